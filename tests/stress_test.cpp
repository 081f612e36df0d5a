/**
 * @file stress_test.cpp
 * @brief Randomized stress test for the ddx copy engine
 *
 * Tests:
 * 1. Sequential vs pipelined equivalence over random configurations
 * 2. Concurrent engines on many threads
 * 3. Cancellation under load
 * 4. File-backed copies with sparse output
 *
 * Build: cmake --build build --target stress_test
 * Run:   ./build/stress_test [options]
 *
 * Options:
 *   --duration <seconds>   Time per test (default: 5)
 *   --threads <count>      Number of threads (default: 4)
 *   --seed <n>             Random seed (default: random)
 *   --quick                Short run for CI
 */

#include <ddx.hpp>

#include <atomic>
#include <chrono>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <memory>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

using Clock = std::chrono::steady_clock;
using namespace std::chrono_literals;

// =============================================================================
// Configuration
// =============================================================================

struct Config {
    int duration_sec = 5;
    int num_threads = 4;
    uint32_t seed = std::random_device{}();
    size_t max_input = 256 * 1024;
    std::string test_dir = "/tmp/ddx_stress";
};

// =============================================================================
// Statistics
// =============================================================================

struct Stats {
    std::atomic<long long> copies{0};
    std::atomic<long long> mismatches{0};
    std::atomic<long long> failures{0};
    std::atomic<long long> cancellations{0};
    std::atomic<long long> bytes_copied{0};

    void print(double elapsed_sec) const {
        double throughput_mb = (bytes_copied / (1024.0 * 1024.0)) / elapsed_sec;

        std::cout << "\n=== Stress Test Results ===\n";
        std::cout << "Duration:          " << std::fixed << std::setprecision(2) << elapsed_sec
                  << " seconds\n";
        std::cout << "Copies:            " << copies << "\n";
        std::cout << "Bytes copied:      " << bytes_copied / (1024 * 1024) << " MB\n";
        std::cout << "Throughput:        " << throughput_mb << " MB/s\n";
        std::cout << "Cancellations:     " << cancellations << "\n";
        std::cout << "Unexpected fails:  " << failures << "\n";
        std::cout << "Mismatches:        " << mismatches << "\n";
    }
};

// =============================================================================
// Random Workloads
// =============================================================================

struct Workload {
    ddx::Bytes input;
    ddx::TransferConfig config;
    size_t max_read = 0;
};

static ddx::Bytes random_input(std::mt19937 &gen, size_t max_size) {
    std::uniform_int_distribution<size_t> size_dist(0, max_size);
    std::uniform_int_distribution<int> byte_dist(0, 255);
    std::bernoulli_distribution zero_run(0.2);

    ddx::Bytes data(size_dist(gen));
    size_t i = 0;
    while (i < data.size()) {
        size_t run = std::min<size_t>(data.size() - i, 1 + gen() % 4096);
        bool zeros = zero_run(gen);
        for (size_t j = 0; j < run; j++) {
            data[i + j] = zeros ? std::byte{0} : static_cast<std::byte>(byte_dist(gen));
        }
        i += run;
    }
    return data;
}

static ddx::Bytes random_records(std::mt19937 &gen, size_t max_size) {
    static const char alphabet[] = "abcdefghijklmnopqrstuvwxyz ABCDEFGHIJ\n\n\n";
    std::uniform_int_distribution<size_t> size_dist(0, max_size);
    std::uniform_int_distribution<size_t> char_dist(0, sizeof(alphabet) - 2);

    ddx::Bytes data(size_dist(gen));
    for (auto &b : data) b = static_cast<std::byte>(alphabet[char_dist(gen)]);
    return data;
}

static Workload random_workload(std::mt19937 &gen, size_t max_input) {
    static const size_t sizes[] = {1, 3, 64, 100, 512, 1000, 4096, 65536};
    auto pick = [&](auto &arr) { return arr[gen() % std::size(arr)]; };

    Workload w;
    w.config.input_block_size(pick(sizes)).output_block_size(pick(sizes));

    switch (gen() % 5) {
    case 0:
        w.config.add_conversion(ddx::Conversion::Ucase);
        break;
    case 1:
        w.config.add_conversion(ddx::Conversion::Lcase).add_conversion(ddx::Conversion::Swab);
        break;
    case 2:
        w.config.conversion_block_size(1 + gen() % 100).add_conversion(ddx::Conversion::Block);
        break;
    case 3:
        w.config.conversion_block_size(1 + gen() % 100).add_conversion(ddx::Conversion::Unblock);
        break;
    default:
        break;
    }

    if (gen() % 3 == 0) w.config.max_blocks(gen() % 200);
    if (gen() % 4 == 0) w.config.skip_blocks(gen() % 8);
    if (gen() % 4 == 0) w.config.full_blocks(true);
    if (gen() % 4 == 0) w.config.sync_pad(true);
    if (gen() % 2 == 0) w.max_read = 1 + gen() % 5000;

    w.input = w.config.conversion_block_size() != 0 ? random_records(gen, max_input)
                                                    : random_input(gen, max_input);
    return w;
}

static ddx::CopyReport run_workload(const Workload &w, int depth, ddx::MemoryChannel &out) {
    ddx::MemoryChannel in(w.input);
    in.max_read(w.max_read);
    ddx::TransferConfig config = w.config;
    config.pipeline_depth(depth);

    ddx::CopyEngine engine(in, out, config);
    return engine.run();
}

static bool same_counters(const ddx::ProgressSnapshot &a, const ddx::ProgressSnapshot &b) {
    return a.full_blocks_in() == b.full_blocks_in() &&
           a.partial_blocks_in() == b.partial_blocks_in() &&
           a.full_blocks_out() == b.full_blocks_out() &&
           a.partial_blocks_out() == b.partial_blocks_out() &&
           a.truncated_records() == b.truncated_records() && a.bytes_in() == b.bytes_in() &&
           a.bytes_out() == b.bytes_out();
}

// =============================================================================
// Stress Test: Sequential vs Pipelined Equivalence
// =============================================================================

void test_pipeline_equivalence(const Config &config, Stats &stats) {
    std::cout << "\n--- Test: Sequential vs Pipelined Equivalence ---\n";

    std::mt19937 gen(config.seed);
    auto end_time = Clock::now() + std::chrono::seconds(config.duration_sec);
    long long runs = 0;

    while (Clock::now() < end_time) {
        Workload w = random_workload(gen, config.max_input);

        ddx::MemoryChannel seq_out;
        ddx::CopyReport seq = run_workload(w, 0, seq_out);

        for (int depth = 1; depth <= ddx::TransferConfig::max_pipeline_depth; depth++) {
            ddx::MemoryChannel pipe_out;
            ddx::CopyReport piped = run_workload(w, depth, pipe_out);
            stats.copies++;

            if (!seq.ok() || !piped.ok()) {
                stats.failures++;
                std::cerr << "copy failed (depth " << depth << "): "
                          << (piped.error ? piped.error->message() : seq.error->message())
                          << "\n";
                continue;
            }
            if (pipe_out.data() != seq_out.data() || !same_counters(seq.counters, piped.counters)) {
                stats.mismatches++;
                std::cerr << "mismatch: ibs=" << w.config.input_block_size()
                          << " obs=" << w.config.output_block_size() << " depth=" << depth
                          << " input=" << w.input.size() << "\n";
            }
            stats.bytes_copied += static_cast<long long>(piped.counters.bytes_out());
        }
        runs++;
    }

    std::cout << "Compared " << runs << " random workloads\n";
}

// =============================================================================
// Stress Test: Concurrent Engines
// =============================================================================

void test_concurrent_engines(const Config &config, Stats &stats) {
    std::cout << "\n--- Test: Concurrent Engines (" << config.num_threads << " threads) ---\n";

    auto end_time = Clock::now() + std::chrono::seconds(config.duration_sec);
    std::vector<std::thread> threads;

    for (int t = 0; t < config.num_threads; t++) {
        threads.emplace_back([&, t] {
            std::mt19937 gen(config.seed + static_cast<uint32_t>(t) + 1);
            while (Clock::now() < end_time) {
                ddx::Bytes data = random_input(gen, config.max_input);
                ddx::MemoryChannel in(data), out;
                ddx::TransferConfig cfg;
                cfg.block_size(4096).pipeline_depth(static_cast<int>(gen() % 3));

                ddx::CopyEngine engine(in, out, cfg);
                std::atomic<long long> updates{0};
                engine.subscribe([&](const ddx::ProgressSnapshot &) { updates++; },
                                 ddx::ProgressCadence::every(1ms));
                auto report = engine.run();

                stats.copies++;
                if (!report.ok()) {
                    stats.failures++;
                } else if (out.data() != data) {
                    stats.mismatches++;
                } else {
                    stats.bytes_copied += static_cast<long long>(data.size());
                }
            }
        });
    }

    for (auto &th : threads) th.join();
}

// =============================================================================
// Stress Test: Cancellation Under Load
// =============================================================================

void test_cancellation_under_load(const Config &config, Stats &stats) {
    std::cout << "\n--- Test: Cancellation Under Load ---\n";

    std::mt19937 gen(config.seed ^ 0x5eed);
    auto end_time = Clock::now() + std::chrono::seconds(config.duration_sec);

    while (Clock::now() < end_time) {
        ddx::ZeroChannel in;
        ddx::NullChannel out;
        ddx::CancelToken token;
        ddx::TransferConfig cfg;
        cfg.block_size(static_cast<size_t>(512) << (gen() % 8))
            .pipeline_depth(static_cast<int>(gen() % 3));

        ddx::CopyEngine engine(in, out, cfg);
        auto delay = std::chrono::microseconds(gen() % 5000);
        std::thread stopper([&] {
            std::this_thread::sleep_for(delay);
            token.cancel();
        });

        auto report = engine.run(token);
        stopper.join();

        stats.copies++;
        if (report.ok() || report.error->kind != ddx::ErrorKind::Cancelled) {
            stats.failures++;
            continue;
        }
        // Every block read before the stop was also written
        const auto &c = report.counters;
        if (c.bytes_in() != c.bytes_out()) stats.mismatches++;
        stats.cancellations++;
        stats.bytes_copied += static_cast<long long>(c.bytes_out());
    }
}

// =============================================================================
// Stress Test: File-Backed Sparse Copies
// =============================================================================

void test_sparse_files(const Config &config, Stats &stats) {
    std::cout << "\n--- Test: File-Backed Sparse Copies ---\n";

    mkdir(config.test_dir.c_str(), 0755);
    std::string path = config.test_dir + "/sparse.out";
    std::mt19937 gen(config.seed ^ 0xf11e);
    auto end_time = Clock::now() + std::chrono::seconds(config.duration_sec);

    while (Clock::now() < end_time) {
        ddx::Bytes data = random_input(gen, config.max_input);
        ddx::MemoryChannel in(data);
        auto out = ddx::FdChannel::open(path, O_RDWR | O_CREAT, 0644);

        ddx::TransferConfig cfg;
        cfg.block_size(512).add_conversion(ddx::Conversion::Sparse).pipeline_depth(
            static_cast<int>(gen() % 3));
        ddx::CopyEngine engine(in, *out, cfg);
        auto report = engine.run();
        stats.copies++;

        if (!report.ok()) {
            stats.failures++;
            continue;
        }

        ddx::Bytes check(data.size());
        ssize_t n = pread(out->fd(), check.data(), check.size(), 0);
        struct stat st;
        if (fstat(out->fd(), &st) != 0 || static_cast<size_t>(st.st_size) != data.size() ||
            n != static_cast<ssize_t>(data.size()) || check != data) {
            stats.mismatches++;
        }
        stats.bytes_copied += static_cast<long long>(data.size());
    }

    unlink(path.c_str());
    rmdir(config.test_dir.c_str());
}

// =============================================================================
// Main
// =============================================================================

void print_usage(const char *prog) {
    std::cout << "Usage: " << prog << " [options]\n"
              << "Options:\n"
              << "  --duration <seconds>   Time per test (default: 5)\n"
              << "  --threads <count>      Number of threads (default: 4)\n"
              << "  --seed <n>             Random seed (default: random)\n"
              << "  --quick                Short run for CI\n"
              << "  --help                 Show this help\n";
}

int main(int argc, char **argv) {
    Config config;

    // Parse arguments
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--duration" && i + 1 < argc) {
            config.duration_sec = std::stoi(argv[++i]);
        } else if (arg == "--threads" && i + 1 < argc) {
            config.num_threads = std::stoi(argv[++i]);
        } else if (arg == "--seed" && i + 1 < argc) {
            config.seed = static_cast<uint32_t>(std::stoul(argv[++i]));
        } else if (arg == "--quick") {
            config.duration_sec = 1;
            config.max_input = 64 * 1024;
        } else if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    std::cout << "=== ddx Stress Test ===\n";
    std::cout << "Duration:     " << config.duration_sec << " seconds per test\n";
    std::cout << "Threads:      " << config.num_threads << "\n";
    std::cout << "Seed:         " << config.seed << "\n";
    std::cout << "Max input:    " << config.max_input / 1024 << " KB\n";

    try {
        Stats stats;
        auto total_start = Clock::now();

        test_pipeline_equivalence(config, stats);
        test_concurrent_engines(config, stats);
        test_cancellation_under_load(config, stats);
        test_sparse_files(config, stats);

        auto total_elapsed = std::chrono::duration<double>(Clock::now() - total_start).count();
        stats.print(total_elapsed);

        if (stats.failures > 0 || stats.mismatches > 0) {
            std::cout << "\n*** STRESS TEST FAILED ***\n";
            return 1;
        }
        std::cout << "\n*** ALL STRESS TESTS PASSED ***\n";
        return 0;

    } catch (const ddx::Error &e) {
        std::cerr << "ddx error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
