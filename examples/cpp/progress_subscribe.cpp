/**
 * @file progress_subscribe.cpp
 * @brief Watch a copy through progress subscriptions and a poller
 *
 * Registers one time-based and one block-count subscriber, and polls the
 * engine's counter from the main thread while the copy runs on a worker.
 *
 * Usage: ./progress_subscribe [megabytes]
 */

#include <ddx.hpp>

#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <thread>

int main(int argc, char *argv[]) {
    long mb = argc > 1 ? std::atol(argv[1]) : 256;
    if (mb <= 0) {
        fprintf(stderr, "Usage: %s [megabytes]\n", argv[0]);
        return 1;
    }

    try {
        ddx::RandomChannel in(42);
        ddx::NullChannel out;

        ddx::TransferConfig config;
        config.block_size(1024 * 1024).max_blocks(static_cast<uint64_t>(mb)).pipeline_depth(1);

        ddx::CopyEngine engine(in, out, config);

        // Time-based: runs on the engine's reporter thread
        engine.subscribe(
            [](const ddx::ProgressSnapshot &s) {
                printf("  [tick]  %8.1f MB  %8.1f MB/s\n", s.total_bytes() / (1024.0 * 1024.0),
                       s.throughput_bps() / (1024.0 * 1024.0));
            },
            ddx::ProgressCadence::every(std::chrono::milliseconds(250)));

        // Count-based: runs on the copy thread every 64 blocks
        engine.subscribe(
            [](const ddx::ProgressSnapshot &s) {
                printf("  [block] %llu records in\n",
                       static_cast<unsigned long long>(s.full_blocks_in()));
            },
            ddx::ProgressCadence::every_n_blocks(64));

        std::atomic<bool> done{false};
        ddx::CopyReport report;
        std::thread worker([&] {
            report = engine.run();
            done.store(true, std::memory_order_release);
        });

        // Lock-free polling from any thread
        ddx::ProgressPoller poller(engine.counter());
        while (!done.load(std::memory_order_acquire)) {
            std::this_thread::sleep_for(std::chrono::milliseconds(500));
            auto s = poller.poll();
            printf("  [poll]  state=%s seq=%llu\n", ddx::engine_state_name(engine.state()),
                   static_cast<unsigned long long>(s.sequence()));
        }
        worker.join();

        if (!report.ok()) {
            fprintf(stderr, "Copy failed: %s\n", report.error->message().c_str());
            return 1;
        }
        printf("Done: %llu bytes, average %.1f MB/s\n",
               static_cast<unsigned long long>(report.counters.total_bytes()),
               report.counters.average_bps() / (1024.0 * 1024.0));

    } catch (const ddx::Error &e) {
        fprintf(stderr, "ddx error: %s\n", e.what());
        return 1;
    }

    return 0;
}
