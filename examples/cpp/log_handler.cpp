/**
 * @file log_handler.cpp
 * @brief Demonstrate the ddx custom log handler
 *
 * Shows how to install a custom log callback that formats library
 * messages with timestamps and severity levels, and how to emit
 * application-level messages through the same pipeline using
 * ddx::log_emit().
 *
 * Build: cmake --build build --target log_handler
 * Run:   ./build/log_handler
 */

#include <ddx.hpp>

#include <chrono>
#include <iomanip>
#include <iostream>

constexpr size_t DATA_SIZE = 64 * 1024; // 64 KB

int main() {
    std::cout << "ddx Log Handler Example\n";
    std::cout << "=======================\n\n";

    // --- Step 1: Install log handler with lambda -------------------------

    ddx::set_log_handler([](ddx::LogLevel level, std::string_view msg) {
        auto now = std::chrono::system_clock::now();
        auto time_t_now = std::chrono::system_clock::to_time_t(now);
        auto ms =
            std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

        std::tm tm{};
        localtime_r(&time_t_now, &tm);

        std::cerr << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0')
                  << std::setw(3) << ms.count() << " [myapp] " << ddx::log_level_name(level)
                  << ": " << msg << '\n';
    });

    // --- Step 2: Emit application-level messages -------------------------
    ddx::log_emit(ddx::LogLevel::Info, "log handler installed, preparing copy");

    try {
        // --- Step 3: Copy with a faulty region and noerror ---------------
        //
        // Every fifth read reports EIO; SkipOnError turns each fault into a
        // warning and sync pads the lost block with zeros.

        class FlakyChannel : public ddx::MemoryChannel {
          public:
            using MemoryChannel::MemoryChannel;

            size_t read(std::span<std::byte> buf) override {
                if (++reads_ % 5 == 0) throw ddx::Error(EIO, "simulated media error");
                return MemoryChannel::read(buf);
            }

          private:
            unsigned reads_ = 0;
        };

        FlakyChannel in(std::vector<std::byte>(DATA_SIZE, std::byte{'A'}));
        ddx::NullChannel out;

        ddx::TransferConfig config;
        config.block_size(4096).error_policy(ddx::ErrorPolicy::SkipOnError).sync_pad(true);

        ddx::CopyEngine engine(in, out, config);
        ddx::log_emit(ddx::LogLevel::Notice, "engine created (bs=4096, conv=noerror,sync)");

        ddx::CopyReport report = engine.run();

        // --- Step 4: Show counters ---------------------------------------
        const auto &c = report.counters;
        std::cout << "\nCopy " << (report.ok() ? "succeeded" : "failed") << ":\n";
        std::cout << "  Records in:     " << c.full_blocks_in() << "+" << c.partial_blocks_in()
                  << '\n';
        std::cout << "  Records out:    " << c.full_blocks_out() << "+" << c.partial_blocks_out()
                  << '\n';
        std::cout << "  Skipped blocks: " << report.skipped_errors.size() << '\n';

        ddx::log_emit(ddx::LogLevel::Notice, "shutting down");

    } catch (const ddx::Error &e) {
        ddx::log_emit(ddx::LogLevel::Error, std::string("ddx error: ") + e.what());
        ddx::clear_log_handler();
        return 1;
    } catch (const std::exception &e) {
        ddx::log_emit(ddx::LogLevel::Error, std::string("unexpected error: ") + e.what());
        ddx::clear_log_handler();
        return 1;
    }

    ddx::clear_log_handler();

    std::cout << "\n--- Summary ---\n";
    std::cout << "The log handler captured all library and application messages\n";
    std::cout << "on stderr with timestamps, severity levels, and an app prefix.\n";
    std::cout << "Use ddx::syslog_install() to forward them to syslog instead.\n";

    return 0;
}
