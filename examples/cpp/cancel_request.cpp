/**
 * @file cancel_request.cpp
 * @brief Demonstrates cancelling a running copy
 *
 * Copies /dev/zero-style data into a null sink forever and stops it from a
 * second thread after a short delay. The report comes back Failed with
 * kind Cancelled and the counters as of the last completed block.
 *
 * Usage: ./cancel_request [milliseconds]
 */

#include <ddx.hpp>

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <thread>

int main(int argc, char *argv[]) {
    int delay_ms = argc > 1 ? std::atoi(argv[1]) : 100;

    try {
        ddx::ZeroChannel in;
        ddx::NullChannel out;

        ddx::TransferConfig config;
        config.block_size(64 * 1024).pipeline_depth(2);

        ddx::CopyEngine engine(in, out, config);

        // Stop from another thread; cancel() is safe to call concurrently
        std::thread stopper([&engine, delay_ms] {
            std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
            std::cout << "Requesting cancellation...\n";
            engine.cancel();
        });

        std::cout << "Copying until cancelled...\n";
        ddx::CopyReport report = engine.run();
        stopper.join();

        if (report.ok()) {
            std::cout << "Copy finished before the cancel request\n";
        } else if (report.error->kind == ddx::ErrorKind::Cancelled) {
            std::cout << "Copy was cancelled at block " << report.error->block_index << "\n";
        } else {
            std::cerr << "Copy failed: " << report.error->message() << "\n";
            return 1;
        }

        std::cout << "Copied " << report.counters.total_bytes() << " bytes in "
                  << report.counters.elapsed_ms() << " ms\n";
        std::cout << "Engine state: " << ddx::engine_state_name(engine.state()) << "\n";

    } catch (const ddx::Error &e) {
        std::cerr << "ddx error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
