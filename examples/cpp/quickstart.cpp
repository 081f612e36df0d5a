/**
 * @file quickstart.cpp
 * @brief Minimal working example of a ddx block copy
 *
 * Build: cmake --build build --target quickstart
 * Run:   ./build/quickstart
 */

#include <ddx.hpp>

#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <iostream>
#include <unistd.h>

int main() {
    const char *src_file = "/tmp/ddx_quickstart_src.tmp";
    const char *dst_file = "/tmp/ddx_quickstart_dst.tmp";
    const char *test_data = "Hello from ddx! Blocks in, blocks out.\n";

    try {
        // Create a source file with known content
        {
            std::ofstream out(src_file, std::ios::binary);
            if (!out) {
                std::cerr << "Failed to create test file\n";
                return 1;
            }
            out.write(test_data, static_cast<std::streamsize>(strlen(test_data)));
        }

        // Channels own their descriptors (RAII)
        auto in = ddx::FdChannel::open(src_file, O_RDONLY);
        auto out = ddx::FdChannel::open(dst_file, O_WRONLY | O_CREAT);

        // 16-byte blocks, upper-cased on the way through
        ddx::TransferConfig config;
        config.block_size(16).add_conversion(ddx::Conversion::Ucase);

        ddx::CopyEngine engine(*in, *out, config);
        ddx::CopyReport report = engine.run();
        if (!report.ok()) {
            std::cerr << "Copy failed: " << report.error->message() << "\n";
            unlink(src_file);
            unlink(dst_file);
            return 1;
        }

        const ddx::ProgressSnapshot &c = report.counters;
        std::cout << c.full_blocks_in() << "+" << c.partial_blocks_in() << " records in\n";
        std::cout << c.full_blocks_out() << "+" << c.partial_blocks_out() << " records out\n";
        std::cout << c.total_bytes() << " bytes copied\n";

        // Show the result
        std::ifstream result(dst_file);
        std::cout << "Output: " << result.rdbuf();

        unlink(src_file);
        unlink(dst_file);

        std::cout << "Success!\n";
        return 0;

    } catch (const ddx::Error &e) {
        std::cerr << "ddx error: " << e.what() << "\n";
        unlink(src_file);
        unlink(dst_file);
        return 1;
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << "\n";
        unlink(src_file);
        unlink(dst_file);
        return 1;
    }
}
