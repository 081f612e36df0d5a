/**
 * @file custom_config.cpp
 * @brief Demonstrates TransferConfig: reblocking and record conversions
 *
 * Converts newline-terminated text into fixed 16-byte upper-case records,
 * then back again, printing the intermediate form.
 *
 * Build: cmake --build build --target custom_config
 * Run:   ./build/custom_config
 */

#include <ddx.hpp>

#include <iostream>

static void print_counters(const char *label, const ddx::ProgressSnapshot &c) {
    std::cout << label << ": " << c.full_blocks_in() << "+" << c.partial_blocks_in()
              << " records in, " << c.full_blocks_out() << "+" << c.partial_blocks_out()
              << " records out, " << c.truncated_records() << " truncated records\n";
}

int main() {
    try {
        ddx::MemoryChannel source(std::string_view("first line\n"
                                                   "second line\n"
                                                   "a line that is longer than sixteen bytes\n"
                                                   "last"));

        // Stage 1: text -> fixed records (cbs=16), ibs != obs forces reblocking
        ddx::TransferConfig to_records;
        to_records.input_block_size(7)
            .output_block_size(32)
            .conversion_block_size(16)
            .add_conversion(ddx::Conversion::Block)
            .add_conversion(ddx::Conversion::Ucase);

        std::cout << "Stage 1 conversions:";
        for (ddx::Conversion conv : to_records.conversions()) {
            std::cout << ' ' << ddx::conversion_name(conv);
        }
        std::cout << "\n";

        ddx::MemoryChannel records;
        ddx::CopyEngine blocker(source, records, to_records);
        ddx::CopyReport r1 = blocker.run();
        if (!r1.ok()) {
            std::cerr << "block failed: " << r1.error->message() << "\n";
            return 1;
        }
        print_counters("block  ", r1.counters);
        std::cout << "  [" << records.str() << "]\n";

        // Stage 2: fixed records -> text
        ddx::TransferConfig to_text;
        to_text.block_size(16).conversion_block_size(16).add_conversion(ddx::Conversion::Unblock);

        ddx::MemoryChannel blocked(records.data());
        ddx::MemoryChannel text;
        ddx::CopyEngine unblocker(blocked, text, to_text);
        ddx::CopyReport r2 = unblocker.run();
        if (!r2.ok()) {
            std::cerr << "unblock failed: " << r2.error->message() << "\n";
            return 1;
        }
        print_counters("unblock", r2.counters);
        std::cout << text.str();

        // Rejected configuration
        try {
            ddx::TransferConfig bad;
            bad.add_conversion(ddx::Conversion::Block);
            bad.validate();
        } catch (const ddx::Error &e) {
            std::cout << "Rejected config: " << e.context() << "\n";
        }

    } catch (const ddx::Error &e) {
        std::cerr << "ddx error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
