// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 ddx Contributors

/**
 * @file operands.cpp
 * @brief dd-style operand parsing for the ddx tool
 */

#include "operands.h"

#include <ddx/error.hpp>

#include <charconv>
#include <limits>
#include <string>

namespace ddx::tool {

namespace {

[[noreturn]] void bad_operand(const std::string &msg) {
    throw Error(ErrorKind::InvalidConfig, EINVAL, msg);
}

std::string quoted(std::string_view s) {
    std::string out = "'";
    out += s;
    out += '\'';
    return out;
}

uint64_t multiplier(std::string_view suffix) noexcept {
    if (suffix.empty() || suffix == "c") return 1;
    if (suffix == "w") return 2;
    if (suffix == "b") return 512;
    if (suffix == "k" || suffix == "K") return 1024;
    if (suffix == "M") return 1024ULL * 1024;
    if (suffix == "G") return 1024ULL * 1024 * 1024;
    if (suffix == "kB" || suffix == "KB") return 1000;
    if (suffix == "MB") return 1000ULL * 1000;
    if (suffix == "GB") return 1000ULL * 1000 * 1000;
    return 0;
}

uint64_t block_size_operand(std::string_view key, std::string_view value) {
    auto bytes = parse_size(value);
    if (!bytes || *bytes == 0) {
        bad_operand("invalid " + std::string(key) + " size " + quoted(value));
    }
    if (*bytes > std::numeric_limits<size_t>::max()) {
        bad_operand(std::string(key) + " too large: " + quoted(value));
    }
    return *bytes;
}

uint64_t count_operand(std::string_view key, std::string_view value) {
    auto n = parse_size(value);
    if (!n) bad_operand("invalid number for " + std::string(key) + ": " + quoted(value));
    return *n;
}

int depth_operand(std::string_view value) {
    int depth = -1;
    auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), depth);
    if (ec != std::errc() || end != value.data() + value.size() || depth < 0 ||
        depth > TransferConfig::max_pipeline_depth) {
        bad_operand("pipeline depth must be 0-" + std::to_string(TransferConfig::max_pipeline_depth));
    }
    return depth;
}

template <typename F> void for_each_flag(std::string_view list, F &&fn) {
    while (!list.empty()) {
        size_t comma = list.find(',');
        std::string_view flag = list.substr(0, comma);
        if (!flag.empty()) fn(flag);
        if (comma == std::string_view::npos) break;
        list.remove_prefix(comma + 1);
    }
}

void apply_conv(TransferConfig &config, std::string_view flag) {
    if (flag == "lcase") {
        config.add_conversion(Conversion::Lcase);
    } else if (flag == "ucase") {
        config.add_conversion(Conversion::Ucase);
    } else if (flag == "swab") {
        config.add_conversion(Conversion::Swab);
    } else if (flag == "block") {
        config.add_conversion(Conversion::Block);
    } else if (flag == "unblock") {
        config.add_conversion(Conversion::Unblock);
    } else if (flag == "sparse") {
        config.add_conversion(Conversion::Sparse);
    } else if (flag == "sync") {
        config.sync_pad(true);
    } else if (flag == "noerror") {
        config.error_policy(ErrorPolicy::SkipOnError);
    } else if (flag == "notrunc") {
        config.truncate_output(false);
    } else {
        bad_operand("invalid conversion " + quoted(flag));
    }
}

uint64_t saturating_mul(uint64_t a, uint64_t b) noexcept {
    if (a != 0 && b > std::numeric_limits<uint64_t>::max() / a) {
        return std::numeric_limits<uint64_t>::max();
    }
    return a * b;
}

uint64_t remaining_after(uint64_t total, uint64_t offset) noexcept {
    return total > offset ? total - offset : 0;
}

} // namespace

std::optional<uint64_t> parse_size(std::string_view str) {
    size_t i = 0;
    uint64_t value = 0;
    while (i < str.size() && str[i] >= '0' && str[i] <= '9') {
        uint64_t digit = static_cast<uint64_t>(str[i] - '0');
        if (value > (std::numeric_limits<uint64_t>::max() - digit) / 10) return std::nullopt;
        value = value * 10 + digit;
        i++;
    }
    if (i == 0) return std::nullopt;

    uint64_t mult = multiplier(str.substr(i));
    if (mult == 0) return std::nullopt;
    if (value > std::numeric_limits<uint64_t>::max() / mult) return std::nullopt;
    return value * mult;
}

Operands parse_operands(int argc, const char *const *argv) {
    Operands ops;
    std::optional<uint64_t> bs, ibs, obs;

    for (int i = 1; i < argc; i++) {
        std::string_view arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            ops.help = true;
            continue;
        }
        if (arg == "-v" || arg == "--verbose") {
            ops.verbose++;
            continue;
        }
        if (arg == "--syslog") {
            ops.syslog = true;
            continue;
        }
        if (arg == "--pipeline") {
            if (++i >= argc) bad_operand("--pipeline requires a value");
            ops.config.pipeline_depth(depth_operand(argv[i]));
            continue;
        }
        if (arg.starts_with("--pipeline=")) {
            ops.config.pipeline_depth(depth_operand(arg.substr(11)));
            continue;
        }

        size_t eq = arg.find('=');
        if (eq == std::string_view::npos || arg.starts_with("-")) {
            bad_operand("unrecognized operand " + quoted(arg));
        }
        std::string_view key = arg.substr(0, eq);
        std::string_view value = arg.substr(eq + 1);

        if (key == "if") {
            ops.input = value;
        } else if (key == "of") {
            ops.output = value;
        } else if (key == "bs") {
            bs = block_size_operand(key, value);
        } else if (key == "ibs") {
            ibs = block_size_operand(key, value);
        } else if (key == "obs") {
            obs = block_size_operand(key, value);
        } else if (key == "cbs") {
            ops.config.conversion_block_size(block_size_operand(key, value));
        } else if (key == "count") {
            ops.config.max_blocks(count_operand(key, value));
        } else if (key == "skip") {
            ops.config.skip_blocks(count_operand(key, value));
        } else if (key == "seek") {
            ops.config.seek_blocks(count_operand(key, value));
        } else if (key == "conv") {
            for_each_flag(value, [&](std::string_view flag) { apply_conv(ops.config, flag); });
        } else if (key == "iflag") {
            for_each_flag(value, [&](std::string_view flag) {
                if (flag != "fullblock") bad_operand("invalid input flag " + quoted(flag));
                ops.config.full_blocks(true);
            });
        } else if (key == "status") {
            if (value == "progress") {
                ops.status = StatusLevel::Progress;
            } else if (value == "none") {
                ops.status = StatusLevel::None;
            } else if (value == "noxfer") {
                ops.status = StatusLevel::NoXfer;
            } else {
                bad_operand("invalid status level " + quoted(value));
            }
        } else {
            bad_operand("unrecognized operand " + quoted(arg));
        }
    }

    // bs= wins over ibs=/obs= regardless of order
    if (bs) {
        ops.config.block_size(static_cast<size_t>(*bs));
    } else {
        if (ibs) ops.config.input_block_size(static_cast<size_t>(*ibs));
        if (obs) ops.config.output_block_size(static_cast<size_t>(*obs));
    }
    return ops;
}

const char *completion_message(ProgressType type) noexcept {
    switch (type) {
    case ProgressType::FileTransfer:
        return "File copy complete!";
    case ProgressType::StreamTransfer:
        return "Stream complete!";
    case ProgressType::FillWithZeros:
        return "Data has been overwritten with zeros!";
    case ProgressType::FillWithRandom:
        return "Data has been overwritten with random data!";
    default:
        return "Done!";
    }
}

ProgressTarget progress_target(std::optional<SpecialDevice> input_dev,
                               std::optional<uint64_t> input_size,
                               std::optional<SpecialDevice> output_dev,
                               std::optional<uint64_t> output_size,
                               const TransferConfig &config) {
    const uint64_t ibs = config.input_block_size();
    ProgressTarget target;

    if (input_dev == SpecialDevice::Null) {
        target.total = 0;
        target.type = ProgressType::FileTransfer;
        return target;
    }

    if (input_dev) {
        target.type = *input_dev == SpecialDevice::Random ? ProgressType::FillWithRandom
                                                          : ProgressType::FillWithZeros;
        if (output_dev == SpecialDevice::Full) {
            target.total = 0;
        } else if (!output_dev && output_size) {
            uint64_t seek = saturating_mul(config.seek_blocks(), config.output_block_size());
            target.total = remaining_after(*output_size, seek);
        }
    } else if (input_size) {
        target.type = ProgressType::FileTransfer;
        target.total = remaining_after(*input_size, saturating_mul(config.skip_blocks(), ibs));
    } else {
        target.type = ProgressType::StreamTransfer;
    }

    if (auto max = config.max_blocks()) {
        uint64_t cap = saturating_mul(*max, ibs);
        if (!target.total || *target.total > cap) target.total = cap;
    }
    return target;
}

void validate_device_pair(const std::string &input, const std::string &output) {
    if (input.empty() || output.empty()) return;
    if (special_device(input) && special_device(output)) {
        bad_operand("cannot copy from special device " + input + " to special device " + output);
    }
}

} // namespace ddx::tool
