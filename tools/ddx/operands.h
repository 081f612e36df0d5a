// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 ddx Contributors

/**
 * @file operands.h
 * @brief dd-style operand parsing and progress target selection for the ddx tool
 */

#ifndef DDX_TOOL_OPERANDS_H
#define DDX_TOOL_OPERANDS_H

#include <ddx/config.hpp>
#include <ddx/special_channels.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace ddx::tool {

/// status= operand
enum class StatusLevel {
    Default, ///< Summary only
    None,    ///< Nothing but errors
    NoXfer,  ///< Record counts without the transfer line
    Progress ///< Live progress line plus summary
};

/// Parsed command line
struct Operands {
    std::string input;  ///< if= (empty = stdin)
    std::string output; ///< of= (empty = stdout)
    TransferConfig config;
    StatusLevel status = StatusLevel::Default;
    int verbose = 0;     ///< -v count: 1 = info log to stderr, 2 = debug
    bool syslog = false; ///< --syslog: forward library log to syslog
    bool help = false;
};

/**
 * Parse a dd size operand
 *
 * Accepts a decimal number with an optional multiplier: c (1), w (2),
 * b (512), k/K (1024), M (1024^2), G (1024^3), kB (1000), MB (1000^2),
 * GB (1000^3).
 *
 * @param str Operand value
 * @return Bytes, or std::nullopt if malformed or overflowing
 */
[[nodiscard]] std::optional<uint64_t> parse_size(std::string_view str);

/**
 * Parse the full argument vector
 * @param argc Argument count
 * @param argv Arguments (argv[0] is skipped)
 * @return Parsed operands
 * @throws Error (kind InvalidConfig) naming the offending operand
 */
[[nodiscard]] Operands parse_operands(int argc, const char *const *argv);

/// What the progress display is measuring
enum class ProgressType {
    FileTransfer,   ///< Input with a known length
    StreamTransfer, ///< Input of unknown length
    FillWithZeros,  ///< /dev/zero into the output
    FillWithRandom  ///< /dev/urandom into the output
};

/// Message shown when a copy of the given type completes
[[nodiscard]] const char *completion_message(ProgressType type) noexcept;

/// Expected transfer size and display mode
struct ProgressTarget {
    std::optional<uint64_t> total; ///< Bytes expected, std::nullopt if unbounded
    ProgressType type = ProgressType::StreamTransfer;
};

/**
 * Choose what the progress display measures
 *
 * @param input_dev Special device named by if=, if any
 * @param input_size Length of the input channel (std::nullopt for streams)
 * @param output_dev Special device named by of=, if any
 * @param output_size Length of the output (std::nullopt if unknown)
 * @param config Transfer configuration (skip, seek, count, block sizes)
 */
[[nodiscard]] ProgressTarget progress_target(std::optional<SpecialDevice> input_dev,
                                             std::optional<uint64_t> input_size,
                                             std::optional<SpecialDevice> output_dev,
                                             std::optional<uint64_t> output_size,
                                             const TransferConfig &config);

/**
 * Reject copies between two emulated devices
 * @throws Error (kind InvalidConfig) if both paths name special devices
 */
void validate_device_pair(const std::string &input, const std::string &output);

} // namespace ddx::tool

#endif // DDX_TOOL_OPERANDS_H
