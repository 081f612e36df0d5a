// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 ddx Contributors


/**
 * @file error.hpp
 * @brief Error exception class and structured error records for ddx
 */

#ifndef DDX_ERROR_HPP
#define DDX_ERROR_HPP

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <limits>
#include <string>
#include <string_view>
#include <system_error>

namespace ddx {

/**
 * Error classification
 *
 * Every fault surfaced by a channel, the conversion pipeline or the copy
 * engine carries one of these kinds, so a front end can map it to an exit
 * code without parsing message text.
 */
enum class ErrorKind {
    Io,                  ///< Read/write fault at the channel level
    Seek,                ///< Unsupported or failed positioning
    Conversion,          ///< Malformed input for a strict conversion
    Cancelled,           ///< External stop request honored at a block boundary
    ShortWriteExhausted, ///< Output made no progress on retry
    InvalidConfig        ///< Rejected transfer configuration
};

/// Operation that was running when a fault occurred
enum class ErrorOp { None, Read, Write, Seek, Truncate, Convert };

/// Return a short name for an error kind ("io", "seek", ...)
[[nodiscard]] inline const char *error_kind_name(ErrorKind kind) noexcept {
    switch (kind) {
    case ErrorKind::Io:
        return "io";
    case ErrorKind::Seek:
        return "seek";
    case ErrorKind::Conversion:
        return "conversion";
    case ErrorKind::Cancelled:
        return "cancelled";
    case ErrorKind::ShortWriteExhausted:
        return "short-write";
    case ErrorKind::InvalidConfig:
        return "config";
    default:
        return "???";
    }
}

/// Return a short name for an operation ("read", "write", ...)
[[nodiscard]] inline const char *error_op_name(ErrorOp op) noexcept {
    switch (op) {
    case ErrorOp::None:
        return "none";
    case ErrorOp::Read:
        return "read";
    case ErrorOp::Write:
        return "write";
    case ErrorOp::Seek:
        return "seek";
    case ErrorOp::Truncate:
        return "truncate";
    case ErrorOp::Convert:
        return "convert";
    default:
        return "???";
    }
}

/// Block index used when a fault is not tied to a block
inline constexpr uint64_t no_block = std::numeric_limits<uint64_t>::max();

/**
 * Structured error value
 *
 * Produced by the copy engine for its final report. Holds the fault
 * classification, the errno value, the operation and the block index it
 * is attributed to.
 */
struct ErrorRecord {
    ErrorKind kind = ErrorKind::Io;
    ErrorOp op = ErrorOp::None;
    int code = 0;
    uint64_t block_index = no_block;
    std::string context;

    [[nodiscard]] bool has_block() const noexcept { return block_index != no_block; }

    /**
     * Render a one-line description
     * @return e.g. "read error at block 3: Input/output error (input)"
     */
    [[nodiscard]] std::string message() const {
        std::string msg = error_op_name(op);
        msg += ' ';
        msg += error_kind_name(kind);
        msg += " error";
        if (has_block()) {
            msg += " at block ";
            msg += std::to_string(block_index);
        }
        msg += ": ";
        msg += std::strerror(code);
        if (!context.empty()) {
            msg += " (";
            msg += context;
            msg += ')';
        }
        return msg;
    }
};

/**
 * Exception class for ddx errors
 *
 * Inherits from std::system_error so callers can catch either
 * ddx::Error or std::system_error. Uses std::generic_category
 * for POSIX errno values.
 */
class Error : public std::system_error {
  public:
    /**
     * Construct an I/O error from errno value
     *
     * @param err Error code (positive errno value)
     * @param context Optional context message
     */
    explicit Error(int err, std::string_view context = {}) : Error(ErrorKind::Io, err, context) {}

    /**
     * Construct error of a given kind
     *
     * @param kind Error classification
     * @param err Error code (positive errno value)
     * @param context Optional context message
     */
    Error(ErrorKind kind, int err, std::string_view context = {})
        : std::system_error(err, std::generic_category(), std::string(context)), kind_(kind),
          context_(context) {}

    /**
     * Get the error code
     * @return Positive errno value
     */
    [[nodiscard]] int code() const noexcept { return std::system_error::code().value(); }

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }
    [[nodiscard]] const std::string &context() const noexcept { return context_; }

    // Convenience predicates
    [[nodiscard]] bool is_io() const noexcept { return kind_ == ErrorKind::Io; }
    [[nodiscard]] bool is_seek() const noexcept { return kind_ == ErrorKind::Seek; }
    [[nodiscard]] bool is_conversion() const noexcept { return kind_ == ErrorKind::Conversion; }
    [[nodiscard]] bool is_cancelled() const noexcept { return kind_ == ErrorKind::Cancelled; }
    [[nodiscard]] bool is_short_write() const noexcept {
        return kind_ == ErrorKind::ShortWriteExhausted;
    }
    [[nodiscard]] bool is_invalid_config() const noexcept {
        return kind_ == ErrorKind::InvalidConfig;
    }

    /**
     * Convert to a structured record
     *
     * @param op Operation that was running
     * @param block_index Block the fault is attributed to
     * @return Record carrying this error's kind, code and context
     */
    [[nodiscard]] ErrorRecord record(ErrorOp op, uint64_t block_index = no_block) const {
        return ErrorRecord{kind_, op, code(), block_index, context_};
    }

    /**
     * Rebuild an exception from a record
     * @param rec Record previously produced by record()
     * @return Error with the same kind, code and context
     */
    [[nodiscard]] static Error from(const ErrorRecord &rec) {
        return Error(rec.kind, rec.code, rec.context);
    }

  private:
    ErrorKind kind_;
    std::string context_;
};

/**
 * Throw Error if condition is false
 *
 * @param condition Condition to check
 * @param context Error context message
 * @throws Error with current errno if condition is false
 */
inline void check(bool condition, std::string_view context = {}) {
    if (!condition) {
        throw Error(errno, context);
    }
}

/**
 * Throw Error from current errno
 *
 * @param context Error context message
 * @throws Error with current errno
 */
[[noreturn]] inline void throw_errno(std::string_view context = {}) {
    throw Error(errno, context);
}

} // namespace ddx

#endif // DDX_ERROR_HPP
