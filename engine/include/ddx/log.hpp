// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 ddx Contributors

/**
 * @file log.hpp
 * @brief Logging interface for ddx
 *
 * The log handler is process-wide and thread-safe. The library never
 * writes to stderr on its own; with no handler installed it is silent.
 *
 * Example:
 * @code
 *   ddx::set_log_handler([](ddx::LogLevel level, std::string_view msg) {
 *       std::cerr << "[" << ddx::log_level_name(level) << "] " << msg << "\n";
 *   });
 *
 *   ddx::CopyEngine engine(in, out, config);
 *   ddx::log_emit(ddx::LogLevel::Info, "copy started");
 *   // ... library and app logs dispatched to the handler ...
 *
 *   ddx::clear_log_handler();
 * @endcode
 */

#ifndef DDX_LOG_HPP
#define DDX_LOG_HPP

#include <functional>
#include <string_view>

namespace ddx {

/// Log severity levels (match syslog priorities 1:1)
enum class LogLevel {
    Error = 3,   ///< Error condition
    Warning = 4, ///< Warning condition
    Notice = 5,  ///< Normal but significant
    Info = 6,    ///< Informational
    Debug = 7    ///< Debug-level
};

/// Return a short name for the given log level ("ERR", "WARN", etc.)
[[nodiscard]] inline const char *log_level_name(LogLevel level) noexcept {
    switch (level) {
    case LogLevel::Error:
        return "ERR";
    case LogLevel::Warning:
        return "WARN";
    case LogLevel::Notice:
        return "NOTICE";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Debug:
        return "DEBUG";
    default:
        return "???";
    }
}

/// Log handler callback type
using LogHandler = std::function<void(LogLevel, std::string_view)>;

/// Install a process-wide log handler.
///
/// Replaces any previously installed handler.  The handler is called from
/// whichever thread emits the log message; it must be thread-safe.
void set_log_handler(LogHandler handler);

/// Remove the current log handler.
///
/// After this call the library is silent (default state).
void clear_log_handler() noexcept;

/// Emit a log message through the registered handler (if any).
///
/// No-op when no handler is installed.  Thread-safe.  Exceptions thrown by
/// the handler are dropped along with the message.
void log_emit(LogLevel level, std::string_view msg);

} // namespace ddx

#endif // DDX_LOG_HPP
