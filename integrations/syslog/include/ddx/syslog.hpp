// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 ddx Contributors

/**
 * @file syslog.hpp
 * @brief Syslog log handler integration for ddx
 *
 * Forwards ddx library log messages to syslog(3).
 * Standalone module: depends only on the public ddx/log.hpp API and libc.
 *
 * ddx log levels map directly to syslog priorities:
 *   LogLevel::Error   (3) -> LOG_ERR     (3)
 *   LogLevel::Warning (4) -> LOG_WARNING (4)
 *   LogLevel::Notice  (5) -> LOG_NOTICE  (5)
 *   LogLevel::Info    (6) -> LOG_INFO    (6)
 *   LogLevel::Debug   (7) -> LOG_DEBUG   (7)
 *
 * Usage:
 * @code
 *   ddx::syslog_install();          // defaults: ident="ddx", LOG_USER
 *   ddx::CopyEngine engine(in, out, config);
 *   engine.run();                   // engine logs forwarded to syslog
 *   ddx::syslog_remove();
 * @endcode
 */

#ifndef DDX_SYSLOG_HPP
#define DDX_SYSLOG_HPP

#include <ddx/log.hpp>

namespace ddx {

/**
 * Syslog configuration options
 *
 * A value of -1 means "use default" for numeric fields.
 */
struct SyslogOptions {
    const char *ident = nullptr; ///< openlog ident (default "ddx"); must stay valid until
                                 ///< syslog_remove(), openlog() retains the pointer
    int facility = -1;           ///< Syslog facility (default LOG_USER)
    int log_options = -1;        ///< openlog() flags (default LOG_PID | LOG_NDELAY)
};

/**
 * Install a syslog-forwarding log handler
 *
 * Calls openlog() then registers a log handler that calls syslog().
 * Replaces any previously installed handler.
 *
 * @param options Configuration
 */
void syslog_install(const SyslogOptions &options = {});

/**
 * Remove the syslog log handler and close syslog
 */
void syslog_remove() noexcept;

/**
 * Map a log level to its syslog priority
 * @return LOG_ERR .. LOG_DEBUG
 */
[[nodiscard]] int syslog_priority(LogLevel level) noexcept;

} // namespace ddx

#endif // DDX_SYSLOG_HPP
