// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 ddx Contributors

/**
 * @file log.h
 * @brief Internal logging infrastructure
 *
 * printf-style front end over the user-settable log handler, so the
 * library never writes directly to stderr.  Default handler is empty
 * (silent), and formatting is skipped entirely in that case.
 */

#ifndef DDX_INTERNAL_LOG_H
#define DDX_INTERNAL_LOG_H

#include <ddx/log.hpp>

namespace ddx::detail {

/**
 * Emit a formatted log message through the registered handler (if any).
 *
 * No-op when no handler is registered.
 */
void log(LogLevel level, const char *fmt, ...) __attribute__((format(printf, 2, 3)));

/// True when a handler is installed (cheap, lock-free check)
[[nodiscard]] bool log_enabled() noexcept;

} // namespace ddx::detail

#endif // DDX_INTERNAL_LOG_H
