// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 ddx Contributors

/**
 * @file log.cpp
 * @brief Process-wide log handler
 */

#include "log.h"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <string>
#include <utility>

namespace ddx {

namespace {

std::mutex log_mutex;
LogHandler log_handler_fn;
std::atomic<bool> log_installed{false};

constexpr size_t LOG_LINE_MAX = 512;

} // namespace

void set_log_handler(LogHandler handler) {
    std::lock_guard<std::mutex> lock(log_mutex);
    log_handler_fn = std::move(handler);
    log_installed.store(static_cast<bool>(log_handler_fn), std::memory_order_release);
}

void clear_log_handler() noexcept {
    std::lock_guard<std::mutex> lock(log_mutex);
    log_installed.store(false, std::memory_order_release);
    log_handler_fn = nullptr;
}

void log_emit(LogLevel level, std::string_view msg) {
    // Fast path: avoid locking if nobody listens
    if (!log_installed.load(std::memory_order_acquire)) return;

    std::lock_guard<std::mutex> lock(log_mutex);
    if (!log_handler_fn) return;
    try {
        log_handler_fn(level, msg);
    } catch (...) {
        // A failing handler loses the message; it must not unwind into the engine.
    }
}

namespace detail {

bool log_enabled() noexcept {
    return log_installed.load(std::memory_order_acquire);
}

void log(LogLevel level, const char *fmt, ...) {
    if (!log_enabled()) return;

    char line[LOG_LINE_MAX];
    va_list ap;
    va_start(ap, fmt);
    int n = vsnprintf(line, sizeof(line), fmt, ap);
    va_end(ap);
    if (n < 0) return;

    size_t len = static_cast<size_t>(n) < sizeof(line) ? static_cast<size_t>(n) : sizeof(line) - 1;
    log_emit(level, std::string_view(line, len));
}

} // namespace detail

} // namespace ddx
