// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 ddx Contributors

/**
 * @file ddx_syslog.cpp
 * @brief Syslog log handler integration for ddx
 */

#include <ddx/syslog.hpp>

#include <string>

#include <syslog.h>

namespace ddx {

int syslog_priority(LogLevel level) noexcept {
    switch (level) {
    case LogLevel::Error:
        return LOG_ERR;
    case LogLevel::Warning:
        return LOG_WARNING;
    case LogLevel::Notice:
        return LOG_NOTICE;
    case LogLevel::Info:
        return LOG_INFO;
    case LogLevel::Debug:
        return LOG_DEBUG;
    default:
        return LOG_DEBUG;
    }
}

void syslog_install(const SyslogOptions &options) {
    const char *ident = options.ident ? options.ident : "ddx";
    int facility = options.facility >= 0 ? options.facility : LOG_USER;
    int flags = options.log_options >= 0 ? options.log_options : (LOG_PID | LOG_NDELAY);

    openlog(ident, flags, facility);
    set_log_handler([](LogLevel level, std::string_view msg) {
        // syslog() needs a terminated string
        std::string line(msg);
        ::syslog(syslog_priority(level), "%s", line.c_str());
    });
}

void syslog_remove() noexcept {
    clear_log_handler();
    closelog();
}

} // namespace ddx
