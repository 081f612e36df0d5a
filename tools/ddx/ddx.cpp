// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 ddx Contributors

/**
 * @file ddx.cpp
 * @brief ddx - dd-compatible block copy powered by the ddx engine
 *
 * Parses dd operands into a TransferConfig, opens the channels (io_uring
 * for files and devices, emulated channels for /dev/zero and friends),
 * renders progress from an engine subscription and prints the dd summary.
 *
 * Usage: ddx [if=FILE] [of=FILE] [bs=N] [count=N] [conv=...] [status=...]
 */

#ifndef _GNU_SOURCE
#    define _GNU_SOURCE
#endif
#include <ddx.hpp>
#include <ddx/syslog.hpp>

#include "operands.h"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>

#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <sys/stat.h>
#include <unistd.h>

using ddx::tool::Operands;
using ddx::tool::ProgressTarget;
using ddx::tool::ProgressType;
using ddx::tool::StatusLevel;

// ============================================================================
// Constants
// ============================================================================

static constexpr auto PROGRESS_INTERVAL = std::chrono::milliseconds(200);
static constexpr int EXIT_INTERRUPTED = 130;

// ============================================================================
// Global state for signal handling
// ============================================================================

static ddx::CancelToken g_cancel;

static void sigint_handler(int /*sig*/) {
    g_cancel.cancel();
}

// ============================================================================
// Formatting helpers
// ============================================================================

static void format_bytes(char *buf, size_t bufsz, double bytes) {
    if (bytes >= 1024.0 * 1024.0 * 1024.0)
        snprintf(buf, bufsz, "%.1f GiB", bytes / (1024.0 * 1024.0 * 1024.0));
    else if (bytes >= 1024.0 * 1024.0) snprintf(buf, bufsz, "%.1f MiB", bytes / (1024.0 * 1024.0));
    else if (bytes >= 1024.0) snprintf(buf, bufsz, "%.1f KiB", bytes / 1024.0);
    else snprintf(buf, bufsz, "%.0f B", bytes);
}

static void format_rate(char *buf, size_t bufsz, double bps) {
    if (bps >= 1024.0 * 1024.0 * 1024.0)
        snprintf(buf, bufsz, "%.1f GiB/s", bps / (1024.0 * 1024.0 * 1024.0));
    else if (bps >= 1024.0 * 1024.0) snprintf(buf, bufsz, "%.1f MiB/s", bps / (1024.0 * 1024.0));
    else if (bps >= 1024.0) snprintf(buf, bufsz, "%.1f KiB/s", bps / 1024.0);
    else snprintf(buf, bufsz, "%.0f B/s", bps);
}

static void format_elapsed(char *buf, size_t bufsz, uint64_t ms) {
    uint64_t secs = ms / 1000;
    snprintf(buf, bufsz, "%02llu:%02llu:%02llu", static_cast<unsigned long long>(secs / 3600),
             static_cast<unsigned long long>(secs / 60 % 60),
             static_cast<unsigned long long>(secs % 60));
}

// ============================================================================
// Progress display
// ============================================================================

static const char *progress_label(ProgressType type) {
    switch (type) {
    case ProgressType::FileTransfer:
        return "Copying";
    case ProgressType::StreamTransfer:
        return "Streaming";
    case ProgressType::FillWithZeros:
        return "Filling with zeros";
    case ProgressType::FillWithRandom:
        return "Filling with random data";
    }
    return "";
}

static void progress_update(const ProgressTarget &target, const ddx::ProgressSnapshot &snap,
                            bool final) {
    double done = static_cast<double>(snap.bytes_out());
    double rate = final ? snap.average_bps() : snap.throughput_bps();

    char done_str[32], rate_str[32], elapsed_str[32];
    format_bytes(done_str, sizeof(done_str), done);
    format_rate(rate_str, sizeof(rate_str), rate);
    format_elapsed(elapsed_str, sizeof(elapsed_str), snap.elapsed_ms());

    if (!target.total || *target.total == 0) {
        // Unbounded: byte counter only
        fprintf(stderr, "\r  [%s] %s  %s  %s   ", elapsed_str, done_str, rate_str,
                progress_label(target.type));
        if (final) fprintf(stderr, "\n");
        return;
    }

    double total = static_cast<double>(*target.total);
    double pct = done / total * 100.0;
    if (pct > 100.0) pct = 100.0;

    char total_str[32];
    format_bytes(total_str, sizeof(total_str), total);

    int bar_width = 30;
    int filled = static_cast<int>(pct / 100.0 * bar_width);
    if (filled > bar_width) filled = bar_width;

    char bar[64];
    int i;
    for (i = 0; i < filled && i < bar_width; i++) bar[i] = '=';
    if (filled < bar_width) {
        bar[filled] = '>';
        for (i = filled + 1; i < bar_width; i++) bar[i] = ' ';
    }
    bar[bar_width] = '\0';

    char eta[32] = "";
    if (!final && rate > 0 && total > done) {
        double remaining = (total - done) / rate;
        int mins = static_cast<int>(remaining / 60.0);
        int secs = static_cast<int>(remaining) % 60;
        snprintf(eta, sizeof(eta), "ETA %d:%02d", mins, secs);
    }

    fprintf(stderr, "\r  [%s] %s / %s  [%s]  %3.0f%%  %s  %s   ", elapsed_str, done_str,
            total_str, bar, pct, rate_str, eta);
    if (final) fprintf(stderr, "\n");
}

// ============================================================================
// Summary
// ============================================================================

static void print_summary(StatusLevel status, const ddx::ProgressSnapshot &c) {
    if (status == StatusLevel::None) return;

    fprintf(stderr, "%llu+%llu records in\n", static_cast<unsigned long long>(c.full_blocks_in()),
            static_cast<unsigned long long>(c.partial_blocks_in()));
    fprintf(stderr, "%llu+%llu records out\n",
            static_cast<unsigned long long>(c.full_blocks_out()),
            static_cast<unsigned long long>(c.partial_blocks_out()));
    if (c.truncated_records() > 0) {
        fprintf(stderr, "%llu truncated record%s\n",
                static_cast<unsigned long long>(c.truncated_records()),
                c.truncated_records() == 1 ? "" : "s");
    }
    if (status == StatusLevel::NoXfer) return;

    double secs = static_cast<double>(c.elapsed_ms()) / 1000.0;
    char size_str[32], rate_str[32];
    format_bytes(size_str, sizeof(size_str), static_cast<double>(c.bytes_out()));
    format_rate(rate_str, sizeof(rate_str), c.average_bps());
    fprintf(stderr, "%llu bytes (%s) copied, %.3f s, %s\n",
            static_cast<unsigned long long>(c.bytes_out()), size_str, secs, rate_str);
}

// ============================================================================
// Channel setup
// ============================================================================

/// Descriptor channel that gives up an interrupted read or write after SIGINT.
static std::unique_ptr<ddx::Channel> fd_channel(int fd, bool owned) {
    auto channel = std::make_unique<ddx::FdChannel>(fd, owned);
    channel->watch_cancel(&g_cancel);
    return channel;
}

/// Prefer io_uring; fall back to plain read/write when the ring is unavailable.
static std::unique_ptr<ddx::Channel> open_file(const std::string &path, int flags) {
    int fd;
    do {
        fd = open(path.c_str(), flags | O_CLOEXEC, 0666);
    } while (fd < 0 && errno == EINTR);
    if (fd < 0) ddx::throw_errno(path);

    try {
        return std::make_unique<ddx::UringChannel>(fd, true);
    } catch (const ddx::Error &e) {
        ddx::log_emit(ddx::LogLevel::Notice,
                      std::string("io_uring unavailable, using read/write: ") + e.what());
        return fd_channel(fd, true);
    }
}

static std::unique_ptr<ddx::Channel> open_input(const std::string &path) {
    if (path.empty()) return fd_channel(STDIN_FILENO, false);
    if (auto dev = ddx::special_device(path)) return ddx::make_special_channel(*dev);
    return open_file(path, O_RDONLY);
}

static std::unique_ptr<ddx::Channel> open_output(const std::string &path) {
    if (path.empty()) return fd_channel(STDOUT_FILENO, false);
    if (auto dev = ddx::special_device(path)) return ddx::make_special_channel(*dev);
    // No O_TRUNC: the engine truncates at the seek offset unless conv=notrunc
    return open_file(path, O_WRONLY | O_CREAT);
}

/// Capacity of a block device named by of=, std::nullopt for anything else.
static std::optional<uint64_t> output_device_size(const std::string &path, ddx::Channel &out) {
    struct stat st;
    if (path.empty() || stat(path.c_str(), &st) != 0 || !S_ISBLK(st.st_mode)) return std::nullopt;
    return out.size();
}

// ============================================================================
// CLI
// ============================================================================

static void print_usage(const char *argv0) {
    fprintf(stderr,
            "Usage: %s [OPERAND]... [OPTION]...\n"
            "\n"
            "Copy a file, converting and formatting according to the operands.\n"
            "\n"
            "Operands:\n"
            "  if=FILE          Read from FILE instead of stdin\n"
            "  of=FILE          Write to FILE instead of stdout\n"
            "  bs=BYTES         Read and write up to BYTES at a time (default: 512)\n"
            "  ibs=BYTES        Read up to BYTES at a time\n"
            "  obs=BYTES        Write BYTES at a time\n"
            "  cbs=BYTES        Convert BYTES at a time (block, unblock)\n"
            "  count=N          Copy only N input blocks\n"
            "  skip=N           Skip N ibs-sized blocks at start of input\n"
            "  seek=N           Skip N obs-sized blocks at start of output\n"
            "  conv=CONVS       lcase,ucase,swab,block,unblock,sparse,sync,noerror,notrunc\n"
            "  iflag=fullblock  Accumulate full blocks of input\n"
            "  status=LEVEL     none, noxfer or progress\n"
            "\n"
            "Options:\n"
            "  --pipeline N     Blocks read ahead of the writer (0-%d, default: 0)\n"
            "  --syslog         Forward engine log messages to syslog\n"
            "  -v, --verbose    Log engine activity to stderr (repeat for debug)\n"
            "  -h, --help       Show this help\n"
            "\n"
            "BYTES and N may have a suffix: c=1, w=2, b=512, kB=1000, K=1024,\n"
            "MB=1000*1000, M=1024*1024, GB, G.\n",
            argv0, ddx::TransferConfig::max_pipeline_depth);
}

static void install_logging(const Operands &ops) {
    if (ops.syslog) {
        ddx::syslog_install();
        return;
    }
    if (ops.verbose == 0) return;

    ddx::LogLevel threshold = ops.verbose > 1 ? ddx::LogLevel::Debug : ddx::LogLevel::Info;
    ddx::set_log_handler([threshold](ddx::LogLevel level, std::string_view msg) {
        if (level > threshold) return;
        fprintf(stderr, "ddx: [%s] %.*s\n", ddx::log_level_name(level),
                static_cast<int>(msg.size()), msg.data());
    });
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char **argv) {
    Operands ops;
    try {
        ops = ddx::tool::parse_operands(argc, argv);
    } catch (const ddx::Error &e) {
        fprintf(stderr, "ddx: %s\n", e.context().c_str());
        fprintf(stderr, "Try '%s --help' for more information.\n", argv[0]);
        return 1;
    }
    if (ops.help) {
        print_usage(argv[0]);
        return 0;
    }

    install_logging(ops);

    // Install SIGINT handler. No SA_RESTART: a blocked read or write returns
    // EINTR so the channel can see the cancel request.
    struct sigaction sa = {};
    sa.sa_handler = sigint_handler;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);

    int status = 0;
    try {
        ddx::tool::validate_device_pair(ops.input, ops.output);

        auto in = open_input(ops.input);
        auto out = open_output(ops.output);

        ddx::CopyEngine engine(*in, *out, ops.config);

        ProgressTarget target = ddx::tool::progress_target(
            ddx::special_device(ops.input), in->size(),
            ddx::special_device(ops.output), output_device_size(ops.output, *out), ops.config);

        bool show_progress = ops.status == StatusLevel::Progress && isatty(STDERR_FILENO);
        if (show_progress) {
            engine.subscribe(
                [&target](const ddx::ProgressSnapshot &snap) {
                    progress_update(target, snap, false);
                },
                ddx::ProgressCadence::every(PROGRESS_INTERVAL));
        }

        ddx::CopyReport report = engine.run(g_cancel);

        if (show_progress) progress_update(target, report.counters, true);

        for (const auto &rec : report.skipped_errors) {
            fprintf(stderr, "ddx: error reading %s: %s\n",
                    ops.input.empty() ? "standard input" : ops.input.c_str(),
                    rec.message().c_str());
        }

        print_summary(ops.status, report.counters);

        if (report.ok()) {
            if (ops.status == StatusLevel::Progress) {
                fprintf(stderr, "%s\n", ddx::tool::completion_message(target.type));
            }
        } else if (report.error->kind == ddx::ErrorKind::Cancelled) {
            fprintf(stderr, "\nddx: interrupted\n");
            status = EXIT_INTERRUPTED;
        } else {
            fprintf(stderr, "ddx: %s\n", report.error->message().c_str());
            status = 1;
        }
    } catch (const ddx::Error &e) {
        if (e.is_invalid_config()) {
            fprintf(stderr, "ddx: %s\n", e.context().c_str());
        } else {
            fprintf(stderr, "ddx: %s\n", e.what());
        }
        status = 1;
    } catch (const std::exception &e) {
        fprintf(stderr, "ddx: error: %s\n", e.what());
        status = 1;
    }

    if (ops.syslog) ddx::syslog_remove();
    else if (ops.verbose > 0) ddx::clear_log_handler();
    return status;
}
