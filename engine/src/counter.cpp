// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 ddx Contributors

/**
 * @file counter.cpp
 * @brief Versioned transfer counters
 *
 * Update protocol (single writer):
 *   seq odd  -> fields may be mid-update
 *   seq even -> fields are consistent
 * A reader copies the fields and accepts the copy only if seq was even and
 * unchanged across the copy.
 */

#include <ddx/counter.hpp>

namespace ddx {

namespace {

inline void cpu_relax() noexcept {
#if defined(__x86_64__) || defined(__i386__)
    __builtin_ia32_pause();
#endif
}

} // namespace

TransferCounter::TransferCounter() noexcept {
    start_.store(clock::now().time_since_epoch().count(), std::memory_order_relaxed);
}

void TransferCounter::begin_update() noexcept {
    uint64_t s = seq_.load(std::memory_order_relaxed);
    seq_.store(s + 1, std::memory_order_relaxed);
    std::atomic_thread_fence(std::memory_order_release);
}

void TransferCounter::end_update() noexcept {
    uint64_t s = seq_.load(std::memory_order_relaxed);
    seq_.store(s + 1, std::memory_order_release);
}

void TransferCounter::bump(std::atomic<uint64_t> &field, uint64_t delta) noexcept {
    // Only the writer stores, so load+store cannot lose an update.
    field.store(field.load(std::memory_order_relaxed) + delta, std::memory_order_relaxed);
}

void TransferCounter::reset() noexcept {
    begin_update();
    full_in_.store(0, std::memory_order_relaxed);
    partial_in_.store(0, std::memory_order_relaxed);
    full_out_.store(0, std::memory_order_relaxed);
    partial_out_.store(0, std::memory_order_relaxed);
    truncated_.store(0, std::memory_order_relaxed);
    bytes_in_.store(0, std::memory_order_relaxed);
    bytes_out_.store(0, std::memory_order_relaxed);
    partial_bytes_in_.store(0, std::memory_order_relaxed);
    partial_bytes_out_.store(0, std::memory_order_relaxed);
    sparse_bytes_.store(0, std::memory_order_relaxed);
    start_.store(clock::now().time_since_epoch().count(), std::memory_order_relaxed);
    end_update();
}

void TransferCounter::record_read(uint64_t bytes, bool was_full) noexcept {
    begin_update();
    if (was_full) {
        bump(full_in_, 1);
    } else {
        bump(partial_in_, 1);
        bump(partial_bytes_in_, bytes);
    }
    bump(bytes_in_, bytes);
    end_update();
}

void TransferCounter::record_write(uint64_t bytes, bool was_full, bool sparse) noexcept {
    begin_update();
    if (was_full) {
        bump(full_out_, 1);
    } else {
        bump(partial_out_, 1);
        bump(partial_bytes_out_, bytes);
    }
    bump(bytes_out_, bytes);
    if (sparse) bump(sparse_bytes_, bytes);
    end_update();
}

void TransferCounter::record_truncated_records(uint64_t count) noexcept {
    if (count == 0) return;
    begin_update();
    bump(truncated_, count);
    end_update();
}

ProgressSnapshot TransferCounter::snapshot() const noexcept {
    ProgressSnapshot snap;
    uint64_t seq;
    clock::rep start;

    for (;;) {
        seq = seq_.load(std::memory_order_acquire);
        if (seq & 1) {
            cpu_relax();
            continue;
        }
        snap.full_in_ = full_in_.load(std::memory_order_relaxed);
        snap.partial_in_ = partial_in_.load(std::memory_order_relaxed);
        snap.full_out_ = full_out_.load(std::memory_order_relaxed);
        snap.partial_out_ = partial_out_.load(std::memory_order_relaxed);
        snap.truncated_ = truncated_.load(std::memory_order_relaxed);
        snap.bytes_in_ = bytes_in_.load(std::memory_order_relaxed);
        snap.bytes_out_ = bytes_out_.load(std::memory_order_relaxed);
        snap.partial_bytes_in_ = partial_bytes_in_.load(std::memory_order_relaxed);
        snap.partial_bytes_out_ = partial_bytes_out_.load(std::memory_order_relaxed);
        snap.sparse_bytes_ = sparse_bytes_.load(std::memory_order_relaxed);
        start = start_.load(std::memory_order_relaxed);
        std::atomic_thread_fence(std::memory_order_acquire);
        if (seq_.load(std::memory_order_relaxed) == seq) break;
    }

    auto now = clock::now().time_since_epoch().count();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        clock::duration(now - start));
    snap.elapsed_ms_ = elapsed.count() > 0 ? static_cast<uint64_t>(elapsed.count()) : 0;
    snap.sequence_ = seq / 2;
    if (snap.elapsed_ms_ > 0) {
        snap.average_bps_ =
            static_cast<double>(snap.bytes_out_) * 1000.0 / static_cast<double>(snap.elapsed_ms_);
    }
    snap.throughput_bps_ = snap.average_bps_;
    return snap;
}

ProgressSnapshot TransferCounter::snapshot(const ProgressSnapshot &previous) const noexcept {
    ProgressSnapshot snap = snapshot();
    if (snap.elapsed_ms_ > previous.elapsed_ms_ && snap.bytes_out_ >= previous.bytes_out_) {
        double dt = static_cast<double>(snap.elapsed_ms_ - previous.elapsed_ms_) / 1000.0;
        snap.throughput_bps_ = static_cast<double>(snap.bytes_out_ - previous.bytes_out_) / dt;
    } else {
        snap.throughput_bps_ = previous.throughput_bps_;
    }
    return snap;
}

} // namespace ddx
