// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 ddx Contributors

/**
 * @file counter.hpp
 * @brief Transfer counters and progress snapshots for ddx
 */

#ifndef DDX_COUNTER_HPP
#define DDX_COUNTER_HPP

#include <atomic>
#include <chrono>
#include <cstdint>

namespace ddx {

/**
 * Point-in-time copy of the transfer counters
 *
 * Immutable once produced. Holds the dd record counts ("a+b records in"),
 * byte totals and the derived throughput.
 */
class ProgressSnapshot {
  public:
    ProgressSnapshot() noexcept = default;

    /// Input blocks read at full ibs
    [[nodiscard]] uint64_t full_blocks_in() const noexcept { return full_in_; }

    /// Input blocks shorter than ibs
    [[nodiscard]] uint64_t partial_blocks_in() const noexcept { return partial_in_; }

    /// Output blocks written at full obs (sparse-skipped blocks included)
    [[nodiscard]] uint64_t full_blocks_out() const noexcept { return full_out_; }

    /// Output blocks shorter than obs
    [[nodiscard]] uint64_t partial_blocks_out() const noexcept { return partial_out_; }

    /// Records cut at cbs by the block conversion
    [[nodiscard]] uint64_t truncated_records() const noexcept { return truncated_; }

    /// Bytes yielded by the input channel
    [[nodiscard]] uint64_t bytes_in() const noexcept { return bytes_in_; }

    /// Bytes logically written to the output (sparse-skipped bytes included)
    [[nodiscard]] uint64_t bytes_out() const noexcept { return bytes_out_; }

    /// Bytes carried by partial input blocks
    [[nodiscard]] uint64_t partial_bytes_in() const noexcept { return partial_bytes_in_; }

    /// Bytes carried by partial output blocks
    [[nodiscard]] uint64_t partial_bytes_out() const noexcept { return partial_bytes_out_; }

    /// Bytes the output advanced over by seeking instead of writing
    [[nodiscard]] uint64_t sparse_bytes() const noexcept { return sparse_bytes_; }

    /// Total bytes copied (same as bytes_out)
    [[nodiscard]] uint64_t total_bytes() const noexcept { return bytes_out_; }

    /// Milliseconds since the counter was started
    [[nodiscard]] uint64_t elapsed_ms() const noexcept { return elapsed_ms_; }

    /**
     * Get current throughput
     * @return Output bytes per second since the previous snapshot, or the
     *         average when no previous snapshot was supplied
     */
    [[nodiscard]] double throughput_bps() const noexcept { return throughput_bps_; }

    /// Output bytes per second over the whole transfer
    [[nodiscard]] double average_bps() const noexcept { return average_bps_; }

    /// Number of completed counter updates when the snapshot was taken
    [[nodiscard]] uint64_t sequence() const noexcept { return sequence_; }

  private:
    friend class TransferCounter;

    uint64_t full_in_ = 0;
    uint64_t partial_in_ = 0;
    uint64_t full_out_ = 0;
    uint64_t partial_out_ = 0;
    uint64_t truncated_ = 0;
    uint64_t bytes_in_ = 0;
    uint64_t bytes_out_ = 0;
    uint64_t partial_bytes_in_ = 0;
    uint64_t partial_bytes_out_ = 0;
    uint64_t sparse_bytes_ = 0;
    uint64_t elapsed_ms_ = 0;
    uint64_t sequence_ = 0;
    double throughput_bps_ = 0.0;
    double average_bps_ = 0.0;
};

/**
 * Monotonic transfer counters
 *
 * Written by a single thread (the copy loop) and read from any thread.
 * Readers never block the writer: each update bumps a version counter
 * around the field stores, and snapshot() retries until it observes a
 * stable even version.
 */
class TransferCounter {
  public:
    using clock = std::chrono::steady_clock;

    TransferCounter() noexcept;

    TransferCounter(const TransferCounter &) = delete;
    TransferCounter &operator=(const TransferCounter &) = delete;

    /**
     * Zero all counters and restart the clock
     * @note Must not race with record_*() calls
     */
    void reset() noexcept;

    /**
     * Count one input block
     * @param bytes Bytes the read returned
     * @param was_full True if the block was read at full ibs
     */
    void record_read(uint64_t bytes, bool was_full) noexcept;

    /**
     * Count one output block
     * @param bytes Bytes logically written
     * @param was_full True if the block was written at full obs
     * @param sparse True if the output seeked over the bytes instead
     */
    void record_write(uint64_t bytes, bool was_full, bool sparse = false) noexcept;

    /**
     * Count records truncated by the block conversion
     * @param count Number of records
     */
    void record_truncated_records(uint64_t count) noexcept;

    void record_truncated_record() noexcept { record_truncated_records(1); }

    /**
     * Take a consistent copy of all counters
     * @return Snapshot with throughput averaged over the whole transfer
     */
    [[nodiscard]] ProgressSnapshot snapshot() const noexcept;

    /**
     * Take a snapshot with interval throughput
     * @param previous Earlier snapshot of this counter
     * @return Snapshot whose throughput_bps() covers the time since previous
     */
    [[nodiscard]] ProgressSnapshot snapshot(const ProgressSnapshot &previous) const noexcept;

  private:
    void begin_update() noexcept;
    void end_update() noexcept;
    static void bump(std::atomic<uint64_t> &field, uint64_t delta) noexcept;

    std::atomic<uint64_t> seq_{0};
    std::atomic<uint64_t> full_in_{0};
    std::atomic<uint64_t> partial_in_{0};
    std::atomic<uint64_t> full_out_{0};
    std::atomic<uint64_t> partial_out_{0};
    std::atomic<uint64_t> truncated_{0};
    std::atomic<uint64_t> bytes_in_{0};
    std::atomic<uint64_t> bytes_out_{0};
    std::atomic<uint64_t> partial_bytes_in_{0};
    std::atomic<uint64_t> partial_bytes_out_{0};
    std::atomic<uint64_t> sparse_bytes_{0};
    std::atomic<clock::rep> start_{0};
};

} // namespace ddx

#endif // DDX_COUNTER_HPP
