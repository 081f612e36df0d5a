// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 ddx Contributors

/**
 * @file progress.hpp
 * @brief Progress subscription and polling interface for ddx
 */

#ifndef DDX_PROGRESS_HPP
#define DDX_PROGRESS_HPP

#include <ddx/counter.hpp>

#include <chrono>
#include <cstdint>
#include <functional>

namespace ddx {

/**
 * How often a subscriber receives snapshots
 *
 * Either trigger may be zero (disabled). A subscriber with both disabled
 * only receives the final snapshot.
 */
struct ProgressCadence {
    std::chrono::milliseconds interval{0}; ///< Time-based: delivered from a reporter thread
    uint64_t every_blocks = 0;             ///< Count-based: delivered from the copy loop

    [[nodiscard]] static ProgressCadence every(std::chrono::milliseconds ms) noexcept {
        return ProgressCadence{ms, 0};
    }
    [[nodiscard]] static ProgressCadence every_n_blocks(uint64_t blocks) noexcept {
        return ProgressCadence{std::chrono::milliseconds(0), blocks};
    }
};

/**
 * Progress subscriber
 *
 * Receives immutable snapshots; must not call back into the engine's run().
 * Count-based callbacks run on the copy thread, so keep them short.
 */
using ProgressCallback = std::function<void(const ProgressSnapshot &)>;

/**
 * Pull-style progress reader
 *
 * Wraps a counter and computes interval throughput between successive
 * polls. Safe to use from any one thread while the copy loop runs.
 */
class ProgressPoller {
  public:
    explicit ProgressPoller(const TransferCounter &counter) noexcept : counter_(counter) {}

    /**
     * Take a new snapshot
     * @return Snapshot with throughput since the previous poll
     */
    ProgressSnapshot poll() noexcept {
        last_ = counter_.snapshot(last_);
        return last_;
    }

    /// Snapshot returned by the most recent poll()
    [[nodiscard]] const ProgressSnapshot &last() const noexcept { return last_; }

  private:
    const TransferCounter &counter_;
    ProgressSnapshot last_;
};

} // namespace ddx

#endif // DDX_PROGRESS_HPP
