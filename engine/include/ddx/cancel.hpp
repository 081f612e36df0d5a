// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 ddx Contributors

/**
 * @file cancel.hpp
 * @brief Cancellation token for ddx
 */

#ifndef DDX_CANCEL_HPP
#define DDX_CANCEL_HPP

#include <atomic>

namespace ddx {

/**
 * External stop request
 *
 * Set from any thread, including a signal handler; the copy engine checks
 * it at every block boundary and fails with a Cancelled error.
 *
 * Example:
 * @code
 * static ddx::CancelToken token;
 * static void on_sigint(int) { token.cancel(); }
 * ...
 * auto report = engine.run(token);
 * @endcode
 */
class CancelToken {
  public:
    CancelToken() noexcept = default;

    // Non-copyable, non-movable (referenced by a running engine)
    CancelToken(const CancelToken &) = delete;
    CancelToken &operator=(const CancelToken &) = delete;

    /// Request a stop (async-signal-safe)
    void cancel() noexcept { flag_.store(true, std::memory_order_release); }

    [[nodiscard]] bool cancelled() const noexcept { return flag_.load(std::memory_order_acquire); }

    /// Clear a previous request
    void reset() noexcept { flag_.store(false, std::memory_order_release); }

  private:
    static_assert(std::atomic<bool>::is_always_lock_free,
                  "cancel flag must be lock-free for use from signal handlers");

    std::atomic<bool> flag_{false};
};

} // namespace ddx

#endif // DDX_CANCEL_HPP
