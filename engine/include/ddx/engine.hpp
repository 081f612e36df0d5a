// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 ddx Contributors

/**
 * @file engine.hpp
 * @brief CopyEngine: block copy state machine for ddx
 */

#ifndef DDX_ENGINE_HPP
#define DDX_ENGINE_HPP

#include <ddx/block_buffer.hpp>
#include <ddx/cancel.hpp>
#include <ddx/channel.hpp>
#include <ddx/config.hpp>
#include <ddx/conversion.hpp>
#include <ddx/counter.hpp>
#include <ddx/error.hpp>
#include <ddx/progress.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <vector>

namespace ddx {

namespace detail {
template <typename T> class BoundedQueue;
} // namespace detail

/**
 * Copy engine state
 *
 * Seeking -> Copying -> Draining -> Done, with Failed reachable from any
 * non-terminal state. Done and Failed are final.
 */
enum class EngineState { Seeking, Copying, Draining, Done, Failed };

/// Return a short name for an engine state ("seeking", "copying", ...)
[[nodiscard]] inline const char *engine_state_name(EngineState state) noexcept {
    switch (state) {
    case EngineState::Seeking:
        return "seeking";
    case EngineState::Copying:
        return "copying";
    case EngineState::Draining:
        return "draining";
    case EngineState::Done:
        return "done";
    case EngineState::Failed:
        return "failed";
    default:
        return "???";
    }
}

/// Terminal status of a copy
enum class CopyStatus { Done, Failed };

/**
 * Final result of CopyEngine::run()
 *
 * The only authoritative outcome of a copy. On failure `counters` is the
 * last consistent snapshot before the fault and `error` names the fault.
 */
struct CopyReport {
    CopyStatus status = CopyStatus::Done;
    ProgressSnapshot counters;
    std::optional<ErrorRecord> error;
    std::vector<ErrorRecord> skipped_errors; ///< Read faults tolerated under SkipOnError

    [[nodiscard]] bool ok() const noexcept { return status == CopyStatus::Done; }
};

/**
 * Block copy engine
 *
 * Reads ibs-sized blocks from an input channel, passes them through the
 * configured conversions, writes obs-sized blocks to the output channel
 * and keeps the transfer counters. Runs once: a second run() returns the
 * first report.
 *
 * With pipeline_depth() > 0 a reader thread fills up to that many blocks
 * ahead of the writer. Blocks are still written strictly in read order
 * and every counter update happens on the thread calling run().
 *
 * Channels are borrowed and must outlive the engine.
 *
 * @par Progress
 * Subscribers registered with subscribe() receive snapshots at their
 * cadence and a final snapshot when run() finishes. An exception thrown by
 * a callback is logged at Warning and does not stop the copy. A block-count
 * delivery that finds the same subscriber busy on the reporter thread is
 * retried on the next block.
 *
 * Example:
 * @code
 * ddx::MemoryChannel in(data), out;
 * ddx::TransferConfig config;
 * config.block_size(4096).max_blocks(10);
 *
 * ddx::CopyEngine engine(in, out, config);
 * engine.subscribe([](const ddx::ProgressSnapshot &s) {
 *     printf("%llu bytes\n", (unsigned long long)s.bytes_out());
 * }, ddx::ProgressCadence::every(std::chrono::milliseconds(200)));
 *
 * ddx::CopyReport report = engine.run();
 * if (!report.ok()) fprintf(stderr, "%s\n", report.error->message().c_str());
 * @endcode
 */
class CopyEngine {
  public:
    /**
     * Create an engine
     * @param input Channel to read from
     * @param output Channel to write to
     * @param config Transfer configuration (copied)
     * @throws Error (kind InvalidConfig) if the configuration is rejected
     */
    CopyEngine(Channel &input, Channel &output, TransferConfig config);

    ~CopyEngine();

    // Non-copyable, non-movable (reporter thread refers to this)
    CopyEngine(const CopyEngine &) = delete;
    CopyEngine &operator=(const CopyEngine &) = delete;

    /**
     * Register a progress subscriber
     * @param callback Receives snapshots
     * @param cadence Delivery cadence; default delivers only the final snapshot
     * @note Must be called before run()
     */
    void subscribe(ProgressCallback callback, ProgressCadence cadence = {});

    /**
     * Run the copy to completion
     * @return Final report
     */
    CopyReport run();

    /**
     * Run the copy, honoring an external cancellation token
     * @param token Checked at every block boundary
     * @return Final report (Failed with kind Cancelled if stopped)
     */
    CopyReport run(const CancelToken &token);

    /**
     * Request cancellation from any thread
     */
    void cancel() noexcept { cancel_.cancel(); }

    [[nodiscard]] EngineState state() const noexcept {
        return state_.load(std::memory_order_acquire);
    }

    /// Consistent snapshot of the counters (safe from any thread)
    [[nodiscard]] ProgressSnapshot snapshot() const noexcept { return counter_.snapshot(); }

    [[nodiscard]] const TransferCounter &counter() const noexcept { return counter_; }
    [[nodiscard]] const TransferConfig &config() const noexcept { return config_; }

  private:
    struct Subscriber;
    struct Slot;
    class Reporter;

    // Phases
    void apply_offsets();
    void discard_input(uint64_t bytes);
    void copy_sequential();
    void copy_pipelined();
    void read_ahead(BufferPool &pool, detail::BoundedQueue<Slot> &full);
    void drain();

    // Input side
    size_t read_input(BlockBuffer &buf);
    void skip_faulted_block();
    [[nodiscard]] bool skippable(const Error &err) const noexcept;
    [[nodiscard]] bool limit_reached(uint64_t blocks) const noexcept;
    void note_skipped(const ErrorRecord &rec, BlockBuffer &buf);

    // Output side
    void consume_block(BlockBuffer &in);
    void process_block(BlockBuffer &in);
    void stage_output(std::span<const std::byte> bytes);
    void flush_staged();
    void emit_output_block(std::span<const std::byte> block, bool hole);
    void write_all(std::span<const std::byte> data);
    [[nodiscard]] bool skip_output(uint64_t length);
    void materialize_hole();

    // Control
    void check_cancel();
    [[nodiscard]] bool cancelled() const noexcept;
    void set_state(EngineState next) noexcept;
    void fail(ErrorRecord rec);
    void notify_block_subscribers();
    void report_interval(std::chrono::steady_clock::time_point now);
    bool deliver(Subscriber &sub, bool wait);

    Channel &input_;
    Channel &output_;
    const TransferConfig config_;
    ConversionPipeline pipeline_;
    TransferCounter counter_;

    BlockBuffer out_buf_;

    std::vector<std::unique_ptr<Subscriber>> subscribers_;
    std::unique_ptr<Reporter> reporter_;

    CancelToken cancel_;
    const CancelToken *token_ = nullptr;
    std::atomic<EngineState> state_{EngineState::Seeking};

    ErrorOp op_ = ErrorOp::None;
    uint64_t block_ = no_block;
    uint64_t in_blocks_ = 0;  ///< Input blocks consumed (faulted ones included)
    uint64_t out_blocks_ = 0; ///< Output blocks emitted
    uint64_t in_pos_ = 0;     ///< Input offset from the channel origin
    uint64_t out_pos_ = 0;    ///< Output offset from the channel origin
    bool pending_hole_ = false;
    bool reblock_ = false;
    bool finished_ = false;

    CopyReport report_;
};

} // namespace ddx

#endif // DDX_ENGINE_HPP
