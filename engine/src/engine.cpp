// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 ddx Contributors

/**
 * @file engine.cpp
 * @brief Copy engine state machine
 *
 * All counter updates, conversions and output writes happen on the thread
 * that calls run(). The optional reader thread only fills input buffers
 * and hands them over in read order.
 */

#include <ddx/engine.hpp>

#include "block_queue.h"
#include "log.h"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <thread>
#include <utility>

namespace ddx {

namespace {

using Clock = std::chrono::steady_clock;

const TransferConfig &validated(const TransferConfig &config) {
    config.validate();
    return config;
}

unsigned long long ull(uint64_t v) noexcept {
    return static_cast<unsigned long long>(v);
}

} // namespace

// =============================================================================
// Internal types
// =============================================================================

struct CopyEngine::Subscriber {
    ProgressCallback callback;
    ProgressCadence cadence;
    std::mutex mutex;
    ProgressSnapshot last;
    uint64_t next_block = 0;
    Clock::time_point next_due;
};

struct CopyEngine::Slot {
    BlockBuffer buf;
    uint64_t index = 0;
    std::optional<ErrorRecord> fault;
    bool fatal = false;
};

/**
 * Timer thread delivering interval-based snapshots
 */
class CopyEngine::Reporter {
  public:
    Reporter(CopyEngine &engine, std::chrono::milliseconds tick)
        : engine_(engine), tick_(tick), thread_([this] { loop(); }) {}

    ~Reporter() { stop(); }

    Reporter(const Reporter &) = delete;
    Reporter &operator=(const Reporter &) = delete;

    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stop_ = true;
        }
        cv_.notify_all();
        if (thread_.joinable()) thread_.join();
    }

  private:
    void loop() {
        std::unique_lock<std::mutex> lock(mutex_);
        while (!cv_.wait_for(lock, tick_, [this] { return stop_; })) {
            lock.unlock();
            engine_.report_interval(Clock::now());
            lock.lock();
        }
    }

    CopyEngine &engine_;
    std::chrono::milliseconds tick_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_ = false;
    std::thread thread_; // last: starts once the members above exist
};

// =============================================================================
// Construction
// =============================================================================

CopyEngine::CopyEngine(Channel &input, Channel &output, TransferConfig config)
    : input_(input), output_(output), config_(std::move(config)), pipeline_(validated(config_)) {
    reblock_ = config_.reblocks();
    if (reblock_) {
        out_buf_ = BlockBuffer(config_.output_block_size());
    }
}

CopyEngine::~CopyEngine() = default;

void CopyEngine::subscribe(ProgressCallback callback, ProgressCadence cadence) {
    auto sub = std::make_unique<Subscriber>();
    sub->callback = std::move(callback);
    sub->cadence = cadence;
    subscribers_.push_back(std::move(sub));
}

// =============================================================================
// Run
// =============================================================================

CopyReport CopyEngine::run() {
    return run(cancel_);
}

CopyReport CopyEngine::run(const CancelToken &token) {
    if (finished_) return report_;
    token_ = &token;
    counter_.reset();

    // Arm subscribers and start the timer thread if any of them needs it
    std::chrono::milliseconds tick{0};
    auto now = Clock::now();
    for (auto &sub : subscribers_) {
        sub->next_block = sub->cadence.every_blocks;
        if (sub->cadence.interval.count() > 0) {
            sub->next_due = now + sub->cadence.interval;
            if (tick.count() == 0 || sub->cadence.interval < tick) tick = sub->cadence.interval;
        }
    }
    if (tick.count() > 0) {
        reporter_ = std::make_unique<Reporter>(*this, tick);
    }

    detail::log(LogLevel::Info, "copy start: ibs=%zu obs=%zu skip=%llu seek=%llu depth=%d",
                config_.input_block_size(), config_.output_block_size(),
                ull(config_.skip_blocks()), ull(config_.seek_blocks()), config_.pipeline_depth());

    try {
        set_state(EngineState::Seeking);
        apply_offsets();

        set_state(EngineState::Copying);
        if (config_.pipeline_depth() > 0) {
            copy_pipelined();
        } else {
            copy_sequential();
        }

        set_state(EngineState::Draining);
        drain();

        report_.status = CopyStatus::Done;
        set_state(EngineState::Done);
    } catch (const Error &e) {
        fail(e.record(op_, block_));
    } catch (const std::system_error &e) {
        fail(ErrorRecord{ErrorKind::Io, op_, e.code().value(), block_, e.what()});
    }

    if (reporter_) {
        reporter_->stop();
        reporter_.reset();
    }

    report_.counters = counter_.snapshot();
    for (auto &sub : subscribers_) {
        deliver(*sub, true);
    }

    const ProgressSnapshot &c = report_.counters;
    detail::log(LogLevel::Info,
                "copy %s: %llu+%llu records in, %llu+%llu records out, %llu bytes, %llu ms",
                engine_state_name(state()), ull(c.full_blocks_in()), ull(c.partial_blocks_in()),
                ull(c.full_blocks_out()), ull(c.partial_blocks_out()), ull(c.bytes_out()),
                ull(c.elapsed_ms()));

    finished_ = true;
    token_ = nullptr;
    return report_;
}

// =============================================================================
// Seeking
// =============================================================================

void CopyEngine::apply_offsets() {
    const uint64_t skip = config_.skip_blocks() * config_.input_block_size();
    const uint64_t seek = config_.seek_blocks() * config_.output_block_size();

    if (skip > 0) {
        op_ = ErrorOp::Seek;
        if (input_.seek(skip) == SeekResult::Ok) {
            in_pos_ = skip;
            auto length = input_.size();
            if (length && *length < skip) {
                detail::log(LogLevel::Warning, "cannot skip to offset %llu: input is %llu bytes",
                            ull(skip), ull(*length));
            }
        } else {
            detail::log(LogLevel::Debug, "input cannot seek, discarding %llu bytes", ull(skip));
            discard_input(skip);
        }
    }

    if (seek > 0) {
        op_ = ErrorOp::Seek;
        if (output_.seek(seek) == SeekResult::Unsupported) {
            throw Error(ErrorKind::Seek, ESPIPE, "output does not support seek");
        }
    }
    out_pos_ = seek;

    if (config_.truncate_output()) {
        op_ = ErrorOp::Truncate;
        if (output_.truncate(seek) == SeekResult::Unsupported) {
            detail::log(LogLevel::Debug, "output has no length, not truncated");
        }
    }
}

void CopyEngine::discard_input(uint64_t bytes) {
    BlockBuffer scratch(static_cast<size_t>(
        std::min<uint64_t>(bytes, config_.input_block_size())));

    while (bytes > 0) {
        check_cancel();
        op_ = ErrorOp::Read;
        size_t want = static_cast<size_t>(std::min<uint64_t>(bytes, scratch.capacity()));
        size_t n = scratch.fill(input_, want);
        if (n == 0) {
            detail::log(LogLevel::Warning, "cannot skip to offset %llu: input ended at %llu",
                        ull(in_pos_ + bytes), ull(in_pos_));
            break;
        }
        in_pos_ += n;
        bytes -= n;
    }
}

// =============================================================================
// Copying
// =============================================================================

void CopyEngine::copy_sequential() {
    BlockBuffer in(config_.input_block_size());

    for (;;) {
        check_cancel();
        if (limit_reached(in_blocks_)) break;

        op_ = ErrorOp::Read;
        block_ = in_blocks_;
        size_t n;
        try {
            n = read_input(in);
        } catch (const Error &e) {
            if (!skippable(e)) throw;
            in_blocks_++;
            op_ = ErrorOp::Seek;
            skip_faulted_block();
            note_skipped(e.record(ErrorOp::Read, block_), in);
            continue;
        }
        if (n == 0) break;

        in_blocks_++;
        consume_block(in);
    }
}

void CopyEngine::copy_pipelined() {
    const auto depth = static_cast<size_t>(config_.pipeline_depth());
    BufferPool pool(config_.input_block_size(), depth + 1);
    detail::BoundedQueue<Slot> full(depth);

    std::thread reader([this, &pool, &full] { read_ahead(pool, full); });

    // Stops and joins the reader on every exit path
    struct ReaderGuard {
        BufferPool &pool;
        detail::BoundedQueue<Slot> &full;
        std::thread &thread;
        ~ReaderGuard() {
            pool.close();
            full.close();
            if (thread.joinable()) thread.join();
        }
    } guard{pool, full, reader};

    for (;;) {
        check_cancel();
        std::optional<Slot> slot = full.pop();
        if (!slot) {
            // The reader also stops on cancellation
            check_cancel();
            break;
        }

        block_ = slot->index;
        in_blocks_++;
        if (slot->fault) {
            if (slot->fatal) {
                op_ = slot->fault->op;
                throw Error::from(*slot->fault);
            }
            note_skipped(*slot->fault, slot->buf);
        } else {
            consume_block(slot->buf);
        }
        pool.release(std::move(slot->buf));
    }
}

void CopyEngine::read_ahead(BufferPool &pool, detail::BoundedQueue<Slot> &full) {
    uint64_t index = 0;

    while (!cancelled() && !limit_reached(index)) {
        std::optional<BlockBuffer> buf = pool.acquire();
        if (!buf) break;

        Slot slot{std::move(*buf), index};
        try {
            if (read_input(slot.buf) == 0) break;
        } catch (const Error &e) {
            slot.fault = e.record(ErrorOp::Read, index);
            slot.fatal = !skippable(e);
            if (!slot.fatal) {
                try {
                    skip_faulted_block();
                } catch (const Error &seek_err) {
                    slot.fault = seek_err.record(ErrorOp::Seek, index);
                    slot.fatal = true;
                }
            }
        }

        index++;
        bool last = slot.fatal;
        if (!full.push(std::move(slot)) || last) break;
    }
    full.close();
}

size_t CopyEngine::read_input(BlockBuffer &buf) {
    const size_t ibs = config_.input_block_size();
    size_t n = config_.full_blocks() ? buf.fill_full(input_, ibs) : buf.fill(input_, ibs);
    in_pos_ += n;
    return n;
}

void CopyEngine::skip_faulted_block() {
    uint64_t next = in_pos_ + config_.input_block_size();
    if (input_.seek(next) == SeekResult::Ok) {
        in_pos_ = next;
    } else {
        detail::log(LogLevel::Debug, "input cannot seek past faulted block");
    }
}

bool CopyEngine::skippable(const Error &err) const noexcept {
    return config_.error_policy() == ErrorPolicy::SkipOnError && err.is_io();
}

bool CopyEngine::limit_reached(uint64_t blocks) const noexcept {
    auto max = config_.max_blocks();
    return max && blocks >= *max;
}

void CopyEngine::note_skipped(const ErrorRecord &rec, BlockBuffer &buf) {
    detail::log(LogLevel::Warning, "skipping unreadable block: %s", rec.message().c_str());
    report_.skipped_errors.push_back(rec);

    if (config_.sync_pad()) {
        buf.clear();
        buf.pad_to(buf.capacity(), config_.pad_byte());
        process_block(buf);
    } else {
        notify_block_subscribers();
    }
}

// =============================================================================
// Output
// =============================================================================

void CopyEngine::consume_block(BlockBuffer &in) {
    const size_t ibs = config_.input_block_size();
    size_t n = in.filled_length();
    counter_.record_read(n, n == ibs);
    if (n < ibs && config_.sync_pad()) {
        in.pad_to(ibs, config_.pad_byte());
    }
    process_block(in);
}

void CopyEngine::process_block(BlockBuffer &in) {
    op_ = ErrorOp::Convert;
    ConversionResult result = pipeline_.apply(in.as_slice(), in.capacity());
    counter_.record_truncated_records(result.truncated_records);

    if (!result.bytes.empty()) {
        if (reblock_) {
            stage_output(result.bytes);
        } else {
            emit_output_block(result.bytes, result.sparse);
        }
    }
    notify_block_subscribers();
}

void CopyEngine::stage_output(std::span<const std::byte> bytes) {
    const size_t obs = config_.output_block_size();

    while (!bytes.empty()) {
        // Whole blocks skip the staging copy
        if (out_buf_.empty() && bytes.size() >= obs) {
            auto block = bytes.first(obs);
            emit_output_block(block, pipeline_.has_sparse() && SparseStage::is_hole(block));
            bytes = bytes.subspan(obs);
            continue;
        }
        bytes = bytes.subspan(out_buf_.append(bytes));
        if (out_buf_.is_full()) flush_staged();
    }
}

void CopyEngine::flush_staged() {
    auto block = out_buf_.as_slice();
    bool hole = pipeline_.has_sparse() && out_buf_.is_full() && SparseStage::is_hole(block);
    emit_output_block(block, hole);
    out_buf_.clear();
}

void CopyEngine::emit_output_block(std::span<const std::byte> block, bool hole) {
    block_ = out_blocks_;
    bool skipped = hole && skip_output(block.size());
    if (!skipped) write_all(block);
    counter_.record_write(block.size(), block.size() == config_.output_block_size(), skipped);
    out_blocks_++;
}

void CopyEngine::write_all(std::span<const std::byte> data) {
    op_ = ErrorOp::Write;
    size_t done = 0;
    unsigned attempts = 0;

    // Bytes the output accepted before a fault still count as written
    auto commit_partial = [&] {
        if (done == 0) return;
        out_pos_ += done;
        counter_.record_write(done, false);
    };

    while (done < data.size()) {
        size_t n;
        try {
            n = output_.write(data.subspan(done));
        } catch (const Error &) {
            commit_partial();
            throw;
        }
        attempts++;

        if (n == 0) {
            if (attempts > 1) {
                commit_partial();
                throw Error(ErrorKind::ShortWriteExhausted, EIO, "output accepted no bytes");
            }
            continue;
        }
        done += std::min(n, data.size() - done);
    }

    out_pos_ += done;
    pending_hole_ = false;
}

bool CopyEngine::skip_output(uint64_t length) {
    op_ = ErrorOp::Seek;
    if (output_.seek(out_pos_ + length) == SeekResult::Unsupported) {
        return false;
    }
    out_pos_ += length;
    pending_hole_ = true;
    return true;
}

// =============================================================================
// Draining
// =============================================================================

void CopyEngine::drain() {
    op_ = ErrorOp::Convert;
    block_ = in_blocks_;

    ConversionResult tail = pipeline_.flush();
    counter_.record_truncated_records(tail.truncated_records);
    if (!tail.bytes.empty()) {
        if (reblock_) {
            stage_output(tail.bytes);
        } else {
            emit_output_block(tail.bytes, false);
        }
    }

    if (reblock_ && !out_buf_.empty()) {
        flush_staged();
    }

    if (pending_hole_) {
        materialize_hole();
    }
}

void CopyEngine::materialize_hole() {
    op_ = ErrorOp::Truncate;
    auto length = output_.size();
    if (length && *length >= out_pos_) {
        pending_hole_ = false;
        return;
    }
    if (length && output_.truncate(out_pos_) == SeekResult::Ok) {
        pending_hole_ = false;
        return;
    }

    // No way to set the length: write the hole's last byte
    op_ = ErrorOp::Seek;
    if (output_.seek(out_pos_ - 1) == SeekResult::Unsupported) {
        detail::log(LogLevel::Warning, "trailing hole of output not materialized");
        return;
    }
    out_pos_--;
    const std::byte zero{0};
    write_all(std::span<const std::byte>(&zero, 1));
}

// =============================================================================
// Control
// =============================================================================

bool CopyEngine::cancelled() const noexcept {
    return cancel_.cancelled() || (token_ != nullptr && token_->cancelled());
}

void CopyEngine::check_cancel() {
    if (!cancelled()) return;
    op_ = ErrorOp::None;
    block_ = in_blocks_;
    throw Error(ErrorKind::Cancelled, ECANCELED, "copy cancelled");
}

void CopyEngine::set_state(EngineState next) noexcept {
    EngineState prev = state_.exchange(next, std::memory_order_acq_rel);
    if (prev != next) {
        detail::log(LogLevel::Debug, "state %s -> %s", engine_state_name(prev),
                    engine_state_name(next));
    }
}

void CopyEngine::fail(ErrorRecord rec) {
    detail::log(rec.kind == ErrorKind::Cancelled ? LogLevel::Notice : LogLevel::Error,
                "copy failed while %s: %s", engine_state_name(state()), rec.message().c_str());
    report_.status = CopyStatus::Failed;
    report_.error = std::move(rec);
    set_state(EngineState::Failed);
}

void CopyEngine::notify_block_subscribers() {
    for (auto &sub : subscribers_) {
        if (sub->cadence.every_blocks == 0 || in_blocks_ < sub->next_block) continue;
        if (!deliver(*sub, false)) continue;
        sub->next_block = in_blocks_ + sub->cadence.every_blocks;
    }
}

void CopyEngine::report_interval(std::chrono::steady_clock::time_point now) {
    for (auto &sub : subscribers_) {
        if (sub->cadence.interval.count() == 0 || now < sub->next_due) continue;
        deliver(*sub, true);
        sub->next_due = now + sub->cadence.interval;
    }
}

bool CopyEngine::deliver(Subscriber &sub, bool wait) {
    // The copy loop never waits on a callback running on the reporter thread.
    std::unique_lock<std::mutex> lock(sub.mutex, std::defer_lock);
    if (wait) {
        lock.lock();
    } else if (!lock.try_lock()) {
        return false;
    }
    sub.last = counter_.snapshot(sub.last);
    if (!sub.callback) return true;
    try {
        sub.callback(sub.last);
    } catch (const std::exception &e) {
        detail::log(LogLevel::Warning, "progress subscriber failed: %s", e.what());
    } catch (...) {
        detail::log(LogLevel::Warning, "progress subscriber failed: unknown exception");
    }
    return true;
}

} // namespace ddx
