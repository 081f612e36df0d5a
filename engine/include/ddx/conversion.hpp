// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 ddx Contributors

/**
 * @file conversion.hpp
 * @brief Conversion stages and the ordered conversion pipeline
 */

#ifndef DDX_CONVERSION_HPP
#define DDX_CONVERSION_HPP

#include <ddx/config.hpp>
#include <ddx/error.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <variant>
#include <vector>

namespace ddx {

/// Byte sequence flowing between stages
using Bytes = std::vector<std::byte>;

/**
 * Side results collected while a block passes the stages
 */
struct StageContext {
    size_t block_capacity = 0;      ///< Capacity of the source block (0 while flushing)
    bool sparse = false;            ///< Set by the sparse stage for an all-zero full block
    uint64_t truncated_records = 0; ///< Records cut at cbs by the block stage
};

/**
 * ASCII case mapping (lcase / ucase), length-preserving
 */
class CaseStage {
  public:
    explicit CaseStage(bool upper) noexcept : upper_(upper) {}

    void apply(Bytes &data, StageContext &ctx) const noexcept;
    void flush(Bytes &, StageContext &) const noexcept {}

    [[nodiscard]] bool upper() const noexcept { return upper_; }

  private:
    bool upper_;
};

/**
 * Swap every pair of adjacent bytes (swab)
 *
 * An odd trailing byte is passed through unchanged unless strict mode is
 * enabled, in which case the block is rejected with a conversion error.
 */
class SwapStage {
  public:
    explicit SwapStage(bool strict) noexcept : strict_(strict) {}

    void apply(Bytes &data, StageContext &ctx) const;
    void flush(Bytes &, StageContext &) const noexcept {}

  private:
    bool strict_;
};

/**
 * Newline-terminated records to fixed-width records (block)
 *
 * Each record is padded with spaces to cbs bytes; the newline is dropped.
 * Bytes beyond cbs are discarded and the record is counted as truncated
 * once. A record may span any number of input blocks.
 */
class BlockStage {
  public:
    explicit BlockStage(size_t cbs) : cbs_(cbs) { pending_.reserve(cbs); }

    void apply(Bytes &data, StageContext &ctx);
    void flush(Bytes &data, StageContext &ctx);

    [[nodiscard]] size_t pending() const noexcept { return pending_.size(); }

  private:
    size_t cbs_;
    Bytes pending_;
    bool overflowed_ = false;
};

/**
 * Fixed-width records to newline-terminated records (unblock)
 *
 * Every cbs bytes form one record; trailing spaces are stripped and a
 * newline appended.
 */
class UnblockStage {
  public:
    explicit UnblockStage(size_t cbs) : cbs_(cbs) { pending_.reserve(cbs); }

    void apply(Bytes &data, StageContext &ctx);
    void flush(Bytes &data, StageContext &ctx);

    [[nodiscard]] size_t pending() const noexcept { return pending_.size(); }

  private:
    void emit_record(Bytes &out) const;

    size_t cbs_;
    Bytes pending_;
};

/**
 * All-zero full block detection (sparse)
 *
 * Never changes the bytes; only marks the result so the engine can seek
 * over it.
 */
class SparseStage {
  public:
    void apply(Bytes &data, StageContext &ctx) const noexcept;
    void flush(Bytes &, StageContext &) const noexcept {}

    /// True if every byte is zero (false for an empty sequence)
    [[nodiscard]] static bool is_hole(std::span<const std::byte> bytes) noexcept;
};

/// Closed set of stage variants
using Stage = std::variant<CaseStage, SwapStage, BlockStage, UnblockStage, SparseStage>;

/**
 * Output of one pipeline pass
 *
 * `bytes` stays valid until the next apply() or flush() on the pipeline.
 * When `sparse` is set the engine advances the output by bytes.size()
 * instead of writing.
 */
struct ConversionResult {
    std::span<const std::byte> bytes;
    bool sparse = false;
    uint64_t truncated_records = 0;
};

/**
 * Ordered chain of conversion stages
 *
 * Built once per copy from the configuration's conversion list. Stateful
 * stages (block, unblock) carry partial records across calls; flush()
 * releases them at end of stream. The configuration is only read.
 *
 * Example:
 * @code
 * ddx::ConversionPipeline pipeline(config);
 * auto result = pipeline.apply(buf.as_slice(), buf.capacity());
 * if (!result.sparse) out.write(result.bytes);
 * @endcode
 */
class ConversionPipeline {
  public:
    /**
     * Build the stage chain
     * @param config Transfer configuration (conversions, cbs, strict_swap)
     */
    explicit ConversionPipeline(const TransferConfig &config);

    ConversionPipeline(const ConversionPipeline &) = delete;
    ConversionPipeline &operator=(const ConversionPipeline &) = delete;
    ConversionPipeline(ConversionPipeline &&) noexcept = default;
    ConversionPipeline &operator=(ConversionPipeline &&) noexcept = default;

    /**
     * Run one block through every stage in order
     *
     * @param block Filled region of the source block
     * @param block_capacity Capacity of the source block; only a block of
     *        exactly this length can be marked sparse
     * @return Converted bytes and flags
     * @throws Error (kind Conversion) from a strict stage
     */
    ConversionResult apply(std::span<const std::byte> block, size_t block_capacity);

    /**
     * Release carried state at end of stream
     *
     * Each stage's pending output passes through the stages after it.
     * Calling flush() again returns an empty result.
     *
     * @return Remaining converted bytes (never sparse)
     */
    ConversionResult flush();

    [[nodiscard]] bool empty() const noexcept { return stages_.empty(); }
    [[nodiscard]] size_t size() const noexcept { return stages_.size(); }
    [[nodiscard]] bool has_sparse() const noexcept { return has_sparse_; }
    [[nodiscard]] bool changes_length() const noexcept { return changes_length_; }

    /// Bytes held by stateful stages awaiting more input
    [[nodiscard]] size_t pending_bytes() const noexcept;

  private:
    std::vector<Stage> stages_;
    Bytes work_;
    bool has_sparse_ = false;
    bool changes_length_ = false;
    bool mutates_ = false;
};

} // namespace ddx

#endif // DDX_CONVERSION_HPP
