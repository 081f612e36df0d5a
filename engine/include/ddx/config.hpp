// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 ddx Contributors

/**
 * @file config.hpp
 * @brief Transfer configuration builder for ddx
 */

#ifndef DDX_CONFIG_HPP
#define DDX_CONFIG_HPP

#include <ddx/error.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

namespace ddx {

/**
 * Conversion stage kind
 *
 * Closed set of byte-block transformations, applied in the order the
 * configuration lists them.
 */
enum class Conversion {
    Lcase,   ///< ASCII upper case to lower case
    Ucase,   ///< ASCII lower case to upper case
    Swab,    ///< Swap every pair of adjacent bytes
    Block,   ///< Newline-terminated records to fixed cbs-wide records
    Unblock, ///< Fixed cbs-wide records to newline-terminated records
    Sparse   ///< Seek over all-zero output blocks instead of writing them
};

/// Return the dd operand spelling of a conversion ("lcase", "swab", ...)
[[nodiscard]] inline const char *conversion_name(Conversion conv) noexcept {
    switch (conv) {
    case Conversion::Lcase:
        return "lcase";
    case Conversion::Ucase:
        return "ucase";
    case Conversion::Swab:
        return "swab";
    case Conversion::Block:
        return "block";
    case Conversion::Unblock:
        return "unblock";
    case Conversion::Sparse:
        return "sparse";
    default:
        return "???";
    }
}

/**
 * Fault handling policy
 */
enum class ErrorPolicy {
    AbortOnError, ///< First fault ends the copy (default)
    SkipOnError   ///< Read faults are recorded and the faulting block skipped
};

/**
 * Transfer configuration
 *
 * Uses builder pattern for fluent configuration. Setters never fail;
 * validate() (called by the CopyEngine constructor) rejects inconsistent
 * combinations.
 *
 * Example:
 * @code
 * ddx::TransferConfig config;
 * config.block_size(4096)
 *     .max_blocks(100)
 *     .add_conversion(ddx::Conversion::Sparse);
 *
 * ddx::CopyEngine engine(in, out, config);
 * @endcode
 */
class TransferConfig {
  public:
    static constexpr size_t default_block_size = 512;
    static constexpr int max_pipeline_depth = 2;

    /**
     * Initialize with dd defaults (512-byte blocks, no limit, truncate output)
     */
    TransferConfig() = default;

    /**
     * Set both input and output block size
     * @param bytes Block size in bytes
     * @return Reference to this for chaining
     */
    TransferConfig &block_size(size_t bytes) noexcept {
        ibs_ = bytes;
        obs_ = bytes;
        return *this;
    }

    /**
     * Set input block size (ibs)
     * @param bytes Bytes requested per read
     * @return Reference to this for chaining
     */
    TransferConfig &input_block_size(size_t bytes) noexcept {
        ibs_ = bytes;
        return *this;
    }

    /**
     * Set output block size (obs)
     * @param bytes Bytes per output block
     * @return Reference to this for chaining
     */
    TransferConfig &output_block_size(size_t bytes) noexcept {
        obs_ = bytes;
        return *this;
    }

    /**
     * Set conversion record size (cbs) used by block and unblock
     * @param bytes Record width
     * @return Reference to this for chaining
     */
    TransferConfig &conversion_block_size(size_t bytes) noexcept {
        cbs_ = bytes;
        return *this;
    }

    /**
     * Limit the copy to a number of input blocks
     * @param blocks Block count, or std::nullopt for no limit
     * @return Reference to this for chaining
     */
    TransferConfig &max_blocks(std::optional<uint64_t> blocks) noexcept {
        max_blocks_ = blocks;
        return *this;
    }

    /**
     * Skip input blocks before copying
     * @param blocks Offset in input-block units
     * @return Reference to this for chaining
     */
    TransferConfig &skip_blocks(uint64_t blocks) noexcept {
        skip_blocks_ = blocks;
        return *this;
    }

    /**
     * Advance the output before copying
     * @param blocks Offset in output-block units
     * @return Reference to this for chaining
     */
    TransferConfig &seek_blocks(uint64_t blocks) noexcept {
        seek_blocks_ = blocks;
        return *this;
    }

    /**
     * Replace the conversion list
     * @param convs Conversions in application order
     * @return Reference to this for chaining
     */
    TransferConfig &conversions(std::vector<Conversion> convs) {
        conversions_ = std::move(convs);
        return *this;
    }

    /**
     * Append a conversion to the list (duplicates are ignored)
     * @param conv Conversion kind
     * @return Reference to this for chaining
     */
    TransferConfig &add_conversion(Conversion conv) {
        if (!has_conversion(conv)) conversions_.push_back(conv);
        return *this;
    }

    /**
     * Set fault handling policy
     * @param policy AbortOnError (default) or SkipOnError
     * @return Reference to this for chaining
     */
    TransferConfig &error_policy(ErrorPolicy policy) noexcept {
        policy_ = policy;
        return *this;
    }

    /**
     * Truncate the output at the seek offset before copying (dd default)
     * @param enable False keeps existing output past the copied range
     * @return Reference to this for chaining
     */
    TransferConfig &truncate_output(bool enable) noexcept {
        truncate_output_ = enable;
        return *this;
    }

    /**
     * Accumulate short reads until a full input block is available
     * @param enable True for dd iflag=fullblock semantics
     * @return Reference to this for chaining
     */
    TransferConfig &full_blocks(bool enable) noexcept {
        full_blocks_ = enable;
        return *this;
    }

    /**
     * Pad every short input block to ibs
     *
     * Pads with NUL bytes, or with spaces when a block or unblock stage is
     * configured. Also supplies the replacement block for reads skipped
     * under SkipOnError.
     *
     * @param enable True for dd conv=sync semantics
     * @return Reference to this for chaining
     */
    TransferConfig &sync_pad(bool enable) noexcept {
        sync_pad_ = enable;
        return *this;
    }

    /**
     * Reject odd-length blocks in the swab stage
     * @param enable True to fail with a conversion error
     * @return Reference to this for chaining
     */
    TransferConfig &strict_swap(bool enable) noexcept {
        strict_swap_ = enable;
        return *this;
    }

    /**
     * Overlap reads with writes
     * @param depth 0 = sequential (default), 1-2 = queued blocks in flight
     * @return Reference to this for chaining
     * @note Validated at engine creation time
     */
    TransferConfig &pipeline_depth(int depth) noexcept {
        pipeline_depth_ = depth;
        return *this;
    }

    // Getters
    [[nodiscard]] size_t input_block_size() const noexcept { return ibs_; }
    [[nodiscard]] size_t output_block_size() const noexcept { return obs_; }
    [[nodiscard]] size_t conversion_block_size() const noexcept { return cbs_; }
    [[nodiscard]] std::optional<uint64_t> max_blocks() const noexcept { return max_blocks_; }
    [[nodiscard]] uint64_t skip_blocks() const noexcept { return skip_blocks_; }
    [[nodiscard]] uint64_t seek_blocks() const noexcept { return seek_blocks_; }
    [[nodiscard]] const std::vector<Conversion> &conversions() const noexcept {
        return conversions_;
    }
    [[nodiscard]] ErrorPolicy error_policy() const noexcept { return policy_; }
    [[nodiscard]] bool truncate_output() const noexcept { return truncate_output_; }
    [[nodiscard]] bool full_blocks() const noexcept { return full_blocks_; }
    [[nodiscard]] bool sync_pad() const noexcept { return sync_pad_; }
    [[nodiscard]] bool strict_swap() const noexcept { return strict_swap_; }
    [[nodiscard]] int pipeline_depth() const noexcept { return pipeline_depth_; }

    [[nodiscard]] bool has_conversion(Conversion conv) const noexcept {
        return std::find(conversions_.begin(), conversions_.end(), conv) != conversions_.end();
    }

    /**
     * Whether converted bytes must be re-framed into obs-sized blocks
     *
     * False only when ibs == obs and no stage changes block length; each
     * input block is then written as one output block.
     */
    [[nodiscard]] bool reblocks() const noexcept {
        return ibs_ != obs_ || has_conversion(Conversion::Block) ||
               has_conversion(Conversion::Unblock);
    }

    /// Byte used by sync_pad for short and skipped blocks
    [[nodiscard]] std::byte pad_byte() const noexcept {
        return (has_conversion(Conversion::Block) || has_conversion(Conversion::Unblock))
                   ? std::byte{' '}
                   : std::byte{0};
    }

    /**
     * Check the configuration for consistency
     * @throws Error (kind InvalidConfig, EINVAL) describing the first problem
     */
    void validate() const;

  private:
    size_t ibs_ = default_block_size;
    size_t obs_ = default_block_size;
    size_t cbs_ = 0;
    std::optional<uint64_t> max_blocks_;
    uint64_t skip_blocks_ = 0;
    uint64_t seek_blocks_ = 0;
    std::vector<Conversion> conversions_;
    ErrorPolicy policy_ = ErrorPolicy::AbortOnError;
    bool truncate_output_ = true;
    bool full_blocks_ = false;
    bool sync_pad_ = false;
    bool strict_swap_ = false;
    int pipeline_depth_ = 0;
};

} // namespace ddx

#endif // DDX_CONFIG_HPP
