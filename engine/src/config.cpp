// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 ddx Contributors

/**
 * @file config.cpp
 * @brief Transfer configuration validation
 */

#include <ddx/config.hpp>

#include <limits>

namespace ddx {

namespace {

[[noreturn]] void reject(const char *what) {
    throw Error(ErrorKind::InvalidConfig, EINVAL, what);
}

// Offsets are converted to byte positions; they must fit in 63 bits.
bool offset_overflows(uint64_t blocks, size_t block_size) {
    constexpr uint64_t limit = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
    return block_size != 0 && blocks > limit / block_size;
}

} // namespace

void TransferConfig::validate() const {
    if (ibs_ == 0) reject("input block size must be nonzero");
    if (obs_ == 0) reject("output block size must be nonzero");

    bool block = has_conversion(Conversion::Block);
    bool unblock = has_conversion(Conversion::Unblock);
    if (block && unblock) reject("block and unblock are mutually exclusive");
    if ((block || unblock) && cbs_ == 0) reject("block and unblock require a conversion block size");
    if (has_conversion(Conversion::Lcase) && has_conversion(Conversion::Ucase))
        reject("lcase and ucase are mutually exclusive");

    if (pipeline_depth_ < 0 || pipeline_depth_ > max_pipeline_depth)
        reject("pipeline depth must be between 0 and 2");

    if (offset_overflows(skip_blocks_, ibs_)) reject("skip offset too large");
    if (offset_overflows(seek_blocks_, obs_)) reject("seek offset too large");
}

} // namespace ddx
