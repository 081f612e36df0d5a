// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 ddx Contributors

/**
 * @file conversion.cpp
 * @brief Conversion stages and pipeline
 */

#include <ddx/conversion.hpp>

#include <algorithm>
#include <utility>

namespace ddx {

namespace {

constexpr std::byte newline{'\n'};
constexpr std::byte space{' '};

bool stage_changes_length(const Stage &stage) noexcept {
    return std::holds_alternative<BlockStage>(stage) || std::holds_alternative<UnblockStage>(stage);
}

} // namespace

// =============================================================================
// Stages
// =============================================================================

void CaseStage::apply(Bytes &data, StageContext &) const noexcept {
    for (std::byte &b : data) {
        auto c = std::to_integer<unsigned char>(b);
        if (upper_ && c >= 'a' && c <= 'z') {
            b = std::byte(c - ('a' - 'A'));
        } else if (!upper_ && c >= 'A' && c <= 'Z') {
            b = std::byte(c + ('a' - 'A'));
        }
    }
}

void SwapStage::apply(Bytes &data, StageContext &) const {
    if (strict_ && data.size() % 2 != 0) {
        throw Error(ErrorKind::Conversion, EINVAL, "swab: odd-length block");
    }
    for (size_t i = 0; i + 1 < data.size(); i += 2) {
        std::swap(data[i], data[i + 1]);
    }
}

void BlockStage::apply(Bytes &data, StageContext &ctx) {
    Bytes out;
    out.reserve(data.size() + cbs_);
    for (std::byte b : data) {
        if (b == newline) {
            pending_.resize(cbs_, space);
            out.insert(out.end(), pending_.begin(), pending_.end());
            pending_.clear();
            overflowed_ = false;
        } else if (pending_.size() < cbs_) {
            pending_.push_back(b);
        } else if (!overflowed_) {
            overflowed_ = true;
            ctx.truncated_records++;
        }
    }
    data.swap(out);
}

void BlockStage::flush(Bytes &data, StageContext &) {
    if (pending_.empty()) return;
    pending_.resize(cbs_, space);
    data.insert(data.end(), pending_.begin(), pending_.end());
    pending_.clear();
    overflowed_ = false;
}

void UnblockStage::emit_record(Bytes &out) const {
    auto last = std::find_if(pending_.rbegin(), pending_.rend(),
                             [](std::byte b) { return b != space; });
    out.insert(out.end(), pending_.begin(), last.base());
    out.push_back(newline);
}

void UnblockStage::apply(Bytes &data, StageContext &) {
    Bytes out;
    out.reserve(data.size() + data.size() / cbs_ + 1);
    for (std::byte b : data) {
        pending_.push_back(b);
        if (pending_.size() == cbs_) {
            emit_record(out);
            pending_.clear();
        }
    }
    data.swap(out);
}

void UnblockStage::flush(Bytes &data, StageContext &) {
    if (pending_.empty()) return;
    emit_record(data);
    pending_.clear();
}

void SparseStage::apply(Bytes &data, StageContext &ctx) const noexcept {
    if (ctx.block_capacity != 0 && data.size() == ctx.block_capacity && is_hole(data)) {
        ctx.sparse = true;
    }
}

bool SparseStage::is_hole(std::span<const std::byte> bytes) noexcept {
    if (bytes.empty()) return false;
    return std::all_of(bytes.begin(), bytes.end(), [](std::byte b) { return b == std::byte{0}; });
}

// =============================================================================
// ConversionPipeline
// =============================================================================

ConversionPipeline::ConversionPipeline(const TransferConfig &config) {
    size_t cbs = config.conversion_block_size();
    for (Conversion conv : config.conversions()) {
        switch (conv) {
        case Conversion::Lcase:
            stages_.emplace_back(CaseStage(false));
            mutates_ = true;
            break;
        case Conversion::Ucase:
            stages_.emplace_back(CaseStage(true));
            mutates_ = true;
            break;
        case Conversion::Swab:
            stages_.emplace_back(SwapStage(config.strict_swap()));
            mutates_ = true;
            break;
        case Conversion::Block:
        case Conversion::Unblock:
            if (cbs == 0) {
                throw Error(ErrorKind::InvalidConfig, EINVAL,
                            std::string(conversion_name(conv)) + " requires cbs");
            }
            if (conv == Conversion::Block) {
                stages_.emplace_back(BlockStage(cbs));
            } else {
                stages_.emplace_back(UnblockStage(cbs));
            }
            mutates_ = true;
            changes_length_ = true;
            break;
        case Conversion::Sparse:
            stages_.emplace_back(SparseStage());
            has_sparse_ = true;
            break;
        }
    }
}

ConversionResult ConversionPipeline::apply(std::span<const std::byte> block,
                                           size_t block_capacity) {
    // Nothing rewrites bytes: hand the caller's block straight back.
    if (!mutates_) {
        ConversionResult result{block};
        result.sparse = has_sparse_ && block.size() == block_capacity && SparseStage::is_hole(block);
        return result;
    }

    StageContext ctx;
    ctx.block_capacity = block_capacity;
    work_.assign(block.begin(), block.end());
    for (Stage &stage : stages_) {
        std::visit([&](auto &s) { s.apply(work_, ctx); }, stage);
        if (stage_changes_length(stage)) ctx.sparse = false;
    }
    return ConversionResult{work_, ctx.sparse, ctx.truncated_records};
}

ConversionResult ConversionPipeline::flush() {
    StageContext ctx;
    work_.clear();
    for (Stage &stage : stages_) {
        std::visit(
            [&](auto &s) {
                s.apply(work_, ctx);
                s.flush(work_, ctx);
            },
            stage);
    }
    return ConversionResult{work_, false, ctx.truncated_records};
}

size_t ConversionPipeline::pending_bytes() const noexcept {
    size_t total = 0;
    for (const Stage &stage : stages_) {
        if (const auto *b = std::get_if<BlockStage>(&stage)) total += b->pending();
        if (const auto *u = std::get_if<UnblockStage>(&stage)) total += u->pending();
    }
    return total;
}

} // namespace ddx
