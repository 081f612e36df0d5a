// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 ddx Contributors

/**
 * @file memory_channel.cpp
 * @brief In-memory channel
 */

#include <ddx/memory_channel.hpp>

#include <algorithm>
#include <cstring>

namespace ddx {

MemoryChannel::MemoryChannel(std::string_view text) : data_(text.size()) {
    std::memcpy(data_.data(), text.data(), text.size());
}

size_t MemoryChannel::read(std::span<std::byte> buf) {
    if (pos_ >= data_.size()) return 0;

    size_t n = std::min<uint64_t>(buf.size(), data_.size() - pos_);
    if (max_read_ != 0) n = std::min(n, max_read_);
    std::memcpy(buf.data(), data_.data() + pos_, n);
    pos_ += n;
    return n;
}

size_t MemoryChannel::write(std::span<const std::byte> data) {
    uint64_t end = pos_ + data.size();
    if (end > data_.size()) data_.resize(end);
    std::memcpy(data_.data() + pos_, data.data(), data.size());
    pos_ = end;
    return data.size();
}

SeekResult MemoryChannel::seek(uint64_t offset) {
    if (!seekable_) return SeekResult::Unsupported;
    pos_ = offset;
    seeks_++;
    return SeekResult::Ok;
}

SeekResult MemoryChannel::truncate(uint64_t length) {
    if (!seekable_) return SeekResult::Unsupported;
    data_.resize(length);
    return SeekResult::Ok;
}

std::optional<uint64_t> MemoryChannel::size() {
    if (!seekable_) return std::nullopt;
    return data_.size();
}

std::string MemoryChannel::str() const {
    return std::string(reinterpret_cast<const char *>(data_.data()), data_.size());
}

} // namespace ddx
