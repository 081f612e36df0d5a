// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 ddx Contributors

/**
 * @file block_buffer.cpp
 * @brief Transfer buffer and buffer pool
 */

#include <ddx/block_buffer.hpp>

#include <algorithm>
#include <cstring>
#include <utility>

namespace ddx {

BlockBuffer::BlockBuffer(size_t capacity)
    : data_(std::make_unique<std::byte[]>(capacity)), capacity_(capacity) {}

BlockBuffer::BlockBuffer(BlockBuffer &&other) noexcept
    : data_(std::move(other.data_)), capacity_(other.capacity_), filled_(other.filled_) {
    other.capacity_ = 0;
    other.filled_ = 0;
}

BlockBuffer &BlockBuffer::operator=(BlockBuffer &&other) noexcept {
    if (this != &other) {
        data_ = std::move(other.data_);
        capacity_ = other.capacity_;
        filled_ = other.filled_;
        other.capacity_ = 0;
        other.filled_ = 0;
    }
    return *this;
}

size_t BlockBuffer::fill(Channel &source, size_t max_bytes) {
    if (max_bytes > capacity_) {
        throw Error(EINVAL, "fill larger than buffer capacity");
    }
    filled_ = 0;
    size_t n = source.read(std::span<std::byte>(data_.get(), max_bytes));
    filled_ = std::min(n, max_bytes);
    return filled_;
}

size_t BlockBuffer::fill_full(Channel &source, size_t max_bytes) {
    if (max_bytes > capacity_) {
        throw Error(EINVAL, "fill larger than buffer capacity");
    }
    filled_ = 0;
    while (filled_ < max_bytes) {
        size_t n = source.read(std::span<std::byte>(data_.get() + filled_, max_bytes - filled_));
        if (n == 0) break;
        filled_ += std::min(n, max_bytes - filled_);
    }
    return filled_;
}

size_t BlockBuffer::append(std::span<const std::byte> bytes) noexcept {
    size_t n = std::min(bytes.size(), remaining());
    if (n > 0) {
        std::memcpy(data_.get() + filled_, bytes.data(), n);
        filled_ += n;
    }
    return n;
}

void BlockBuffer::pad_to(size_t length, std::byte value) noexcept {
    length = std::min(length, capacity_);
    if (length > filled_) {
        std::memset(data_.get() + filled_, std::to_integer<int>(value), length - filled_);
        filled_ = length;
    }
}

void BlockBuffer::drain(size_t n) noexcept {
    n = std::min(n, filled_);
    if (n == 0) return;
    std::memmove(data_.get(), data_.get() + n, filled_ - n);
    filled_ -= n;
}

// =============================================================================
// BufferPool
// =============================================================================

BufferPool::BufferPool(size_t buffer_capacity, size_t count) : buffer_capacity_(buffer_capacity) {
    free_.reserve(count);
    for (size_t i = 0; i < count; i++) {
        free_.emplace_back(buffer_capacity);
    }
}

std::optional<BlockBuffer> BufferPool::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return closed_ || !free_.empty(); });
    if (closed_) return std::nullopt;

    BlockBuffer buf = std::move(free_.back());
    free_.pop_back();
    return buf;
}

void BufferPool::release(BlockBuffer buf) {
    buf.clear();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        free_.push_back(std::move(buf));
    }
    cv_.notify_one();
}

void BufferPool::close() noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

size_t BufferPool::available() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return free_.size();
}

} // namespace ddx
