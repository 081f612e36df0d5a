// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 ddx Contributors

/**
 * @file block_buffer.hpp
 * @brief Fixed-capacity transfer buffer and bounded buffer pool
 */

#ifndef DDX_BLOCK_BUFFER_HPP
#define DDX_BLOCK_BUFFER_HPP

#include <ddx/channel.hpp>

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <vector>

namespace ddx {

/**
 * One transfer unit
 *
 * Owns a byte array of fixed capacity (ibs or obs) and tracks how much of
 * it holds data. A buffer filled to capacity is a full block; anything
 * shorter is a partial block. Move-only, single owner.
 *
 * Example:
 * @code
 * ddx::BlockBuffer buf(512);
 * size_t n = buf.fill(input, 512);
 * if (n == 0) return;             // end of input
 * output.write(buf.as_slice());   // exactly the filled region
 * @endcode
 */
class BlockBuffer {
  public:
    /**
     * Default constructor - creates empty zero-capacity buffer
     */
    BlockBuffer() noexcept = default;

    /**
     * Allocate a buffer
     * @param capacity Size of the byte array
     */
    explicit BlockBuffer(size_t capacity);

    BlockBuffer(BlockBuffer &&other) noexcept;
    BlockBuffer &operator=(BlockBuffer &&other) noexcept;

    // Non-copyable
    BlockBuffer(const BlockBuffer &) = delete;
    BlockBuffer &operator=(const BlockBuffer &) = delete;

    ~BlockBuffer() = default;

    /**
     * Replace the content with one read from a channel
     *
     * Issues a single read at offset 0 of the buffer.
     *
     * @param source Channel to read from
     * @param max_bytes Upper bound for the read (<= capacity)
     * @return Bytes read; 0 signals end of input
     * @throws Error on read fault, or EINVAL if max_bytes exceeds capacity
     */
    size_t fill(Channel &source, size_t max_bytes);

    /**
     * Replace the content, reading until max_bytes are held or input ends
     *
     * @param source Channel to read from
     * @param max_bytes Bytes wanted (<= capacity)
     * @return Bytes read; less than max_bytes only at end of input
     * @throws Error on read fault, or EINVAL if max_bytes exceeds capacity
     */
    size_t fill_full(Channel &source, size_t max_bytes);

    /**
     * Append bytes after the filled region
     * @param bytes Data to copy in
     * @return Number of bytes taken (bounded by remaining capacity)
     */
    size_t append(std::span<const std::byte> bytes) noexcept;

    /**
     * Extend the filled region to length with a constant byte
     * @param length Target length (clamped to capacity)
     * @param value Fill byte
     */
    void pad_to(size_t length, std::byte value) noexcept;

    /**
     * Remove bytes from the front of the filled region
     * @param n Bytes to drop (clamped to the filled length)
     */
    void drain(size_t n) noexcept;

    /// Forget the content (capacity is kept)
    void clear() noexcept { filled_ = 0; }

    [[nodiscard]] size_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] size_t filled_length() const noexcept { return filled_; }
    [[nodiscard]] size_t remaining() const noexcept { return capacity_ - filled_; }
    [[nodiscard]] bool empty() const noexcept { return filled_ == 0; }
    [[nodiscard]] bool is_full() const noexcept { return filled_ == capacity_; }

    /**
     * Exactly the filled region
     */
    [[nodiscard]] std::span<std::byte> as_slice() noexcept { return {data_.get(), filled_}; }
    [[nodiscard]] std::span<const std::byte> as_slice() const noexcept {
        return {data_.get(), filled_};
    }

  private:
    std::unique_ptr<std::byte[]> data_;
    size_t capacity_ = 0;
    size_t filled_ = 0;
};

/**
 * Bounded pool of equally sized buffers
 *
 * Holds at most `count` buffers; acquire() blocks until one is released
 * or the pool is closed. Thread-safe. Used by the pipelined copy mode to
 * bound the number of blocks in flight.
 */
class BufferPool {
  public:
    /**
     * Pre-allocate the pool
     * @param buffer_capacity Capacity of each buffer
     * @param count Number of buffers
     */
    BufferPool(size_t buffer_capacity, size_t count);

    BufferPool(const BufferPool &) = delete;
    BufferPool &operator=(const BufferPool &) = delete;

    /**
     * Take a buffer, waiting for one to be released
     * @return Empty buffer, or std::nullopt once the pool is closed
     */
    [[nodiscard]] std::optional<BlockBuffer> acquire();

    /**
     * Return a buffer (its content is cleared)
     * @param buf Buffer previously acquired from this pool
     */
    void release(BlockBuffer buf);

    /// Wake all waiters; later acquire() calls return std::nullopt
    void close() noexcept;

    [[nodiscard]] size_t available() const;
    [[nodiscard]] size_t buffer_capacity() const noexcept { return buffer_capacity_; }

  private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<BlockBuffer> free_;
    size_t buffer_capacity_;
    bool closed_ = false;
};

} // namespace ddx

#endif // DDX_BLOCK_BUFFER_HPP
