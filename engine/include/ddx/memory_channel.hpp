// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 ddx Contributors

/**
 * @file memory_channel.hpp
 * @brief In-memory channel
 */

#ifndef DDX_MEMORY_CHANNEL_HPP
#define DDX_MEMORY_CHANNEL_HPP

#include <ddx/channel.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ddx {

/**
 * Channel backed by a growable byte vector
 *
 * Behaves like a regular file: reads advance a cursor until the end of
 * the data, writes past the end extend it (a gap left by seek reads back
 * as zeros), and truncate resizes. Can be configured to act like a pipe
 * (no positioning) or to return short reads.
 */
class MemoryChannel : public Channel {
  public:
    MemoryChannel() = default;

    /**
     * Start with existing content, cursor at 0
     * @param data Initial bytes
     */
    explicit MemoryChannel(std::vector<std::byte> data) noexcept : data_(std::move(data)) {}

    /**
     * Start with the bytes of a string, cursor at 0
     * @param text Initial content
     */
    explicit MemoryChannel(std::string_view text);

    [[nodiscard]] size_t read(std::span<std::byte> buf) override;
    [[nodiscard]] size_t write(std::span<const std::byte> data) override;
    [[nodiscard]] SeekResult seek(uint64_t offset) override;
    [[nodiscard]] SeekResult truncate(uint64_t length) override;
    [[nodiscard]] std::optional<uint64_t> size() override;

    /**
     * Allow or forbid positioning
     * @param enable False makes seek() and truncate() return Unsupported
     * @return Reference to this for chaining
     */
    MemoryChannel &seekable(bool enable) noexcept {
        seekable_ = enable;
        return *this;
    }

    /**
     * Cap the bytes returned by a single read
     * @param bytes Maximum per read (0 = unlimited)
     * @return Reference to this for chaining
     */
    MemoryChannel &max_read(size_t bytes) noexcept {
        max_read_ = bytes;
        return *this;
    }

    [[nodiscard]] const std::vector<std::byte> &data() const noexcept { return data_; }
    [[nodiscard]] std::string str() const;
    [[nodiscard]] uint64_t position() const noexcept { return pos_; }
    [[nodiscard]] bool is_seekable() const noexcept { return seekable_; }

    /// Number of seek() calls that succeeded
    [[nodiscard]] uint64_t seek_count() const noexcept { return seeks_; }

  private:
    std::vector<std::byte> data_;
    uint64_t pos_ = 0;
    size_t max_read_ = 0;
    uint64_t seeks_ = 0;
    bool seekable_ = true;
};

} // namespace ddx

#endif // DDX_MEMORY_CHANNEL_HPP
