// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 ddx Contributors

/**
 * @file special_channels.hpp
 * @brief In-process emulation of /dev/zero, /dev/null, /dev/urandom, /dev/full
 *
 * These behave like their Linux device counterparts but never touch the
 * filesystem, so they work identically on every platform.
 */

#ifndef DDX_SPECIAL_CHANNELS_HPP
#define DDX_SPECIAL_CHANNELS_HPP

#include <ddx/channel.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <string_view>

namespace ddx {

/// Infinite source of zero bytes; discards writes
class ZeroChannel : public Channel {
  public:
    [[nodiscard]] size_t read(std::span<std::byte> buf) override;
    [[nodiscard]] size_t write(std::span<const std::byte> data) override { return data.size(); }
    [[nodiscard]] SeekResult seek(uint64_t) override { return SeekResult::Ok; }
};

/// Empty source (immediate end of input); discards writes
class NullChannel : public Channel {
  public:
    [[nodiscard]] size_t read(std::span<std::byte>) override { return 0; }
    [[nodiscard]] size_t write(std::span<const std::byte> data) override { return data.size(); }
    [[nodiscard]] SeekResult seek(uint64_t) override { return SeekResult::Ok; }
};

/// Infinite source of pseudo-random bytes; discards writes
class RandomChannel : public Channel {
  public:
    /// Seed from std::random_device
    RandomChannel();

    /// Deterministic stream
    explicit RandomChannel(uint64_t seed) noexcept : rng_(seed) {}

    [[nodiscard]] size_t read(std::span<std::byte> buf) override;
    [[nodiscard]] size_t write(std::span<const std::byte> data) override { return data.size(); }
    [[nodiscard]] SeekResult seek(uint64_t) override { return SeekResult::Ok; }

  private:
    std::mt19937_64 rng_;
};

/// Reads zeros; every write fails with ENOSPC
class FullChannel : public Channel {
  public:
    [[nodiscard]] size_t read(std::span<std::byte> buf) override;
    [[nodiscard]] size_t write(std::span<const std::byte> data) override;
    [[nodiscard]] SeekResult seek(uint64_t) override { return SeekResult::Ok; }
};

/**
 * Special device kinds recognised by path
 */
enum class SpecialDevice { Zero, Null, Random, Full };

/**
 * Map a path to the device it names
 * @param path e.g. "/dev/zero"
 * @return The device, or std::nullopt for ordinary paths
 */
[[nodiscard]] std::optional<SpecialDevice> special_device(std::string_view path) noexcept;

/**
 * Create the emulated channel for a device
 * @param dev Device kind
 * @return Owned channel
 */
[[nodiscard]] std::unique_ptr<Channel> make_special_channel(SpecialDevice dev);

} // namespace ddx

#endif // DDX_SPECIAL_CHANNELS_HPP
