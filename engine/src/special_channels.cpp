// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 ddx Contributors

/**
 * @file special_channels.cpp
 * @brief Emulated special devices
 */

#include <ddx/special_channels.hpp>

#include <cerrno>
#include <cstring>

namespace ddx {

size_t ZeroChannel::read(std::span<std::byte> buf) {
    std::memset(buf.data(), 0, buf.size());
    return buf.size();
}

RandomChannel::RandomChannel() : rng_(std::random_device{}()) {}

size_t RandomChannel::read(std::span<std::byte> buf) {
    size_t i = 0;
    while (i + sizeof(uint64_t) <= buf.size()) {
        uint64_t word = rng_();
        std::memcpy(buf.data() + i, &word, sizeof(word));
        i += sizeof(word);
    }
    if (i < buf.size()) {
        uint64_t word = rng_();
        std::memcpy(buf.data() + i, &word, buf.size() - i);
    }
    return buf.size();
}

size_t FullChannel::read(std::span<std::byte> buf) {
    std::memset(buf.data(), 0, buf.size());
    return buf.size();
}

size_t FullChannel::write(std::span<const std::byte> data) {
    if (data.empty()) return 0;
    throw Error(ENOSPC, "/dev/full");
}

std::optional<SpecialDevice> special_device(std::string_view path) noexcept {
    if (path == "/dev/zero") return SpecialDevice::Zero;
    if (path == "/dev/null") return SpecialDevice::Null;
    if (path == "/dev/urandom" || path == "/dev/random") return SpecialDevice::Random;
    if (path == "/dev/full") return SpecialDevice::Full;
    return std::nullopt;
}

std::unique_ptr<Channel> make_special_channel(SpecialDevice dev) {
    switch (dev) {
    case SpecialDevice::Zero:
        return std::make_unique<ZeroChannel>();
    case SpecialDevice::Null:
        return std::make_unique<NullChannel>();
    case SpecialDevice::Random:
        return std::make_unique<RandomChannel>();
    case SpecialDevice::Full:
        return std::make_unique<FullChannel>();
    }
    throw Error(ErrorKind::InvalidConfig, EINVAL, "unknown special device");
}

} // namespace ddx
