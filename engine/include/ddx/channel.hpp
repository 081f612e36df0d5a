// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 ddx Contributors

/**
 * @file channel.hpp
 * @brief Byte channel abstraction and POSIX descriptor channel
 */

#ifndef DDX_CHANNEL_HPP
#define DDX_CHANNEL_HPP

#include <ddx/error.hpp>
#include <ddx/fwd.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>

#include <sys/types.h>

namespace ddx {

/**
 * Outcome of a positioning request
 *
 * Faults while positioning are thrown as Error; Unsupported is the normal
 * answer of a channel that cannot position at all (pipes, terminals).
 */
enum class SeekResult { Ok, Unsupported };

/**
 * Already-opened readable/writable byte channel
 *
 * The copy engine drives one channel for input and one for output. All
 * operations may block. Offsets are absolute, relative to the channel's
 * position when it was handed over.
 *
 * Implementations report faults by throwing Error (kind Io for read and
 * write faults, kind Seek for positioning faults).
 */
class Channel {
  public:
    virtual ~Channel() = default;

    /**
     * Read up to buf.size() bytes
     * @param buf Destination
     * @return Bytes read; 0 signals end of input
     * @throws Error on read fault
     */
    [[nodiscard]] virtual size_t read(std::span<std::byte> buf) = 0;

    /**
     * Write up to data.size() bytes
     * @param data Source
     * @return Bytes accepted; may be fewer than requested
     * @throws Error on write fault
     */
    [[nodiscard]] virtual size_t write(std::span<const std::byte> data) = 0;

    /**
     * Move to an absolute offset
     * @param offset Byte offset
     * @return Ok, or Unsupported if the channel cannot position
     * @throws Error on positioning fault
     */
    [[nodiscard]] virtual SeekResult seek(uint64_t offset) = 0;

    /**
     * Set the channel length (output only)
     * @param length New length in bytes
     * @return Ok, or Unsupported if the channel has no length
     * @throws Error on fault
     */
    [[nodiscard]] virtual SeekResult truncate(uint64_t length) {
        (void)length;
        return SeekResult::Unsupported;
    }

    /**
     * Bytes between the channel origin and its end
     * @return Length for files and block devices, std::nullopt for streams
     * @throws Error if the length cannot be queried
     */
    [[nodiscard]] virtual std::optional<uint64_t> size() { return std::nullopt; }
};

/**
 * Length of the object behind a descriptor
 * @param fd Open descriptor
 * @return File size, block device size, or std::nullopt for streams
 * @throws Error if fstat or the device size query fails
 */
[[nodiscard]] std::optional<uint64_t> descriptor_size(int fd);

/**
 * Channel over a POSIX file descriptor
 *
 * Uses read(2)/write(2)/lseek(2)/ftruncate(2). Offsets passed to seek()
 * and truncate() are relative to the descriptor's position at construction,
 * so a descriptor already positioned by the caller keeps that origin.
 *
 * Non-blocking descriptors are polled until ready. Interrupted calls are
 * retried unless the watched CancelToken has been cancelled.
 */
class FdChannel : public Channel {
  public:
    /**
     * Wrap an open descriptor
     * @param fd File descriptor
     * @param owned Close the descriptor on destruction
     */
    explicit FdChannel(int fd, bool owned = false) noexcept;

    ~FdChannel() override;

    FdChannel(const FdChannel &) = delete;
    FdChannel &operator=(const FdChannel &) = delete;

    /**
     * Open a path and wrap the resulting descriptor (owned)
     * @param path File path
     * @param flags open(2) flags
     * @param mode Creation mode
     * @throws Error with the path as context on failure
     */
    [[nodiscard]] static std::unique_ptr<FdChannel> open(const std::string &path, int flags,
                                                         mode_t mode = 0666);

    [[nodiscard]] size_t read(std::span<std::byte> buf) override;
    [[nodiscard]] size_t write(std::span<const std::byte> data) override;
    [[nodiscard]] SeekResult seek(uint64_t offset) override;
    [[nodiscard]] SeekResult truncate(uint64_t length) override;
    [[nodiscard]] std::optional<uint64_t> size() override;

    [[nodiscard]] int fd() const noexcept { return fd_; }

    /**
     * Stop retrying interrupted calls once a token is cancelled
     *
     * A read or write interrupted by a signal (EINTR) while the token is set
     * throws a Cancelled error instead of blocking again.
     *
     * @param token Token to watch, or nullptr to always retry; must outlive the channel
     */
    void watch_cancel(const CancelToken *token) noexcept { cancel_ = token; }

  private:
    void interrupted(const char *op) const;
    void wait_ready(short events, const char *op) const;

    int fd_;
    bool owned_;
    off_t origin_ = 0;
    const CancelToken *cancel_ = nullptr;
};

} // namespace ddx

#endif // DDX_CHANNEL_HPP
