// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 ddx Contributors

/**
 * @file uring_channel.hpp
 * @brief io_uring-backed file channel
 */

#ifndef DDX_URING_CHANNEL_HPP
#define DDX_URING_CHANNEL_HPP

#include <ddx/channel.hpp>

#include <cstdint>
#include <memory>
#include <string>

#include <sys/types.h>

namespace ddx {

/**
 * Channel that performs each read and write as an io_uring request
 *
 * For regular files and block devices every request carries an explicit
 * offset tracked by the channel, so seek() is a cursor update with no
 * system call. Pipes, sockets and terminals are driven at their current
 * file position and report seek() as Unsupported.
 *
 * One private ring per channel; requests are submitted and reaped
 * synchronously, matching the copy engine's blocking model.
 *
 * Example:
 * @code
 * auto in = ddx::UringChannel::open("disk.img", O_RDONLY);
 * ddx::FdChannel out(STDOUT_FILENO);
 * ddx::CopyEngine engine(*in, out, config);
 * @endcode
 */
class UringChannel : public Channel {
  public:
    static constexpr unsigned default_queue_depth = 4;

    /**
     * Wrap an open descriptor
     * @param fd File descriptor
     * @param owned Close the descriptor on destruction
     * @param queue_depth Ring size
     * @throws Error if the ring cannot be created (e.g. io_uring disabled)
     */
    explicit UringChannel(int fd, bool owned = false, unsigned queue_depth = default_queue_depth);

    ~UringChannel() override;

    UringChannel(const UringChannel &) = delete;
    UringChannel &operator=(const UringChannel &) = delete;

    /**
     * Open a path and wrap the resulting descriptor (owned)
     * @throws Error on open or ring setup failure
     */
    [[nodiscard]] static std::unique_ptr<UringChannel> open(const std::string &path, int flags,
                                                            mode_t mode = 0666);

    [[nodiscard]] size_t read(std::span<std::byte> buf) override;
    [[nodiscard]] size_t write(std::span<const std::byte> data) override;
    [[nodiscard]] SeekResult seek(uint64_t offset) override;
    [[nodiscard]] SeekResult truncate(uint64_t length) override;
    [[nodiscard]] std::optional<uint64_t> size() override;

    [[nodiscard]] int fd() const noexcept { return fd_; }
    [[nodiscard]] bool positional() const noexcept { return positional_; }

  private:
    struct Ring;

    size_t submit(bool is_write, void *buf, size_t len);

    std::unique_ptr<Ring> ring_;
    int fd_;
    bool owned_;
    bool positional_ = false;
    bool regular_ = false;
    uint64_t origin_ = 0;
    uint64_t offset_ = 0;
};

} // namespace ddx

#endif // DDX_URING_CHANNEL_HPP
