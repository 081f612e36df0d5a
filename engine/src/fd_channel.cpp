// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 ddx Contributors

/**
 * @file fd_channel.cpp
 * @brief POSIX descriptor channel
 */

#include <ddx/cancel.hpp>
#include <ddx/channel.hpp>

#include "log.h"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <linux/fs.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace ddx {

std::optional<uint64_t> descriptor_size(int fd) {
    struct stat st;
    check(fstat(fd, &st) == 0, "fstat");
    if (S_ISREG(st.st_mode)) return static_cast<uint64_t>(st.st_size);
    if (S_ISBLK(st.st_mode)) {
        uint64_t bytes = 0;
        check(ioctl(fd, BLKGETSIZE64, &bytes) == 0, "BLKGETSIZE64");
        return bytes;
    }
    return std::nullopt;
}

FdChannel::FdChannel(int fd, bool owned) noexcept : fd_(fd), owned_(owned) {
    // Unseekable descriptors keep origin 0; seek() reports Unsupported later.
    off_t pos = lseek(fd_, 0, SEEK_CUR);
    if (pos >= 0) origin_ = pos;
}

FdChannel::~FdChannel() {
    if (owned_ && fd_ >= 0 && ::close(fd_) != 0) {
        detail::log(LogLevel::Warning, "close(%d) failed: %s", fd_, strerror(errno));
    }
}

std::unique_ptr<FdChannel> FdChannel::open(const std::string &path, int flags, mode_t mode) {
    for (;;) {
        int fd = ::open(path.c_str(), flags | O_CLOEXEC, mode);
        if (fd < 0) {
            if (errno == EINTR) continue;
            throw_errno(path);
        }
        return std::make_unique<FdChannel>(fd, true);
    }
}

void FdChannel::interrupted(const char *op) const {
    if (cancel_ != nullptr && cancel_->cancelled()) {
        throw Error(ErrorKind::Cancelled, ECANCELED, std::string(op) + " interrupted");
    }
}

void FdChannel::wait_ready(short events, const char *op) const {
    struct pollfd pfd = {fd_, events, 0};
    while (::poll(&pfd, 1, -1) < 0) {
        if (errno != EINTR) throw_errno("poll");
        interrupted(op);
    }
}

size_t FdChannel::read(std::span<std::byte> buf) {
    for (;;) {
        ssize_t n = ::read(fd_, buf.data(), buf.size());
        if (n >= 0) return static_cast<size_t>(n);
        if (errno == EINTR) {
            interrupted("read");
        } else if (errno == EAGAIN || errno == EWOULDBLOCK) {
            wait_ready(POLLIN, "read");
        } else {
            throw_errno("read");
        }
    }
}

size_t FdChannel::write(std::span<const std::byte> data) {
    for (;;) {
        ssize_t n = ::write(fd_, data.data(), data.size());
        if (n >= 0) return static_cast<size_t>(n);
        if (errno == EINTR) {
            interrupted("write");
        } else if (errno == EAGAIN || errno == EWOULDBLOCK) {
            wait_ready(POLLOUT, "write");
        } else {
            throw_errno("write");
        }
    }
}

SeekResult FdChannel::seek(uint64_t offset) {
    if (lseek(fd_, origin_ + static_cast<off_t>(offset), SEEK_SET) < 0) {
        if (errno == ESPIPE) return SeekResult::Unsupported;
        throw Error(ErrorKind::Seek, errno, "lseek");
    }
    return SeekResult::Ok;
}

SeekResult FdChannel::truncate(uint64_t length) {
    struct stat st;
    check(fstat(fd_, &st) == 0, "fstat");
    // Block devices and pipes have no length to set.
    if (!S_ISREG(st.st_mode)) return SeekResult::Unsupported;

    for (;;) {
        if (ftruncate(fd_, origin_ + static_cast<off_t>(length)) == 0) return SeekResult::Ok;
        if (errno == EINTR) continue;
        throw_errno("ftruncate");
    }
}

std::optional<uint64_t> FdChannel::size() {
    auto total = descriptor_size(fd_);
    if (!total) return std::nullopt;
    uint64_t origin = static_cast<uint64_t>(origin_);
    return *total > origin ? *total - origin : 0;
}

} // namespace ddx
