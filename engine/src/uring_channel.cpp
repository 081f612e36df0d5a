// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 ddx Contributors

/**
 * @file uring_channel.cpp
 * @brief io_uring-backed file channel
 *
 * Internal ring handling follows the engine's blocking model: one SQE
 * submitted, one CQE reaped, per channel call.
 */

#include <ddx/uring_channel.hpp>

#include "log.h"

#include <cerrno>
#include <climits>
#include <cstring>

#include <fcntl.h>
#include <liburing.h>
#include <sys/stat.h>
#include <unistd.h>

namespace ddx {

struct UringChannel::Ring {
    struct io_uring ring;
    bool initialized = false;

    ~Ring() {
        if (initialized) io_uring_queue_exit(&ring);
    }
};

UringChannel::UringChannel(int fd, bool owned, unsigned queue_depth)
    : ring_(std::make_unique<Ring>()), fd_(fd), owned_(false) {
    struct stat st;
    check(fstat(fd_, &st) == 0, "fstat");
    regular_ = S_ISREG(st.st_mode);
    positional_ = regular_ || S_ISBLK(st.st_mode);
    if (positional_) {
        off_t pos = lseek(fd_, 0, SEEK_CUR);
        if (pos > 0) origin_ = static_cast<uint64_t>(pos);
    }

    int ret = io_uring_queue_init(queue_depth, &ring_->ring, 0);
    if (ret < 0) {
        throw Error(-ret, "io_uring_queue_init");
    }
    ring_->initialized = true;
    // Ownership transfers only once construction can no longer fail.
    owned_ = owned;

    detail::log(LogLevel::Debug, "uring channel fd=%d depth=%u %s", fd_, queue_depth,
                positional_ ? "positional" : "streaming");
}

UringChannel::~UringChannel() {
    ring_.reset();
    if (owned_ && fd_ >= 0 && ::close(fd_) != 0) {
        detail::log(LogLevel::Warning, "close(%d) failed: %s", fd_, strerror(errno));
    }
}

std::unique_ptr<UringChannel> UringChannel::open(const std::string &path, int flags, mode_t mode) {
    int fd;
    do {
        fd = ::open(path.c_str(), flags | O_CLOEXEC, mode);
    } while (fd < 0 && errno == EINTR);
    if (fd < 0) throw_errno(path);

    try {
        return std::make_unique<UringChannel>(fd, true);
    } catch (...) {
        ::close(fd);
        throw;
    }
}

size_t UringChannel::submit(bool is_write, void *buf, size_t len) {
    unsigned nbytes = len > UINT_MAX ? UINT_MAX : static_cast<unsigned>(len);

    for (;;) {
        struct io_uring_sqe *sqe = io_uring_get_sqe(&ring_->ring);
        if (!sqe) {
            throw Error(EBUSY, "io_uring_get_sqe");
        }

        // -1 means "current file position" for non-seekable descriptors
        __u64 off = positional_ ? origin_ + offset_ : static_cast<__u64>(-1);
        if (is_write) {
            io_uring_prep_write(sqe, fd_, buf, nbytes, off);
        } else {
            io_uring_prep_read(sqe, fd_, buf, nbytes, off);
        }

        int ret = io_uring_submit(&ring_->ring);
        if (ret < 0) {
            throw Error(-ret, "io_uring_submit");
        }

        struct io_uring_cqe *cqe = nullptr;
        do {
            ret = io_uring_wait_cqe(&ring_->ring, &cqe);
        } while (ret == -EINTR);
        if (ret < 0) {
            throw Error(-ret, "io_uring_wait_cqe");
        }

        int res = cqe->res;
        io_uring_cqe_seen(&ring_->ring, cqe);

        if (res == -EINTR || res == -EAGAIN) continue;
        if (res < 0) {
            throw Error(-res, is_write ? "write" : "read");
        }
        if (positional_) offset_ += static_cast<uint64_t>(res);
        return static_cast<size_t>(res);
    }
}

size_t UringChannel::read(std::span<std::byte> buf) {
    if (buf.empty()) return 0;
    return submit(false, buf.data(), buf.size());
}

size_t UringChannel::write(std::span<const std::byte> data) {
    if (data.empty()) return 0;
    // The kernel only reads from the buffer for a write request.
    return submit(true, const_cast<std::byte *>(data.data()), data.size());
}

SeekResult UringChannel::seek(uint64_t offset) {
    if (!positional_) return SeekResult::Unsupported;
    offset_ = offset;
    return SeekResult::Ok;
}

SeekResult UringChannel::truncate(uint64_t length) {
    if (!regular_) return SeekResult::Unsupported;

    for (;;) {
        if (ftruncate(fd_, static_cast<off_t>(origin_ + length)) == 0) return SeekResult::Ok;
        if (errno == EINTR) continue;
        throw_errno("ftruncate");
    }
}

std::optional<uint64_t> UringChannel::size() {
    auto total = descriptor_size(fd_);
    if (!total) return std::nullopt;
    return *total > origin_ ? *total - origin_ : 0;
}

} // namespace ddx
