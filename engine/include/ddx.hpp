// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 ddx Contributors

/**
 * @file ddx.hpp
 * @brief Main header for the ddx block copy library
 *
 * This is the single header you need to include to use ddx from C++.
 *
 * Example:
 * @code
 * #include <ddx.hpp>
 *
 * int main() {
 *     auto in = ddx::FdChannel::open("disk.img", O_RDONLY);
 *     auto out = ddx::FdChannel::open("copy.img", O_WRONLY | O_CREAT);
 *
 *     ddx::TransferConfig config;
 *     config.block_size(1 << 20).add_conversion(ddx::Conversion::Sparse);
 *
 *     ddx::CopyEngine engine(*in, *out, config);
 *     ddx::CopyReport report = engine.run();
 *     return report.ok() ? 0 : 1;
 * }
 * @endcode
 */

#ifndef DDX_HPP
#define DDX_HPP

// Order matters for dependencies
#include <ddx/fwd.hpp>
#include <ddx/error.hpp>
#include <ddx/log.hpp>
#include <ddx/config.hpp>
#include <ddx/channel.hpp>
#include <ddx/memory_channel.hpp>
#include <ddx/special_channels.hpp>
#include <ddx/uring_channel.hpp>
#include <ddx/block_buffer.hpp>
#include <ddx/conversion.hpp>
#include <ddx/counter.hpp>
#include <ddx/progress.hpp>
#include <ddx/cancel.hpp>
#include <ddx/engine.hpp>

#endif // DDX_HPP
