// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 ddx Contributors

/**
 * @file fwd.hpp
 * @brief Forward declarations for ddx
 */

#ifndef DDX_FWD_HPP
#define DDX_FWD_HPP

namespace ddx {

class Error;
struct ErrorRecord;
class TransferConfig;
class Channel;
class FdChannel;
class UringChannel;
class MemoryChannel;
class BlockBuffer;
class BufferPool;
class ConversionPipeline;
struct ConversionResult;
class TransferCounter;
class ProgressSnapshot;
class ProgressPoller;
class CancelToken;
class CopyEngine;
struct CopyReport;

} // namespace ddx

#endif // DDX_FWD_HPP
