/* Flow-Xfer: Core
 * Copyright 2023 Akamai Technologies, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in
 * compliance with the License.  You may obtain a copy
 * of the License at
 *
 *   https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in
 * writing, software distributed under the License is
 * distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing
 * permissions and limitations under the License. */

/// @file
#pragma once

#include "xfer/transfer/transfer_fwd.hpp"
#include <flow/log/log.hpp>

/**
 * Internal helpers performing plain blocking-semantics `read()`/`write()` on a descriptor that may or may not be
 * in non-blocking mode: `EINTR` is retried; `EAGAIN` is turned into a util::wait_until_ready() followed by a retry.
 * Used by buffered_copy() and by Splice_selector (to rescue bytes stranded in its private pipe).
 */
namespace xfer::transfer::fd_io
{

// Free functions.

/**
 * Reads at least 1 byte (unless at end-of-data) and at most `target.size()` bytes from `hndl` into `target`,
 * blocking if necessary.  `target.size()` must be positive.
 *
 * @param logger_ptr
 *        Logger to use for logging subsequently.
 * @param hndl
 *        Descriptor to read.
 * @param target
 *        Buffer.
 * @param err_code
 *        Must not be null.  On error set to the system code from `read()` (or util::wait_until_ready()); else
 *        cleared.
 * @return Bytes read; 0 means end-of-data (if `!*err_code`).
 */
size_t read_some(flow::log::Logger* logger_ptr, Native_handle hndl, const util::Blob_mutable& target,
                 Error_code* err_code);

/**
 * Writes all of `source` to `hndl`, blocking as necessary.
 *
 * @param logger_ptr
 *        Logger to use for logging subsequently.
 * @param hndl
 *        Descriptor to write.
 * @param source
 *        Buffer.
 * @param err_code
 *        Must not be null.  On error set to the system code from `write()` (or util::wait_until_ready()) or
 *        error::Code::S_SHORT_WRITE (`write()` accepted 0 bytes); else cleared.
 * @return Bytes written: `source.size()` on success; possibly fewer on error.
 */
size_t write_all(flow::log::Logger* logger_ptr, Native_handle hndl, const util::Blob_const& source,
                 Error_code* err_code);

} // namespace xfer::transfer::fd_io
