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

#include "xfer/util/native_handle.hpp"
#include "xfer/common.hpp"
#include <flow/log/log.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/readable_pipe.hpp>
#include <boost/asio/writable_pipe.hpp>

/**
 * Flow-Xfer module containing miscellaneous general-use facilities that don't fit into any other Flow-Xfer module.
 *
 * Each symbol therein is typically used by at least 1 other Flow-Xfer module; but all public symbols (except ones
 * under a detail/ subdirectory) are intended for use by Flow-Xfer user as well.
 */
namespace xfer::util
{

// Types.

/// Short-hand for Flow's `String_view`.
using String_view = flow::util::String_view;

/// Short-hand for anonymous pipe write end.
using Pipe_writer = boost::asio::writable_pipe;

/// Short-hand for anonymous pipe read end.
using Pipe_reader = boost::asio::readable_pipe;

/**
 * Short-hand for an immutable blob somewhere in memory, stored as exactly a `void const *` and a `size_t`.
 *
 * ### How to use ###
 * We provide this alias as a stylistic short-hand, as it better suits our domain than `boost::asio::const_buffer`,
 * to which it aliases.  Use blob_data() (instead of `.data()`) to get a pointer to `uint8_t`.
 */
using Blob_const = boost::asio::const_buffer;

/// Like #Blob_const, but the bytes are mutable.
using Blob_mutable = boost::asio::mutable_buffer;

/// Which readiness wait_until_ready() waits for.
enum class Readiness
{
  /// Readable (`POLLIN`); includes the peer-closed/end-of-data condition.
  S_READABLE,

  /// Writable (`POLLOUT`).
  S_WRITABLE
};

// Free functions.

/**
 * Returns the memory page size of this system, as reported by `sysconf(_SC_PAGESIZE)`; computed once.
 *
 * @return See above.
 */
size_t page_size();

/**
 * Blocks until the given descriptor is ready for the given kind of I/O, as reported by `poll()`; or an error or
 * hang-up is reported (in which case we return success too: the subsequent I/O attempt will report the actual
 * error or end-of-data).  `EINTR` is handled internally by retrying.
 *
 * Intended use: a non-blocking descriptor (or a `SPLICE_F_NONBLOCK` system call) yielded `EAGAIN`; call this;
 * then retry the I/O.  Note a regular file is always "ready."
 *
 * @param logger_ptr
 *        Logger to use for logging subsequently.
 * @param hndl
 *        Descriptor.  Must not be `.null()`, or behavior is undefined (assertion may trip).
 * @param readiness
 *        What to wait for.
 * @param err_code
 *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
 *        system codes from `poll()` other than `EINTR` (realistically `ENOMEM`).
 */
void wait_until_ready(flow::log::Logger* logger_ptr, Native_handle hndl, Readiness readiness,
                      Error_code* err_code = 0);

/**
 * Syntactic-sugary helper that returns pointer to first byte in an immutable buffer, as `const uint8_t*`.
 *
 * @param blob
 *        The buffer.
 * @return See above.
 */
const uint8_t* blob_data(const Blob_const& blob);

/**
 * Syntactic-sugary helper that returns pointer to first byte in a mutable buffer, as `uint8_t*`.
 *
 * @param blob
 *        The buffer.
 * @return See above.
 */
uint8_t* blob_data(const Blob_mutable& blob);

/**
 * Prints string representation of the given Readiness to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Readiness val);

} // namespace xfer::util
