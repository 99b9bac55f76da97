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

#include "xfer/transfer/endpoint.hpp"
#include <flow/log/log.hpp>

namespace xfer::transfer
{

// Constants.

/// Default size of the user-space buffer used by buffered_copy(): 32 KiB.
constexpr size_t S_DEFAULT_BUFFER_SZ = size_t(32) * 1024;

// Free functions.

/**
 * The generic transfer loop: repeatedly `read()`s at most `buf_sz` (and never beyond `max_n` in total) bytes from
 * `src` into a user-space buffer and `write()`s all of them to `dst`, until end-of-data or until `max_n` bytes were
 * moved.  Works for any pair of readable/writable descriptors; Copier uses it when no accelerated selector applies
 * (or to finish what one left over).  Non-blocking descriptors are handled by waiting for readiness.
 *
 * Any `read()` or `write()` error aborts the loop; the bytes written so far are returned.  A `write()` that
 * accepts nothing results in error::Code::S_SHORT_WRITE.
 *
 * @param logger_ptr
 *        Logger to use for logging subsequently.
 * @param dst
 *        Destination; if not valid() the result is error::Code::S_INVALID_ARGUMENT.
 * @param src
 *        Source; ditto.
 * @param max_n
 *        Limit; #S_UNLIMITED means until end-of-data; 0 means return 0 immediately.
 * @param buf_sz
 *        Buffer size; must be positive.
 * @param err_code
 *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
 *        error::Code::S_INVALID_ARGUMENT, error::Code::S_SHORT_WRITE; system codes from `read()`, `write()`,
 *        `poll()`.
 * @return Bytes written to `dst`.
 */
uint64_t buffered_copy(flow::log::Logger* logger_ptr, const Endpoint& dst, const Endpoint& src, uint64_t max_n,
                       size_t buf_sz = S_DEFAULT_BUFFER_SZ, Error_code* err_code = 0);

} // namespace xfer::transfer
