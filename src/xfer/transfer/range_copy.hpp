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

#include "xfer/transfer/selector.hpp"
#include "xfer/transfer/endpoint.hpp"
#include <flow/log/log.hpp>

namespace xfer::transfer
{

// Types.

/**
 * Selector that moves bytes from a regular file to a regular file with `copy_file_range()`, entirely inside the
 * kernel (and, on filesystems supporting it, possibly without copying data blocks at all).  Both file positions are
 * used and advanced by the kernel, exactly as a `read()`/`write()` loop would.
 *
 * Applies only if both endpoints are regular files and the destination is not in append-mode.
 * The outcome, per `copy_file_range()` result, is:
 *   - Bytes moved: continue until `max_n` is reached or the call returns 0 (end of source): Completed.
 *   - 0 on the very first call: Not_applicable.  Some files (e.g., in `/proc`) report size 0 and yield nothing to
 *     `copy_file_range()` while `read()` works fine; only the generic loop can tell which case it is.
 *   - `EINTR`: retried.
 *   - Before any bytes moved: `EINVAL` (overlapping ranges within one file; unsupported file types), `EIO`, `EPERM`,
 *     `EBADF`: Not_applicable.  `ENOSYS`: Not_applicable and memoized as absent in the Unsupported_op_cache.
 *     `EXDEV`, `EOPNOTSUPP`: Not_applicable and memoized for this (source device, destination device) pairing.
 *   - Anything else, or any error after bytes moved: Failed.
 *
 * A Range_copy_selector is a light-weight copyable value; it can be stored in Selectors::m_range_copy.
 * It may be invoked concurrently from multiple threads.
 */
class Range_copy_selector :
  public flow::log::Log_context
{
public:
  // Constants.

  /// Default max bytes per `copy_file_range()` call: 1 GiB.
  static constexpr size_t S_DEFAULT_MAX_CHUNK_SZ = size_t(1) << 30;

  // Constructors/destructor.

  /**
   * Constructs the selector.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param max_chunk_sz
   *        Max bytes per system call.  Must be positive.
   * @param cache
   *        Memo of unsupported operations to consult and update.  Null means Unsupported_op_cache::process_wide().
   *        Must outlive `*this` and copies of it.
   */
  explicit Range_copy_selector(flow::log::Logger* logger_ptr, size_t max_chunk_sz = S_DEFAULT_MAX_CHUNK_SZ,
                               Unsupported_op_cache* cache = 0);

  // Methods.

  /**
   * Returns `true` if and only if the selector applies, structurally, to the given pair.  operator()() returns
   * Not_applicable without any I/O if this returns `false`.
   *
   * @param dst
   *        Destination.
   * @param src
   *        Source.
   * @return See above.
   */
  static bool eligible(const Endpoint& dst, const Endpoint& src);

  /**
   * Performs the transfer of at most `max_n` bytes, as described in the class doc header.
   *
   * @param dst
   *        Destination; must be valid().
   * @param src
   *        Source; must be valid().
   * @param max_n
   *        Limit; positive; #S_UNLIMITED means until end of source.
   * @return See above.
   */
  Selector_result operator()(const Endpoint& dst, const Endpoint& src, uint64_t max_n) const;

private:
  // Data.

  /// See ctor.
  size_t m_max_chunk_sz;

  /// See ctor.  Not null.
  Unsupported_op_cache* m_cache;
}; // class Range_copy_selector

} // namespace xfer::transfer
