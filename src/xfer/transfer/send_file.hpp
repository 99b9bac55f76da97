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
 * Selector that moves bytes from a regular file to nearly any destination (socket, pipe, regular file, terminal)
 * with `sendfile()`.  The source file position is used and advanced, as is the destination's.
 *
 * Applies only if the source is a regular file and the destination is not in append-mode.  (Copier additionally
 * skips it when source and destination are the same file: `sendfile()` would read and write through one shared
 * position.)  The outcome, per `sendfile()` result:
 *   - Bytes moved: continue until `max_n` is reached or the call returns 0 (end of source): Completed.
 *   - 0 on the very first call: Not_applicable.
 *   - `EINTR`: retried.  `EAGAIN` (non-blocking destination): wait for the destination to be writable; retry.
 *   - Before any bytes moved: `EINVAL`: Not_applicable.  `ENOSYS`: Not_applicable, memoized as absent.
 *     `EOPNOTSUPP`: Not_applicable, memoized for the device pairing.
 *   - Anything else, or any error after bytes moved: Failed.
 */
class Send_file_selector :
  public flow::log::Log_context
{
public:
  // Constants.

  /// Default max bytes per `sendfile()` call: 4 MiB.
  static constexpr size_t S_DEFAULT_MAX_CHUNK_SZ = size_t(4) << 20;

  // Constructors/destructor.

  /**
   * Constructs the selector.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param max_chunk_sz
   *        Max bytes per system call.  Must be positive.
   * @param cache
   *        See Range_copy_selector ctor.
   */
  explicit Send_file_selector(flow::log::Logger* logger_ptr, size_t max_chunk_sz = S_DEFAULT_MAX_CHUNK_SZ,
                              Unsupported_op_cache* cache = 0);

  // Methods.

  /**
   * Returns `true` if and only if the selector applies, structurally, to the given pair.
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
}; // class Send_file_selector

} // namespace xfer::transfer
