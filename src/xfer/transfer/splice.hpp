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
 * Selector that moves bytes with `splice()`, which requires a pipe on at least one side of each call.
 *
 * Applies if either endpoint is a pipe, or if the source is a stream socket; but never to an append-mode
 * regular-file destination.
 *
 * ### Direct mode ###
 * If either endpoint is a pipe, bytes are spliced straight from source to destination.
 *
 * ### Two-stage mode ###
 * Otherwise (e.g., TCP or Unix-domain socket into a file or a terminal) a Private_pipe is opened for the duration of
 * the call, and each round consists of a *drain* (source to pipe, at most the lesser of the remaining limit and the
 * pipe capacity; so no byte beyond the limit is ever consumed from the source) followed by a *pump* (pipe to
 * destination until the pipe is empty).
 *
 * ### Outcomes ###
 * All calls use `SPLICE_F_NONBLOCK`; `EAGAIN` results in a `poll()`-wait for readiness of the relevant
 * endpoint(s), then a retry.  `EINTR` is retried.
 *   - A 0 result from a drain or direct splice: end of source (peer closed, writers gone, end of file): Completed.
 *   - A 0 result from a pump while bytes remain in the private pipe: not end of anything.  (Terminal
 *     destinations have been observed to do this under bursty input.)  Wait for the destination to be writable;
 *     retry.
 *   - Before any bytes moved: `EINVAL`, `EOPNOTSUPP`: Not_applicable.  `ENOSYS`: Not_applicable, memoized as absent.
 *   - A pump failing that way after a drain: the drained bytes are *rescued* (moved from the private pipe to the
 *     destination with `read()`/`write()`), and the result is Not_applicable with the count so far, so that the
 *     rest can be moved by the generic loop.  Nothing is lost or duplicated.
 *   - Anything else: Failed.
 */
class Splice_selector :
  public flow::log::Log_context
{
public:
  // Constants.

  /// Default max bytes per `splice()` call, and the capacity requested for the private pipe: 1 MiB.
  static constexpr size_t S_DEFAULT_MAX_CHUNK_SZ = size_t(1) << 20;

  // Constructors/destructor.

  /**
   * Constructs the selector.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param max_chunk_sz
   *        Max bytes per system call; also the requested private pipe capacity.  Must be positive.
   * @param cache
   *        See Range_copy_selector ctor.
   */
  explicit Splice_selector(flow::log::Logger* logger_ptr, size_t max_chunk_sz = S_DEFAULT_MAX_CHUNK_SZ,
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
  // Methods.

  /**
   * Direct mode.  See class doc header.
   *
   * @param dst
   *        See operator()().
   * @param src
   *        See operator()().
   * @param max_n
   *        See operator()().
   * @return See above.
   */
  Selector_result splice_direct(const Endpoint& dst, const Endpoint& src, uint64_t max_n) const;

  /**
   * Two-stage mode.  See class doc header.
   *
   * @param dst
   *        See operator()().
   * @param src
   *        See operator()().
   * @param max_n
   *        See operator()().
   * @return See above.
   */
  Selector_result splice_via_pipe(const Endpoint& dst, const Endpoint& src, uint64_t max_n) const;

  /**
   * Waits until `hndl` is ready as specified, unless `ep` is a regular file (always ready).
   *
   * @param ep
   *        Endpoint.
   * @param readiness
   *        What to wait for.
   * @param err_code
   *        Not null.  Cleared or set to a system code.
   */
  void await(const Endpoint& ep, util::Readiness readiness, Error_code* err_code) const;

  /**
   * Handles an errno from a `splice()` before any bytes moved: if it means "not supported here," memoizes as
   * needed and returns `true`.
   *
   * @param err
   *        The errno value.
   * @param dst
   *        Destination (for logging).
   * @param src
   *        Source (for logging).
   * @return Whether the result should be Not_applicable.
   */
  bool unsupported_errno(int err, const Endpoint& dst, const Endpoint& src) const;

  /**
   * Number of bytes buffered in the given pipe (`FIONREAD`); 0 if that cannot be determined.
   *
   * @param pipe_fd
   *        Either end of a pipe.
   * @return See above.
   */
  static size_t pipe_pending(int pipe_fd);

  // Data.

  /// See ctor.
  size_t m_max_chunk_sz;

  /// See ctor.  Not null.
  Unsupported_op_cache* m_cache;
}; // class Splice_selector

} // namespace xfer::transfer
