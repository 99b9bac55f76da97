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
#include "xfer/transfer/limited_source.hpp"
#include "xfer/transfer/range_copy.hpp"
#include "xfer/transfer/send_file.hpp"
#include "xfer/transfer/splice.hpp"
#include "xfer/transfer/buffered_copy.hpp"
#include <flow/log/log.hpp>
#include <boost/core/noncopyable.hpp>

namespace xfer::transfer
{

// Types.

/**
 * The transfer dispatcher: copies bytes from a source Endpoint to a destination Endpoint, using the fastest
 * mechanism the pair of descriptors allows, with results indistinguishable from buffered_copy().  This is the main
 * entry point of xfer::transfer.
 *
 * ### Algorithm ###
 * copy() does the following.
 *   -# If either endpoint is null or closed: error::Code::S_INVALID_ARGUMENT; no I/O.
 *   -# If the limit (Limited_source::remaining()) is 0: success, 0 bytes, no I/O.
 *   -# Consider, in order, the selectors in Selectors (given to the ctor, or default_selectors()); each is invoked at
 *      most once, and only if enabled in Config and structurally eligible for the pair:
 *      - range-copy: both endpoints are regular files; destination not in append-mode.
 *      - send-file: source is a regular file; destination not in append-mode; source and destination are not the
 *        same file.
 *      - splice: either endpoint is a pipe, or the source is a stream socket.
 *
 *      Completed ends the transfer successfully.  Failed ends it with the selector's error, and the bytes moved so
 *      far are returned; there is no fallback.  Not_applicable moves on (accounting any bytes it reports).
 *   -# If no selector completed the job: buffered_copy() for whatever is left.
 *
 * If the source and destination are the same file (same device and inode; e.g., one descriptor for both), the
 * outcome is as with buffered_copy(): the data read from the current position are appended after it, so a copy of
 * an entire file from offset 0 to itself doubles its contents.  Range-copy is still attempted (the kernel refuses
 * overlapping ranges with `EINVAL`).
 *
 * ### Thread safety ###
 * copy() is `const` and may be invoked concurrently from multiple threads, on independent pairs of descriptors.
 * The only state shared among concurrent transfers is the Unsupported_op_cache.
 */
class Copier :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Types.

  /**
   * Tunables of a Copier.  The defaults are suitable for nearly everyone; the enable flags exist mostly for
   * benchmarking and troubleshooting.
   */
  struct Config
  {
    // Constructors/destructor.

    /// Constructs with the default values documented on each member.
    Config();

    // Data.

    /// Max bytes per `copy_file_range()` call.  Default: Range_copy_selector::S_DEFAULT_MAX_CHUNK_SZ.
    size_t m_range_copy_max_chunk_sz;

    /// Max bytes per `sendfile()` call.  Default: Send_file_selector::S_DEFAULT_MAX_CHUNK_SZ.
    size_t m_send_file_max_chunk_sz;

    /**
     * Max bytes per `splice()` call; and the requested private pipe capacity.
     * Default: Splice_selector::S_DEFAULT_MAX_CHUNK_SZ.
     */
    size_t m_splice_max_chunk_sz;

    /// buffered_copy() buffer size.  Default: #S_DEFAULT_BUFFER_SZ.
    size_t m_buffer_sz;

    /// Whether range-copy is attempted at all.  Default: `true`.
    bool m_range_copy_enabled;

    /// Whether send-file is attempted at all.  Default: `true`.
    bool m_send_file_enabled;

    /// Whether splice is attempted at all.  Default: `true`.
    bool m_splice_enabled;
  }; // struct Config

  // Constructors/destructor.

  /**
   * Constructs the dispatcher using default_selectors().
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param config
   *        Tunables.
   */
  explicit Copier(flow::log::Logger* logger_ptr, const Config& config = Config());

  /**
   * Constructs the dispatcher using the given selectors, which are used as-is for the lifetime of `*this`.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param config
   *        Tunables.  The chunk sizes are not used (the selectors are already constructed); the rest is.
   * @param selectors
   *        The selectors.  An empty member means that strategy is never attempted.
   */
  explicit Copier(flow::log::Logger* logger_ptr, const Config& config, Selectors selectors);

  // Methods.

  /**
   * The real selectors, constructed from the chunk sizes in `config`.  Start from this to wrap or replace some.
   *
   * @param logger_ptr
   *        Logger for the selectors to use.
   * @param config
   *        Tunables.
   * @param cache
   *        Unsupported-op memo for the selectors.  Null means Unsupported_op_cache::process_wide().
   * @return See above.
   */
  static Selectors default_selectors(flow::log::Logger* logger_ptr, const Config& config,
                                     Unsupported_op_cache* cache = 0);

  /**
   * Copies bytes from `src` to `dst` until end of source.  See class doc header.
   *
   * @param dst
   *        Destination.
   * @param src
   *        Source.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_INVALID_ARGUMENT (null or closed endpoint); error::Code::S_SHORT_WRITE (destination
   *        accepts no bytes); system codes from the I/O calls.
   * @return Bytes appended to the destination (also on error: the partial count).
   */
  uint64_t copy(const Endpoint& dst, const Endpoint& src, Error_code* err_code = 0) const;

  /**
   * Copies at most `src->remaining()` bytes from `src->source()` to `dst`, stopping earlier at end of source;
   * decrements `src->remaining()` by exactly the number of bytes moved (whether or not an error occurs).
   *
   * @param dst
   *        Destination.
   * @param src
   *        Source and limit.  Must not be null.
   * @param err_code
   *        See other copy().
   * @return See other copy().
   */
  uint64_t copy(const Endpoint& dst, Limited_source* src, Error_code* err_code = 0) const;

  /**
   * The config given to ctor.
   * @return See above.
   */
  const Config& config() const;

private:
  // Methods.

  /**
   * Both copy()s forward to this.
   *
   * @param dst
   *        See copy().
   * @param src
   *        See copy().
   * @param max_n
   *        Limit; #S_UNLIMITED if none.
   * @param err_code
   *        Not null.
   * @return See copy().
   */
  uint64_t copy_impl(const Endpoint& dst, const Endpoint& src, uint64_t max_n, Error_code* err_code) const;

  // Data.

  /// See config().
  const Config m_config;

  /// See ctor.
  const Selectors m_selectors;
}; // class Copier

// Free functions: in *_fwd.hpp.

/**
 * Prints string representation of the given Copier::Config to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Copier::Config& val);

} // namespace xfer::transfer
