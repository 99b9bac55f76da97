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
#include <flow/util/util_fwd.hpp>
#include <boost/core/noncopyable.hpp>

namespace xfer::transfer
{

// Types.

/**
 * An anonymous kernel pipe owned by the present object: both ends are opened (`boost::asio::connect_pipe()`) in the
 * ctor and closed when the util::Pipe_reader and util::Pipe_writer members are destroyed.  No async op is ever
 * started on them; the attached `Task_engine` exists only because boost.asio I/O objects require one.
 * Splice_selector uses one per transfer as the intermediate buffer when neither endpoint is itself a pipe:
 * `splice()` requires a pipe on at least one side.
 *
 * The ends are in blocking mode; Splice_selector uses `SPLICE_F_NONBLOCK` per call instead.
 */
class Private_pipe :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /**
   * Opens the pipe and attempts to set its capacity to `capacity` (`F_SETPIPE_SZ`); failure to resize is not an
   * error (the kernel default, or whatever the kernel rounded to, is used; see capacity()).
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param capacity
   *        Desired pipe buffer size in bytes.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        system codes from `connect_pipe()` (e.g., `EMFILE`).
   */
  explicit Private_pipe(flow::log::Logger* logger_ptr, size_t capacity, Error_code* err_code = 0);

  // Methods.

  /**
   * The read end.  `.null()` if ctor failed.
   * @return See above.
   */
  Native_handle read_end();

  /**
   * The write end.  `.null()` if ctor failed.
   * @return See above.
   */
  Native_handle write_end();

  /**
   * The pipe buffer size in bytes as reported by the kernel; at most this many bytes can sit in the pipe.
   * @return See above.
   */
  size_t capacity() const;

private:
  // Data.

  /// Execution context of #m_read_end and #m_write_end.  Never run.
  flow::util::Task_engine m_task_engine;

  /// See read_end().
  util::Pipe_reader m_read_end;

  /// See write_end().
  util::Pipe_writer m_write_end;

  /// See capacity().
  size_t m_capacity;
}; // class Private_pipe

} // namespace xfer::transfer
