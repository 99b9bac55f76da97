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
#include "xfer/transfer/detail/private_pipe.hpp"
#include <flow/error/error.hpp>
#include <boost/asio/connect_pipe.hpp>
#include <fcntl.h>

namespace xfer::transfer
{

// Private_pipe implementations.

Private_pipe::Private_pipe(flow::log::Logger* logger_ptr, size_t capacity, Error_code* err_code) :
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSFER),
  m_read_end(m_task_engine),
  m_write_end(m_task_engine),
  m_capacity(0)
{
  using flow::error::Runtime_error;
  using boost::asio::connect_pipe;
  using ::fcntl;
  // using ::F_SETPIPE_SZ; // A macro apparently.

  Error_code sys_err_code;
  connect_pipe(m_read_end, m_write_end, sys_err_code);
  if (sys_err_code)
  {
    FLOW_LOG_WARNING("Private_pipe: connect_pipe() failed.  Details follow.");
    FLOW_ERROR_SYS_ERROR_LOG_WARNING();

    if (err_code)
    {
      *err_code = sys_err_code;
      return;
    }
    // else
    throw Runtime_error(sys_err_code, FLOW_UTIL_WHERE_AM_I_STR());
  }
  // else

  const Native_handle rd(m_read_end.native_handle());
  const Native_handle wr(m_write_end.native_handle());

  // Not fatal if it fails (e.g., EPERM above /proc/sys/fs/pipe-max-size for unprivileged user).
  if (fcntl(wr.m_native_handle, F_SETPIPE_SZ, int(capacity)) == -1)
  {
    FLOW_LOG_TRACE("Private_pipe [" << rd << ", " << wr << "]: F_SETPIPE_SZ to "
                   "[" << capacity << "] failed (errno [" << errno << "]); using default capacity.");
  }

  const int actual = fcntl(wr.m_native_handle, F_GETPIPE_SZ);
  m_capacity = (actual > 0) ? size_t(actual) : util::page_size(); // A pipe can always hold at least 1 page.

  FLOW_LOG_TRACE("Private_pipe [" << rd << ", " << wr << "]: Opened; capacity [" << m_capacity << "].");

  if (err_code)
  {
    err_code->clear();
  }
} // Private_pipe::Private_pipe()

Native_handle Private_pipe::read_end()
{
  return Native_handle(m_read_end.native_handle());
}

Native_handle Private_pipe::write_end()
{
  return Native_handle(m_write_end.native_handle());
}

size_t Private_pipe::capacity() const
{
  return m_capacity;
}

} // namespace xfer::transfer
