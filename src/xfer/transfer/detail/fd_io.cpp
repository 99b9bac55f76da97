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
#include "xfer/transfer/detail/fd_io.hpp"
#include "xfer/transfer/error.hpp"
#include <flow/error/error.hpp>
#include <unistd.h>

namespace xfer::transfer::fd_io
{

// Implementations.

size_t read_some(flow::log::Logger* logger_ptr, Native_handle hndl, const util::Blob_mutable& target,
                 Error_code* err_code)
{
  using util::blob_data;
  using util::wait_until_ready;
  using util::Readiness;
  using boost::system::system_category;
  using ::read;
  using ::ssize_t;
  // using ::errno; // It's a macro apparently.

  assert(err_code);
  assert(target.size() != 0);

  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_TRANSFER);

  while (true)
  {
    const ssize_t n_rcvd = read(hndl.m_native_handle, blob_data(target), target.size());
    if (n_rcvd >= 0)
    {
      FLOW_LOG_TRACE("Handle [" << hndl << "]: read() got [" << n_rcvd << "] of [" << target.size() << "] "
                     "max bytes.");
      err_code->clear();
      return size_t(n_rcvd);
    }
    // else
    if (errno == EINTR)
    {
      continue;
    }
    // else
    if ((errno == EAGAIN) || (errno == EWOULDBLOCK))
    {
      wait_until_ready(logger_ptr, hndl, Readiness::S_READABLE, err_code);
      if (*err_code)
      {
        return 0;
      }
      continue;
    }
    // else

    const auto& sys_err_code = *err_code = Error_code(errno, system_category());
    FLOW_LOG_WARNING("Handle [" << hndl << "]: read() failed.  Details follow.");
    FLOW_ERROR_SYS_ERROR_LOG_WARNING();
    return 0;
  } // while (true)
} // read_some()

size_t write_all(flow::log::Logger* logger_ptr, Native_handle hndl, const util::Blob_const& source,
                 Error_code* err_code)
{
  using util::blob_data;
  using util::wait_until_ready;
  using util::Readiness;
  using boost::system::system_category;
  using ::write;
  using ::ssize_t;
  // using ::errno; // It's a macro apparently.

  assert(err_code);

  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_TRANSFER);

  const auto data = blob_data(source);
  size_t n_sent_total = 0;
  while (n_sent_total != source.size())
  {
    const ssize_t n_sent = write(hndl.m_native_handle, data + n_sent_total, source.size() - n_sent_total);
    if (n_sent > 0)
    {
      n_sent_total += size_t(n_sent);
      continue;
    }
    // else
    if (n_sent == 0)
    {
      FLOW_LOG_WARNING("Handle [" << hndl << "]: write() of [" << (source.size() - n_sent_total) << "] bytes "
                       "accepted 0 bytes; giving up after [" << n_sent_total << "] bytes.");
      *err_code = error::Code::S_SHORT_WRITE;
      return n_sent_total;
    }
    // else
    if (errno == EINTR)
    {
      continue;
    }
    // else
    if ((errno == EAGAIN) || (errno == EWOULDBLOCK))
    {
      wait_until_ready(logger_ptr, hndl, Readiness::S_WRITABLE, err_code);
      if (*err_code)
      {
        return n_sent_total;
      }
      continue;
    }
    // else

    const auto& sys_err_code = *err_code = Error_code(errno, system_category());
    FLOW_LOG_WARNING("Handle [" << hndl << "]: write() failed after [" << n_sent_total << "] of "
                     "[" << source.size() << "] bytes.  Details follow.");
    FLOW_ERROR_SYS_ERROR_LOG_WARNING();
    return n_sent_total;
  } // while (n_sent_total != source.size())

  FLOW_LOG_TRACE("Handle [" << hndl << "]: write() loop sent all [" << n_sent_total << "] bytes.");
  err_code->clear();
  return n_sent_total;
} // write_all()

} // namespace xfer::transfer::fd_io
