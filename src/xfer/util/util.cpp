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
#include "xfer/util/util_fwd.hpp"
#include "xfer/util/native_handle.hpp"
#include <flow/error/error.hpp>
#include <flow/common.hpp>
#include <poll.h>
#include <unistd.h>

namespace xfer::util
{

// Implementations.

size_t page_size()
{
  using ::sysconf;

  static const size_t S_PAGE_SZ = []() -> size_t
  {
    const auto raw = sysconf(_SC_PAGESIZE);
    // Can't really fail for _SC_PAGESIZE in Linux; if it does, assume the traditional value.
    return (raw > 0) ? size_t(raw) : size_t(4096);
  }();

  return S_PAGE_SZ;
}

void wait_until_ready(flow::log::Logger* logger_ptr, Native_handle hndl, Readiness readiness, Error_code* err_code)
{
  using boost::system::system_category;
  using ::poll;
  using ::pollfd;
  // using ::errno; // It's a macro apparently.

  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { wait_until_ready(logger_ptr, hndl, readiness, actual_err_code); },
         err_code, "util::wait_until_ready()"))
  {
    return;
  }
  // else

  assert((!hndl.null()) && "Disallowed per contract.");

  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_UTIL);

  pollfd poll_spec;
  poll_spec.fd = hndl.m_native_handle;
  poll_spec.events = (readiness == Readiness::S_READABLE) ? POLLIN : POLLOUT;
  poll_spec.revents = 0;

  FLOW_LOG_TRACE("Handle [" << hndl << "]: Awaiting [" << readiness << "] via poll().");

  int rc;
  do
  {
    rc = poll(&poll_spec, 1, -1); // No timeout.
  }
  while ((rc == -1) && (errno == EINTR));

  if (rc == -1)
  {
    const auto& sys_err_code = *err_code = Error_code(errno, system_category());
    FLOW_LOG_WARNING("Handle [" << hndl << "]: poll() for [" << readiness << "] failed.  Details follow.");
    FLOW_ERROR_SYS_ERROR_LOG_WARNING();
    return;
  }
  // else

  /* POLLERR/POLLHUP/POLLNVAL count as "ready" too: the caller's next I/O call will report what happened
   * (EPIPE, end-of-data, EBADF...). */
  FLOW_LOG_TRACE("Handle [" << hndl << "]: poll() returned events [" << poll_spec.revents << "].");
  err_code->clear();
} // wait_until_ready()

const uint8_t* blob_data(const Blob_const& blob)
{
  return static_cast<const uint8_t*>(blob.data());
}

uint8_t* blob_data(const Blob_mutable& blob)
{
  return static_cast<uint8_t*>(blob.data());
}

std::ostream& operator<<(std::ostream& os, Readiness val)
{
  return os << ((val == Readiness::S_READABLE) ? "readable" : "writable");
}

} // namespace xfer::util
