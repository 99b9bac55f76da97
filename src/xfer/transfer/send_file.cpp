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
#include "xfer/transfer/send_file.hpp"
#include "xfer/transfer/unsupported_op_cache.hpp"
#include <flow/error/error.hpp>
#include <algorithm>
#include <sys/sendfile.h>

namespace xfer::transfer
{

// Send_file_selector implementations.

Send_file_selector::Send_file_selector(flow::log::Logger* logger_ptr, size_t max_chunk_sz,
                                       Unsupported_op_cache* cache) :
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSFER),
  m_max_chunk_sz(max_chunk_sz),
  m_cache(cache ? cache : &Unsupported_op_cache::process_wide())
{
  assert(m_max_chunk_sz != 0);
}

bool Send_file_selector::eligible(const Endpoint& dst, const Endpoint& src) // Static.
{
  return dst.valid() && src.valid() && (src.kind() == Endpoint_kind::S_REGULAR_FILE) && (!dst.append_mode());
}

Selector_result Send_file_selector::operator()(const Endpoint& dst, const Endpoint& src, uint64_t max_n) const
{
  using util::wait_until_ready;
  using util::Readiness;
  using boost::system::system_category;
  using std::min;
  using ::sendfile;
  using ::ssize_t;
  // using ::errno; // It's a macro apparently.

  constexpr auto OP = Accelerated_op::S_SEND_FILE;

  assert(max_n != 0);

  if (!eligible(dst, src))
  {
    return Not_applicable{ 0 };
  }
  // else
  if (m_cache->unsupported(OP, src.device(), dst.device()))
  {
    FLOW_LOG_TRACE("Send-file [" << src << "] => [" << dst << "]: Memoized as unsupported; skipping.");
    return Not_applicable{ 0 };
  }
  // else

  const auto src_fd = src.native_handle().m_native_handle;
  const auto dst_fd = dst.native_handle().m_native_handle;

  FLOW_LOG_TRACE("Send-file [" << src << "] => [" << dst << "]: Starting; limit [" << max_n << "].");

  uint64_t n_total = 0;
  while (n_total != max_n)
  {
    const auto chunk_sz = size_t(min<uint64_t>(max_n - n_total, m_max_chunk_sz));
    const ssize_t n = sendfile(dst_fd, src_fd, nullptr, chunk_sz);
    if (n > 0)
    {
      n_total += uint64_t(n);
      FLOW_LOG_TRACE("Send-file: Chunk of [" << n << "] (of max [" << chunk_sz << "]); "
                     "total [" << n_total << "].");
      continue;
    }
    // else
    if (n == 0)
    {
      if (n_total == 0)
      {
        FLOW_LOG_TRACE("Send-file [" << src << "] => [" << dst << "]: Nothing sent on first call; "
                       "deferring to other strategies.");
        return Not_applicable{ 0 };
      }
      // else
      break; // End of source.
    }
    // else
    if (errno == EINTR)
    {
      continue;
    }
    // else
    if ((errno == EAGAIN) || (errno == EWOULDBLOCK))
    {
      Error_code sys_err_code;
      wait_until_ready(get_logger(), dst.native_handle(), Readiness::S_WRITABLE, &sys_err_code);
      if (sys_err_code)
      {
        return Failed{ n_total, sys_err_code };
      }
      continue;
    }
    // else

    const int err = errno;
    if (n_total == 0)
    {
      switch (err)
      {
      case ENOSYS:
        FLOW_LOG_INFO("Send-file: sendfile() is not available; memoizing for this process.");
        m_cache->mark_absent(OP);
        return Not_applicable{ 0 };
      case EOPNOTSUPP:
        FLOW_LOG_INFO("Send-file [" << src << "] => [" << dst << "]: Unsupported for this device pairing; "
                      "memoizing.");
        m_cache->mark_unsupported(OP, src.device(), dst.device());
        return Not_applicable{ 0 };
      case EINVAL:
        FLOW_LOG_TRACE("Send-file [" << src << "] => [" << dst << "]: Declined by kernel (EINVAL); "
                       "deferring to other strategies.");
        return Not_applicable{ 0 };
      }
    }
    // else

    const Error_code sys_err_code(err, system_category());
    FLOW_LOG_WARNING("Send-file [" << src << "] => [" << dst << "]: Failed after [" << n_total << "] bytes.  "
                     "Details follow.");
    FLOW_ERROR_SYS_ERROR_LOG_WARNING();
    return Failed{ n_total, sys_err_code };
  } // while (n_total != max_n)

  FLOW_LOG_TRACE("Send-file [" << src << "] => [" << dst << "]: Done; moved [" << n_total << "].");
  return Completed{ n_total };
} // Send_file_selector::operator()()

} // namespace xfer::transfer
