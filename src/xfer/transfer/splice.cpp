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
#include "xfer/transfer/splice.hpp"
#include "xfer/transfer/unsupported_op_cache.hpp"
#include "xfer/transfer/detail/private_pipe.hpp"
#include "xfer/transfer/detail/fd_io.hpp"
#include <flow/error/error.hpp>
#include <flow/util/blob.hpp>
#include <algorithm>
#include <fcntl.h>
#include <sys/ioctl.h>

namespace xfer::transfer
{

// Splice_selector implementations.

Splice_selector::Splice_selector(flow::log::Logger* logger_ptr, size_t max_chunk_sz, Unsupported_op_cache* cache) :
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSFER),
  m_max_chunk_sz(max_chunk_sz),
  m_cache(cache ? cache : &Unsupported_op_cache::process_wide())
{
  assert(m_max_chunk_sz != 0);
}

bool Splice_selector::eligible(const Endpoint& dst, const Endpoint& src) // Static.
{
  if ((!dst.valid()) || (!src.valid()))
  {
    return false;
  }
  // else
  if ((dst.kind() == Endpoint_kind::S_REGULAR_FILE) && dst.append_mode())
  {
    return false;
  }
  // else
  return (dst.kind() == Endpoint_kind::S_PIPE) || (src.kind() == Endpoint_kind::S_PIPE)
         || (src.kind() == Endpoint_kind::S_STREAM_SOCKET);
}

Selector_result Splice_selector::operator()(const Endpoint& dst, const Endpoint& src, uint64_t max_n) const
{
  assert(max_n != 0);

  if (!eligible(dst, src))
  {
    return Not_applicable{ 0 };
  }
  // else
  if (m_cache->absent(Accelerated_op::S_SPLICE))
  {
    FLOW_LOG_TRACE("Splice [" << src << "] => [" << dst << "]: Memoized as unsupported; skipping.");
    return Not_applicable{ 0 };
  }
  // else

  const bool direct = (dst.kind() == Endpoint_kind::S_PIPE) || (src.kind() == Endpoint_kind::S_PIPE);
  FLOW_LOG_TRACE("Splice [" << src << "] => [" << dst << "]: Starting in [" << (direct ? "direct" : "two-stage")
                 << "] mode; limit [" << max_n << "].");

  return direct ? splice_direct(dst, src, max_n) : splice_via_pipe(dst, src, max_n);
}

size_t Splice_selector::pipe_pending(int pipe_fd) // Static.
{
  using ::ioctl;

  int n_pending = 0;
  if (ioctl(pipe_fd, FIONREAD, &n_pending) == -1)
  {
    return 0;
  }
  // else
  return (n_pending > 0) ? size_t(n_pending) : 0;
}

Selector_result Splice_selector::splice_direct(const Endpoint& dst, const Endpoint& src, uint64_t max_n) const
{
  using util::Readiness;
  using boost::system::system_category;
  using std::min;
  using ::splice;
  using ::ssize_t;
  // using ::errno; // It's a macro apparently.

  const auto src_fd = src.native_handle().m_native_handle;
  const auto dst_fd = dst.native_handle().m_native_handle;

  uint64_t n_total = 0;
  while (n_total != max_n)
  {
    const auto chunk_sz = size_t(min<uint64_t>(max_n - n_total, m_max_chunk_sz));
    const ssize_t n = splice(src_fd, nullptr, dst_fd, nullptr, chunk_sz, SPLICE_F_MOVE | SPLICE_F_NONBLOCK);
    if (n > 0)
    {
      n_total += uint64_t(n);
      FLOW_LOG_TRACE("Splice: Chunk of [" << n << "] (of max [" << chunk_sz << "]); total [" << n_total << "].");
      continue;
    }
    // else
    if (n == 0)
    {
      /* From a pipe, 0 means end-of-data only if the pipe is empty; with bytes still buffered it is the
       * destination declining for now (terminals do this).  Wait for the destination, and retry. */
      if ((src.kind() == Endpoint_kind::S_PIPE) && (pipe_pending(src_fd) != 0))
      {
        FLOW_LOG_TRACE("Splice: Returned 0 with bytes pending in source pipe; awaiting destination.");
        Error_code sys_err_code;
        await(dst, Readiness::S_WRITABLE, &sys_err_code);
        if (sys_err_code)
        {
          return Failed{ n_total, sys_err_code };
        }
        continue;
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
    if (errno == EAGAIN)
    {
      // Either side may be the reason.  Wait for both; then retry.
      Error_code sys_err_code;
      await(src, Readiness::S_READABLE, &sys_err_code);
      if (!sys_err_code)
      {
        await(dst, Readiness::S_WRITABLE, &sys_err_code);
      }
      if (sys_err_code)
      {
        return Failed{ n_total, sys_err_code };
      }
      continue;
    }
    // else

    const int err = errno;
    if ((n_total == 0) && unsupported_errno(err, dst, src))
    {
      return Not_applicable{ 0 };
    }
    // else

    const Error_code sys_err_code(err, system_category());
    FLOW_LOG_WARNING("Splice [" << src << "] => [" << dst << "]: Failed after [" << n_total << "] bytes.  "
                     "Details follow.");
    FLOW_ERROR_SYS_ERROR_LOG_WARNING();
    return Failed{ n_total, sys_err_code };
  } // while (n_total != max_n)

  FLOW_LOG_TRACE("Splice [" << src << "] => [" << dst << "]: Done; moved [" << n_total << "].");
  return Completed{ n_total };
} // Splice_selector::splice_direct()

Selector_result Splice_selector::splice_via_pipe(const Endpoint& dst, const Endpoint& src, uint64_t max_n) const
{
  using util::Readiness;
  using util::Blob_mutable;
  using util::Blob_const;
  using flow::util::Blob;
  using boost::system::system_category;
  using std::min;
  using ::splice;
  using ::ssize_t;
  // using ::errno; // It's a macro apparently.

  Error_code sys_err_code;
  Private_pipe pipe(get_logger(), m_max_chunk_sz, &sys_err_code);
  if (sys_err_code)
  {
    return Failed{ 0, sys_err_code };
  }
  // else

  const auto src_fd = src.native_handle().m_native_handle;
  const auto dst_fd = dst.native_handle().m_native_handle;
  const auto pipe_rd_fd = pipe.read_end().m_native_handle;
  const auto pipe_wr_fd = pipe.write_end().m_native_handle;

  uint64_t n_total = 0; // Bytes in destination.
  while (n_total != max_n)
  {
    // Drain: source => (empty) pipe.  Never take more from the source than the limit allows.
    const auto drain_sz = size_t(min<uint64_t>(max_n - n_total, pipe.capacity()));
    const ssize_t n_drained = splice(src_fd, nullptr, pipe_wr_fd, nullptr, drain_sz,
                                     SPLICE_F_MOVE | SPLICE_F_NONBLOCK);
    if (n_drained == 0)
    {
      break; // End of source.
    }
    // else
    if (n_drained == -1)
    {
      if (errno == EINTR)
      {
        continue;
      }
      // else
      if (errno == EAGAIN)
      {
        // Pipe is empty, so it must be the source.
        await(src, Readiness::S_READABLE, &sys_err_code);
        if (sys_err_code)
        {
          return Failed{ n_total, sys_err_code };
        }
        continue;
      }
      // else

      const int err = errno;
      if ((n_total == 0) && unsupported_errno(err, dst, src))
      {
        return Not_applicable{ 0 };
      }
      // else
      sys_err_code = Error_code(err, system_category());
      FLOW_LOG_WARNING("Splice [" << src << "] => [" << dst << "]: Drain failed after [" << n_total << "] bytes.  "
                       "Details follow.");
      FLOW_ERROR_SYS_ERROR_LOG_WARNING();
      return Failed{ n_total, sys_err_code };
    } // if (n_drained == -1)
    // else

    FLOW_LOG_TRACE("Splice: Drained [" << n_drained << "] (of max [" << drain_sz << "]) into private pipe.");

    // Pump: pipe => destination, until pipe is empty.
    auto n_in_pipe = size_t(n_drained);
    while (n_in_pipe != 0)
    {
      const ssize_t n_pumped = splice(pipe_rd_fd, nullptr, dst_fd, nullptr, n_in_pipe,
                                      SPLICE_F_MOVE | SPLICE_F_NONBLOCK);
      if (n_pumped > 0)
      {
        n_in_pipe -= size_t(n_pumped);
        n_total += uint64_t(n_pumped);
        FLOW_LOG_TRACE("Splice: Pumped [" << n_pumped << "]; [" << n_in_pipe << "] left in pipe; "
                       "total [" << n_total << "].");
        continue;
      }
      // else
      if ((n_pumped == 0) || (errno == EAGAIN))
      {
        /* 0 with bytes still in the pipe is not end-of-anything (terminals do this); like EAGAIN,
         * wait for the destination and retry. */
        if (n_pumped == 0)
        {
          FLOW_LOG_TRACE("Splice: Pump returned 0 with [" << n_in_pipe << "] bytes pending; awaiting destination.");
        }
        await(dst, Readiness::S_WRITABLE, &sys_err_code);
        if (sys_err_code)
        {
          return Failed{ n_total, sys_err_code };
        }
        continue;
      }
      // else
      if (errno == EINTR)
      {
        continue;
      }
      // else

      const int err = errno;
      if ((err == EINVAL) || (err == ENOSYS) || (err == EOPNOTSUPP))
      {
        /* The destination won't take splice() after all; but the source bytes are already in our pipe.
         * Rescue them with plain I/O; then let the generic loop do the rest. */
        FLOW_LOG_INFO("Splice [" << src << "] => [" << dst << "]: Destination rejects splice() "
                      "(errno [" << err << "]); rescuing [" << n_in_pipe << "] bytes from private pipe; "
                      "then deferring to other strategies.");
        if (err == ENOSYS)
        {
          m_cache->mark_absent(Accelerated_op::S_SPLICE);
        }

        Blob buf(get_logger(), n_in_pipe);
        while (n_in_pipe != 0)
        {
          const auto n_rcvd = fd_io::read_some(get_logger(), pipe.read_end(),
                                               Blob_mutable(buf.data(), n_in_pipe), &sys_err_code);
          if (sys_err_code)
          {
            return Failed{ n_total, sys_err_code };
          }
          // else
          assert((n_rcvd != 0) && "Our own pipe cannot be at end-of-data while we know it holds bytes.");

          const auto n_sent = fd_io::write_all(get_logger(), dst.native_handle(),
                                               Blob_const(buf.data(), n_rcvd), &sys_err_code);
          n_total += n_sent;
          if (sys_err_code)
          {
            return Failed{ n_total, sys_err_code };
          }
          // else
          n_in_pipe -= n_rcvd;
        }

        return Not_applicable{ n_total };
      } // if (err is an unsupported-type errno)
      // else

      sys_err_code = Error_code(err, system_category());
      FLOW_LOG_WARNING("Splice [" << src << "] => [" << dst << "]: Pump failed after [" << n_total << "] bytes "
                       "with [" << n_in_pipe << "] bytes still in private pipe.  Details follow.");
      FLOW_ERROR_SYS_ERROR_LOG_WARNING();
      return Failed{ n_total, sys_err_code };
    } // while (n_in_pipe != 0)
  } // while (n_total != max_n)

  FLOW_LOG_TRACE("Splice [" << src << "] => [" << dst << "]: Done; moved [" << n_total << "].");
  return Completed{ n_total };
} // Splice_selector::splice_via_pipe()

void Splice_selector::await(const Endpoint& ep, util::Readiness readiness, Error_code* err_code) const
{
  if (ep.kind() == Endpoint_kind::S_REGULAR_FILE)
  {
    err_code->clear();
    return;
  }
  // else
  util::wait_until_ready(get_logger(), ep.native_handle(), readiness, err_code);
}

bool Splice_selector::unsupported_errno(int err, const Endpoint& dst, const Endpoint& src) const
{
  switch (err)
  {
  case ENOSYS:
    FLOW_LOG_INFO("Splice: splice() is not available; memoizing for this process.");
    m_cache->mark_absent(Accelerated_op::S_SPLICE);
    return true;
  case EINVAL:
  case EOPNOTSUPP:
    FLOW_LOG_TRACE("Splice [" << src << "] => [" << dst << "]: Declined by kernel (errno [" << err << "]); "
                   "deferring to other strategies.");
    return true;
  }
  return false;
}

} // namespace xfer::transfer
