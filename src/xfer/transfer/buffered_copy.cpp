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
#include "xfer/transfer/buffered_copy.hpp"
#include "xfer/transfer/error.hpp"
#include "xfer/transfer/detail/fd_io.hpp"
#include <flow/error/error.hpp>
#include <flow/util/blob.hpp>
#include <algorithm>

namespace xfer::transfer
{

// Implementations.

uint64_t buffered_copy(flow::log::Logger* logger_ptr, const Endpoint& dst, const Endpoint& src, uint64_t max_n,
                       size_t buf_sz, Error_code* err_code)
{
  using util::Blob_mutable;
  using util::Blob_const;
  using flow::util::Blob;
  using std::min;

  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(uint64_t, buffered_copy, logger_ptr, dst, src, max_n, buf_sz, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  assert(buf_sz != 0);

  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_TRANSFER);

  if ((!dst.valid()) || (!src.valid()))
  {
    FLOW_LOG_WARNING("Buffered copy [" << src << "] => [" << dst << "]: Invalid endpoint.");
    *err_code = error::Code::S_INVALID_ARGUMENT;
    return 0;
  }
  // else
  if (max_n == 0)
  {
    err_code->clear();
    return 0;
  }
  // else

  // Don't allocate the full buffer for a tiny limit.
  Blob buf(logger_ptr, size_t(min<uint64_t>(buf_sz, max_n)));

  FLOW_LOG_TRACE("Buffered copy [" << src << "] => [" << dst << "]: Starting; limit [" << max_n << "]; "
                 "buffer size [" << buf.size() << "].");

  uint64_t n_total = 0;
  while (n_total != max_n)
  {
    const auto n_to_rcv = size_t(min<uint64_t>(max_n - n_total, buf.size()));
    const auto n_rcvd = fd_io::read_some(logger_ptr, src.native_handle(), Blob_mutable(buf.data(), n_to_rcv),
                                         err_code);
    if (*err_code)
    {
      return n_total;
    }
    // else
    if (n_rcvd == 0)
    {
      break; // End of source.
    }
    // else

    n_total += fd_io::write_all(logger_ptr, dst.native_handle(), Blob_const(buf.data(), n_rcvd), err_code);
    if (*err_code)
    {
      return n_total;
    }
  } // while (n_total != max_n)

  FLOW_LOG_TRACE("Buffered copy [" << src << "] => [" << dst << "]: Done; moved [" << n_total << "].");
  err_code->clear();
  return n_total;
} // buffered_copy()

} // namespace xfer::transfer
