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
#include "xfer/transfer/copier.hpp"
#include "xfer/transfer/error.hpp"
#include <flow/error/error.hpp>

namespace xfer::transfer
{

// Copier::Config implementations.

Copier::Config::Config() :
  m_range_copy_max_chunk_sz(Range_copy_selector::S_DEFAULT_MAX_CHUNK_SZ),
  m_send_file_max_chunk_sz(Send_file_selector::S_DEFAULT_MAX_CHUNK_SZ),
  m_splice_max_chunk_sz(Splice_selector::S_DEFAULT_MAX_CHUNK_SZ),
  m_buffer_sz(S_DEFAULT_BUFFER_SZ),
  m_range_copy_enabled(true),
  m_send_file_enabled(true),
  m_splice_enabled(true)
{
  // That's it.
}

// Copier implementations.

Copier::Copier(flow::log::Logger* logger_ptr, const Config& config) :
  Copier(logger_ptr, config, default_selectors(logger_ptr, config))
{
  // Cool.
}

Copier::Copier(flow::log::Logger* logger_ptr, const Config& config, Selectors selectors) :
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSFER),
  m_config(config),
  m_selectors(std::move(selectors))
{
  assert(m_config.m_buffer_sz != 0);

  FLOW_LOG_INFO("Copier [" << *this << "]: Created with config [" << m_config << "]; "
                "selectors present: range-copy [" << bool(m_selectors.m_range_copy) << "], "
                "send-file [" << bool(m_selectors.m_send_file) << "], "
                "splice [" << bool(m_selectors.m_splice) << "].");
}

Selectors Copier::default_selectors(flow::log::Logger* logger_ptr, const Config& config,
                                    Unsupported_op_cache* cache) // Static.
{
  Selectors selectors;
  selectors.m_range_copy = Range_copy_selector(logger_ptr, config.m_range_copy_max_chunk_sz, cache);
  selectors.m_send_file = Send_file_selector(logger_ptr, config.m_send_file_max_chunk_sz, cache);
  selectors.m_splice = Splice_selector(logger_ptr, config.m_splice_max_chunk_sz, cache);
  return selectors;
}

const Copier::Config& Copier::config() const
{
  return m_config;
}

uint64_t Copier::copy(const Endpoint& dst, const Endpoint& src, Error_code* err_code) const
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(uint64_t, Copier::copy, dst, src, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  return copy_impl(dst, src, S_UNLIMITED, err_code);
}

uint64_t Copier::copy(const Endpoint& dst, Limited_source* src, Error_code* err_code) const
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(uint64_t, Copier::copy, dst, src, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  assert(src);

  // An exhausted limit still gets its endpoints validated first; copy_impl() then returns 0 for max_n == 0.
  const auto n = copy_impl(dst, src->source(), src->remaining(), err_code);
  src->consume(n);
  return n;
}

uint64_t Copier::copy_impl(const Endpoint& dst, const Endpoint& src, uint64_t max_n, Error_code* err_code) const
{
  assert(err_code);

  if ((!dst.valid()) || (!src.valid()))
  {
    FLOW_LOG_WARNING("Copier [" << *this << "]: Asked to copy [" << src << "] => [" << dst << "], but at least one "
                     "endpoint is null or closed.  Refusing.");
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

  const bool self = dst.same_file(src);

  FLOW_LOG_TRACE("Copier [" << *this << "]: Copy [" << src << "] => [" << dst << "]; limit "
                 "[" << ((max_n == S_UNLIMITED) ? std::string("none") : std::to_string(max_n)) << "]; "
                 "same-file [" << self << "].");

  uint64_t n_total = 0;
  bool done = false;

  /* Invokes the given selector; accounts for its bytes; returns true if and only if the transfer is over
   * (*err_code is then final). */
  const auto attempt = [&](const Selector_func& selector, Accelerated_op op) -> bool
  {
    const auto result = selector(dst, src, max_n - n_total);
    const auto n = n_moved(result);
    assert((n <= (max_n - n_total)) && "Selector moved more than the limit it was given.");
    n_total += n;

    FLOW_LOG_TRACE("Copier [" << *this << "]: Selector [" << op << "] result [" << result << "]; "
                   "total so far [" << n_total << "].");

    if (handled(result))
    {
      const auto failed = std::get_if<Failed>(&result);
      if (failed)
      {
        *err_code = failed->m_err_code;
      }
      else
      {
        err_code->clear();
      }
      return true;
    }
    // else: Not_applicable.  Limit may have been reached anyway.
    if (n_total == max_n)
    {
      err_code->clear();
      return true;
    }
    return false;
  }; // const auto attempt =

  if (m_config.m_range_copy_enabled && m_selectors.m_range_copy && Range_copy_selector::eligible(dst, src))
  {
    done = attempt(m_selectors.m_range_copy, Accelerated_op::S_RANGE_COPY);
  }

  // Send-file through one file position would overwrite what it reads; the generic loop appends as expected.
  if ((!done) && m_config.m_send_file_enabled && m_selectors.m_send_file && (!self)
      && Send_file_selector::eligible(dst, src))
  {
    done = attempt(m_selectors.m_send_file, Accelerated_op::S_SEND_FILE);
  }

  if ((!done) && m_config.m_splice_enabled && m_selectors.m_splice && Splice_selector::eligible(dst, src))
  {
    done = attempt(m_selectors.m_splice, Accelerated_op::S_SPLICE);
  }

  if (!done)
  {
    FLOW_LOG_TRACE("Copier [" << *this << "]: Using buffered copy for the rest; limit "
                   "[" << ((max_n == S_UNLIMITED) ? max_n : (max_n - n_total)) << "].");
    n_total += buffered_copy(get_logger(), dst, src,
                             (max_n == S_UNLIMITED) ? S_UNLIMITED : (max_n - n_total),
                             m_config.m_buffer_sz, err_code);
  }

  if (*err_code)
  {
    FLOW_LOG_WARNING("Copier [" << *this << "]: Copy [" << src << "] => [" << dst << "] failed after "
                     "[" << n_total << "] bytes: [" << *err_code << "] [" << err_code->message() << "].");
  }
  else
  {
    FLOW_LOG_TRACE("Copier [" << *this << "]: Copy [" << src << "] => [" << dst << "] done; "
                   "moved [" << n_total << "].");
  }

  return n_total;
} // Copier::copy_impl()

std::ostream& operator<<(std::ostream& os, const Copier& val)
{
  return os << "Copier@" << static_cast<const void*>(&val);
}

std::ostream& operator<<(std::ostream& os, const Copier::Config& val)
{
  return os << "range-copy[" << (val.m_range_copy_enabled ? "on" : "off")
            << " chunk=" << val.m_range_copy_max_chunk_sz << "] "
            << "send-file[" << (val.m_send_file_enabled ? "on" : "off")
            << " chunk=" << val.m_send_file_max_chunk_sz << "] "
            << "splice[" << (val.m_splice_enabled ? "on" : "off")
            << " chunk=" << val.m_splice_max_chunk_sz << "] "
            << "buffer[" << val.m_buffer_sz << ']';
}

} // namespace xfer::transfer
