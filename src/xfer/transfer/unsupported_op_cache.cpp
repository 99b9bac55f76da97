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
#include "xfer/transfer/unsupported_op_cache.hpp"
#include <boost/functional/hash/hash.hpp>

namespace xfer::transfer
{

// Unsupported_op_cache implementations.

Unsupported_op_cache::Unsupported_op_cache()
{
  m_absent.fill(false);
}

Unsupported_op_cache& Unsupported_op_cache::process_wide() // Static.
{
  // Never destroyed; a transfer may still be running in some thread during static destruction.
  static Unsupported_op_cache* const S_CACHE = new Unsupported_op_cache;
  return *S_CACHE;
}

bool Unsupported_op_cache::unsupported(Accelerated_op op, dev_t src_dev, dev_t dst_dev) const
{
  using flow::util::Lock_guard;

  assert(op != Accelerated_op::S_END_SENTINEL);

  Lock_guard<decltype(m_mutex)> lock(m_mutex);
  return m_absent[size_t(op)] || (m_pairings.count(Pairing{ op, src_dev, dst_dev }) != 0);
}

void Unsupported_op_cache::mark_unsupported(Accelerated_op op, dev_t src_dev, dev_t dst_dev)
{
  using flow::util::Lock_guard;

  assert(op != Accelerated_op::S_END_SENTINEL);

  Lock_guard<decltype(m_mutex)> lock(m_mutex);
  m_pairings.insert(Pairing{ op, src_dev, dst_dev });
}

void Unsupported_op_cache::mark_absent(Accelerated_op op)
{
  using flow::util::Lock_guard;

  assert(op != Accelerated_op::S_END_SENTINEL);

  Lock_guard<decltype(m_mutex)> lock(m_mutex);
  m_absent[size_t(op)] = true;
}

bool Unsupported_op_cache::absent(Accelerated_op op) const
{
  using flow::util::Lock_guard;

  assert(op != Accelerated_op::S_END_SENTINEL);

  Lock_guard<decltype(m_mutex)> lock(m_mutex);
  return m_absent[size_t(op)];
}

void Unsupported_op_cache::clear()
{
  using flow::util::Lock_guard;

  Lock_guard<decltype(m_mutex)> lock(m_mutex);
  m_pairings.clear();
  m_absent.fill(false);
}

size_t Unsupported_op_cache::size() const
{
  using flow::util::Lock_guard;

  Lock_guard<decltype(m_mutex)> lock(m_mutex);
  return m_pairings.size();
}

size_t Unsupported_op_cache::Pairing_hash::operator()(const Pairing& val) const
{
  using boost::hash_combine;

  size_t seed = 0;
  hash_combine(seed, int(val.m_op));
  hash_combine(seed, uint64_t(val.m_src_dev));
  hash_combine(seed, uint64_t(val.m_dst_dev));
  return seed;
}

bool Unsupported_op_cache::Pairing_equal::operator()(const Pairing& val1, const Pairing& val2) const
{
  return (val1.m_op == val2.m_op) && (val1.m_src_dev == val2.m_src_dev) && (val1.m_dst_dev == val2.m_dst_dev);
}

std::ostream& operator<<(std::ostream& os, Accelerated_op val)
{
  switch (val)
  {
  case Accelerated_op::S_RANGE_COPY:
    return os << "copy_file_range";
  case Accelerated_op::S_SEND_FILE:
    return os << "sendfile";
  case Accelerated_op::S_SPLICE:
    return os << "splice";
  case Accelerated_op::S_END_SENTINEL:
    break;
  }
  assert(false);
  return os;
}

} // namespace xfer::transfer
