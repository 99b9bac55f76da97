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
#include "xfer/transfer/limited_source.hpp"

namespace xfer::transfer
{

// Limited_source implementations.

Limited_source::Limited_source(const Endpoint& src, uint64_t limit) :
  m_src(src),
  m_remaining(limit)
{
  // Nope.
}

const Endpoint& Limited_source::source() const
{
  return m_src;
}

uint64_t Limited_source::remaining() const
{
  return m_remaining;
}

bool Limited_source::exhausted() const
{
  return m_remaining == 0;
}

void Limited_source::consume(uint64_t n)
{
  assert((n <= m_remaining) && "Moved more bytes than the limit allowed: a bug in the caller or a selector.");
  m_remaining -= n;
}

std::ostream& operator<<(std::ostream& os, const Limited_source& val)
{
  return os << "[src " << val.source() << " remaining [" << val.remaining() << "]]";
}

} // namespace xfer::transfer
