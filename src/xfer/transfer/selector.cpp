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
#include "xfer/transfer/selector.hpp"

namespace xfer::transfer
{

// Implementations.

bool handled(const Selector_result& result)
{
  return !std::holds_alternative<Not_applicable>(result);
}

uint64_t n_moved(const Selector_result& result)
{
  return std::visit([](const auto& alt) -> uint64_t { return alt.m_n_moved; }, result);
}

std::ostream& operator<<(std::ostream& os, const Selector_result& val)
{
  if (const auto not_applicable = std::get_if<Not_applicable>(&val))
  {
    return os << "not-applicable[moved=" << not_applicable->m_n_moved << ']';
  }
  // else
  if (const auto completed = std::get_if<Completed>(&val))
  {
    return os << "completed[moved=" << completed->m_n_moved << ']';
  }
  // else
  const auto& failed = std::get<Failed>(val);
  return os << "failed[moved=" << failed.m_n_moved << " err=" << failed.m_err_code
            << " \"" << failed.m_err_code.message() << "\"]";
}

} // namespace xfer::transfer
