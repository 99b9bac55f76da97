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
#pragma once

#include "xfer/transfer/endpoint.hpp"

namespace xfer::transfer
{

// Types.

/**
 * A source Endpoint paired with a count of bytes that may still be read from it: the *limit*.  Pass a pointer to
 * one to Copier::copy() to transfer at most that many bytes; the count is then decremented by exactly the number of
 * bytes moved (and so can be reused across consecutive copies as a running budget).  When remaining() reaches 0,
 * further copies return 0 immediately, touching no descriptor.
 *
 * Not thread-safe: a Limited_source is meant to be used by one copy at a time.
 */
class Limited_source
{
public:
  // Constructors/destructor.

  /**
   * Constructs the tracker.
   *
   * @param src
   *        Source endpoint.  Copied (it is a light-weight value).
   * @param limit
   *        Initial remaining() value.  May be 0.
   */
  explicit Limited_source(const Endpoint& src, uint64_t limit);

  // Methods.

  /**
   * The source endpoint.
   * @return See above.
   */
  const Endpoint& source() const;

  /**
   * Bytes that may still be moved out of source().
   * @return See above.
   */
  uint64_t remaining() const;

  /**
   * `remaining() == 0`.
   * @return See above.
   */
  bool exhausted() const;

  /**
   * Records that `n` bytes have been moved out of source().  `n` must not exceed remaining(), or behavior is
   * undefined (assertion may trip).
   *
   * @param n
   *        Byte count.
   */
  void consume(uint64_t n);

private:
  // Data.

  /// See source().
  Endpoint m_src;

  /// See remaining().
  uint64_t m_remaining;
}; // class Limited_source

} // namespace xfer::transfer
