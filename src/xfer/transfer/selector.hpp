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

#include "xfer/transfer/transfer_fwd.hpp"

namespace xfer::transfer
{

// Types.

/**
 * Selector_result alternative: the selector does not apply to this pair of endpoints (or discovered, by trying,
 * that the kernel will not do it); Copier should try the next strategy.  Usually #m_n_moved is 0; but a selector
 * may have moved some bytes before hitting the unsupported condition (e.g., Splice_selector rescuing bytes stranded
 * in its private pipe), in which case Copier accounts for them and continues with the rest.
 */
struct Not_applicable
{
  /// Bytes moved before inapplicability was discovered.
  uint64_t m_n_moved;
};

/**
 * Selector_result alternative: the selector handled the transfer successfully; it moved #m_n_moved bytes, stopping
 * at end-of-data or at the limit.
 */
struct Completed
{
  /// Bytes moved.
  uint64_t m_n_moved;
};

/**
 * Selector_result alternative: the selector took ownership of the transfer and it failed with #m_err_code after
 * #m_n_moved bytes.  Copier surfaces this as-is; it does not fall back.
 */
struct Failed
{
  /// Bytes moved before the failure.
  uint64_t m_n_moved;

  /// The failure; always truthy.
  Error_code m_err_code;
};

/**
 * The three accelerated strategies used by a Copier, in the order it considers them.  Each is any callable with the
 * #Selector_func signature.  Copier::default_selectors() returns the real ones (Range_copy_selector,
 * Send_file_selector, Splice_selector); a user (most notably a unit test) can wrap or replace any of them, e.g., to
 * count invocations or inject a Failed result, and pass the result to the Copier ctor.  There is no global
 * registry: whatever a Copier was constructed with is what it uses for its lifetime.
 *
 * An empty `Function` member means that strategy is never attempted.
 */
struct Selectors
{
  // Data.

  /// Tried first: file to file.
  Selector_func m_range_copy;

  /// Tried second: from a file.
  Selector_func m_send_file;

  /// Tried third: pipes and stream sockets.
  Selector_func m_splice;
};

// Free functions.

/**
 * Returns `true` if and only if the result is Completed or Failed: the selector fully owns the outcome.
 *
 * @param result
 *        A selector result.
 * @return See above.
 */
bool handled(const Selector_result& result);

/**
 * The byte count in whichever alternative `result` holds.
 *
 * @param result
 *        A selector result.
 * @return See above.
 */
uint64_t n_moved(const Selector_result& result);

} // namespace xfer::transfer
