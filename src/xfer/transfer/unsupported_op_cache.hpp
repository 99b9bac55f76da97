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
#include <boost/unordered_set.hpp>
#include <array>
#include <sys/types.h>

namespace xfer::transfer
{

// Types.

/**
 * Thread-safe memo of accelerated operations that were discovered, by actually trying them, not to work: either
 * for a specific (source device, destination device) pairing (e.g., `copy_file_range()` yielding `EXDEV` across
 * filesystems on an older kernel), or for the whole process (e.g., `ENOSYS`: the system call does not exist).
 * The selectors consult it before trying an operation and record into it after a memoizable failure, so that
 * subsequent transfers skip the doomed attempt.
 *
 * It is purely a performance hint: a stale or cleared entry can only cost one extra failed system call, which is
 * handled exactly as the first time.
 *
 * A process-wide instance, process_wide(), is what Copier uses by default.  Tests can create their own instance
 * (or clear() the process-wide one) to avoid interference.
 *
 * ### Thread safety ###
 * All methods may be invoked concurrently with each other on the same object.
 */
class Unsupported_op_cache
{
public:
  // Constructors/destructor.

  /// Constructs an empty cache.
  Unsupported_op_cache();

  // Methods.

  /**
   * The process-wide instance.  Never destroyed before exit.
   * @return See above.
   */
  static Unsupported_op_cache& process_wide();

  /**
   * Returns `true` if and only if the given op was memoized as unsupported for the given pairing, or for the
   * entire process.
   *
   * @param op
   *        The operation.
   * @param src_dev
   *        Device of the source endpoint (Endpoint::device()).
   * @param dst_dev
   *        Device of the destination endpoint.
   * @return See above.
   */
  bool unsupported(Accelerated_op op, dev_t src_dev, dev_t dst_dev) const;

  /**
   * Memoizes that `op` does not work for the given pairing.
   *
   * @param op
   *        The operation.
   * @param src_dev
   *        See unsupported().
   * @param dst_dev
   *        See unsupported().
   */
  void mark_unsupported(Accelerated_op op, dev_t src_dev, dev_t dst_dev);

  /**
   * Memoizes that `op` does not work anywhere in this process (e.g., the system call is absent).
   *
   * @param op
   *        The operation.
   */
  void mark_absent(Accelerated_op op);

  /**
   * Returns `true` if and only if mark_absent() was called for `op` (since the last clear()).
   *
   * @param op
   *        The operation.
   * @return See above.
   */
  bool absent(Accelerated_op op) const;

  /// Forgets everything.
  void clear();

  /**
   * Number of memoized (op, pairing) entries; not counting mark_absent() ones.
   * @return See above.
   */
  size_t size() const;

private:
  // Types.

  /// Key of #m_pairings.
  struct Pairing
  {
    /// The op.
    Accelerated_op m_op;
    /// Source device.
    dev_t m_src_dev;
    /// Destination device.
    dev_t m_dst_dev;
  };

  /// Hasher for Pairing.
  struct Pairing_hash
  {
    /**
     * Computes the hash.
     * @param val
     *        Key.
     * @return See above.
     */
    size_t operator()(const Pairing& val) const;
  };

  /// Equality for Pairing.
  struct Pairing_equal
  {
    /**
     * Compares.
     * @param val1
     *        Key.
     * @param val2
     *        Key.
     * @return See above.
     */
    bool operator()(const Pairing& val1, const Pairing& val2) const;
  };

  // Data.

  /// Protects the other data members.
  mutable flow::util::Mutex_non_recursive m_mutex;

  /// Memoized (op, pairing) failures.
  boost::unordered_set<Pairing, Pairing_hash, Pairing_equal> m_pairings;

  /// `m_absent[size_t(op)]` is `true` if and only if mark_absent(op) was called.
  std::array<bool, size_t(Accelerated_op::S_END_SENTINEL)> m_absent;
}; // class Unsupported_op_cache

} // namespace xfer::transfer
