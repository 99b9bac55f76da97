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

#include <ostream>

namespace xfer::util
{

// Types.

/**
 * A caller-owned descriptor (FD) as a value: a regular file, a pipe end, a socket, a terminal, and so on.
 * Construct it from the `int`, e.g., `Native_handle hndl(some_fd)`; default construction yields `null() == true`.
 *
 * A Native_handle never owns the descriptor: copying it copies the number; destroying it closes nothing.
 * Everything in xfer::transfer operates on descriptors opened, positioned, and eventually closed by the user.
 */
struct Native_handle
{
  // Types.

  /// The native handle type: a POSIX descriptor.
  using handle_t = int;

  // Constants.

  /// The value for #m_native_handle such that `null() == true`.  No valid FD is negative.
  static constexpr handle_t S_NULL_HANDLE = -1;

  // Data.

  /// The descriptor, or #S_NULL_HANDLE.
  handle_t m_native_handle;

  // Constructors/destructor.

  /**
   * Constructs with given descriptor; or null if none given.
   *
   * @param native_handle
   *        Descriptor.
   */
  Native_handle(handle_t native_handle = S_NULL_HANDLE);

  // Methods.

  /**
   * Returns `true` if and only if #m_native_handle equals #S_NULL_HANDLE.  Note a non-null handle may still refer
   * to no open file; transfer::Endpoint finds that out.
   *
   * @return See above.
   */
  bool null() const;
}; // struct Native_handle

// Free functions.

/**
 * Returns `true` if and only if the two objects hold the same descriptor number.
 *
 * @relatesalso Native_handle
 *
 * @param val1
 *        Object.
 * @param val2
 *        Object.
 * @return See above.
 */
bool operator==(Native_handle val1, Native_handle val2);

/**
 * Negation of similar `==`.
 *
 * @relatesalso Native_handle
 *
 * @param val1
 *        Object.
 * @param val2
 *        Object.
 * @return See above.
 */
bool operator!=(Native_handle val1, Native_handle val2);

/**
 * Prints `fd[N]`, or `fd[null]`, to the given `ostream`.
 *
 * @relatesalso Native_handle
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Native_handle val);

} // namespace xfer::util
