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

#include "xfer/util/native_handle.hpp"
#include "xfer/util/util_fwd.hpp"
#include <limits>
#include <variant>

/**
 * Flow-Xfer module providing bulk transfer of bytes from one caller-owned descriptor (the *source*) to another
 * (the *destination*).  See namespace ::xfer doc header for an overview.  A synopsis follows.
 *
 * The user wraps each descriptor in an Endpoint, which classifies it once (regular file, pipe, stream socket, or
 * other) and records the properties that matter for acceleration (append-mode, file identity, ...).  Then the user
 * invokes Copier::copy() with the destination and either the source Endpoint (copy until end-of-data) or a
 * Limited_source wrapping it (copy at most N bytes; the remaining count is decremented by exactly what was moved).
 *
 * Internally Copier tries, in a fixed priority order and subject to each one's eligibility rules, the *selectors*:
 *   -# Range_copy_selector: `copy_file_range()`, file to file, entirely in-kernel (possibly reflink-fast).
 *   -# Send_file_selector: `sendfile()`, from a file to nearly anything.
 *   -# Splice_selector: `splice()`, when a pipe is involved or the source is a stream socket (through a private
 *      pipe in the latter case).
 *
 * ...and finally buffered_copy(), the plain `read()`/`write()` loop.  Each selector returns a Selector_result
 * saying whether it did the job (Completed), failed after taking ownership (Failed), or does not apply
 * (Not_applicable).  The results are byte-for-byte identical to buffered_copy() in all cases; that function is
 * also the oracle in the unit tests.
 *
 * The set of selectors used by a Copier can be replaced at construction (see Selectors); this is how the unit tests
 * observe which paths were attempted, and how one could substitute instrumented or alternative implementations.
 */
namespace xfer::transfer
{

// Types.

// Find doc headers near the bodies of these compound types.

class Endpoint;
class Limited_source;
class Copier;
class Range_copy_selector;
class Send_file_selector;
class Splice_selector;
class Unsupported_op_cache;
struct Selectors;
struct Not_applicable;
struct Completed;
struct Failed;

/// Convenience alias for the commonly used type util::Native_handle.
using Native_handle = util::Native_handle;

/**
 * Classification of a descriptor, as determined by Endpoint (a/k/a classify()).  Selector eligibility depends on it.
 */
enum class Endpoint_kind
{
  /// A seekable regular file.
  S_REGULAR_FILE,

  /// A pipe or FIFO (either end).
  S_PIPE,

  /// A connected (or not) socket of type `SOCK_STREAM`; Unix-domain or TCP.
  S_STREAM_SOCKET,

  /**
   * Anything else: terminals and other character devices, datagram sockets, directories, and anything whose type
   * could not be determined.  Only the generic buffered_copy() loop is used for such an endpoint (unless the other
   * endpoint makes a selector applicable that is fine with it -- e.g., a terminal destination of a splice).
   */
  S_OTHER
}; // enum class Endpoint_kind

/// Identifies an accelerated operation, e.g., for Unsupported_op_cache bookkeeping and for logging.
enum class Accelerated_op
{
  /// `copy_file_range()`.  See Range_copy_selector.
  S_RANGE_COPY,

  /// `sendfile()`.  See Send_file_selector.
  S_SEND_FILE,

  /// `splice()`.  See Splice_selector.
  S_SPLICE,

  /// Sentinel: not a valid value.  May be used to, e.g., size an `array<>` mapping from Accelerated_op.
  S_END_SENTINEL
}; // enum class Accelerated_op

/**
 * The result of a selector invocation: exactly one of Not_applicable, Completed, Failed.
 * See those `struct`s' doc headers.
 */
using Selector_result = std::variant<Not_applicable, Completed, Failed>;

/**
 * The signature of a selector, as stored in Selectors.  Args: destination, source, max number of bytes to move
 * (#S_UNLIMITED means until end-of-data).
 */
using Selector_func = Function<Selector_result (const Endpoint& dst, const Endpoint& src, uint64_t max_n)>;

// Constants.

/// Value for a byte count meaning "no limit": move until end-of-data.
constexpr uint64_t S_UNLIMITED = std::numeric_limits<uint64_t>::max();

// Free functions.

/**
 * Prints string representation of the given Endpoint_kind to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Endpoint_kind val);

/**
 * Prints string representation of the given Accelerated_op to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Accelerated_op val);

/**
 * Prints string representation of the given Endpoint to the given `ostream`.
 *
 * @relatesalso Endpoint
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Endpoint& val);

/**
 * Prints string representation of the given Limited_source to the given `ostream`.
 *
 * @relatesalso Limited_source
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Limited_source& val);

/**
 * Prints string representation of the given Selector_result to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Selector_result& val);

/**
 * Prints string representation of the given Copier to the given `ostream`.
 *
 * @relatesalso Copier
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Copier& val);

} // namespace xfer::transfer
