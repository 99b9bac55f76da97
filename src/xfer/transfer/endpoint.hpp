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
#include <flow/log/log.hpp>
#include <sys/types.h>

namespace xfer::transfer
{

// Types.

/**
 * A caller-owned open descriptor (the *native handle*) together with what xfer::transfer needs to know about it
 * in order to pick a transfer strategy: its Endpoint_kind, whether it is in append-mode or non-blocking mode,
 * and its file identity (device and inode).  This info is probed exactly once, at construction, via `fstat()`,
 * `fcntl(F_GETFL)` and (for sockets) `getsockopt()`; the probe has no side effects on the descriptor.
 *
 * An Endpoint never owns, closes, or changes the mode of the descriptor.  It is a light-weight, copyable value;
 * its lifetime must not exceed the usefulness of the descriptor it describes.
 *
 * ### Null and closed ###
 * A default-constructed Endpoint is null() (no descriptor at all).  An Endpoint constructed on a descriptor that
 * turned out (`EBADF`) not to be open is closed().  Either way it is not valid(): Copier::copy() will refuse it
 * with error::Code::S_INVALID_ARGUMENT without doing any I/O.
 *
 * ### Staleness ###
 * Since the probe happens once, changing the descriptor's flags (e.g., `O_APPEND` or `O_NONBLOCK`) afterwards is
 * not reflected.  Construct a new Endpoint if that happens.  offset() on the other hand is always queried live.
 */
class Endpoint :
  public flow::log::Log_context
{
public:
  // Constructors/destructor.

  /// Constructs a null() endpoint; it is not valid() for any transfer.
  Endpoint();

  /**
   * Probes the given descriptor and constructs an Endpoint describing it.  Does not fail: if the descriptor is not
   * open, the result is closed(); if its type cannot be determined, kind() is Endpoint_kind::S_OTHER.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param hndl
   *        The descriptor.  May be `.null()`, in which case the result is null().
   */
  explicit Endpoint(flow::log::Logger* logger_ptr, Native_handle hndl);

  // Methods.

  /**
   * The descriptor, as given to the ctor.
   * @return See above.
   */
  Native_handle native_handle() const;

  /**
   * The classification.  Meaningless if `!valid()`.
   * @return See above.
   */
  Endpoint_kind kind() const;

  /**
   * `true` if and only if default-constructed (or constructed with a `.null()` descriptor).
   * @return See above.
   */
  bool null() const;

  /**
   * `true` if and only if a descriptor was given, but it was not open at probe time.
   * @return See above.
   */
  bool closed() const;

  /**
   * `!null() && !closed()`.
   * @return See above.
   */
  bool valid() const;

  /**
   * Whether the descriptor had `O_APPEND` at probe time.  An append-mode destination disables range-copy and
   * send-file acceleration: those write at the file position instead of the end.
   *
   * @return See above.
   */
  bool append_mode() const;

  /**
   * Whether the descriptor had `O_NONBLOCK` at probe time.
   * @return See above.
   */
  bool non_blocking() const;

  /**
   * Whether `kind() == Endpoint_kind::S_REGULAR_FILE`, so offset() is meaningful.
   * @return See above.
   */
  bool seekable() const;

  /**
   * Device ID (`st_dev`) of the underlying file (or pseudo-filesystem, for pipes/sockets).  Used for
   * the unsupported-op cache.  0 if `!valid()`.
   *
   * @return See above.
   */
  dev_t device() const;

  /**
   * Inode number (`st_ino`).  0 if `!valid()`.
   * @return See above.
   */
  ino_t inode() const;

  /**
   * Returns `true` if and only if `*this` and `other` are both valid() and refer to the same underlying file
   * (same device and inode), even via different descriptors.
   *
   * @param other
   *        The other endpoint.
   * @return See above.
   */
  bool same_file(const Endpoint& other) const;

  /**
   * Socket domain (`AF_UNIX`, `AF_INET`, `AF_INET6`, ...) if `kind() == Endpoint_kind::S_STREAM_SOCKET`;
   * else `AF_UNSPEC`.
   *
   * @return See above.
   */
  int socket_domain() const;

  /**
   * Whether the descriptor is a stream-oriented socket.  Equivalent to `kind() == Endpoint_kind::S_STREAM_SOCKET`.
   * @return See above.
   */
  bool is_stream() const;

  /**
   * Short network name of a stream socket: `"unix"`, `"tcp4"`, `"tcp6"`; or empty string if not a stream socket
   * (or some other domain).
   *
   * @return See above.
   */
  util::String_view network() const;

  /**
   * Returns the current file position of the descriptor, as reported live by `lseek(fd, 0, SEEK_CUR)`.
   * Meaningful only if seekable().
   *
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_INVALID_ARGUMENT (`!valid()`); system codes from `lseek()` (e.g., `ESPIPE`).
   * @return The offset; or 0 on error.
   */
  uint64_t offset(Error_code* err_code = 0) const;

private:
  // Data.

  /// See native_handle().
  Native_handle m_hndl;

  /// See closed().
  bool m_closed;

  /// See kind().
  Endpoint_kind m_kind;

  /// See append_mode().
  bool m_append_mode;

  /// See non_blocking().
  bool m_non_blocking;

  /// See device().
  dev_t m_device;

  /// See inode().
  ino_t m_inode;

  /// See socket_domain().
  int m_socket_domain;
}; // class Endpoint

// Free functions: in *_fwd.hpp.

/**
 * Equivalent to `Endpoint(logger_ptr, hndl)`.  Provided for readability at call sites that classify many
 * descriptors.
 *
 * @param logger_ptr
 *        Logger to use for logging subsequently.
 * @param hndl
 *        The descriptor.
 * @return See above.
 */
Endpoint classify(flow::log::Logger* logger_ptr, Native_handle hndl);

} // namespace xfer::transfer
