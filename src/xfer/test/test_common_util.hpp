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

#pragma once

#include <xfer/common.hpp>
#include <boost/asio.hpp>
#include <boost/core/noncopyable.hpp>
#include <string>
#include <type_traits>

namespace xfer::test
{

/**
 * Returns the name of the currently running gtest test suite and test, as `<suite>.<test>`; or empty string if
 * outside of a test.
 *
 * @return See above.
 */
std::string get_test_suite_name();

/**
 * Returns `n` pseudo-random bytes; the same `n` and `seed` always yield the same bytes.
 *
 * @param n
 *        Size.
 * @param seed
 *        Seed.
 * @return See above.
 */
std::string random_data(size_t n, unsigned int seed = 0);

/// Owns a raw descriptor: closes it on destruction.  Movable, not copyable.
class Scoped_fd :
  private boost::noncopyable
{
public:
  /**
   * Takes ownership of `fd`.
   * @param fd
   *        Descriptor or -1.
   */
  explicit Scoped_fd(int fd = -1);

  /**
   * Moves ownership from `src`, leaving it at -1.
   * @param src
   *        Source.
   */
  Scoped_fd(Scoped_fd&& src);

  /// Closes the descriptor, if any.
  ~Scoped_fd();

  /**
   * Closes ours, then takes `src`'s.
   * @param src
   *        Source.
   * @return `*this`.
   */
  Scoped_fd& operator=(Scoped_fd&& src);

  /**
   * The descriptor; -1 if none.
   * @return See above.
   */
  int get() const;

  /// Closes the descriptor now, if any.
  void reset();

private:
  /// See get().
  int m_fd;
}; // class Scoped_fd

/// A temporary regular file, created on construction and removed (and its descriptor closed) on destruction.
class Temp_file :
  private boost::noncopyable
{
public:
  /**
   * Creates the file in the system temp directory with the given contents; leaves the descriptor (opened
   * read-write) positioned at offset 0.
   *
   * @param contents
   *        Initial contents.
   */
  explicit Temp_file(const std::string& contents = "");

  /// Closes and removes the file.
  ~Temp_file();

  /**
   * The read-write descriptor opened at construction.
   * @return See above.
   */
  int fd() const;

  /**
   * The file's path.
   * @return See above.
   */
  const fs::path& path() const;

  /**
   * Opens another, independent, descriptor to the same file (own file position).
   *
   * @param flags
   *        `open()` flags, e.g., `O_RDWR | O_APPEND`.
   * @return The new descriptor.
   */
  Scoped_fd open(int flags) const;

  /**
   * The file's entire current contents, read via a fresh descriptor (so no file position is disturbed).
   * @return See above.
   */
  std::string contents() const;

private:
  /// See path().
  fs::path m_path;

  /// See fd().
  Scoped_fd m_fd;
}; // class Temp_file

/// Both ends of a pipe.
struct Pipe_fds
{
  /// Read end.
  Scoped_fd m_read;

  /// Write end.
  Scoped_fd m_write;
};

/**
 * Creates a pipe (`O_CLOEXEC`).
 *
 * @param nb
 *        Whether to put both ends in non-blocking mode.
 * @return See above.
 */
Pipe_fds make_pipe(bool nb = false);

/// A connected pair of Unix-domain stream sockets.
struct Socket_fds
{
  /// One end.
  Scoped_fd m_a;

  /// The other.
  Scoped_fd m_b;
};

/**
 * Creates a connected Unix-domain stream socket pair via `socketpair()`.
 * @return See above.
 */
Socket_fds make_unix_stream_pair();

/// A connected pair of TCP sockets over loopback (IPv4).
class Tcp_pair :
  private boost::noncopyable
{
public:
  /// Listens on an ephemeral port on 127.0.0.1; connects; accepts.  Throws on failure.
  Tcp_pair();

  /**
   * Descriptor of the connecting side.
   * @return See above.
   */
  int client_fd();

  /**
   * Descriptor of the accepted side.
   * @return See above.
   */
  int server_fd();

private:
  /// Needed by the sockets.
  boost::asio::io_context m_task_engine;

  /// See client_fd().
  boost::asio::ip::tcp::socket m_client;

  /// See server_fd().
  boost::asio::ip::tcp::socket m_server;
}; // class Tcp_pair

/// A pseudo-terminal in raw mode: the test side (master) and the terminal side (slave).
struct Pty_fds
{
  /// Master side: what the terminal "displays" can be read from here.
  Scoped_fd m_master;

  /// Slave side: the terminal device proper.
  Scoped_fd m_slave;
};

/**
 * Opens a pseudo-terminal and puts its slave side in raw mode.  Throws on failure.
 * @return See above.
 */
Pty_fds make_raw_pty();

/**
 * Writes all of `data` to `fd`; returns `false` on error.
 *
 * @param fd
 *        Descriptor.
 * @param data
 *        Bytes.
 * @return See above.
 */
bool write_fully(int fd, const std::string& data);

/**
 * Reads from `fd` until end-of-data or until `max_n` bytes were read; returns what was read.
 *
 * @param fd
 *        Descriptor.
 * @param max_n
 *        Limit.
 * @return See above.
 */
std::string read_until_eof(int fd, size_t max_n = size_t(-1));

/**
 * Current file position of `fd` (`lseek(SEEK_CUR)`); -1 on error.
 *
 * @param fd
 *        Descriptor.
 * @return See above.
 */
int64_t file_offset(int fd);

/**
 * Casts an enumeration to its primitive type.
 *
 * @tparam Enum The enumeration type.
 * @param e The enumeration value.
 *
 * @return The primitive type form of the enumeration value.
 */
template <class Enum>
constexpr std::underlying_type_t<Enum> to_underlying(Enum e) noexcept
{
  return static_cast<std::underlying_type_t<Enum>>(e);
}

} // namespace xfer::test
