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
#include "xfer/transfer/endpoint.hpp"
#include "xfer/transfer/error.hpp"
#include <flow/error/error.hpp>
#include <sys/stat.h>
#include <sys/socket.h>
#include <fcntl.h>
#include <unistd.h>

namespace xfer::transfer
{

// Endpoint implementations.

Endpoint::Endpoint() :
  flow::log::Log_context(nullptr, Log_component::S_TRANSFER),
  m_closed(false),
  m_kind(Endpoint_kind::S_OTHER),
  m_append_mode(false),
  m_non_blocking(false),
  m_device(0),
  m_inode(0),
  m_socket_domain(AF_UNSPEC)
{
  // That's it.
}

Endpoint::Endpoint(flow::log::Logger* logger_ptr, Native_handle hndl) :
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSFER),
  m_hndl(hndl),
  m_closed(false),
  m_kind(Endpoint_kind::S_OTHER),
  m_append_mode(false),
  m_non_blocking(false),
  m_device(0),
  m_inode(0),
  m_socket_domain(AF_UNSPEC)
{
  using boost::system::system_category;
  using ::fstat;
  using ::fcntl;
  using ::getsockopt;
  using ::socklen_t;
  // using ::errno; // It's a macro apparently.

  if (m_hndl.null())
  {
    return;
  }
  // else

  struct ::stat stat_buf;
  if (fstat(m_hndl.m_native_handle, &stat_buf) == -1)
  {
    if (errno == EBADF)
    {
      FLOW_LOG_TRACE("Endpoint [" << m_hndl << "]: Not an open descriptor; marking closed.");
      m_closed = true;
      return;
    }
    // else
    const Error_code sys_err_code(errno, system_category());
    FLOW_LOG_WARNING("Endpoint [" << m_hndl << "]: fstat() failed; cannot classify; treating as "
                     "[" << Endpoint_kind::S_OTHER << "] (generic transfer only).  Details follow.");
    FLOW_ERROR_SYS_ERROR_LOG_WARNING();
    return;
  }
  // else

  m_device = stat_buf.st_dev;
  m_inode = stat_buf.st_ino;

  if (S_ISREG(stat_buf.st_mode))
  {
    m_kind = Endpoint_kind::S_REGULAR_FILE;
  }
  else if (S_ISFIFO(stat_buf.st_mode))
  {
    m_kind = Endpoint_kind::S_PIPE;
  }
  else if (S_ISSOCK(stat_buf.st_mode))
  {
    int sock_type = 0;
    int sock_domain = AF_UNSPEC;
    socklen_t opt_len = sizeof(sock_type);
    if ((getsockopt(m_hndl.m_native_handle, SOL_SOCKET, SO_TYPE, &sock_type, &opt_len) == 0)
        && (sock_type == SOCK_STREAM))
    {
      m_kind = Endpoint_kind::S_STREAM_SOCKET;
      opt_len = sizeof(sock_domain);
      if (getsockopt(m_hndl.m_native_handle, SOL_SOCKET, SO_DOMAIN, &sock_domain, &opt_len) == 0)
      {
        m_socket_domain = sock_domain;
      }
    }
    // else { Datagram, seqpacket, whatever: S_OTHER. }
  }
  // else { Terminal, other char device, directory, ...: S_OTHER. }

  const int flags = fcntl(m_hndl.m_native_handle, F_GETFL);
  if (flags == -1)
  {
    // Weird, since fstat() just worked; but be conservative: no flags means no append-mode knowledge.
    const Error_code sys_err_code(errno, system_category());
    FLOW_LOG_WARNING("Endpoint [" << m_hndl << "]: fcntl(F_GETFL) failed; treating as "
                     "[" << Endpoint_kind::S_OTHER << "] (generic transfer only).  Details follow.");
    FLOW_ERROR_SYS_ERROR_LOG_WARNING();
    m_kind = Endpoint_kind::S_OTHER;
  }
  else
  {
    m_append_mode = (flags & O_APPEND) != 0;
    m_non_blocking = (flags & O_NONBLOCK) != 0;
  }

  FLOW_LOG_TRACE("Endpoint classified: [" << *this << "].");
} // Endpoint::Endpoint()

Native_handle Endpoint::native_handle() const
{
  return m_hndl;
}

Endpoint_kind Endpoint::kind() const
{
  return m_kind;
}

bool Endpoint::null() const
{
  return m_hndl.null();
}

bool Endpoint::closed() const
{
  return m_closed;
}

bool Endpoint::valid() const
{
  return (!null()) && (!closed());
}

bool Endpoint::append_mode() const
{
  return m_append_mode;
}

bool Endpoint::non_blocking() const
{
  return m_non_blocking;
}

bool Endpoint::seekable() const
{
  return m_kind == Endpoint_kind::S_REGULAR_FILE;
}

dev_t Endpoint::device() const
{
  return m_device;
}

ino_t Endpoint::inode() const
{
  return m_inode;
}

bool Endpoint::same_file(const Endpoint& other) const
{
  return valid() && other.valid() && (m_device == other.m_device) && (m_inode == other.m_inode);
}

int Endpoint::socket_domain() const
{
  return m_socket_domain;
}

bool Endpoint::is_stream() const
{
  return m_kind == Endpoint_kind::S_STREAM_SOCKET;
}

util::String_view Endpoint::network() const
{
  if (!is_stream())
  {
    return "";
  }
  // else
  switch (m_socket_domain)
  {
  case AF_UNIX:
    return "unix";
  case AF_INET:
    return "tcp4";
  case AF_INET6:
    return "tcp6";
  }
  return "";
}

uint64_t Endpoint::offset(Error_code* err_code) const
{
  using boost::system::system_category;
  using ::lseek;
  using ::off_t;

  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(uint64_t, offset, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  if (!valid())
  {
    FLOW_LOG_WARNING("Endpoint [" << *this << "]: offset() requested of invalid endpoint.");
    *err_code = error::Code::S_INVALID_ARGUMENT;
    return 0;
  }
  // else

  const off_t pos = lseek(m_hndl.m_native_handle, 0, SEEK_CUR);
  if (pos == off_t(-1))
  {
    *err_code = Error_code(errno, system_category());
    return 0;
  }
  // else

  err_code->clear();
  return uint64_t(pos);
} // Endpoint::offset()

Endpoint classify(flow::log::Logger* logger_ptr, Native_handle hndl)
{
  return Endpoint(logger_ptr, hndl);
}

std::ostream& operator<<(std::ostream& os, const Endpoint& val)
{
  os << '[' << val.native_handle();
  if (val.null())
  {
    return os << " null]";
  }
  // else
  if (val.closed())
  {
    return os << " closed]";
  }
  // else

  os << ' ' << val.kind();
  if (val.is_stream())
  {
    const auto network = val.network();
    os << '/' << (network.empty() ? util::String_view("?") : network);
  }
  os << " dev[" << val.device() << "] ino[" << val.inode() << ']';
  if (val.append_mode())
  {
    os << " append";
  }
  if (val.non_blocking())
  {
    os << " nb";
  }
  return os << ']';
}

std::ostream& operator<<(std::ostream& os, Endpoint_kind val)
{
  switch (val)
  {
  case Endpoint_kind::S_REGULAR_FILE:
    return os << "file";
  case Endpoint_kind::S_PIPE:
    return os << "pipe";
  case Endpoint_kind::S_STREAM_SOCKET:
    return os << "stream-socket";
  case Endpoint_kind::S_OTHER:
    return os << "other";
  }
  assert(false);
  return os;
}

} // namespace xfer::transfer
