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

#include "xfer/transfer/endpoint.hpp"
#include "xfer/transfer/limited_source.hpp"
#include "xfer/transfer/error.hpp"
#include "xfer/test/test_logger.hpp"
#include "xfer/test/test_common_util.hpp"
#include <gtest/gtest.h>
#include <flow/error/error.hpp>
#include <sstream>
#include <fcntl.h>
#include <sys/socket.h>
#include <unistd.h>

namespace xfer::transfer::test
{

namespace
{
using xfer::test::Test_logger;
using xfer::test::Temp_file;
using xfer::test::Tcp_pair;
using xfer::test::make_pipe;
using xfer::test::make_unix_stream_pair;
using xfer::test::make_raw_pty;

/// A descriptor number that is certainly not open.
constexpr int S_NEVER_OPEN_FD = 1000000;
} // namespace (anon)

TEST(Endpoint, Null_and_closed)
{
  Test_logger logger;

  const Endpoint null_ep;
  EXPECT_TRUE(null_ep.null());
  EXPECT_FALSE(null_ep.closed());
  EXPECT_FALSE(null_ep.valid());

  const Endpoint null_ep2(&logger, Native_handle());
  EXPECT_TRUE(null_ep2.null());
  EXPECT_FALSE(null_ep2.valid());

  const Endpoint closed_ep(&logger, Native_handle(S_NEVER_OPEN_FD));
  EXPECT_FALSE(closed_ep.null());
  EXPECT_TRUE(closed_ep.closed());
  EXPECT_FALSE(closed_ep.valid());
  EXPECT_FALSE(closed_ep.same_file(closed_ep));

  Error_code err_code;
  EXPECT_EQ(closed_ep.offset(&err_code), 0u);
  EXPECT_EQ(err_code, error::Code::S_INVALID_ARGUMENT);
  EXPECT_THROW(null_ep.offset(), flow::error::Runtime_error);

  std::ostringstream os;
  os << null_ep << ' ' << closed_ep;
  EXPECT_NE(os.str().find("null"), std::string::npos);
  EXPECT_NE(os.str().find("closed"), std::string::npos);
}

TEST(Endpoint, Regular_file)
{
  Test_logger logger;
  const Temp_file file("0123456789");

  const auto ep = classify(&logger, Native_handle(file.fd()));
  ASSERT_TRUE(ep.valid());
  EXPECT_EQ(ep.kind(), Endpoint_kind::S_REGULAR_FILE);
  EXPECT_TRUE(ep.seekable());
  EXPECT_FALSE(ep.append_mode());
  EXPECT_FALSE(ep.non_blocking());
  EXPECT_FALSE(ep.is_stream());
  EXPECT_TRUE(ep.network().empty());
  EXPECT_NE(ep.inode(), 0u);
  EXPECT_EQ(ep.offset(), 0u);

  ASSERT_EQ(::lseek(file.fd(), 4, SEEK_SET), 4);
  EXPECT_EQ(ep.offset(), 4u) << "offset() must be queried live.";

  // Another descriptor to the same file: same identity; but different flags are seen.
  const auto append_fd = file.open(O_WRONLY | O_APPEND);
  const Endpoint append_ep(&logger, Native_handle(append_fd.get()));
  EXPECT_TRUE(append_ep.append_mode());
  EXPECT_TRUE(append_ep.same_file(ep));
  EXPECT_TRUE(ep.same_file(append_ep));
  EXPECT_EQ(append_ep.device(), ep.device());

  const Temp_file other_file;
  const Endpoint other_ep(&logger, Native_handle(other_file.fd()));
  EXPECT_FALSE(other_ep.same_file(ep));
}

TEST(Endpoint, Pipe)
{
  Test_logger logger;
  const auto pipe = make_pipe(true);

  const Endpoint rd_ep(&logger, Native_handle(pipe.m_read.get()));
  const Endpoint wr_ep(&logger, Native_handle(pipe.m_write.get()));
  EXPECT_EQ(rd_ep.kind(), Endpoint_kind::S_PIPE);
  EXPECT_EQ(wr_ep.kind(), Endpoint_kind::S_PIPE);
  EXPECT_TRUE(rd_ep.non_blocking());
  EXPECT_FALSE(rd_ep.seekable());
  EXPECT_TRUE(rd_ep.same_file(wr_ep)) << "Both ends of one pipe are the same pipe inode.";

  Error_code err_code;
  rd_ep.offset(&err_code);
  EXPECT_EQ(err_code, Error_code(ESPIPE, boost::system::system_category()));
}

TEST(Endpoint, Stream_sockets)
{
  Test_logger logger;

  const auto unix_pair = make_unix_stream_pair();
  const Endpoint unix_ep(&logger, Native_handle(unix_pair.m_a.get()));
  EXPECT_EQ(unix_ep.kind(), Endpoint_kind::S_STREAM_SOCKET);
  EXPECT_TRUE(unix_ep.is_stream());
  EXPECT_EQ(unix_ep.socket_domain(), AF_UNIX);
  EXPECT_EQ(unix_ep.network(), "unix");

  Tcp_pair tcp_pair;
  const Endpoint tcp_ep(&logger, Native_handle(tcp_pair.server_fd()));
  EXPECT_EQ(tcp_ep.kind(), Endpoint_kind::S_STREAM_SOCKET);
  EXPECT_TRUE(tcp_ep.is_stream());
  EXPECT_EQ(tcp_ep.socket_domain(), AF_INET);
  EXPECT_EQ(tcp_ep.network(), "tcp4");

  std::ostringstream os;
  os << tcp_ep;
  EXPECT_NE(os.str().find("stream-socket/tcp4"), std::string::npos) << os.str();
}

TEST(Endpoint, Other)
{
  Test_logger logger;

  int fds[2];
  ASSERT_EQ(::socketpair(AF_UNIX, SOCK_DGRAM | SOCK_CLOEXEC, 0, fds), 0);
  const xfer::test::Scoped_fd dgram_a(fds[0]);
  const xfer::test::Scoped_fd dgram_b(fds[1]);
  const Endpoint dgram_ep(&logger, Native_handle(dgram_a.get()));
  EXPECT_EQ(dgram_ep.kind(), Endpoint_kind::S_OTHER);
  EXPECT_FALSE(dgram_ep.is_stream());
  EXPECT_TRUE(dgram_ep.network().empty());

  const auto pty = make_raw_pty();
  const Endpoint tty_ep(&logger, Native_handle(pty.m_slave.get()));
  EXPECT_TRUE(tty_ep.valid());
  EXPECT_EQ(tty_ep.kind(), Endpoint_kind::S_OTHER);
}

TEST(Limited_source, Accounting)
{
  Test_logger logger;
  const Temp_file file("abc");
  const Endpoint ep(&logger, Native_handle(file.fd()));

  Limited_source src(ep, 10);
  EXPECT_EQ(src.remaining(), 10u);
  EXPECT_FALSE(src.exhausted());
  EXPECT_EQ(src.source().native_handle(), ep.native_handle());

  src.consume(3);
  EXPECT_EQ(src.remaining(), 7u);
  src.consume(0);
  EXPECT_EQ(src.remaining(), 7u);
  src.consume(7);
  EXPECT_EQ(src.remaining(), 0u);
  EXPECT_TRUE(src.exhausted());

  const Limited_source zero(ep, 0);
  EXPECT_TRUE(zero.exhausted());

  std::ostringstream os;
  os << src;
  EXPECT_NE(os.str().find("remaining [0]"), std::string::npos) << os.str();
}

} // namespace xfer::transfer::test
