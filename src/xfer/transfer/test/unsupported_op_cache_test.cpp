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

#include "xfer/transfer/unsupported_op_cache.hpp"
#include "xfer/transfer/range_copy.hpp"
#include "xfer/transfer/send_file.hpp"
#include "xfer/transfer/splice.hpp"
#include "xfer/test/test_logger.hpp"
#include "xfer/test/test_common_util.hpp"
#include <gtest/gtest.h>
#include <flow/util/util.hpp>
#include <boost/thread/thread.hpp>
#include <memory>
#include <vector>
#include <unistd.h>

namespace xfer::transfer::test
{

namespace
{
using xfer::test::Test_logger;
using xfer::test::Temp_file;
using xfer::test::make_pipe;
using xfer::test::file_offset;
}

TEST(Unsupported_op_cache, Pairings_and_absence)
{
  Unsupported_op_cache cache;
  EXPECT_EQ(cache.size(), 0u);
  EXPECT_FALSE(cache.unsupported(Accelerated_op::S_RANGE_COPY, 1, 2));

  cache.mark_unsupported(Accelerated_op::S_RANGE_COPY, 1, 2);
  EXPECT_TRUE(cache.unsupported(Accelerated_op::S_RANGE_COPY, 1, 2));
  EXPECT_FALSE(cache.unsupported(Accelerated_op::S_RANGE_COPY, 2, 1)) << "Pairings are directional.";
  EXPECT_FALSE(cache.unsupported(Accelerated_op::S_SEND_FILE, 1, 2)) << "Pairings are per-op.";
  cache.mark_unsupported(Accelerated_op::S_RANGE_COPY, 1, 2); // Dupe.
  EXPECT_EQ(cache.size(), 1u);

  EXPECT_FALSE(cache.absent(Accelerated_op::S_SPLICE));
  cache.mark_absent(Accelerated_op::S_SPLICE);
  EXPECT_TRUE(cache.absent(Accelerated_op::S_SPLICE));
  EXPECT_TRUE(cache.unsupported(Accelerated_op::S_SPLICE, 7, 8)) << "Absent means unsupported everywhere.";
  EXPECT_FALSE(cache.absent(Accelerated_op::S_SEND_FILE));

  cache.clear();
  EXPECT_EQ(cache.size(), 0u);
  EXPECT_FALSE(cache.absent(Accelerated_op::S_SPLICE));
  EXPECT_FALSE(cache.unsupported(Accelerated_op::S_RANGE_COPY, 1, 2));

  EXPECT_EQ(&Unsupported_op_cache::process_wide(), &Unsupported_op_cache::process_wide());
}

TEST(Unsupported_op_cache, Concurrent_use)
{
  using flow::util::Thread;

  Unsupported_op_cache cache;
  constexpr int N_THREADS = 8;
  constexpr int N_PER_THREAD = 200;

  std::vector<std::unique_ptr<Thread>> threads;
  for (int thread_idx = 0; thread_idx != N_THREADS; ++thread_idx)
  {
    threads.emplace_back(new Thread([&cache, thread_idx]()
    {
      for (int idx = 0; idx != N_PER_THREAD; ++idx)
      {
        cache.mark_unsupported(Accelerated_op::S_SEND_FILE, dev_t(thread_idx), dev_t(idx));
        EXPECT_TRUE(cache.unsupported(Accelerated_op::S_SEND_FILE, dev_t(thread_idx), dev_t(idx)));
      }
    }));
  }
  for (auto& thread : threads)
  {
    thread->join();
  }

  EXPECT_EQ(cache.size(), size_t(N_THREADS * N_PER_THREAD));
}

TEST(Unsupported_op_cache, Memoized_op_is_skipped_without_io)
{
  Test_logger logger;
  Unsupported_op_cache cache;

  const Temp_file src_file("some bytes");
  const Temp_file dst_file;
  const Endpoint src(&logger, Native_handle(src_file.fd()));
  const Endpoint dst(&logger, Native_handle(dst_file.fd()));

  cache.mark_unsupported(Accelerated_op::S_RANGE_COPY, src.device(), dst.device());
  cache.mark_absent(Accelerated_op::S_SEND_FILE);

  const Range_copy_selector range_copy(&logger, Range_copy_selector::S_DEFAULT_MAX_CHUNK_SZ, &cache);
  const Send_file_selector send_file(&logger, Send_file_selector::S_DEFAULT_MAX_CHUNK_SZ, &cache);

  auto result = range_copy(dst, src, S_UNLIMITED);
  ASSERT_TRUE(std::holds_alternative<Not_applicable>(result));
  EXPECT_EQ(n_moved(result), 0u);
  result = send_file(dst, src, S_UNLIMITED);
  ASSERT_TRUE(std::holds_alternative<Not_applicable>(result));

  EXPECT_EQ(file_offset(src_file.fd()), 0);
  EXPECT_EQ(file_offset(dst_file.fd()), 0);
  EXPECT_TRUE(dst_file.contents().empty());

  // Splice memoized absent: even a pipe pair is declined up-front.
  cache.mark_absent(Accelerated_op::S_SPLICE);
  const Splice_selector splice(&logger, Splice_selector::S_DEFAULT_MAX_CHUNK_SZ, &cache);
  const auto pipe1 = make_pipe();
  const auto pipe2 = make_pipe();
  ASSERT_EQ(::write(pipe1.m_write.get(), "x", 1), 1);
  result = splice(Endpoint(&logger, Native_handle(pipe2.m_write.get())),
                  Endpoint(&logger, Native_handle(pipe1.m_read.get())), S_UNLIMITED);
  ASSERT_TRUE(std::holds_alternative<Not_applicable>(result));
  char ch;
  EXPECT_EQ(::read(pipe1.m_read.get(), &ch, 1), 1) << "Byte must still be in the source pipe.";
}

} // namespace xfer::transfer::test
