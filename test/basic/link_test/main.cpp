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

#include <xfer/transfer/copier.hpp>
#include <xfer/transfer/error.hpp>
#include <flow/log/simple_ostream_logger.hpp>
#include <flow/log/async_file_logger.hpp>
#include <flow/error/error.hpp>
#include <iostream>
#include <string>
#include <fcntl.h>
#include <unistd.h>

/* This little thing is *not* a unit-test; it is built to ensure the proper stuff links through our
 * build process.  It copies a file (or standard input) into another file (or standard output) through
 * xfer::transfer::Copier, which will pick whatever accelerated path applies to the given descriptors.
 * Try, e.g., `xfer_link_test x.log in.bin out.bin`, `cat in.bin | xfer_link_test x.log - out.bin`, or
 * `xfer_link_test x.log in.bin - | wc -c`. */
int main(int argc, char const * const * argv)
{
  using xfer::transfer::Copier;
  using xfer::transfer::Endpoint;
  using xfer::transfer::Limited_source;
  using xfer::transfer::Native_handle;
  using xfer::transfer::S_UNLIMITED;

  using flow::log::Simple_ostream_logger;
  using flow::log::Async_file_logger;
  using flow::log::Config;
  using flow::log::Sev;
  using flow::Error_code;
  using flow::Flow_log_component;

  using std::string;
  using std::exception;

  const string LOG_FILE = "xfer_core_link_test.log";
  const string STD_STREAM = "-";
  const int BAD_EXIT = 1;

  Config std_log_config;
  std_log_config.init_component_to_union_idx_mapping<Flow_log_component>(1000, 999);
  std_log_config.init_component_names<Flow_log_component>(flow::S_FLOW_LOG_COMPONENT_NAME_MAP, false, "link_test-");

  Simple_ostream_logger std_logger(&std_log_config, std::cerr, std::cerr); // Standard output may be the payload.
  FLOW_LOG_SET_CONTEXT(&std_logger, Flow_log_component::S_UNCAT);

  // This is separate: the Xfer/Flow logging will go into this file.
  const string log_file((argc >= 2) ? string(argv[1]) : LOG_FILE);
  const string src_path((argc >= 3) ? string(argv[2]) : STD_STREAM);
  const string dst_path((argc >= 4) ? string(argv[3]) : STD_STREAM);
  const uint64_t limit = (argc >= 5) ? std::stoull(argv[4]) : S_UNLIMITED;

  FLOW_LOG_INFO("Opening log file [" << log_file << "] for Xfer/Flow logs only.");
  Config log_config = std_log_config;
  log_config.init_component_to_union_idx_mapping<xfer::Log_component>
    (2000, Config::standard_component_payload_enum_sparse_length<xfer::Log_component>());
  log_config.init_component_names<xfer::Log_component>(xfer::S_XFER_LOG_COMPONENT_NAME_MAP, false, "xfer-");
  log_config.configure_default_verbosity(Sev::S_DATA, true); // High-verbosity.  Use S_INFO in production.
  Async_file_logger log_logger(nullptr, &log_config, log_file, false /* No rotation; we're no serious business. */);

  int src_fd = STDIN_FILENO;
  int dst_fd = STDOUT_FILENO;
  try
  {
    if (src_path != STD_STREAM)
    {
      src_fd = ::open(src_path.c_str(), O_RDONLY | O_CLOEXEC);
      if (src_fd == -1)
      {
        throw flow::error::Runtime_error(Error_code(errno, boost::system::system_category()),
                                         "open(" + src_path + ")");
      }
    }
    if (dst_path != STD_STREAM)
    {
      dst_fd = ::open(dst_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
      if (dst_fd == -1)
      {
        throw flow::error::Runtime_error(Error_code(errno, boost::system::system_category()),
                                         "open(" + dst_path + ")");
      }
    }

    const Copier copier(&log_logger);
    const Endpoint src(&log_logger, Native_handle(src_fd));
    const Endpoint dst(&log_logger, Native_handle(dst_fd));
    FLOW_LOG_INFO("Copying [" << src << "] => [" << dst << "].");

    uint64_t n;
    if (limit == S_UNLIMITED)
    {
      n = copier.copy(dst, src); // Throws on error.
    }
    else
    {
      Limited_source limited_src(src, limit);
      n = copier.copy(dst, &limited_src); // Ditto.
      FLOW_LOG_INFO("Limit remaining: [" << limited_src.remaining() << "].");
    }
    FLOW_LOG_INFO("Copied [" << n << "] bytes.  Exiting.");
  } // try
  catch (const exception& exc)
  {
    FLOW_LOG_WARNING("Caught exception: [" << exc.what() << "].");
    return BAD_EXIT;
  }

  return 0;
} // main()
