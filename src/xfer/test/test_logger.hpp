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

#include <flow/log/simple_ostream_logger.hpp>
#include <xfer/common.hpp>
#include "xfer/test/test_config.hpp"
#include <atomic>

namespace xfer::test
{

/**
 * Logger for unit tests.  Messages go to the console, filtered by severity (by default Test_config::m_sev), with the
 * Flow-Xfer and Flow component names registered (`xfer-` and `flow-` prefixes respectively).
 *
 * In addition it counts the WARNING-or-worse messages it lets through.  A transfer that should have gone smoothly
 * (including one that legitimately fell back to the buffered loop) logs no warnings, so a test may check
 * n_warnings().  With the default filter severity all such messages pass; with a stricter one, fewer are counted.
 *
 * May be used concurrently from multiple threads.
 */
class Test_logger :
  public flow::log::Logger
{
public:
  // Constructors/destructor.

  /**
   * Constructor.
   *
   * @param min_severity
   *        Lowest severity that will pass through logging filter.
   */
  explicit Test_logger(flow::log::Sev min_severity = Test_config::get_singleton().m_sev) :
    m_config(min_severity),
    m_logger(&m_config),
    m_n_warnings(0)
  {
    using flow::log::Config;

    // Formally fine to do this after the Logger took the m_config ptr already.
    m_config.init_component_to_union_idx_mapping<Log_component>
      (S_XFER_COMPONENT_IDX_BASE, Config::standard_component_payload_enum_sparse_length<Log_component>());
    m_config.init_component_names<Log_component>(S_XFER_LOG_COMPONENT_NAME_MAP, false, "xfer-");
    m_config.init_component_to_union_idx_mapping<flow::Flow_log_component>
      (S_FLOW_COMPONENT_IDX_BASE, Config::standard_component_payload_enum_sparse_length<flow::Flow_log_component>());
    m_config.init_component_names<flow::Flow_log_component>(flow::S_FLOW_LOG_COMPONENT_NAME_MAP, false, "flow-");
  }

  // Methods.

  /**
   * Number of messages of severity WARNING or worse logged so far.
   *
   * @return See above.
   */
  unsigned int n_warnings() const
  {
    return m_n_warnings;
  }

  /// Forwards to console Logger.
  bool should_log(flow::log::Sev sev, const flow::log::Component& component) const override
  {
    return m_logger.should_log(sev, component);
  }

  /// Forwards to console Logger.
  bool logs_asynchronously() const override
  {
    return m_logger.logs_asynchronously();
  }

  /// Counts warnings; forwards to console Logger.
  void do_log(flow::log::Msg_metadata* metadata, flow::util::String_view msg) override
  {
    using flow::log::Sev;

    if ((metadata->m_msg_sev != Sev::S_NONE) && (metadata->m_msg_sev <= Sev::S_WARNING))
    {
      ++m_n_warnings;
    }
    m_logger.do_log(metadata, msg);
  }

private:
  // Constants.

  /// Where xfer::Log_component values start in the union of component indices.
  static constexpr size_t S_XFER_COMPONENT_IDX_BASE = 100;

  /// Where flow::Flow_log_component values start in the union of component indices.
  static constexpr size_t S_FLOW_COMPONENT_IDX_BASE = 200;

  // Data.

  /// Logging configuration.
  flow::log::Config m_config;

  /// The real logger.
  flow::log::Simple_ostream_logger m_logger;

  /// See n_warnings().
  std::atomic<unsigned int> m_n_warnings;
}; // class Test_logger

} // namespace xfer::test
