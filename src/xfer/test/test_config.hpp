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

#include <flow/log/log.hpp>
#include <string>

namespace xfer::test
{

/**
 * Process-wide settings for the unit tests, filled from the command line by the test `main()` before any test runs.
 */
class Test_config
{
public:
  /**
   * Returns the singleton.
   *
   * @return See above.
   */
  static Test_config& get_singleton()
  {
    static Test_config s_config;
    return s_config;
  }

  /**
   * Consumes the options we understand from the command line (what's left is for gtest).  Recognized:
   *   - `--minimum-log-severity=<sev>`: e.g., `info`, `trace`, `data`.  Default: `warning`.
   *
   * @param argc
   *        In/out: `main()` argument count.
   * @param argv
   *        In/out: `main()` arguments.
   * @return `false` if an option was malformed (an explanation has been printed to `cerr`).
   */
  bool parse_command_line(int* argc, char** argv);

  /// Lowest severity that passes through the Test_logger filter.
  flow::log::Sev m_sev;

private:
  /// Sets defaults.
  Test_config() :
    m_sev(flow::log::Sev::S_WARNING)
  {
    // Nope.
  }
}; // class Test_config

} // namespace xfer::test
