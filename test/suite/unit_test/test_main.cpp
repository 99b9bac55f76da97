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

#include "xfer/test/test_config.hpp"
#include <gtest/gtest.h>
#include <iostream>

/* Runs every unit test linked into this executable.  Beyond the usual GoogleTest flags (which InitGoogleTest()
 * consumes) one may specify `--minimum-log-severity=<sev>` (e.g., `trace`) to see more of the library's logging. */
int main(int argc, char** argv)
{
  using xfer::test::Test_config;

  testing::InitGoogleTest(&argc, argv);
  if (!Test_config::get_singleton().parse_command_line(&argc, argv))
  {
    std::cerr << "Usage: " << argv[0] << " [GoogleTest flags] [--minimum-log-severity=<sev>]\n";
    return 1;
  }

  return RUN_ALL_TESTS();
}
