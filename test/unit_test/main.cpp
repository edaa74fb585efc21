/* BLE-Xact: Core
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

#include "blex/test/fake_host.hpp"
#include "blex/test/test_logger.hpp"
#include <gtest/gtest.h>
#include <string>

/* The unit test binary doubles as the fake host process that the transport tests spawn: when invoked with
 * `fake-blehostd:<mode> <socket path>` it plays the host instead of running the tests. */
int main(int argc, char** argv)
{
  using blex::test::S_FAKE_HOST_ARG_PREFIX;
  using std::string;

  if ((argc >= 3) && (string(argv[1]).rfind(string(S_FAKE_HOST_ARG_PREFIX), 0) == 0))
  {
    blex::test::Test_logger logger;
    const string mode(string(argv[1]).substr(S_FAKE_HOST_ARG_PREFIX.size()));
    return blex::test::run_fake_host(&logger, mode, argv[2]);
  }
  // else

  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
