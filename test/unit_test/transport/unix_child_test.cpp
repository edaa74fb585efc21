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

#include "blex/transport/unix_child.hpp"
#include "blex/transport/ble_msg.hpp"
#include "blex/transport/error.hpp"
#include "blex/test/test_common_util.hpp"
#include "blex/test/test_logger.hpp"
#include "blex/test/fake_host.hpp"
#include <gtest/gtest.h>
#include <flow/error/error.hpp>
#include <flow/util/blob.hpp>
#include <flow/async/single_thread_task_loop.hpp>
#include <boost/chrono.hpp>
#include <boost/thread/future.hpp>
#include <signal.h>
#include <sys/wait.h>
#include <string>

namespace blex::transport::test
{

namespace
{

using blex::test::Test_logger;
using boost::chrono::milliseconds;
using boost::chrono::seconds;
using std::string;

/// Config running the fake host in `mode`.
Unix_child::Config child_config(util::String_view mode)
{
  Unix_child::Config cfg;
  cfg.m_sock_path = blex::test::unique_sock_path();
  cfg.m_child_path = blex::test::self_exe_path();
  cfg.m_child_args = { flow::util::ostream_op_string(blex::test::S_FAKE_HOST_ARG_PREFIX, mode),
                       cfg.m_sock_path.string() };
  cfg.m_max_msg_size = 1024;
  cfg.m_rcv_depth = 4;
  cfg.m_accept_timeout = seconds(5);
  return cfg;
}

} // namespace (anon)

TEST(Unix_child, Exchange_with_child)
{
  Test_logger logger;
  Unix_child child(&logger, child_config("synced"));

  Error_code err_code;
  child.to_child(encode_sync_req(&logger, 1), &err_code);
  EXPECT_EQ(err_code, error::Code::S_XPORT_NOT_STARTED);

  child.start(&err_code);
  ASSERT_FALSE(err_code) << "Error [" << err_code << "] [" << err_code.message() << "].";
  EXPECT_NE(child.child_pid(), 0);
  EXPECT_TRUE(fs::exists(child.config().m_sock_path));

  child.to_child(encode_sync_req(&logger, 1));
  child.to_child(encode_msg(&logger, { Msg_op::S_REQ, Msg_type::S_SCAN, 2, Msg_base::S_CONN_HANDLE_NONE }));

  util::Blob body;
  Ble_msg msg;
  ASSERT_TRUE(child.from_child(&body));
  decode_msg(util::blob_view(body), &msg);
  EXPECT_EQ(msg.base(), (Msg_base{ Msg_op::S_RSP, Msg_type::S_SYNC, 1, Msg_base::S_CONN_HANDLE_NONE }));
  EXPECT_EQ(msg.synced(), std::optional<bool>(true));

  ASSERT_TRUE(child.from_child(&body));
  decode_msg(util::blob_view(body), &msg);
  EXPECT_EQ(msg.base(), (Msg_base{ Msg_op::S_RSP, Msg_type::S_SCAN, 2, Msg_base::S_CONN_HANDLE_NONE }));

  child.stop();
  EXPECT_EQ(child.child_pid(), 0);
  EXPECT_FALSE(fs::exists(child.config().m_sock_path));
  EXPECT_FALSE(child.from_child(&body));
  EXPECT_FALSE(child.err_child(&err_code));
  child.stop(); // Idempotent.
}

TEST(Unix_child, Rejects_bad_outbound_sizes)
{
  Test_logger logger;
  auto cfg = child_config("synced");
  cfg.m_max_msg_size = 16;
  Unix_child child(&logger, cfg);
  child.start();

  Error_code err_code;
  child.to_child(util::Blob(&logger, 17), &err_code);
  EXPECT_EQ(err_code, error::Code::S_MESSAGE_SIZE_EXCEEDED);
  child.to_child(util::Blob(&logger), &err_code);
  EXPECT_EQ(err_code, error::Code::S_MESSAGE_SIZE_EXCEEDED);
  child.to_child(util::to_blob(&logger, "{}"), &err_code);
  EXPECT_FALSE(err_code);
}

TEST(Unix_child, Child_exit_reported_once)
{
  Test_logger logger;
  Unix_child child(&logger, child_config("exit-after-sync"));
  child.start();
  child.to_child(encode_sync_req(&logger, 1));

  Error_code err_code;
  ASSERT_TRUE(child.err_child(&err_code));
  EXPECT_EQ(err_code, error::Code::S_CHILD_FAILED);
  EXPECT_TRUE(blex::test::wait_until([&]() { return child.child_pid() == 0; }, seconds(5)));
}

TEST(Unix_child, Child_never_connects)
{
  Test_logger logger;
  auto cfg = child_config("no-connect");
  cfg.m_accept_timeout = milliseconds(300);
  Unix_child child(&logger, cfg);

  Error_code err_code;
  child.start(&err_code);
  EXPECT_EQ(err_code, error::Code::S_CHILD_ACCEPT_TIMEOUT);
  EXPECT_EQ(child.child_pid(), 0); // Killed and reaped.
  EXPECT_FALSE(fs::exists(cfg.m_sock_path));
}

TEST(Unix_child, Child_reaped_elsewhere_counts_as_exit)
{
  Test_logger logger;
  auto cfg = child_config("no-connect");
  cfg.m_accept_timeout = seconds(10);
  Unix_child child(&logger, cfg);

  boost::promise<Error_code> start_result;
  auto start_result_future = start_result.get_future();
  flow::async::Single_thread_task_loop starter(&logger, "starter");
  starter.start();
  starter.post([&]()
  {
    Error_code err_code;
    child.start(&err_code);
    start_result.set_value(err_code);
  });

  ASSERT_TRUE(blex::test::wait_until([&]() { return child.child_pid() != 0; }, seconds(5)));
  const auto pid = child.child_pid();

  // Kill and reap it from here.  Whichever waitpid() gets it, start() must learn the child is gone.
  ASSERT_EQ(::kill(pid, SIGKILL), 0);
  int status;
  [[maybe_unused]] const auto reaped_pid = ::waitpid(pid, &status, 0);

  ASSERT_EQ(start_result_future.wait_for(seconds(5)), boost::future_status::ready);
  EXPECT_EQ(start_result_future.get(), error::Code::S_CHILD_FAILED);
  EXPECT_EQ(child.child_pid(), 0);
  EXPECT_FALSE(fs::exists(cfg.m_sock_path));
}

TEST(Unix_child, Child_not_executable)
{
  Test_logger logger;
  auto cfg = child_config("synced");
  cfg.m_child_path = "/nonexistent/blehostd";
  Unix_child child(&logger, cfg);

  Error_code err_code;
  child.start(&err_code);
  EXPECT_EQ(err_code, error::Code::S_CHILD_START_FAILED);
  EXPECT_THROW(Unix_child(&logger, cfg).start(), flow::error::Runtime_error);
}

} // namespace blex::transport::test
