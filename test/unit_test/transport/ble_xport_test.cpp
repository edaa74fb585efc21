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

#include "blex/transport/ble_xport.hpp"
#include "blex/transport/error.hpp"
#include "blex/test/test_common_util.hpp"
#include "blex/test/test_logger.hpp"
#include "blex/test/fake_host.hpp"
#include <gtest/gtest.h>
#include <flow/error/error.hpp>
#include <flow/async/single_thread_task_loop.hpp>
#include <boost/chrono.hpp>
#include <algorithm>
#include <atomic>
#include <memory>
#include <string>
#include <vector>

namespace blex::transport::test
{

namespace
{

using blex::test::fake_host_xport_config;
using blex::test::Test_logger;
using blex::test::wait_until;
using boost::chrono::milliseconds;
using boost::chrono::seconds;
using State = Ble_xport::State;

constexpr auto S_ANY_SEQ = Msg_base::S_SEQ_NONE;
constexpr auto S_ANY_CONN = Msg_base::S_CONN_HANDLE_NONE;

/// Test_logger that remembers what was logged, and can hold up the thread logging a given message.
class Watching_logger :
  public Test_logger
{
public:
  /**
   * Constructor.
   *
   * @param min_severity
   *        See Test_logger.
   */
  explicit Watching_logger(flow::log::Sev min_severity = flow::log::Sev::S_INFO) :
    Test_logger(min_severity),
    m_pause(util::Fine_duration::zero()),
    m_paused(false)
  {
    // That's it.
  }

  /**
   * Number of messages logged so far that contain `text`.
   *
   * @param text
   *        Substring.
   * @return See above.
   */
  size_t count(const std::string& text) const
  {
    Lock lock(m_mutex);
    return std::count_if(m_msgs.begin(), m_msgs.end(),
                         [&](const std::string& msg) -> bool { return msg.find(text) != std::string::npos; });
  }

  /**
   * The next message containing `text` will make the thread logging it sleep for `pause` right after.
   *
   * @param text
   *        Substring.
   * @param pause
   *        Sleep time.
   */
  void pause_on(const std::string& text, util::Fine_duration pause)
  {
    Lock lock(m_mutex);
    m_pause_text = text;
    m_pause = pause;
  }

  /**
   * Whether the message given to pause_on() has been logged.
   * @return See above.
   */
  bool paused() const
  {
    return m_paused;
  }

  void do_log(flow::log::Msg_metadata* metadata, flow::util::String_view msg) override
  {
    util::Fine_duration pause = util::Fine_duration::zero();
    {
      Lock lock(m_mutex);
      m_msgs.emplace_back(msg);
      if ((!m_pause_text.empty()) && (m_msgs.back().find(m_pause_text) != std::string::npos))
      {
        m_pause_text.clear();
        pause = m_pause;
      }
    }

    Test_logger::do_log(metadata, msg);
    if (pause != util::Fine_duration::zero())
    {
      m_paused = true;
      flow::util::this_thread::sleep_for(pause);
    }
  }

private:
  /// Short-hand for mutex type.
  using Mutex = flow::util::Mutex_non_recursive;

  /// Short-hand for lock type.
  using Lock = flow::util::Lock_guard<Mutex>;

  /// Protects the following (not #m_paused).
  mutable Mutex m_mutex;

  /// Every message logged.
  std::vector<std::string> m_msgs;

  /// See pause_on(); empty if not armed.
  std::string m_pause_text;

  /// See pause_on().
  util::Fine_duration m_pause;

  /// See paused().
  std::atomic<bool> m_paused;
}; // class Watching_logger

/**
 * Text of the line logged when `lis` accepts its terminal error.
 *
 * @param lis
 *        Listener.
 * @return See above.
 */
std::string terminal_error_line(const Ble_listener& lis)
{
  return flow::util::ostream_op_string("Listener [", lis, "]: Terminal error");
}

/// Text of the line logged once by each shutdown that actually tears the transport down.
const std::string S_TEARDOWN_LINE = "Shutting down (fully started?";

/// Registers a listener for all events and returns it.
Ble_dispatcher::Listener_ptr listen_to_events(Test_logger* logger, Ble_xport* xport)
{
  auto lis = std::make_shared<Ble_listener>(logger, "events");
  xport->dispatcher()->add_listener({ Msg_op::S_EVT, Msg_type::S_WILDCARD, S_ANY_SEQ, S_ANY_CONN }, lis);
  return lis;
}

} // namespace (anon)

TEST(Ble_xport, Start_synced_and_stop)
{
  Test_logger logger;
  Ble_xport xport(&logger, fake_host_xport_config("synced"));
  EXPECT_EQ(xport.state(), State::S_STOPPED);

  xport.start();
  EXPECT_EQ(xport.state(), State::S_STARTED);
  const auto status = xport.restart_status();
  EXPECT_TRUE(status.m_active);
  EXPECT_EQ(status.m_n_attempts, 0u);

  Error_code err_code;
  xport.start(&err_code);
  EXPECT_EQ(err_code, error::Code::S_XPORT_STARTED_TWICE);
  EXPECT_EQ(xport.state(), State::S_STARTED);

  const auto lis = listen_to_events(&logger, &xport);
  xport.stop();
  EXPECT_EQ(xport.state(), State::S_STOPPED);
  EXPECT_FALSE(xport.restart_status().m_active);

  Ble_msg msg;
  lis->await(&msg, &err_code);
  EXPECT_EQ(err_code, error::Code::S_XPORT_STOPPED);

  xport.stop(); // No-op.
  EXPECT_EQ(xport.state(), State::S_STOPPED);
}

TEST(Ble_xport, Request_response_by_seq)
{
  Test_logger logger;
  Ble_xport xport(&logger, fake_host_xport_config("synced"));

  Error_code err_code;
  xport.tx(encode_sync_req(&logger, 1), &err_code);
  EXPECT_EQ(err_code, error::Code::S_XPORT_NOT_STARTED);

  xport.start();
  const auto seq = xport.next_seq();
  EXPECT_GT(seq, 0);
  EXPECT_EQ(xport.next_seq(), seq + 1);

  const Msg_base selector{ Msg_op::S_WILDCARD, Msg_type::S_WILDCARD, seq, S_ANY_CONN };
  const auto lis = std::make_shared<Ble_listener>(&logger, "rsp");
  xport.dispatcher()->add_listener(selector, lis);
  xport.tx(encode_msg(&logger, { Msg_op::S_REQ, Msg_type::S_EXCHANGE_MTU, seq, 1 }, { { "mtu", 256 } }));

  Ble_msg rsp;
  lis->timed_await(&rsp, seconds(2));
  EXPECT_EQ(rsp.base().m_op, Msg_op::S_RSP);
  EXPECT_EQ(rsp.base().m_type, Msg_type::S_EXCHANGE_MTU);
  EXPECT_EQ(rsp.body().at("status"), 0);
  EXPECT_EQ(xport.dispatcher()->remove_listener(selector), lis);
}

TEST(Ble_xport, Sync_via_event)
{
  Test_logger logger;
  Ble_xport xport(&logger, fake_host_xport_config("sync-evt"));
  xport.start();
  EXPECT_EQ(xport.state(), State::S_STARTED);
}

TEST(Ble_xport, Sync_timeout)
{
  Test_logger logger;
  auto cfg = fake_host_xport_config("never-synced");
  cfg.m_sync_timeout = milliseconds(500);
  Ble_xport xport(&logger, cfg);

  Error_code err_code;
  xport.start(&err_code);
  EXPECT_EQ(err_code, error::Code::S_SYNC_TIMEOUT);
  EXPECT_EQ(xport.state(), State::S_STOPPED);
  EXPECT_FALSE(fs::exists(cfg.m_sock_path));

  // A failed start() leaves the object startable again (and equally failing).
  EXPECT_THROW(xport.start(), flow::error::Runtime_error);
}

TEST(Ble_xport, Child_never_connects)
{
  Test_logger logger;
  auto cfg = fake_host_xport_config("no-connect");
  cfg.m_accept_timeout = milliseconds(300);
  Ble_xport xport(&logger, cfg);

  Error_code err_code;
  xport.start(&err_code);
  EXPECT_EQ(err_code, error::Code::S_CHILD_ACCEPT_TIMEOUT);
  EXPECT_EQ(xport.state(), State::S_STOPPED);
  EXPECT_FALSE(xport.restart_status().m_active); // Initial start failures are never retried.
}

TEST(Ble_xport, Child_not_executable)
{
  Test_logger logger;
  auto cfg = fake_host_xport_config("synced");
  cfg.m_child_path = "/nonexistent/blehostd";
  Ble_xport xport(&logger, cfg);

  Error_code err_code;
  xport.start(&err_code);
  EXPECT_EQ(err_code, error::Code::S_CHILD_START_FAILED);
  EXPECT_EQ(xport.state(), State::S_STOPPED);
}

TEST(Ble_xport, Restart_after_child_exit)
{
  Test_logger logger;
  Ble_xport xport(&logger, fake_host_xport_config("exit-after-sync"));
  xport.start();
  const auto lis = listen_to_events(&logger, &xport);

  // The child exits shortly after sync: waiters see the failure.
  Ble_msg msg;
  Error_code err_code;
  lis->timed_await(&msg, seconds(5), &err_code);
  EXPECT_EQ(err_code, error::Code::S_CHILD_FAILED);

  // Then the supervisor brings it back.
  EXPECT_TRUE(wait_until([&]() { return xport.restart_status().m_n_attempts >= 1; }, seconds(5)));
  EXPECT_TRUE(wait_until([&]() { return xport.state() == State::S_STARTED; }, seconds(5)));
  const auto status = xport.restart_status();
  EXPECT_TRUE(status.m_active);
  EXPECT_EQ(status.m_n_failures, 0u);

  xport.stop();
  EXPECT_EQ(xport.state(), State::S_STOPPED);
  EXPECT_FALSE(xport.restart_status().m_active);
}

TEST(Ble_xport, Restart_after_sync_lost)
{
  Test_logger logger;
  Ble_xport xport(&logger, fake_host_xport_config("sync-lost"));
  xport.start();
  const auto lis = listen_to_events(&logger, &xport);

  Ble_msg msg;
  Error_code err_code;
  lis->timed_await(&msg, seconds(5), &err_code);
  EXPECT_EQ(err_code, error::Code::S_SYNC_LOST);
  EXPECT_TRUE(wait_until([&]() { return xport.restart_status().m_n_attempts >= 1; }, seconds(5)));
  EXPECT_TRUE(wait_until([&]() { return xport.state() == State::S_STARTED; }, seconds(5)));
}

TEST(Ble_xport, No_restart_when_disabled)
{
  Test_logger logger;
  auto cfg = fake_host_xport_config("exit-after-sync");
  cfg.m_restart = false;
  Ble_xport xport(&logger, cfg);
  xport.start();
  EXPECT_FALSE(xport.restart_status().m_active);

  EXPECT_TRUE(wait_until([&]() { return xport.state() == State::S_STOPPED; }, seconds(5)));
  flow::util::this_thread::sleep_for(cfg.m_restart_delay * 3);
  EXPECT_EQ(xport.state(), State::S_STOPPED);
  EXPECT_EQ(xport.restart_status().m_n_attempts, 0u);
}

TEST(Ble_xport, Stop_cancels_pending_restart)
{
  Test_logger logger;
  auto cfg = fake_host_xport_config("exit-after-sync");
  cfg.m_restart_delay = milliseconds(500);
  Ble_xport xport(&logger, cfg);
  xport.start();

  EXPECT_TRUE(wait_until([&]() { return xport.state() == State::S_STOPPED; }, seconds(5)));
  xport.stop();
  flow::util::this_thread::sleep_for(milliseconds(800));
  EXPECT_EQ(xport.state(), State::S_STOPPED);
  EXPECT_EQ(xport.restart_status().m_n_attempts, 0u);
  EXPECT_FALSE(xport.restart_status().m_active);
}

TEST(Ble_xport, Restart_retries_after_failed_attempt)
{
  Test_logger logger;
  // Works once, then (as if the controller were unplugged) every respawned host fails to connect.
  auto cfg = fake_host_xport_config("exit-after-sync+no-connect");
  cfg.m_accept_timeout = milliseconds(300);
  Ble_xport xport(&logger, cfg);
  xport.start();

  ASSERT_TRUE(wait_until([&]() { return xport.restart_status().m_n_failures >= 2; }, seconds(10)));
  auto status = xport.restart_status();
  EXPECT_TRUE(status.m_active);
  EXPECT_GE(status.m_n_attempts, status.m_n_failures);
  EXPECT_EQ(status.m_last_err, error::Code::S_CHILD_ACCEPT_TIMEOUT);
  EXPECT_NE(xport.state(), State::S_STARTED);

  // stop() ends the retrying for good.
  xport.stop();
  EXPECT_EQ(xport.state(), State::S_STOPPED);
  EXPECT_FALSE(xport.restart_status().m_active);
  flow::util::this_thread::sleep_for(cfg.m_restart_delay * 2);
  const auto n_attempts = xport.restart_status().m_n_attempts;
  flow::util::this_thread::sleep_for(cfg.m_accept_timeout + (cfg.m_restart_delay * 5));
  EXPECT_EQ(xport.restart_status().m_n_attempts, n_attempts);
  EXPECT_EQ(xport.state(), State::S_STOPPED);

  Error_code sys_err_code;
  fs::remove(blex::test::spawn_marker_path(cfg.m_sock_path), sys_err_code);
}

TEST(Ble_xport, Stop_and_start_during_restart)
{
  Watching_logger logger;
  // The first host exits after sync; the ones after it stay up.
  const auto cfg = fake_host_xport_config("exit-after-sync+synced");
  Ble_xport xport(&logger, cfg);
  xport.start();

  /* A registered listener makes the restart attempt log (and so be held up) right as it takes over the STOPPED
   * state.  stop() and start() from here then run while it is held up. */
  const auto lis = listen_to_events(&logger, &xport);
  logger.pause_on("Unregistering all", milliseconds(300));
  ASSERT_TRUE(wait_until([&]() { return logger.paused(); }, seconds(5)));

  xport.stop();
  Error_code err_code;
  xport.start(&err_code);
  EXPECT_FALSE(err_code) << "Error [" << err_code << "] [" << err_code.message() << "].";
  EXPECT_EQ(xport.state(), State::S_STARTED);

  // The superseded restart attempt neither disturbed this start() nor comes back later.
  flow::util::this_thread::sleep_for(cfg.m_restart_delay * 5);
  EXPECT_EQ(xport.state(), State::S_STARTED);
  EXPECT_EQ(xport.restart_status().m_n_attempts, 0u);

  xport.stop();
  EXPECT_EQ(xport.state(), State::S_STOPPED);
  EXPECT_FALSE(fs::exists(cfg.m_sock_path));

  Error_code sys_err_code;
  fs::remove(blex::test::spawn_marker_path(cfg.m_sock_path), sys_err_code);
}

TEST(Ble_xport, Concurrent_stops_tear_down_once)
{
  constexpr size_t N_THREADS = 4;

  Watching_logger logger(flow::log::Sev::S_TRACE);
  Ble_xport xport(&logger, fake_host_xport_config("synced"));
  xport.start();

  std::vector<Ble_dispatcher::Listener_ptr> listeners;
  listeners.push_back(listen_to_events(&logger, &xport));
  for (seq_t seq = 1000; seq != 1003; ++seq)
  {
    listeners.push_back(std::make_shared<Ble_listener>(&logger, flow::util::ostream_op_string("rsp-", seq)));
    xport.dispatcher()->add_listener({ Msg_op::S_RSP, Msg_type::S_WILDCARD, seq, S_ANY_CONN }, listeners.back());
  }

  std::atomic<size_t> n_stopped(0);
  std::vector<std::unique_ptr<flow::async::Single_thread_task_loop>> threads;
  for (size_t idx = 0; idx != N_THREADS; ++idx)
  {
    threads.emplace_back(new flow::async::Single_thread_task_loop(&logger,
                                                                  flow::util::ostream_op_string("stopper-", idx)));
    threads.back()->start();
  }
  for (const auto& thread : threads)
  {
    thread->post([&]()
    {
      xport.stop();
      ++n_stopped;
    });
  }
  ASSERT_TRUE(wait_until([&]() { return n_stopped == N_THREADS; }, seconds(10)));
  threads.clear();

  EXPECT_EQ(xport.state(), State::S_STOPPED);
  EXPECT_FALSE(xport.restart_status().m_active);
  EXPECT_EQ(logger.count(S_TEARDOWN_LINE), 1u);
  for (const auto& lis : listeners)
  {
    EXPECT_EQ(logger.count(terminal_error_line(*lis)), 1u) << "Listener [" << *lis << "].";
    Ble_msg msg;
    Error_code err_code;
    lis->timed_await(&msg, milliseconds(0), &err_code);
    EXPECT_EQ(err_code, error::Code::S_XPORT_STOPPED) << "Listener [" << *lis << "].";
  }
}

TEST(Ble_xport, Stop_racing_host_failure_tears_down_once)
{
  /* The host fails (exits, or loses sync) about 500ms after sync; stop() lands just before, at, or just after
   * that.  Exactly one of the two tears the transport down; and the other never restarts it. */
  for (const std::string mode : { "exit-after-sync", "sync-lost" })
  {
    for (const auto delay : { milliseconds(450), milliseconds(500), milliseconds(550) })
    {
      Watching_logger logger(flow::log::Sev::S_TRACE);
      auto cfg = fake_host_xport_config(mode);
      cfg.m_restart_delay = seconds(5);
      Ble_xport xport(&logger, cfg);
      xport.start();
      const auto lis = listen_to_events(&logger, &xport);
      const auto ctx = flow::util::ostream_op_string("Mode [", mode, "]; delay [", delay.count(), " ms].");

      flow::util::this_thread::sleep_for(delay);
      xport.stop();
      flow::util::this_thread::sleep_for(milliseconds(300)); // Let any shutdown posted by the failure run.

      EXPECT_EQ(xport.state(), State::S_STOPPED) << ctx;
      EXPECT_EQ(logger.count(S_TEARDOWN_LINE), 1u) << ctx;
      EXPECT_EQ(logger.count(terminal_error_line(*lis)), 1u) << ctx;
      EXPECT_EQ(xport.restart_status().m_n_attempts, 0u) << ctx;

      Ble_msg msg;
      Error_code err_code;
      lis->timed_await(&msg, milliseconds(0), &err_code);
      EXPECT_TRUE((err_code == error::Code::S_XPORT_STOPPED) || (err_code == error::Code::S_CHILD_FAILED)
                  || (err_code == error::Code::S_SYNC_LOST)) << ctx << "  Error [" << err_code << "].";
    }
  }
}

TEST(Ble_xport, Destroy_while_started)
{
  Test_logger logger;
  const auto cfg = fake_host_xport_config("synced");
  {
    Ble_xport xport(&logger, cfg);
    xport.start();
  }
  EXPECT_FALSE(fs::exists(cfg.m_sock_path));
}

} // namespace blex::transport::test
