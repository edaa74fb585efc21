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

#include "blex/transport/ble_dispatcher.hpp"
#include "blex/transport/error.hpp"
#include "blex/test/test_logger.hpp"
#include <gtest/gtest.h>
#include <flow/async/single_thread_task_loop.hpp>
#include <flow/error/error.hpp>
#include <boost/chrono.hpp>
#include <memory>
#include <string>

namespace blex::transport::test
{

namespace
{

using boost::chrono::milliseconds;
using std::make_shared;
using std::string;
using Listener_ptr = Ble_dispatcher::Listener_ptr;

constexpr auto S_ANY_SEQ = Msg_base::S_SEQ_NONE;
constexpr auto S_ANY_CONN = Msg_base::S_CONN_HANDLE_NONE;

/// Feeds `text` to `dispatcher` as if it arrived from the host.
void feed(Ble_dispatcher* dispatcher, const string& text)
{
  dispatcher->dispatch(util::Blob_const(text.data(), text.size()));
}

/// Expects `listener` to have a message already; returns it.
Ble_msg expect_msg(Ble_listener* listener)
{
  Ble_msg msg;
  Error_code err_code;
  listener->timed_await(&msg, milliseconds(0), &err_code);
  EXPECT_FALSE(err_code) << "Error [" << err_code << "] [" << err_code.message() << "].";
  return msg;
}

/// Expects `listener` to have nothing pending.
void expect_nothing(Ble_listener* listener)
{
  Ble_msg msg;
  Error_code err_code;
  listener->timed_await(&msg, milliseconds(0), &err_code);
  EXPECT_EQ(err_code, error::Code::S_TIMEOUT);
}

} // namespace (anon)

TEST(Ble_listener, Delivers_in_order_then_times_out)
{
  blex::test::Test_logger logger;
  Ble_listener listener(&logger, "lis");
  listener.on_msg(Ble_msg({ Msg_op::S_EVT, Msg_type::S_SCAN_EVT, S_ANY_SEQ, S_ANY_CONN }, { { "n", 1 } }));
  listener.on_msg(Ble_msg({ Msg_op::S_EVT, Msg_type::S_SCAN_EVT, S_ANY_SEQ, S_ANY_CONN }, { { "n", 2 } }));

  EXPECT_EQ(expect_msg(&listener).body().at("n"), 1);
  EXPECT_EQ(expect_msg(&listener).body().at("n"), 2);

  Ble_msg msg;
  EXPECT_THROW(listener.timed_await(&msg, milliseconds(10)), flow::error::Runtime_error);
}

TEST(Ble_listener, Error_is_sticky_and_preempts_messages)
{
  blex::test::Test_logger logger;
  Ble_listener listener(&logger, "lis");
  listener.on_msg(Ble_msg({ Msg_op::S_EVT, Msg_type::S_SCAN_EVT, S_ANY_SEQ, S_ANY_CONN }, {}));

  EXPECT_TRUE(listener.on_error(error::Code::S_CHILD_FAILED));
  EXPECT_FALSE(listener.on_error(error::Code::S_XPORT_STOPPED)); // First one wins.
  listener.on_msg(Ble_msg({ Msg_op::S_EVT, Msg_type::S_SCAN_EVT, S_ANY_SEQ, S_ANY_CONN }, {})); // Dropped.

  for (int i = 0; i != 2; ++i)
  {
    Ble_msg msg;
    Error_code err_code;
    listener.await(&msg, &err_code);
    EXPECT_EQ(err_code, error::Code::S_CHILD_FAILED);
  }
}

TEST(Ble_listener, Await_wakes_on_message_from_other_thread)
{
  blex::test::Test_logger logger;
  Ble_listener listener(&logger, "lis");

  flow::async::Single_thread_task_loop sender(&logger, "sender");
  sender.start();
  sender.schedule_from_now(milliseconds(50), [&](bool)
  {
    listener.on_msg(Ble_msg({ Msg_op::S_RSP, Msg_type::S_SYNC, 3, S_ANY_CONN }, { { "synced", true } }));
  });

  Ble_msg msg;
  listener.await(&msg);
  EXPECT_EQ(msg.base().m_seq, 3);
  EXPECT_EQ(msg.synced(), std::optional<bool>(true));
}

TEST(Ble_dispatcher, Routes_by_seq_before_type)
{
  blex::test::Test_logger logger;
  Ble_dispatcher dispatcher(&logger);

  const auto by_type = make_shared<Ble_listener>(&logger, "by-type");
  const auto by_seq = make_shared<Ble_listener>(&logger, "by-seq");
  // Type-keyed one registered first; the seq-keyed one must still win for its seq.
  dispatcher.add_listener({ Msg_op::S_RSP, Msg_type::S_CONNECT, S_ANY_SEQ, S_ANY_CONN }, by_type);
  dispatcher.add_listener({ Msg_op::S_WILDCARD, Msg_type::S_WILDCARD, 10, S_ANY_CONN }, by_seq);
  EXPECT_EQ(dispatcher.n_listeners(), 2u);

  feed(&dispatcher, R"({"op":"response","type":"connect","seq":10,"status":0})");
  EXPECT_EQ(expect_msg(by_seq.get()).base().m_seq, 10);
  expect_nothing(by_type.get());

  feed(&dispatcher, R"({"op":"response","type":"connect","seq":11,"status":0})");
  EXPECT_EQ(expect_msg(by_type.get()).base().m_seq, 11);
  expect_nothing(by_seq.get());
}

TEST(Ble_dispatcher, Drops_undecodable_and_unroutable)
{
  blex::test::Test_logger logger;
  Ble_dispatcher dispatcher(&logger);
  const auto lis = make_shared<Ble_listener>(&logger, "evt");
  dispatcher.add_listener({ Msg_op::S_EVT, Msg_type::S_SYNC_EVT, S_ANY_SEQ, S_ANY_CONN }, lis);

  feed(&dispatcher, "garbage");
  feed(&dispatcher, R"({"op":"event","type":"scan_evt"})");
  expect_nothing(lis.get());

  feed(&dispatcher, R"({"op":"event","type":"sync_evt","synced":false})");
  EXPECT_EQ(expect_msg(lis.get()).synced(), std::optional<bool>(false));
}

TEST(Ble_dispatcher, Duplicate_selector_rejected_and_remove)
{
  blex::test::Test_logger logger;
  Ble_dispatcher dispatcher(&logger);
  const Msg_base selector{ Msg_op::S_WILDCARD, Msg_type::S_WILDCARD, 4, S_ANY_CONN };
  const auto lis1 = make_shared<Ble_listener>(&logger, "1");
  const auto lis2 = make_shared<Ble_listener>(&logger, "2");

  dispatcher.add_listener(selector, lis1);
  Error_code err_code;
  dispatcher.add_listener(selector, lis2, &err_code);
  EXPECT_EQ(err_code, error::Code::S_LISTENER_SELECTOR_IN_USE);
  EXPECT_THROW(dispatcher.add_listener(selector, lis2), flow::error::Runtime_error);
  EXPECT_EQ(dispatcher.n_listeners(), 1u);

  EXPECT_EQ(dispatcher.remove_listener(selector), lis1);
  EXPECT_EQ(dispatcher.remove_listener(selector), Listener_ptr());
  EXPECT_EQ(dispatcher.n_listeners(), 0u);

  dispatcher.add_listener(selector, lis2); // Free again.
  EXPECT_EQ(dispatcher.n_listeners(), 1u);
}

TEST(Ble_dispatcher, Error_all_reaches_every_listener)
{
  blex::test::Test_logger logger;
  Ble_dispatcher dispatcher(&logger);
  const auto lis1 = make_shared<Ble_listener>(&logger, "1");
  const auto lis2 = make_shared<Ble_listener>(&logger, "2");
  dispatcher.add_listener({ Msg_op::S_WILDCARD, Msg_type::S_WILDCARD, 1, S_ANY_CONN }, lis1);
  dispatcher.add_listener({ Msg_op::S_EVT, Msg_type::S_WILDCARD, S_ANY_SEQ, S_ANY_CONN }, lis2);

  dispatcher.error_all(error::Code::S_SYNC_LOST);
  EXPECT_EQ(dispatcher.n_listeners(), 2u);

  for (const auto& lis : { lis1, lis2 })
  {
    Ble_msg msg;
    Error_code err_code;
    lis->timed_await(&msg, milliseconds(0), &err_code);
    EXPECT_EQ(err_code, error::Code::S_SYNC_LOST);
  }

  dispatcher.clear();
  EXPECT_EQ(dispatcher.n_listeners(), 0u);
}

} // namespace blex::transport::test
