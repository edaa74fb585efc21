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

#include "blex/util/sync_queue.hpp"
#include <gtest/gtest.h>
#include <flow/async/single_thread_task_loop.hpp>
#include <boost/chrono.hpp>
#include <atomic>
#include <string>

namespace blex::util::test
{

namespace
{
using boost::chrono::milliseconds;
using std::string;
}

TEST(Sync_queue, Fifo_order)
{
  Sync_queue<string> q;
  EXPECT_TRUE(q.push("a"));
  EXPECT_TRUE(q.push("b"));
  EXPECT_TRUE(q.push("c"));
  EXPECT_EQ(q.size(), 3u);

  string val;
  ASSERT_TRUE(q.pop(&val));
  EXPECT_EQ(val, "a");
  ASSERT_TRUE(q.pop(&val));
  EXPECT_EQ(val, "b");
  ASSERT_TRUE(q.pop(&val));
  EXPECT_EQ(val, "c");
  EXPECT_EQ(q.size(), 0u);
}

TEST(Sync_queue, Timed_pop_times_out_when_empty)
{
  Sync_queue<int> q;
  int val = 0;
  bool timed_out = false;
  EXPECT_FALSE(q.timed_pop(&val, milliseconds(20), &timed_out));
  EXPECT_TRUE(timed_out);

  q.push(5);
  EXPECT_TRUE(q.timed_pop(&val, milliseconds(20), &timed_out));
  EXPECT_FALSE(timed_out);
  EXPECT_EQ(val, 5);
}

TEST(Sync_queue, Close_wakes_blocked_pop)
{
  Sync_queue<int> q;
  std::atomic<bool> popped_ok(true);
  std::atomic<bool> done(false);

  flow::async::Single_thread_task_loop popper(nullptr, "popper");
  popper.start();
  popper.post([&]()
  {
    int val;
    popped_ok = q.pop(&val);
    done = true;
  });

  flow::util::this_thread::sleep_for(milliseconds(50));
  EXPECT_FALSE(done);
  q.close();
  popper.stop(); // Joins: the pop must have returned.
  EXPECT_TRUE(done);
  EXPECT_FALSE(popped_ok);
  EXPECT_TRUE(q.closed());
  EXPECT_FALSE(q.push(1));
}

TEST(Sync_queue, Bounded_push_waits_for_pop)
{
  Sync_queue<int> q(1);
  std::atomic<bool> pushed(false);
  q.push(1);

  flow::async::Single_thread_task_loop pusher(nullptr, "pusher");
  pusher.start();
  pusher.post([&]()
  {
    q.push(2);
    pushed = true;
  });

  flow::util::this_thread::sleep_for(milliseconds(50));
  EXPECT_FALSE(pushed);

  int val;
  ASSERT_TRUE(q.pop(&val));
  EXPECT_EQ(val, 1);
  ASSERT_TRUE(q.pop(&val)); // Blocks until the pusher gets in.
  EXPECT_EQ(val, 2);
  pusher.stop();
  EXPECT_TRUE(pushed);
}

} // namespace blex::util::test
