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

/// @file
#pragma once

#include "blex/util/util_fwd.hpp"
#include <flow/util/util.hpp>
#include <boost/thread/condition_variable.hpp>
#include <deque>
#include <limits>

namespace blex::util
{

// Types.

/**
 * Thread-safe FIFO queue of `Value`s with optional bounded depth, blocking push/pop, and a one-way close()
 * that releases every blocked pusher and popper at once.
 *
 * This is the hand-off point between a producer thread (typically a boost.asio worker that has just read a whole
 * message off a socket) and a consumer thread that blocks awaiting the next item.  close() is the broadcast
 * shutdown primitive: after it, push() fails immediately, and pop() drains nothing further and fails
 * immediately.  There is no way to reopen a queue; make a new one.
 *
 * ### Thread safety ###
 * All methods are safe to call concurrently.
 *
 * @tparam Value
 *         Movable value type.
 */
template<typename Value>
class Sync_queue :
  private boost::noncopyable
{
public:
  // Constants.

  /// Depth to pass to ctor for no bound.
  static constexpr size_t S_UNBOUNDED = std::numeric_limits<size_t>::max();

  // Constructors/destructor.

  /**
   * Constructs open, empty queue.
   *
   * @param max_depth
   *        push() blocks while this many items are queued.  Must be positive.
   */
  explicit Sync_queue(size_t max_depth = S_UNBOUNDED);

  // Methods.

  /**
   * Enqueues `val`, blocking while the queue is at its max depth.
   *
   * @param val
   *        Value to move-in.
   * @return `true` if enqueued; `false` if the queue was (or became, while blocked) closed; `val` is then
   *         untouched.
   */
  bool push(Value&& val);

  /**
   * Dequeues the oldest item, blocking until one is available.
   *
   * @param target
   *        On success the item is moved here.
   * @return `true` if dequeued; `false` if the queue was (or became, while blocked) closed.
   */
  bool pop(Value* target);

  /**
   * Same as pop() but gives up after `timeout`.
   *
   * @param target
   *        See pop().
   * @param timeout
   *        Max time to block.
   * @param timed_out
   *        Set to `true` if and only if `false` is returned due to the timeout expiring.
   * @return See pop().
   */
  bool timed_pop(Value* target, Fine_duration timeout, bool* timed_out);

  /// Closes the queue, waking all blocked push() and pop() calls which then return `false`.  Idempotent.
  void close();

  /**
   * Returns `true` if and only if close() has been called.
   * @return See above.
   */
  bool closed() const;

  /**
   * Returns the number of items currently queued.
   * @return See above.
   */
  size_t size() const;

private:
  // Types.

  /// Short-hand for mutex type.
  using Mutex = flow::util::Mutex_non_recursive;

  /// Short-hand for lock type.
  using Lock = flow::util::Lock_guard<Mutex>;

  // Data.

  /// See ctor.
  const size_t m_max_depth;

  /// Protects the data below.
  mutable Mutex m_mutex;

  /// Notified when an item is pushed, or on close().
  boost::condition_variable m_not_empty;

  /// Notified when an item is popped, or on close().
  boost::condition_variable m_not_full;

  /// The items, oldest at front.
  std::deque<Value> m_items;

  /// See closed().
  bool m_closed;
}; // class Sync_queue

// Template implementations.

template<typename Value>
Sync_queue<Value>::Sync_queue(size_t max_depth) :
  m_max_depth(max_depth),
  m_closed(false)
{
  assert((m_max_depth != 0) && "Broke contract.");
}

template<typename Value>
bool Sync_queue<Value>::push(Value&& val)
{
  Lock lock(m_mutex);
  m_not_full.wait(lock, [&]() -> bool { return m_closed || (m_items.size() < m_max_depth); });
  if (m_closed)
  {
    return false;
  }
  // else

  m_items.emplace_back(std::move(val));
  m_not_empty.notify_one();
  return true;
}

template<typename Value>
bool Sync_queue<Value>::pop(Value* target)
{
  assert(target);

  Lock lock(m_mutex);
  m_not_empty.wait(lock, [&]() -> bool { return m_closed || (!m_items.empty()); });
  if (m_closed)
  {
    return false;
  }
  // else

  *target = std::move(m_items.front());
  m_items.pop_front();
  m_not_full.notify_one();
  return true;
}

template<typename Value>
bool Sync_queue<Value>::timed_pop(Value* target, Fine_duration timeout, bool* timed_out)
{
  assert(target && timed_out);

  *timed_out = false;

  Lock lock(m_mutex);
  if (!m_not_empty.wait_for(lock, timeout, [&]() -> bool { return m_closed || (!m_items.empty()); }))
  {
    *timed_out = true;
    return false;
  }
  // else
  if (m_closed)
  {
    return false;
  }
  // else

  *target = std::move(m_items.front());
  m_items.pop_front();
  m_not_full.notify_one();
  return true;
}

template<typename Value>
void Sync_queue<Value>::close()
{
  Lock lock(m_mutex);
  if (m_closed)
  {
    return;
  }
  // else

  m_closed = true;
  m_items.clear();
  m_not_empty.notify_all();
  m_not_full.notify_all();
}

template<typename Value>
bool Sync_queue<Value>::closed() const
{
  Lock lock(m_mutex);
  return m_closed;
}

template<typename Value>
size_t Sync_queue<Value>::size() const
{
  Lock lock(m_mutex);
  return m_items.size();
}

} // namespace blex::util
