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

#include "blex/transport/ble_msg.hpp"
#include <flow/log/log.hpp>
#include <flow/util/util.hpp>
#include <boost/thread/condition_variable.hpp>
#include <deque>
#include <string>

namespace blex::transport
{

// Types.

/**
 * A caller's handle for receiving the inbound messages matching one selector, plus the terminal error that ends
 * its usefulness.  The caller creates it (via `make_shared`), registers it with Ble_dispatcher::add_listener()
 * under a selector, then blocks in await() / timed_await() for each message; when done it unregisters it via
 * Ble_dispatcher::remove_listener().
 *
 * Delivery semantics:
 *   - Messages are delivered in the order dispatched, any number of them.
 *   - At most one error is ever delivered (the first; any later ones are ignored).  It is terminal: once it has
 *     arrived, every await() returns it immediately, even if messages remain queued.  Ble_dispatcher::error_all()
 *     is how the transport guarantees that nobody blocks forever on a dead transport.
 *
 * ### Thread safety ###
 * All methods are safe to call concurrently.  Typically exactly one thread awaits, while the transport's
 * receive thread (and its shutdown path) feed it.
 */
class Ble_listener :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /**
   * Constructs listener with nothing queued and no error.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   * @param nickname
   *        Human-readable nickname, used only in logging.
   */
  explicit Ble_listener(flow::log::Logger* logger_ptr, util::String_view nickname);

  // Methods.

  /**
   * Blocks until a message or the terminal error is available, then returns it.
   *
   * @param target
   *        On success the oldest queued message is moved here; untouched otherwise.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        whatever error was delivered via on_error() (e.g., error::Code::S_CHILD_FAILED).
   */
  void await(Ble_msg* target, Error_code* err_code = 0);

  /**
   * Identical to await() but gives up after `timeout`.
   *
   * @param target
   *        See await().
   * @param timeout
   *        Max time to block.
   * @param err_code
   *        See await().  In addition: error::Code::S_TIMEOUT.
   */
  void timed_await(Ble_msg* target, util::Fine_duration timeout, Error_code* err_code = 0);

  /**
   * Queues a message for await().  No-op if the terminal error has already arrived.  Used by Ble_dispatcher.
   *
   * @param msg
   *        The message.
   */
  void on_msg(Ble_msg&& msg);

  /**
   * Delivers the terminal error.  Only the first call has any effect.  Used by Ble_dispatcher.
   *
   * @param err_code
   *        Truthy error.
   * @return `true` if this was the first error (hence delivered); `false` if ignored.
   */
  bool on_error(const Error_code& err_code);

  /**
   * Nickname from ctor.
   * @return See above.
   */
  const std::string& nickname() const;

private:
  // Types.

  /// Short-hand for mutex type.
  using Mutex = flow::util::Mutex_non_recursive;

  /// Short-hand for lock type.
  using Lock = flow::util::Lock_guard<Mutex>;

  // Methods.

  /**
   * Helper for await() and timed_await(): with `lock` held and something available, hands it out.
   *
   * @param target
   *        See await().
   * @param err_code
   *        Not null.
   */
  void take_one(Ble_msg* target, Error_code* err_code);

  // Data.

  /// See nickname().
  const std::string m_nickname;

  /// Protects the data below.
  mutable Mutex m_mutex;

  /// Notified when a message or the error arrives.
  boost::condition_variable m_cond;

  /// Messages awaiting await(), oldest at front.
  std::deque<Ble_msg> m_msgs;

  /// Falsy until the terminal error arrives; then that error forever.
  Error_code m_err_code;
}; // class Ble_listener

// Free functions.

/**
 * Prints string representation of the given listener to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Ble_listener& val);

} // namespace blex::transport
