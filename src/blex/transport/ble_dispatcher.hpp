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

#include "blex/transport/ble_listener.hpp"
#include <memory>
#include <utility>
#include <vector>

namespace blex::transport
{

// Types.

/**
 * Routes each inbound message from the host to at most one registered Ble_listener, chosen by selector.
 *
 * A selector is a Msg_base whose fields may be wildcards (see selector_matches()).  Registrations are unique by
 * exact selector equality.  Routing of a decoded message `M`:
 *   -# First, among listeners whose selector has a specific sequence number (not Msg_base::S_SEQ_NONE), the first
 *      (in registration order) whose selector matches `M`.  This is how a response finds the caller that sent the
 *      corresponding request.
 *   -# Failing that, the first (in registration order) remaining listener whose selector matches `M`.
 *   -# Failing that, `M` is logged and dropped.
 *
 * Bytes that fail to decode are logged and dropped; no listener sees them.
 *
 * ### Thread safety ###
 * All methods are safe to call concurrently.  Listener callbacks (Ble_listener::on_msg(), Ble_listener::on_error())
 * are invoked without the internal lock held.
 */
class Ble_dispatcher :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Types.

  /// Short-hand for the shared handle to a listener.  The registering caller keeps its own copy to await() on.
  using Listener_ptr = std::shared_ptr<Ble_listener>;

  // Constructors/destructor.

  /**
   * Constructs dispatcher with no listeners.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   */
  explicit Ble_dispatcher(flow::log::Logger* logger_ptr);

  // Methods.

  /**
   * Registers `listener` under `selector`.
   *
   * @param selector
   *        Selector; may contain wildcards.
   * @param listener
   *        Non-null listener.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_LISTENER_SELECTOR_IN_USE (a listener is already registered under an equal selector;
   *        nothing changed).
   */
  void add_listener(const Msg_base& selector, Listener_ptr listener, Error_code* err_code = 0);

  /**
   * Unregisters the listener registered under exactly `selector`, if any.  The listener itself is unaffected.
   *
   * @param selector
   *        Selector given to add_listener().
   * @return The listener that was removed; or null if none was registered under that selector.
   */
  Listener_ptr remove_listener(const Msg_base& selector);

  /**
   * Decodes the given bytes and delivers the resulting message to the matching listener, if any.
   *
   * @param buf
   *        One complete message body as received from the host.
   */
  void dispatch(const util::Blob_const& buf);

  /**
   * Delivers `err_code` to every currently registered listener.  Listeners stay registered.  A listener that
   * already holds a terminal error ignores it.
   *
   * @param err_code
   *        Truthy error.
   */
  void error_all(const Error_code& err_code);

  /// Unregisters all listeners without notifying them.
  void clear();

  /**
   * Number of registered listeners.
   * @return See above.
   */
  size_t n_listeners() const;

private:
  // Types.

  /// Short-hand for mutex type.
  using Mutex = flow::util::Mutex_non_recursive;

  /// Short-hand for lock type.
  using Lock = flow::util::Lock_guard<Mutex>;

  /// A registration.
  using Entry = std::pair<Msg_base, Listener_ptr>;

  /// Registrations, in registration order.
  using Entries = std::vector<Entry>;

  // Methods.

  /**
   * With #m_mutex locked: finds the listener to which a message with the given envelope routes.
   *
   * @param msg_base
   *        Envelope of decoded message.
   * @return See above; null if none.
   */
  Listener_ptr route(const Msg_base& msg_base) const;

  /**
   * With #m_mutex locked: finds the registration under exactly `selector`.
   *
   * @param selector
   *        Selector.
   * @return Iterator into #m_entries; `end()` if none.
   */
  Entries::iterator find_entry(const Msg_base& selector);

  // Data.

  /// Protects #m_entries.
  mutable Mutex m_mutex;

  /// Registrations, in registration order.  Protected by #m_mutex.
  Entries m_entries;
}; // class Ble_dispatcher

} // namespace blex::transport
