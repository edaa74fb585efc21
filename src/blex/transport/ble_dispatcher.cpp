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
#include "blex/transport/ble_dispatcher.hpp"
#include "blex/transport/error.hpp"
#include <flow/error/error.hpp>
#include <algorithm>

namespace blex::transport
{

// Implementations.

Ble_dispatcher::Ble_dispatcher(flow::log::Logger* logger_ptr) :
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSPORT)
{
  // That's it.
}

void Ble_dispatcher::add_listener(const Msg_base& selector, Listener_ptr listener, Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { add_listener(selector, listener, actual_err_code); },
         err_code, "Ble_dispatcher::add_listener()"))
  {
    return;
  }
  // else

  assert(listener && "Broke contract.");

  Lock lock(m_mutex);
  if (find_entry(selector) != m_entries.end())
  {
    FLOW_LOG_WARNING("Dispatcher [" << this << "]: Cannot register listener [" << *listener << "] under "
                     "selector [" << selector << "]: a listener is already registered under that selector.");
    *err_code = error::Code::S_LISTENER_SELECTOR_IN_USE;
    return;
  }
  // else

  FLOW_LOG_TRACE("Dispatcher [" << this << "]: Registered listener [" << *listener << "] under "
                 "selector [" << selector << "]; [" << (m_entries.size() + 1) << "] registered now.");
  m_entries.emplace_back(selector, std::move(listener));
  err_code->clear();
} // Ble_dispatcher::add_listener()

Ble_dispatcher::Listener_ptr Ble_dispatcher::remove_listener(const Msg_base& selector)
{
  Lock lock(m_mutex);
  const auto it = find_entry(selector);
  if (it == m_entries.end())
  {
    FLOW_LOG_TRACE("Dispatcher [" << this << "]: Nothing registered under selector [" << selector << "]; "
                   "removal is a no-op.");
    return Listener_ptr();
  }
  // else

  auto listener = std::move(it->second);
  m_entries.erase(it);
  FLOW_LOG_TRACE("Dispatcher [" << this << "]: Unregistered listener [" << *listener << "] from "
                 "selector [" << selector << "]; [" << m_entries.size() << "] registered now.");
  return listener;
}

void Ble_dispatcher::dispatch(const util::Blob_const& buf)
{
  Ble_msg msg;
  Error_code err_code;
  decode_msg(buf, &msg, &err_code);
  if (err_code)
  {
    // decode_msg() has logged the details.
    FLOW_LOG_WARNING("Dispatcher [" << this << "]: Inbound message of size [" << buf.size() << "] could not be "
                     "decoded [" << err_code << "] [" << err_code.message() << "]; dropping it.");
    return;
  }
  // else

  Listener_ptr listener;
  {
    Lock lock(m_mutex);
    listener = route(msg.base());
  }

  if (!listener)
  {
    FLOW_LOG_INFO("Dispatcher [" << this << "]: No listener for inbound message [" << msg.base() << "]; "
                  "dropping it.");
    return;
  }
  // else

  FLOW_LOG_TRACE("Dispatcher [" << this << "]: Inbound message [" << msg.base() << "] routed to "
                 "listener [" << *listener << "].");
  listener->on_msg(std::move(msg));
} // Ble_dispatcher::dispatch()

void Ble_dispatcher::error_all(const Error_code& err_code)
{
  assert(err_code && "Broke contract.");

  std::vector<Listener_ptr> listeners;
  {
    Lock lock(m_mutex);
    listeners.reserve(m_entries.size());
    for (const auto& entry : m_entries)
    {
      listeners.push_back(entry.second);
    }
  }

  FLOW_LOG_INFO("Dispatcher [" << this << "]: Delivering error [" << err_code << "] [" << err_code.message() << "] "
                "to [" << listeners.size() << "] listeners.");
  for (const auto& listener : listeners)
  {
    listener->on_error(err_code);
  }
}

void Ble_dispatcher::clear()
{
  Lock lock(m_mutex);
  if (!m_entries.empty())
  {
    FLOW_LOG_INFO("Dispatcher [" << this << "]: Unregistering all [" << m_entries.size() << "] listeners.");
    m_entries.clear();
  }
}

size_t Ble_dispatcher::n_listeners() const
{
  Lock lock(m_mutex);
  return m_entries.size();
}

Ble_dispatcher::Listener_ptr Ble_dispatcher::route(const Msg_base& msg_base) const
{
  // Sequence-keyed selectors first, so that a response reaches whoever sent the request.
  for (const auto& entry : m_entries)
  {
    if ((entry.first.m_seq != Msg_base::S_SEQ_NONE) && selector_matches(entry.first, msg_base))
    {
      return entry.second;
    }
  }
  for (const auto& entry : m_entries)
  {
    if ((entry.first.m_seq == Msg_base::S_SEQ_NONE) && selector_matches(entry.first, msg_base))
    {
      return entry.second;
    }
  }
  return Listener_ptr();
}

Ble_dispatcher::Entries::iterator Ble_dispatcher::find_entry(const Msg_base& selector)
{
  return std::find_if(m_entries.begin(), m_entries.end(),
                      [&](const Entry& entry) -> bool { return entry.first == selector; });
}

} // namespace blex::transport
