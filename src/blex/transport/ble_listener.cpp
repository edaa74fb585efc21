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
#include "blex/transport/ble_listener.hpp"
#include "blex/transport/error.hpp"
#include <flow/error/error.hpp>
#include <boost/chrono/round.hpp>

namespace blex::transport
{

// Implementations.

Ble_listener::Ble_listener(flow::log::Logger* logger_ptr, util::String_view nickname) :
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSPORT),
  m_nickname(nickname)
{
  FLOW_LOG_TRACE("Listener [" << *this << "]: Created.");
}

void Ble_listener::await(Ble_msg* target, Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { await(target, actual_err_code); },
         err_code, "Ble_listener::await()"))
  {
    return;
  }
  // else

  Lock lock(m_mutex);
  m_cond.wait(lock, [&]() -> bool { return m_err_code || (!m_msgs.empty()); });
  take_one(target, err_code);
}

void Ble_listener::timed_await(Ble_msg* target, util::Fine_duration timeout, Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { timed_await(target, timeout, actual_err_code); },
         err_code, "Ble_listener::timed_await()"))
  {
    return;
  }
  // else

  using boost::chrono::round;
  using boost::chrono::milliseconds;

  Lock lock(m_mutex);
  if (!m_cond.wait_for(lock, timeout, [&]() -> bool { return m_err_code || (!m_msgs.empty()); }))
  {
    FLOW_LOG_TRACE("Listener [" << *this << "]: Nothing arrived within "
                   "[" << round<milliseconds>(timeout) << "].");
    *err_code = error::Code::S_TIMEOUT;
    return;
  }
  // else
  take_one(target, err_code);
}

void Ble_listener::take_one(Ble_msg* target, Error_code* err_code)
{
  assert(target && err_code);

  // The error wins: whatever is still queued was delivered over a transport that is now dead.
  if (m_err_code)
  {
    *err_code = m_err_code;
    return;
  }
  // else

  assert(!m_msgs.empty());
  *target = std::move(m_msgs.front());
  m_msgs.pop_front();
  err_code->clear();
}

void Ble_listener::on_msg(Ble_msg&& msg)
{
  Lock lock(m_mutex);
  if (m_err_code)
  {
    FLOW_LOG_TRACE("Listener [" << *this << "]: Message [" << msg.base() << "] arrived after terminal error; "
                   "dropping.");
    return;
  }
  // else

  m_msgs.emplace_back(std::move(msg));
  m_cond.notify_all();
}

bool Ble_listener::on_error(const Error_code& err_code)
{
  assert(err_code && "Broke contract.");

  Lock lock(m_mutex);
  if (m_err_code)
  {
    FLOW_LOG_TRACE("Listener [" << *this << "]: Error [" << err_code << "] [" << err_code.message() << "] "
                   "ignored: already have terminal error [" << m_err_code << "].");
    return false;
  }
  // else

  FLOW_LOG_TRACE("Listener [" << *this << "]: Terminal error [" << err_code << "] [" << err_code.message() << "]; "
                 "dropping [" << m_msgs.size() << "] queued messages if any.");
  m_err_code = err_code;
  m_msgs.clear();
  m_cond.notify_all();
  return true;
}

const std::string& Ble_listener::nickname() const
{
  return m_nickname;
}

std::ostream& operator<<(std::ostream& os, const Ble_listener& val)
{
  return os << '[' << val.nickname() << "]@" << static_cast<const void*>(&val);
}

} // namespace blex::transport
