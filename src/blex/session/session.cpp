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
#include "blex/session/session.hpp"
#include "blex/session/plain_session.hpp"
#include "blex/session/oic_session.hpp"
#include "blex/transport/ble_xport.hpp"
#include "blex/transport/error.hpp"
#include <flow/error/error.hpp>

namespace blex::session
{

// Implementations.

Session::Session(flow::log::Logger* logger_ptr, transport::Ble_xport* xport, const Session_config& cfg) :
  flow::log::Log_context(logger_ptr, Log_component::S_SESSION),
  m_xport(xport),
  m_cfg(cfg),
  m_open(false)
{
  assert(m_xport && "Broke contract.");
}

Session::~Session() = default;

void Session::open(Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { open(actual_err_code); },
         err_code, "Session::open()"))
  {
    return;
  }
  // else

  if (m_xport->state() != transport::Ble_xport::State::S_STARTED)
  {
    FLOW_LOG_WARNING("Session [" << *this << "]: Cannot open: transport state is [" << m_xport->state() << "].");
    *err_code = transport::error::Code::S_XPORT_NOT_STARTED;
    return;
  }
  // else

  if (!m_open.exchange(true))
  {
    FLOW_LOG_INFO("Session [" << *this << "]: Opened.");
  }
  err_code->clear();
}

void Session::close()
{
  if (m_open.exchange(false))
  {
    FLOW_LOG_INFO("Session [" << *this << "]: Closed.");
  }
}

bool Session::is_open() const
{
  return m_open;
}

util::Fine_duration Session::rsp_timeout() const
{
  return m_xport->rsp_timeout();
}

void Session::tx_request(transport::Msg_type type, const nlohmann::json& fields, transport::Ble_msg* rsp,
                         Error_code* err_code)
{
  using transport::Msg_base;
  using transport::Msg_op;
  using transport::Msg_type;
  using transport::Ble_listener;

  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { tx_request(type, fields, rsp, actual_err_code); },
         err_code, "Session::tx_request()"))
  {
    return;
  }
  // else

  assert(rsp);

  if (!is_open())
  {
    FLOW_LOG_WARNING("Session [" << *this << "]: Cannot send [" << type << "] request: not open.");
    *err_code = transport::error::Code::S_SESSION_NOT_OPEN;
    return;
  }
  // else

  const auto seq = m_xport->next_seq();
  const Msg_base selector{ Msg_op::S_WILDCARD, Msg_type::S_WILDCARD, seq, Msg_base::S_CONN_HANDLE_NONE };
  auto listener = std::make_shared<Ble_listener>(get_logger(), flow::util::ostream_op_string("rsp-", seq));
  const auto dispatcher = m_xport->dispatcher();

  dispatcher->add_listener(selector, listener, err_code);
  if (*err_code)
  {
    return;
  }
  // else

  FLOW_LOG_TRACE("Session [" << *this << "]: Sending [" << type << "] request seq [" << seq << "].");
  m_xport->tx(transport::encode_msg(get_logger(),
                                    Msg_base{ Msg_op::S_REQ, type, seq, Msg_base::S_CONN_HANDLE_NONE },
                                    fields),
              err_code);
  if (!*err_code)
  {
    listener->timed_await(rsp, rsp_timeout(), err_code);
  }
  dispatcher->remove_listener(selector);

  if (*err_code)
  {
    FLOW_LOG_WARNING("Session [" << *this << "]: Request seq [" << seq << "] failed [" << *err_code << "] "
                     "[" << err_code->message() << "].");
  }
} // Session::tx_request()

const Session_config& Session::config() const
{
  return m_cfg;
}

std::unique_ptr<Session> build_session(transport::Ble_xport* xport, const Session_config& cfg,
                                       Error_code* err_code)
{
  using flow::error::Runtime_error;

  std::unique_ptr<Session> sesn;
  switch (cfg.m_mgmt_proto)
  {
  case Mgmt_proto::S_NMP:
    sesn.reset(new Plain_session(xport->get_logger(), xport, cfg));
    break;
  case Mgmt_proto::S_OMP:
    sesn.reset(new Oic_session(xport->get_logger(), xport, cfg));
    break;
  case Mgmt_proto::S_END_SENTINEL:
    break;
  }

  if (!sesn)
  {
    FLOW_LOG_SET_CONTEXT(xport->get_logger(), Log_component::S_SESSION);
    FLOW_LOG_WARNING("Invalid management protocol [" << cfg.m_mgmt_proto << "]; expected NMP or OMP.");
    const Error_code bad_proto_err_code = transport::error::Code::S_INVALID_MGMT_PROTO;
    if (!err_code)
    {
      throw Runtime_error(bad_proto_err_code, "build_session()");
    }
    // else
    *err_code = bad_proto_err_code;
    return sesn;
  }
  // else

  if (err_code)
  {
    err_code->clear();
  }
  return sesn;
} // build_session()

std::ostream& operator<<(std::ostream& os, Mgmt_proto val)
{
  switch (val)
  {
  case Mgmt_proto::S_NMP:
    return os << "NMP";
  case Mgmt_proto::S_OMP:
    return os << "OMP";
  case Mgmt_proto::S_END_SENTINEL:
    break;
  }
  return os << "UNKNOWN(" << int(val) << ')';
}

std::ostream& operator<<(std::ostream& os, const Session& val)
{
  return os << '[' << val.mgmt_proto() << ':' << val.config().m_peer_name << "]@" << static_cast<const void*>(&val);
}

} // namespace blex::session
