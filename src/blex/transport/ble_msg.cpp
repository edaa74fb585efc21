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
#include "blex/transport/ble_msg.hpp"
#include "blex/transport/error.hpp"
#include <flow/error/error.hpp>
#include <flow/util/blob.hpp>
#include <array>
#include <limits>
#include <string>

namespace blex::transport
{

namespace
{

/// Wire strings of the Msg_type values in `enum` order, up to but excluding Msg_type::S_UNKNOWN.
const std::array<util::String_view, size_t(Msg_type::S_UNKNOWN)> S_MSG_TYPE_STRS =
{{
  "error", "sync", "connect", "terminate", "disc_all_svcs", "disc_svc_uuid", "disc_all_chrs", "disc_chr_uuid",
  "write", "write_cmd", "exchange_mtu", "gen_rand_addr", "set_rand_addr", "conn_cancel", "scan", "scan_cancel",
  "set_preferred_mtu", "security_initiate", "conn_find", "reset",
  "sync_evt", "connect_evt", "disconnect_evt", "disc_svc_evt", "disc_chr_evt", "write_ack_evt", "notify_rx_evt",
  "mtu_change_evt", "scan_evt", "scan_tmo_evt", "enc_change_evt", "reset_evt"
}};

/// JSON key names of the envelope.
constexpr char S_KEY_OP[] = "op";
constexpr char S_KEY_TYPE[] = "type";
constexpr char S_KEY_SEQ[] = "seq";
constexpr char S_KEY_CONN_HANDLE[] = "conn_handle";
constexpr char S_KEY_SYNCED[] = "synced";

/**
 * Loads a JSON integer into an `int32_t`, if it is one and fits.
 *
 * @param val
 *        JSON value.
 * @param target
 *        Receives the value on success; untouched otherwise.
 * @return `false` if `val` is not an integer or is out of `int32_t` range.
 */
bool json_to_int32(const nlohmann::json& val, int32_t* target)
{
  using limits = std::numeric_limits<int32_t>;

  if (val.is_number_unsigned())
  {
    const auto uval = val.get<uint64_t>();
    if (uval > uint64_t(limits::max()))
    {
      return false;
    }
    // else
    *target = int32_t(uval);
    return true;
  }
  // else
  if (!val.is_number_integer())
  {
    return false;
  }
  // else

  const auto ival = val.get<int64_t>();
  if ((ival < limits::min()) || (ival > limits::max()))
  {
    return false;
  }
  // else
  *target = int32_t(ival);
  return true;
} // json_to_int32()

} // namespace (anon)

// Ble_msg implementations.

Ble_msg::Ble_msg() :
  m_base({ Msg_op::S_WILDCARD, Msg_type::S_WILDCARD, Msg_base::S_SEQ_NONE, Msg_base::S_CONN_HANDLE_NONE })
{
  // That's it.
}

Ble_msg::Ble_msg(const Msg_base& base, nlohmann::json body) :
  m_base(base),
  m_body(std::move(body))
{
  // That's it.
}

const Msg_base& Ble_msg::base() const
{
  return m_base;
}

const nlohmann::json& Ble_msg::body() const
{
  return m_body;
}

std::optional<bool> Ble_msg::synced() const
{
  if (!m_body.is_object())
  {
    return std::nullopt;
  }
  // else
  const auto it = m_body.find(S_KEY_SYNCED);
  if ((it == m_body.end()) || (!it->is_boolean()))
  {
    return std::nullopt;
  }
  // else
  return it->get<bool>();
}

// Free function implementations.

bool selector_matches(const Msg_base& selector, const Msg_base& msg_base)
{
  return ((selector.m_op == Msg_op::S_WILDCARD) || (selector.m_op == msg_base.m_op))
         && ((selector.m_type == Msg_type::S_WILDCARD) || (selector.m_type == msg_base.m_type))
         && ((selector.m_seq == Msg_base::S_SEQ_NONE) || (selector.m_seq == msg_base.m_seq))
         && ((selector.m_conn_handle == Msg_base::S_CONN_HANDLE_NONE)
             || (selector.m_conn_handle == msg_base.m_conn_handle));
}

seq_t next_seq_after(seq_t seq)
{
  return ((seq < 1) || (seq == std::numeric_limits<seq_t>::max())) ? 1 : (seq + 1);
}

void decode_msg(const util::Blob_const& buf, Ble_msg* target, Error_code* err_code)
{
  using nlohmann::json;
  using util::blob_data;
  using std::string;

  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { decode_msg(buf, target, actual_err_code); },
         err_code, "transport::decode_msg()"))
  {
    return;
  }
  // else

  assert(target);

  const auto begin = blob_data(buf);
  auto body = json::parse(begin, begin + buf.size(), nullptr, false); // No exceptions: is_discarded() on error.
  if (body.is_discarded() || (!body.is_object()))
  {
    *err_code = error::Code::S_MSG_DECODE_FAILED;
    return;
  }
  // else

  const auto op_it = body.find(S_KEY_OP);
  const auto type_it = body.find(S_KEY_TYPE);
  Msg_base base{ Msg_op::S_WILDCARD, Msg_type::S_WILDCARD, Msg_base::S_SEQ_NONE, Msg_base::S_CONN_HANDLE_NONE };
  if ((op_it == body.end()) || (!op_it->is_string())
      || (!msg_op_from_str(op_it->get_ref<const string&>(), &base.m_op))
      || (type_it == body.end()) || (!type_it->is_string()))
  {
    *err_code = error::Code::S_MSG_DECODE_FAILED;
    return;
  }
  // else
  base.m_type = msg_type_from_str(type_it->get_ref<const string&>());

  const auto seq_it = body.find(S_KEY_SEQ);
  if (seq_it != body.end())
  {
    if (!json_to_int32(*seq_it, &base.m_seq))
    {
      *err_code = error::Code::S_MSG_DECODE_FAILED;
      return;
    }
  }

  const auto conn_it = body.find(S_KEY_CONN_HANDLE);
  if (conn_it != body.end())
  {
    if (!json_to_int32(*conn_it, &base.m_conn_handle))
    {
      *err_code = error::Code::S_MSG_DECODE_FAILED;
      return;
    }
  }

  *target = Ble_msg(base, std::move(body));
  err_code->clear();
} // decode_msg()

util::Blob encode_msg(flow::log::Logger* logger_ptr, const Msg_base& base, const nlohmann::json& fields)
{
  using nlohmann::json;
  using std::string;

  assert((base.m_op != Msg_op::S_WILDCARD)
         && (base.m_type != Msg_type::S_WILDCARD) && (base.m_type != Msg_type::S_UNKNOWN)
         && "Selector-only values cannot go on the wire.");
  assert((fields.is_null() || fields.is_object()) && "Broke contract.");

  json msg = fields.is_object() ? fields : json::object();
  msg[S_KEY_OP] = string(msg_op_to_str(base.m_op));
  msg[S_KEY_TYPE] = string(msg_type_to_str(base.m_type));
  if (base.m_seq != Msg_base::S_SEQ_NONE)
  {
    msg[S_KEY_SEQ] = base.m_seq;
  }
  if (base.m_conn_handle != Msg_base::S_CONN_HANDLE_NONE)
  {
    msg[S_KEY_CONN_HANDLE] = base.m_conn_handle;
  }

  return util::to_blob(logger_ptr, msg.dump());
}

util::Blob encode_sync_req(flow::log::Logger* logger_ptr, seq_t seq)
{
  return encode_msg(logger_ptr, { Msg_op::S_REQ, Msg_type::S_SYNC, seq, Msg_base::S_CONN_HANDLE_NONE });
}

util::String_view msg_op_to_str(Msg_op op)
{
  switch (op)
  {
  case Msg_op::S_WILDCARD:
    return "*";
  case Msg_op::S_REQ:
    return "request";
  case Msg_op::S_RSP:
    return "response";
  case Msg_op::S_EVT:
    return "event";
  }
  assert(false);
  return "";
}

util::String_view msg_type_to_str(Msg_type type)
{
  if (type == Msg_type::S_WILDCARD)
  {
    return "*";
  }
  // else
  if ((type == Msg_type::S_UNKNOWN) || (type == Msg_type::S_END_SENTINEL))
  {
    return "unknown";
  }
  // else
  return S_MSG_TYPE_STRS[size_t(type)];
}

bool msg_op_from_str(util::String_view str, Msg_op* target)
{
  for (const auto op : { Msg_op::S_REQ, Msg_op::S_RSP, Msg_op::S_EVT })
  {
    if (msg_op_to_str(op) == str)
    {
      *target = op;
      return true;
    }
  }
  return false;
}

Msg_type msg_type_from_str(util::String_view str)
{
  for (size_t idx = 0; idx != S_MSG_TYPE_STRS.size(); ++idx)
  {
    if (S_MSG_TYPE_STRS[idx] == str)
    {
      return Msg_type(idx);
    }
  }
  return Msg_type::S_UNKNOWN;
}

bool operator==(const Msg_base& val1, const Msg_base& val2)
{
  return (val1.m_op == val2.m_op) && (val1.m_type == val2.m_type)
         && (val1.m_seq == val2.m_seq) && (val1.m_conn_handle == val2.m_conn_handle);
}

bool operator!=(const Msg_base& val1, const Msg_base& val2)
{
  return !operator==(val1, val2);
}

std::ostream& operator<<(std::ostream& os, Msg_op val)
{
  return os << msg_op_to_str(val);
}

std::ostream& operator<<(std::ostream& os, Msg_type val)
{
  return os << msg_type_to_str(val);
}

std::ostream& operator<<(std::ostream& os, const Msg_base& val)
{
  os << "op[" << val.m_op << "] type[" << val.m_type << "] seq[";
  if (val.m_seq == Msg_base::S_SEQ_NONE)
  {
    os << '*';
  }
  else
  {
    os << val.m_seq;
  }
  os << "] conn[";
  if (val.m_conn_handle == Msg_base::S_CONN_HANDLE_NONE)
  {
    os << '*';
  }
  else
  {
    os << val.m_conn_handle;
  }
  return os << ']';
}

} // namespace blex::transport
