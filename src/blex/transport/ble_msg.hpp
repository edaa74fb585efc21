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
#include <nlohmann/json.hpp>
#include <optional>
#include <ostream>

namespace blex::transport
{

// Types.

/// Integer type of the request/response correlation sequence number carried in the message envelope.
using seq_t = int32_t;

/// Integer type of the BLE connection handle carried in the message envelope.
using conn_handle_t = int32_t;

/**
 * Operation kind of a message: the `"op"` field of the JSON envelope exchanged with the host process.
 * S_WILDCARD is not a wire value; it is used only in selectors (see Msg_base) to mean "any".
 */
enum class Msg_op : int
{
  /// Selector-only: matches any operation kind.
  S_WILDCARD = -1,
  /// `"request"`: we ask the host to do something; it answers with S_RSP carrying the same sequence number.
  S_REQ = 0,
  /// `"response"`: the host's answer to an S_REQ.
  S_RSP,
  /// `"event"`: unsolicited notification from the host.
  S_EVT
};

/**
 * Message type: the `"type"` field of the JSON envelope.  Only S_SYNC and S_SYNC_EVT have payloads understood by
 * this library; the rest are enumerated so that callers can select on them and are otherwise carried opaquely.
 * S_WILDCARD is selector-only; S_UNKNOWN is what a type string we do not recognize decodes to.
 */
enum class Msg_type : int
{
  S_WILDCARD = -1,
  S_ERROR = 0,
  S_SYNC,
  S_CONNECT,
  S_TERMINATE,
  S_DISC_ALL_SVCS,
  S_DISC_SVC_UUID,
  S_DISC_ALL_CHRS,
  S_DISC_CHR_UUID,
  S_WRITE,
  S_WRITE_CMD,
  S_EXCHANGE_MTU,
  S_GEN_RAND_ADDR,
  S_SET_RAND_ADDR,
  S_CONN_CANCEL,
  S_SCAN,
  S_SCAN_CANCEL,
  S_SET_PREFERRED_MTU,
  S_SECURITY_INITIATE,
  S_CONN_FIND,
  S_RESET,

  S_SYNC_EVT,
  S_CONNECT_EVT,
  S_DISCONNECT_EVT,
  S_DISC_SVC_EVT,
  S_DISC_CHR_EVT,
  S_WRITE_ACK_EVT,
  S_NOTIFY_RX_EVT,
  S_MTU_CHANGE_EVT,
  S_SCAN_EVT,
  S_SCAN_TMO_EVT,
  S_ENC_CHANGE_EVT,
  S_RESET_EVT,

  S_UNKNOWN,
  /// Sentinel: not a valid value.
  S_END_SENTINEL
}; // enum class Msg_type

/**
 * The routing-relevant header of every message (its *envelope*), also used as a *selector*: the key under which
 * a Ble_listener is registered with Ble_dispatcher.  As a selector, any field may be its wildcard value
 * (Msg_op::S_WILDCARD, Msg_type::S_WILDCARD, #S_SEQ_NONE, #S_CONN_HANDLE_NONE), meaning "any".
 * As a decoded message header, #S_SEQ_NONE / #S_CONN_HANDLE_NONE mean the field was absent.
 */
struct Msg_base
{
  // Constants.

  /// Sequence number meaning "none" (in a message) or "any" (in a selector).
  static constexpr seq_t S_SEQ_NONE = -1;

  /// Connection handle meaning "none" (in a message) or "any" (in a selector).
  static constexpr conn_handle_t S_CONN_HANDLE_NONE = -1;

  // Data.

  /// Operation kind.
  Msg_op m_op;

  /// Message type.
  Msg_type m_type;

  /// Sequence number.
  seq_t m_seq;

  /// Connection handle.
  conn_handle_t m_conn_handle;
}; // struct Msg_base

/**
 * One decoded inbound message: its envelope plus the entire JSON object (envelope fields included) for
 * type-specific interpretation by whoever awaits it.
 */
class Ble_msg
{
public:
  // Constructors/destructor.

  /// Constructs a message with all-wildcard envelope and null body.
  Ble_msg();

  /**
   * Constructs a message from its parts.
   *
   * @param base
   *        Envelope.
   * @param body
   *        Entire JSON object.
   */
  explicit Ble_msg(const Msg_base& base, nlohmann::json body);

  // Methods.

  /**
   * The envelope.
   * @return See above.
   */
  const Msg_base& base() const;

  /**
   * The entire JSON object as received.
   * @return See above.
   */
  const nlohmann::json& body() const;

  /**
   * The `"synced"` field carried by sync responses and sync events; or none if absent or not a boolean.
   * @return See above.
   */
  std::optional<bool> synced() const;

private:
  // Data.

  /// See base().
  Msg_base m_base;

  /// See body().
  nlohmann::json m_body;
}; // class Ble_msg

// Free functions.

/**
 * Returns `true` if and only if every field of `selector` either is its wildcard value or equals the corresponding
 * field of `msg_base`.
 *
 * @param selector
 *        Selector, possibly containing wildcards.
 * @param msg_base
 *        Envelope of an actual message.
 * @return See above.
 */
bool selector_matches(const Msg_base& selector, const Msg_base& msg_base);

/**
 * Decodes a whole message received from the host process.  The envelope fields `"op"` and `"type"` are required;
 * `"seq"` and `"conn_handle"` are optional.  A `"type"` we do not recognize decodes as Msg_type::S_UNKNOWN
 * (not an error).
 *
 * @param buf
 *        The bytes: one JSON object.
 * @param target
 *        On success the decoded message is placed here; untouched on failure.
 * @param err_code
 *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
 *        error::Code::S_MSG_DECODE_FAILED.
 */
void decode_msg(const util::Blob_const& buf, Ble_msg* target, Error_code* err_code = 0);

/**
 * Encodes a message to be sent to the host process: the envelope (`"seq"` and `"conn_handle"` omitted when they are
 * the "none" value) merged with the type-specific `fields`.
 *
 * @param logger_ptr
 *        Logger for the resulting Blob.
 * @param base
 *        Envelope; must not contain Msg_op::S_WILDCARD, Msg_type::S_WILDCARD or Msg_type::S_UNKNOWN.
 * @param fields
 *        JSON object (or null) with additional fields.
 * @return The serialized message.
 */
util::Blob encode_msg(flow::log::Logger* logger_ptr, const Msg_base& base,
                      const nlohmann::json& fields = nlohmann::json());

/**
 * Returns the sequence number to use after `seq`: `seq + 1`, wrapping from the `seq_t` maximum back to 1.  The
 * result is always positive; so it is never Msg_base::S_SEQ_NONE (which in a selector means "any sequence number").
 *
 * @param seq
 *        The last sequence number used; 0 if none yet.
 * @return See above.
 */
seq_t next_seq_after(seq_t seq);

/**
 * Encodes the sync-status query `{"op":"request","type":"sync","seq":<seq>}`.
 *
 * @param logger_ptr
 *        Logger for the resulting Blob.
 * @param seq
 *        Sequence number to tag the request with.
 * @return The serialized message.
 */
util::Blob encode_sync_req(flow::log::Logger* logger_ptr, seq_t seq);

/**
 * Returns the wire string for the given operation kind (`"request"`, etc.); `"*"` for the wildcard.
 *
 * @param op
 *        Value.
 * @return See above.
 */
util::String_view msg_op_to_str(Msg_op op);

/**
 * Returns the wire string for the given message type (`"sync"`, etc.); `"*"` for the wildcard; `"unknown"` for
 * Msg_type::S_UNKNOWN.
 *
 * @param type
 *        Value.
 * @return See above.
 */
util::String_view msg_type_to_str(Msg_type type);

/**
 * Reverse of msg_op_to_str() for wire values; `false` if `str` is not one.
 *
 * @param str
 *        Wire string.
 * @param target
 *        On success the value is placed here.
 * @return See above.
 */
bool msg_op_from_str(util::String_view str, Msg_op* target);

/**
 * Reverse of msg_type_to_str() for wire values; unrecognized strings map to Msg_type::S_UNKNOWN.
 *
 * @param str
 *        Wire string.
 * @return See above.
 */
Msg_type msg_type_from_str(util::String_view str);

/**
 * Returns `true` if and only if all fields are equal.
 *
 * @param val1
 *        Value.
 * @param val2
 *        Value.
 * @return See above.
 */
bool operator==(const Msg_base& val1, const Msg_base& val2);

/**
 * Negation of similar `==`.
 *
 * @param val1
 *        Value.
 * @param val2
 *        Value.
 * @return See above.
 */
bool operator!=(const Msg_base& val1, const Msg_base& val2);

/**
 * Prints string representation of the given Msg_op to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Msg_op val);

/**
 * Prints string representation of the given Msg_type to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Msg_type val);

/**
 * Prints string representation of the given Msg_base to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Msg_base& val);

} // namespace blex::transport
