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

#include "blex/session/session_fwd.hpp"
#include "blex/transport/ble_msg.hpp"
#include <flow/log/log.hpp>
#include <atomic>
#include <ostream>
#include <string>

namespace blex::session
{

// Types.

/// Management protocol spoken by a session.
enum class Mgmt_proto
{
  /// Plain newtmgr protocol (NMP); see Plain_session.
  S_NMP = 0,
  /// OIC/CoAP-wrapped management protocol (OMP); see Oic_session.
  S_OMP,
  /// Sentinel: not a valid value.
  S_END_SENTINEL
};

/// Settings for one session; see build_session().
struct Session_config
{
  /// Which kind of session.
  Mgmt_proto m_mgmt_proto;

  /// Name of the peer device; used for logging.
  std::string m_peer_name;
};

/**
 * A management session over a blex::transport::Ble_xport: the abstract interface plus the behavior the
 * two protocol-specific subclasses share.
 *
 * A session is created closed.  open() succeeds only while the transport is STARTED; after that tx_request()
 * may be used until close().  A session never starts or stops the transport.
 *
 * ### Thread safety ###
 * Concurrent calls are safe.  Each tx_request() gets its own sequence number, so concurrent requests do not
 * see each other's responses.
 */
class Session :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /// Boring virtual destructor.
  virtual ~Session();

  // Methods.

  /**
   * The protocol this session speaks.
   * @return See above.
   */
  virtual Mgmt_proto mgmt_proto() const = 0;

  /**
   * Opens the session.  A no-op if already open.
   *
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        transport::error::Code::S_XPORT_NOT_STARTED (the transport is not STARTED).
   */
  void open(Error_code* err_code = 0);

  /// Closes the session.  A no-op if not open.
  void close();

  /**
   * Whether open() has succeeded and close() has not been called since.
   * @return See above.
   */
  bool is_open() const;

  /**
   * How long tx_request() waits for a response: the transport's transport::Ble_xport::rsp_timeout().
   * @return See above.
   */
  util::Fine_duration rsp_timeout() const;

  /**
   * Sends one request of the given type with the given payload fields and awaits the response correlated to it
   * by sequence number.
   *
   * @param type
   *        Request type.
   * @param fields
   *        Payload fields (a JSON object, or null for none).  The envelope fields are added.
   * @param rsp
   *        On success the response is loaded here.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        transport::error::Code::S_SESSION_NOT_OPEN, transport::error::Code::S_TIMEOUT (no response
   *        within rsp_timeout()), transport::error::Code::S_XPORT_NOT_STARTED; or whatever error shut down the
   *        transport while waiting.
   */
  void tx_request(transport::Msg_type type, const nlohmann::json& fields, transport::Ble_msg* rsp,
                  Error_code* err_code = 0);

  /**
   * Config from ctor.
   * @return See above.
   */
  const Session_config& config() const;

protected:
  // Constructors/destructor.

  /**
   * Constructs a closed session.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   * @param xport
   *        Transport; must outlive `*this`.
   * @param cfg
   *        Settings.
   */
  explicit Session(flow::log::Logger* logger_ptr, transport::Ble_xport* xport, const Session_config& cfg);

private:
  // Data.

  /// The transport.
  transport::Ble_xport* const m_xport;

  /// See config().
  const Session_config m_cfg;

  /// See is_open().
  std::atomic<bool> m_open;
}; // class Session

// Free functions.

/**
 * Prints string representation of the given protocol to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Mgmt_proto val);

/**
 * Prints string representation of the given session to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Session& val);

} // namespace blex::session
