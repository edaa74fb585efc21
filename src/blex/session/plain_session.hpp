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

#include "blex/session/session.hpp"

namespace blex::session
{

// Types.

/// Session speaking plain newtmgr protocol (Mgmt_proto::S_NMP).
class Plain_session : public Session
{
public:
  // Constructors/destructor.

  /**
   * Constructs a closed session.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   * @param xport
   *        Transport; must outlive `*this`.
   * @param cfg
   *        Settings; `cfg.m_mgmt_proto` must be Mgmt_proto::S_NMP.
   */
  explicit Plain_session(flow::log::Logger* logger_ptr, transport::Ble_xport* xport, const Session_config& cfg);

  // Methods.

  /**
   * Returns Mgmt_proto::S_NMP.
   * @return See above.
   */
  Mgmt_proto mgmt_proto() const override;
}; // class Plain_session

} // namespace blex::session
