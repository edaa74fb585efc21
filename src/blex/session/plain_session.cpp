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
#include "blex/session/plain_session.hpp"

namespace blex::session
{

// Implementations.

Plain_session::Plain_session(flow::log::Logger* logger_ptr, transport::Ble_xport* xport,
                             const Session_config& cfg) :
  Session(logger_ptr, xport, cfg)
{
  assert((cfg.m_mgmt_proto == Mgmt_proto::S_NMP) && "Broke contract.");
}

Mgmt_proto Plain_session::mgmt_proto() const
{
  return Mgmt_proto::S_NMP;
}

} // namespace blex::session
