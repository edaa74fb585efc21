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

#include "blex/common.hpp"
#include <memory>

namespace blex::transport
{
class Ble_xport;
}

/**
 * Management-protocol sessions layered on a started blex::transport::Ble_xport.  A session is a thin stateful
 * handle: it knows which management protocol it speaks, whether it is open, and how to issue one request and
 * collect its response over the transport.  Obtain one via build_session() (or the equivalent
 * blex::transport::Ble_xport::build_session()).
 */
namespace blex::session
{

// Types.

enum class Mgmt_proto;
struct Session_config;
class Session;
class Plain_session;
class Oic_session;

// Free functions.

/**
 * Creates a session of the kind selected by `cfg.m_mgmt_proto` over the given transport.
 *
 * @param xport
 *        Transport; must outlive the returned session.
 * @param cfg
 *        Session settings.
 * @param err_code
 *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
 *        transport::error::Code::S_INVALID_MGMT_PROTO (neither Mgmt_proto::S_NMP nor Mgmt_proto::S_OMP).
 * @return The session on success; null otherwise.
 */
std::unique_ptr<Session> build_session(transport::Ble_xport* xport, const Session_config& cfg,
                                       Error_code* err_code = 0);

} // namespace blex::session
