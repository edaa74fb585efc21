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

/* flow/common.hpp (pulled in by flow/util/util.hpp) needs to #undef a couple things before
 * blex/detail/common.hpp `#define`s them (FLOW_LOG_CFG_COMPONENT_ENUM_*); hence the ordering. */
#include <flow/util/util.hpp>

#include "blex/detail/common.hpp"
#include <boost/filesystem.hpp>

/* The APIs and header-inlined stuff require C++17 or newer, and that applies to the `#include`ing .cpp file(s)
 * of the user too. */
#if (!defined(__cplusplus)) || (__cplusplus < 201703L)
#  error "To compile a translation unit that `#include`s any blex/ API headers, use C++17 compile mode or later."
#endif

/**
 * Catch-all namespace for the BLE-Xact project: the transport layer of a device-management client that speaks
 * to a Bluetooth Low-Energy (BLE) controller through an intermediary host process (a `blehostd`-style daemon)
 * reachable over a local (Unix domain) stream socket.
 *
 * Modules overview
 * ----------------
 *   - *blex::transport*: The point of the library.  blex::transport::Ble_xport owns the lifecycle of the host
 *     process (via blex::transport::Unix_child), performs the host <-> controller synchronization handshake,
 *     routes inbound JSON messages to waiting callers (blex::transport::Ble_dispatcher,
 *     blex::transport::Ble_listener), and restarts the whole pipeline when something fatal happens.
 *   - *blex::session*: Thin management-protocol sessions built on top of a started `Ble_xport`;
 *     see blex::session::build_session().
 *   - *blex::util*: Miscellaneous building blocks used by the other modules (blocking queue, atomic state cell).
 *
 * Relationship with Flow and Boost
 * --------------------------------
 * `flow::log` is the assumed logging system (the user supplies a `flow::log::Logger*`; null
 * means log nowhere), and `flow::Error_code` (boost.system) plus the Flow `Error_code* err_code = 0` convention
 * are used for error reporting: if `err_code` is null and an error occurs, `flow::error::Runtime_error` is thrown
 * instead.  Threads are `flow::async::Single_thread_task_loop`s; sockets and timers are boost.asio.
 */
namespace blex
{

// Types.  They're outside of `namespace ::blex::util` for brevity due to their frequent use.

/**
 * @namespace blex::fs
 * @brief Short-hand for `filesystem` namespace.  Aliased to `boost::filesystem`, as Flow does.
 */
namespace fs = boost::filesystem;

/// Short-hand for `flow::Error_code` which is very common.
using Error_code = flow::Error_code;

/// Short-hand for polymorphic functor holder which is very common.  This is essentially `std::function`.
template<typename Signature>
using Function = flow::Function<Signature>;

#ifdef BLEX_DOXYGEN_ONLY // Actual compilation will ignore the below; but Doxygen will scan it and generate docs.

/**
 * The `flow::log::Component` payload enumeration containing various log components used by BLE-Xact internal
 * logging.  The actual members are generated by `flow::log` macro magic; see
 * `log_component_enum_declare.macros.hpp`.
 */
enum class Log_component
{
  /// Placeholder for Doxygen purposes only.
  S_END_SENTINEL
};

/**
 * The map generated by `flow::log` macro magic that maps each enumerated value in blex::Log_component to its
 * string representation as used in log output and verbosity config.
 */
extern const boost::unordered_multimap<Log_component, std::string> S_BLEX_LOG_COMPONENT_NAME_MAP;

#endif // BLEX_DOXYGEN_ONLY

} // namespace blex
