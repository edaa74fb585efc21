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
#include "blex/common.hpp"
#include <ostream>
#include <string>

namespace blex::transport
{

// Types.

/**
 * Settings for a Ble_xport (and the Unix_child it runs), as a plain aggregate.  Ble_xport copies it at
 * construction; there is no way to change it afterwards.
 *
 * Start from defaults() and set at least #m_sock_path, #m_child_path and #m_dev_path.
 */
struct Xport_config
{
  // Data.

  /// Filesystem path of the local stream socket we listen on and the child connects to.
  fs::path m_sock_path;

  /// Executable of the host process.  It is invoked as `<m_child_path> <m_dev_path> <m_sock_path>`.
  fs::path m_child_path;

  /// Controller device path; passed through to the child verbatim.
  std::string m_dev_path;

  /// How long the child has to connect to #m_sock_path once spawned.
  util::Fine_duration m_accept_timeout;

  /// Advisory per-request response timeout for layers above the transport; see Ble_xport::rsp_timeout().
  util::Fine_duration m_rsp_timeout;

  /// How long to wait for host <-> controller sync before giving up on a start attempt.
  util::Fine_duration m_sync_timeout;

  /// Whether an established transport that fails is automatically restarted.
  bool m_restart;

  /// Settling delay before each automatic restart attempt.
  util::Fine_duration m_restart_delay;

  /// Largest message body (in bytes) accepted in either direction.
  size_t m_max_msg_size;

  /// Max number of inbound message bodies buffered between the socket reader and the dispatching thread.
  size_t m_rcv_depth;

  // Methods.

  /**
   * Returns config with every field at its default; the paths empty.
   * @return See above.
   */
  static Xport_config defaults();
}; // struct Xport_config

// Free functions.

/**
 * Prints string representation of the given config to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Xport_config& val);

} // namespace blex::transport
