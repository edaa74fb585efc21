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
#include "blex/transport/xport_config.hpp"
#include <boost/chrono/round.hpp>

namespace blex::transport
{

// Implementations.

Xport_config Xport_config::defaults()
{
  using boost::chrono::seconds;

  Xport_config cfg;
  cfg.m_accept_timeout = seconds(1);
  cfg.m_rsp_timeout = seconds(1);
  cfg.m_sync_timeout = seconds(10);
  cfg.m_restart = true;
  cfg.m_restart_delay = seconds(1);
  cfg.m_max_msg_size = 10 * 1024;
  cfg.m_rcv_depth = 10;
  return cfg;
}

std::ostream& operator<<(std::ostream& os, const Xport_config& val)
{
  using boost::chrono::round;
  using boost::chrono::milliseconds;

  return os << "sock[" << val.m_sock_path << "] child[" << val.m_child_path << "] dev[" << val.m_dev_path << "] "
               "accept_timeout[" << round<milliseconds>(val.m_accept_timeout) << "] "
               "rsp_timeout[" << round<milliseconds>(val.m_rsp_timeout) << "] "
               "sync_timeout[" << round<milliseconds>(val.m_sync_timeout) << "] "
               "restart[" << val.m_restart << "] "
               "restart_delay[" << round<milliseconds>(val.m_restart_delay) << "] "
               "max_msg_size[" << val.m_max_msg_size << "] rcv_depth[" << val.m_rcv_depth << ']';
}

} // namespace blex::transport
