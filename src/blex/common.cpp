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
#include "blex/common.hpp"

namespace blex
{

// Static initializations.

// Counterpart of the `enum class Log_component` generation in detail/common.hpp.
#include <flow/log/macros/config_enum_start_cpp.macros.hpp>
#include "blex/detail/macros/log_component_enum_declare.macros.hpp"
#include <flow/log/macros/config_enum_end_cpp.macros.hpp>

} // namespace blex
