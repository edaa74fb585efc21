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
#include "blex/util/util_fwd.hpp"
#include <flow/util/blob.hpp>
#include <flow/util/util.hpp>
#include <cstring>

namespace blex::util
{

// Implementations.

const uint8_t* blob_data(const Blob_const& blob)
{
  return static_cast<const uint8_t*>(blob.data());
}

Blob to_blob(flow::log::Logger* logger_ptr, String_view src)
{
  Blob blob(logger_ptr, src.size());
  if (!src.empty())
  {
    std::memcpy(blob.begin(), src.data(), src.size());
  }
  return blob;
}

Blob_const blob_view(const Blob& blob)
{
  if (blob.empty())
  {
    return Blob_const();
  }
  // else
  return Blob_const(static_cast<const void*>(blob.begin()), blob.size());
}

std::string hex_dump(const Blob_const& blob)
{
  // Indent each line of the dump so it's visually distinct from the log line that precedes it.
  return flow::util::buffers_dump_string(blob, "  ");
}

} // namespace blex::util
