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
#include <flow/util/blob_fwd.hpp>
#include <flow/async/async_fwd.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/noncopyable.hpp>
#include <sys/types.h>

/**
 * Miscellaneous building blocks used throughout BLE-Xact: chiefly util::Sync_queue (the blocking hand-off queue
 * between a boost.asio worker thread and a consumer thread) and util::Atomic_state (a lifecycle state cell that
 * can only be loaded or compare-and-swapped).
 */
namespace blex::util
{

// Types.

// Find doc headers near the bodies of these compound types.

template<typename Value>
class Sync_queue;

template<typename Enum>
class Atomic_state;

/// Short-hand for Flow's `String_view`.
using String_view = flow::util::String_view;
/// Short-hand for Flow's `Fine_duration`.
using Fine_duration = flow::Fine_duration;
/// Short-hand for Flow's `Fine_time_pt`.
using Fine_time_pt = flow::Fine_time_pt;

/// Short-hand for polymorphic function (a-la `std::function<>`) that takes no arguments and returns nothing.
using Task = flow::async::Task;

/**
 * Owning buffer of bytes: one whole message as it travels between us and the host process.  It is Flow's
 * `Blob`, so it is movable (cheaply) but copying it is explicit.
 */
using Blob = flow::util::Blob;

/// Short-hand for an immutable blob somewhere in memory, stored as exactly a `void const *` and a `size_t`.
using Blob_const = boost::asio::const_buffer;

/// Syntactic-sugary type for POSIX process ID (integer).
using process_id_t = ::pid_t;

// Free functions.

/**
 * Syntactic-sugary helper that returns pointer to first byte in an immutable buffer, as `const uint8_t*`.
 *
 * @param blob
 *        The buffer.
 * @return See above.
 */
const uint8_t* blob_data(const Blob_const& blob);

/**
 * Returns a new Blob holding a copy of the given bytes.
 *
 * @param logger_ptr
 *        Logger passed to the Blob (it logs only at TRACE or below).
 * @param src
 *        Bytes to copy; may be empty.
 * @return See above.
 */
Blob to_blob(flow::log::Logger* logger_ptr, String_view src);

/**
 * Returns an immutable buffer view of the given Blob's contents (empty buffer if the Blob is empty).
 *
 * @param blob
 *        The Blob.
 * @return See above.
 */
Blob_const blob_view(const Blob& blob);

/**
 * Returns a multi-line hex/ASCII dump of the given bytes, suitable for DATA-severity logging of traffic.
 *
 * @param blob
 *        The bytes.
 * @return See above.
 */
std::string hex_dump(const Blob_const& blob);

} // namespace blex::util
