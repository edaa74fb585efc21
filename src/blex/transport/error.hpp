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

/**
 * Namespace containing the blex::transport module's extension of boost.system error conventions, so that that API
 * can return codes/messages from within its own new set of error codes/messages.  Note that many errors
 * blex::transport might report are system errors and would not draw from this set of codes/messages but rather
 * from `boost::asio::error` or `boost::system::errc` (possibly others).
 *
 * See flow's `flow::net_flow::error` doc header which was used as the model for this.
 */
namespace blex::transport::error
{

// Types.

/// Numeric value of the lowest Code.
constexpr int S_CODE_LOWEST_INT_VALUE = 1;

/**
 * All possible errors returned (via `Error_code` arguments) by blex::transport functions/methods *outside of*
 * system-triggered errors such as `boost::asio::error::connection_reset`.
 * These values are convertible to #Error_code (a/k/a `boost::system::error_code`) and thus
 * extend the set of errors that #Error_code can represent.
 *
 * @internal
 *
 * When you add a value to this `enum`, also add its description to
 * error.cpp's Category::message().  This description must be identical to the
 * description in the /// comment below, or at least as close as possible.
 *
 * When you add a value to this `enum`, also add its symbolic representation to
 * error.cpp's Category::code_symbol().  This string must be identical to the symbol, minus the `S_`.
 *
 * If, when adding a new revision of the code, you add a value to this `enum`, add it to the end, but ahead of
 * Code::S_END_SENTINEL.
 *
 * Errors that indicate apparent logic bugs (in other words, assertions that we were too afraid
 * to write as actual `assert()`s) should be prefixed with `S_INTERNAL_ERROR_`, and their messages
 * should also indicate "Internal error: ".
 */
enum class Code
{
  /// Transport start was requested, but the transport was not in stopped state (already started or in transition).
  S_XPORT_STARTED_TWICE = S_CODE_LOWEST_INT_VALUE,

  /// Transmit was requested, but the transport is not fully started.
  S_XPORT_NOT_STARTED,

  /// Transport was stopped by explicit user request; pending operations were aborted.
  S_XPORT_STOPPED,

  /// Host process did not connect to the local socket within the accept timeout; is the controller attached?
  S_CHILD_ACCEPT_TIMEOUT,

  /// Host process could not be launched, or its local socket could not be set up; details were logged.
  S_CHILD_START_FAILED,

  /// Host process terminated, or its local socket connection failed; details were logged.
  S_CHILD_FAILED,

  /// Host and controller did not synchronize within the configured sync timeout.
  S_SYNC_TIMEOUT,

  /// Host and controller lost synchronization.
  S_SYNC_LOST,

  /// A listener is already registered for the given message selector.
  S_LISTENER_SELECTOR_IN_USE,

  /// A message on the local socket declared a size of zero or above the configured maximum.
  S_MESSAGE_SIZE_EXCEEDED,

  /// A message from the host process could not be decoded as a JSON message envelope.
  S_MSG_DECODE_FAILED,

  /// A (usually user-specified) timeout period has elapsed before a blocking operation completed.
  S_TIMEOUT,

  /// Requested management protocol is not one of the supported ones.
  S_INVALID_MGMT_PROTO,

  /// A session operation requiring an open session was invoked on a session that is not open.
  S_SESSION_NOT_OPEN,

  /// Internal error: a transport lifecycle state transition that should have succeeded did not.
  S_INTERNAL_ERROR_UNEXPECTED_STATE,

  /// SENTINEL: Not an error.  This Code must never be issued by an error/success-emitting API; I/O use only.
  S_END_SENTINEL
}; // enum class Code

// Free functions.

/**
 * Given a `Code` `enum` value, creates a lightweight #Error_code (a/k/a boost.system `error_code`)
 * representing that error.  This is needed to make the
 * `boost::system::error_code::error_code<Code>()` template implementation work.
 *
 * @param err_code
 *        The `enum` value.
 * @return A corresponding #Error_code.
 */
Error_code make_error_code(Code err_code);

/**
 * Deserializes a transport::error::Code from a standard input stream.  Reads up to but not including the next
 * non-alphanumeric-or-underscore character; the resulting string is then mapped to a Code.  If none is
 * recognized, Code::S_END_SENTINEL is the result.  The recognized values are:
 *   - "1", "2", ...: Corresponds to the `int` conversion of that Code.
 *   - Case-insensitive encoding of the non-S_-prefix part of the actual Code member; e.g.,
 *     "SYNC_TIMEOUT" (or "sync_timeout" or "Sync_timeout" or...) for Code::S_SYNC_TIMEOUT.
 *
 * @param is
 *        Stream from which to deserialize.
 * @param val
 *        Value to set.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Code& val);

/**
 * Serializes a transport::error::Code to a standard output stream.  The output string is compatible with the reverse
 * `istream>>` operator.  E.g., Code::S_SYNC_TIMEOUT => `"SYNC_TIMEOUT"`.
 *
 * @param os
 *        Stream to which to serialize.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Code val);

} // namespace blex::transport::error

namespace boost::system
{

// Types.

/**
 * Specialization that authorizes boost.system to make `enum` `Code` convertible to `Error_code`.  The
 * non-specialized version of this sets `value` to `false`, so that random arbitary `enum`s can't just be used as
 * `Error_code`s.
 */
template<>
struct is_error_code_enum<::blex::transport::error::Code>
{
  /// Means `Code` `enum` values can be used for `Error_code`.
  static const bool value = true;
};

} // namespace boost::system
