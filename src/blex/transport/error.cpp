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
#include "blex/transport/error.hpp"
#include "blex/util/util_fwd.hpp"

namespace blex::transport::error
{

// Types.

/**
 * The boost.system category for errors returned by the blex::transport module.  Think of it as the polymorphic
 * counterpart of error::Code, and it kicks in when, for `Error_code ec`, something
 * like `ec.message()` is invoked.
 */
class Category :
  public boost::system::error_category
{
public:
  // Constants.

  /// The one Category.
  static const Category S_CATEGORY;

  // Methods.

  /**
   * Implements super-class API: returns a `static` string representing this `error_category`.
   *
   * @return A `static` string that's a brief description of this error category.
   */
  const char* name() const noexcept override;

  /**
   * Implements super-class API: given the integer error code of an error in this category, returns a description of
   * that error (similarly in spirit to `std::strerror()`).
   *
   * @param val
   *        Error code of an Category error (realistically, a #Code `enum` value cast to `int`).
   * @return String describing the error.
   */
  std::string message(int val) const override;

  /**
   * The guts of the `ostream << Code` operation: outputs, e.g., Code::S_SYNC_TIMEOUT => `"SYNC_TIMEOUT"`.
   * @param code
   *        A Code.
   * @return What would/should be printed to an `ostream` given `code`.
   */
  static util::String_view code_symbol(Code code);

private:
  // Constructors.

  /// Boring constructor.
  explicit Category();
}; // class Category

// Static initializations.

const Category Category::S_CATEGORY;

// Implementations.

Error_code make_error_code(Code err_code)
{
  return Error_code(static_cast<int>(err_code), Category::S_CATEGORY);
}

Category::Category() = default;

const char* Category::name() const noexcept // Virtual.
{
  return "blex/transport";
}

std::string Category::message(int val) const // Virtual.
{
  // KEEP THESE STRINGS IN SYNC WITH COMMENT IN error.hpp ON THE INDIVIDUAL ENUM MEMBERS!

  switch (static_cast<Code>(val))
  {
  case Code::S_XPORT_STARTED_TWICE:
    return "Transport start was requested, but the transport was not in stopped state (already started or in "
           "transition).";
  case Code::S_XPORT_NOT_STARTED:
    return "Transmit was requested, but the transport is not fully started.";
  case Code::S_XPORT_STOPPED:
    return "Transport was stopped by explicit user request; pending operations were aborted.";
  case Code::S_CHILD_ACCEPT_TIMEOUT:
    return "Host process did not connect to the local socket within the accept timeout; is the controller "
           "attached?";
  case Code::S_CHILD_START_FAILED:
    return "Host process could not be launched, or its local socket could not be set up; details were logged.";
  case Code::S_CHILD_FAILED:
    return "Host process terminated, or its local socket connection failed; details were logged.";
  case Code::S_SYNC_TIMEOUT:
    return "Host and controller did not synchronize within the configured sync timeout.";
  case Code::S_SYNC_LOST:
    return "Host and controller lost synchronization.";
  case Code::S_LISTENER_SELECTOR_IN_USE:
    return "A listener is already registered for the given message selector.";
  case Code::S_MESSAGE_SIZE_EXCEEDED:
    return "A message on the local socket declared a size of zero or above the configured maximum.";
  case Code::S_MSG_DECODE_FAILED:
    return "A message from the host process could not be decoded as a JSON message envelope.";
  case Code::S_TIMEOUT:
    return "A (usually user-specified) timeout period has elapsed before a blocking operation completed.";
  case Code::S_INVALID_MGMT_PROTO:
    return "Requested management protocol is not one of the supported ones.";
  case Code::S_SESSION_NOT_OPEN:
    return "A session operation requiring an open session was invoked on a session that is not open.";
  case Code::S_INTERNAL_ERROR_UNEXPECTED_STATE:
    return "Internal error: a transport lifecycle state transition that should have succeeded did not.";

  case Code::S_END_SENTINEL:
    assert(false && "SENTINEL: Not an error.  "
                    "This Code must never be issued by an error/success-emitting API; I/O use only.");
  }
  assert(false);
  return "";
} // Category::message()

util::String_view Category::code_symbol(Code code) // Static.
{
  // Note: Must satisfy istream_to_enum() requirements.

  switch (code)
  {
  case Code::S_XPORT_STARTED_TWICE:
    return "XPORT_STARTED_TWICE";
  case Code::S_XPORT_NOT_STARTED:
    return "XPORT_NOT_STARTED";
  case Code::S_XPORT_STOPPED:
    return "XPORT_STOPPED";
  case Code::S_CHILD_ACCEPT_TIMEOUT:
    return "CHILD_ACCEPT_TIMEOUT";
  case Code::S_CHILD_START_FAILED:
    return "CHILD_START_FAILED";
  case Code::S_CHILD_FAILED:
    return "CHILD_FAILED";
  case Code::S_SYNC_TIMEOUT:
    return "SYNC_TIMEOUT";
  case Code::S_SYNC_LOST:
    return "SYNC_LOST";
  case Code::S_LISTENER_SELECTOR_IN_USE:
    return "LISTENER_SELECTOR_IN_USE";
  case Code::S_MESSAGE_SIZE_EXCEEDED:
    return "MESSAGE_SIZE_EXCEEDED";
  case Code::S_MSG_DECODE_FAILED:
    return "MSG_DECODE_FAILED";
  case Code::S_TIMEOUT:
    return "TIMEOUT";
  case Code::S_INVALID_MGMT_PROTO:
    return "INVALID_MGMT_PROTO";
  case Code::S_SESSION_NOT_OPEN:
    return "SESSION_NOT_OPEN";
  case Code::S_INTERNAL_ERROR_UNEXPECTED_STATE:
    return "INTERNAL_ERROR_UNEXPECTED_STATE";

  case Code::S_END_SENTINEL:
    return "END_SENTINEL";
  }
  assert(false);
  return "";
}

std::ostream& operator<<(std::ostream& os, Code val)
{
  // Note: Must satisfy istream_to_enum() requirements.
  return os << Category::code_symbol(val);
}

std::istream& operator>>(std::istream& is, Code& val)
{
  /* Range [<1st Code>, END_SENTINEL); no match => END_SENTINEL;
   * allow for number instead of ostream<< string; case-insensitive. */
  val = flow::util::istream_to_enum(&is, Code::S_END_SENTINEL, Code::S_END_SENTINEL, true, false,
                                    Code(S_CODE_LOWEST_INT_VALUE));
  return is;
}

} // namespace blex::transport::error
