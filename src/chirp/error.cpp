/* chirp
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
#include "chirp/error.hpp"
#include <flow/util/util.hpp>

namespace chirp::error
{

// Types.

/**
 * The boost.system category for errors returned by chirp.  Think of it as the polymorphic counterpart of
 * error::Code, and it kicks in when, for `Error_code ec`, something like `ec.message()` is invoked.
 *
 * Note that this class's declaration is not available outside this translation unit (.cpp file), and its logic
 * is accessed indirectly through standard boost.system machinery.
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
   * @return See above.
   */
  const char* name() const noexcept override;

  /**
   * Implements super-class API: given the integer error code of an error in this category, returns a description of
   * that error (similarly in spirit to `std::strerror()`).
   *
   * @param val
   *        Error code of a Category error (realistically, a #Code `enum` value cast to `int`).
   * @return String describing the error.
   */
  std::string message(int val) const override;

  /**
   * The guts of the `ostream << Code` operation: outputs, e.g., Code::S_TIMEOUT => `"TIMEOUT"`.
   * @param code
   *        A Code.
   * @return What would/should be printed to an `ostream` given `code`.
   */
  static flow::util::String_view code_symbol(Code code);

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
  // Glue together Category::name()/message() with the Code enum.
  return Error_code(static_cast<int>(err_code), Category::S_CATEGORY);
}

Error_kind error_kind(const Error_code& err_code)
{
  if ((!err_code) || (err_code.category() != Category::S_CATEGORY))
  {
    return Error_kind::S_UNKNOWN;
  }
  // else

  switch (static_cast<Code>(err_code.value()))
  {
  case Code::S_VALUE_ERROR:
    return Error_kind::S_VALUE;
  case Code::S_CANNOT_CONNECT:
  case Code::S_WRITE_ERROR:
  case Code::S_SHUTDOWN:
    return Error_kind::S_CONNECTION;
  case Code::S_TIMEOUT:
    return Error_kind::S_TIMEOUT;
  case Code::S_RESOURCE_ERROR:
    return Error_kind::S_RESOURCE;
  case Code::S_PROTOCOL_ERROR:
  case Code::S_TLS_ERROR:
  case Code::S_LOOP_ERROR:
  case Code::S_INIT_FAIL:
  case Code::S_NOT_INITIALIZED:
    return Error_kind::S_PROTOCOL;
  case Code::S_FATAL:
  case Code::S_LOOP_CLOSE_FAILED:
    return Error_kind::S_FATAL;
  case Code::S_ADDRESS_IN_USE:
    return Error_kind::S_ADDRESS_IN_USE;
  case Code::S_MSG_STILL_SENDING:
  case Code::S_LOOP_CANNOT_RESTART:
  case Code::S_UNRELEASED_MSGS_ON_STOP:
  case Code::S_SESSION_NOT_READY:
  case Code::S_REQUEST_ALREADY_PENDING:
    return Error_kind::S_USAGE;
  case Code::S_END_SENTINEL:
    break;
  }
  return Error_kind::S_UNKNOWN;
} // error_kind()

Category::Category() = default;

const char* Category::name() const noexcept // Virtual.
{
  return "chirp";
}

std::string Category::message(int val) const // Virtual.
{
  // KEEP THESE STRINGS IN SYNC WITH COMMENT IN error.hpp ON THE INDIVIDUAL ENUM MEMBERS!

  switch (static_cast<Code>(val))
  {
  case Code::S_VALUE_ERROR:
    return "Engine: a value (configuration field, address, message size) was rejected.";
  case Code::S_LOOP_ERROR:
    return "Engine: the underlying event-loop machinery reported an error.";
  case Code::S_PROTOCOL_ERROR:
    return "Engine: the opposing side violated the wire protocol.";
  case Code::S_ADDRESS_IN_USE:
    return "Engine: the configured port is already bound.";
  case Code::S_FATAL:
    return "Engine: unrecoverable internal failure.";
  case Code::S_TLS_ERROR:
    return "Engine: TLS setup or handshake failed.";
  case Code::S_NOT_INITIALIZED:
    return "Engine: the process-wide library was not initialized (see util::library_init()).";
  case Code::S_TIMEOUT:
    return "Engine: a send or request did not complete within the configured timeout.";
  case Code::S_RESOURCE_ERROR:
    return "Engine: allocation of a native resource failed.";
  case Code::S_SHUTDOWN:
    return "Engine: operation aborted, because the engine is shutting down.";
  case Code::S_CANNOT_CONNECT:
    return "Engine: could not connect to the remote address/port.";
  case Code::S_WRITE_ERROR:
    return "Engine: writing to an established connection failed.";
  case Code::S_INIT_FAIL:
    return "Engine: initialization failed for a reason other than those above.";
  case Code::S_MSG_STILL_SENDING:
    return "Usage: the message already has an unresolved send in flight.";
  case Code::S_LOOP_CANNOT_RESTART:
    return "Usage: the event loop cannot be restarted after it was stopped.";
  case Code::S_UNRELEASED_MSGS_ON_STOP:
    return "Usage: the session was stopped while messages received by the user still held slots; "
           "they were force-released.";
  case Code::S_SESSION_NOT_READY:
    return "Usage: the session is not (or no longer) in ready state.";
  case Code::S_REQUEST_ALREADY_PENDING:
    return "Usage: a request with the same message identity is already awaiting its reply.";
  case Code::S_LOOP_CLOSE_FAILED:
    return "Loop: the event loop failed to close after its thread was joined.";

  case Code::S_END_SENTINEL:
    assert(false && "SENTINEL: Not an error.  "
                    "This Code must never be issued by an error/success-emitting API; I/O use only.");
  }
  assert(false);
  return "";
} // Category::message()

flow::util::String_view Category::code_symbol(Code code) // Static.
{
  // Note: Must satisfy istream_to_enum() requirements.

  switch (code)
  {
  case Code::S_VALUE_ERROR:
    return "VALUE_ERROR";
  case Code::S_LOOP_ERROR:
    return "LOOP_ERROR";
  case Code::S_PROTOCOL_ERROR:
    return "PROTOCOL_ERROR";
  case Code::S_ADDRESS_IN_USE:
    return "ADDRESS_IN_USE";
  case Code::S_FATAL:
    return "FATAL";
  case Code::S_TLS_ERROR:
    return "TLS_ERROR";
  case Code::S_NOT_INITIALIZED:
    return "NOT_INITIALIZED";
  case Code::S_TIMEOUT:
    return "TIMEOUT";
  case Code::S_RESOURCE_ERROR:
    return "RESOURCE_ERROR";
  case Code::S_SHUTDOWN:
    return "SHUTDOWN";
  case Code::S_CANNOT_CONNECT:
    return "CANNOT_CONNECT";
  case Code::S_WRITE_ERROR:
    return "WRITE_ERROR";
  case Code::S_INIT_FAIL:
    return "INIT_FAIL";
  case Code::S_MSG_STILL_SENDING:
    return "MSG_STILL_SENDING";
  case Code::S_LOOP_CANNOT_RESTART:
    return "LOOP_CANNOT_RESTART";
  case Code::S_UNRELEASED_MSGS_ON_STOP:
    return "UNRELEASED_MSGS_ON_STOP";
  case Code::S_SESSION_NOT_READY:
    return "SESSION_NOT_READY";
  case Code::S_REQUEST_ALREADY_PENDING:
    return "REQUEST_ALREADY_PENDING";
  case Code::S_LOOP_CLOSE_FAILED:
    return "LOOP_CLOSE_FAILED";

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

std::ostream& operator<<(std::ostream& os, Error_kind val)
{
  switch (val)
  {
  case Error_kind::S_VALUE:
    return os << "VALUE";
  case Error_kind::S_CONNECTION:
    return os << "CONNECTION";
  case Error_kind::S_TIMEOUT:
    return os << "TIMEOUT";
  case Error_kind::S_RESOURCE:
    return os << "RESOURCE";
  case Error_kind::S_PROTOCOL:
    return os << "PROTOCOL";
  case Error_kind::S_FATAL:
    return os << "FATAL";
  case Error_kind::S_ADDRESS_IN_USE:
    return os << "ADDRESS_IN_USE";
  case Error_kind::S_USAGE:
    return os << "USAGE";
  case Error_kind::S_UNKNOWN:
    break;
  }
  return os << "UNKNOWN";
}

} // namespace chirp::error
