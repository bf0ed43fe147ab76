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
#pragma once

#include "chirp/common.hpp"
#include <flow/util/string_view.hpp>

/**
 * Namespace containing chirp's extension of boost.system error conventions, so that chirp APIs can return
 * codes/messages from within its own new set of error codes/messages.  Note that some errors chirp might report
 * are system errors (such as `boost::asio::error::operation_aborted` bubbling up from a timer) and would not draw
 * from this set; that is normal for boost.system.
 *
 * There are three families of codes below, and the order within error::Code reflects that:
 *   - Errors reported by the transport engine through its completion callbacks (or synchronously by
 *     `Engine::init()` / `Engine::send()`).  These are attached to futures; they are never thrown into unrelated
 *     code.
 *   - Usage errors: the caller violated a contract (double-send, restart-after-stop, forgotten release...).
 *     These are emitted synchronously at the offending call (or, for forgotten releases, at the end of
 *     session::Session::stop()).
 *   - Event-loop infrastructure failures.
 *
 * error::error_kind() folds any #Error_code into the coarse error::Error_kind taxonomy which is what most
 * applications will want to branch on.
 *
 * See flow's `flow::net_flow::error` doc header which was used as the model for this and similar.
 */
namespace chirp::error
{

// Types.

/// Numeric value of the lowest Code.
constexpr int S_CODE_LOWEST_INT_VALUE = 1;

/**
 * All possible errors returned (via `Error_code` arguments or exceptions stored in futures) by chirp
 * functions/methods *outside of* system-triggered errors.  These values are convertible to #Error_code
 * (a/k/a `boost::system::error_code`) and thus extend the set of errors that #Error_code can represent.
 *
 * @internal
 *
 * When you add a value to this `enum`, also add its description to error.cpp's Category::message() and its
 * symbol (minus `S_`) to Category::code_symbol(); and classify it in error_kind().  Add new values at the end,
 * ahead of Code::S_END_SENTINEL.
 */
enum class Code
{
  /// Engine: a value (configuration field, address, message size) was rejected.
  S_VALUE_ERROR = S_CODE_LOWEST_INT_VALUE,

  /// Engine: the underlying event-loop machinery reported an error.
  S_LOOP_ERROR,

  /// Engine: the opposing side violated the wire protocol.
  S_PROTOCOL_ERROR,

  /// Engine: the configured port is already bound.
  S_ADDRESS_IN_USE,

  /// Engine: unrecoverable internal failure.
  S_FATAL,

  /// Engine: TLS setup or handshake failed.
  S_TLS_ERROR,

  /// Engine: the process-wide library was not initialized (see util::library_init()).
  S_NOT_INITIALIZED,

  /// Engine: a send or request did not complete within the configured timeout.
  S_TIMEOUT,

  /// Engine: allocation of a native resource failed.
  S_RESOURCE_ERROR,

  /// Engine: operation aborted, because the engine is shutting down.
  S_SHUTDOWN,

  /// Engine: could not connect to the remote address/port.
  S_CANNOT_CONNECT,

  /// Engine: writing to an established connection failed.
  S_WRITE_ERROR,

  /// Engine: initialization failed for a reason other than those above.
  S_INIT_FAIL,

  /// Usage: the message already has an unresolved send in flight.
  S_MSG_STILL_SENDING,

  /// Usage: the event loop cannot be restarted after it was stopped.
  S_LOOP_CANNOT_RESTART,

  /// Usage: the session was stopped while messages received by the user still held slots; they were force-released.
  S_UNRELEASED_MSGS_ON_STOP,

  /// Usage: the session is not (or no longer) in ready state.
  S_SESSION_NOT_READY,

  /// Usage: a request with the same message identity is already awaiting its reply.
  S_REQUEST_ALREADY_PENDING,

  /// Loop: the event loop failed to close after its thread was joined.
  S_LOOP_CLOSE_FAILED,

  /// SENTINEL: Not an error.  This Code must never be issued by an error/success-emitting API; I/O use only.
  S_END_SENTINEL
}; // enum class Code

/**
 * Coarse classification of any #Error_code, as returned by error_kind().  Applications that want to react to, say,
 * "any connection problem" should branch on this rather than on individual Code values.
 */
enum class Error_kind
{
  /// Bad configuration or address.
  S_VALUE,
  /// Transport-level connect or write failure; includes aborts due to shutdown.
  S_CONNECTION,
  /// Send, request, or shutdown-drain timeout.
  S_TIMEOUT,
  /// Allocation failure in the native layer.
  S_RESOURCE,
  /// Unrecoverable transport state (protocol, TLS, loop, init).
  S_PROTOCOL,
  /// Fatal internal failure.
  S_FATAL,
  /// Port already bound.
  S_ADDRESS_IN_USE,
  /// Caller violated an API contract.
  S_USAGE,
  /// Not a chirp error (or not an error at all).
  S_UNKNOWN
}; // enum class Error_kind

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
 * Classifies the given error into the coarse Error_kind taxonomy.  Codes not in our category (and the success
 * value) yield Error_kind::S_UNKNOWN.
 *
 * @param err_code
 *        Any error code.
 * @return See above.
 */
Error_kind error_kind(const Error_code& err_code);

/**
 * Deserializes an error::Code from a standard input stream.  Reads up to but not including the next
 * non-alphanumeric-or-underscore character.  If none is recognized, Code::S_END_SENTINEL is the result.
 * The recognized values are:
 *   - "1", "2", ...: Corresponds to the `int` conversion of that Code.
 *   - Case-insensitive encoding of the non-S_-prefix part of the actual Code member; e.g.,
 *     "TIMEOUT" (or "timeout" or...) for Code::S_TIMEOUT.
 *
 * @param is
 *        Stream from which to deserialize.
 * @param val
 *        Value to set.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Code& val);

/**
 * Serializes an error::Code to a standard output stream; e.g., Code::S_TIMEOUT => `"TIMEOUT"`.  The output string
 * is compatible with the reverse `istream>>` operator.
 *
 * @param os
 *        Stream to which to serialize.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Code val);

/**
 * Serializes an error::Error_kind to a standard output stream; e.g., Error_kind::S_USAGE => `"USAGE"`.
 *
 * @param os
 *        Stream to which to serialize.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Error_kind val);

} // namespace chirp::error

namespace boost::system
{

// Types.

/**
 * Specializes this `struct` so that boost.system authorizes `enum` `Code` to be convertible to `Error_code`.
 * This is the official way to accomplish that, as documented in boost.system docs.
 */
template<>
struct is_error_code_enum<::chirp::error::Code>
{
  /// Means `Code` `enum` values can be used for `Error_code`.
  static const bool value = true;
};

} // namespace boost::system
