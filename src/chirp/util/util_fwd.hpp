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
#include <flow/log/log.hpp>
#include <flow/async/util.hpp>
#include <boost/asio.hpp>
#include <array>
#include <cstdint>

/**
 * Module containing miscellaneous general-use facilities that don't fit into any other chirp module.
 * Most notably: the message/node Identity type, and process-wide util::library_init() / util::library_cleanup().
 */
namespace chirp::util
{

// Types.

// Find doc headers near the bodies of these compound types.

class Use_counted_object;

/// Size in bytes of an Identity.
constexpr size_t S_IDENTITY_SIZE = 16;

/**
 * A 16-byte opaque token.  Used both as a message identity (correlation key of a logical exchange, surviving
 * reply substitution) and as a node identity (stable per engine instance lifetime; lets higher layers detect
 * remote restarts).  An all-zero Identity is the "not set" value.
 */
using Identity = std::array<uint8_t, S_IDENTITY_SIZE>;

/// Short-hand for Flow's `String_view`.
using String_view = flow::util::String_view;
/// Short-hand for Flow's `Fine_duration`.
using Fine_duration = flow::Fine_duration;
/// Short-hand for Flow's `Fine_time_pt`.
using Fine_time_pt = flow::Fine_time_pt;

/// Short-hand for polymorphic function (a-la `std::function<>`) that takes no arguments and returns nothing.
using Task = flow::async::Task;

/// Short-hand for the boost.asio-based `io_context` type on which flow::async loops run their tasks.
using Task_engine = flow::util::Task_engine;

/// IPv4-or-IPv6 address, as used for message destinations/origins and bind addresses.
using Ip_address = boost::asio::ip::address;

// Constants.

/// A (default-cted) string.  May be useful for functions returning `const std::string&`.
extern const std::string EMPTY_STRING;

/// The all-zero Identity.
extern const Identity NULL_IDENTITY;

// Free functions.

/**
 * Returns a fresh random Identity (RFC 4122 version-4 UUID bytes); never equal to #NULL_IDENTITY.
 * Thread-safe.
 *
 * @return See above.
 */
Identity random_identity();

/**
 * Returns `true` if and only if `id` is #NULL_IDENTITY.
 *
 * @param id
 *        Value to check.
 * @return See above.
 */
bool is_null(const Identity& id);

/**
 * Converts seconds (as floating-point, the way timeouts are configured) to a Fine_duration.
 *
 * @param secs
 *        Non-negative number of seconds.
 * @return See above.
 */
Fine_duration seconds_to_duration(float secs);

/**
 * Parses the given text as an IPv4 or IPv6 address.
 *
 * @param text
 *        Text such as "127.0.0.1" or "::1".
 * @param err_code
 *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
 *        error::Code::S_VALUE_ERROR (not an address).
 * @return The address; unspecified if error.
 */
Ip_address parse_address(String_view text, Error_code* err_code = 0);

/**
 * Prints the given Identity as 32 lower-case hex digits.
 *
 * @param os
 *        Stream to which to write.
 * @param id
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Identity& id);

/**
 * Sets up process-wide chirp state (currently: the registry backing engine::Loopback_engine).  Idempotent and
 * thread-safe; further calls are no-ops until library_cleanup().  Must precede the first engine `init()`.
 *
 * @param logger_ptr
 *        Logger to use for subsequently logging.
 */
void library_init(flow::log::Logger* logger_ptr);

/**
 * Undoes library_init().  Refuses (returns `false`, logs) if any engine is still registered.  Idempotent.
 *
 * @param logger_ptr
 *        Logger to use for subsequently logging.
 * @return `false` if live engines prevented cleanup; `true` otherwise (including if not initialized).
 */
bool library_cleanup(flow::log::Logger* logger_ptr);

/**
 * Returns `true` between library_init() and library_cleanup().
 *
 * @return See above.
 */
bool library_initialized();

} // namespace chirp::util
