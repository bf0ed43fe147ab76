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

#include "chirp/engine/engine_fwd.hpp"
#include <boost/thread/future.hpp>
#include <optional>

/**
 * Namespace containing the chirp::session module: the correlation layer between application threads and the
 * single-threaded transport engine.  session::Session is the central class; session::Message is the envelope
 * the application sends and receives; session::Request_future is the handle of a request/reply exchange.
 * session::Pending_table, internally, tracks every in-flight operation until it is resolved.
 */
namespace chirp::session
{

// Types.

// Find doc headers near the bodies of these compound types.

class Message;
class Session;
class Pending_table;
class Request_future;
struct Release_key;

namespace detail
{
class Request_timeout;
struct Request_state;
}

/// A session is configured exactly as its engine is.
using Config = engine::Config;

/// Short-hand for ref-counted pointer to a Message.  This is how messages are passed between threads.
using Message_ptr = boost::shared_ptr<Message>;

/// Resolves once the engine reports a send complete: to the (serial-stamped) message, or to an exception.
using Send_future = boost::shared_future<Message_ptr>;

/// Resolves to the reply of a request, or to an exception (timeout, send failure, shutdown).
using Reply_future = boost::shared_future<Message_ptr>;

/**
 * Resolves once a slot is released: to the (identity, serial) of the released message; or to an empty value if
 * there was nothing to release (no slot, already released, or the session had stopped).
 */
using Release_future = boost::shared_future<std::optional<Release_key>>;

// Free functions.

/**
 * Prints string representation of the given Message to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Message& val);

/**
 * Prints string representation of the given Session to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Session& val);

/**
 * Prints string representation of the given Release_key to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Release_key& val);

/**
 * Whether the two keys are equal.
 *
 * @param val1
 *        Object to compare.
 * @param val2
 *        Object to compare.
 * @return See above.
 */
bool operator==(const Release_key& val1, const Release_key& val2);

/**
 * Hash of a Release_key, for boost.unordered containers.
 *
 * @param val
 *        Object to hash.
 * @return See above.
 */
size_t hash_value(const Release_key& val);

} // namespace chirp::session
