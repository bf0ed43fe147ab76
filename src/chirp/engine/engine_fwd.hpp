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

#include "chirp/util/util_fwd.hpp"
#include <boost/shared_ptr.hpp>
#include <boost/move/unique_ptr.hpp>

/**
 * Namespace containing the chirp::engine module: the contract a transport engine must honor to be driven by
 * session::Session (engine::Engine), the engine configuration (engine::Config), the wire-level message struct
 * exchanged with an engine (engine::Wire_message), and engine::Loopback_engine, a complete in-process
 * implementation.
 */
namespace chirp::engine
{

// Types.

// Find doc headers near the bodies of these compound types.

struct Config;
struct Wire_message;
class Engine;
class Loopback_engine;

/// Short-hand for the handle through which a Wire_message is passed between session and engine.
using Wire_message_ptr = boost::shared_ptr<Wire_message>;

/// Short-hand for the owning pointer to an Engine; a session::Session takes ownership of one.
using Engine_ptr = boost::movelib::unique_ptr<Engine>;

// Free functions.

/**
 * Prints string representation of the given Config to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Config& val);

/**
 * Prints string representation of the given Wire_message to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Wire_message& val);

/**
 * Prints string representation of the given Engine to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Engine& val);

} // namespace chirp::engine
