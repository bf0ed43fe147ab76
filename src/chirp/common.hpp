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

/* flow/common.hpp (pulled in by flow/util/util.hpp) #undef-s a couple of things that could otherwise clash; so
 * get it in first. */
#include <flow/util/util.hpp>

#include "chirp/detail/common.hpp"
#include <boost/filesystem.hpp>

/* We build in C++17 mode ourselves, but linking user shouldn't care about that so much.  Still, our headers use
 * C++17 features (nested namespace definitions for one), so enforce it for them too. */
#if (!defined(__cplusplus)) || (__cplusplus < 201703L)
#  error "To compile a translation unit that `#include`s any chirp/ API headers, use C++17 compile mode or later."
#endif

/**
 * Catch-all namespace for chirp: a client-side concurrency runtime allowing application threads to exchange
 * messages through a single-threaded transport engine without ever blocking (or even touching) that engine's
 * I/O thread directly.
 *
 * From the user's perspective, one should view this namespace as the "root," meaning it consists of two parts:
 *   - Symbols directly in chirp: the absolute most basic, commonly used symbols (such as the alias
 *     chirp::Error_code).  In particular this includes `enum class` chirp::Log_component which defines the set of
 *     possible `flow::log::Component` values logged from within all modules of chirp.
 *   - Sub-namespaces, each of which represents a chirp *module* providing certain grouped functionality:
 *
 *   - *chirp::loop*: chirp::loop::Event_loop owns the one I/O thread ("thread W" in our internal docs) on which the
 *     transport engine and every one of its completion callbacks execute.  Any thread may `post()` work onto it.
 *     Multiple sessions may share one loop; it is reference-counted and shuts down with the last of them.
 *   - *chirp::engine*: the contract chirp requires of a transport engine (chirp::engine::Engine) plus
 *     chirp::engine::Loopback_engine, a complete in-process engine.  A TCP/TLS engine is a collaborator that
 *     merely implements the same abstract interface.
 *   - *chirp::session*: the correlation layer proper.  chirp::session::Session lets any thread `send()`,
 *     `request()`, `release_slot()`, and `stop()`, all returning futures where appropriate; it tracks every
 *     in-flight operation in a chirp::session::Pending_table and resolves each exactly once.
 *   - *chirp::adapter*: thin delivery-strategy wrappers around a chirp::session::Session: blocking queue,
 *     worker pool, continuation on a user-supplied loop.
 *   - *chirp::util*: miscellany, including process-wide chirp::util::library_init().
 *   - *chirp::error*: chirp's extension of the boost.system error-code conventions.
 */
namespace chirp
{

// Types.  They're outside of `namespace ::chirp::util` for brevity due to their frequent use.

/// Short-hand for filesystem namespace.
namespace fs = boost::filesystem;

/// Short-hand for `flow::Error_code` which is very common.
using Error_code = flow::Error_code;

/// Short-hand for polymorphic functor holder which is very common.  This is essentially `std::function`.
template<typename Signature>
using Function = flow::Function<Signature>;

#ifdef CHIRP_DOXYGEN_ONLY // Actual compilation will ignore the below; but Doxygen will scan it and generate docs.

/**
 * The `flow::log::Component` payload enumeration containing various log components used by chirp internal logging.
 * Internal chirp code specifies members thereof when indicating the log component for each particular piece of
 * logging code.  chirp user specifies it, albeit very rarely, when configuring their program's logging
 * such as via `flow::log::Config::init_component_to_union_idx_mapping()` and `flow::log::Config::init_component_names()`.
 *
 * The actual members of this `enum class` are generated via macro magic from the file
 * detail/macros/log_component_enum_declare.macros.hpp; see that file for the list.
 */
enum class Log_component
{
  /// Placeholder for Doxygen purposes only; see above.
  S_END_SENTINEL
};

// Constants.

/**
 * The map generated by `flow::log` macro magic that maps each enumerated value in chirp::Log_component to its
 * string representation as used in log output and verbosity config.  chirp user specifies it, albeit very rarely,
 * when configuring their program's logging via `flow::log::Config::init_component_names()`.
 *
 * @see chirp::Log_component first.
 */
extern const boost::unordered_multimap<Log_component, std::string> S_CHIRP_LOG_COMPONENT_NAME_MAP;

#endif // CHIRP_DOXYGEN_ONLY

} // namespace chirp
