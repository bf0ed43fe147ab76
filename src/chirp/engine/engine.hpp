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
#include "chirp/engine/config.hpp"
#include "chirp/engine/wire_message.hpp"
#include <flow/log/log.hpp>

namespace chirp::engine
{

/**
 * The capability contract a transport engine must honor to be driven by session::Session.  Connection
 * establishment, retransmission, TLS, byte-level flow control: all that is the implementation's business.
 * What the session relies on is precisely the following.
 *
 * ### Threading ###
 * Every method is invoked by the session on the I/O thread (thread W) of its loop::Event_loop, and the Engine
 * invokes every callback on that same thread W (typically by posting to the `Task_engine` given to init()).
 * Therefore an Engine needs no internal locking for its own per-instance state.
 *
 * ### Completion guarantees ###
 *   - init(): if it returns falsy, the engine is running.  If it returns error::Code::S_RESOURCE_ERROR nothing was
 *     set up.  If it returns any other error, partial setup may exist, and `on_done` *will* be invoked once it has
 *     been torn down; the session must wait for that before reporting the failure.
 *   - send(): if it returns an error, the send did not happen, and `on_done` will *not* be invoked.  Otherwise
 *     `on_done` is invoked exactly once, success or failure, and hands the message back.
 *   - release_slot(): `on_release` is invoked exactly once, even if the message held no slot or the engine is
 *     closing.
 *   - close(): every outstanding send completes (with error::Code::S_SHUTDOWN if not done yet), then the
 *     init()-given `on_done` is invoked, once.  After that the only callbacks still invoked are the `on_release`
 *     completions of release_slot() calls made later.
 *
 * ### Diagnostics ###
 * The engine reports human-readable diagnostics through `on_log`.  `is_error == true` lines are remembered by the
 * session and attached to the next failed completion.
 */
class Engine
{
public:
  // Types.

  /// Short-hand for the task engine on which the engine must invoke callbacks (thread W).
  using Task_engine_ptr = boost::shared_ptr<util::Task_engine>;

  /// Invoked on thread W for each message received.  The message may hold a slot; see release_slot().
  using On_receive_func = Function<void (Wire_message_ptr msg)>;

  /// Invoked on thread W once the engine has fully shut down (after close(), or after a failed init()).
  using On_done_func = Function<void ()>;

  /// Invoked on thread W with a diagnostic line; `is_error` marks lines describing a failure.
  using On_log_func = Function<void (util::String_view msg, bool is_error)>;

  /// Invoked on thread W once a send() completes; hands the message back (serial updated).
  using On_send_done_func = Function<void (Wire_message_ptr msg, const Error_code& err_code)>;

  /// Invoked on thread W once a release_slot() completes; reports the released message's identity and serial.
  using On_release_func = Function<void (const util::Identity& identity, uint32_t serial)>;

  // Constructors/destructor.

  /// Boring virtual destructor.  An engine must not be destroyed before `on_done` fired (or init() failed with
  /// error::Code::S_RESOURCE_ERROR, or was never called).
  virtual ~Engine();

  // Methods.

  /**
   * Starts the engine: validates `config`, binds, and begins accepting/delivering traffic.
   *
   * @param config
   *        Configuration; copied.
   * @param task_engine
   *        Thread W's task engine; callbacks and timers must run on it.
   * @param on_receive
   *        See #On_receive_func.
   * @param on_done
   *        See #On_done_func and class doc header.
   * @param on_log
   *        See #On_log_func.
   * @return Falsy on success; else an error::Code (VALUE_ERROR, ADDRESS_IN_USE, NOT_INITIALIZED, TLS_ERROR,
   *         RESOURCE_ERROR, INIT_FAIL, ...).
   */
  virtual Error_code init(const Config& config, Task_engine_ptr task_engine,
                          On_receive_func&& on_receive, On_done_func&& on_done, On_log_func&& on_log) = 0;

  /**
   * Sends the message to its `m_address`/`m_port`.
   *
   * @param msg
   *        The message.  The engine owns it until `on_done`.
   * @param on_done
   *        See #On_send_done_func and class doc header.
   * @return Falsy if the send was started; else the error (no callback will fire).
   */
  virtual Error_code send(Wire_message_ptr msg, On_send_done_func&& on_done) = 0;

  /**
   * Releases the slot held by the given message (received earlier through `on_receive`), letting the remote send
   * more.  Harmless (still completes) if no slot is held.
   *
   * @param msg
   *        The message.
   * @param on_release
   *        See #On_release_func and class doc header.
   */
  virtual void release_slot(Wire_message_ptr msg, On_release_func&& on_release) = 0;

  /// Begins shutdown; see class doc header.
  virtual void close() = 0;

  /**
   * This node's identity: stable for the lifetime of the engine instance.  Meaningful after successful init().
   * @return See above.
   */
  virtual const util::Identity& identity() const = 0;
}; // class Engine

} // namespace chirp::engine
