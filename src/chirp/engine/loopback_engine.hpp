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

#include "chirp/engine/engine.hpp"
#include <flow/log/log.hpp>
#include <boost/noncopyable.hpp>

namespace chirp::engine
{

// Types.

namespace detail
{
class Loopback_node;
}

/**
 * A complete Engine delivering messages between engines within the current process, addressed by port, exactly as
 * if they were remote nodes listening on the loopback interface.  Intended for tests and for applications wanting
 * intra-process messaging with the exact semantics (slots, synchronous mode, timeouts, shutdown) of the
 * networked engine.
 *
 * ### Semantics ###
 *   - init() validates the Config (error::Code::S_VALUE_ERROR), checks that certificate/DH files exist when
 *     encryption is enabled (error::Code::S_TLS_ERROR), requires util::library_init()
 *     (error::Code::S_NOT_INITIALIZED), and binds the port process-wide (error::Code::S_ADDRESS_IN_USE).
 *   - The node identity is Config::m_identity if non-null, else random.
 *   - send() stamps the next serial of this node into the message.  The destination must be a loopback, unspecified,
 *     or bind address whose port is bound by a live engine; else the completion reports
 *     error::Code::S_CANNOT_CONNECT.  A message larger than the receiver's Config::m_max_msg_size completes with
 *     error::Code::S_VALUE_ERROR.  A send not completed within Config::m_timeout completes with
 *     error::Code::S_TIMEOUT.
 *   - The receiver holds at most Config::effective_max_slots() messages at once; others wait for a slot.
 *   - Asynchronous mode: a send completes once delivered.  Synchronous mode: once the receiver released the slot;
 *     and messages to a given port are sent one at a time, in order.
 *   - The received copy carries the sender's port and the loopback address (of the family used to address it) as
 *     its origin, and the sender's identity as its remote identity.
 *   - close() fails outstanding sends with error::Code::S_SHUTDOWN, and senders of messages it holds or queues
 *     with error::Code::S_WRITE_ERROR; then reports done.
 *
 * The implementation is in detail::Loopback_node, of which we hold the one owning reference; the process-wide
 * registry and any in-flight deliveries hold weak references only.
 */
class Loopback_engine :
  public Engine,
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /**
   * Creates an engine in un-initialized state; call init() (on thread W) to start it.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   */
  explicit Loopback_engine(flow::log::Logger* logger_ptr);

  /// If still bound (close() was never called), unbinds; logs a warning in that case.
  ~Loopback_engine() override;

  // Methods.

  /**
   * Implements Engine API.
   *
   * @param config
   *        See Engine.
   * @param task_engine
   *        See Engine.
   * @param on_receive
   *        See Engine.
   * @param on_done
   *        See Engine.
   * @param on_log
   *        See Engine.
   * @return See Engine.
   */
  Error_code init(const Config& config, Task_engine_ptr task_engine,
                  On_receive_func&& on_receive, On_done_func&& on_done, On_log_func&& on_log) override;

  /**
   * Implements Engine API.
   *
   * @param msg
   *        See Engine.
   * @param on_done
   *        See Engine.
   * @return See Engine.
   */
  Error_code send(Wire_message_ptr msg, On_send_done_func&& on_done) override;

  /**
   * Implements Engine API.
   *
   * @param msg
   *        See Engine.
   * @param on_release
   *        See Engine.
   */
  void release_slot(Wire_message_ptr msg, On_release_func&& on_release) override;

  /// Implements Engine API.
  void close() override;

  /**
   * Implements Engine API.
   * @return See Engine.
   */
  const util::Identity& identity() const override;

private:
  // Data.

  /// The implementation; null until init().
  boost::shared_ptr<detail::Loopback_node> m_node;
}; // class Loopback_engine

} // namespace chirp::engine
