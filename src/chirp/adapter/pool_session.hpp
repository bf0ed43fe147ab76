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

#include "chirp/adapter/session_adapter.hpp"
#include <flow/log/log.hpp>
#include <flow/async/single_thread_task_loop.hpp>
#include <flow/async/x_thread_task_loop.hpp>

namespace chirp::adapter
{

// Types.

/**
 * Session delivering each received message to an application handler run on a pool of worker threads
 * (`flow::async::Cross_thread_task_loop`).  Handlers may block (within reason) and run concurrently with each
 * other.  If Config::m_auto_release, the message's slot is released after the handler returns, unless the handler
 * released it already.
 */
class Pool_session :
  public flow::log::Log_context,
  public Session_adapter
{
public:
  // Types.

  /// The application handler.
  using On_receive_func = Function<void (session::Message_ptr msg)>;

  // Constructors/destructor.

  /**
   * Starts the pool and the session; see session::Session ctor.
   *
   * @param logger_ptr
   *        See session::Session ctor.
   * @param loop
   *        See session::Session ctor.
   * @param config
   *        See session::Session ctor.
   * @param engine
   *        See session::Session ctor.
   * @param on_receive_func
   *        Handler of received (non-reply) messages; invoked on some worker thread.
   * @param n_workers
   *        Pool size; 0 means one per hardware thread.
   * @param err_code
   *        See session::Session ctor.
   */
  explicit Pool_session(flow::log::Logger* logger_ptr, loop::Event_loop* loop, const session::Config& config,
                        engine::Engine_ptr&& engine, On_receive_func&& on_receive_func, size_t n_workers = 0,
                        Error_code* err_code = 0);

  /// Stops the session (if needed), then the pool.
  ~Pool_session();

  // Methods.

  /**
   * See Session_adapter::stop(); in addition then stops the pool.  Handlers queued but not started are dropped
   * (their messages' slots were reclaimed by the session stop).
   *
   * @param err_code
   *        See Session_adapter::stop().
   */
  void stop(Error_code* err_code = 0);

private:
  // Methods.

  /**
   * Worker thread: runs the handler and auto-releases.
   *
   * @param msg
   *        Message.
   */
  void deliver(const session::Message_ptr& msg);

  // Data.

  /// See ctor.
  On_receive_func m_on_receive_func;

  /// Config::m_auto_release.
  const bool m_auto_release;

  /// The workers.
  flow::async::Cross_thread_task_loop m_pool;
}; // class Pool_session

} // namespace chirp::adapter
