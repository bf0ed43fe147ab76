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
#include <boost/shared_ptr.hpp>

namespace chirp::adapter
{

// Types.

/**
 * Session delivering each received message to an application handler run as a continuation on the application's
 * own single-threaded loop (`flow::async::Single_thread_task_loop`), which the application starts and owns.  So
 * all handlers run serially, in the application's thread, in arrival order.  If Config::m_auto_release, the
 * message's slot is released after the handler returns, unless the handler released it already.
 *
 * Handlers must not call stop() (nor destroy `*this`): stop() waits for slots to be released, which may need
 * handlers queued behind the caller.
 */
class Callback_session :
  public flow::log::Log_context,
  public Session_adapter
{
public:
  // Types.

  /// The application handler.
  using On_receive_func = Function<void (session::Message_ptr msg)>;

  // Constructors/destructor.

  /**
   * Starts the session; see session::Session ctor.
   *
   * @param logger_ptr
   *        See session::Session ctor.
   * @param loop
   *        See session::Session ctor.
   * @param config
   *        See session::Session ctor.
   * @param engine
   *        See session::Session ctor.
   * @param user_loop
   *        The application's loop on which to run the handler.  Must outlive `*this`.
   * @param on_receive_func
   *        Handler of received (non-reply) messages.
   * @param err_code
   *        See session::Session ctor.
   */
  explicit Callback_session(flow::log::Logger* logger_ptr, loop::Event_loop* loop, const session::Config& config,
                            engine::Engine_ptr&& engine, flow::async::Single_thread_task_loop* user_loop,
                            On_receive_func&& on_receive_func, Error_code* err_code = 0);

  /// Stops the session if needed.  Deliveries still queued on the application loop become no-ops.
  ~Callback_session();

private:
  // Types.

  /// What a queued delivery needs; outlived by queued deliveries only via weak reference.
  struct Delivery_context
  {
    /// See ctor.
    On_receive_func m_on_receive_func;
    /// Config::m_auto_release.
    bool m_auto_release;
  };

  // Data.

  /// See ctor.
  flow::async::Single_thread_task_loop* const m_user_loop;

  /// See Delivery_context.  Reset in dtor.
  boost::shared_ptr<Delivery_context> m_delivery;
}; // class Callback_session

} // namespace chirp::adapter
