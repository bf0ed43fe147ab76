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

#include "chirp/session/session.hpp"
#include <boost/move/unique_ptr.hpp>

/**
 * Namespace containing the chirp::adapter module: thin wrappers around a session::Session, each supplying one
 * strategy for delivering received messages to the application.  adapter::Queue_session: a blocking queue the
 * application pops from.  adapter::Pool_session: a handler run on a worker-thread pool.  adapter::Callback_session:
 * a handler run on a user-supplied single-thread loop.
 */
namespace chirp::adapter
{

// Types.

/**
 * Common part of the adapters: owns the session::Session and forwards the operations on it.  The Session is
 * created by start(), which the subclass calls once its delivery machinery is ready (the Session may deliver
 * messages as soon as it exists); and destroyed by finish(), which the subclass dtor calls before that machinery
 * goes away.
 */
class Session_adapter :
  private boost::noncopyable
{
public:
  // Methods.

  /**
   * See session::Session::send().
   *
   * @param msg
   *        See session::Session::send().
   * @param err_code
   *        See session::Session::send().
   * @return See session::Session::send().
   */
  session::Send_future send(const session::Message_ptr& msg, Error_code* err_code = 0);

  /**
   * See session::Session::request().
   *
   * @param msg
   *        See session::Session::request().
   * @param auto_release
   *        See session::Session::request().
   * @param err_code
   *        See session::Session::request().
   * @return See session::Session::request().
   */
  session::Request_future request(const session::Message_ptr& msg, bool auto_release = true,
                                  Error_code* err_code = 0);

  /**
   * See session::Session::release_slot().
   *
   * @param msg
   *        See session::Session::release_slot().
   * @return See session::Session::release_slot().
   */
  session::Release_future release_slot(const session::Message_ptr& msg);

  /**
   * See session::Session::stop().  Subclasses extend it to also stop their delivery machinery.
   *
   * @param err_code
   *        See session::Session::stop().
   */
  void stop(Error_code* err_code = 0);

  /**
   * See session::Session::identity().
   * @return See above.
   */
  const util::Identity& identity() const;

  /**
   * The underlying session.
   * @return See above.
   */
  session::Session& session();

protected:
  // Constructors/destructor.

  /// Does nothing; subclass calls start().
  Session_adapter();

  /// Asserts finish() was called.
  ~Session_adapter();

  // Methods.

  /**
   * Creates and starts the Session; see session::Session ctor.
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
   *        See session::Session ctor.
   * @param err_code
   *        See session::Session ctor.  Not null.
   */
  void start(flow::log::Logger* logger_ptr, loop::Event_loop* loop, const session::Config& config,
             engine::Engine_ptr&& engine, session::Session::On_receive_func&& on_receive_func, Error_code* err_code);

  /// Stops (if needed, logging any error) and destroys the Session.  Idempotent.
  void finish();

  /**
   * Whether the Session exists and is not stopped.
   * @return See above.
   */
  bool session_live() const;

private:
  // Data.

  /// The session; null until start() succeeds, and after finish().
  boost::movelib::unique_ptr<session::Session> m_session;
}; // class Session_adapter

} // namespace chirp::adapter
