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

#include "chirp/session/pending_table.hpp"
#include "chirp/session/request_future.hpp"
#include "chirp/engine/config.hpp"
#include "chirp/engine/engine.hpp"
#include "chirp/loop/event_loop.hpp"
#include <flow/log/log.hpp>
#include <boost/exception_ptr.hpp>
#include <atomic>

namespace chirp::session
{

// Types.

/**
 * The correlation engine between application threads and one transport engine::Engine running in thread W of an
 * loop::Event_loop.  Any thread may send(), request(), release_slot(), and stop(); none of them ever runs engine
 * code itself: each posts a task onto thread W and (where applicable) returns a future which thread W resolves
 * upon the engine's completion callback.
 *
 * ### Lifecycle ###
 * The ctor retains the loop, initializes the engine in thread W, and blocks until that is done; on failure it
 * reports the error (after waiting for the engine's done notification if the engine gave one), releases the loop,
 * and the object is unusable.  On success the Session is *ready*.  stop() (called by the dtor if needed) ends it:
 *   -# Waits up to Config::m_timeout for the application to release every received message's slot.
 *   -# If some remain, force-releases them, waits up to Config::m_timeout again, and will report
 *      error::Code::S_UNRELEASED_MSGS_ON_STOP.
 *   -# Closes the engine and waits for its done notification; the engine fails in-flight sends meanwhile.
 *   -# Fails all still-outstanding requests with error::Code::S_SHUTDOWN.
 *   -# Releases the loop (shutting it down if this was the last reference).
 *
 * ### Receiving ###
 * A received message which is the reply to an outstanding request (same identity) resolves that request.
 * Otherwise it goes to the `on_receive_func` given to the ctor, in thread W; that handler must not block.  If none
 * was given, the message's slot is released immediately.  (The adapter module builds queue, worker-pool, and
 * user-loop delivery on top of this.)  A reply arriving after its request timed out is just such a message.
 *
 * ### Error reporting ###
 * Synchronous usage errors are reported via the `Error_code* err_code` convention (throwing
 * flow::error::Runtime_error if `err_code` is null).  Asynchronous outcomes are reported through the returned
 * futures, whose exceptions are flow::error::Runtime_error carrying an error::Code and the engine's last
 * diagnostic line, if any.
 *
 * ### Thread safety ###
 * All public methods are thread-safe, except that stop() (and the dtor) must not be called from thread W, nor
 * concurrently with each other.
 */
class Session :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Types.

  /// Lifecycle state.
  enum class State
  {
    /// Engine being initialized (in ctor).
    S_INITIALIZING,
    /// Operational.
    S_READY,
    /// stop() in progress.
    S_STOPPING,
    /// Stopped, or init failed.
    S_STOPPED
  };

  /// Handler of received non-reply messages; invoked in thread W.
  using On_receive_func = Function<void (Message_ptr msg)>;

  // Constructors/destructor.

  /**
   * Starts the session: see class doc header.  Blocks until the engine is initialized or has failed to.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   * @param loop
   *        The loop whose thread W runs the engine.  Must outlive `*this`.  If not yet running it is run().
   * @param config
   *        Configuration; validated by the engine.
   * @param engine
   *        The engine, un-initialized.  `*this` takes ownership.
   * @param on_receive_func
   *        See class doc header.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  error::Code generated: whatever
   *        engine::Engine::init() reports (error::Code::S_VALUE_ERROR, error::Code::S_ADDRESS_IN_USE,
   *        error::Code::S_TLS_ERROR, error::Code::S_NOT_INITIALIZED, error::Code::S_INIT_FAIL,
   *        error::Code::S_RESOURCE_ERROR, ...); error::Code::S_LOOP_CANNOT_RESTART (`loop` was stopped).
   */
  explicit Session(flow::log::Logger* logger_ptr, loop::Event_loop* loop, const Config& config,
                   engine::Engine_ptr&& engine, On_receive_func&& on_receive_func = On_receive_func(),
                   Error_code* err_code = 0);

  /// stop()s if needed, logging any error instead of throwing.
  ~Session();

  // Methods.

  /**
   * Sends the given message to its address/port.  The returned future resolves when the engine reports the send
   * complete: to `msg` itself (now carrying the serial the engine stamped) or to an exception carrying the
   * engine's error.  Completion is never reported synchronously.
   *
   * @param msg
   *        Message.  Must not be modified until the future resolves.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  error::Code generated:
   *        error::Code::S_SESSION_NOT_READY, error::Code::S_MSG_STILL_SENDING (this same object is already in
   *        flight).  On error the returned future is invalid.
   * @return See above.
   */
  Send_future send(const Message_ptr& msg, Error_code* err_code = 0);

  /**
   * Sends the given message as a request and arranges to catch its reply: the next received message with the
   * same identity, if it arrives within Config::m_timeout of the send being issued in thread W.
   *
   * @param msg
   *        Message.  Must not be modified until the send future resolves.
   * @param auto_release
   *        Whether Request_future::get() releases the reply's slot.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  error::Code generated: those of send();
   *        error::Code::S_REQUEST_ALREADY_PENDING (a request with this identity is outstanding).  On error the
   *        returned handle is invalid.
   * @return See above.
   */
  Request_future request(const Message_ptr& msg, bool auto_release = true, Error_code* err_code = 0);

  /**
   * Releases the slot held by the given received message.  The returned future resolves once the engine has
   * released it, to the released (identity, serial).  If the message holds no slot (never did, already released,
   * or the session has stopped), resolves immediately to empty.  Calling it again before the first completes
   * yields the same future.
   *
   * @param msg
   *        Message received by `*this`.
   * @return See above.
   */
  Release_future release_slot(const Message_ptr& msg);

  /**
   * Stops the session: see class doc header.  No-op if already stopped.  Blocks for at most about
   * 2 x Config::m_timeout plus the engine's close time.
   *
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  error::Code generated:
   *        error::Code::S_UNRELEASED_MSGS_ON_STOP (the session did stop, but the application had not released
   *        all slots in time); error::Code::S_LOOP_CLOSE_FAILED (from loop::Event_loop::release()).
   */
  void stop(Error_code* err_code = 0);

  /**
   * This node's identity, as chosen by the engine.
   * @return See above.
   */
  const util::Identity& identity() const;

  /**
   * The configuration.
   * @return See above.
   */
  const Config& config() const;

  /**
   * The loop.
   * @return See above.
   */
  loop::Event_loop* event_loop() const;

  /**
   * Current state.
   * @return See above.
   */
  State state() const;

  /**
   * Number of requests outstanding.
   * @return See above.
   */
  size_t pending_request_count() const;

  /**
   * Number of received messages still holding a slot.
   * @return See above.
   */
  size_t unreleased_count() const;

  /**
   * Number of in-flight sends.
   * @return See above.
   */
  size_t pending_send_count() const;

  /**
   * Number of request timers allocated and not yet cleaned up.
   * @return See above.
   */
  size_t live_request_timer_count() const;

  /**
   * A Release_future already resolved to empty.
   * @return See above.
   */
  static Release_future nothing_released();

private:
  // Types.

  /// Short-hand for our mutex type.
  using Mutex = flow::util::Mutex_non_recursive;

  /// Short-hand for its lock.
  using Lock_guard = flow::util::Lock_guard<Mutex>;

  // Methods.

  /**
   * Helper of the ctor: everything after the loop has been retained.
   *
   * @param err_code
   *        See ctor.  Not null.
   */
  void start(Error_code* err_code);

  /**
   * Thread W: issues the given send to the engine.
   *
   * @param wire
   *        The wire message (continuation ID set).
   */
  void do_send(const engine::Wire_message_ptr& wire);

  /**
   * Thread W: engine reports a send complete.
   *
   * @param wire
   *        As given to do_send().
   * @param err_code
   *        Result.
   */
  void on_send_done(const engine::Wire_message_ptr& wire, const Error_code& err_code);

  /**
   * Thread W: arms the timeout of the given request (unless it is already resolved).
   *
   * @param identity
   *        Request identity.
   * @param state
   *        The request.
   */
  void arm_request_timeout(const util::Identity& identity, const detail::Request_state_ptr& state);

  /**
   * Thread W: a request's timeout fired.
   *
   * @param identity
   *        Request identity.
   * @param state
   *        The request.
   */
  void on_request_timeout(const util::Identity& identity, const detail::Request_state_ptr& state);

  /**
   * Thread W: a request was just taken out of #m_table for resolution; disarms its timer (scheduling the cleanup)
   * and marks it done.  The caller then resolves the promise.
   *
   * @param state
   *        The request.
   */
  void finish_request(const detail::Request_state_ptr& state);

  /**
   * Thread W: posts the destruction of the request's timer, if any, to run after any already-queued handler of
   * it.
   *
   * @param state
   *        The request.
   */
  void schedule_timer_cleanup(const detail::Request_state_ptr& state);

  /**
   * Thread W: engine delivers a message.
   *
   * @param wire
   *        The message.
   */
  void on_receive(const engine::Wire_message_ptr& wire);

  /**
   * Thread W: asks the engine to release the slot of the given message.
   *
   * @param msg
   *        Message.
   */
  void do_release(const Message_ptr& msg);

  /**
   * Thread W: engine reports a slot released.
   *
   * @param msg
   *        Message.
   * @param identity
   *        As reported.
   * @param serial
   *        As reported.
   */
  void on_released(const Message_ptr& msg, const util::Identity& identity, uint32_t serial);

  /// Thread W: engine reports it is done (closed, or failed init).
  void on_engine_done();

  /**
   * Thread W: engine reports a diagnostic line.
   *
   * @param msg
   *        The line.
   * @param is_error
   *        Whether it describes an error.
   */
  void on_engine_log(util::String_view msg, bool is_error);

  /// Thread W: resolves everything still outstanding after the engine is done: requests, sends, releases.
  void drain_after_close();

  /**
   * Blocks until every release registered in #m_table is resolved, or the given time passes.
   *
   * @param timeout
   *        Max time to wait.
   * @return `true` if all resolved.
   */
  bool await_releases(util::Fine_duration timeout) const;

  /**
   * Posts the given task onto thread W and blocks until it has run.
   *
   * @param task
   *        Task.
   * @return `false` if the loop refused it (it is stopped), in which case nothing ran.
   */
  bool post_and_wait(util::Task&& task);

  /**
   * Thread W: an exception object with the given code, carrying the engine's last diagnostic line if any.
   *
   * @param err_code
   *        Truthy code.
   * @return See above.
   */
  boost::exception_ptr make_exception(const Error_code& err_code) const;

  /**
   * The Wire_message to hand the engine for sending `msg`.
   *
   * @param msg
   *        Message.
   * @param continuation_id
   *        Send registration.
   * @return See above.
   */
  static engine::Wire_message_ptr to_wire(const Message& msg, uint64_t continuation_id);

  // Data.

  /// See config().
  const Config m_config;

  /// See event_loop().
  loop::Event_loop* const m_loop;

  /// The engine; touched only in thread W (except destroyed in our dtor, after it is done).
  engine::Engine_ptr m_engine;

  /// See ctor.
  On_receive_func m_on_receive_func;

  /// See identity().  Set before the ctor returns; immutable thereafter.
  util::Identity m_identity;

  /// Everything in flight.
  Pending_table m_table;

  /// Protects #m_state.
  mutable Mutex m_mutex;

  /// See state().
  State m_state;

  /// Whether we hold a reference to #m_loop.
  bool m_loop_retained;

  /// Set (once) upon the engine's done notification.
  boost::promise<void> m_engine_done_promise;

  /// Future of #m_engine_done_promise.
  boost::shared_future<void> m_engine_done_future;

  /// Whether #m_engine_done_promise was set.  Thread W only.
  bool m_engine_done;

  /// The engine's last error diagnostic line.  Thread W only.
  std::string m_last_diag;

  /// See live_request_timer_count().
  std::atomic<size_t> m_live_timers;
}; // class Session

} // namespace chirp::session
