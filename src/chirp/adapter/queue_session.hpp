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
#include <boost/thread/condition_variable.hpp>
#include <atomic>
#include <deque>

namespace chirp::adapter
{

// Types.

/**
 * Session delivering received messages into a thread-safe FIFO queue, from which any application thread pops
 * them with get() or try_get().  Concurrency comes from sending several messages and collecting the results
 * later; a map keyed by Message identity matches requests with answers, if Session::request() is not used.
 *
 * Config::m_auto_release does not apply: the application releases each message it pops.  The exception is
 * set_disable_queue(), for nodes that only send: then every incoming message is released on arrival and dropped.
 */
class Queue_session :
  public flow::log::Log_context,
  public Session_adapter
{
public:
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
   * @param disable_queue
   *        Initial set_disable_queue() value.
   * @param err_code
   *        See session::Session ctor.
   */
  explicit Queue_session(flow::log::Logger* logger_ptr, loop::Event_loop* loop, const session::Config& config,
                         engine::Engine_ptr&& engine, bool disable_queue = false, Error_code* err_code = 0);

  /// Stops the session (if needed) and wakes any get()ters.
  ~Queue_session();

  // Methods.

  /**
   * Pops the oldest message, waiting as long as needed.  Returns null only if stop()ped (and empty).
   * @return See above.
   */
  session::Message_ptr get();

  /**
   * Pops the oldest message, waiting up to the given time.
   *
   * @param timeout
   *        Max time to wait.
   * @return The message; or null if none arrived in time (or stop()ped).
   */
  session::Message_ptr get(util::Fine_duration timeout);

  /**
   * Pops the oldest message if any, without waiting.
   * @return The message or null.
   */
  session::Message_ptr try_get();

  /**
   * Number of queued messages.
   * @return See above.
   */
  size_t size() const;

  /**
   * Whether `size() == 0`.
   * @return See above.
   */
  bool empty() const;

  /**
   * Whether incoming messages are dropped (after release) instead of queued.
   * @param disable_queue
   *        Value.
   */
  void set_disable_queue(bool disable_queue);

  /**
   * See Session_adapter::stop(); in addition wakes any get()ters.
   *
   * @param err_code
   *        See Session_adapter::stop().
   */
  void stop(Error_code* err_code = 0);

private:
  // Types.

  /// Short-hand for our mutex type.
  using Mutex = flow::util::Mutex_non_recursive;

  /// Short-hand for its lock.
  using Lock_guard = flow::util::Lock_guard<Mutex>;

  // Methods.

  /**
   * Thread W: queues (or drops) a received message.
   *
   * @param msg
   *        Message.
   */
  void on_receive(session::Message_ptr msg);

  /**
   * Helper: pops front; #m_mutex must be locked and #m_queue non-empty.
   * @return See above.
   */
  session::Message_ptr pop();

  /// Marks stopped and wakes get()ters.
  void wake_all();

  // Data.

  /// See set_disable_queue().
  std::atomic<bool> m_disable_queue;

  /// Protects #m_queue and #m_stopped.
  mutable Mutex m_mutex;

  /// Signaled on push and on stop.
  boost::condition_variable m_cond;

  /// The queue.
  std::deque<session::Message_ptr> m_queue;

  /// Whether stop() was called.
  bool m_stopped;
}; // class Queue_session

} // namespace chirp::adapter
