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
#include "chirp/util/use_counted_object.hpp"
#include <flow/async/single_thread_task_loop.hpp>
#include <flow/log/log.hpp>
#include <flow/util/util.hpp>
#include <boost/thread.hpp>
#include <boost/shared_ptr.hpp>

/**
 * Namespace containing the chirp::loop module: loop::Event_loop, which owns the single I/O thread on which a
 * transport engine (and all its completion callbacks) run.
 */
namespace chirp::loop
{

// Types.

/**
 * Owner of one cooperatively-scheduled execution context ("the I/O thread," thread W in internal docs) on which an
 * engine::Engine runs, with a thread-safe post() primitive and a reference-counted shutdown protocol.
 *
 * ### Lifecycle ###
 *   - Construct.  If `run_now` (the default) the thread starts immediately; else call run() later.  run() is
 *     idempotent; but once the loop has shut down, run() emits error::Code::S_LOOP_CANNOT_RESTART.
 *   - The constructing user holds one reference.  Each session::Session sharing the loop calls retain() when
 *     constructed and release() when it stops.  stop() is release() of the user's own reference; only the first stop()
 *     does anything, so repeating it can never take away a reference some session still counts on.
 *   - When the count reaches zero the loop physically shuts down: drain tasks are posted (so they execute on thread
 *     W after everything posted earlier), awaited, and then thread W is joined from the calling thread.  Therefore
 *     once the last release() returns, no posted task or engine callback can ever run again; and every task that
 *     post() accepted has run, in thread W.
 *
 * ### Thread safety ###
 * post(), retain(), release(), stop(), run(), running() may be called concurrently from any threads.
 * The lifecycle state (reference count, started/stopped flags) is protected by a mutex.
 * However: the call that drops the last reference must *not* be made from thread W itself (it would be joining
 * itself); this is a usage contract, as it would be in any `Single_thread_task_loop`-based object.
 *
 * ### Ordering ###
 * Tasks given to post() execute on thread W in FIFO order relative to each other.  There is no ordering
 * guarantee relative to callbacks that the engine itself has scheduled (timers, deliveries) beyond
 * "eventually, in the same single thread."
 *
 * ### Shutdown failures ###
 * Shutdown drains thread W twice before joining it: once for everything posted before shutdown, once more for
 * whatever those handlers queued (e.g., an engine's deferred cleanup).  Handlers queued after that are abandoned,
 * which is not fatal.  A loop that was never run gets thread W started only for this drain, so posted tasks still
 * execute nowhere else.  However if the underlying task engine cannot then be put into stopped state, the
 * release() that triggered shutdown emits error::Code::S_LOOP_CLOSE_FAILED.
 */
class Event_loop :
  public flow::log::Log_context,
  private boost::noncopyable // And non-movable.
{
public:
  // Types.

  /// Short-hand for the task engine pointer exposed to engines so they can schedule work/timers on thread W.
  using Task_engine_ptr = boost::shared_ptr<util::Task_engine>;

  // Constructors/destructor.

  /**
   * Constructs the loop; the caller holds the first (and only) reference.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   * @param nickname
   *        Human-readable name for logging; also the basis of the OS thread name.
   * @param run_now
   *        If `true` the thread is started now; else call run() when desired.  Tasks post()ed before then are
   *        queued.
   */
  explicit Event_loop(flow::log::Logger* logger_ptr, util::String_view nickname, bool run_now = true);

  /**
   * If shutdown has not yet occurred (meaning references were leaked, or the user never called stop()), performs
   * it now, logging a warning.  Must not be called from thread W.
   */
  ~Event_loop();

  // Methods.

  /**
   * Starts thread W, unless already started (no-op).
   *
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_LOOP_CANNOT_RESTART (loop already shut down).
   */
  void run(Error_code* err_code = 0);

  /**
   * Returns `true` if and only if thread W has been started and not yet shut down.
   * @return See above.
   */
  bool running() const;

  /**
   * Returns `true` if and only if the loop has irreversibly shut down.
   * @return See above.
   */
  bool stopped() const;

  /**
   * Enqueues `task` for execution on thread W, FIFO.  If the loop has shut down, the task is dropped (and a warning
   * is logged): the loop can no longer guarantee it would ever run, and we promise none runs after shutdown.
   * Conversely a task accepted here is guaranteed to run (in thread W), even if shutdown begins immediately after.
   *
   * @param task
   *        The task.
   * @return `true` if enqueued; `false` if dropped.
   */
  bool post(util::Task&& task);

  /**
   * Adds a reference; the loop will not shut down until a matching release() (or stop()).
   * Used by session::Session on construction.  Ignored (with a warning) if already shut down.
   */
  void retain();

  /**
   * Drops a reference; if that was the last one, shuts down synchronously as described in class doc header.
   *
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_LOOP_CLOSE_FAILED (shutdown was attempted but the task engine could not be closed).
   * @return `true` if this call performed the shutdown; `false` otherwise (including on error).
   */
  bool release(Error_code* err_code = 0);

  /**
   * release() of the user's own (constructor-given) reference.  Only the first call releases it; subsequent calls
   * are no-ops returning `false`.
   *
   * @param err_code
   *        See release().
   * @return See release().
   */
  bool stop(Error_code* err_code = 0);

  /**
   * Returns the number of references currently held.  For diagnostics/tests.
   * @return See above.
   */
  unsigned int ref_count() const;

  /**
   * Returns the task engine on which thread W runs tasks.  An engine::Engine uses it to create timers and to
   * schedule its own callbacks.
   *
   * @return See above.
   */
  Task_engine_ptr task_engine();

  /**
   * Returns `true` if and only if the calling thread is thread W.
   * @return See above.
   */
  bool in_loop_thread() const;

  // Data.

  /// Nickname as passed to ctor.
  const std::string m_nickname;

private:
  // Types.

  /// Short-hand for our mutex type.
  using Mutex = flow::util::Mutex_non_recursive;

  /// Short-hand for its lock.
  using Lock_guard = flow::util::Lock_guard<Mutex>;

  // Constants.

  /// How many times shutdown() drains thread W before joining it.
  static constexpr unsigned int S_N_DRAIN_PASSES = 2;

  // Methods.

  /// Starts thread W and records its ID.  #m_mutex must be locked.
  void start_worker();

  /**
   * Performs the physical shutdown.  Must be called with #m_mutex *unlocked* and #m_stopped already `true`
   * (so no new posts are accepted while we shut down).
   *
   * @param was_started
   *        Whether thread W was ever started.
   * @param err_code
   *        See release().  Not null.
   */
  void shutdown(bool was_started, Error_code* err_code);

  // Data.

  /// Protects #m_started, #m_stopped, #m_user_released, #m_refs, #m_thread_id; held across posting to #m_worker.
  mutable Mutex m_mutex;

  /// Whether run() has started thread W.
  bool m_started;

  /// Whether the loop has (begun to) shut down; irreversible.
  bool m_stopped;

  /// Whether stop() has released the user's reference.
  bool m_user_released;

  /// Reference count; starts at 1 for the constructing user.
  util::Use_counted_object m_refs;

  /// ID of thread W once started; default (not-a-thread) until then.
  boost::thread::id m_thread_id;

  /// The thread W itself and its task engine.
  flow::async::Single_thread_task_loop m_worker;
}; // class Event_loop

// Free functions.

/**
 * Prints string representation of the given Event_loop to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Event_loop& val);

} // namespace chirp::loop
