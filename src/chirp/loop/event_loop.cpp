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
#include "chirp/loop/event_loop.hpp"
#include "chirp/error.hpp"
#include <flow/error/error.hpp>
#include <flow/async/util.hpp>

namespace chirp::loop
{

// Implementations.

Event_loop::Event_loop(flow::log::Logger* logger_ptr, util::String_view nickname, bool run_now) :
  flow::log::Log_context(logger_ptr, Log_component::S_LOOP),
  m_nickname(nickname),
  m_started(false),
  m_stopped(false),
  m_user_released(false),
  // (Linux) OS thread name will truncate to 15 chars; "chl-" plus a reasonable nickname prefix should fit usefully.
  m_worker(get_logger(), flow::util::ostream_op_string("chl-", m_nickname))
{
  FLOW_LOG_INFO("Event_loop [" << *this << "]: Created; run_now = [" << run_now << "].");
  if (run_now)
  {
    run(); // Cannot fail: cannot have been stopped yet.
  }
}

Event_loop::~Event_loop()
{
  bool was_started;
  {
    Lock_guard lock(m_mutex);
    if (m_stopped)
    {
      return; // Already shut down properly.  Nothing to do; m_worker dtor is a no-op at this stage.
    }
    // else
    FLOW_LOG_WARNING("Event_loop [" << *this << "]: Destroyed with [" << m_refs.get_use_count() << "] reference(s) "
                     "outstanding; did someone forget stop()?  Shutting down now regardless.");
    m_stopped = true;
    was_started = m_started;
  }

  Error_code err_code;
  shutdown(was_started, &err_code);
  if (err_code)
  {
    FLOW_LOG_WARNING("Event_loop [" << *this << "]: Shutdown in destructor failed: [" << err_code << "] "
                     "[" << err_code.message() << "].  Nothing more can be done at this stage.");
  }
} // Event_loop::~Event_loop()

void Event_loop::run(Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { run(actual_err_code); },
         err_code, "Event_loop::run()"))
  {
    return;
  }
  // else

  Lock_guard lock(m_mutex);
  if (m_stopped)
  {
    FLOW_LOG_WARNING("Event_loop [" << *this << "]: run() called after loop shut down; cannot restart.");
    *err_code = error::Code::S_LOOP_CANNOT_RESTART;
    return;
  }
  // else
  err_code->clear();

  if (m_started)
  {
    FLOW_LOG_TRACE("Event_loop [" << *this << "]: run() called but already running; no-op.");
    return;
  }
  // else

  start_worker();
} // Event_loop::run()

void Event_loop::start_worker()
{
  using flow::async::reset_thread_pinning;

  // We are in thread U, with m_mutex locked.

  /* Run a synchronous init functor in thread W, so that by the time we return the thread ID is known,
   * and in_loop_thread() works for any task we (or anyone) posted earlier. */
  m_worker.start([&]()
  {
    reset_thread_pinning(get_logger()); // Don't inherit any strange core-affinity!  Worker must float free.
    m_thread_id = boost::this_thread::get_id();
    FLOW_LOG_INFO("Event_loop [" << *this << "]: I/O thread started.");
  });
  m_started = true;
}

bool Event_loop::running() const
{
  Lock_guard lock(m_mutex);
  return m_started && (!m_stopped);
}

bool Event_loop::stopped() const
{
  Lock_guard lock(m_mutex);
  return m_stopped;
}

bool Event_loop::post(util::Task&& task)
{
  /* Keep the lock through m_worker.post() (it does not block): m_stopped becomes true under the same lock, and
   * shutdown()'s drain tasks are queued after that; so an accepted task is always ahead of them and runs in W. */
  Lock_guard lock(m_mutex);
  if (m_stopped)
  {
    FLOW_LOG_WARNING("Event_loop [" << *this << "]: Task posted after shutdown; dropping it.");
    return false;
  }
  // else

  m_worker.post(std::move(task));
  return true;
}

void Event_loop::retain()
{
  Lock_guard lock(m_mutex);
  if (m_stopped)
  {
    FLOW_LOG_WARNING("Event_loop [" << *this << "]: retain() after shutdown; ignoring.");
    return;
  }
  // else

  m_refs.increment_use();
  FLOW_LOG_TRACE("Event_loop [" << *this << "]: Retained; references = [" << m_refs.get_use_count() << "].");
}

bool Event_loop::stop(Error_code* err_code)
{
  {
    Lock_guard lock(m_mutex);
    if (m_user_released)
    {
      FLOW_LOG_TRACE("Event_loop [" << *this << "]: stop() called again; the user's reference is already gone; "
                     "no-op.");
      if (err_code)
      {
        err_code->clear();
      }
      return false;
    }
    // else
    m_user_released = true;
  }

  return release(err_code);
}

bool Event_loop::release(Error_code* err_code)
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(bool, Event_loop::release, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  err_code->clear();

  bool was_started;
  {
    Lock_guard lock(m_mutex);
    if (m_stopped)
    {
      FLOW_LOG_TRACE("Event_loop [" << *this << "]: release() after shutdown; no-op.");
      return false;
    }
    // else

    if (m_refs.decrement_use() != 0)
    {
      FLOW_LOG_TRACE("Event_loop [" << *this << "]: Released; references = [" << m_refs.get_use_count() << "].");
      return false;
    }
    // else: Last reference.  Stop accepting posts now; then shut down outside the lock.

    assert(((!m_started) || (boost::this_thread::get_id() != m_thread_id))
           && "The last release() of Event_loop must not be performed from its own I/O thread.");
    m_stopped = true;
    was_started = m_started;
  } // Lock_guard lock(m_mutex);

  shutdown(was_started, err_code);
  return !*err_code;
} // Event_loop::release()

void Event_loop::shutdown(bool was_started, Error_code* err_code)
{
  using flow::async::Synchronicity;

  // We are in thread U (not W).  m_stopped is true, so no new tasks can arrive through post().

  if (!was_started)
  {
    /* Whatever was posted to a never-run loop is still to execute in an I/O thread and nowhere else; so bring
     * thread W up just to drain it. */
    FLOW_LOG_INFO("Event_loop [" << *this << "]: Shutting down a loop that was never run; starting the I/O thread "
                  "only to drain it.");
    Lock_guard lock(m_mutex);
    start_worker();
  }

  FLOW_LOG_INFO("Event_loop [" << *this << "]: Shutting down.  Draining in the I/O thread; then joining it.");

  /* Each drain task executes in W after everything queued before it (FIFO).  The first pass therefore completes
   * all that was posted before shutdown; the second completes what those handlers queued in turn (typically
   * deferred cleanup that an engine scheduled from its close() path).  Anything queued later than that is
   * abandoned: best-effort cleanup. */
  for (unsigned int pass = 0; pass != S_N_DRAIN_PASSES; ++pass)
  {
    m_worker.post([this, pass]()
    {
      // We are in thread W.
      FLOW_LOG_TRACE("Event_loop [" << *this << "]: Drain pass [" << pass << "] reached in I/O thread.");
    }, Synchronicity::S_ASYNC_AND_AWAIT_CONCURRENT_COMPLETION);
  }

  m_worker.stop();
  // Thread W is (synchronously!) no more.

  if (!m_worker.task_engine()->stopped())
  {
    FLOW_LOG_WARNING("Event_loop [" << *this << "]: Task engine could not be closed after I/O thread joined.");
    *err_code = error::Code::S_LOOP_CLOSE_FAILED;
    return;
  }
  // else
  FLOW_LOG_INFO("Event_loop [" << *this << "]: Shutdown complete.");
} // Event_loop::shutdown()

unsigned int Event_loop::ref_count() const
{
  Lock_guard lock(m_mutex);
  return m_stopped ? 0 : m_refs.get_use_count();
}

Event_loop::Task_engine_ptr Event_loop::task_engine()
{
  return m_worker.task_engine();
}

bool Event_loop::in_loop_thread() const
{
  Lock_guard lock(m_mutex);
  return m_started && (boost::this_thread::get_id() == m_thread_id);
}

std::ostream& operator<<(std::ostream& os, const Event_loop& val)
{
  return os << '[' << val.m_nickname << "]@" << static_cast<const void*>(&val);
}

} // namespace chirp::loop
