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
#include "chirp/session/session.hpp"
#include "chirp/error.hpp"
#include <flow/error/error.hpp>
#include <boost/make_shared.hpp>
#include <boost/chrono/chrono_io.hpp>
#include <boost/exception_ptr.hpp>

namespace chirp::session
{

// Implementations.

Session::Session(flow::log::Logger* logger_ptr, loop::Event_loop* loop, const Config& config,
                 engine::Engine_ptr&& engine, On_receive_func&& on_receive_func, Error_code* err_code) :
  flow::log::Log_context(logger_ptr, Log_component::S_SESSION),
  m_config(config),
  m_loop(loop),
  m_engine(std::move(engine)),
  m_on_receive_func(std::move(on_receive_func)),
  m_identity(util::NULL_IDENTITY),
  m_state(State::S_INITIALIZING),
  m_loop_retained(false),
  m_engine_done_future(m_engine_done_promise.get_future()),
  m_engine_done(false),
  m_live_timers(0)
{
  Error_code our_err_code;
  start(&our_err_code);
  if (our_err_code)
  {
    if (!err_code)
    {
      throw flow::error::Runtime_error(our_err_code, "Session::Session()");
    }
    *err_code = our_err_code;
    return;
  }
  // else
  if (err_code)
  {
    err_code->clear();
  }
} // Session::Session()

void Session::start(Error_code* err_code)
{
  using boost::promise;

  assert(!m_loop->in_loop_thread() && "Blocking on thread W from thread W would deadlock.");

  FLOW_LOG_INFO("Session [" << *this << "]: Starting on loop [" << *m_loop << "]; config [" << m_config << "].");

  const auto fail = [&](const Error_code& our_err_code)
  {
    {
      Lock_guard lock(m_mutex);
      m_state = State::S_STOPPED;
    }
    if (m_loop_retained)
    {
      m_loop_retained = false;
      Error_code loop_err_code;
      m_loop->release(&loop_err_code);
      if (loop_err_code)
      {
        FLOW_LOG_WARNING("Session [" << *this << "]: Upon failed start, releasing the loop also failed "
                         "[" << loop_err_code << "] [" << loop_err_code.message() << "].  Reporting the former.");
      }
    }
    *err_code = our_err_code;
  };

  m_loop->run(err_code);
  if (*err_code)
  {
    fail(*err_code);
    return;
  }
  // else
  m_loop->retain();
  m_loop_retained = true;

  promise<Error_code> init_promise;
  const bool posted = m_loop->post([&]()
  {
    // We are in thread W.
    const auto init_err_code
      = m_engine->init(m_config, m_loop->task_engine(),
                       [this](engine::Wire_message_ptr wire) { on_receive(wire); },
                       [this]() { on_engine_done(); },
                       [this](util::String_view msg, bool is_error) { on_engine_log(msg, is_error); });
    if (!init_err_code)
    {
      m_identity = m_engine->identity();
    }
    init_promise.set_value(init_err_code);
  });

  if (!posted)
  {
    fail(error::Code::S_LOOP_CANNOT_RESTART);
    return;
  }
  // else

  const auto init_err_code = init_promise.get_future().get();
  if (init_err_code)
  {
    /* Everything posted to thread W before now has run; so m_last_diag is safe to read.  Per Engine contract
     * all but a RESOURCE_ERROR failure are followed by the done notification: wait for it, so that the engine
     * has nothing left in thread W referring to us. */
    FLOW_LOG_WARNING("Session [" << *this << "]: Engine init failed [" << init_err_code << "] "
                     "[" << init_err_code.message() << "]; engine said [" << m_last_diag << "].");
    if (init_err_code != error::Code::S_RESOURCE_ERROR)
    {
      m_engine_done_future.wait();
    }
    fail(init_err_code);
    return;
  }
  // else

  {
    Lock_guard lock(m_mutex);
    m_state = State::S_READY;
  }
  FLOW_LOG_INFO("Session [" << *this << "]: Ready.");
} // Session::start()

Session::~Session()
{
  Error_code err_code;
  stop(&err_code);
  if (err_code)
  {
    FLOW_LOG_WARNING("Session [" << *this << "]: Stop in destructor reported [" << err_code << "] "
                     "[" << err_code.message() << "].  Nothing more can be done at this stage.");
  }
}

Send_future Session::send(const Message_ptr& msg, Error_code* err_code)
{
  using boost::make_shared;

  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(Send_future, Session::send, msg, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  if (state() != State::S_READY)
  {
    FLOW_LOG_WARNING("Session [" << *this << "]: send() of [" << *msg << "] while not ready; refusing.");
    *err_code = error::Code::S_SESSION_NOT_READY;
    return Send_future();
  }
  // else

  auto promise = make_shared<Pending_table::Send_promise>();
  Send_future send_future(promise->get_future());
  const auto continuation_id = m_table.register_send(Pending_table::Send_entry{ msg, promise, {} });
  if (continuation_id == 0)
  {
    FLOW_LOG_WARNING("Session [" << *this << "]: send() of [" << *msg << "] while a send of that same object is "
                     "in progress; refusing.");
    *err_code = error::Code::S_MSG_STILL_SENDING;
    return Send_future();
  }
  // else

  FLOW_LOG_TRACE("Session [" << *this << "]: Sending [" << *msg << "] (continuation [" << continuation_id << "]).");

  auto wire = to_wire(*msg, continuation_id);
  if (!m_loop->post([this, wire]() { do_send(wire); }))
  {
    // The loop is going away under us (someone stop()ped it directly); the send never started.
    const auto entry = m_table.take_send(continuation_id);
    if (entry)
    {
      entry->m_promise->set_exception
        (boost::copy_exception(flow::error::Runtime_error(error::Code::S_SHUTDOWN, "Session::send()")));
    }
  }

  err_code->clear();
  return send_future;
} // Session::send()

Request_future Session::request(const Message_ptr& msg, bool auto_release, Error_code* err_code)
{
  using boost::make_shared;

  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(Request_future, Session::request, msg, auto_release, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  if (state() != State::S_READY)
  {
    FLOW_LOG_WARNING("Session [" << *this << "]: request() of [" << *msg << "] while not ready; refusing.");
    *err_code = error::Code::S_SESSION_NOT_READY;
    return Request_future();
  }
  // else

  const auto identity = msg->identity();
  auto state = make_shared<detail::Request_state>();
  if (!m_table.register_request(identity, state))
  {
    FLOW_LOG_WARNING("Session [" << *this << "]: request() of [" << *msg << "] while a request with that identity "
                     "is outstanding; refusing.");
    *err_code = error::Code::S_REQUEST_ALREADY_PENDING;
    return Request_future();
  }
  // else

  // Same as send() but remembering the request in the send entry, so a failed send fails the request too.
  auto promise = make_shared<Pending_table::Send_promise>();
  Send_future send_future(promise->get_future());
  const auto continuation_id = m_table.register_send(Pending_table::Send_entry{ msg, promise, state });
  if (continuation_id == 0)
  {
    FLOW_LOG_WARNING("Session [" << *this << "]: request() of [" << *msg << "] while a send of that same object is "
                     "in progress; refusing.");
    m_table.take_request_if(identity, state);
    *err_code = error::Code::S_MSG_STILL_SENDING;
    return Request_future();
  }
  // else

  FLOW_LOG_TRACE("Session [" << *this << "]: Requesting [" << *msg << "] (continuation [" << continuation_id << "]).");

  /* Post the send, then the timer arming, in that order: so the timeout counts from when the send is actually
   * issued in thread W. */
  auto wire = to_wire(*msg, continuation_id);
  if (!m_loop->post([this, wire, identity, state]()
                    {
                      do_send(wire);
                      arm_request_timeout(identity, state);
                    }))
  {
    const auto entry = m_table.take_send(continuation_id);
    const auto shutdown_exc
      = boost::copy_exception(flow::error::Runtime_error(error::Code::S_SHUTDOWN, "Session::request()"));
    if (entry)
    {
      entry->m_promise->set_exception(shutdown_exc);
    }
    if (m_table.take_request_if(identity, state))
    {
      state->m_reply_promise.set_exception(shutdown_exc);
    }
  }

  err_code->clear();
  return Request_future(send_future, state->m_reply_future, auto_release);
} // Session::request()

Release_future Session::release_slot(const Message_ptr& msg)
{
  if ((!msg->has_slot()) || (state() == State::S_STOPPED))
  {
    return nothing_released();
  }
  // else

  // m_wire is immutable; and so is its m_serial (the engine stamped it before delivery).
  const Release_key key{ msg->m_wire->m_identity, msg->m_wire->m_serial };
  auto future = m_table.release_future(key);
  if (!future.valid())
  {
    // Raced against another release (or the stop() drain) which has already completed.
    return nothing_released();
  }
  // else

  FLOW_LOG_TRACE("Session [" << *this << "]: Releasing slot of [" << *msg << "].");
  if (!m_loop->post([this, msg]() { do_release(msg); }))
  {
    FLOW_LOG_WARNING("Session [" << *this << "]: Loop is shut down; cannot release slot of [" << *msg << "]; "
                     "stop() will account for it.");
  }
  return future;
} // Session::release_slot()

void Session::stop(Error_code* err_code)
{
  using boost::chrono::milliseconds;

  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { stop(actual_err_code); },
         err_code, "Session::stop()"))
  {
    return;
  }
  // else

  {
    Lock_guard lock(m_mutex);
    if (m_state != State::S_READY)
    {
      err_code->clear();
      return; // Already stopped (or never started).  No-op.
    }
    // else
    m_state = State::S_STOPPING;
  }

  assert(!m_loop->in_loop_thread() && "Blocking on thread W from thread W would deadlock.");

  const auto timeout = m_config.timeout();
  FLOW_LOG_INFO("Session [" << *this << "]: Stopping; waiting up to "
                "[" << boost::chrono::duration_cast<milliseconds>(timeout) << "] for [" << unreleased_count() << "] "
                "slot(s) to be released.");

  // Step 1: Let the application finish with what it has received.
  bool all_released = await_releases(timeout);
  if (!all_released)
  {
    // Step 2: Take the slots back ourselves.
    const auto entries = m_table.release_entries();
    FLOW_LOG_WARNING("Session [" << *this << "]: [" << entries.size() << "] slot(s) still held after the timeout; "
                     "the application failed to release them.  Force-releasing.");
    for (const auto& entry : entries)
    {
      const auto msg = entry.m_msg;
      if (!m_loop->post([this, msg]() { do_release(msg); }))
      {
        FLOW_LOG_WARNING("Session [" << *this << "]: Loop refused the force-release of [" << *msg << "].");
      }
    }
    if (!await_releases(timeout))
    {
      FLOW_LOG_WARNING("Session [" << *this << "]: [" << unreleased_count() << "] slot(s) still not confirmed "
                       "released; closing regardless.");
    }
  }

  // Step 3: Close the engine; it fails in-flight sends and then reports done.
  if (post_and_wait([this]() { m_engine->close(); }))
  {
    m_engine_done_future.wait();

    // Step 4: Anything still outstanding can only fail now.
    if (!post_and_wait([this]() { drain_after_close(); }))
    {
      // Loop went away between the two; thread W is gone, so it is safe to do it here.
      drain_after_close();
    }
  }
  else
  {
    /* Someone released the loop out from under us (more release()s than retain()s); thread W is gone and the
     * engine with it.  Just fail everything. */
    FLOW_LOG_WARNING("Session [" << *this << "]: Loop [" << *m_loop << "] already shut down; cannot close the "
                     "engine in an orderly way.  Failing everything outstanding.");
    drain_after_close();
  }

  {
    Lock_guard lock(m_mutex);
    m_state = State::S_STOPPED;
  }

  // Step 5: Our reference to the loop.
  assert(m_loop_retained);
  m_loop_retained = false;
  m_loop->release(err_code);
  if (*err_code)
  {
    FLOW_LOG_WARNING("Session [" << *this << "]: Releasing the loop failed [" << *err_code << "] "
                     "[" << err_code->message() << "].");
    return;
  }
  // else

  if (!all_released)
  {
    *err_code = error::Code::S_UNRELEASED_MSGS_ON_STOP;
  }
  FLOW_LOG_INFO("Session [" << *this << "]: Stopped; result [" << *err_code << "] [" << err_code->message() << "].");
} // Session::stop()

void Session::do_send(const engine::Wire_message_ptr& wire)
{
  // We are in thread W.

  const auto err_code = m_engine->send(wire, [this](engine::Wire_message_ptr wire, const Error_code& err_code)
  {
    on_send_done(wire, err_code);
  });
  if (err_code)
  {
    // Refused outright: the engine will not call back; so complete it ourselves (still asynchronously to user).
    FLOW_LOG_WARNING("Session [" << *this << "]: Engine refused send [" << *wire << "]: "
                     "[" << err_code << "] [" << err_code.message() << "].");
    on_send_done(wire, err_code);
  }
}

void Session::on_send_done(const engine::Wire_message_ptr& wire, const Error_code& err_code)
{
  // We are in thread W.

  auto entry = m_table.take_send(wire->m_continuation_id);
  if (!entry)
  {
    FLOW_LOG_WARNING("Session [" << *this << "]: Engine reported completion of send [" << *wire << "] "
                     "with unknown continuation; ignoring.");
    return;
  }
  // else

  if (!err_code)
  {
    FLOW_LOG_TRACE("Session [" << *this << "]: Send of [" << *entry->m_msg << "] completed (serial "
                   "[" << wire->m_serial << "]).");
    entry->m_msg->m_serial = wire->m_serial;
    entry->m_promise->set_value(entry->m_msg);
    return;
  }
  // else

  FLOW_LOG_INFO("Session [" << *this << "]: Send of [" << *entry->m_msg << "] failed "
                "[" << err_code << "] [" << err_code.message() << "].");
  const auto exc = make_exception(err_code);
  entry->m_promise->set_exception(exc);

  // If it was a request, the reply is not coming either.
  if (entry->m_request && m_table.take_request_if(entry->m_msg->identity(), entry->m_request))
  {
    finish_request(entry->m_request);
    entry->m_request->m_reply_promise.set_exception(exc);
  }
} // Session::on_send_done()

void Session::arm_request_timeout(const util::Identity& identity, const detail::Request_state_ptr& state)
{
  using boost::make_shared;
  using boost::weak_ptr;

  // We are in thread W.

  if (state->m_done)
  {
    return; // Already resolved (e.g., send refused outright).  Nothing to time.
  }
  // else

  state->m_timeout = make_shared<detail::Request_timeout>
                       (get_logger(), *(m_loop->task_engine()), m_config.timeout(),
                        [this, identity, state_weak = weak_ptr<detail::Request_state>(state)]()
  {
    const auto state = state_weak.lock();
    if (state)
    {
      on_request_timeout(identity, state);
    }
  });
  ++m_live_timers;
  state->m_timeout->arm();
}

void Session::on_request_timeout(const util::Identity& identity, const detail::Request_state_ptr& state)
{
  using util::operator<<;
  using flow::util::ostream_op_string;

  // We are in thread W.

  if (!m_table.take_request_if(identity, state))
  {
    return; // Lost the race to a reply/failure/shutdown after all.
  }
  // else

  FLOW_LOG_INFO("Session [" << *this << "]: Request [" << identity << "] timed out.");
  finish_request(state);
  state->m_reply_promise.set_exception
    (boost::copy_exception(flow::error::Runtime_error
                             (error::Code::S_TIMEOUT,
                              ostream_op_string("Request timed out after [", m_config.m_timeout, "] s."))));
}

void Session::finish_request(const detail::Request_state_ptr& state)
{
  // We are in thread W.

  state->m_done = true;
  if (state->m_timeout)
  {
    state->m_timeout->disarm(); // No-op if it is the timeout itself that is finishing us.
    schedule_timer_cleanup(state);
  }
}

void Session::schedule_timer_cleanup(const detail::Request_state_ptr& state)
{
  // We are in thread W.

  m_loop->post([this, state]()
  {
    if (state->m_timeout)
    {
      state->m_timeout.reset();
      --m_live_timers;
    }
  });
}

void Session::on_receive(const engine::Wire_message_ptr& wire)
{
  using boost::make_shared;

  // We are in thread W.

  const Message_ptr msg(new Message(wire, this));

  if (wire->m_has_slot)
  {
    auto promise = make_shared<Pending_table::Release_promise>();
    Release_future future(promise->get_future());
    const Release_key key{ wire->m_identity, wire->m_serial };
    if (!m_table.register_release(key, Pending_table::Release_entry{ msg, promise, future }))
    {
      FLOW_LOG_WARNING("Session [" << *this << "]: Received [" << *msg << "] whose slot key [" << key << "] is "
                       "already tracked; the engine delivered a duplicate.  Not tracking it again.");
    }
  }

  const auto state = m_table.take_request(wire->m_identity);
  if (state)
  {
    FLOW_LOG_TRACE("Session [" << *this << "]: Received [" << *msg << "]: reply to outstanding request.");
    finish_request(state);
    state->m_reply_promise.set_value(msg);
    return;
  }
  // else

  FLOW_LOG_TRACE("Session [" << *this << "]: Received [" << *msg << "].");
  if (m_on_receive_func)
  {
    m_on_receive_func(msg);
  }
  else if (msg->has_slot())
  {
    do_release(msg); // Nobody to give it to.
  }
} // Session::on_receive()

void Session::do_release(const Message_ptr& msg)
{
  // We are in thread W.

  const auto& wire = msg->m_wire;
  if (!wire->m_has_slot)
  {
    return; // Released meanwhile (e.g., release_slot() twice quickly; or forced by stop()).
  }
  // else

  m_engine->release_slot(wire, [this, msg](const util::Identity& identity, uint32_t serial)
  {
    on_released(msg, identity, serial);
  });
}

void Session::on_released(const Message_ptr& msg, const util::Identity& identity, uint32_t serial)
{
  // We are in thread W.

  const Release_key key{ identity, serial };
  msg->m_has_slot = false;
  auto entry = m_table.take_release(key);
  if (entry)
  {
    FLOW_LOG_TRACE("Session [" << *this << "]: Slot [" << key << "] released.");
    entry->m_promise->set_value(std::optional<Release_key>(key));
  }
}

void Session::on_engine_done()
{
  // We are in thread W.

  if (m_engine_done)
  {
    FLOW_LOG_WARNING("Session [" << *this << "]: Engine reported done twice; ignoring.");
    return;
  }
  // else
  m_engine_done = true;

  FLOW_LOG_INFO("Session [" << *this << "]: Engine reports done.");
  m_engine_done_promise.set_value();
}

void Session::on_engine_log(util::String_view msg, bool is_error)
{
  // We are in thread W.

  if (is_error)
  {
    FLOW_LOG_INFO("Session [" << *this << "]: Engine error: [" << msg << "].");
    m_last_diag.assign(msg.data(), msg.size());
  }
  else
  {
    FLOW_LOG_TRACE("Session [" << *this << "]: Engine: [" << msg << "].");
  }
}

void Session::drain_after_close()
{
  // We are in thread W.

  const auto shutdown_exc
    = boost::copy_exception(flow::error::Runtime_error(error::Code::S_SHUTDOWN, "Session::stop()"));

  const auto requests = m_table.take_all_requests();
  const auto sends = m_table.take_all_sends(); // Should be none: the engine failed them when closing.
  const auto releases = m_table.take_all_releases();
  FLOW_LOG_INFO("Session [" << *this << "]: Failing [" << requests.size() << "] outstanding request(s) and "
                "[" << sends.size() << "] send(s); dropping [" << releases.size() << "] unreleased slot(s).");

  for (const auto& state : requests)
  {
    state->m_done = true;
    if (state->m_timeout)
    {
      state->m_timeout->disarm();
      state->m_timeout.reset();
      --m_live_timers;
    }
    state->m_reply_promise.set_exception(shutdown_exc);
  }
  for (const auto& entry : sends)
  {
    entry.m_promise->set_exception(shutdown_exc);
  }
  for (const auto& entry : releases)
  {
    entry.m_msg->m_has_slot = false; // The engine has closed; its slots are gone.
    entry.m_promise->set_value(std::optional<Release_key>());
  }
} // Session::drain_after_close()

bool Session::await_releases(util::Fine_duration timeout) const
{
  const auto deadline = flow::Fine_clock::now() + timeout;

  // Released entries leave the table; but more may arrive meanwhile; so re-check until it is empty.
  for (auto entries = m_table.release_entries(); !entries.empty(); entries = m_table.release_entries())
  {
    for (const auto& entry : entries)
    {
      const auto now = flow::Fine_clock::now();
      if (entry.m_future.is_ready())
      {
        continue;
      }
      // else
      if ((now >= deadline) || (entry.m_future.wait_for(deadline - now) != boost::future_status::ready))
      {
        return false;
      }
    }
  }
  return true;
}

bool Session::post_and_wait(util::Task&& task)
{
  boost::promise<void> done_promise;
  if (!m_loop->post([&]()
                    {
                      task();
                      done_promise.set_value();
                    }))
  {
    return false;
  }
  // else
  done_promise.get_future().wait();
  return true;
}

boost::exception_ptr Session::make_exception(const Error_code& err_code) const
{
  return boost::copy_exception(flow::error::Runtime_error(err_code, m_last_diag));
}

engine::Wire_message_ptr Session::to_wire(const Message& msg, uint64_t continuation_id)
{
  auto wire = boost::make_shared<engine::Wire_message>();
  wire->m_identity = msg.m_identity;
  wire->m_header = msg.m_header;
  wire->m_data = msg.m_data;
  wire->m_address = msg.m_address;
  wire->m_port = msg.m_port;
  wire->m_continuation_id = continuation_id;
  return wire;
}

const util::Identity& Session::identity() const
{
  return m_identity;
}

const Config& Session::config() const
{
  return m_config;
}

loop::Event_loop* Session::event_loop() const
{
  return m_loop;
}

Session::State Session::state() const
{
  Lock_guard lock(m_mutex);
  return m_state;
}

size_t Session::pending_request_count() const
{
  return m_table.request_count();
}

size_t Session::unreleased_count() const
{
  return m_table.release_count();
}

size_t Session::pending_send_count() const
{
  return m_table.send_count();
}

size_t Session::live_request_timer_count() const
{
  return m_live_timers;
}

Release_future Session::nothing_released()
{
  Pending_table::Release_promise promise;
  promise.set_value(std::optional<Release_key>());
  return Release_future(promise.get_future());
}

std::ostream& operator<<(std::ostream& os, const Session& val)
{
  using util::operator<<;
  return os << '[' << val.identity() << "]@port[" << val.config().m_port << "]@" << static_cast<const void*>(&val);
}

} // namespace chirp::session
