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
#include "chirp/adapter/queue_session.hpp"
#include <flow/error/error.hpp>

namespace chirp::adapter
{

// Implementations.

Queue_session::Queue_session(flow::log::Logger* logger_ptr, loop::Event_loop* loop, const session::Config& config,
                             engine::Engine_ptr&& engine, bool disable_queue, Error_code* err_code) :
  flow::log::Log_context(logger_ptr, Log_component::S_ADAPTER),
  m_disable_queue(disable_queue),
  m_stopped(false)
{
  Error_code our_err_code;
  start(logger_ptr, loop, config, std::move(engine),
        [this](session::Message_ptr msg) { on_receive(std::move(msg)); }, &our_err_code);
  if (our_err_code)
  {
    if (!err_code)
    {
      throw flow::error::Runtime_error(our_err_code, "Queue_session::Queue_session()");
    }
    *err_code = our_err_code;
    return;
  }
  // else

  FLOW_LOG_INFO("Queue_session [" << this << "]: Started session [" << session() << "]; queue "
                "[" << (m_disable_queue ? "disabled" : "enabled") << "].");
  if (err_code)
  {
    err_code->clear();
  }
}

Queue_session::~Queue_session()
{
  finish();
  wake_all();
}

void Queue_session::on_receive(session::Message_ptr msg)
{
  // We are in thread W.

  if (m_disable_queue)
  {
    FLOW_LOG_TRACE("Queue_session [" << this << "]: Queue disabled; dropping [" << *msg << "].");
    if (msg->has_slot())
    {
      msg->release_slot();
    }
    return;
  }
  // else

  {
    Lock_guard lock(m_mutex);
    m_queue.emplace_back(std::move(msg));
  }
  m_cond.notify_one();
}

session::Message_ptr Queue_session::get()
{
  Lock_guard lock(m_mutex);
  m_cond.wait(lock, [&]() { return m_stopped || (!m_queue.empty()); });
  return m_queue.empty() ? session::Message_ptr() : pop();
}

session::Message_ptr Queue_session::get(util::Fine_duration timeout)
{
  Lock_guard lock(m_mutex);
  m_cond.wait_for(lock, timeout, [&]() { return m_stopped || (!m_queue.empty()); });
  return m_queue.empty() ? session::Message_ptr() : pop();
}

session::Message_ptr Queue_session::try_get()
{
  Lock_guard lock(m_mutex);
  return m_queue.empty() ? session::Message_ptr() : pop();
}

session::Message_ptr Queue_session::pop()
{
  auto msg = std::move(m_queue.front());
  m_queue.pop_front();
  return msg;
}

size_t Queue_session::size() const
{
  Lock_guard lock(m_mutex);
  return m_queue.size();
}

bool Queue_session::empty() const
{
  return size() == 0;
}

void Queue_session::set_disable_queue(bool disable_queue)
{
  m_disable_queue = disable_queue;
}

void Queue_session::stop(Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { stop(actual_err_code); },
         err_code, "Queue_session::stop()"))
  {
    return;
  }
  // else

  Session_adapter::stop(err_code);
  wake_all();
}

void Queue_session::wake_all()
{
  {
    Lock_guard lock(m_mutex);
    m_stopped = true;
  }
  m_cond.notify_all();
}

} // namespace chirp::adapter
