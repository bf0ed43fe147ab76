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
#include "chirp/session/detail/request_timeout.hpp"
#include <boost/chrono/chrono_io.hpp>

namespace chirp::session::detail
{

// Implementations.

Request_timeout::Request_timeout(flow::log::Logger* logger_ptr, util::Task_engine& task_engine,
                                 util::Fine_duration timeout, On_fire_func&& on_fire_func) :
  flow::log::Log_context(logger_ptr, Log_component::S_SESSION),
  m_timer(task_engine),
  m_timeout(timeout),
  m_on_fire_func(std::move(on_fire_func)),
  m_done(false)
{
  // Nothing else.
}

void Request_timeout::arm()
{
  using boost::weak_ptr;

  FLOW_LOG_TRACE("Request_timeout [" << this << "]: Armed for "
                 "[" << boost::chrono::duration_cast<boost::chrono::milliseconds>(m_timeout) << "].");

  m_timer.expires_after(m_timeout);
  m_timer.async_wait([this_weak = weak_ptr<Request_timeout>(shared_from_this())](const Error_code& sys_err_code)
  {
    const auto this_ptr = this_weak.lock();
    if (this_ptr)
    {
      this_ptr->on_timer(sys_err_code);
    }
    // else { Destroyed meanwhile (which means disarmed); nothing to do. }
  });
}

bool Request_timeout::disarm()
{
  if (m_done)
  {
    return false;
  }
  // else

  m_done = true;
  m_timer.cancel();
  FLOW_LOG_TRACE("Request_timeout [" << this << "]: Disarmed before firing.");
  return true;
}

bool Request_timeout::done() const
{
  return m_done;
}

void Request_timeout::on_timer(const Error_code& sys_err_code)
{
  if ((sys_err_code == boost::asio::error::operation_aborted) || m_done)
  {
    return; // disarm() won (its cancel() may have come too late to abort us; the latch covers that).
  }
  // else

  m_done = true;
  FLOW_LOG_TRACE("Request_timeout [" << this << "]: Fired.");
  m_on_fire_func();
}

} // namespace chirp::session::detail
