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
#include "chirp/adapter/session_adapter.hpp"
#include "chirp/error.hpp"
#include <flow/error/error.hpp>

namespace chirp::adapter
{

// Implementations.

Session_adapter::Session_adapter() = default;

Session_adapter::~Session_adapter()
{
  assert((!m_session) && "Subclass dtor must finish() before its delivery machinery is destroyed.");
}

void Session_adapter::start(flow::log::Logger* logger_ptr, loop::Event_loop* loop, const session::Config& config,
                            engine::Engine_ptr&& engine, session::Session::On_receive_func&& on_receive_func,
                            Error_code* err_code)
{
  using boost::movelib::make_unique;

  auto session = make_unique<session::Session>(logger_ptr, loop, config, std::move(engine),
                                               std::move(on_receive_func), err_code);
  if (!*err_code)
  {
    m_session = std::move(session);
  }
  // else { The Session logged it; it is in stopped state; just let it go. }
}

void Session_adapter::finish()
{
  // Session dtor stops it if needed, logging any error.
  m_session.reset();
}

bool Session_adapter::session_live() const
{
  return m_session && (m_session->state() == session::Session::State::S_READY);
}

session::Send_future Session_adapter::send(const session::Message_ptr& msg, Error_code* err_code)
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(session::Send_future, Session_adapter::send, msg, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  if (!m_session)
  {
    *err_code = error::Code::S_SESSION_NOT_READY;
    return session::Send_future();
  }
  // else
  return m_session->send(msg, err_code);
}

session::Request_future Session_adapter::request(const session::Message_ptr& msg, bool auto_release,
                                                 Error_code* err_code)
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(session::Request_future, Session_adapter::request, msg, auto_release, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  if (!m_session)
  {
    *err_code = error::Code::S_SESSION_NOT_READY;
    return session::Request_future();
  }
  // else
  return m_session->request(msg, auto_release, err_code);
}

session::Release_future Session_adapter::release_slot(const session::Message_ptr& msg)
{
  return m_session ? m_session->release_slot(msg) : session::Session::nothing_released();
}

void Session_adapter::stop(Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { stop(actual_err_code); },
         err_code, "Session_adapter::stop()"))
  {
    return;
  }
  // else

  if (!m_session)
  {
    err_code->clear();
    return;
  }
  // else
  m_session->stop(err_code);
}

const util::Identity& Session_adapter::identity() const
{
  return m_session ? m_session->identity() : util::NULL_IDENTITY;
}

session::Session& Session_adapter::session()
{
  assert(m_session);
  return *m_session;
}

} // namespace chirp::adapter
