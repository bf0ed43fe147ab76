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
#include "chirp/adapter/pool_session.hpp"
#include <flow/error/error.hpp>

namespace chirp::adapter
{

// Implementations.

Pool_session::Pool_session(flow::log::Logger* logger_ptr, loop::Event_loop* loop, const session::Config& config,
                           engine::Engine_ptr&& engine, On_receive_func&& on_receive_func, size_t n_workers,
                           Error_code* err_code) :
  flow::log::Log_context(logger_ptr, Log_component::S_ADAPTER),
  m_on_receive_func(std::move(on_receive_func)),
  m_auto_release(config.m_auto_release),
  m_pool(logger_ptr, "chirp_pool", n_workers)
{
  m_pool.start();

  Error_code our_err_code;
  start(logger_ptr, loop, config, std::move(engine),
        [this](session::Message_ptr msg)
  {
    // We are in thread W.  Never block it: hand off.
    m_pool.post([this, msg]() { deliver(msg); });
  }, &our_err_code);

  if (our_err_code)
  {
    m_pool.stop();
    if (!err_code)
    {
      throw flow::error::Runtime_error(our_err_code, "Pool_session::Pool_session()");
    }
    *err_code = our_err_code;
    return;
  }
  // else

  FLOW_LOG_INFO("Pool_session [" << this << "]: Started session [" << session() << "]; "
                "[" << m_pool.n_threads() << "] worker(s).");
  if (err_code)
  {
    err_code->clear();
  }
}

Pool_session::~Pool_session()
{
  /* Stop the session first (handlers still running may release their slots meanwhile); then the pool; and only
   * then destroy the session, as no handler can refer to it any longer. */
  Error_code err_code;
  Session_adapter::stop(&err_code);
  if (err_code)
  {
    FLOW_LOG_WARNING("Pool_session [" << this << "]: Stop in destructor reported [" << err_code << "] "
                     "[" << err_code.message() << "].");
  }
  m_pool.stop();
  finish();
}

void Pool_session::deliver(const session::Message_ptr& msg)
{
  FLOW_LOG_TRACE("Pool_session [" << this << "]: Delivering [" << *msg << "] to handler.");
  m_on_receive_func(msg);
  if (m_auto_release && msg->has_slot())
  {
    msg->release_slot();
  }
}

void Pool_session::stop(Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { stop(actual_err_code); },
         err_code, "Pool_session::stop()"))
  {
    return;
  }
  // else

  Session_adapter::stop(err_code);
  m_pool.stop();
}

} // namespace chirp::adapter
