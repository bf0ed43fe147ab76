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
#include "chirp/adapter/callback_session.hpp"
#include <flow/error/error.hpp>
#include <boost/make_shared.hpp>
#include <boost/weak_ptr.hpp>

namespace chirp::adapter
{

// Implementations.

Callback_session::Callback_session(flow::log::Logger* logger_ptr, loop::Event_loop* loop,
                                   const session::Config& config, engine::Engine_ptr&& engine,
                                   flow::async::Single_thread_task_loop* user_loop,
                                   On_receive_func&& on_receive_func, Error_code* err_code) :
  flow::log::Log_context(logger_ptr, Log_component::S_ADAPTER),
  m_user_loop(user_loop),
  m_delivery(boost::make_shared<Delivery_context>(Delivery_context{ std::move(on_receive_func),
                                                                    config.m_auto_release }))
{
  using boost::weak_ptr;

  Error_code our_err_code;
  start(logger_ptr, loop, config, std::move(engine),
        [this, delivery_weak = weak_ptr<Delivery_context>(m_delivery)](session::Message_ptr msg)
  {
    // We are in thread W.  Never block it: hand off to the application loop.
    m_user_loop->post([delivery_weak, msg]()
    {
      const auto delivery = delivery_weak.lock();
      if (!delivery)
      {
        return; // *this is gone; and so are its session's slots.
      }
      // else

      delivery->m_on_receive_func(msg);
      if (delivery->m_auto_release && msg->has_slot())
      {
        msg->release_slot();
      }
    });
  }, &our_err_code);

  if (our_err_code)
  {
    if (!err_code)
    {
      throw flow::error::Runtime_error(our_err_code, "Callback_session::Callback_session()");
    }
    *err_code = our_err_code;
    return;
  }
  // else

  FLOW_LOG_INFO("Callback_session [" << this << "]: Started session [" << session() << "]; handlers run on "
                "application loop [" << m_user_loop << "].");
  if (err_code)
  {
    err_code->clear();
  }
}

Callback_session::~Callback_session()
{
  finish();
  m_delivery.reset();
}

} // namespace chirp::adapter
