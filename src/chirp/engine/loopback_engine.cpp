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
#include "chirp/engine/loopback_engine.hpp"
#include "chirp/engine/detail/loopback_node.hpp"
#include "chirp/error.hpp"
#include <boost/make_shared.hpp>

namespace chirp::engine
{

// Implementations.

Loopback_engine::Loopback_engine(flow::log::Logger* logger_ptr) :
  flow::log::Log_context(logger_ptr, Log_component::S_ENGINE)
{
  // Nothing else; m_node is created by init().
}

Loopback_engine::~Loopback_engine() = default; // m_node dtor unbinds (with a warning) if needed.

Error_code Loopback_engine::init(const Config& config, Task_engine_ptr task_engine,
                                 On_receive_func&& on_receive, On_done_func&& on_done, On_log_func&& on_log)
{
  // We are in thread W.

  if (m_node)
  {
    FLOW_LOG_WARNING("Loopback_engine [" << *this << "]: init() called twice; refusing.");
    boost::asio::post(*task_engine, std::move(on_done)); // Per contract: non-RESOURCE_ERROR failure => on_done.
    return error::Code::S_INIT_FAIL;
  }
  // else

  m_node = boost::make_shared<detail::Loopback_node>(get_logger());
  return m_node->init(config, task_engine, std::move(on_receive), std::move(on_done), std::move(on_log));
}

Error_code Loopback_engine::send(Wire_message_ptr msg, On_send_done_func&& on_done)
{
  if (!m_node)
  {
    FLOW_LOG_WARNING("Loopback_engine [" << *this << "]: send() before init(); refusing.");
    return error::Code::S_NOT_INITIALIZED;
  }
  // else
  return m_node->send(std::move(msg), std::move(on_done));
}

void Loopback_engine::release_slot(Wire_message_ptr msg, On_release_func&& on_release)
{
  assert(m_node && "release_slot() before init()?  Then nothing could have been received; so it's a bug.");
  m_node->release_slot(std::move(msg), std::move(on_release));
}

void Loopback_engine::close()
{
  if (m_node)
  {
    m_node->close();
  }
}

const util::Identity& Loopback_engine::identity() const
{
  return m_node ? m_node->identity() : util::NULL_IDENTITY;
}

} // namespace chirp::engine
