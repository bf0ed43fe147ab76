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
#include "chirp/engine/detail/loopback_network.hpp"
#include "chirp/engine/detail/loopback_node.hpp"

namespace chirp::engine::detail
{

// Implementations.

Loopback_network::Loopback_network() = default;

Loopback_network& Loopback_network::get() // Static.
{
  static Loopback_network s_network;
  return s_network;
}

bool Loopback_network::bind(uint16_t port, const Node_ptr& node)
{
  flow::util::Lock_guard<flow::util::Mutex_non_recursive> lock(m_mutex);
  auto& entry = m_nodes[port];
  if (!entry.expired())
  {
    return false;
  }
  // else
  entry = node;
  return true;
}

void Loopback_network::unbind(uint16_t port, const Loopback_node* node)
{
  flow::util::Lock_guard<flow::util::Mutex_non_recursive> lock(m_mutex);
  const auto it = m_nodes.find(port);
  if (it == m_nodes.end())
  {
    return;
  }
  // else

  /* Compare against what it points to, if still alive; if expired it's garbage either way.
   * (Cannot lock() a node in its own destructor; hence the raw pointer argument.) */
  const auto bound = it->second.lock();
  if ((!bound) || (bound.get() == node))
  {
    m_nodes.erase(it);
  }
}

Loopback_network::Node_ptr Loopback_network::find(uint16_t port) const
{
  flow::util::Lock_guard<flow::util::Mutex_non_recursive> lock(m_mutex);
  const auto it = m_nodes.find(port);
  return (it == m_nodes.end()) ? Node_ptr() : it->second.lock();
}

} // namespace chirp::engine::detail
