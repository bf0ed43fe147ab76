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

#include "chirp/engine/engine_fwd.hpp"
#include <flow/util/util.hpp>
#include <boost/unordered_map.hpp>
#include <boost/weak_ptr.hpp>

namespace chirp::engine::detail
{

// Types.

class Loopback_node;

/**
 * Process-wide registry of live Loopback_node objects by bound port: the "network" over which Loopback_engine
 * instances find each other.  Holds weak references only.  Thread-safe.
 */
class Loopback_network :
  private boost::noncopyable
{
public:
  // Types.

  /// Short-hand for a node reference.
  using Node_ptr = boost::shared_ptr<Loopback_node>;

  // Methods.

  /**
   * Returns the one process-wide Loopback_network.
   * @return See above.
   */
  static Loopback_network& get();

  /**
   * Binds `node` to `port` unless another live node already has it.
   *
   * @param port
   *        Port.
   * @param node
   *        Node.
   * @return `false` if the port is taken.
   */
  bool bind(uint16_t port, const Node_ptr& node);

  /**
   * Undoes bind() if `node` is in fact the one bound to `port`; else no-op.
   *
   * @param port
   *        Port.
   * @param node
   *        Node.
   */
  void unbind(uint16_t port, const Loopback_node* node);

  /**
   * Returns the live node bound to `port`, or null.
   *
   * @param port
   *        Port.
   * @return See above.
   */
  Node_ptr find(uint16_t port) const;

private:
  // Constructors.

  /// Boring constructor; see get().
  Loopback_network();

  // Data.

  /// Protects #m_nodes.
  mutable flow::util::Mutex_non_recursive m_mutex;

  /// Port => node.  A dead (expired) entry is as good as none.
  boost::unordered_map<uint16_t, boost::weak_ptr<Loopback_node>> m_nodes;
}; // class Loopback_network

} // namespace chirp::engine::detail
