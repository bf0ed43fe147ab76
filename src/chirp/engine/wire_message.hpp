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
#include <string>

namespace chirp::engine
{

/**
 * The message struct exchanged between session::Session and an Engine: what goes on (and comes off) the wire,
 * plus the little bookkeeping both sides need.  It is handed back and forth via #Wire_message_ptr; whoever is
 * currently processing it (the session before `Engine::send()`; the engine until it invokes the completion
 * callback; and so on) is its exclusive owner, even though the pointer type could technically be shared.
 *
 * session::Message is the user-facing counterpart; it converts to/from this at the session boundary.
 */
struct Wire_message
{
  // Data.

  /// Correlation key of the logical exchange; preserved by the engine.
  util::Identity m_identity = {};

  /// Set by the engine on send (incremented per node); carried through to the receiver.
  uint32_t m_serial = 0;

  /// Opaque header bytes.
  std::string m_header;

  /// Opaque payload bytes.
  std::string m_data;

  /// Outgoing: destination address.  Incoming: origin address.
  util::Ip_address m_address;

  /// Outgoing: destination port.  Incoming: origin port.
  uint16_t m_port = 0;

  /// Incoming: identity of the node that sent it.  Set by the engine.
  util::Identity m_remote_identity = {};

  /// `true` while this (incoming) message occupies one of the engine's slots; cleared on release.
  bool m_has_slot = false;

  /**
   * Opaque to the engine: set by the session before `Engine::send()`, so it can find its bookkeeping again when
   * the completion callback hands the message back.  0 means "none."
   */
  uint64_t m_continuation_id = 0;
}; // struct Wire_message

} // namespace chirp::engine
