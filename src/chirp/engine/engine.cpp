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
#include "chirp/engine/engine.hpp"

namespace chirp::engine
{

// Implementations.

Engine::~Engine() = default;

std::ostream& operator<<(std::ostream& os, const Engine& val)
{
  using util::operator<<;
  return os << "engine[" << val.identity() << "]@" << static_cast<const void*>(&val);
}

std::ostream& operator<<(std::ostream& os, const Wire_message& val)
{
  using util::operator<<;
  return os << "id[" << val.m_identity << "] serial[" << val.m_serial << "] "
               "peer[" << val.m_address << ':' << val.m_port << "] "
               "sizes[" << val.m_header.size() << '+' << val.m_data.size() << "] slot[" << val.m_has_slot << ']';
}

} // namespace chirp::engine
