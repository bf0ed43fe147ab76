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
#include "chirp/util/use_counted_object.hpp"

namespace chirp::util
{

Use_counted_object::Use_counted_object() :
  m_use_count(1)
{
  // Nothing else.
}

unsigned int Use_counted_object::get_use_count() const
{
  return m_use_count;
}

void Use_counted_object::increment_use()
{
  ++m_use_count;
}

unsigned int Use_counted_object::decrement_use()
{
  assert((m_use_count != 0) && "Decrementing use count below zero: unbalanced increment/decrement.");
  return --m_use_count;
}

} // namespace chirp::util
