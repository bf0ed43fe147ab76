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

#include "chirp/util/util_fwd.hpp"

namespace chirp::util
{

/**
 * Simple counter that manually tracks utilization.  It is not thread-safe; the owner protects it (e.g.,
 * loop::Event_loop guards its reference count with its own mutex).  Starts at 1: the creator's own use.
 */
class Use_counted_object
{
public:

  // Constructors/destructor.

  /// Constructor.  Initial use count is 1.
  Use_counted_object();

  // Methods.

  /**
   * Returns the current usage.
   * @return See above.
   */
  unsigned int get_use_count() const;

  /// Increments the usage.
  void increment_use();

  /**
   * Decrements the usage.  The current count must be greater than zero.
   * @return The usage after decrementing; 0 means the last user is gone.
   */
  unsigned int decrement_use();

private:
  // Data.

  /// The current usage count.
  unsigned int m_use_count;
}; // class Use_counted_object

} // namespace chirp::util
