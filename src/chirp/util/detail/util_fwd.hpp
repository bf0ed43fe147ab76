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

// Free functions.

/**
 * Internal-use: an engine calls this on successful `init()`, so that library_cleanup() knows not to tear down
 * process-wide state under it.  Returns `false` (and does nothing) if library_init() has not been called.
 *
 * @return See above.
 */
bool engine_attached();

/// Internal-use: reverses a successful engine_attached().
void engine_detached();

} // namespace chirp::util
