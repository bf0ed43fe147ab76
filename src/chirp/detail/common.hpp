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

#include <boost/unordered_map.hpp>
#include <string>

namespace chirp
{

// Types.

/* See common.hpp for the Doxygen-facing doc header of this enum class; the below is the real thing, generated
 * via the same macro magic Flow uses for flow::Flow_log_component. */

/// @cond
// -^- Doxygen, please ignore the following.

#define FLOW_LOG_CFG_COMPONENT_DEFINE(ARG_name_root, ARG_enum_val) \
  S_##ARG_name_root = ARG_enum_val,
enum class Log_component
{
#include "chirp/detail/macros/log_component_enum_declare.macros.hpp"
  /// CAUTION: sentinel; not a real component.  Must be last.
  S_END_SENTINEL
};
#undef FLOW_LOG_CFG_COMPONENT_DEFINE

// Constants.

extern const boost::unordered_multimap<Log_component, std::string> S_CHIRP_LOG_COMPONENT_NAME_MAP;

// -v- Doxygen, please stop ignoring.
/// @endcond

} // namespace chirp
