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
#include "chirp/util/detail/util_fwd.hpp"
#include "chirp/error.hpp"
#include <flow/error/error.hpp>
#include <flow/util/util.hpp>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/thread/mutex.hpp>
#include <boost/thread/locks.hpp>
#include <algorithm>
#include <iomanip>

namespace chirp::util
{

namespace
{

/// Process-wide state set up by library_init() and torn down by library_cleanup().
struct Library_state
{
  /// Protects the other members.
  flow::util::Mutex_non_recursive m_mutex;
  /// Whether library_init() was called (and not undone by library_cleanup()).
  bool m_initialized = false;
  /// How many engines are currently attached; see engine_attached().
  unsigned int m_n_engines = 0;
};

/// The one Library_state.  Function-local `static` to avoid static-init-order trouble.
Library_state& library_state()
{
  static Library_state s_state;
  return s_state;
}

/// Protects the random generator in random_identity().
flow::util::Mutex_non_recursive s_random_mutex;

} // namespace (anon)

// Initializations.

const std::string EMPTY_STRING;
const Identity NULL_IDENTITY = {};

// Implementations.

Identity random_identity()
{
  using boost::uuids::random_generator;
  using boost::uuids::uuid;

  // random_generator is not thread-safe, and seeding one per call is costly; share one.
  static random_generator s_gen;

  uuid id;
  {
    flow::util::Lock_guard<flow::util::Mutex_non_recursive> lock(s_random_mutex);
    id = s_gen();
  }

  Identity result;
  static_assert(sizeof(id.data) == S_IDENTITY_SIZE, "UUID must be exactly one Identity in size.");
  std::copy(std::begin(id.data), std::end(id.data), result.begin());
  return result; // Version-4 UUID has non-zero version bits; so never NULL_IDENTITY.
}

bool is_null(const Identity& id)
{
  return id == NULL_IDENTITY;
}

Fine_duration seconds_to_duration(float secs)
{
  using boost::chrono::duration;
  using boost::chrono::duration_cast;

  return duration_cast<Fine_duration>(duration<double>(secs));
}

Ip_address parse_address(String_view text, Error_code* err_code)
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(Ip_address, parse_address, text, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  Error_code sys_err_code;
  const auto addr = boost::asio::ip::make_address(std::string(text), sys_err_code);
  if (sys_err_code)
  {
    *err_code = error::Code::S_VALUE_ERROR;
    return Ip_address();
  }
  // else
  err_code->clear();
  return addr;
}

std::ostream& operator<<(std::ostream& os, const Identity& id)
{
  const auto flags = os.flags();
  const auto fill = os.fill();
  os << std::hex << std::setfill('0');
  for (const auto byte : id)
  {
    os << std::setw(2) << static_cast<unsigned int>(byte);
  }
  os.flags(flags);
  os.fill(fill);
  return os;
}

void library_init(flow::log::Logger* logger_ptr)
{
  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_UTIL);

  auto& state = library_state();
  flow::util::Lock_guard<flow::util::Mutex_non_recursive> lock(state.m_mutex);
  if (state.m_initialized)
  {
    FLOW_LOG_TRACE("library_init(): Already initialized; no-op.");
    return;
  }
  // else

  state.m_initialized = true;
  FLOW_LOG_INFO("library_init(): Process-wide chirp state initialized.");
}

bool library_cleanup(flow::log::Logger* logger_ptr)
{
  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_UTIL);

  auto& state = library_state();
  flow::util::Lock_guard<flow::util::Mutex_non_recursive> lock(state.m_mutex);
  if (!state.m_initialized)
  {
    FLOW_LOG_TRACE("library_cleanup(): Not initialized; no-op.");
    return true;
  }
  // else

  if (state.m_n_engines != 0)
  {
    FLOW_LOG_WARNING("library_cleanup(): [" << state.m_n_engines << "] engine(s) still attached; stop every "
                     "session first.  Refusing to clean up.");
    return false;
  }
  // else

  state.m_initialized = false;
  FLOW_LOG_INFO("library_cleanup(): Process-wide chirp state cleaned up.");
  return true;
}

bool library_initialized()
{
  auto& state = library_state();
  flow::util::Lock_guard<flow::util::Mutex_non_recursive> lock(state.m_mutex);
  return state.m_initialized;
}

bool engine_attached()
{
  auto& state = library_state();
  flow::util::Lock_guard<flow::util::Mutex_non_recursive> lock(state.m_mutex);
  if (!state.m_initialized)
  {
    return false;
  }
  // else
  ++state.m_n_engines;
  return true;
}

void engine_detached()
{
  auto& state = library_state();
  flow::util::Lock_guard<flow::util::Mutex_non_recursive> lock(state.m_mutex);
  assert((state.m_n_engines != 0) && "engine_detached() without matching engine_attached()?");
  --state.m_n_engines;
}

} // namespace chirp::util
