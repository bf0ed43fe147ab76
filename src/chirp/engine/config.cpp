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
#include "chirp/engine/config.hpp"
#include "chirp/error.hpp"
#include <flow/error/error.hpp>
#include <algorithm>

namespace chirp::engine
{

// Static initializations.

constexpr uint8_t Config::S_MAX_SLOTS_LIMIT;
constexpr uint8_t Config::S_DEFAULT_ASYNC_SLOTS;
constexpr float Config::S_MAX_CONNECT_TIMEOUT_SECS;

// Implementations.

void Config::validate(flow::log::Logger* logger_ptr, Error_code* err_code) const
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { validate(logger_ptr, actual_err_code); },
         err_code, "Config::validate()"))
  {
    return;
  }
  // else

  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_ENGINE);

  const auto fail = [&](util::String_view what)
  {
    FLOW_LOG_WARNING("Config [" << *this << "] rejected: " << what << '.');
    *err_code = error::Code::S_VALUE_ERROR;
  };

  err_code->clear();
  if (m_max_slots > S_MAX_SLOTS_LIMIT)
  {
    fail("MAX_SLOTS exceeds 32");
  }
  else if ((!(m_timeout > 0)) || (m_timeout > 1200))
  {
    fail("TIMEOUT not in (0, 1200] seconds");
  }
  else if ((!(m_reuse_time > 0)) || (m_reuse_time > 3600))
  {
    fail("REUSE_TIME not in (0, 3600] seconds");
  }
  else if ((m_buffer_size != 0) && (m_buffer_size < 1024))
  {
    fail("BUFFER_SIZE below 1024");
  }
  else if ((m_buffer_size != 0) && (m_max_msg_size != 0) && (m_max_msg_size < m_buffer_size))
  {
    fail("MAX_MSG_SIZE smaller than BUFFER_SIZE");
  }
  else if ((!m_disable_encryption) && m_cert_chain_pem.empty())
  {
    fail("encryption enabled but CERT_CHAIN_PEM not set");
  }
  else
  {
    Error_code addr_err_code;
    const auto v4 = util::parse_address(m_bind_v4, &addr_err_code);
    if (addr_err_code || (!v4.is_v4()))
    {
      fail("BIND_V4 is not an IPv4 address");
      return;
    }
    // else
    const auto v6 = util::parse_address(m_bind_v6, &addr_err_code);
    if (addr_err_code || (!v6.is_v6()))
    {
      fail("BIND_V6 is not an IPv6 address");
    }
  }
} // Config::validate()

uint8_t Config::effective_max_slots() const
{
  if (m_max_slots != 0)
  {
    return m_max_slots;
  }
  // else
  return m_synchronous ? 1 : S_DEFAULT_ASYNC_SLOTS;
}

util::Fine_duration Config::connect_timeout() const
{
  return util::seconds_to_duration(std::min(m_timeout * 2, S_MAX_CONNECT_TIMEOUT_SECS));
}

util::Fine_duration Config::timeout() const
{
  return util::seconds_to_duration(m_timeout);
}

std::ostream& operator<<(std::ostream& os, const Config& val)
{
  using util::operator<<; // For Identity; ADL will not find it (it is an std::array).

  return os << "reuse_time[" << val.m_reuse_time << "s] timeout[" << val.m_timeout << "s] "
               "port[" << val.m_port << "] backlog[" << unsigned(val.m_backlog) << "] "
               "max_slots[" << unsigned(val.m_max_slots) << "] sync[" << val.m_synchronous << "] "
               "disable_signals[" << val.m_disable_signals << "] buffer_size[" << val.m_buffer_size << "] "
               "max_msg_size[" << val.m_max_msg_size << "] bind_v4[" << val.m_bind_v4 << "] "
               "bind_v6[" << val.m_bind_v6 << "] identity[" << val.m_identity << "] "
               "cert_chain_pem[" << val.m_cert_chain_pem << "] dh_params_pem[" << val.m_dh_params_pem << "] "
               "disable_encryption[" << val.m_disable_encryption << "] auto_release[" << val.m_auto_release << ']';
}

} // namespace chirp::engine
