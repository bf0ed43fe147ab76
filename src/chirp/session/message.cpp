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
#include "chirp/session/message.hpp"
#include "chirp/session/session.hpp"
#include "chirp/util/util_fwd.hpp"
#include <flow/error/error.hpp>
#include <boost/functional/hash/hash.hpp>

namespace chirp::session
{

// Message implementations.

Message::Message() :
  m_identity(util::random_identity()),
  m_serial(0),
  m_port(0),
  m_remote_identity(util::NULL_IDENTITY),
  m_session(0),
  m_has_slot(false)
{
  // m_address is 0.0.0.0 by default.
}

Message::Message(const engine::Wire_message_ptr& wire, Session* session) :
  m_identity(wire->m_identity),
  m_serial(wire->m_serial),
  m_header(wire->m_header),
  m_data(wire->m_data),
  m_address(wire->m_address),
  m_port(wire->m_port),
  m_remote_identity(wire->m_remote_identity),
  m_wire(wire),
  m_session(session),
  m_has_slot(wire->m_has_slot)
{
  // Nothing else.
}

Message::Ptr Message::create()
{
  return Ptr(new Message);
}

const util::Identity& Message::identity() const
{
  return m_identity;
}

uint32_t Message::serial() const
{
  return m_serial;
}

const std::string& Message::header() const
{
  return m_header;
}

void Message::set_header(util::String_view header)
{
  m_header.assign(header.data(), header.size());
}

const std::string& Message::data() const
{
  return m_data;
}

void Message::set_data(util::String_view data)
{
  m_data.assign(data.data(), data.size());
}

std::string Message::address() const
{
  return m_address.to_string();
}

const util::Ip_address& Message::ip_address() const
{
  return m_address;
}

void Message::set_address(util::String_view address, Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { set_address(address, actual_err_code); },
         err_code, "Message::set_address()"))
  {
    return;
  }
  // else if (err_code): Proceed.

  const auto parsed = util::parse_address(address, err_code);
  if (!*err_code)
  {
    m_address = parsed;
  }
  // else: Unchanged, as promised.
}

uint16_t Message::port() const
{
  return m_port;
}

void Message::set_port(uint16_t port)
{
  m_port = port;
}

const util::Identity& Message::remote_identity() const
{
  return m_remote_identity;
}

bool Message::has_slot() const
{
  return m_has_slot;
}

Release_future Message::release_slot()
{
  if (!m_has_slot)
  {
    return Session::nothing_released();
  }
  // else
  assert(m_session && "Only a received message can have a slot.");
  return m_session->release_slot(shared_from_this());
}

int32_t Message::serial_delta(uint32_t serial1, uint32_t serial2)
{
  return static_cast<int32_t>(serial1 - serial2);
}

// Free function implementations.

std::ostream& operator<<(std::ostream& os, const Message& val)
{
  using util::operator<<;

  return os << "msg[" << val.identity() << "] serial [" << val.serial() << "] "
               "to/from [" << val.address() << "]:[" << val.port() << "] "
               "header/data sizes [" << val.header().size() << '/' << val.data().size() << "] "
               "slot? [" << val.has_slot() << ']';
}

std::ostream& operator<<(std::ostream& os, const Release_key& val)
{
  using util::operator<<;

  return os << val.m_identity << '#' << val.m_serial;
}

bool operator==(const Release_key& val1, const Release_key& val2)
{
  return (val1.m_identity == val2.m_identity) && (val1.m_serial == val2.m_serial);
}

size_t hash_value(const Release_key& val)
{
  size_t result = boost::hash_range(val.m_identity.begin(), val.m_identity.end());
  boost::hash_combine(result, val.m_serial);
  return result;
}

} // namespace chirp::session
