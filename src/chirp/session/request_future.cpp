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
#include "chirp/session/request_future.hpp"
#include "chirp/session/message.hpp"

namespace chirp::session
{

// Implementations.

Request_future::Request_future() :
  m_auto_release(false)
{
  // Futures are invalid.
}

Request_future::Request_future(const Send_future& send_future, const Reply_future& reply_future,
                               bool auto_release) :
  m_send_future(send_future),
  m_reply_future(reply_future),
  m_auto_release(auto_release)
{
  // Nothing else.
}

bool Request_future::valid() const
{
  return m_reply_future.valid();
}

const Send_future& Request_future::send_future() const
{
  return m_send_future;
}

void Request_future::wait() const
{
  assert(valid());
  m_reply_future.wait();
}

bool Request_future::ready() const
{
  assert(valid());
  return m_reply_future.is_ready();
}

bool Request_future::wait_for(util::Fine_duration timeout) const
{
  assert(valid());
  return m_reply_future.wait_for(timeout) == boost::future_status::ready;
}

Message_ptr Request_future::get() const
{
  assert(valid());

  auto reply = m_reply_future.get(); // Throws if failed.
  if (m_auto_release && reply->has_slot())
  {
    /* Not waiting for it: the release completes asynchronously in thread W; and Session::stop() waits for it
     * if need be. */
    reply->release_slot();
  }
  return reply;
}

} // namespace chirp::session
