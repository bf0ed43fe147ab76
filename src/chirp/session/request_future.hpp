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

#include "chirp/session/session_fwd.hpp"

namespace chirp::session
{

// Types.

/**
 * Handle of one request/reply exchange, as returned by Session::request().  Copyable; copies refer to the same
 * exchange.  A default-cted object refers to nothing (valid() is `false`); such is returned when request()
 * fails synchronously.
 *
 * The reply is the received Message whose identity equals that of the request.  It holds a slot like any received
 * message; if the request was made with `auto_release == true`, get() releases it before returning (the reply's
 * contents remain usable).
 */
class Request_future
{
public:
  // Constructors/destructor.

  /// Refers to nothing.
  Request_future();

  /**
   * Refers to the given exchange.
   *
   * @param send_future
   *        Future of the request's send.
   * @param reply_future
   *        Future of the reply.
   * @param auto_release
   *        Whether get() releases the reply's slot.
   */
  explicit Request_future(const Send_future& send_future, const Reply_future& reply_future, bool auto_release);

  // Methods.

  /**
   * Whether this refers to an exchange.
   * @return See above.
   */
  bool valid() const;

  /**
   * Future of the request's send.  If the send fails, the reply future fails with the same error.
   * @return See above.
   */
  const Send_future& send_future() const;

  /**
   * Waits for ready(), without touching the reply.  (The reply future itself is not exposed: taking the reply
   * from it would bypass the auto-release of get(), leaving the slot held until Session::stop() forces it back.)
   */
  void wait() const;

  /**
   * Whether the reply (or failure) has arrived: get() would not block.
   * @return See above.
   */
  bool ready() const;

  /**
   * Waits up to the given time for ready().
   *
   * @param timeout
   *        Max time to wait.
   * @return ready().
   */
  bool wait_for(util::Fine_duration timeout) const;

  /**
   * Waits for the reply and returns it; releasing its slot first if so configured.
   *
   * @throws flow::error::Runtime_error
   *         Whatever the exchange failed with: error::Code::S_TIMEOUT if no reply in time; the send's error if the
   *         request could not be sent; error::Code::S_SHUTDOWN if the Session stopped meanwhile.
   * @return The reply.
   */
  Message_ptr get() const;

private:
  // Data.

  /// See send_future().
  Send_future m_send_future;

  /// Future of the reply; only get() takes the value from it.
  Reply_future m_reply_future;

  /// See ctor.
  bool m_auto_release;
}; // class Request_future

} // namespace chirp::session
