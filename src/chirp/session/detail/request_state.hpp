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

#include "chirp/session/detail/request_timeout.hpp"
#include <boost/shared_ptr.hpp>

namespace chirp::session::detail
{

// Types.

/**
 * Everything about one outstanding request (Session::request()) other than its send: the reply promise and the
 * timeout guarding it.  Shared by Pending_table (while the request is outstanding) and thread W tasks.
 *
 * #m_reply_promise is resolved exactly once, by whichever of {reply, send failure, timeout, shutdown} first
 * takes the entry out of Pending_table; only that party touches it.  #m_done and #m_timeout are touched only in
 * thread W.
 */
struct Request_state
{
  // Constructors/destructor.

  /// Makes the (unresolved) reply promise and its future.
  Request_state() :
    m_reply_future(m_reply_promise.get_future()),
    m_done(false)
  {
    // Nothing else.
  }

  // Data.

  /// Resolved with the reply, or an exception.
  boost::promise<Message_ptr> m_reply_promise;

  /// Future of #m_reply_promise.
  Reply_future m_reply_future;

  /// Set once resolved; so the timeout is not armed after the fact.
  bool m_done;

  /// The timeout; null until armed, and again once it has been cleaned up.
  boost::shared_ptr<Request_timeout> m_timeout;
}; // struct Request_state

/// Short-hand for ref-counted pointer to Request_state.
using Request_state_ptr = boost::shared_ptr<Request_state>;

} // namespace chirp::session::detail
