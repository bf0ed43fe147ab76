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

#include "chirp/engine/engine_fwd.hpp"
#include <string>

namespace chirp::engine
{

/**
 * Engine configuration, including the handful of fields session::Session itself consumes (#m_timeout,
 * #m_auto_release, #m_max_slots, #m_synchronous).  A plain copyable `struct`: fill it out, then give it to
 * a session::Session, which copies it.  Once given, later changes to the caller's object have no effect on that
 * session -- the config in use is, in effect, sealed.
 *
 * Validation happens in validate(), which an Engine calls from its `init()`.  Defaults are what a default-constructed
 * Config holds and are usable as-is, except that with encryption enabled (the default) #m_cert_chain_pem must be set.
 */
struct Config
{
  // Constants.

  /// Maximal allowed #m_max_slots.
  static constexpr uint8_t S_MAX_SLOTS_LIMIT = 32;

  /// Slots used when #m_max_slots is 0 and #m_synchronous is `false`.
  static constexpr uint8_t S_DEFAULT_ASYNC_SLOTS = 16;

  /// Connect timeout never exceeds this many seconds.
  static constexpr float S_MAX_CONNECT_TIMEOUT_SECS = 60;

  // Data.

  /**
   * Seconds until an idle connection is garbage-collected; until then it is reused.  Actual reuse time is
   * max(#m_reuse_time, 3 x #m_timeout).  Must be in (0, 3600].
   */
  float m_reuse_time = 30;

  /**
   * Send- and connect-timeout scaling in seconds.  Send (and request, and shutdown-drain) timeout is #m_timeout;
   * connect timeout is min(2 x #m_timeout, 60).  Must be in (0, 1200].
   */
  float m_timeout = 5;

  /// Port for listening to connections.
  uint16_t m_port = 2998;

  /// TCP-listen socket backlog.
  uint8_t m_backlog = 100;

  /**
   * The count of message slots: how many received messages may be held (not yet released) at once.  Allowed
   * values are 1 through #S_MAX_SLOTS_LIMIT; 0 means use #S_DEFAULT_ASYNC_SLOTS if not #m_synchronous, else 1.
   * See effective_max_slots().
   */
  uint8_t m_max_slots = 0;

  /**
   * Connection-synchronous mode: if `true`, a send completes only after the remote has released the message's slot
   * (acknowledgement), and at most one message per remote is unacknowledged at any time.  If `false`, a send
   * completes once the message was delivered.
   */
  bool m_synchronous = true;

  /// If `false` the engine may close on SIGINT/SIGTERM.  Ignored by engines without signal handling.
  bool m_disable_signals = false;

  /// Size of per-connection buffer; 0 means engine default.  Values below 1024 are rejected.
  uint32_t m_buffer_size = 0;

  /// Max message (header + data) size accepted; 0 means unlimited.
  uint32_t m_max_msg_size = 0;

  /// IPv6 bind address, textual.
  std::string m_bind_v6 = "::";

  /// IPv4 bind address, textual.
  std::string m_bind_v4 = "0.0.0.0";

  /// Identity of this node; all-zero (the default) means the engine generates a random one.
  util::Identity m_identity = {};

  /// Path to the verification certificate chain (PEM).  Required unless #m_disable_encryption.
  std::string m_cert_chain_pem;

  /// Path to the file containing DH parameters (PEM).
  std::string m_dh_params_pem;

  /// Disables encryption.  (Connections to loopback addresses are never encrypted anyway.)
  bool m_disable_encryption = false;

  /**
   * If `true`, adapters release a received message's slot automatically after their handler returns
   * (if the handler did not already).  Session itself does not consult it, except that a Session constructed
   * without a receive handler always releases immediately.
   */
  bool m_auto_release = true;

  // Methods.

  /**
   * Checks the values for consistency and range as documented on each member.  Does not touch the file system.
   *
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_VALUE_ERROR (with details logged to `logger_ptr`).
   * @param logger_ptr
   *        Logger to use for logging the reason of a failure.
   */
  void validate(flow::log::Logger* logger_ptr, Error_code* err_code = 0) const;

  /**
   * #m_max_slots, with 0 resolved per its doc header.
   * @return See above.
   */
  uint8_t effective_max_slots() const;

  /**
   * min(2 x #m_timeout, #S_MAX_CONNECT_TIMEOUT_SECS), as a duration.
   * @return See above.
   */
  util::Fine_duration connect_timeout() const;

  /**
   * #m_timeout as a duration.
   * @return See above.
   */
  util::Fine_duration timeout() const;
}; // struct Config

} // namespace chirp::engine
