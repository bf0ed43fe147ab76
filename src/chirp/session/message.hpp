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
#include "chirp/engine/wire_message.hpp"
#include <boost/enable_shared_from_this.hpp>
#include <atomic>

namespace chirp::session
{

// Types.

/**
 * Identifies one received message for the purpose of releasing its slot: the sender-assigned identity plus the
 * sender-assigned serial.
 */
struct Release_key
{
  /// Message identity.
  util::Identity m_identity;
  /// Serial stamped by the sending engine.
  uint32_t m_serial;
};

/**
 * The envelope the application sends and receives through a Session.
 *
 * A fresh Message gets a random identity, which it keeps for life; a request and the reply to it share an
 * identity, which is how a Session correlates the two.  To reply, modify (if desired) the header/data of the
 * received Message and send that same object back: its address and port are those of the sender.
 *
 * A received Message may hold a *slot* in the receiving engine (has_slot()); the application must release_slot()
 * it when done, else the sender (in synchronous mode) or further senders (once the slots run out) stall.
 *
 * ### Thread safety ###
 * A given Message must not be modified concurrently with any other operation on it, nor while a send() of it is
 * in progress (before its Send_future resolves).  has_slot() and release_slot() may be called from any thread.
 */
class Message :
  public boost::enable_shared_from_this<Message>,
  private boost::noncopyable
{
public:
  // Types.

  /// Short-hand for ref-counted pointer to a Message.
  using Ptr = Message_ptr;

  // Constructors/destructor.

  /// Creates an empty message with a random identity, addressed to 0.0.0.0, port 0.
  Message();

  /**
   * Creates message via ctor and returns it wrapped in a Ptr.  Useful for brevity.
   * @return See above.
   */
  static Ptr create();

  // Methods.

  /**
   * The identity; unique per request/reply exchange.
   * @return See above.
   */
  const util::Identity& identity() const;

  /**
   * Serial stamped by the engine that sent this message last; 0 if never sent (nor received).
   * @return See above.
   */
  uint32_t serial() const;

  /**
   * Application-level header bytes.
   * @return See above.
   */
  const std::string& header() const;

  /**
   * Sets header().
   * @param header
   *        Value.
   */
  void set_header(util::String_view header);

  /**
   * Application-level payload bytes.
   * @return See above.
   */
  const std::string& data() const;

  /**
   * Sets data().
   * @param data
   *        Value.
   */
  void set_data(util::String_view data);

  /**
   * Destination (if outgoing) or origin (if received) address, in canonical textual form.
   * @return See above.
   */
  std::string address() const;

  /**
   * Same as address() but as an address object.
   * @return See above.
   */
  const util::Ip_address& ip_address() const;

  /**
   * Sets address() from IPv4 dotted-quad or IPv6 textual form.  On failure the address is unchanged.
   *
   * @param address
   *        Textual address.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  error::Code generated:
   *        error::Code::S_VALUE_ERROR (not a valid address).
   */
  void set_address(util::String_view address, Error_code* err_code = 0);

  /**
   * Destination (if outgoing) or origin (if received) port.
   * @return See above.
   */
  uint16_t port() const;

  /**
   * Sets port().
   * @param port
   *        Value.
   */
  void set_port(uint16_t port);

  /**
   * Identity of the remote engine (node) that sent this message; null if not received.
   * @return See above.
   */
  const util::Identity& remote_identity() const;

  /**
   * Whether this received message currently holds a slot in the receiving engine.
   * @return See above.
   */
  bool has_slot() const;

  /**
   * Releases this message's slot through the Session that received it.  No-op (resolving to empty) if
   * `!has_slot()`.  Equivalent to `Session::release_slot(shared_from_this())`.
   *
   * @return See Session::release_slot().
   */
  Release_future release_slot();

  /**
   * Signed difference between two serials, correct across wrap-around: positive if `serial1` is later.
   *
   * @param serial1
   *        Serial.
   * @param serial2
   *        Serial.
   * @return See above.
   */
  static int32_t serial_delta(uint32_t serial1, uint32_t serial2);

private:
  // Friends.

  // Friend of Message: Session converts to/from the wire and tracks the slot.
  friend class Session;

  // Constructors.

  /**
   * Creates the application-side Message for the given received wire message.
   *
   * @param wire
   *        Received message; kept as the slot handle.
   * @param session
   *        The receiving Session.
   */
  explicit Message(const engine::Wire_message_ptr& wire, Session* session);

  // Data.

  /// See identity().
  util::Identity m_identity;

  /// See serial().
  uint32_t m_serial;

  /// See header().
  std::string m_header;

  /// See data().
  std::string m_data;

  /// See ip_address().
  util::Ip_address m_address;

  /// See port().
  uint16_t m_port;

  /// See remote_identity().
  util::Identity m_remote_identity;

  /**
   * For a received message: the engine's own message object, through which the slot is released.  Immutable
   * after construction; null for a message created by the application.
   */
  const engine::Wire_message_ptr m_wire;

  /// Receiving Session if any; used only while has_slot() (the Session clears the slot before it stops).
  Session* const m_session;

  /// See has_slot().  Cleared by the receiving Session in thread W.
  std::atomic<bool> m_has_slot;
}; // class Message

} // namespace chirp::session
