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

#include "chirp/engine/engine.hpp"
#include <flow/log/log.hpp>
#include <flow/util/util.hpp>
#include <boost/enable_shared_from_this.hpp>
#include <boost/move/unique_ptr.hpp>
#include <atomic>
#include <deque>
#include <map>
#include <utility>

namespace chirp::engine::detail
{

// Types.

/**
 * The implementation of Loopback_engine: one node of the in-process "network."  Other nodes reach it through
 * Loopback_network and post deliveries/acknowledgements onto its thread W; everything else happens in its own
 * thread W.
 *
 * ### Threads and members ###
 * #m_config, #m_task_engine, #m_identity are set in init() before the node becomes reachable (bound in
 * Loopback_network) and are immutable thereafter; so other nodes may read them from their own threads.
 * All other members are touched only from this node's thread W.
 */
class Loopback_node :
  public flow::log::Log_context,
  public boost::enable_shared_from_this<Loopback_node>,
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /**
   * Constructs an un-initialized node.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   */
  explicit Loopback_node(flow::log::Logger* logger_ptr);

  /// Unbinds if still bound.
  ~Loopback_node();

  // Methods.

  /**
   * See Loopback_engine::init().
   *
   * @param config
   *        See Engine::init().
   * @param task_engine
   *        See Engine::init().
   * @param on_receive
   *        See Engine::init().
   * @param on_done
   *        See Engine::init().
   * @param on_log
   *        See Engine::init().
   * @return See Engine::init().
   */
  Error_code init(const Config& config, Engine::Task_engine_ptr task_engine,
                  Engine::On_receive_func&& on_receive, Engine::On_done_func&& on_done,
                  Engine::On_log_func&& on_log);

  /**
   * See Loopback_engine::send().
   *
   * @param msg
   *        See Engine::send().
   * @param on_done
   *        See Engine::send().
   * @return See Engine::send().
   */
  Error_code send(Wire_message_ptr msg, Engine::On_send_done_func&& on_done);

  /**
   * See Loopback_engine::release_slot().
   *
   * @param msg
   *        See Engine::release_slot().
   * @param on_release
   *        See Engine::release_slot().
   */
  void release_slot(Wire_message_ptr msg, Engine::On_release_func&& on_release);

  /// See Loopback_engine::close().
  void close();

  /**
   * See Loopback_engine::identity().
   * @return See above.
   */
  const util::Identity& identity() const;

  /**
   * Whether the node is bound (init() succeeded, close() not yet called).  Only for use in thread W, or after it
   * is gone.
   *
   * @return See above.
   */
  bool bound() const;

private:
  // Friends.

  // Friend of Loopback_node: For access to our internals.
  friend std::ostream& operator<<(std::ostream& os, const Loopback_node& val);

  // Types.

  /// Short-hand for "abandoned" flag shared between sender and receiver of one message.
  using Abandoned_flag_ptr = boost::shared_ptr<std::atomic<bool>>;

  /// Sender-side record of one send() not yet completed.
  struct Outbound
  {
    /// The message being sent (handed back on completion).
    Wire_message_ptr m_msg;
    /// Completion callback.
    Engine::On_send_done_func m_on_done;
    /// Send timeout timer; null until dispatched.
    boost::movelib::unique_ptr<flow::util::Timer> m_timer;
    /// Set once we stop caring about the outcome (completed here, e.g., by timeout); receiver then skips it.
    Abandoned_flag_ptr m_abandoned;
  };

  /// Receiver-side record of one delivered message (holding or awaiting a slot).
  struct Inbound
  {
    /// The receiver's own copy.
    Wire_message_ptr m_msg;
    /// Who sent it; used to acknowledge.  Expired if the sender is gone (then nobody is told anything).
    boost::weak_ptr<Loopback_node> m_sender;
    /// Key into the sender's #m_in_flight.
    uint64_t m_send_id;
    /// See Outbound::m_abandoned.
    Abandoned_flag_ptr m_abandoned;
    /// Whether the sender wants its completion on release (synchronous mode) rather than on delivery.
    bool m_ack_on_release;
  };

  /// Key of a held slot.
  using Slot_key = std::pair<util::Identity, uint32_t>;

  // Methods.

  /**
   * Sender side, thread W: starts actually sending a message already in #m_in_flight: finds the receiver and posts
   * the delivery onto its thread, arming the send timer.
   *
   * @param send_id
   *        Key into #m_in_flight.
   */
  void dispatch(uint64_t send_id);

  /**
   * Sender side, thread W: completes the given send if not completed yet (else no-op); in synchronous mode
   * dispatches the next one queued to the same port.
   *
   * @param send_id
   *        Key into #m_in_flight.
   * @param err_code
   *        Result.
   * @param diag
   *        If `err_code` is truthy: diagnostic line to report through `on_log` first.
   */
  void complete_send(uint64_t send_id, const Error_code& err_code, util::String_view diag);

  /**
   * Posts complete_send() onto our own thread W.
   *
   * @param send_id
   *        See complete_send().
   * @param err_code
   *        See complete_send().
   * @param diag
   *        See complete_send().
   */
  void post_complete_send(uint64_t send_id, const Error_code& err_code, std::string diag);

  /**
   * Receiver side, any thread: posts `complete_send()` onto the sender's thread W for the given inbound message.
   *
   * @param inbound
   *        The message.
   * @param err_code
   *        Result to report.
   * @param diag
   *        See complete_send().
   */
  static void acknowledge(const Inbound& inbound, const Error_code& err_code, std::string diag);

  /**
   * Receiver side, thread W: a message has arrived; give it a slot, or make it wait for one.
   *
   * @param inbound
   *        The message.
   */
  void on_inbound(Inbound&& inbound);

  /**
   * Receiver side, thread W: gives the message a slot and hands it to `on_receive`.
   *
   * @param inbound
   *        The message.
   */
  void grant_slot(Inbound&& inbound);

  /// Receiver side, thread W: grants slots freed up to waiting messages, while possible.
  void grant_waiting();

  /**
   * Receiver side, any thread: whether a message addressed to `addr` (at our port) reaches us.
   *
   * @param addr
   *        Destination address.
   * @return See above.
   */
  bool accepts_address(const util::Ip_address& addr) const;

  /// Thread W: second half of close(), posted: fails everything outstanding and reports done.
  void finish_close();

  /**
   * Reports a diagnostic line through `on_log` (and our own log).
   *
   * @param msg
   *        The line.
   * @param is_error
   *        See Engine::On_log_func.
   */
  void diag(util::String_view msg, bool is_error);

  // Data.

  /// Thread W's task engine.  Immutable after init().  Declared before any timer, so it outlives them.
  Engine::Task_engine_ptr m_task_engine;

  /// Configuration.  Immutable after init().
  Config m_config;

  /// This node's identity.  Immutable after init().
  util::Identity m_identity;

  /// Bind addresses parsed from #m_config.  Immutable after init().
  util::Ip_address m_bind_v4;

  /// See #m_bind_v4.
  util::Ip_address m_bind_v6;

  /// See Engine::init().
  Engine::On_receive_func m_on_receive;

  /// See Engine::init().
  Engine::On_done_func m_on_done;

  /// See Engine::init().
  Engine::On_log_func m_on_log;

  /// Whether bound in Loopback_network (and attached per util::engine_attached()).
  bool m_bound;

  /// Whether close() was called.
  bool m_closed;

  /// Last serial stamped on a sent message.
  uint32_t m_serial;

  /// Last send ID generated (key into #m_in_flight).
  uint64_t m_send_id;

  /// Sends not yet completed, by send ID (so ordered by send time).
  std::map<uint64_t, Outbound> m_in_flight;

  /// Synchronous mode only: send IDs to each port; the front one is dispatched, the rest wait for it.
  std::map<uint16_t, std::deque<uint64_t>> m_sync_queues;

  /// Count of slots currently held (i.e., size of #m_held).
  size_t m_slots_used;

  /// Messages holding a slot.
  std::multimap<Slot_key, Inbound> m_held;

  /// Messages waiting for a slot, FIFO.
  std::deque<Inbound> m_waiting;
}; // class Loopback_node

// Free functions.

/**
 * Prints string representation of the given node to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Loopback_node& val);

} // namespace chirp::engine::detail
