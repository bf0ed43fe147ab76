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
#include "chirp/engine/detail/loopback_node.hpp"
#include "chirp/engine/detail/loopback_network.hpp"
#include "chirp/util/detail/util_fwd.hpp"
#include "chirp/error.hpp"
#include <flow/util/util.hpp>
#include <boost/make_shared.hpp>
#include <boost/move/make_unique.hpp>
#include <algorithm>

namespace chirp::engine::detail
{

// Implementations.

Loopback_node::Loopback_node(flow::log::Logger* logger_ptr) :
  flow::log::Log_context(logger_ptr, Log_component::S_ENGINE),
  m_identity(util::NULL_IDENTITY),
  m_bound(false),
  m_closed(false),
  m_serial(0),
  m_send_id(0),
  m_slots_used(0)
{
  // Nothing else.
}

Loopback_node::~Loopback_node()
{
  if (m_bound)
  {
    FLOW_LOG_WARNING("Loopback_node [" << *this << "]: Destroyed while still bound (close() never called).  "
                     "Unbinding.");
    Loopback_network::get().unbind(m_config.m_port, this);
    util::engine_detached();
  }
}

Error_code Loopback_node::init(const Config& config, Engine::Task_engine_ptr task_engine,
                               Engine::On_receive_func&& on_receive, Engine::On_done_func&& on_done,
                               Engine::On_log_func&& on_log)
{
  using util::operator<<;
  using flow::util::ostream_op_string;

  // We are in thread W.

  m_task_engine = task_engine;
  m_config = config;
  m_on_log = std::move(on_log);

  /* Per Engine contract any failure except RESOURCE_ERROR is followed by on_done (once torn down; here there is
   * nothing to tear down, so immediately -- but still asynchronously). */
  const auto fail = [&](error::Code code, util::String_view what) -> Error_code
  {
    diag(what, true);
    boost::asio::post(*m_task_engine, std::move(on_done));
    return code;
  };

  Error_code err_code;
  m_config.validate(get_logger(), &err_code);
  if (err_code)
  {
    return fail(error::Code::S_VALUE_ERROR, "Configuration rejected (see log for details).");
  }
  // else

  if (!m_config.m_disable_encryption)
  {
    Error_code fs_err_code;
    if (!fs::is_regular_file(m_config.m_cert_chain_pem, fs_err_code))
    {
      return fail(error::Code::S_TLS_ERROR,
                  ostream_op_string("Certificate chain [", m_config.m_cert_chain_pem, "] is not a readable file."));
    }
    // else
    if ((!m_config.m_dh_params_pem.empty()) && (!fs::is_regular_file(m_config.m_dh_params_pem, fs_err_code)))
    {
      return fail(error::Code::S_TLS_ERROR,
                  ostream_op_string("DH parameters [", m_config.m_dh_params_pem, "] are not a readable file."));
    }
  }

  // validate() vouched for these.
  m_bind_v4 = util::parse_address(m_config.m_bind_v4);
  m_bind_v6 = util::parse_address(m_config.m_bind_v6);
  m_identity = util::is_null(m_config.m_identity) ? util::random_identity() : m_config.m_identity;

  if (!util::engine_attached())
  {
    return fail(error::Code::S_NOT_INITIALIZED, "util::library_init() was not called.");
  }
  // else

  m_on_receive = std::move(on_receive);
  if (!Loopback_network::get().bind(m_config.m_port, shared_from_this()))
  {
    util::engine_detached();
    return fail(error::Code::S_ADDRESS_IN_USE,
                ostream_op_string("Port [", m_config.m_port, "] is already bound by another engine."));
  }
  // else

  m_on_done = std::move(on_done);
  m_bound = true;

  FLOW_LOG_INFO("Loopback_node [" << *this << "]: Bound; identity [" << m_identity << "]; "
                "slots [" << unsigned(m_config.effective_max_slots()) << "]; "
                "synchronous [" << m_config.m_synchronous << "].");
  return Error_code();
} // Loopback_node::init()

Error_code Loopback_node::send(Wire_message_ptr msg, Engine::On_send_done_func&& on_done)
{
  using boost::make_shared;
  using std::atomic;

  // We are in thread W.

  if (m_closed || (!m_bound))
  {
    diag("Cannot send: engine is not running.", true);
    return error::Code::S_SHUTDOWN;
  }
  // else
  if (msg->m_port == 0)
  {
    diag("Cannot send: destination port is not set.", true);
    return error::Code::S_VALUE_ERROR;
  }
  // else

  msg->m_serial = ++m_serial;
  const auto send_id = ++m_send_id;

  Outbound out;
  out.m_msg = msg;
  out.m_on_done = std::move(on_done);
  out.m_abandoned = make_shared<atomic<bool>>(false);
  m_in_flight.emplace(send_id, std::move(out));

  FLOW_LOG_TRACE("Loopback_node [" << *this << "]: Send [" << send_id << "] of message [" << *msg << "] registered.");

  if (m_config.m_synchronous)
  {
    auto& queue = m_sync_queues[msg->m_port];
    queue.push_back(send_id);
    if (queue.size() != 1)
    {
      FLOW_LOG_TRACE("Loopback_node [" << *this << "]: Synchronous mode: send [" << send_id << "] waits behind "
                     "[" << (queue.size() - 1) << "] unacknowledged/queued send(s) to the same port.");
      return Error_code();
    }
  }

  dispatch(send_id);
  return Error_code();
} // Loopback_node::send()

void Loopback_node::dispatch(uint64_t send_id)
{
  using flow::util::ostream_op_string;
  using flow::util::Timer;
  using boost::asio::ip::address_v4;
  using boost::asio::ip::address_v6;
  using boost::movelib::make_unique;
  using boost::make_shared;
  using boost::weak_ptr;

  // We are in thread W.

  if (m_closed)
  {
    return; // finish_close() will deal with it.
  }
  // else

  const auto it = m_in_flight.find(send_id);
  assert((it != m_in_flight.end()) && "Dispatching a send that is not in flight?");
  auto& out = it->second;
  const auto& msg = *out.m_msg;

  const weak_ptr<Loopback_node> weak_self(shared_from_this());

  // The send timer covers everything from here: delivery, waiting for a slot, and (synchronous mode) the release.
  out.m_timer = make_unique<Timer>(*m_task_engine);
  out.m_timer->expires_after(m_config.timeout());
  out.m_timer->async_wait([weak_self, send_id](const Error_code& async_err_code)
  {
    // We are in thread W.
    if (async_err_code == boost::asio::error::operation_aborted)
    {
      return; // Completed some other way.  GTFO.
    }
    // else
    const auto self = weak_self.lock();
    if (self)
    {
      self->complete_send(send_id, error::Code::S_TIMEOUT,
                          ostream_op_string("Send [", send_id, "] timed out after [", self->m_config.m_timeout,
                                            "] seconds."));
    }
  });

  const auto receiver = Loopback_network::get().find(msg.m_port);
  if ((!receiver) || (!receiver->accepts_address(msg.m_address)))
  {
    post_complete_send(send_id, error::Code::S_CANNOT_CONNECT,
                       ostream_op_string("Cannot connect to [", msg.m_address, "]:[", msg.m_port, "]: "
                                         "no node is listening there."));
    return;
  }
  // else

  // The receiver's m_config is immutable; reading it from our thread is fine.
  const auto max_size = receiver->m_config.m_max_msg_size;
  if ((max_size != 0) && ((msg.m_header.size() + msg.m_data.size()) > max_size))
  {
    post_complete_send(send_id, error::Code::S_VALUE_ERROR,
                       ostream_op_string("Message of [", msg.m_header.size() + msg.m_data.size(), "] bytes exceeds "
                                         "receiver's MAX_MSG_SIZE [", max_size, "]."));
    return;
  }
  // else

  Inbound inbound;
  inbound.m_msg = make_shared<Wire_message>();
  auto& copy = *inbound.m_msg;
  copy.m_identity = msg.m_identity;
  copy.m_serial = msg.m_serial;
  copy.m_header = msg.m_header;
  copy.m_data = msg.m_data;
  copy.m_address = msg.m_address.is_v6() ? util::Ip_address(address_v6::loopback())
                                         : util::Ip_address(address_v4::loopback());
  copy.m_port = m_config.m_port;
  copy.m_remote_identity = m_identity;
  inbound.m_sender = weak_self;
  inbound.m_send_id = send_id;
  inbound.m_abandoned = out.m_abandoned;
  inbound.m_ack_on_release = m_config.m_synchronous;

  FLOW_LOG_TRACE("Loopback_node [" << *this << "]: Send [" << send_id << "]: delivering to [" << *receiver << "].");

  const weak_ptr<Loopback_node> weak_receiver(receiver);
  boost::asio::post(*receiver->m_task_engine, [weak_receiver, inbound = std::move(inbound)]() mutable
  {
    // We are in the receiver's thread W.
    const auto receiver = weak_receiver.lock();
    if (!receiver)
    {
      acknowledge(inbound, error::Code::S_WRITE_ERROR, "Receiver went away before delivery.");
      return;
    }
    // else
    receiver->on_inbound(std::move(inbound));
  });
} // Loopback_node::dispatch()

void Loopback_node::complete_send(uint64_t send_id, const Error_code& err_code, util::String_view diag_msg)
{
  // We are in thread W.

  const auto it = m_in_flight.find(send_id);
  if (it == m_in_flight.end())
  {
    FLOW_LOG_TRACE("Loopback_node [" << *this << "]: Send [" << send_id << "] result [" << err_code << "] "
                   "arrived, but it was already completed (e.g., timed out).  Ignoring.");
    return;
  }
  // else

  auto out = std::move(it->second);
  m_in_flight.erase(it);
  if (out.m_timer)
  {
    out.m_timer->cancel();
  }
  *out.m_abandoned = true;

  if (err_code)
  {
    diag(diag_msg, true);
  }

  // Synchronous mode: this send no longer blocks the port; pick the next one (but send it after the callback).
  uint64_t next_send_id = 0;
  if (m_config.m_synchronous)
  {
    const auto q_it = m_sync_queues.find(out.m_msg->m_port);
    if (q_it != m_sync_queues.end())
    {
      auto& queue = q_it->second;
      const bool was_front = (!queue.empty()) && (queue.front() == send_id);
      queue.erase(std::remove(queue.begin(), queue.end(), send_id), queue.end());
      if (queue.empty())
      {
        m_sync_queues.erase(q_it);
      }
      else if (was_front)
      {
        next_send_id = queue.front();
      }
    }
  }

  FLOW_LOG_TRACE("Loopback_node [" << *this << "]: Send [" << send_id << "] completed with "
                 "[" << err_code << "] [" << (err_code ? err_code.message() : "success") << "].");
  out.m_on_done(out.m_msg, err_code);

  if (next_send_id != 0)
  {
    dispatch(next_send_id);
  }
} // Loopback_node::complete_send()

void Loopback_node::post_complete_send(uint64_t send_id, const Error_code& err_code, std::string diag_msg)
{
  // We are in any thread.  m_task_engine is immutable, so that's fine.

  const boost::weak_ptr<Loopback_node> weak_self(shared_from_this());
  boost::asio::post(*m_task_engine, [weak_self, send_id, err_code, diag_msg = std::move(diag_msg)]()
  {
    const auto self = weak_self.lock();
    if (self)
    {
      self->complete_send(send_id, err_code, diag_msg);
    }
  });
}

void Loopback_node::acknowledge(const Inbound& inbound, const Error_code& err_code, std::string diag_msg) // Static.
{
  const auto sender = inbound.m_sender.lock();
  if (sender)
  {
    sender->post_complete_send(inbound.m_send_id, err_code, std::move(diag_msg));
  }
  // else { Sender is gone; nobody to tell. }
}

void Loopback_node::on_inbound(Inbound&& inbound)
{
  // We are in thread W.

  if (m_closed)
  {
    acknowledge(inbound, error::Code::S_WRITE_ERROR, "Receiver is shutting down.");
    return;
  }
  // else
  if (*inbound.m_abandoned)
  {
    FLOW_LOG_TRACE("Loopback_node [" << *this << "]: Message [" << *inbound.m_msg << "] arrived, but its sender "
                   "already gave up on it.  Dropping.");
    return;
  }
  // else

  if (m_slots_used < m_config.effective_max_slots())
  {
    grant_slot(std::move(inbound));
    return;
  }
  // else

  FLOW_LOG_TRACE("Loopback_node [" << *this << "]: Message [" << *inbound.m_msg << "] arrived, but all "
                 "[" << m_slots_used << "] slots are held.  It waits.");
  m_waiting.emplace_back(std::move(inbound));
}

void Loopback_node::grant_slot(Inbound&& inbound)
{
  // We are in thread W.

  ++m_slots_used;
  const auto msg = inbound.m_msg;
  msg->m_has_slot = true;

  if (!inbound.m_ack_on_release)
  {
    acknowledge(inbound, Error_code(), std::string());
  }

  m_held.emplace(Slot_key(msg->m_identity, msg->m_serial), std::move(inbound));

  FLOW_LOG_TRACE("Loopback_node [" << *this << "]: Message [" << *msg << "] granted a slot "
                 "([" << m_slots_used << "] held).  Delivering.");
  m_on_receive(msg);
}

void Loopback_node::grant_waiting()
{
  // We are in thread W.

  while ((!m_closed) && (!m_waiting.empty()) && (m_slots_used < m_config.effective_max_slots()))
  {
    auto inbound = std::move(m_waiting.front());
    m_waiting.pop_front();
    if (*inbound.m_abandoned)
    {
      continue;
    }
    // else
    grant_slot(std::move(inbound));
  }
}

void Loopback_node::release_slot(Wire_message_ptr msg, Engine::On_release_func&& on_release)
{
  // We are in thread W.

  const auto identity = msg->m_identity;
  const auto serial = msg->m_serial;

  if (msg->m_has_slot)
  {
    msg->m_has_slot = false;

    auto range = m_held.equal_range(Slot_key(identity, serial));
    auto it = std::find_if(range.first, range.second,
                           [&](const auto& entry) { return entry.second.m_msg == msg; });
    if (it == range.second)
    {
      it = range.first; // Not the same object (a copy?); the key is what counts then.
    }

    if (it == range.second)
    {
      FLOW_LOG_TRACE("Loopback_node [" << *this << "]: Release of [" << *msg << "]: slot no longer held "
                     "(dropped during shutdown?).  Reporting release anyway.");
    }
    else
    {
      const auto inbound = std::move(it->second);
      m_held.erase(it);
      --m_slots_used;
      FLOW_LOG_TRACE("Loopback_node [" << *this << "]: Released slot of [" << *msg << "] "
                     "([" << m_slots_used << "] held).");
      if (inbound.m_ack_on_release)
      {
        acknowledge(inbound, Error_code(), std::string());
      }
      grant_waiting();
    }
  } // if (msg->m_has_slot)

  boost::asio::post(*m_task_engine, [on_release = std::move(on_release), identity, serial]()
  {
    on_release(identity, serial);
  });
} // Loopback_node::release_slot()

void Loopback_node::close()
{
  // We are in thread W.

  if (m_closed)
  {
    return;
  }
  // else
  m_closed = true;

  FLOW_LOG_INFO("Loopback_node [" << *this << "]: Closing: unbinding now; outstanding work fails next.");
  if (m_bound)
  {
    Loopback_network::get().unbind(m_config.m_port, this);
    util::engine_detached();
    m_bound = false;
  }

  const boost::weak_ptr<Loopback_node> weak_self(shared_from_this());
  boost::asio::post(*m_task_engine, [weak_self]()
  {
    const auto self = weak_self.lock();
    if (self)
    {
      self->finish_close();
    }
  });
} // Loopback_node::close()

void Loopback_node::finish_close()
{
  // We are in thread W.

  FLOW_LOG_INFO("Loopback_node [" << *this << "]: Finishing close: [" << m_in_flight.size() << "] send(s) "
                "in flight; [" << m_held.size() << "] message(s) holding slots; [" << m_waiting.size() << "] "
                "waiting.");

  while (!m_in_flight.empty())
  {
    complete_send(m_in_flight.begin()->first, error::Code::S_SHUTDOWN, "Engine shut down; send aborted.");
  }
  m_sync_queues.clear();

  for (const auto& inbound : m_waiting)
  {
    acknowledge(inbound, error::Code::S_WRITE_ERROR, "Receiver shut down before granting a slot.");
  }
  m_waiting.clear();

  for (const auto& entry : m_held)
  {
    if (entry.second.m_ack_on_release)
    {
      acknowledge(entry.second, error::Code::S_WRITE_ERROR, "Receiver shut down before releasing the slot.");
    }
  }
  m_held.clear();
  m_slots_used = 0;

  diag("Closed.", false);

  auto on_done = std::move(m_on_done);
  m_on_done = Engine::On_done_func();
  if (on_done)
  {
    on_done();
  }
} // Loopback_node::finish_close()

bool Loopback_node::accepts_address(const util::Ip_address& addr) const
{
  return addr.is_loopback() || addr.is_unspecified() || (addr == m_bind_v4) || (addr == m_bind_v6);
}

void Loopback_node::diag(util::String_view msg, bool is_error)
{
  if (is_error)
  {
    FLOW_LOG_WARNING("Loopback_node [" << *this << "]: " << msg);
  }
  else
  {
    FLOW_LOG_TRACE("Loopback_node [" << *this << "]: " << msg);
  }

  if (m_on_log)
  {
    m_on_log(msg, is_error);
  }
}

const util::Identity& Loopback_node::identity() const
{
  return m_identity;
}

bool Loopback_node::bound() const
{
  return m_bound;
}

std::ostream& operator<<(std::ostream& os, const Loopback_node& val)
{
  return os << "loopback:" << val.m_config.m_port << '@' << static_cast<const void*>(&val);
}

} // namespace chirp::engine::detail
