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
#include "chirp/engine/libchirp_engine.hpp"
#include "chirp/util/detail/util_fwd.hpp"
#include "chirp/error.hpp"
#include <flow/util/util.hpp>
#include <boost/asio/post.hpp>
#include <boost/make_shared.hpp>
#include <boost/move/make_unique.hpp>
#include <sys/socket.h>
#include <algorithm>
#include <cstdint>
#include <string>

namespace chirp::engine
{

namespace
{

/// Process-wide native state: `ch_libchirp_init()` on first use; `ch_libchirp_cleanup()` at exit.
struct Native_library
{
  Native_library() :
    m_result(ch_libchirp_init())
  {
    // Nothing else.
  }

  ~Native_library()
  {
    if (m_result == CH_SUCCESS)
    {
      ch_libchirp_cleanup();
    }
  }

  /// What `ch_libchirp_init()` returned.
  const ch_error_t m_result;
};

/**
 * Initializes the native library once per process.
 *
 * @return What `ch_libchirp_init()` returned.
 */
ch_error_t native_library_init()
{
  static const Native_library s_library;
  return s_library.m_result;
}

/* The native log callback carries no context.  Thread N serves one engine only, so a thread-local finds it; and
 * during ch_chirp_init() (in thread W) so does the other one. */

/// In thread N: its engine.
thread_local Libchirp_engine* s_engine_in_native_thread = nullptr;

/// In thread W, during `ch_chirp_init()`: the engine being initialized.
thread_local Libchirp_engine* s_engine_in_init = nullptr;

} // namespace (anon)

// Implementations.

Libchirp_engine::Libchirp_engine(flow::log::Logger* logger_ptr) :
  flow::log::Log_context(logger_ptr, Log_component::S_ENGINE),
  m_identity(util::NULL_IDENTITY),
  m_state(State::S_NOT_STARTED),
  m_attached(false),
  m_uv_loop(),
  m_chirp()
{
  // Nothing else; thread N is started by init().
}

Libchirp_engine::~Libchirp_engine()
{
  if (!m_native_thread)
  {
    return;
  }
  // else

  if (m_state == State::S_RUNNING)
  {
    FLOW_LOG_WARNING("Libchirp_engine [" << *this << "]: Destroyed while running; did someone forget close()?  "
                     "Closing now and awaiting the native thread.");
    ch_chirp_close_ts(&m_chirp);
  }
  m_native_thread->stop(); // Returns once ch_run() has returned, and thread N is joined.
}

Error_code Libchirp_engine::init(const Config& config, Task_engine_ptr task_engine,
                                 On_receive_func&& on_receive, On_done_func&& on_done, On_log_func&& on_log)
{
  using flow::util::ostream_op_string;

  // We are in thread W.

  if (m_task_engine)
  {
    FLOW_LOG_WARNING("Libchirp_engine [" << *this << "]: init() called twice; refusing.");
    boost::asio::post(*task_engine, std::move(on_done)); // Per contract: non-RESOURCE_ERROR failure => on_done.
    return error::Code::S_INIT_FAIL;
  }
  // else

  m_task_engine = task_engine;
  m_config = config;
  m_on_log = std::move(on_log);

  // Failures before anything native exists: nothing to tear down; so on_done immediately (but asynchronously).
  const auto fail = [&](const Error_code& err_code, util::String_view what) -> Error_code
  {
    diag(what, true);
    boost::asio::post(*m_task_engine, std::move(on_done));
    return err_code;
  };

  Error_code err_code;
  m_config.validate(get_logger(), &err_code);
  if (err_code)
  {
    return fail(error::Code::S_VALUE_ERROR, "Configuration rejected (see log for details).");
  }
  // else

  const auto lib_result = native_library_init();
  if (lib_result != CH_SUCCESS)
  {
    return fail(to_error_code(lib_result), ostream_op_string("ch_libchirp_init() failed [", lib_result, "]."));
  }
  // else

  if (!util::engine_attached())
  {
    return fail(error::Code::S_NOT_INITIALIZED, "util::library_init() was not called.");
  }
  // else
  m_attached = true;

  const int loop_result = ch_loop_init(&m_uv_loop);
  if (loop_result != 0)
  {
    util::engine_detached();
    m_attached = false;
    return fail(error::Code::S_LOOP_ERROR, ostream_op_string("ch_loop_init() failed [", loop_result, "]."));
  }
  // else

  ch_config_t native_config;
  to_native_config(&native_config);

  m_on_receive = std::move(on_receive);
  m_on_done = std::move(on_done);

  s_engine_in_init = this;
  const auto native_code = ch_chirp_init(&m_chirp, &native_config, &m_uv_loop,
                                         &on_native_receive, nullptr, &on_native_done, &on_native_log);
  s_engine_in_init = nullptr;
  m_chirp.user_data = this; // Thread N is not running yet, so no callback can have needed it.

  if (native_code == CH_ENOMEM)
  {
    // Per libchirp: nothing was set up; nothing will be reported done.  Per our contract: no on_done either.
    diag("ch_chirp_init() could not allocate.", true);
    ch_loop_close(&m_uv_loop);
    util::engine_detached();
    m_attached = false;
    m_on_receive = On_receive_func();
    m_on_done = On_done_func();
    return error::Code::S_RESOURCE_ERROR;
  }
  // else

  if (native_code != CH_SUCCESS)
  {
    /* Per libchirp: it tears down what it set up on its loop, and reports done; only then may m_chirp go away.
     * So run the loop anyway; finish() then reports on_done as our contract wants. */
    diag(ostream_op_string("ch_chirp_init() failed [", native_code, "]; awaiting native teardown."), true);
    m_state = State::S_CLOSING;
    start_native_thread();
    return to_error_code(native_code);
  }
  // else

  ch_chirp_set_auto_stop_loop(&m_chirp); // So that ch_chirp_close_ts() ends ch_run() in thread N.
  const auto native_identity = ch_chirp_get_identity(&m_chirp);
  std::copy(native_identity.data, native_identity.data + CH_ID_SIZE, m_identity.begin());

  m_state = State::S_RUNNING;
  start_native_thread();

  FLOW_LOG_INFO("Libchirp_engine [" << *this << "]: Running; identity [" << m_identity << "]; "
                "slots [" << unsigned(m_config.effective_max_slots()) << "]; "
                "synchronous [" << m_config.m_synchronous << "]; "
                "encryption [" << (!m_config.m_disable_encryption) << "].");
  return Error_code();
} // Libchirp_engine::init()

void Libchirp_engine::to_native_config(ch_config_t* native_config) const
{
  ch_chirp_config_init(native_config);

  native_config->REUSE_TIME = m_config.m_reuse_time;
  native_config->TIMEOUT = m_config.m_timeout;
  native_config->PORT = m_config.m_port;
  native_config->BACKLOG = m_config.m_backlog;
  native_config->MAX_SLOTS = m_config.m_max_slots;
  native_config->SYNCHRONOUS = m_config.m_synchronous;
  native_config->DISABLE_SIGNALS = m_config.m_disable_signals;
  native_config->BUFFER_SIZE = m_config.m_buffer_size;
  if (m_config.m_max_msg_size != 0) // Else keep the native default.
  {
    native_config->MAX_MSG_SIZE = m_config.m_max_msg_size;
  }

  // validate() vouched for these.
  const auto bind_v4 = util::parse_address(m_config.m_bind_v4).to_v4().to_bytes();
  std::copy(bind_v4.begin(), bind_v4.end(), native_config->BIND_V4);
  const auto bind_v6 = util::parse_address(m_config.m_bind_v6).to_v6().to_bytes();
  std::copy(bind_v6.begin(), bind_v6.end(), native_config->BIND_V6);
  std::copy(m_config.m_identity.begin(), m_config.m_identity.end(), native_config->IDENTITY);

  // libchirp only reads these, during ch_chirp_init().
  native_config->CERT_CHAIN_PEM
    = m_config.m_cert_chain_pem.empty() ? nullptr : const_cast<char*>(m_config.m_cert_chain_pem.c_str());
  native_config->DH_PARAMS_PEM
    = m_config.m_dh_params_pem.empty() ? nullptr : const_cast<char*>(m_config.m_dh_params_pem.c_str());
  native_config->DISABLE_ENCRYPTION = m_config.m_disable_encryption;
}

void Libchirp_engine::start_native_thread()
{
  using flow::async::Single_thread_task_loop;
  using flow::util::ostream_op_string;
  using boost::movelib::make_unique;

  // We are in thread W.

  // (Linux) OS thread name will truncate to 15 chars; "chn-" plus the port fits.
  m_native_thread = make_unique<Single_thread_task_loop>(get_logger(), ostream_op_string("chn-", m_config.m_port));
  m_native_thread->start();
  m_native_thread->post([this]()
  {
    // We are in thread N.  This task occupies it until libchirp is done.
    s_engine_in_native_thread = this;
    const int run_result = ch_run(&m_uv_loop);
    const int close_result = ch_loop_close(&m_uv_loop);
    s_engine_in_native_thread = nullptr;

    if ((run_result != 0) || (close_result != 0))
    {
      FLOW_LOG_WARNING("Libchirp_engine [" << *this << "]: Native loop ended with run result [" << run_result << "] "
                       "and close result [" << close_result << "]; continuing shutdown regardless.");
    }

    // Every native callback was posted before this; so finish() runs after all of them.
    boost::asio::post(*m_task_engine, [this]() { finish(); });
  });
}

Error_code Libchirp_engine::send(Wire_message_ptr msg, On_send_done_func&& on_done)
{
  using boost::movelib::make_unique;
  using flow::util::ostream_op_string;

  // We are in thread W.

  if (m_state != State::S_RUNNING)
  {
    diag("Cannot send: engine is not running.", true);
    return (m_state == State::S_NOT_STARTED) ? error::Code::S_NOT_INITIALIZED : error::Code::S_SHUTDOWN;
  }
  // else
  if (msg->m_port == 0)
  {
    diag("Cannot send: destination port is not set.", true);
    return error::Code::S_VALUE_ERROR;
  }
  // else
  if (msg->m_header.size() > UINT16_MAX)
  {
    diag(ostream_op_string("Cannot send: header of [", msg->m_header.size(), "] bytes is too long."), true);
    return error::Code::S_VALUE_ERROR;
  }
  // else

  auto outbound = make_unique<Outbound>();
  outbound->m_msg = msg;
  outbound->m_on_done = std::move(on_done);

  // The native message points into *msg's buffers; we own *msg until completion; so they stay put.
  auto& native = outbound->m_native;
  ch_msg_init(&native);
  std::copy(msg->m_identity.begin(), msg->m_identity.end(), native.identity);
  if (!msg->m_header.empty())
  {
    native.header = &msg->m_header[0];
    native.header_len = static_cast<uint16_t>(msg->m_header.size());
  }
  if (!msg->m_data.empty())
  {
    ch_msg_set_data(&native, &msg->m_data[0], static_cast<uint32_t>(msg->m_data.size()));
  }
  const auto address = msg->m_address.to_string();
  auto native_code = ch_msg_set_address(&native, msg->m_address.is_v6() ? _CH_IPV6 : _CH_IPV4,
                                        address.c_str(), msg->m_port);
  if (native_code != CH_SUCCESS)
  {
    diag(ostream_op_string("Cannot send: address [", address, "] rejected [", native_code, "]."), true);
    return to_error_code(native_code);
  }
  // else

  const auto key = outbound.get();
  native.user_data = key;
  m_in_flight.emplace(key, std::move(outbound));

  native_code = ch_chirp_send_ts(&m_chirp, &native, &on_native_send);
  if (native_code != CH_SUCCESS)
  {
    m_in_flight.erase(key);
    diag(ostream_op_string("ch_chirp_send_ts() refused the message [", native_code, "]."), true);
    return to_error_code(native_code);
  }
  // else

  FLOW_LOG_TRACE("Libchirp_engine [" << *this << "]: Send of message [" << *msg << "] handed to libchirp.");
  return Error_code();
} // Libchirp_engine::send()

void Libchirp_engine::complete_send(Outbound* outbound, uint32_t serial, ch_error_t native_code)
{
  // We are in thread W.

  const auto it = m_in_flight.find(outbound);
  if (it == m_in_flight.end())
  {
    return; // finish() got to it first.
  }
  // else

  const auto record = std::move(it->second);
  m_in_flight.erase(it);

  record->m_msg->m_serial = serial;
  const auto err_code = to_error_code(native_code);
  FLOW_LOG_TRACE("Libchirp_engine [" << *this << "]: Send of message [" << *record->m_msg << "] completed with "
                 "[" << err_code << "].");
  record->m_on_done(record->m_msg, err_code);
}

void Libchirp_engine::release_slot(Wire_message_ptr msg, On_release_func&& on_release)
{
  using flow::util::ostream_op_string;

  // We are in thread W.

  const Release_key key(msg->m_identity, msg->m_serial);
  const auto native_it = m_natives.find(msg);
  ch_message_t* native = nullptr;
  if (native_it != m_natives.end())
  {
    native = native_it->second;
    m_natives.erase(native_it);
  }

  if ((!msg->m_has_slot) || (!native) || (m_state == State::S_DONE))
  {
    // Nothing (left) to release natively; still complete, as promised.
    msg->m_has_slot = false;
    boost::asio::post(*m_task_engine, [on_release = std::move(on_release), key]()
    {
      on_release(key.first, key.second);
    });
    return;
  }
  // else

  msg->m_has_slot = false;
  m_releases.emplace(key, std::move(on_release));
  const auto native_code = ch_chirp_release_msg_slot_ts(&m_chirp, native, &on_native_release);
  if (native_code != CH_SUCCESS)
  {
    diag(ostream_op_string("ch_chirp_release_msg_slot_ts() failed [", native_code, "]; "
                           "reporting the release anyway."), true);
    boost::asio::post(*m_task_engine, [this, key]() { complete_release(key); });
  }
}

void Libchirp_engine::complete_release(const Release_key& key)
{
  // We are in thread W.

  const auto it = m_releases.find(key);
  if (it == m_releases.end())
  {
    return; // finish() got to it first.
  }
  // else

  const auto on_release = std::move(it->second);
  m_releases.erase(it);
  on_release(key.first, key.second);
}

void Libchirp_engine::close()
{
  using flow::util::ostream_op_string;

  // We are in thread W.

  if (m_state != State::S_RUNNING)
  {
    return; // Never started; or already on its way down.
  }
  // else
  m_state = State::S_CLOSING;

  FLOW_LOG_INFO("Libchirp_engine [" << *this << "]: Closing; [" << m_in_flight.size() << "] send(s) in flight.");
  const auto native_code = ch_chirp_close_ts(&m_chirp);
  if (native_code != CH_SUCCESS)
  {
    diag(ostream_op_string("ch_chirp_close_ts() failed [", native_code, "]."), true);
  }
}

void Libchirp_engine::finish()
{
  // We are in thread W.  Thread N has left its loop; no native callback can arrive anymore.

  FLOW_LOG_INFO("Libchirp_engine [" << *this << "]: Native side done; [" << m_in_flight.size() << "] send(s) and "
                "[" << m_releases.size() << "] release(s) left to complete.");
  m_state = State::S_DONE;

  while (!m_in_flight.empty())
  {
    const auto it = m_in_flight.begin();
    const auto record = std::move(it->second);
    m_in_flight.erase(it);
    record->m_on_done(record->m_msg, error::Code::S_SHUTDOWN);
  }
  while (!m_releases.empty())
  {
    const auto it = m_releases.begin();
    const auto key = it->first;
    const auto on_release = std::move(it->second);
    m_releases.erase(it);
    on_release(key.first, key.second);
  }
  m_natives.clear(); // Their memory belonged to libchirp, which is gone.

  if (m_attached)
  {
    util::engine_detached();
    m_attached = false;
  }

  auto on_done = std::move(m_on_done);
  m_on_done = On_done_func();
  if (on_done)
  {
    on_done();
  }
} // Libchirp_engine::finish()

const util::Identity& Libchirp_engine::identity() const
{
  return m_identity;
}

void Libchirp_engine::diag(util::String_view msg, bool is_error)
{
  if (is_error)
  {
    FLOW_LOG_WARNING("Libchirp_engine [" << *this << "]: " << msg);
  }
  else
  {
    FLOW_LOG_TRACE("Libchirp_engine [" << *this << "]: " << msg);
  }

  if (m_on_log)
  {
    m_on_log(msg, is_error);
  }
}

void Libchirp_engine::on_native_receive(ch_chirp_t* chirp, ch_message_t* msg)
{
  using boost::asio::ip::address_v4;
  using boost::asio::ip::address_v6;

  // We are in thread N.  Copy everything out now: the native buffers are freed right after.
  const auto engine = static_cast<Libchirp_engine*>(chirp->user_data);

  const auto wire = boost::make_shared<Wire_message>();
  std::copy(msg->identity, msg->identity + CH_ID_SIZE, wire->m_identity.begin());
  wire->m_serial = msg->serial;
  if (msg->header_len != 0)
  {
    wire->m_header.assign(msg->header, msg->header_len);
  }
  if (msg->data_len != 0)
  {
    wire->m_data.assign(msg->data, msg->data_len);
  }
  if (msg->ip_protocol == AF_INET6)
  {
    address_v6::bytes_type bytes;
    std::copy(msg->address, msg->address + bytes.size(), bytes.begin());
    wire->m_address = address_v6(bytes);
  }
  else
  {
    address_v4::bytes_type bytes;
    std::copy(msg->address, msg->address + bytes.size(), bytes.begin());
    wire->m_address = address_v4(bytes);
  }
  wire->m_port = static_cast<uint16_t>(msg->port);
  std::copy(msg->remote_identity, msg->remote_identity + CH_ID_SIZE, wire->m_remote_identity.begin());
  wire->m_has_slot = (ch_msg_has_slot(msg) != 0);
  ch_msg_free_data(msg);

  boost::asio::post(*engine->m_task_engine, [engine, wire, msg]()
  {
    // We are in thread W.
    engine->m_natives.emplace(wire, msg);
    engine->m_on_receive(wire);
  });
}

void Libchirp_engine::on_native_done(ch_chirp_t* chirp)
{
  // We are in thread N.  The loop ends soon after; start_native_thread()'s task takes it from there.
  const auto engine = static_cast<Libchirp_engine*>(chirp->user_data);
  FLOW_LOG_SET_CONTEXT(engine->get_logger(), engine->get_log_component());
  FLOW_LOG_INFO("Libchirp_engine [" << *engine << "]: libchirp reports done.");
}

void Libchirp_engine::on_native_log(char msg[], char error)
{
  // We are in thread N; or in thread W inside ch_chirp_init().
  const bool is_error = (error != 0);
  if (s_engine_in_init)
  {
    s_engine_in_init->diag(msg, is_error);
    return;
  }
  // else

  const auto engine = s_engine_in_native_thread;
  if (!engine)
  {
    return; // Not on behalf of any engine of ours.
  }
  // else
  boost::asio::post(*engine->m_task_engine, [engine, line = std::string(msg), is_error]()
  {
    engine->diag(line, is_error);
  });
}

void Libchirp_engine::on_native_send(ch_chirp_t* chirp, ch_message_t* msg, ch_error_t status)
{
  // We are in thread N.
  const auto engine = static_cast<Libchirp_engine*>(chirp->user_data);
  const auto outbound = static_cast<Outbound*>(msg->user_data);
  const auto serial = msg->serial;
  boost::asio::post(*engine->m_task_engine, [engine, outbound, serial, status]()
  {
    engine->complete_send(outbound, serial, status);
  });
}

void Libchirp_engine::on_native_release(ch_chirp_t* chirp, uint8_t identity[CH_ID_SIZE], uint32_t serial)
{
  // We are in thread N.
  const auto engine = static_cast<Libchirp_engine*>(chirp->user_data);
  Release_key key;
  std::copy(identity, identity + CH_ID_SIZE, key.first.begin());
  key.second = serial;
  boost::asio::post(*engine->m_task_engine, [engine, key]() { engine->complete_release(key); });
}

Error_code Libchirp_engine::to_error_code(ch_error_t native_code)
{
  switch (native_code)
  {
  case CH_SUCCESS:
  case CH_QUEUED:
    return Error_code();
  case CH_VALUE_ERROR:
    return error::Code::S_VALUE_ERROR;
  case CH_UV_ERROR:
    return error::Code::S_LOOP_ERROR;
  case CH_PROTOCOL_ERROR:
    return error::Code::S_PROTOCOL_ERROR;
  case CH_EADDRINUSE:
    return error::Code::S_ADDRESS_IN_USE;
  case CH_TLS_ERROR:
    return error::Code::S_TLS_ERROR;
  case CH_NOT_INITIALIZED:
    return error::Code::S_NOT_INITIALIZED;
  case CH_TIMEOUT:
    return error::Code::S_TIMEOUT;
  case CH_ENOMEM:
    return error::Code::S_RESOURCE_ERROR;
  case CH_SHUTDOWN:
    return error::Code::S_SHUTDOWN;
  case CH_CANNOT_CONNECT:
    return error::Code::S_CANNOT_CONNECT;
  case CH_WRITE_ERROR:
    return error::Code::S_WRITE_ERROR;
  case CH_INIT_FAIL:
    return error::Code::S_INIT_FAIL;
  case CH_USED:
    return error::Code::S_MSG_STILL_SENDING;
  default:
    return error::Code::S_FATAL; // CH_FATAL; and anything else unexpected.
  }
}

std::ostream& operator<<(std::ostream& os, const Libchirp_engine& val)
{
  return os << "libchirp:" << val.m_config.m_port << '@' << static_cast<const void*>(&val);
}

} // namespace chirp::engine
