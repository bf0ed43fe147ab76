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
#include <flow/async/single_thread_task_loop.hpp>
#include <flow/log/log.hpp>
#include <boost/move/unique_ptr.hpp>
#include <boost/noncopyable.hpp>
#include <map>
#include <utility>

extern "C"
{
#include <libchirp.h>
}

namespace chirp::engine
{

// Types.

/**
 * Engine backed by the native libchirp library: real TCP (and TLS) connections to chirp nodes in other processes
 * and on other hosts.  Built only if libchirp (and libuv under it) is installed.
 *
 * ### Threads ###
 * libchirp runs on a libuv loop of its own, in a dedicated thread ("thread N" below) started by init().  The
 * Engine methods are called in thread W, as always; they talk to thread N only through libchirp's thread-safe
 * `*_ts()` calls.  Every callback libchirp makes in thread N is re-posted onto thread W before reaching the
 * session, so the Engine threading contract holds unchanged.  All members other than the native structures are
 * touched only in thread W.
 *
 * ### Lifetime ###
 * As per Engine: this must not be destroyed before `on_done` fired.  Thread N exits after libchirp reports done
 * and its libuv loop is closed; only then is `on_done` posted to thread W.  If destroyed while still running
 * (close() never called), the destructor closes and joins synchronously, with a warning.
 */
class Libchirp_engine :
  public Engine,
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /**
   * Creates an engine in un-initialized state; call init() (on thread W) to start it.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   */
  explicit Libchirp_engine(flow::log::Logger* logger_ptr);

  /// See class doc header.
  ~Libchirp_engine() override;

  // Methods.

  /**
   * Implements Engine API.  Besides the Engine errors, the native ones map as follows: `CH_UV_ERROR` to
   * error::Code::S_LOOP_ERROR; `CH_EADDRINUSE` to error::Code::S_ADDRESS_IN_USE; `CH_ENOMEM` to
   * error::Code::S_RESOURCE_ERROR; and so on (see to_error_code()).
   *
   * @param config
   *        See Engine.
   * @param task_engine
   *        See Engine.
   * @param on_receive
   *        See Engine.
   * @param on_done
   *        See Engine.
   * @param on_log
   *        See Engine.
   * @return See Engine.
   */
  Error_code init(const Config& config, Task_engine_ptr task_engine,
                  On_receive_func&& on_receive, On_done_func&& on_done, On_log_func&& on_log) override;

  /**
   * Implements Engine API via `ch_chirp_send_ts()`.
   *
   * @param msg
   *        See Engine.
   * @param on_done
   *        See Engine.
   * @return See Engine.
   */
  Error_code send(Wire_message_ptr msg, On_send_done_func&& on_done) override;

  /**
   * Implements Engine API via `ch_chirp_release_msg_slot_ts()`.
   *
   * @param msg
   *        See Engine.
   * @param on_release
   *        See Engine.
   */
  void release_slot(Wire_message_ptr msg, On_release_func&& on_release) override;

  /// Implements Engine API via `ch_chirp_close_ts()`.
  void close() override;

  /**
   * Implements Engine API.
   * @return See Engine.
   */
  const util::Identity& identity() const override;

  /**
   * Maps a native libchirp result to our error code.  `CH_SUCCESS` maps to success.
   *
   * @param native_code
   *        The native result.
   * @return See above.
   */
  static Error_code to_error_code(ch_error_t native_code);

private:
  // Friends.

  // Friend of Libchirp_engine: For access to our internals.
  friend std::ostream& operator<<(std::ostream& os, const Libchirp_engine& val);

  // Types.

  /// One send() not yet completed.  Its address is the native message's `user_data`.
  struct Outbound
  {
    /// The message being sent; its header/data buffers back the native message until completion.
    Wire_message_ptr m_msg;
    /// Completion callback.
    On_send_done_func m_on_done;
    /// The native message.
    ch_message_t m_native;
  };

  /// Key of a release in progress: identity and serial, as libchirp reports them on completion.
  using Release_key = std::pair<util::Identity, uint32_t>;

  /// Engine states.
  enum class State
  {
    /// init() not called, or it failed with error::Code::S_RESOURCE_ERROR.
    S_NOT_STARTED,
    /// Thread N is running libchirp.
    S_RUNNING,
    /// close() (or a failed init()) is being torn down.
    S_CLOSING,
    /// `on_done` was invoked.
    S_DONE
  };

  // Methods.

  /**
   * Fills the native config from #m_config.  Its string pointers point into #m_config.
   *
   * @param native_config
   *        Destination.
   */
  void to_native_config(ch_config_t* native_config) const;

  /**
   * Starts thread N, which runs the libuv loop until libchirp has shut down, closes it, and posts finish().
   */
  void start_native_thread();

  /// Thread W: completes whatever libchirp left uncompleted, then invokes `on_done`.
  void finish();

  /**
   * Thread W: completes a send.
   *
   * @param outbound
   *        Key into #m_in_flight.
   * @param serial
   *        Serial libchirp stamped on it.
   * @param native_code
   *        Result.
   */
  void complete_send(Outbound* outbound, uint32_t serial, ch_error_t native_code);

  /**
   * Thread W: completes a release.
   *
   * @param key
   *        Released message's identity and serial.
   */
  void complete_release(const Release_key& key);

  /**
   * Thread W: reports a diagnostic line through `on_log` and our own log.
   *
   * @param msg
   *        The line.
   * @param is_error
   *        See Engine::On_log_func.
   */
  void diag(util::String_view msg, bool is_error);

  /// Native callback, thread N: a message was received.
  static void on_native_receive(ch_chirp_t* chirp, ch_message_t* msg);

  /// Native callback, thread N: libchirp has shut down.
  static void on_native_done(ch_chirp_t* chirp);

  /// Native callback, thread N (or W, during `ch_chirp_init()`): a log line.
  static void on_native_log(char msg[], char error);

  /// Native callback, thread N: a send completed.
  static void on_native_send(ch_chirp_t* chirp, ch_message_t* msg, ch_error_t status);

  /// Native callback, thread N: a release completed.
  static void on_native_release(ch_chirp_t* chirp, uint8_t identity[CH_ID_SIZE], uint32_t serial);

  // Data.

  /// Thread W's task engine.
  Task_engine_ptr m_task_engine;

  /// Configuration, copied in init().  Immutable thereafter.
  Config m_config;

  /// This node's identity, as libchirp reports it after init().
  util::Identity m_identity;

  /// See Engine::init().
  On_receive_func m_on_receive;

  /// See Engine::init().
  On_done_func m_on_done;

  /// See Engine::init().
  On_log_func m_on_log;

  /// Current state.
  State m_state;

  /// Whether util::engine_attached() succeeded (to be undone in finish()).
  bool m_attached;

  /// Sends not yet completed.
  std::map<Outbound*, boost::movelib::unique_ptr<Outbound>> m_in_flight;

  /// Received messages whose native counterpart is not yet released.
  std::map<Wire_message_ptr, ch_message_t*> m_natives;

  /// Releases in progress.
  std::multimap<Release_key, On_release_func> m_releases;

  /// The native libuv loop run by thread N.
  uv_loop_t m_uv_loop;

  /// The native chirp object.
  ch_chirp_t m_chirp;

  /// Thread N.  Null until init().
  boost::movelib::unique_ptr<flow::async::Single_thread_task_loop> m_native_thread;
}; // class Libchirp_engine

// Free functions.

/**
 * Prints string representation of the given engine to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Libchirp_engine& val);

} // namespace chirp::engine
