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

#include "chirp/engine/loopback_engine.hpp"
#include <atomic>

namespace chirp::test
{

/**
 * Engine that behaves exactly like engine::Loopback_engine, except that release_slot() does nothing at all: the
 * slot stays held at the transport and `on_release` is never invoked.  Models a transport that stops confirming
 * releases, so that Session::stop() can be driven through both of its waits.
 */
class Unconfirmed_release_engine :
  public engine::Engine
{
public:
  /**
   * Constructor.
   *
   * @param logger_ptr Logger for the underlying engine::Loopback_engine.
   */
  explicit Unconfirmed_release_engine(flow::log::Logger* logger_ptr) :
    m_engine(logger_ptr),
    m_n_releases(0)
  {
    // Nothing else.
  }

  /// Same as engine::Loopback_engine.
  Error_code init(const engine::Config& config, Task_engine_ptr task_engine,
                  On_receive_func&& on_receive, On_done_func&& on_done, On_log_func&& on_log) override
  {
    return m_engine.init(config, std::move(task_engine),
                         std::move(on_receive), std::move(on_done), std::move(on_log));
  }

  /// Same as engine::Loopback_engine.
  Error_code send(engine::Wire_message_ptr msg, On_send_done_func&& on_done) override
  {
    return m_engine.send(std::move(msg), std::move(on_done));
  }

  /// Counts the call; otherwise ignores it.
  void release_slot(engine::Wire_message_ptr, On_release_func&&) override
  {
    ++m_n_releases;
  }

  /// Same as engine::Loopback_engine.
  void close() override
  {
    m_engine.close();
  }

  /// Same as engine::Loopback_engine.
  const util::Identity& identity() const override
  {
    return m_engine.identity();
  }

  /**
   * Number of release_slot() calls ignored so far.
   * @return See above.
   */
  size_t n_releases() const
  {
    return m_n_releases;
  }

private:
  /// Does everything but releasing.
  engine::Loopback_engine m_engine;

  /// See n_releases().
  std::atomic<size_t> m_n_releases;
}; // class Unconfirmed_release_engine

} // namespace chirp::test
