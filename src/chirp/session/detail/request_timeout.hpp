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
#include <flow/log/log.hpp>
#include <flow/util/util.hpp>
#include <boost/enable_shared_from_this.hpp>

namespace chirp::session::detail
{

// Types.

/**
 * One-shot timer guarding one request: fires its handler once after the configured timeout unless disarm()ed
 * first.  Exactly one of {fire, disarm} wins; the loser is a no-op.
 *
 * Lives in thread W: construct anywhere, but arm(), disarm(), and destruction must be in thread W.  The timer
 * completion handler holds only a weak reference to `*this`, so destroying `*this` while an expiry is queued is
 * safe.
 */
class Request_timeout :
  public flow::log::Log_context,
  public boost::enable_shared_from_this<Request_timeout>,
  private boost::noncopyable
{
public:
  // Types.

  /// Short-hand for the handler to invoke on expiry.
  using On_fire_func = Function<void ()>;

  // Constructors/destructor.

  /**
   * Constructs the timer, not armed.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   * @param task_engine
   *        Thread W's task engine.
   * @param timeout
   *        Delay from arm() to firing.
   * @param on_fire_func
   *        Handler invoked (in thread W) upon firing.
   */
  explicit Request_timeout(flow::log::Logger* logger_ptr, util::Task_engine& task_engine,
                           util::Fine_duration timeout, On_fire_func&& on_fire_func);

  // Methods.

  /// Starts the countdown.  Must be called at most once, after construction via `make_shared()`.
  void arm();

  /**
   * Prevents the handler from firing, unless it already has.
   *
   * @return `true` if this call won (handler has not fired and now never will); `false` if it had already fired
   *         or been disarmed.
   */
  bool disarm();

  /**
   * Whether it has fired or been disarmed.
   * @return See above.
   */
  bool done() const;

private:
  // Methods.

  /**
   * Timer completion handler.
   *
   * @param sys_err_code
   *        Timer result.
   */
  void on_timer(const Error_code& sys_err_code);

  // Data.

  /// The underlying timer.
  flow::util::Timer m_timer;

  /// See ctor.
  const util::Fine_duration m_timeout;

  /// See ctor.
  On_fire_func m_on_fire_func;

  /// Latch: set by the first of {fire, disarm}.
  bool m_done;
}; // class Request_timeout

} // namespace chirp::session::detail
