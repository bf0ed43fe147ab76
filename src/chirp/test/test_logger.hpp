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

#pragma once

#include <flow/log/simple_ostream_logger.hpp>
#include <chirp/common.hpp>
#include "chirp/test/test_config.hpp"
#include <atomic>

namespace chirp::test
{

/**
 * Logger used by the tests: prints to console at or above the given severity (chirp and Flow component names
 * registered), and independently counts every message logged at WARNING or worse, whether printed or not.  Tests
 * use the count to check that a misuse (say, a slot never released) was reported and not merely tolerated.
 */
class Test_logger :
  public flow::log::Logger
{
public:
  /**
   * Constructor.
   *
   * @param min_severity Lowest severity printed to console.
   */
  Test_logger(const flow::log::Sev& min_severity = Test_config::get_singleton().m_sev) :
    m_config(min_severity),
    m_console(&m_config),
    m_n_warnings(0)
  {
    using flow::log::Config;

    m_config.init_component_to_union_idx_mapping<Log_component>
      (100, Config::standard_component_payload_enum_sparse_length<Log_component>());
    m_config.init_component_names<Log_component>(S_CHIRP_LOG_COMPONENT_NAME_MAP, false, "chirp-");
    m_config.init_component_to_union_idx_mapping<flow::Flow_log_component>
      (100, Config::standard_component_payload_enum_sparse_length<flow::Flow_log_component>());
    m_config.init_component_names<flow::Flow_log_component>(flow::S_FLOW_LOG_COMPONENT_NAME_MAP, false, "flow-");
  }

  /**
   * Number of messages logged at WARNING or worse so far.
   * @return See above.
   */
  size_t n_warnings() const
  {
    return m_n_warnings;
  }

  /// Everything at WARNING or worse passes (to be counted); the rest as the console config says.
  bool should_log(flow::log::Sev sev, const flow::log::Component& component) const override
  {
    return is_warning(sev) || m_console.should_log(sev, component);
  }

  /// Same as the console Logger.
  bool logs_asynchronously() const override
  {
    return m_console.logs_asynchronously();
  }

  /// Counts; then prints, unless filtered out at the console severity.
  void do_log(flow::log::Msg_metadata* metadata, flow::util::String_view msg) override
  {
    if (is_warning(metadata->m_msg_sev))
    {
      ++m_n_warnings;
    }
    if (m_console.should_log(metadata->m_msg_sev, metadata->m_msg_component))
    {
      m_console.do_log(metadata, msg);
    }
  }

private:
  /**
   * Whether `sev` is WARNING or worse.
   *
   * @param sev Severity.
   * @return See above.
   */
  static bool is_warning(flow::log::Sev sev)
  {
    return (sev != flow::log::Sev::S_NONE) && (sev <= flow::log::Sev::S_WARNING);
  }

  /// Console logging configuration.
  flow::log::Config m_config;

  /// Console logger.
  flow::log::Simple_ostream_logger m_console;

  /// See n_warnings().
  std::atomic<size_t> m_n_warnings;
}; // class Test_logger

} // namespace chirp::test
