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

#include "chirp/test/test_common_util.hpp"
#include "chirp/engine/loopback_engine.hpp"
#include <gtest/gtest.h>
#include <boost/move/make_unique.hpp>
#include <boost/thread/thread.hpp>
#include <atomic>

using std::string;

namespace chirp::test
{

string get_test_suite_name()
{
  const auto* test_info = ::testing::UnitTest::GetInstance()->current_test_info();
  return test_info ? (string(test_info->test_suite_name()) + '.' + test_info->name()) : string("no_test");
}

uint16_t next_test_port()
{
  // Stay clear of the default port, in case something real listens there.
  static std::atomic<uint16_t> s_next_port(2992);
  return s_next_port++;
}

session::Config make_test_config(uint16_t port, float timeout_secs)
{
  session::Config config;
  config.m_port = port;
  config.m_timeout = timeout_secs;
  config.m_disable_encryption = true;
  return config;
}

engine::Engine_ptr make_loopback_engine(flow::log::Logger* logger_ptr)
{
  return engine::Engine_ptr(boost::movelib::make_unique<engine::Loopback_engine>(logger_ptr));
}

bool wait_until(const std::function<bool()>& condition, util::Fine_duration timeout)
{
  const auto deadline = flow::Fine_clock::now() + timeout;
  while (!condition())
  {
    if (flow::Fine_clock::now() >= deadline)
    {
      return false;
    }
    boost::this_thread::sleep_for(boost::chrono::milliseconds(5));
  }
  return true;
}

session::Session::On_receive_func Msg_collector::handler()
{
  return [this](session::Message_ptr msg) { add(std::move(msg)); };
}

void Msg_collector::add(session::Message_ptr msg)
{
  {
    flow::util::Lock_guard<flow::util::Mutex_non_recursive> lock(m_mutex);
    m_msgs.emplace_back(std::move(msg));
  }
  m_cond.notify_all();
}

bool Msg_collector::wait_for_count(size_t n, util::Fine_duration timeout)
{
  flow::util::Lock_guard<flow::util::Mutex_non_recursive> lock(m_mutex);
  return m_cond.wait_for(lock, timeout, [&]() { return m_msgs.size() >= n; });
}

std::vector<session::Message_ptr> Msg_collector::msgs() const
{
  flow::util::Lock_guard<flow::util::Mutex_non_recursive> lock(m_mutex);
  return m_msgs;
}

} // namespace chirp::test
