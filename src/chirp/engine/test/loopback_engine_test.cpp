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

#include "chirp/engine/loopback_engine.hpp"
#include "chirp/engine/config.hpp"
#include "chirp/engine/wire_message.hpp"
#include "chirp/loop/event_loop.hpp"
#include "chirp/error.hpp"
#include "chirp/test/test_logger.hpp"
#include "chirp/test/test_common_util.hpp"
#include <gtest/gtest.h>
#include <boost/shared_ptr.hpp>
#include <boost/make_shared.hpp>
#include <boost/thread/future.hpp>
#include <vector>

namespace chirp::engine::test
{

namespace
{
using chirp::test::Test_logger;
using chirp::test::get_test_suite_name;
using chirp::test::next_test_port;
using chirp::test::make_test_config;
using chirp::test::wait_until;
using boost::chrono::seconds;

/**
 * One Loopback_engine driven directly on an Event_loop, recording everything it reports.  Recording happens in
 * thread W into a shared #Record, so callbacks arriving after the harness is gone are harmless; tests read it via
 * on_loop().
 */
class Engine_harness
{
public:
  struct Record
  {
    size_t m_n_done = 0;
    std::vector<Wire_message_ptr> m_received;
    std::vector<Error_code> m_send_results;
    std::vector<uint32_t> m_released;
    std::vector<std::string> m_errors;
  };

  Engine_harness(flow::log::Logger* logger_ptr, loop::Event_loop* loop, const Config& config) :
    m_loop(loop),
    m_engine(logger_ptr),
    m_config(config),
    m_rec(boost::make_shared<Record>())
  {
    // Nothing else.
  }

  ~Engine_harness()
  {
    if (m_bound)
    {
      close();
    }
  }

  /// Runs `func` in thread W and waits for it.
  template<typename Func>
  void on_loop(const Func& func)
  {
    boost::promise<void> done;
    m_loop->post([&]()
    {
      func();
      done.set_value();
    });
    done.get_future().wait();
  }

  /// Number of `on_done` reports so far.
  size_t n_done()
  {
    size_t n;
    on_loop([&]() { n = m_rec->m_n_done; });
    return n;
  }

  Error_code init()
  {
    const auto rec = m_rec;
    Error_code result;
    on_loop([&]()
    {
      result = m_engine.init(m_config, m_loop->task_engine(),
                             [rec](Wire_message_ptr msg) { rec->m_received.push_back(msg); },
                             [rec]() { ++rec->m_n_done; },
                             [rec](util::String_view msg, bool is_error)
      {
        if (is_error)
        {
          rec->m_errors.emplace_back(msg);
        }
      });
    });
    m_bound = m_bound || (!result);
    return result;
  }

  /// Sends; returns immediate result; completion is recorded in Record::m_send_results.
  Error_code send(uint16_t port, const std::string& data, const std::string& address = "127.0.0.1")
  {
    auto msg = boost::make_shared<Wire_message>();
    msg->m_identity = util::random_identity();
    msg->m_address = util::parse_address(address);
    msg->m_port = port;
    msg->m_data = data;

    const auto rec = m_rec;
    Error_code result;
    on_loop([&]()
    {
      result = m_engine.send(msg, [rec](Wire_message_ptr, const Error_code& err_code)
      {
        rec->m_send_results.push_back(err_code);
      });
    });
    return result;
  }

  void release(const Wire_message_ptr& msg)
  {
    const auto rec = m_rec;
    on_loop([&]()
    {
      m_engine.release_slot(msg, [rec](const util::Identity&, uint32_t serial) { rec->m_released.push_back(serial); });
    });
  }

  /// Closes and waits for `on_done`.
  void close()
  {
    const auto n_done_before = n_done();
    on_loop([&]() { m_engine.close(); });
    EXPECT_TRUE(wait_until([&]() { return n_done() > n_done_before; }, seconds(5)));
    m_bound = false;
  }

  size_t n_send_results()
  {
    size_t n;
    on_loop([&]() { n = m_rec->m_send_results.size(); });
    return n;
  }

  size_t n_received()
  {
    size_t n;
    on_loop([&]() { n = m_rec->m_received.size(); });
    return n;
  }

  loop::Event_loop* const m_loop;
  Loopback_engine m_engine;
  const Config m_config;
  const boost::shared_ptr<Record> m_rec;
  bool m_bound = false;
}; // class Engine_harness

} // Anonymous namespace

TEST(Loopback_engine, Init_errors)
{
  Test_logger logger;
  loop::Event_loop loop(&logger, get_test_suite_name());

  {
    // Bad config.
    auto config = make_test_config(next_test_port());
    config.m_max_slots = 40;
    Engine_harness engine(&logger, &loop, config);
    EXPECT_EQ(engine.init(), error::Code::S_VALUE_ERROR);
    EXPECT_TRUE(wait_until([&]() { return engine.n_done() == 1; }, seconds(5)));
    engine.on_loop([&]() { EXPECT_FALSE(engine.m_rec->m_errors.empty()); });
  }
  {
    // Certificate file that is not there.
    auto config = make_test_config(next_test_port());
    config.m_disable_encryption = false;
    config.m_cert_chain_pem = "/nonexistent/chirp_cert.pem";
    Engine_harness engine(&logger, &loop, config);
    EXPECT_EQ(engine.init(), error::Code::S_TLS_ERROR);
    EXPECT_TRUE(util::is_null(engine.m_engine.identity()));
  }
  {
    // Port taken.
    const auto config = make_test_config(next_test_port());
    Engine_harness engine1(&logger, &loop, config);
    Engine_harness engine2(&logger, &loop, config);
    EXPECT_FALSE(engine1.init());
    EXPECT_FALSE(util::is_null(engine1.m_engine.identity()));
    EXPECT_EQ(engine2.init(), error::Code::S_ADDRESS_IN_USE);
    engine1.close();

    // Free again after close.
    Engine_harness engine3(&logger, &loop, config);
    EXPECT_FALSE(engine3.init());
  }
  {
    // Double init; send before init.
    const auto config = make_test_config(next_test_port());
    Engine_harness engine(&logger, &loop, config);
    EXPECT_EQ(engine.send(config.m_port, "x"), error::Code::S_NOT_INITIALIZED);
    EXPECT_TRUE(util::is_null(engine.m_engine.identity()));
    EXPECT_FALSE(engine.init());
    EXPECT_EQ(engine.init(), error::Code::S_INIT_FAIL);
    EXPECT_TRUE(wait_until([&]() { return engine.n_done() == 1; }, seconds(5)));
    // The first init stands: still bound; the dtor closes it.
  }
  {
    // Configured identity is used.
    auto config = make_test_config(next_test_port());
    config.m_identity = util::random_identity();
    Engine_harness engine(&logger, &loop, config);
    EXPECT_FALSE(engine.init());
    EXPECT_EQ(engine.m_engine.identity(), config.m_identity);
  }

  loop.stop();
}

TEST(Loopback_engine, Send_errors)
{
  Test_logger logger;
  loop::Event_loop loop(&logger, get_test_suite_name());

  auto config_a = make_test_config(next_test_port());
  auto config_b = make_test_config(next_test_port());
  config_b.m_max_msg_size = 4;
  Engine_harness a(&logger, &loop, config_a);
  Engine_harness b(&logger, &loop, config_b);
  ASSERT_FALSE(a.init());
  ASSERT_FALSE(b.init());

  // Nobody there.
  EXPECT_FALSE(a.send(next_test_port(), "x"));
  // Port 0: refused outright.
  EXPECT_EQ(a.send(0, "x"), error::Code::S_VALUE_ERROR);
  // Not an address of b.
  EXPECT_FALSE(a.send(config_b.m_port, "x", "10.1.2.3"));
  // Too big for b.
  EXPECT_FALSE(a.send(config_b.m_port, "12345"));

  ASSERT_TRUE(wait_until([&]() { return a.n_send_results() == 3; }, seconds(5)));
  a.on_loop([&]()
  {
    EXPECT_EQ(a.m_rec->m_send_results[0], error::Code::S_CANNOT_CONNECT);
    EXPECT_EQ(a.m_rec->m_send_results[1], error::Code::S_CANNOT_CONNECT);
    EXPECT_EQ(a.m_rec->m_send_results[2], error::Code::S_VALUE_ERROR);
  });
  EXPECT_EQ(b.n_received(), 0u);

  a.close();
  b.close();
  loop.stop();
}

TEST(Loopback_engine, Synchronous_mode_acks_on_release)
{
  Test_logger logger;
  loop::Event_loop loop(&logger, get_test_suite_name());

  const auto config_a = make_test_config(next_test_port());
  const auto config_b = make_test_config(next_test_port());
  Engine_harness a(&logger, &loop, config_a);
  Engine_harness b(&logger, &loop, config_b);
  ASSERT_FALSE(a.init());
  ASSERT_FALSE(b.init());

  EXPECT_FALSE(a.send(config_b.m_port, "one"));
  EXPECT_FALSE(a.send(config_b.m_port, "two"));
  ASSERT_TRUE(wait_until([&]() { return b.n_received() == 1; }, seconds(5)));

  // One at a time; and not done until released.
  Wire_message_ptr first;
  b.on_loop([&]() { first = b.m_rec->m_received.front(); });
  EXPECT_EQ(first->m_data, "one");
  EXPECT_TRUE(first->m_has_slot);
  EXPECT_EQ(first->m_port, config_a.m_port);
  EXPECT_TRUE(first->m_address.is_loopback());
  EXPECT_EQ(first->m_remote_identity, a.m_engine.identity());
  EXPECT_EQ(a.n_send_results(), 0u);

  b.release(first);
  ASSERT_TRUE(wait_until([&]() { return b.n_received() == 2; }, seconds(5)));
  EXPECT_EQ(a.n_send_results(), 1u);
  b.on_loop([&]()
  {
    EXPECT_EQ(b.m_rec->m_received[1]->m_data, "two");
    EXPECT_EQ(b.m_rec->m_released.size(), 1u);
    EXPECT_EQ(b.m_rec->m_released.front(), first->m_serial);
    EXPECT_EQ(b.m_rec->m_received[1]->m_serial, first->m_serial + 1);
  });

  // Releasing again: no-op, but still reported.
  b.release(first);
  ASSERT_TRUE(wait_until([&]()
  {
    bool ok;
    b.on_loop([&]() { ok = b.m_rec->m_released.size() == 2; });
    return ok;
  }, seconds(5)));

  // Receiver closes holding "two": sender learns of it.
  b.close();
  ASSERT_TRUE(wait_until([&]() { return a.n_send_results() == 2; }, seconds(5)));
  a.on_loop([&]()
  {
    EXPECT_FALSE(a.m_rec->m_send_results[0]);
    EXPECT_EQ(a.m_rec->m_send_results[1], error::Code::S_WRITE_ERROR);
  });

  a.close();
  loop.stop();
}

TEST(Loopback_engine, Asynchronous_mode_slots)
{
  Test_logger logger;
  loop::Event_loop loop(&logger, get_test_suite_name());

  auto config_a = make_test_config(next_test_port());
  auto config_b = make_test_config(next_test_port());
  config_a.m_synchronous = false;
  config_b.m_synchronous = false;
  config_b.m_max_slots = 2;
  Engine_harness a(&logger, &loop, config_a);
  Engine_harness b(&logger, &loop, config_b);
  ASSERT_FALSE(a.init());
  ASSERT_FALSE(b.init());

  for (int idx = 0; idx != 3; ++idx)
  {
    EXPECT_FALSE(a.send(config_b.m_port, "m"));
  }

  // Two get slots (and are done, being delivered); the third waits for one.
  ASSERT_TRUE(wait_until([&]() { return a.n_send_results() == 2; }, seconds(5)));
  EXPECT_EQ(b.n_received(), 2u);

  Wire_message_ptr first;
  b.on_loop([&]() { first = b.m_rec->m_received.front(); });
  b.release(first);
  ASSERT_TRUE(wait_until([&]() { return b.n_received() == 3; }, seconds(5)));
  ASSERT_TRUE(wait_until([&]() { return a.n_send_results() == 3; }, seconds(5)));

  a.close();
  b.close();
  loop.stop();
}

TEST(Loopback_engine, Send_timeout_and_shutdown)
{
  Test_logger logger;
  loop::Event_loop loop(&logger, get_test_suite_name());

  const auto config_a = make_test_config(next_test_port(), 0.3f);
  const auto config_b = make_test_config(next_test_port());
  Engine_harness a(&logger, &loop, config_a);
  Engine_harness b(&logger, &loop, config_b);
  ASSERT_FALSE(a.init());
  ASSERT_FALSE(b.init());

  // b never releases; synchronous a times out.
  EXPECT_FALSE(a.send(config_b.m_port, "one"));
  ASSERT_TRUE(wait_until([&]() { return a.n_send_results() == 1; }, seconds(5)));
  a.on_loop([&]() { EXPECT_EQ(a.m_rec->m_send_results[0], error::Code::S_TIMEOUT); });

  // b still holds (its only slot for) the first; so the second stays in flight until a closes, failing it.
  EXPECT_FALSE(a.send(config_b.m_port, "two"));
  a.close();
  a.on_loop([&]()
  {
    ASSERT_EQ(a.m_rec->m_send_results.size(), 2u);
    EXPECT_EQ(a.m_rec->m_send_results[1], error::Code::S_SHUTDOWN);
  });

  b.close();
  loop.stop();
}

} // namespace chirp::engine::test
