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

#include "chirp/adapter/queue_session.hpp"
#include "chirp/adapter/pool_session.hpp"
#include "chirp/adapter/callback_session.hpp"
#include "chirp/loop/event_loop.hpp"
#include "chirp/error.hpp"
#include "chirp/test/test_logger.hpp"
#include "chirp/test/test_common_util.hpp"
#include <gtest/gtest.h>
#include <flow/async/single_thread_task_loop.hpp>
#include <boost/thread/thread.hpp>
#include <atomic>

namespace chirp::adapter::test
{

namespace
{
using chirp::test::Test_logger;
using chirp::test::get_test_suite_name;
using chirp::test::next_test_port;
using chirp::test::make_test_config;
using chirp::test::make_loopback_engine;
using chirp::test::wait_until;
using chirp::test::error_of;
using session::Message;
using session::Message_ptr;
using session::Session;
using boost::chrono::seconds;
using boost::chrono::milliseconds;

Message_ptr make_msg(uint16_t port, util::String_view data)
{
  const auto msg = Message::create();
  msg->set_data(data);
  msg->set_address("127.0.0.1");
  msg->set_port(port);
  return msg;
}

} // Anonymous namespace

TEST(Queue_session, Get_and_release)
{
  Test_logger logger;
  loop::Event_loop loop(&logger, get_test_suite_name());
  auto config_a = make_test_config(next_test_port());
  const auto config_q = make_test_config(next_test_port());
  config_a.m_synchronous = false;
  Session a(&logger, &loop, config_a, make_loopback_engine(&logger));
  Queue_session q(&logger, &loop, config_q, make_loopback_engine(&logger));
  EXPECT_FALSE(util::is_null(q.identity()));
  EXPECT_TRUE(q.empty());
  EXPECT_FALSE(q.try_get());
  EXPECT_FALSE(q.get(milliseconds(50)));

  const auto sent1 = a.send(make_msg(config_q.m_port, "one"));
  const auto sent2 = a.send(make_msg(config_q.m_port, "two"));

  // The receiver is synchronous: one slot; the second waits for it.
  const auto msg1 = q.get();
  ASSERT_TRUE(msg1);
  EXPECT_EQ(msg1->data(), "one");
  EXPECT_TRUE(msg1->has_slot());
  EXPECT_FALSE(q.get(milliseconds(100)));

  // Nothing is released on our behalf.
  EXPECT_EQ(q.session().unreleased_count(), 1u);
  ASSERT_TRUE(q.release_slot(msg1).get());
  const auto msg2 = q.get(seconds(5));
  ASSERT_TRUE(msg2);
  EXPECT_EQ(msg2->data(), "two");
  ASSERT_TRUE(msg2->release_slot().get());

  EXPECT_FALSE(error_of(sent1));
  EXPECT_FALSE(error_of(sent2));

  // Disabled: released and dropped on arrival.
  q.set_disable_queue(true);
  EXPECT_FALSE(error_of(a.send(make_msg(config_q.m_port, "three"))));
  EXPECT_TRUE(wait_until([&]() { return q.session().unreleased_count() == 0; }, seconds(5)));
  EXPECT_TRUE(q.empty());
  q.set_disable_queue(false);

  // A get()ter blocked at stop() time wakes up empty-handed.
  std::atomic<bool> woke(false);
  boost::thread getter([&]()
  {
    EXPECT_FALSE(q.get());
    woke = true;
  });
  boost::this_thread::sleep_for(milliseconds(50));
  EXPECT_FALSE(woke.load());

  Error_code err_code;
  q.stop(&err_code);
  EXPECT_FALSE(err_code);
  getter.join();
  EXPECT_TRUE(woke.load());
  EXPECT_EQ(q.session().state(), Session::State::S_STOPPED);

  q.send(make_msg(config_a.m_port, "x"), &err_code);
  EXPECT_EQ(err_code, error::Code::S_SESSION_NOT_READY);

  a.stop();
  loop.stop();
}

TEST(Queue_session, Request_through_adapter)
{
  Test_logger logger;
  loop::Event_loop loop(&logger, get_test_suite_name());
  const auto config_a = make_test_config(next_test_port());
  const auto config_b = make_test_config(next_test_port());
  Queue_session a(&logger, &loop, config_a, make_loopback_engine(&logger));
  Queue_session b(&logger, &loop, config_b, make_loopback_engine(&logger));

  const auto msg = make_msg(config_b.m_port, "ping");
  const auto reply_future = a.request(msg);

  // Answer from this thread.
  const auto at_b = b.get(seconds(5));
  ASSERT_TRUE(at_b);
  at_b->set_data("pong");
  const auto reply_sent = b.send(at_b);
  b.release_slot(at_b);

  const auto reply = reply_future.get();
  EXPECT_EQ(reply->data(), "pong");
  EXPECT_EQ(reply->identity(), msg->identity());
  EXPECT_FALSE(error_of(reply_sent));

  // The reply went to the request, not the queue.
  EXPECT_TRUE(a.empty());

  // Failure to start.
  Error_code err_code;
  Queue_session c(&logger, &loop, config_a, make_loopback_engine(&logger), false, &err_code);
  EXPECT_EQ(err_code, error::Code::S_ADDRESS_IN_USE);

  a.stop();
  b.stop();
  loop.stop();
}

TEST(Pool_session, Handlers_on_workers)
{
  Test_logger logger;
  loop::Event_loop loop(&logger, get_test_suite_name());
  const auto config_a = make_test_config(next_test_port());
  const auto config_p = make_test_config(next_test_port());
  Session a(&logger, &loop, config_a, make_loopback_engine(&logger));

  const auto test_thread_id = boost::this_thread::get_id();
  std::atomic<size_t> n_handled(0);
  std::atomic<bool> had_slot(true);
  std::atomic<bool> wrong_thread(false);
  Pool_session p(&logger, &loop, config_p, make_loopback_engine(&logger),
                 [&](Message_ptr msg)
  {
    wrong_thread = wrong_thread || (boost::this_thread::get_id() == test_thread_id) || loop.in_loop_thread();
    had_slot = had_slot && msg->has_slot();
    ++n_handled;
  }, 2);

  // Synchronous sender: each send completes only once the handler returned and the slot was auto-released.
  for (int idx = 0; idx != 5; ++idx)
  {
    EXPECT_FALSE(error_of(a.send(make_msg(config_p.m_port, "x"))));
  }
  EXPECT_EQ(n_handled.load(), 5u);
  EXPECT_TRUE(had_slot.load());
  EXPECT_FALSE(wrong_thread.load());
  EXPECT_TRUE(wait_until([&]() { return p.session().unreleased_count() == 0; }, seconds(5)));

  Error_code err_code;
  p.stop(&err_code);
  EXPECT_FALSE(err_code);
  a.stop();
  loop.stop();
}

TEST(Pool_session, Manual_release)
{
  Test_logger logger;
  loop::Event_loop loop(&logger, get_test_suite_name());
  const auto config_a = make_test_config(next_test_port());
  auto config_p = make_test_config(next_test_port());
  config_p.m_auto_release = false;
  Session a(&logger, &loop, config_a, make_loopback_engine(&logger));

  chirp::test::Msg_collector handled;
  Pool_session p(&logger, &loop, config_p, make_loopback_engine(&logger), handled.handler());

  const auto sent = a.send(make_msg(config_p.m_port, "x"));
  ASSERT_TRUE(handled.wait_for_count(1, seconds(5)));
  const auto msg = handled.msgs().front();

  // Handler returned; still held.
  EXPECT_FALSE(sent.wait_for(milliseconds(100)) == boost::future_status::ready);
  EXPECT_TRUE(msg->has_slot());
  ASSERT_TRUE(p.release_slot(msg).get());
  EXPECT_FALSE(error_of(sent));

  p.stop();
  a.stop();
  loop.stop();
}

TEST(Callback_session, Handler_on_user_loop)
{
  Test_logger logger;
  loop::Event_loop loop(&logger, get_test_suite_name());
  const auto config_a = make_test_config(next_test_port());
  const auto config_c = make_test_config(next_test_port());
  Session a(&logger, &loop, config_a, make_loopback_engine(&logger));

  flow::async::Single_thread_task_loop user_loop(&logger, "user_loop");
  boost::thread::id user_thread_id;
  user_loop.start([&]() { user_thread_id = boost::this_thread::get_id(); });

  std::atomic<size_t> n_handled(0);
  std::atomic<bool> wrong_thread(false);
  std::string last_data; // Touched only in user_loop thread (and after it stops).
  Callback_session c(&logger, &loop, config_c, make_loopback_engine(&logger), &user_loop,
                     [&](Message_ptr msg)
  {
    wrong_thread = wrong_thread || (boost::this_thread::get_id() != user_thread_id);
    last_data = msg->data();
    ++n_handled;
  });

  EXPECT_FALSE(error_of(a.send(make_msg(config_c.m_port, "one"))));
  EXPECT_FALSE(error_of(a.send(make_msg(config_c.m_port, "two"))));
  EXPECT_EQ(n_handled.load(), 2u);
  EXPECT_FALSE(wrong_thread.load());

  // Requests from the callback session are correlated as usual.
  {
    chirp::test::Msg_collector b_msgs;
    Session b(&logger, &loop, make_test_config(next_test_port()), make_loopback_engine(&logger),
              b_msgs.handler());
    const auto msg = make_msg(b.config().m_port, "ping");
    const auto reply_future = c.request(msg);
    ASSERT_TRUE(b_msgs.wait_for_count(1, seconds(5)));
    const auto at_b = b_msgs.msgs().front();
    at_b->set_data("pong");
    const auto reply_sent = b.send(at_b);
    at_b->release_slot();
    EXPECT_EQ(reply_future.get()->data(), "pong");
    EXPECT_FALSE(error_of(reply_sent));
    EXPECT_EQ(n_handled.load(), 2u); // Reply went to the request.
    b.stop();
  }

  c.stop();
  user_loop.stop();
  EXPECT_EQ(last_data, "two");
  a.stop();
  loop.stop();
}

} // namespace chirp::adapter::test
