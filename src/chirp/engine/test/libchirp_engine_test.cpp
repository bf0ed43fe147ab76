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

#include "chirp/engine/libchirp_engine.hpp"
#include "chirp/session/session.hpp"
#include "chirp/loop/event_loop.hpp"
#include "chirp/error.hpp"
#include "chirp/test/test_logger.hpp"
#include "chirp/test/test_common_util.hpp"
#include <gtest/gtest.h>
#include <boost/move/make_unique.hpp>

namespace chirp::engine::test
{

namespace
{
using chirp::test::Test_logger;
using chirp::test::Msg_collector;
using chirp::test::get_test_suite_name;
using chirp::test::next_test_port;
using chirp::test::make_test_config;
using boost::chrono::seconds;

Engine_ptr make_native_engine(flow::log::Logger* logger_ptr)
{
  return Engine_ptr(boost::movelib::make_unique<Libchirp_engine>(logger_ptr));
}

session::Message_ptr make_msg(uint16_t port, util::String_view data)
{
  const auto msg = session::Message::create();
  msg->set_data(data);
  msg->set_address("127.0.0.1");
  msg->set_port(port);
  return msg;
}

} // Anonymous namespace

TEST(Libchirp_engine, Error_mapping)
{
  EXPECT_FALSE(Libchirp_engine::to_error_code(CH_SUCCESS));
  EXPECT_FALSE(Libchirp_engine::to_error_code(CH_QUEUED));
  EXPECT_EQ(Libchirp_engine::to_error_code(CH_UV_ERROR), error::Code::S_LOOP_ERROR);
  EXPECT_EQ(Libchirp_engine::to_error_code(CH_EADDRINUSE), error::Code::S_ADDRESS_IN_USE);
  EXPECT_EQ(Libchirp_engine::to_error_code(CH_ENOMEM), error::Code::S_RESOURCE_ERROR);
  EXPECT_EQ(Libchirp_engine::to_error_code(CH_TIMEOUT), error::Code::S_TIMEOUT);
  EXPECT_EQ(Libchirp_engine::to_error_code(CH_USED), error::Code::S_MSG_STILL_SENDING);
  EXPECT_EQ(Libchirp_engine::to_error_code(CH_FATAL), error::Code::S_FATAL);
}

TEST(Libchirp_engine, Send_and_release_over_localhost)
{
  Test_logger logger;
  loop::Event_loop loop(&logger, get_test_suite_name());
  Msg_collector b_msgs;
  const auto config_a = make_test_config(next_test_port());
  const auto config_b = make_test_config(next_test_port());
  session::Session a(&logger, &loop, config_a, make_native_engine(&logger));
  session::Session b(&logger, &loop, config_b, make_native_engine(&logger), b_msgs.handler());
  EXPECT_EQ(a.state(), session::Session::State::S_READY);
  EXPECT_NE(a.identity(), b.identity());

  const auto msg = make_msg(config_b.m_port, "ping");
  msg->set_header("hdr");
  const auto sent = a.send(msg);
  ASSERT_TRUE(b_msgs.wait_for_count(1, seconds(10)));

  const auto received = b_msgs.msgs().front();
  EXPECT_EQ(received->identity(), msg->identity());
  EXPECT_EQ(received->header(), "hdr");
  EXPECT_EQ(received->data(), "ping");
  EXPECT_EQ(received->address(), "127.0.0.1");
  EXPECT_EQ(received->remote_identity(), a.identity());
  EXPECT_TRUE(received->has_slot());

  const auto key = received->release_slot().get();
  ASSERT_TRUE(key);
  EXPECT_EQ(key->m_identity, msg->identity());
  EXPECT_EQ(sent.get(), msg);
  EXPECT_EQ(msg->serial(), received->serial());

  Error_code err_code;
  a.stop(&err_code);
  EXPECT_FALSE(err_code);
  b.stop(&err_code);
  EXPECT_FALSE(err_code);
  loop.stop();
}

TEST(Libchirp_engine, Request_reply_over_localhost)
{
  Test_logger logger;
  loop::Event_loop loop(&logger, get_test_suite_name());
  const auto config_a = make_test_config(next_test_port());
  const auto config_b = make_test_config(next_test_port());
  session::Session* b_ptr = nullptr;
  session::Session a(&logger, &loop, config_a, make_native_engine(&logger));
  session::Session b(&logger, &loop, config_b, make_native_engine(&logger), [&b_ptr](session::Message_ptr msg)
  {
    msg->set_data("re:" + msg->data());
    b_ptr->send(msg);
    msg->release_slot();
  });
  b_ptr = &b;

  const auto reply_future = a.request(make_msg(config_b.m_port, "ping"));
  ASSERT_TRUE(reply_future.wait_for(seconds(10)));
  const auto reply = reply_future.get();
  EXPECT_EQ(reply->data(), "re:ping");
  EXPECT_EQ(reply->remote_identity(), b.identity());

  a.stop();
  b.stop();
  loop.stop();
}

TEST(Libchirp_engine, Port_in_use)
{
  Test_logger logger;
  loop::Event_loop loop(&logger, get_test_suite_name());
  const auto config = make_test_config(next_test_port());
  session::Session a(&logger, &loop, config, make_native_engine(&logger));
  Error_code err_code;
  {
    session::Session b(&logger, &loop, config, make_native_engine(&logger), session::Session::On_receive_func(),
                       &err_code);
  }
  EXPECT_EQ(err_code, error::Code::S_ADDRESS_IN_USE);
  a.stop();
  loop.stop();
}

} // namespace chirp::engine::test
