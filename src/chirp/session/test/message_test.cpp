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

#include "chirp/session/message.hpp"
#include "chirp/session/session.hpp"
#include "chirp/error.hpp"
#include <gtest/gtest.h>
#include <flow/error/error.hpp>
#include <boost/unordered_set.hpp>

namespace chirp::session::test
{

TEST(Message, Defaults)
{
  const auto msg = Message::create();
  EXPECT_FALSE(util::is_null(msg->identity()));
  EXPECT_NE(msg->identity(), Message::create()->identity());
  EXPECT_EQ(msg->serial(), 0u);
  EXPECT_TRUE(msg->header().empty());
  EXPECT_TRUE(msg->data().empty());
  EXPECT_EQ(msg->address(), "0.0.0.0");
  EXPECT_EQ(msg->port(), 0);
  EXPECT_TRUE(util::is_null(msg->remote_identity()));
  EXPECT_FALSE(msg->has_slot());
}

TEST(Message, Setters)
{
  const auto msg = Message::create();
  msg->set_header("hdr");
  msg->set_data(std::string("da\0ta", 5));
  msg->set_port(2998);
  EXPECT_EQ(msg->header(), "hdr");
  EXPECT_EQ(msg->data().size(), 5u);
  EXPECT_EQ(msg->port(), 2998);

  Error_code err_code;
  msg->set_address("127.0.0.1", &err_code);
  EXPECT_FALSE(err_code);
  EXPECT_EQ(msg->address(), "127.0.0.1");
  EXPECT_TRUE(msg->ip_address().is_v4());

  // IPv6 comes back in canonical form.
  msg->set_address("0:0:0:0:0:0:0:1", &err_code);
  EXPECT_FALSE(err_code);
  EXPECT_EQ(msg->address(), "::1");
  EXPECT_TRUE(msg->ip_address().is_v6());

  // Garbage: error; address unchanged.
  msg->set_address("not.an.address", &err_code);
  EXPECT_EQ(err_code, error::Code::S_VALUE_ERROR);
  EXPECT_EQ(msg->address(), "::1");

  EXPECT_THROW(msg->set_address("1.2.3.256"), flow::error::Runtime_error);
  EXPECT_EQ(msg->address(), "::1");
}

TEST(Message, Serial_delta)
{
  EXPECT_EQ(Message::serial_delta(5, 3), 2);
  EXPECT_EQ(Message::serial_delta(3, 5), -2);
  EXPECT_EQ(Message::serial_delta(7, 7), 0);
  // Across wrap-around, the later serial is still "after."
  EXPECT_EQ(Message::serial_delta(1, 0xFFFFFFFFu), 2);
  EXPECT_EQ(Message::serial_delta(0xFFFFFFFFu, 1), -2);
}

TEST(Message, Release_without_slot)
{
  // Never received, so never held a slot: nothing to release, and said so immediately.
  const auto msg = Message::create();
  const auto future = msg->release_slot();
  ASSERT_TRUE(future.valid());
  ASSERT_TRUE(future.is_ready());
  EXPECT_FALSE(future.get());
  EXPECT_FALSE(msg->has_slot());

  const auto nothing = Session::nothing_released();
  ASSERT_TRUE(nothing.is_ready());
  EXPECT_FALSE(nothing.get());
}

TEST(Message, Release_key)
{
  const auto id = util::random_identity();
  const Release_key key1{id, 7};
  const Release_key key2{id, 8};
  const Release_key key3{id, 7};
  EXPECT_TRUE(key1 == key3);
  EXPECT_FALSE(key1 == key2);

  boost::unordered_set<Release_key> keys;
  keys.insert(key1);
  keys.insert(key2);
  keys.insert(key3);
  EXPECT_EQ(keys.size(), 2u);
}

} // namespace chirp::session::test
