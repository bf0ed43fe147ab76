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

#include "chirp/session/pending_table.hpp"
#include <gtest/gtest.h>
#include <boost/make_shared.hpp>

namespace chirp::session::test
{

namespace
{

Pending_table::Send_entry make_send_entry(const Message_ptr& msg)
{
  return Pending_table::Send_entry{msg, boost::make_shared<Pending_table::Send_promise>(), {}};
}

Pending_table::Release_entry make_release_entry(const Message_ptr& msg)
{
  const auto promise = boost::make_shared<Pending_table::Release_promise>();
  return Pending_table::Release_entry{msg, promise, promise->get_future().share()};
}

} // Anonymous namespace

TEST(Pending_table, Sends)
{
  Pending_table table;
  const auto msg1 = Message::create();
  const auto msg2 = Message::create();

  const auto id1 = table.register_send(make_send_entry(msg1));
  const auto id2 = table.register_send(make_send_entry(msg2));
  EXPECT_NE(id1, 0u);
  EXPECT_NE(id2, 0u);
  EXPECT_NE(id1, id2);
  EXPECT_EQ(table.send_count(), 2u);

  // Same object still in flight: refused.
  EXPECT_EQ(table.register_send(make_send_entry(msg1)), 0u);
  EXPECT_EQ(table.send_count(), 2u);

  // Taken exactly once.
  auto entry = table.take_send(id1);
  ASSERT_TRUE(entry);
  EXPECT_EQ(entry->m_msg, msg1);
  EXPECT_FALSE(table.take_send(id1));
  EXPECT_FALSE(table.take_send(12345));

  // Done sending, so it may be sent again; under a new ID.
  const auto id3 = table.register_send(make_send_entry(msg1));
  EXPECT_NE(id3, 0u);
  EXPECT_NE(id3, id1);

  const auto all = table.take_all_sends();
  EXPECT_EQ(all.size(), 2u);
  EXPECT_EQ(table.send_count(), 0u);
  EXPECT_FALSE(table.take_send(id2));
  EXPECT_NE(table.register_send(make_send_entry(msg2)), 0u);
}

TEST(Pending_table, Releases)
{
  Pending_table table;
  const auto msg = Message::create();
  const Release_key key{msg->identity(), 5};
  const Release_key other_key{msg->identity(), 6};

  EXPECT_FALSE(table.release_future(key).valid());

  auto entry = make_release_entry(msg);
  const auto future = entry.m_future;
  EXPECT_TRUE(table.register_release(key, std::move(entry)));
  EXPECT_FALSE(table.register_release(key, make_release_entry(msg)));
  EXPECT_TRUE(table.register_release(other_key, make_release_entry(msg)));
  EXPECT_EQ(table.release_count(), 2u);

  // Everyone asking gets the same future.
  const auto future2 = table.release_future(key);
  ASSERT_TRUE(future2.valid());
  EXPECT_FALSE(future2.is_ready());

  // Snapshot leaves the table alone.
  EXPECT_EQ(table.release_entries().size(), 2u);
  EXPECT_EQ(table.release_count(), 2u);

  auto taken = table.take_release(key);
  ASSERT_TRUE(taken);
  EXPECT_FALSE(table.take_release(key));
  taken->m_promise->set_value(std::optional<Release_key>(key));
  ASSERT_TRUE(future.is_ready());
  ASSERT_TRUE(future2.is_ready());
  ASSERT_TRUE(future2.get());
  EXPECT_TRUE(*future2.get() == key);

  EXPECT_EQ(table.take_all_releases().size(), 1u);
  EXPECT_EQ(table.release_count(), 0u);
  EXPECT_FALSE(table.release_future(other_key).valid());
}

TEST(Pending_table, Requests)
{
  Pending_table table;
  const auto id1 = util::random_identity();
  const auto id2 = util::random_identity();
  const auto state1 = boost::make_shared<detail::Request_state>();
  const auto state2 = boost::make_shared<detail::Request_state>();
  const auto state3 = boost::make_shared<detail::Request_state>();

  EXPECT_TRUE(table.register_request(id1, state1));
  EXPECT_TRUE(table.register_request(id2, state2));
  EXPECT_FALSE(table.register_request(id1, state3));
  EXPECT_EQ(table.request_count(), 2u);

  // Conditional take: only if still the same request.
  EXPECT_FALSE(table.take_request_if(id1, state3));
  EXPECT_EQ(table.request_count(), 2u);
  EXPECT_TRUE(table.take_request_if(id1, state1));
  EXPECT_FALSE(table.take_request_if(id1, state1));
  EXPECT_FALSE(table.take_request(id1));

  // The identity is free again.
  EXPECT_TRUE(table.register_request(id1, state3));

  EXPECT_EQ(table.take_request(id2), state2);
  EXPECT_FALSE(table.take_request(id2));

  const auto all = table.take_all_requests();
  ASSERT_EQ(all.size(), 1u);
  EXPECT_EQ(all.front(), state3);
  EXPECT_EQ(table.request_count(), 0u);
}

} // namespace chirp::session::test
