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

#include "chirp/loop/event_loop.hpp"
#include "chirp/error.hpp"
#include "chirp/test/test_logger.hpp"
#include "chirp/test/test_common_util.hpp"
#include <gtest/gtest.h>
#include <boost/thread/future.hpp>
#include <boost/thread/thread.hpp>
#include <atomic>
#include <vector>

namespace chirp::loop::test
{

namespace
{
using chirp::test::Test_logger;
using chirp::test::get_test_suite_name;
} // Anonymous namespace

TEST(Event_loop, Post_runs_in_loop_thread_in_order)
{
  Test_logger logger;
  Event_loop loop(&logger, get_test_suite_name());
  EXPECT_TRUE(loop.running());
  EXPECT_FALSE(loop.in_loop_thread());

  std::vector<int> order; // Touched only in thread W until the promise is set.
  bool all_in_loop = true;
  boost::promise<void> done;
  for (int idx = 0; idx != 100; ++idx)
  {
    EXPECT_TRUE(loop.post([&, idx]()
    {
      all_in_loop = all_in_loop && loop.in_loop_thread();
      order.push_back(idx);
      if (idx == 99)
      {
        done.set_value();
      }
    }));
  }
  done.get_future().wait();

  ASSERT_EQ(order.size(), 100u);
  for (int idx = 0; idx != 100; ++idx)
  {
    EXPECT_EQ(order[idx], idx);
  }
  EXPECT_TRUE(all_in_loop);

  EXPECT_TRUE(loop.stop());
  EXPECT_TRUE(loop.stopped());
}

TEST(Event_loop, Deferred_run)
{
  Test_logger logger;
  Event_loop loop(&logger, get_test_suite_name(), false);
  EXPECT_FALSE(loop.running());

  // Queued until run().
  boost::promise<void> ran;
  EXPECT_TRUE(loop.post([&]() { ran.set_value(); }));

  loop.run();
  EXPECT_TRUE(loop.running());
  ran.get_future().wait();

  loop.run(); // No-op.
  EXPECT_TRUE(loop.running());
  EXPECT_TRUE(loop.stop());
}

TEST(Event_loop, Reference_counting)
{
  Test_logger logger;
  Event_loop loop(&logger, get_test_suite_name());
  EXPECT_EQ(loop.ref_count(), 1u);

  loop.retain();
  loop.retain();
  EXPECT_EQ(loop.ref_count(), 3u);

  EXPECT_FALSE(loop.release());
  EXPECT_FALSE(loop.stop()); // User's own reference; but others remain.
  EXPECT_TRUE(loop.running());
  EXPECT_EQ(loop.ref_count(), 1u);

  // Last one out shuts it down; whatever was posted before still runs.
  bool ran = false;
  EXPECT_TRUE(loop.post([&]() { ran = true; }));
  EXPECT_TRUE(loop.release());
  EXPECT_TRUE(ran);
  EXPECT_TRUE(loop.stopped());
  EXPECT_FALSE(loop.running());
  EXPECT_EQ(loop.ref_count(), 0u);

  // Now everything is a no-op.
  EXPECT_FALSE(loop.release());
  loop.retain();
  EXPECT_EQ(loop.ref_count(), 0u);
}

TEST(Event_loop, No_restart_after_stop)
{
  Test_logger logger;
  Event_loop loop(&logger, get_test_suite_name());
  EXPECT_TRUE(loop.stop());

  Error_code err_code;
  loop.run(&err_code);
  EXPECT_EQ(err_code, error::Code::S_LOOP_CANNOT_RESTART);
  EXPECT_THROW(loop.run(), flow::error::Runtime_error);

  // Posting after shutdown drops the task.
  bool ran = false;
  EXPECT_FALSE(loop.post([&]() { ran = true; }));
  EXPECT_FALSE(ran);
}

TEST(Event_loop, Repeated_stop_releases_once)
{
  Test_logger logger;
  Event_loop loop(&logger, get_test_suite_name());
  loop.retain(); // As a Session would.
  EXPECT_EQ(loop.ref_count(), 2u);

  EXPECT_FALSE(loop.stop());
  EXPECT_FALSE(loop.stop());
  Error_code err_code;
  EXPECT_FALSE(loop.stop(&err_code));
  EXPECT_FALSE(err_code);
  EXPECT_TRUE(loop.running());
  EXPECT_EQ(loop.ref_count(), 1u);

  boost::promise<void> ran;
  EXPECT_TRUE(loop.post([&]() { ran.set_value(); }));
  ran.get_future().wait();

  EXPECT_TRUE(loop.release());
  EXPECT_TRUE(loop.stopped());
  EXPECT_FALSE(loop.stop());
}

TEST(Event_loop, Never_run_loop_stops_and_drains)
{
  Test_logger logger;
  Event_loop loop(&logger, get_test_suite_name(), false);

  bool ran = false;
  bool in_loop = false;
  EXPECT_TRUE(loop.post([&]()
  {
    ran = true;
    in_loop = loop.in_loop_thread();
  }));
  EXPECT_TRUE(loop.stop());
  EXPECT_TRUE(ran);
  EXPECT_TRUE(in_loop); // Drained in the I/O thread, not somewhere else.
  EXPECT_TRUE(loop.stopped());
}

TEST(Event_loop, Accepted_posts_run_despite_concurrent_shutdown)
{
  constexpr unsigned int N_THREADS = 4;

  Test_logger logger;
  Event_loop loop(&logger, get_test_suite_name());

  std::atomic<unsigned int> n_accepted(0);
  std::atomic<unsigned int> n_ran(0);
  std::atomic<unsigned int> n_ran_elsewhere(0);
  std::atomic<bool> go(false);

  std::vector<boost::thread> posters;
  for (unsigned int idx = 0; idx != N_THREADS; ++idx)
  {
    posters.emplace_back([&]()
    {
      while (!go)
      {
        boost::this_thread::yield();
      }
      // Keep posting until the loop refuses.
      while (loop.post([&]()
                       {
                         if (!loop.in_loop_thread())
                         {
                           ++n_ran_elsewhere;
                         }
                         ++n_ran;
                       }))
      {
        ++n_accepted;
      }
    });
  }

  go = true;
  boost::this_thread::sleep_for(boost::chrono::milliseconds(20));
  EXPECT_TRUE(loop.stop());
  for (auto& poster : posters)
  {
    poster.join();
  }

  // Every accepted task ran, and in thread W; none ran after stop() returned.
  EXPECT_GT(n_accepted.load(), 0u);
  EXPECT_EQ(n_ran.load(), n_accepted.load());
  EXPECT_EQ(n_ran_elsewhere.load(), 0u);
}

} // namespace chirp::loop::test
