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

#include "chirp/engine/config.hpp"
#include "chirp/error.hpp"
#include "chirp/test/test_logger.hpp"
#include <flow/error/error.hpp>
#include <gtest/gtest.h>

namespace chirp::engine::test
{

namespace
{
using chirp::test::Test_logger;

/// Valid config (encryption off, so no certificate needed).
Config valid_config()
{
  Config config;
  config.m_disable_encryption = true;
  return config;
}

/// validate() result.
Error_code validate(const Config& config)
{
  Test_logger logger;
  Error_code err_code;
  config.validate(&logger, &err_code);
  return err_code;
}
} // Anonymous namespace

TEST(Config, Defaults)
{
  const Config config;
  EXPECT_EQ(config.m_reuse_time, 30);
  EXPECT_EQ(config.m_timeout, 5);
  EXPECT_EQ(config.m_port, 2998);
  EXPECT_EQ(config.m_backlog, 100);
  EXPECT_EQ(config.m_max_slots, 0);
  EXPECT_TRUE(config.m_synchronous);
  EXPECT_FALSE(config.m_disable_signals);
  EXPECT_EQ(config.m_buffer_size, 0u);
  EXPECT_EQ(config.m_max_msg_size, 0u);
  EXPECT_EQ(config.m_bind_v6, "::");
  EXPECT_EQ(config.m_bind_v4, "0.0.0.0");
  EXPECT_TRUE(util::is_null(config.m_identity));
  EXPECT_FALSE(config.m_disable_encryption);
  EXPECT_TRUE(config.m_auto_release);
}

TEST(Config, Validate)
{
  EXPECT_FALSE(validate(valid_config()));

  // Encryption on by default; so a certificate is needed.
  EXPECT_EQ(validate(Config()), error::Code::S_VALUE_ERROR);
  auto config = Config();
  config.m_cert_chain_pem = "cert.pem";
  EXPECT_FALSE(validate(config));

  config = valid_config();
  config.m_max_slots = 32;
  EXPECT_FALSE(validate(config));
  config.m_max_slots = 33;
  EXPECT_EQ(validate(config), error::Code::S_VALUE_ERROR);

  config = valid_config();
  config.m_timeout = 0;
  EXPECT_EQ(validate(config), error::Code::S_VALUE_ERROR);
  config.m_timeout = 1201;
  EXPECT_EQ(validate(config), error::Code::S_VALUE_ERROR);
  config.m_timeout = 1200;
  EXPECT_FALSE(validate(config));

  config = valid_config();
  config.m_reuse_time = 0;
  EXPECT_EQ(validate(config), error::Code::S_VALUE_ERROR);
  config.m_reuse_time = 3601;
  EXPECT_EQ(validate(config), error::Code::S_VALUE_ERROR);

  config = valid_config();
  config.m_buffer_size = 1023;
  EXPECT_EQ(validate(config), error::Code::S_VALUE_ERROR);
  config.m_buffer_size = 1024;
  EXPECT_FALSE(validate(config));
  config.m_max_msg_size = 1000;
  EXPECT_EQ(validate(config), error::Code::S_VALUE_ERROR);
  config.m_max_msg_size = 4096;
  EXPECT_FALSE(validate(config));

  config = valid_config();
  config.m_bind_v4 = "::1";
  EXPECT_EQ(validate(config), error::Code::S_VALUE_ERROR);
  config = valid_config();
  config.m_bind_v6 = "127.0.0.1";
  EXPECT_EQ(validate(config), error::Code::S_VALUE_ERROR);
  config.m_bind_v6 = "garbage";
  EXPECT_EQ(validate(config), error::Code::S_VALUE_ERROR);

  Test_logger logger;
  EXPECT_THROW(Config().validate(&logger), flow::error::Runtime_error);
}

TEST(Config, Derived_values)
{
  using boost::chrono::milliseconds;
  using boost::chrono::duration_cast;

  Config config;
  EXPECT_EQ(config.effective_max_slots(), 1); // Synchronous.
  config.m_synchronous = false;
  EXPECT_EQ(config.effective_max_slots(), Config::S_DEFAULT_ASYNC_SLOTS);
  config.m_max_slots = 3;
  EXPECT_EQ(config.effective_max_slots(), 3);

  config.m_timeout = 5;
  EXPECT_EQ(duration_cast<milliseconds>(config.timeout()).count(), 5000);
  EXPECT_EQ(duration_cast<milliseconds>(config.connect_timeout()).count(), 10000);
  config.m_timeout = 45;
  EXPECT_EQ(duration_cast<milliseconds>(config.connect_timeout()).count(), 60000);
}

} // namespace chirp::engine::test
