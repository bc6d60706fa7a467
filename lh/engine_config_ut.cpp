#include "lh/engine_config.hpp"
#include <lh/log.hpp>

#include <gtest/gtest.h>
#include <vector>

/**
 * @test Verify the default configuration.
 */
TEST(engine_config, defaults) {
  using namespace std::chrono_literals;
  lh::engine_config config;
  EXPECT_EQ(config.node_count, 5U);
  EXPECT_EQ(config.node_prefix, "node-");
  EXPECT_EQ(config.lease_duration, 10000ms);
  EXPECT_EQ(config.heartbeat_interval, 3000ms);
  EXPECT_EQ(config.follower_backoff, 5000ms);
  EXPECT_EQ(config.competition_jitter, 2000ms);
  EXPECT_EQ(config.seed, 0U);
  ASSERT_TRUE(static_cast<bool>(config.clock));
  EXPECT_NO_THROW(config.validate());
}

/**
 * @test Verify that invalid configurations are rejected.
 */
TEST(engine_config, invalid) {
  using namespace std::chrono_literals;
  auto check = [](auto modifier) {
    lh::engine_config config;
    modifier(config);
    EXPECT_THROW(config.validate(), std::invalid_argument);
  };
  check([](lh::engine_config& c) { c.node_count = 0; });
  check([](lh::engine_config& c) { c.lease_duration = 0ms; });
  check([](lh::engine_config& c) { c.heartbeat_interval = -1ms; });
  check([](lh::engine_config& c) { c.follower_backoff = 0ms; });
  check([](lh::engine_config& c) { c.competition_jitter = -5ms; });
  check([](lh::engine_config& c) { c.lease_duration = 3000ms; });
  check([](lh::engine_config& c) { c.clock = lh::clock_function(); });

  lh::engine_config config;
  config.competition_jitter = 0ms;
  EXPECT_NO_THROW(config.validate());
}

/**
 * @test Verify that short leases are accepted with a warning.
 */
TEST(engine_config, short_lease_warning) {
  using namespace std::chrono_literals;
  std::vector<std::string> messages;
  auto sink = lh::make_log_sink([&messages](lh::severity sev, std::string&& msg) {
    if (sev == lh::severity::warning) {
      messages.push_back(std::move(msg));
    }
  });
  lh::log::instance().add_sink(sink);

  lh::engine_config config;
  config.lease_duration = 5000ms;
  EXPECT_NO_THROW(config.validate());
  lh::log::instance().remove_sink(sink);

  ASSERT_EQ(messages.size(), 1U);
  EXPECT_NE(messages[0].find("fewer than two missed heartbeats"), std::string::npos);
}
