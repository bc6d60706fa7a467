#include "lh/node_registry.hpp"
#include <lh/assert_throw.hpp>

#include <gtest/gtest.h>

/**
 * @test Verify that the registry creates the nodes with the expected names and initial state.
 */
TEST(node_registry, basic) {
  lh::node_registry registry(5);
  ASSERT_EQ(registry.list().size(), 5U);
  EXPECT_EQ(registry.list().front().id(), "node-1");
  EXPECT_EQ(registry.list().back().id(), "node-5");
  for (auto const& n : registry.list()) {
    EXPECT_EQ(n.status(), lh::node_status::idle);
    EXPECT_FALSE(n.has_lease());
    EXPECT_FALSE(n.competition_timer());
    EXPECT_FALSE(n.heartbeat_timer());
  }

  EXPECT_EQ(registry.get("node-3").id(), "node-3");
  EXPECT_TRUE(registry.find("node-6") == nullptr);
  EXPECT_THROW(registry.get("node-6"), std::invalid_argument);

  lh::node_registry custom(2, "candidate-");
  EXPECT_EQ(custom.list().back().id(), "candidate-2");
}

/**
 * @test Verify that the lease is present if and only if the node is the leader.
 */
TEST(node_registry, lease_follows_leadership) {
  using namespace std::chrono_literals;
  lh::node_registry registry(3);
  auto& n = registry.get("node-2");
  auto expiry = lh::clock_type::time_point(10000ms);

  EXPECT_FALSE(n.promote("test", expiry));
  EXPECT_FALSE(n.has_lease());
  EXPECT_TRUE(n.start_competing("test"));
  EXPECT_TRUE(n.promote("test", expiry));
  EXPECT_TRUE(n.has_lease());
  EXPECT_EQ(n.lease_expiry(), expiry);

  n.extend_lease(expiry + 3000ms);
  EXPECT_EQ(n.lease_expiry(), expiry + 3000ms);

  EXPECT_TRUE(n.demote("test"));
  EXPECT_EQ(n.status(), lh::node_status::follower);
  EXPECT_FALSE(n.has_lease());
  EXPECT_THROW(n.extend_lease(expiry), lh::invariant_error);

  auto info = n.info();
  EXPECT_EQ(info.id, "node-2");
  EXPECT_EQ(info.status, lh::node_status::follower);
  EXPECT_FALSE(info.has_lease);
}

/**
 * @test Verify that crashed nodes stay crashed until the registry is reset.
 */
TEST(node_registry, crash_and_reset) {
  using namespace std::chrono_literals;
  lh::node_registry registry(5);
  auto& leader = registry.get("node-1");
  ASSERT_TRUE(leader.start_competing("test"));
  ASSERT_TRUE(leader.promote("test", lh::clock_type::time_point(10000ms)));

  EXPECT_TRUE(registry.mark_crashed("node-1"));
  EXPECT_EQ(leader.status(), lh::node_status::crashed);
  EXPECT_FALSE(leader.has_lease());
  EXPECT_FALSE(registry.mark_crashed("node-1"));
  EXPECT_FALSE(leader.start_competing("test"));
  EXPECT_THROW(registry.mark_crashed("node-42"), std::invalid_argument);

  registry.get("node-4").start_competing("test");
  registry.reset();
  for (auto const& info : registry.snapshot()) {
    EXPECT_EQ(info.status, lh::node_status::idle) << info.id;
    EXPECT_FALSE(info.has_lease) << info.id;
  }
}

/**
 * @test Verify that release_timers() hands over the pending timers.
 */
TEST(node_registry, release_timers) {
  lh::node_registry registry(1);
  auto& n = registry.list().front();
  EXPECT_TRUE(n.release_timers().empty());

  n.competition_timer(std::make_shared<lh::detail::deadline_timer>());
  n.heartbeat_timer(std::make_shared<lh::detail::deadline_timer>());
  auto timers = n.release_timers();
  EXPECT_EQ(timers.size(), 2U);
  EXPECT_FALSE(n.competition_timer());
  EXPECT_FALSE(n.heartbeat_timer());
}
