#include "lh/detail/node_state_machine.hpp"

#include <gtest/gtest.h>

/**
 * @test Verify that lh::detail::node_state_machine follows the expected life cycle.
 */
TEST(node_state_machine, basic) {
  using s = lh::node_status;
  lh::detail::node_state_machine machine;

  ASSERT_EQ(machine.current(), s::idle);
  EXPECT_FALSE(machine.change_state("test", s::leader));
  EXPECT_FALSE(machine.change_state("test", s::follower));
  EXPECT_TRUE(machine.change_state("test", s::competing));
  EXPECT_TRUE(machine.change_state("test", s::follower));
  EXPECT_FALSE(machine.change_state("test", s::leader));
  EXPECT_TRUE(machine.change_state("test", s::competing));
  EXPECT_TRUE(machine.change_state("test", s::leader));
  EXPECT_FALSE(machine.change_state("test", s::leader));
  EXPECT_TRUE(machine.change_state("test", s::follower));
  EXPECT_TRUE(machine.change_state("test", s::competing));
  EXPECT_TRUE(machine.change_state("test", s::leader));
  EXPECT_TRUE(machine.change_state("test", s::crashed));
  EXPECT_EQ(machine.current(), s::crashed);

  // ... a crashed node only leaves that state through a reset ...
  EXPECT_FALSE(machine.change_state("test", s::competing));
  EXPECT_FALSE(machine.change_state("test", s::leader));
  EXPECT_FALSE(machine.change_state("test", s::follower));
  EXPECT_FALSE(machine.change_state("test", s::crashed));
  EXPECT_TRUE(machine.change_state("test", s::idle));
  EXPECT_EQ(machine.current(), s::idle);
  EXPECT_TRUE(machine.change_state("test", s::crashed));
}

/**
 * @test Verify that a restarted election can move any live node back to competing.
 */
TEST(node_state_machine, restart) {
  using s = lh::node_status;
  using m = lh::detail::node_state_machine;
  EXPECT_TRUE(m::valid_transition(s::idle, s::competing));
  EXPECT_TRUE(m::valid_transition(s::competing, s::competing));
  EXPECT_TRUE(m::valid_transition(s::leader, s::competing));
  EXPECT_TRUE(m::valid_transition(s::follower, s::competing));
  EXPECT_FALSE(m::valid_transition(s::crashed, s::competing));
  EXPECT_FALSE(m::valid_transition(s::idle, s::leader));
}
