#include "lh/detail/async_op_counter.hpp"

#include <gtest/gtest.h>

#include <thread>

/**
 * @test Verify that lh::detail::async_op_counter tracks the timers of an election.
 */
TEST(async_op_counter, basic) {
  lh::detail::async_op_counter counter;

  EXPECT_TRUE(counter.async_op_start("competition/node-1"));
  EXPECT_TRUE(counter.async_op_start("heartbeat/", std::string("node-2"), " deadline=", 3000));
  EXPECT_EQ(counter.pending(), 2);

  counter.async_op_done("competition/node-1");
  counter.async_op_done("heartbeat/node-2", " canceled");
  EXPECT_EQ(counter.pending(), 0);

  // ... an unmatched done is logged and ignored ...
  counter.async_op_done("backoff/node-3");
  EXPECT_EQ(counter.pending(), 0);
}

/**
 * @test Verify that shutdown waits for the outstanding timers and refuses new ones.
 */
TEST(async_op_counter, shutdown) {
  lh::detail::async_op_counter counter;
  EXPECT_TRUE(counter.async_op_start("backoff/node-4"));
  EXPECT_TRUE(counter.async_op_start("heartbeat/node-5"));

  counter.shutdown();
  EXPECT_FALSE(counter.async_op_start("competition/node-1"));
  EXPECT_EQ(counter.pending(), 2);

  std::thread t([&counter]() {
    counter.async_op_done("backoff/node-4", " canceled");
    counter.async_op_done("heartbeat/node-5", " canceled");
  });

  counter.block_until_all_done();
  EXPECT_FALSE(counter.async_op_start("competition/node-1"));
  EXPECT_EQ(counter.pending(), 0);
  t.join();
}
