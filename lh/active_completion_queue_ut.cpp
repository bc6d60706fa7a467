#include "lh/active_completion_queue.hpp"

#include <gtest/gtest.h>

#include <future>

/**
 * @test Verify that lh::active_completion_queue starts and stops cleanly.
 */
TEST(active_completion_queue, basic) {
  auto shq = std::make_shared<lh::active_completion_queue>();
  EXPECT_FALSE(shq->in_scheduler_thread());
  EXPECT_EQ(shq->cq().pending_operations(), 0U);
  EXPECT_NO_THROW(shq.reset());

  EXPECT_NO_THROW(lh::active_completion_queue());
}

/**
 * @test Verify that the timers run in the scheduler thread, in deadline order.
 */
TEST(active_completion_queue, runs_timers) {
  using namespace std::chrono_literals;
  lh::active_completion_queue queue;

  std::promise<bool> heartbeat;
  std::promise<bool> backoff;
  auto late = backoff.get_future();
  auto const now = std::chrono::system_clock::now();
  queue.cq().make_deadline_timer(now + 50ms, "backoff/node-2", [&](lh::detail::deadline_timer const&, bool ok) {
    backoff.set_value(queue.in_scheduler_thread());
  });
  queue.cq().make_deadline_timer(now + 10ms, "heartbeat/node-1", [&](lh::detail::deadline_timer const&, bool ok) {
    // ... the heartbeat is due first, the backoff timer must still be pending ...
    heartbeat.set_value(late.wait_for(0ms) == std::future_status::timeout and queue.in_scheduler_thread());
  });

  auto early = heartbeat.get_future();
  ASSERT_EQ(early.wait_for(1000ms), std::future_status::ready);
  EXPECT_TRUE(early.get());
  ASSERT_EQ(late.wait_for(1000ms), std::future_status::ready);
  EXPECT_TRUE(late.get());
}
