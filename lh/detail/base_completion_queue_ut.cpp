#include "lh/detail/base_completion_queue.hpp"
#include <lh/completion_queue.hpp>

#include <gtest/gtest.h>

#include <future>
#include <stdexcept>
#include <thread>

/**
 * @test Verify that we can run and shutdown a completion queue.
 */
TEST(base_completion_queue, run_shutdown) {
  lh::detail::base_completion_queue queue;
  // run the event loop in a separate thread ...
  std::promise<void> start;
  std::promise<void> end;
  std::thread t([&]() {
    start.set_value();
    queue.run();
    end.set_value();
  });

  using namespace std::chrono_literals;

  auto start_fut = start.get_future();
  ASSERT_EQ(start_fut.wait_for(500ms), std::future_status::ready);
  EXPECT_EQ(queue.pending_operations(), 0U);

  queue.shutdown();
  // ... calling shutdown() twice is harmless ...
  queue.shutdown();

  auto end_fut = end.get_future();
  ASSERT_EQ(end_fut.wait_for(10 * lh::detail::base_completion_queue::loop_timeout), std::future_status::ready);

  t.join();
}

/**
 * @test Verify that an exception in a timer callback does not stop the loop.
 */
TEST(base_completion_queue, callback_exception) {
  using namespace std::chrono_literals;
  lh::completion_queue<> queue;
  std::thread t([&queue]() { queue.run(); });

  std::promise<bool> second;
  auto const now = std::chrono::system_clock::now();
  queue.make_deadline_timer(now + 5ms, "heartbeat/node-1", [](lh::detail::deadline_timer const&, bool) {
    throw std::runtime_error("lease store unavailable");
  });
  queue.make_deadline_timer(now + 20ms, "heartbeat/node-2", [&second](lh::detail::deadline_timer const&, bool ok) {
    second.set_value(ok);
  });

  auto f = second.get_future();
  ASSERT_EQ(f.wait_for(1000ms), std::future_status::ready);
  EXPECT_TRUE(f.get());
  EXPECT_EQ(queue.pending_operations(), 0U);

  queue.shutdown();
  t.join();
}
