#include "lh/completion_queue.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace lh {
namespace detail {
struct base_completion_queue_test_only {
  static grpc::CompletionQueue* get_raw_queue(base_completion_queue& q) {
    return q.cq();
  }
};
} // namespace detail
} // namespace lh

/**
 * @test Verify that timers fire, and canceled timers report ok == false.
 */
TEST(completion_queue, basic) {
  lh::completion_queue<> queue;

  std::atomic<int> cnt(0);
  std::atomic<int> cxl(0);
  auto functor = [&cnt, &cxl](lh::detail::deadline_timer const& op, bool ok) {
    if (not ok) {
      ++cxl;
    } else {
      ++cnt;
    }
  };

  using namespace std::chrono_literals;

  auto const now = std::chrono::system_clock::now();
  auto canceled = queue.make_deadline_timer(now + 500ms, "test-canceled", functor);
  queue.cancel_timer(canceled);
  auto timer = queue.make_deadline_timer(now + 5ms, "test-timer", functor);
  EXPECT_EQ(timer->name, "test-timer");
  std::thread t([&queue]() { queue.run(); });

  for (int i = 0; i != 100 and (cnt.load() == 0 or cxl.load() == 0); ++i) {
    std::this_thread::sleep_for(10ms);
  }
  ASSERT_EQ(cnt.load(), 1);
  ASSERT_EQ(cxl.load(), 1);
  EXPECT_EQ(queue.pending_operations(), 0U);

  queue.shutdown();
  t.join();
}

/**
 * @test Verify that timers fire in deadline order, not creation order.
 */
TEST(completion_queue, deadline_order) {
  using namespace std::chrono_literals;
  lh::completion_queue<> queue;

  std::mutex mu;
  std::vector<std::string> fired;
  auto record = [&mu, &fired](lh::detail::deadline_timer const& op, bool ok) {
    std::lock_guard<std::mutex> lock(mu);
    fired.push_back(op.name);
  };
  auto now = std::chrono::system_clock::now();
  queue.make_deadline_timer(now + 60ms, "third", record);
  queue.make_deadline_timer(now + 20ms, "first", record);
  queue.make_deadline_timer(now + 40ms, "second", record);
  std::thread t([&queue]() { queue.run(); });

  for (int i = 0; i != 100 and queue.pending_operations() != 0; ++i) {
    std::this_thread::sleep_for(10ms);
  }
  queue.shutdown();
  t.join();

  ASSERT_EQ(fired.size(), 3U);
  EXPECT_EQ(fired[0], "first");
  EXPECT_EQ(fired[1], "second");
  EXPECT_EQ(fired[2], "third");
}

/**
 * @test Make sure lh::completion_queue handles errors gracefully.
 */
TEST(completion_queue, error) {
  using namespace std::chrono_literals;

  lh::completion_queue<> queue;
  std::thread t([&queue]() { queue.run(); });

  // ... manually create alarms with bad tags, that requires going around the API ...
  grpc::CompletionQueue* cq = lh::detail::base_completion_queue_test_only::get_raw_queue(queue);

  std::atomic<int> cnt(0);
  auto const now = std::chrono::system_clock::now();
  auto op = queue.make_deadline_timer(
      now + 30ms, "alarm-after", [&cnt](lh::detail::deadline_timer const& op, bool ok) { ++cnt; });
  // ... an earlier alarm with a nullptr tag ...
  grpc::Alarm al1;
  al1.Set(cq, now + 10ms, nullptr);
  // ... and an alarm with a tag the queue does not know about ...
  grpc::Alarm al2;
  al2.Set(cq, now + 20ms, (void*)&cnt);

  for (int i = 0; i != 100 and cnt.load() == 0; ++i) {
    std::this_thread::sleep_for(40ms);
  }
  ASSERT_EQ(cnt.load(), 1);

  queue.shutdown();
  t.join();
}
