#include "lh/election_engine.hpp"
#include <lh/memory_document_store.hpp>
#include <lh/memory_ttl_key_store.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <vector>

namespace {
using namespace std::chrono_literals;

/// Collect the events and let the test wait for them.
class event_recorder {
public:
  std::shared_ptr<lh::event_sink> sink() {
    return lh::make_event_sink([this](lh::election_event const& e) {
      std::lock_guard<std::mutex> lock(mu_);
      events_.push_back(e);
      cv_.notify_all();
    });
  }

  /// Wait until @a count events of type @a type were received, returns false on timeout.
  bool wait_for(lh::event_type type, std::size_t count, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mu_);
    return cv_.wait_for(lock, timeout, [this, type, count]() {
      return std::count_if(events_.begin(), events_.end(), [type](auto const& e) { return e.type == type; }) >=
             std::ptrdiff_t(count);
    });
  }

  std::vector<lh::election_event> events() const {
    std::lock_guard<std::mutex> lock(mu_);
    return events_;
  }

private:
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::vector<lh::election_event> events_;
};

/// A configuration with short timers, so the tests run quickly.
lh::engine_config fast_config() {
  lh::engine_config config;
  config.lease_duration = 400ms;
  config.heartbeat_interval = 100ms;
  config.follower_backoff = 200ms;
  config.competition_jitter = 50ms;
  return config;
}
} // anonymous namespace

/**
 * @test Verify that lh::election_engine elects a leader, and a new one after the leader crashes, using real timers.
 */
TEST(election_engine, crash_and_failover) {
  for (auto kind : {lh::backend_kind::conditional_write, lh::backend_kind::ttl_key}) {
    SCOPED_TRACE(kind);
    event_recorder recorder;
    auto config = fast_config();
    lh::election_engine engine(
        config,
        lh::make_backend_factory(
            std::make_shared<lh::memory_document_store>(), std::make_shared<lh::memory_ttl_key_store>(),
            config.lease_duration),
        recorder.sink());

    engine.start_election(kind);
    EXPECT_TRUE(engine.running());
    ASSERT_TRUE(recorder.wait_for(lh::event_type::leader_elected, 1, 5000ms));
    auto leader = engine.current_leader();
    ASSERT_NE(leader, "");

    engine.crash_node(leader);
    ASSERT_TRUE(recorder.wait_for(lh::event_type::leader_elected, 2, 5000ms));
    auto successor = engine.current_leader();
    EXPECT_NE(successor, leader);

    // ... the crash is reported before the loss, and both before the new election ...
    auto events = recorder.events();
    auto crashed = std::find(events.begin(), events.end(), lh::election_event::crashed(leader));
    auto lost = std::find(events.begin(), events.end(), lh::election_event::lost(leader));
    auto elected = std::find(events.begin(), events.end(), lh::election_event::elected(successor));
    ASSERT_NE(crashed, events.end());
    ASSERT_NE(lost, events.end());
    ASSERT_NE(elected, events.end());
    EXPECT_LT(crashed, lost);
    EXPECT_LT(lost, elected);

    engine.stop_election();
    EXPECT_FALSE(engine.running());
  }
}

/**
 * @test Verify that the leader keeps its lease through several heartbeats with real timers.
 */
TEST(election_engine, leader_is_stable) {
  event_recorder recorder;
  auto config = fast_config();
  lh::election_engine engine(
      config, lh::make_backend_factory(std::make_shared<lh::memory_document_store>(), nullptr, config.lease_duration),
      recorder.sink());

  engine.start_election(lh::parse_backend_kind("A"));
  ASSERT_TRUE(recorder.wait_for(lh::event_type::leader_elected, 1, 5000ms));
  auto leader = engine.current_leader();
  std::this_thread::sleep_for(1000ms);
  EXPECT_EQ(engine.current_leader(), leader);

  auto events = recorder.events();
  EXPECT_EQ(std::count_if(events.begin(), events.end(), [](auto const& e) {
    return e.type == lh::event_type::leader_elected;
  }), 1);
  engine.reset_election();
  for (auto const& n : engine.nodes()) {
    EXPECT_EQ(n.status, lh::node_status::idle);
  }
}

/**
 * @test Verify that the engine can be destroyed while the election runs.
 */
TEST(election_engine, destroy_while_running) {
  auto config = fast_config();
  auto queue = std::make_shared<lh::active_completion_queue>();
  {
    lh::election_engine engine(
        config, lh::make_backend_factory(nullptr, std::make_shared<lh::memory_ttl_key_store>(), config.lease_duration),
        lh::make_null_event_sink(), queue);
    engine.start_election(lh::backend_kind::ttl_key);
    std::this_thread::sleep_for(100ms);
  }
  // ... every timer reported back before the engine went away ...
  std::this_thread::sleep_for(100ms);
  EXPECT_EQ(queue->cq().pending_operations(), 0U);
}
