#include "lh/detail/election_engine_impl.hpp"

#include <lh/detail/simulated_scheduler.hpp>
#include <lh/memory_document_store.hpp>
#include <lh/memory_ttl_key_store.hpp>

#include <gmock/gmock.h>

#include <algorithm>
#include <iterator>
#include <vector>

/// Define helper types and functions used in these tests
namespace {
using namespace std::chrono_literals;
using scheduler_type = lh::detail::simulated_scheduler;
using engine_type = lh::detail::election_engine_impl<scheduler_type::completion_queue_type>;

lh::clock_type::time_point const start_time(1500000000000ms);

/// Hold the collaborators of an engine under test, in the order they must be destroyed.
struct fixture {
  explicit fixture(std::uint64_t seed = 42)
      : scheduler(start_time)
      , documents(std::make_shared<lh::memory_document_store>())
      , keys(std::make_shared<lh::memory_ttl_key_store>(scheduler.clock()))
      , events() {
    lh::engine_config config;
    config.seed = seed;
    config.clock = scheduler.clock();
    engine = std::make_unique<engine_type>(
        scheduler.queue(), config, lh::make_backend_factory(documents, keys, config.lease_duration),
        lh::make_event_sink([this](lh::election_event const& e) { events.push_back(e); }));
  }

  ~fixture() {
    engine.reset();
  }

  std::size_t count(lh::node_status status) const {
    auto nodes = engine->nodes();
    return std::count_if(nodes.begin(), nodes.end(), [status](auto const& n) { return n.status == status; });
  }

  std::vector<lh::election_event> events_of(lh::event_type type) const {
    std::vector<lh::election_event> r;
    std::copy_if(events.begin(), events.end(), std::back_inserter(r), [type](auto const& e) {
      return e.type == type;
    });
    return r;
  }

  /// Number of nodes that believe they hold an unexpired lease.
  std::size_t valid_leaders() const {
    auto now = scheduler.now();
    auto nodes = engine->nodes();
    return std::count_if(nodes.begin(), nodes.end(), [now](auto const& n) {
      return n.status == lh::node_status::leader and n.has_lease and n.lease_expiry > now;
    });
  }

  scheduler_type scheduler;
  std::shared_ptr<lh::memory_document_store> documents;
  std::shared_ptr<lh::memory_ttl_key_store> keys;
  std::vector<lh::election_event> events;
  std::unique_ptr<engine_type> engine;
};

/// A backend whose reset always fails.
class broken_backend : public lh::storage_backend {
public:
  lh::backend_kind kind() const override {
    return lh::backend_kind::ttl_key;
  }
  bool try_acquire(std::string const&, lh::clock_type::time_point) override {
    return false;
  }
  bool renew(std::string const&, lh::clock_type::time_point) override {
    return false;
  }
  void release() override {
  }
  void reset() override {
    throw std::runtime_error("cannot connect to backend");
  }
  void close() override {
  }
};
} // anonymous namespace

/// @test verify lh::detail::election_engine_impl<> instances can be created and destructed.
TEST(election_engine_impl, basic) {
  fixture f;
  EXPECT_FALSE(f.engine->running());
  EXPECT_THROW(f.engine->active_backend(), std::runtime_error);
  EXPECT_EQ(f.engine->current_leader(), "");
  auto nodes = f.engine->nodes();
  ASSERT_EQ(nodes.size(), 5U);
  EXPECT_EQ(nodes[0].id, "node-1");
  EXPECT_EQ(f.count(lh::node_status::idle), 5U);
  EXPECT_TRUE(f.events.empty());
  EXPECT_EQ(f.scheduler.pending(), 0U);
}

/// @test verify that invalid configurations are rejected at construction.
TEST(election_engine_impl, invalid_config) {
  scheduler_type scheduler(start_time);
  lh::engine_config config;
  config.lease_duration = config.heartbeat_interval;
  auto factory = lh::make_backend_factory(std::make_shared<lh::memory_document_store>(), nullptr, 10000ms);
  EXPECT_THROW(
      engine_type(scheduler.queue(), config, factory, lh::make_null_event_sink()), std::invalid_argument);
}

/// @test five idle nodes on the TTL backend elect exactly one leader within the jitter window.
TEST(election_engine_impl, ttl_backend_elects_one_leader) {
  fixture f;
  f.engine->start_election(lh::backend_kind::ttl_key);
  EXPECT_TRUE(f.engine->running());
  EXPECT_EQ(f.engine->active_backend(), lh::backend_kind::ttl_key);

  ASSERT_FALSE(f.events.empty());
  EXPECT_EQ(f.events.front(), lh::election_event::started("ttl-key"));
  EXPECT_EQ(f.count(lh::node_status::competing), 5U);
  EXPECT_EQ(f.scheduler.pending(), 5U);

  f.scheduler.advance(2000ms);
  EXPECT_EQ(f.count(lh::node_status::leader), 1U);
  EXPECT_EQ(f.count(lh::node_status::follower), 4U);
  auto elected = f.events_of(lh::event_type::leader_elected);
  ASSERT_EQ(elected.size(), 1U);

  auto leader = f.engine->current_leader();
  EXPECT_EQ(elected[0].node_id, leader);
  std::string owner;
  ASSERT_TRUE(f.keys->get("leader", &owner));
  EXPECT_EQ(owner, leader);

  // ... the leader reports its lease before the leader-elected event ...
  auto i = std::find(f.events.begin(), f.events.end(), elected[0]);
  ASSERT_NE(i, f.events.begin());
  auto update = *(i - 1);
  EXPECT_EQ(update.type, lh::event_type::node_update);
  EXPECT_EQ(update.node_id, leader);
  EXPECT_EQ(update.status, lh::node_status::leader);
  EXPECT_TRUE(update.has_lease);
}

/// @test the same election on the conditional-write backend.
TEST(election_engine_impl, conditional_write_backend_elects_one_leader) {
  fixture f;
  f.engine->start_election(lh::backend_kind::conditional_write);
  EXPECT_EQ(f.events.front(), lh::election_event::started("conditional-write"));
  f.scheduler.advance(2000ms);
  EXPECT_EQ(f.count(lh::node_status::leader), 1U);
  EXPECT_EQ(f.count(lh::node_status::follower), 4U);

  lh::proto::lease_record record;
  ASSERT_TRUE(f.documents->find_one("current-leader", &record));
  EXPECT_EQ(record.owner(), f.engine->current_leader());
}

/// @test verify that the leader renews its lease on every heartbeat and followers keep retrying.
TEST(election_engine_impl, heartbeat_extends_lease) {
  fixture f;
  f.engine->start_election(lh::backend_kind::conditional_write);
  f.scheduler.advance(2000ms);
  auto leader = f.engine->current_leader();
  ASSERT_NE(leader, "");

  auto lease_of = [&f](std::string const& id) {
    for (auto const& n : f.engine->nodes()) {
      if (n.id == id) {
        return n.lease_expiry;
      }
    }
    return lh::clock_type::time_point();
  };
  auto initial = lease_of(leader);
  f.scheduler.advance(60000ms);
  EXPECT_EQ(f.engine->current_leader(), leader);
  EXPECT_GT(lease_of(leader), initial + 50000ms);
  EXPECT_TRUE(f.events_of(lh::event_type::leader_lost).empty());
  EXPECT_EQ(f.events_of(lh::event_type::leader_elected).size(), 1U);
  EXPECT_EQ(f.count(lh::node_status::leader), 1U);
}

/// @test crashing the leader reports the crash, the loss, and a new leader is elected.
TEST(election_engine_impl, crash_leader) {
  for (auto kind : {lh::backend_kind::conditional_write, lh::backend_kind::ttl_key}) {
    SCOPED_TRACE(kind);
    fixture f;
    f.engine->start_election(kind);
    f.scheduler.advance(2000ms);
    auto leader = f.engine->current_leader();
    ASSERT_NE(leader, "");

    f.events.clear();
    f.engine->crash_node(leader);
    ASSERT_EQ(f.events.size(), 2U);
    EXPECT_EQ(f.events[0], lh::election_event::crashed(leader));
    EXPECT_EQ(f.events[1], lh::election_event::lost(leader));
    EXPECT_EQ(f.engine->current_leader(), "");

    // ... a surviving node takes over within backoff + lease duration ...
    f.scheduler.advance(15000ms);
    auto elected = f.events_of(lh::event_type::leader_elected);
    ASSERT_EQ(elected.size(), 1U);
    EXPECT_NE(elected[0].node_id, leader);
    EXPECT_EQ(f.engine->current_leader(), elected[0].node_id);

    auto nodes = f.engine->nodes();
    auto crashed = std::find_if(nodes.begin(), nodes.end(), [&leader](auto const& n) { return n.id == leader; });
    ASSERT_NE(crashed, nodes.end());
    EXPECT_EQ(crashed->status, lh::node_status::crashed);
    EXPECT_FALSE(crashed->has_lease);
  }
}

/// @test crashing a follower does not disturb the leader, and the follower never competes again.
TEST(election_engine_impl, crash_follower) {
  fixture f;
  f.engine->start_election(lh::backend_kind::ttl_key);
  f.scheduler.advance(2000ms);
  auto leader = f.engine->current_leader();
  std::string follower;
  for (auto const& n : f.engine->nodes()) {
    if (n.status == lh::node_status::follower) {
      follower = n.id;
      break;
    }
  }
  ASSERT_NE(follower, "");

  f.events.clear();
  f.engine->crash_node(follower);
  ASSERT_EQ(f.events.size(), 1U);
  EXPECT_EQ(f.events[0], lh::election_event::crashed(follower));

  // ... crashing it again, or crashing an unknown node ...
  f.engine->crash_node(follower);
  EXPECT_EQ(f.events.size(), 1U);
  EXPECT_THROW(f.engine->crash_node("node-42"), std::invalid_argument);

  f.scheduler.advance(30000ms);
  EXPECT_EQ(f.engine->current_leader(), leader);
  for (auto const& e : f.events) {
    if (e.node_id == follower) {
      EXPECT_EQ(e.type, lh::event_type::node_crashed);
    }
  }
  EXPECT_EQ(f.count(lh::node_status::crashed), 1U);
}

/// @test a leader that cannot renew reports the loss, becomes a follower and competes again at once.
TEST(election_engine_impl, renewal_failure) {
  fixture f;
  f.engine->start_election(lh::backend_kind::conditional_write);
  f.scheduler.advance(2000ms);
  auto leader = f.engine->current_leader();
  ASSERT_NE(leader, "");

  // ... the record disappears behind the leader's back, so the next renewal fails ...
  f.documents->delete_all();
  f.events.clear();
  // ... the first heartbeat comes before any follower retries ...
  f.scheduler.advance(3000ms);
  auto lost = std::find(f.events.begin(), f.events.end(), lh::election_event::lost(leader));
  ASSERT_NE(lost, f.events.end());
  ASSERT_GE(std::distance(lost, f.events.end()), std::ptrdiff_t(3));
  EXPECT_EQ((lost + 1)->type, lh::event_type::node_update);
  EXPECT_EQ((lost + 1)->status, lh::node_status::follower);
  EXPECT_EQ((lost + 2)->type, lh::event_type::node_update);
  EXPECT_EQ((lost + 2)->status, lh::node_status::competing);

  // ... some node, maybe the same one, wins the record back ...
  f.scheduler.advance(7000ms);
  EXPECT_EQ(f.count(lh::node_status::leader), 1U);
  EXPECT_EQ(f.events_of(lh::event_type::leader_elected).size(), 1U);
}

/// @test at most one node believes it holds a valid lease at any time.
TEST(election_engine_impl, mutual_exclusion) {
  for (auto kind : {lh::backend_kind::conditional_write, lh::backend_kind::ttl_key}) {
    for (std::uint64_t seed = 1; seed != 11; ++seed) {
      SCOPED_TRACE(seed);
      fixture f(seed);
      f.engine->start_election(kind);
      std::size_t max_leaders = 0;
      auto check = [&f, &max_leaders]() { max_leaders = std::max(max_leaders, f.valid_leaders()); };
      f.scheduler.advance(20000ms, check);
      f.engine->crash_node(f.engine->current_leader());
      f.scheduler.advance(20000ms, check);
      f.engine->crash_node(f.engine->current_leader());
      f.scheduler.advance(20000ms, check);
      EXPECT_EQ(max_leaders, 1U);
      EXPECT_EQ(f.count(lh::node_status::crashed), 2U);
      EXPECT_EQ(f.count(lh::node_status::leader), 1U);
    }
  }
}

/// @test stopping cancels every timer, and no transition happens afterwards.
TEST(election_engine_impl, stop_cancels_timers) {
  fixture f;
  f.engine->start_election(lh::backend_kind::ttl_key);
  f.scheduler.advance(2000ms);
  EXPECT_GT(f.scheduler.pending(), 0U);

  auto before = f.engine->nodes();
  f.events.clear();
  f.engine->stop_election();
  EXPECT_FALSE(f.engine->running());
  EXPECT_EQ(f.scheduler.pending(), 0U);
  EXPECT_EQ(f.engine->pending_timers(), 0);

  f.scheduler.advance(60000ms);
  EXPECT_TRUE(f.events.empty());
  // ... the statuses are kept ...
  auto after = f.engine->nodes();
  ASSERT_EQ(before.size(), after.size());
  for (std::size_t i = 0; i != before.size(); ++i) {
    EXPECT_EQ(before[i].status, after[i].status);
  }
  EXPECT_EQ(f.engine->active_backend(), lh::backend_kind::ttl_key);

  // ... stopping twice is harmless ...
  EXPECT_NO_THROW(f.engine->stop_election());
  EXPECT_TRUE(f.events.empty());
}

/// @test resetting twice in a row only reports the first reset.
TEST(election_engine_impl, reset_is_idempotent) {
  fixture f;
  f.engine->start_election(lh::backend_kind::conditional_write);
  f.scheduler.advance(2000ms);
  f.engine->crash_node("node-3");

  f.events.clear();
  f.engine->reset_election();
  ASSERT_EQ(f.events.size(), 1U);
  EXPECT_EQ(f.events[0], lh::election_event::reset());
  EXPECT_EQ(f.count(lh::node_status::idle), 5U);
  EXPECT_EQ(f.scheduler.pending(), 0U);

  f.engine->reset_election();
  EXPECT_EQ(f.events.size(), 1U);

  // ... a fresh engine also reports its first reset only ...
  fixture g;
  g.engine->reset_election();
  g.engine->reset_election();
  EXPECT_EQ(g.events.size(), 1U);
}

/// @test crashed nodes sit out new elections until the next reset.
TEST(election_engine_impl, crashed_nodes_skip_elections) {
  fixture f;
  f.engine->crash_node("node-1");
  f.engine->crash_node("node-2");
  f.engine->start_election(lh::backend_kind::ttl_key);
  EXPECT_EQ(f.count(lh::node_status::competing), 3U);
  f.scheduler.advance(2000ms);
  auto leader = f.engine->current_leader();
  EXPECT_NE(leader, "node-1");
  EXPECT_NE(leader, "node-2");
  EXPECT_EQ(f.count(lh::node_status::crashed), 2U);

  f.engine->reset_election();
  f.engine->start_election(lh::backend_kind::ttl_key);
  EXPECT_EQ(f.count(lh::node_status::competing), 5U);
}

/// @test starting an election while one runs replaces it.
TEST(election_engine_impl, restart) {
  fixture f;
  f.engine->start_election(lh::backend_kind::conditional_write);
  f.scheduler.advance(2000ms);
  ASSERT_NE(f.engine->current_leader(), "");

  f.events.clear();
  f.engine->start_election(lh::backend_kind::ttl_key);
  EXPECT_EQ(f.engine->active_backend(), lh::backend_kind::ttl_key);
  ASSERT_FALSE(f.events.empty());
  EXPECT_EQ(f.events.front(), lh::election_event::started("ttl-key"));
  EXPECT_EQ(f.count(lh::node_status::competing), 5U);
  EXPECT_EQ(f.scheduler.pending(), 5U);

  f.scheduler.advance(2000ms);
  EXPECT_EQ(f.count(lh::node_status::leader), 1U);
  EXPECT_EQ(f.events_of(lh::event_type::leader_elected).size(), 1U);
}

/// @test a backend that cannot be initialized makes start_election() fail, and leaves the engine stopped.
TEST(election_engine_impl, start_failure) {
  scheduler_type scheduler(start_time);
  std::vector<lh::election_event> events;
  lh::engine_config config;
  config.clock = scheduler.clock();
  engine_type engine(
      scheduler.queue(), config,
      [](lh::backend_kind) -> std::unique_ptr<lh::storage_backend> { return std::make_unique<broken_backend>(); },
      lh::make_event_sink([&events](lh::election_event const& e) { events.push_back(e); }));

  EXPECT_THROW(engine.start_election(lh::backend_kind::ttl_key), std::runtime_error);
  EXPECT_FALSE(engine.running());
  EXPECT_TRUE(events.empty());
  EXPECT_EQ(scheduler.pending(), 0U);
  for (auto const& n : engine.nodes()) {
    EXPECT_EQ(n.status, lh::node_status::idle);
  }
}

/// @test exceptions raised by the event sink do not interrupt the election.
TEST(election_engine_impl, sink_exceptions_are_ignored) {
  scheduler_type scheduler(start_time);
  lh::engine_config config;
  config.clock = scheduler.clock();
  config.seed = 7;
  auto keys = std::make_shared<lh::memory_ttl_key_store>(scheduler.clock());
  engine_type engine(
      scheduler.queue(), config, lh::make_backend_factory(nullptr, keys, config.lease_duration),
      lh::make_event_sink([](lh::election_event const&) { throw std::runtime_error("transport closed"); }));

  EXPECT_NO_THROW(engine.start_election(lh::backend_kind::ttl_key));
  scheduler.advance(2000ms);
  EXPECT_NE(engine.current_leader(), "");
}
