#include "lh/ttl_key_backend.hpp"
#include <lh/assert_throw.hpp>
#include <lh/memory_ttl_key_store.hpp>

#include <gmock/gmock.h>

#include <atomic>
#include <thread>
#include <vector>

namespace {
using namespace std::chrono_literals;

/// A ttl_key_store that delegates to a memory store by default, tests override individual calls.
class mock_ttl_key_store : public lh::ttl_key_store {
public:
  explicit mock_ttl_key_store(lh::clock_function clock)
      : real(std::move(clock)) {
    using namespace ::testing;
    ON_CALL(*this, set_if_absent(_, _, _)).WillByDefault(Invoke(&real, &lh::memory_ttl_key_store::set_if_absent));
    ON_CALL(*this, get(_, _)).WillByDefault(Invoke(&real, &lh::memory_ttl_key_store::get));
    ON_CALL(*this, expire(_, _)).WillByDefault(Invoke(&real, &lh::memory_ttl_key_store::expire));
    ON_CALL(*this, remove(_)).WillByDefault(Invoke(&real, &lh::memory_ttl_key_store::remove));
  }

  MOCK_METHOD3(set_if_absent, bool(std::string const&, std::string const&, std::chrono::milliseconds));
  MOCK_METHOD2(get, bool(std::string const&, std::string*));
  MOCK_METHOD2(expire, bool(std::string const&, std::chrono::milliseconds));
  MOCK_METHOD1(remove, bool(std::string const&));

  lh::memory_ttl_key_store real;
};
} // anonymous namespace

/**
 * @test Verify acquisition, expiration and renewal fencing.
 */
TEST(ttl_key_backend, basic) {
  lh::clock_type::time_point now(1500000000000ms);
  auto store = std::make_shared<lh::memory_ttl_key_store>([&now]() { return now; });
  lh::ttl_key_backend backend(store, 10000ms);
  EXPECT_EQ(backend.kind(), lh::backend_kind::ttl_key);

  ASSERT_TRUE(backend.try_acquire("node-1", now));
  EXPECT_FALSE(backend.try_acquire("node-2", now));
  EXPECT_EQ(store->expiration("leader"), now + 10000ms);

  now += 3000ms;
  EXPECT_FALSE(backend.renew("node-2", now));
  EXPECT_EQ(store->expiration("leader"), now + 7000ms);
  EXPECT_TRUE(backend.renew("node-1", now));
  EXPECT_EQ(store->expiration("leader"), now + 10000ms);

  now += 10000ms;
  EXPECT_FALSE(backend.renew("node-1", now));
  ASSERT_TRUE(backend.try_acquire("node-2", now));
  std::string owner;
  ASSERT_TRUE(store->get("leader", &owner));
  EXPECT_EQ(owner, "node-2");

  backend.release();
  EXPECT_FALSE(store->get("leader", nullptr));
  ASSERT_TRUE(backend.try_acquire("node-3", now));
  backend.reset();
  EXPECT_FALSE(store->get("leader", nullptr));
}

/**
 * @test Demonstrate the non-atomic renewal: the old owner extends the lease of the new owner.
 */
TEST(ttl_key_backend, renewal_race) {
  using namespace ::testing;
  lh::clock_type::time_point now(1500000000000ms);
  auto store = std::make_shared<NiceMock<mock_ttl_key_store>>([&now]() { return now; });
  lh::ttl_key_backend backend(store, 10000ms);

  ASSERT_TRUE(backend.try_acquire("node-1", now));
  now += 9999ms;

  // ... node-1 reads the key just before it expires, between the read and the refresh the key expires and node-2
  // acquires it ...
  bool node2_acquired = false;
  lh::clock_type::time_point node2_expiration;
  EXPECT_CALL(*store, get(_, _)).WillOnce(Invoke([&](std::string const& key, std::string* value) {
    bool r = store->real.get(key, value);
    now += 2ms;
    node2_acquired = backend.try_acquire("node-2", now);
    node2_expiration = store->real.expiration(key);
    now += 1000ms;
    return r;
  }));

  EXPECT_TRUE(backend.renew("node-1", now));
  EXPECT_TRUE(node2_acquired);

  // ... the renewal of node-1 refreshed the lease that node-2 owns ...
  std::string owner;
  ASSERT_TRUE(store->real.get("leader", &owner));
  EXPECT_EQ(owner, "node-2");
  EXPECT_EQ(store->real.expiration("leader"), now + 10000ms);
  EXPECT_GT(store->real.expiration("leader"), node2_expiration);
}

/**
 * @test Verify that a renewal succeeds when the key vanishes between reading the owner and refreshing it.
 */
TEST(ttl_key_backend, renewal_key_vanishes) {
  using namespace ::testing;
  lh::clock_type::time_point now(1500000000000ms);
  auto store = std::make_shared<NiceMock<mock_ttl_key_store>>([&now]() { return now; });
  lh::ttl_key_backend backend(store, 10000ms);

  ASSERT_TRUE(backend.try_acquire("node-1", now));
  now += 3000ms;

  EXPECT_CALL(*store, get(_, _)).WillOnce(Invoke([&](std::string const& key, std::string* value) {
    bool r = store->real.get(key, value);
    store->real.remove(key);
    return r;
  }));
  EXPECT_CALL(*store, expire(_, _)).Times(1);

  // ... the refresh finds nothing, node-1 still believes it renewed ...
  EXPECT_TRUE(backend.renew("node-1", now));
  EXPECT_FALSE(store->real.get("leader", nullptr));
}

/**
 * @test Verify that exactly one of many concurrent callers acquires an absent lease.
 */
TEST(ttl_key_backend, concurrent_acquire) {
  auto store = std::make_shared<lh::memory_ttl_key_store>();
  lh::ttl_key_backend backend(store, 10000ms);

  for (int round = 0; round != 20; ++round) {
    backend.reset();
    std::atomic<int> winners(0);
    std::vector<std::thread> threads;
    for (int i = 0; i != 5; ++i) {
      threads.emplace_back([&backend, &winners, i]() {
        if (backend.try_acquire("node-" + std::to_string(i + 1), lh::clock_type::now())) {
          ++winners;
        }
      });
    }
    for (auto& t : threads) {
      t.join();
    }
    EXPECT_EQ(winners.load(), 1) << "round=" << round;
  }
}

/**
 * @test Verify that store errors are reported as failures, and closed backends do nothing.
 */
TEST(ttl_key_backend, errors_and_close) {
  using namespace ::testing;
  lh::clock_type::time_point now(1500000000000ms);
  auto store = std::make_shared<NiceMock<mock_ttl_key_store>>([&now]() { return now; });
  lh::ttl_key_backend backend(store, 10000ms);

  EXPECT_CALL(*store, set_if_absent(_, _, _)).WillOnce(Throw(std::runtime_error("connection reset")));
  EXPECT_CALL(*store, get(_, _)).WillOnce(Throw(std::runtime_error("connection reset")));
  EXPECT_CALL(*store, remove(_))
      .WillOnce(Throw(std::runtime_error("connection reset")))
      .WillOnce(Throw(std::runtime_error("connection reset")));
  EXPECT_FALSE(backend.try_acquire("node-1", now));
  EXPECT_FALSE(backend.renew("node-1", now));
  EXPECT_NO_THROW(backend.release());
  EXPECT_THROW(backend.reset(), std::runtime_error);

  Mock::VerifyAndClearExpectations(store.get());
  EXPECT_CALL(*store, set_if_absent(_, _, _)).Times(0);
  EXPECT_CALL(*store, get(_, _)).Times(0);
  EXPECT_CALL(*store, remove(_)).Times(0);
  backend.close();
  EXPECT_FALSE(backend.try_acquire("node-1", now));
  EXPECT_FALSE(backend.renew("node-1", now));
  EXPECT_NO_THROW(backend.release());
  EXPECT_THROW(backend.reset(), lh::invariant_error);
}
