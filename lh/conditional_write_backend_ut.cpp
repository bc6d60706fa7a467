#include "lh/conditional_write_backend.hpp"
#include <lh/assert_throw.hpp>
#include <lh/memory_document_store.hpp>

#include <gmock/gmock.h>

#include <atomic>
#include <thread>
#include <vector>

namespace {
using namespace std::chrono_literals;

/// A document store that delegates to a memory store by default, tests override individual calls.
class mock_document_store : public lh::document_store {
public:
  mock_document_store() {
    using namespace ::testing;
    ON_CALL(*this, find_one_and_update(_, _, _))
        .WillByDefault(Invoke(&real, &lh::memory_document_store::find_one_and_update));
    ON_CALL(*this, insert_one(_)).WillByDefault(Invoke(&real, &lh::memory_document_store::insert_one));
    ON_CALL(*this, find_one(_, _)).WillByDefault(Invoke(&real, &lh::memory_document_store::find_one));
    ON_CALL(*this, delete_one(_)).WillByDefault(Invoke(&real, &lh::memory_document_store::delete_one));
    ON_CALL(*this, delete_all()).WillByDefault(Invoke(&real, &lh::memory_document_store::delete_all));
  }

  MOCK_METHOD3(
      find_one_and_update, bool(lh::document_filter const&, lh::proto::lease_record const&, lh::proto::lease_record*));
  MOCK_METHOD1(insert_one, void(lh::proto::lease_record const&));
  MOCK_METHOD2(find_one, bool(std::string const&, lh::proto::lease_record*));
  MOCK_METHOD1(delete_one, bool(std::string const&));
  MOCK_METHOD0(delete_all, void());

  lh::memory_document_store real;
};

lh::clock_type::time_point const t0(1500000000000ms);
} // anonymous namespace

/**
 * @test Verify that the first node acquires an absent lease and the others cannot until it expires.
 */
TEST(conditional_write_backend, acquire_and_expire) {
  auto store = std::make_shared<lh::memory_document_store>();
  lh::conditional_write_backend backend(store, 10000ms);
  EXPECT_EQ(backend.kind(), lh::backend_kind::conditional_write);

  ASSERT_TRUE(backend.try_acquire("node-1", t0));
  lh::proto::lease_record record;
  ASSERT_TRUE(store->find_one("current-leader", &record));
  EXPECT_EQ(record.owner(), "node-1");
  EXPECT_EQ(record.expires_at(), lh::to_epoch_ms(t0 + 10000ms));
  EXPECT_EQ(record.updated_at(), lh::to_epoch_ms(t0));

  EXPECT_FALSE(backend.try_acquire("node-2", t0 + 1000ms));
  // ... the lease is valid until its expiration, inclusive ...
  EXPECT_FALSE(backend.try_acquire("node-2", t0 + 10000ms));
  ASSERT_TRUE(backend.try_acquire("node-2", t0 + 10001ms));
  ASSERT_TRUE(store->find_one("current-leader", &record));
  EXPECT_EQ(record.owner(), "node-2");
  EXPECT_EQ(record.expires_at(), lh::to_epoch_ms(t0 + 20001ms));
  EXPECT_EQ(store->size(), 1U);
}

/**
 * @test Verify that only the owner can renew the lease.
 */
TEST(conditional_write_backend, renewal_fencing) {
  auto store = std::make_shared<lh::memory_document_store>();
  lh::conditional_write_backend backend(store, 10000ms);

  EXPECT_FALSE(backend.renew("node-1", t0));
  ASSERT_TRUE(backend.try_acquire("node-1", t0));

  lh::proto::lease_record before;
  ASSERT_TRUE(store->find_one("current-leader", &before));
  EXPECT_FALSE(backend.renew("node-2", t0 + 3000ms));
  lh::proto::lease_record after;
  ASSERT_TRUE(store->find_one("current-leader", &after));
  EXPECT_EQ(before.SerializeAsString(), after.SerializeAsString());

  EXPECT_TRUE(backend.renew("node-1", t0 + 3000ms));
  ASSERT_TRUE(store->find_one("current-leader", &after));
  EXPECT_EQ(after.owner(), "node-1");
  EXPECT_EQ(after.expires_at(), lh::to_epoch_ms(t0 + 13000ms));
}

/**
 * @test Verify release and reset.
 */
TEST(conditional_write_backend, release_and_reset) {
  auto store = std::make_shared<lh::memory_document_store>();
  lh::conditional_write_backend backend(store, 10000ms);

  ASSERT_TRUE(backend.try_acquire("node-1", t0));
  backend.release();
  EXPECT_EQ(store->size(), 0U);
  EXPECT_NO_THROW(backend.release());
  ASSERT_TRUE(backend.try_acquire("node-2", t0));

  backend.reset();
  EXPECT_EQ(store->size(), 0U);
}

/**
 * @test Verify that two nodes racing for an absent record are resolved by the duplicate key on insert.
 */
TEST(conditional_write_backend, insert_race) {
  using namespace ::testing;
  auto store = std::make_shared<NiceMock<mock_document_store>>();
  lh::conditional_write_backend backend(store, 10000ms);

  // ... node-1 finds nothing to update, and before it inserts, node-2 runs its whole acquisition ...
  bool node2_result = false;
  EXPECT_CALL(*store, find_one_and_update(_, _, _))
      .WillOnce(Invoke([&](lh::document_filter const& f, lh::proto::lease_record const& u, lh::proto::lease_record* a) {
        bool r = store->real.find_one_and_update(f, u, a);
        node2_result = backend.try_acquire("node-2", t0);
        return r;
      }))
      .WillRepeatedly(Invoke(&store->real, &lh::memory_document_store::find_one_and_update));
  EXPECT_CALL(*store, insert_one(_)).Times(2);

  EXPECT_FALSE(backend.try_acquire("node-1", t0));
  EXPECT_TRUE(node2_result);

  lh::proto::lease_record record;
  ASSERT_TRUE(store->real.find_one("current-leader", &record));
  EXPECT_EQ(record.owner(), "node-2");
}

/**
 * @test Verify that exactly one of many concurrent callers acquires an absent lease.
 */
TEST(conditional_write_backend, concurrent_acquire) {
  auto store = std::make_shared<lh::memory_document_store>();
  lh::conditional_write_backend backend(store, 10000ms);

  for (int round = 0; round != 20; ++round) {
    backend.reset();
    std::atomic<int> winners(0);
    std::vector<std::thread> threads;
    for (int i = 0; i != 5; ++i) {
      threads.emplace_back([&backend, &winners, i]() {
        if (backend.try_acquire("node-" + std::to_string(i + 1), t0)) {
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
 * @test Verify that store errors are reported as a failure to acquire or renew.
 */
TEST(conditional_write_backend, errors_are_failures) {
  using namespace ::testing;
  auto store = std::make_shared<NiceMock<mock_document_store>>();
  lh::conditional_write_backend backend(store, 10000ms);

  EXPECT_CALL(*store, find_one_and_update(_, _, _)).WillRepeatedly(Throw(std::runtime_error("connection lost")));
  EXPECT_CALL(*store, delete_one(_)).WillOnce(Throw(std::runtime_error("connection lost")));
  EXPECT_CALL(*store, delete_all()).WillOnce(Throw(std::runtime_error("connection lost")));

  EXPECT_FALSE(backend.try_acquire("node-1", t0));
  EXPECT_FALSE(backend.renew("node-1", t0));
  EXPECT_NO_THROW(backend.release());
  EXPECT_THROW(backend.reset(), std::runtime_error);
}

/**
 * @test Verify that a closed backend does not touch the store.
 */
TEST(conditional_write_backend, closed) {
  using namespace ::testing;
  auto store = std::make_shared<StrictMock<mock_document_store>>();
  lh::conditional_write_backend backend(store, 10000ms);
  backend.close();

  EXPECT_FALSE(backend.try_acquire("node-1", t0));
  EXPECT_FALSE(backend.renew("node-1", t0));
  EXPECT_NO_THROW(backend.release());
  EXPECT_THROW(backend.reset(), lh::invariant_error);
}
