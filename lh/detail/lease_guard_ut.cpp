#include "lh/detail/lease_guard.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

namespace {
/// Record the revoked leases instead of calling etcd.
struct fake_lease_client {
  void revoke_lease(std::int64_t lease_id) {
    revoked.push_back(lease_id);
    if (fail) {
      throw std::runtime_error("etcd unavailable");
    }
  }

  std::vector<std::int64_t> revoked;
  bool fail = false;
};

using guard_type = lh::detail::lease_guard<fake_lease_client>;
} // anonymous namespace

/**
 * @test Verify that a lease attached to a key is kept.
 */
TEST(lease_guard, attached) {
  fake_lease_client client;
  {
    guard_type lease(client, 0x1234);
    EXPECT_EQ(lease.lease_id(), 0x1234);
    lease.attached();
  }
  EXPECT_TRUE(client.revoked.empty());
}

/**
 * @test Verify that a lease is revoked when the key was not created.
 */
TEST(lease_guard, not_attached) {
  fake_lease_client client;
  {
    guard_type lease(client, 0x1234);
  }
  ASSERT_EQ(client.revoked.size(), 1U);
  EXPECT_EQ(client.revoked[0], 0x1234);
}

/**
 * @test Verify that a lease is revoked when the transaction raises.
 */
TEST(lease_guard, transaction_raises) {
  fake_lease_client client;
  auto set_if_absent = [&client]() {
    guard_type lease(client, 0x42);
    throw std::runtime_error("Txn failed: deadline exceeded");
  };
  EXPECT_THROW(set_if_absent(), std::runtime_error);
  ASSERT_EQ(client.revoked.size(), 1U);
  EXPECT_EQ(client.revoked[0], 0x42);
}

/**
 * @test Verify that a failure to revoke is logged, not raised.
 */
TEST(lease_guard, revoke_fails) {
  fake_lease_client client;
  client.fail = true;
  EXPECT_NO_THROW({ guard_type lease(client, 0x7); });
  EXPECT_EQ(client.revoked.size(), 1U);
}
