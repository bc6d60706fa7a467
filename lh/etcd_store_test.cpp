#include "lh/etcd_document_store.hpp"
#include <lh/conditional_write_backend.hpp>
#include <lh/etcd_ttl_key_store.hpp>
#include <lh/ttl_key_backend.hpp>

#include <gtest/gtest.h>

#include <thread>

/// Define helper types and functions used in these tests
namespace {
std::string const address = "localhost:22379";

std::string unique_prefix(char const* name) {
  return std::string("leasehold-test/") + name + "/" +
         std::to_string(std::chrono::system_clock::now().time_since_epoch().count()) + "/";
}
} // anonymous namespace

/**
 * @test Verify that the etcd document store implements conditional updates and unique inserts.
 */
TEST(etcd_store_test, document_store) {
  using namespace std::chrono_literals;
  auto etcd_channel = grpc::CreateChannel(address, grpc::InsecureChannelCredentials());
  lh::etcd_document_store store(etcd_channel, unique_prefix("documents"));

  lh::proto::lease_record record;
  record.set_id("current-leader");
  record.set_owner("node-1");
  record.set_expires_at(2000);
  record.set_updated_at(1000);
  store.insert_one(record);
  EXPECT_THROW(store.insert_one(record), lh::duplicate_key_error);

  lh::document_filter filter;
  filter.id = "current-leader";
  filter.match_owner = true;
  filter.owner = "node-2";
  lh::proto::lease_record update;
  update.set_expires_at(5000);
  update.set_updated_at(4000);
  EXPECT_FALSE(store.find_one_and_update(filter, update, nullptr));

  filter.owner = "node-1";
  lh::proto::lease_record after;
  ASSERT_TRUE(store.find_one_and_update(filter, update, &after));
  EXPECT_EQ(after.owner(), "node-1");
  EXPECT_EQ(after.expires_at(), 5000);

  ASSERT_TRUE(store.find_one("current-leader", &after));
  EXPECT_EQ(after.updated_at(), 4000);

  EXPECT_TRUE(store.delete_one("current-leader"));
  EXPECT_FALSE(store.delete_one("current-leader"));
  store.insert_one(record);
  store.delete_all();
  EXPECT_FALSE(store.find_one("current-leader", nullptr));
}

/**
 * @test Verify that the etcd TTL store expires keys.
 */
TEST(etcd_store_test, ttl_key_store) {
  using namespace std::chrono_literals;
  auto etcd_channel = grpc::CreateChannel(address, grpc::InsecureChannelCredentials());
  lh::etcd_ttl_key_store store(etcd_channel, unique_prefix("keys"));

  EXPECT_FALSE(store.expire("leader", 1000ms));
  ASSERT_TRUE(store.set_if_absent("leader", "node-1", 1000ms));
  EXPECT_FALSE(store.set_if_absent("leader", "node-2", 1000ms));
  std::string value;
  ASSERT_TRUE(store.get("leader", &value));
  EXPECT_EQ(value, "node-1");

  // ... refresh to a longer TTL, the original lease expires without taking the key ...
  ASSERT_TRUE(store.expire("leader", 5000ms));
  std::this_thread::sleep_for(2500ms);
  ASSERT_TRUE(store.get("leader", &value));
  EXPECT_EQ(value, "node-1");

  EXPECT_TRUE(store.remove("leader"));
  EXPECT_FALSE(store.get("leader", nullptr));

  ASSERT_TRUE(store.set_if_absent("leader", "node-3", 1000ms));
  std::this_thread::sleep_for(3000ms);
  EXPECT_FALSE(store.get("leader", nullptr));
}

/**
 * @test Verify both backends on a live etcd server.
 */
TEST(etcd_store_test, backends) {
  using namespace std::chrono_literals;
  auto etcd_channel = grpc::CreateChannel(address, grpc::InsecureChannelCredentials());
  auto now = lh::clock_type::now();

  lh::conditional_write_backend a(
      std::make_shared<lh::etcd_document_store>(etcd_channel, unique_prefix("backend-a")), 10000ms);
  a.reset();
  EXPECT_TRUE(a.try_acquire("node-1", now));
  EXPECT_FALSE(a.try_acquire("node-2", now));
  EXPECT_TRUE(a.renew("node-1", now + 3000ms));
  EXPECT_FALSE(a.renew("node-2", now + 3000ms));
  EXPECT_TRUE(a.try_acquire("node-2", now + 13001ms));
  a.release();

  lh::ttl_key_backend b(std::make_shared<lh::etcd_ttl_key_store>(etcd_channel, unique_prefix("backend-b")), 10000ms);
  b.reset();
  EXPECT_TRUE(b.try_acquire("node-1", now));
  EXPECT_FALSE(b.try_acquire("node-2", now));
  EXPECT_TRUE(b.renew("node-1", now));
  EXPECT_FALSE(b.renew("node-2", now));
  b.release();
  EXPECT_TRUE(b.try_acquire("node-2", now));
  b.release();
}
