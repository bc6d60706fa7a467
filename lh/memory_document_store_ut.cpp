#include "lh/memory_document_store.hpp"

#include <gtest/gtest.h>

namespace {
lh::proto::lease_record make_record(std::string owner, std::int64_t expires_at, std::int64_t updated_at) {
  lh::proto::lease_record r;
  r.set_id("current-leader");
  r.set_owner(std::move(owner));
  r.set_expires_at(expires_at);
  r.set_updated_at(updated_at);
  return r;
}
} // anonymous namespace

/**
 * @test Verify the filter semantics, in particular for missing expirations.
 */
TEST(document_filter, matches) {
  using namespace std::chrono_literals;
  lh::document_filter filter;
  filter.id = "current-leader";
  EXPECT_TRUE(filter.matches(make_record("node-1", 100, 0)));

  filter.match_expired = true;
  filter.expired_before = lh::clock_type::time_point(100ms);
  EXPECT_FALSE(filter.matches(make_record("node-1", 100, 0)));
  EXPECT_TRUE(filter.matches(make_record("node-1", 99, 0)));
  EXPECT_TRUE(filter.matches(make_record("node-1", 0, 0)));

  filter.match_expired = false;
  filter.match_owner = true;
  filter.owner = "node-2";
  EXPECT_FALSE(filter.matches(make_record("node-1", 100, 0)));
  EXPECT_TRUE(filter.matches(make_record("node-2", 100, 0)));

  auto other = make_record("node-2", 100, 0);
  other.set_id("another-record");
  EXPECT_FALSE(filter.matches(other));
}

/**
 * @test Verify the basic operations of lh::memory_document_store.
 */
TEST(memory_document_store, basic) {
  lh::memory_document_store store;
  EXPECT_EQ(store.size(), 0U);
  EXPECT_FALSE(store.find_one("current-leader", nullptr));

  store.insert_one(make_record("node-1", 1000, 10));
  EXPECT_THROW(store.insert_one(make_record("node-2", 2000, 20)), lh::duplicate_key_error);

  lh::proto::lease_record record;
  ASSERT_TRUE(store.find_one("current-leader", &record));
  EXPECT_EQ(record.owner(), "node-1");
  EXPECT_EQ(record.expires_at(), 1000);

  EXPECT_TRUE(store.delete_one("current-leader"));
  EXPECT_FALSE(store.delete_one("current-leader"));
  EXPECT_EQ(store.size(), 0U);

  store.insert_one(make_record("node-1", 1000, 10));
  store.delete_all();
  EXPECT_EQ(store.size(), 0U);
}

/**
 * @test Verify that lh::memory_document_store updates only matching records.
 */
TEST(memory_document_store, find_one_and_update) {
  lh::memory_document_store store;
  lh::document_filter filter;
  filter.id = "current-leader";
  filter.match_owner = true;
  filter.owner = "node-1";

  lh::proto::lease_record after;
  EXPECT_FALSE(store.find_one_and_update(filter, make_record("", 3000, 30), &after));

  store.insert_one(make_record("node-1", 1000, 10));
  ASSERT_TRUE(store.find_one_and_update(filter, make_record("", 3000, 30), &after));
  EXPECT_EQ(after.owner(), "node-1");
  EXPECT_EQ(after.expires_at(), 3000);
  EXPECT_EQ(after.updated_at(), 30);

  // ... a non-empty owner in the update replaces the owner ...
  ASSERT_TRUE(store.find_one_and_update(filter, make_record("node-2", 4000, 40), nullptr));
  EXPECT_FALSE(store.find_one_and_update(filter, make_record("", 5000, 50), &after));
  ASSERT_TRUE(store.find_one("current-leader", &after));
  EXPECT_EQ(after.owner(), "node-2");
  EXPECT_EQ(after.expires_at(), 4000);
}
