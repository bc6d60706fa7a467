#include "lh/memory_ttl_key_store.hpp"

#include <gtest/gtest.h>

/**
 * @test Verify the basic operations of lh::memory_ttl_key_store.
 */
TEST(memory_ttl_key_store, basic) {
  using namespace std::chrono_literals;
  lh::clock_type::time_point now(1000000ms);
  lh::memory_ttl_key_store store([&now]() { return now; });

  std::string value;
  EXPECT_FALSE(store.get("leader", &value));
  EXPECT_FALSE(store.expire("leader", 10000ms));
  EXPECT_FALSE(store.remove("leader"));

  EXPECT_TRUE(store.set_if_absent("leader", "node-1", 10000ms));
  EXPECT_FALSE(store.set_if_absent("leader", "node-2", 10000ms));
  ASSERT_TRUE(store.get("leader", &value));
  EXPECT_EQ(value, "node-1");
  EXPECT_EQ(store.expiration("leader"), now + 10000ms);

  EXPECT_TRUE(store.remove("leader"));
  EXPECT_FALSE(store.get("leader", &value));
  EXPECT_EQ(store.expiration("leader"), lh::clock_type::time_point());
}

/**
 * @test Verify that keys expire at their deadline.
 */
TEST(memory_ttl_key_store, expiration) {
  using namespace std::chrono_literals;
  lh::clock_type::time_point now(1000000ms);
  lh::memory_ttl_key_store store([&now]() { return now; });

  ASSERT_TRUE(store.set_if_absent("leader", "node-1", 10000ms));
  now += 9999ms;
  EXPECT_TRUE(store.get("leader", nullptr));

  // ... refreshing the TTL counts from the current time ...
  EXPECT_TRUE(store.expire("leader", 10000ms));
  now += 9999ms;
  EXPECT_TRUE(store.get("leader", nullptr));
  now += 1ms;
  EXPECT_FALSE(store.get("leader", nullptr));
  EXPECT_FALSE(store.expire("leader", 10000ms));

  // ... once expired the key can be acquired again ...
  EXPECT_TRUE(store.set_if_absent("leader", "node-2", 10000ms));
  std::string value;
  ASSERT_TRUE(store.get("leader", &value));
  EXPECT_EQ(value, "node-2");
}
