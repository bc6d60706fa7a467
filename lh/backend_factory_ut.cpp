#include "lh/backend_factory.hpp"
#include <lh/memory_document_store.hpp>
#include <lh/memory_ttl_key_store.hpp>

#include <gtest/gtest.h>

/**
 * @test Verify that the factory creates the requested backend on the configured store.
 */
TEST(backend_factory, basic) {
  using namespace std::chrono_literals;
  auto documents = std::make_shared<lh::memory_document_store>();
  auto keys = std::make_shared<lh::memory_ttl_key_store>();
  auto factory = lh::make_backend_factory(documents, keys, 10000ms);

  auto a = factory(lh::parse_backend_kind("A"));
  ASSERT_TRUE(a.get() != nullptr);
  EXPECT_EQ(a->kind(), lh::backend_kind::conditional_write);
  ASSERT_TRUE(a->try_acquire("node-1", lh::clock_type::now()));
  EXPECT_EQ(documents->size(), 1U);

  auto b = factory(lh::parse_backend_kind("B"));
  ASSERT_TRUE(b.get() != nullptr);
  EXPECT_EQ(b->kind(), lh::backend_kind::ttl_key);
  ASSERT_TRUE(b->try_acquire("node-2", lh::clock_type::now()));
  EXPECT_TRUE(keys->get("leader", nullptr));
}

/**
 * @test Verify that asking for a backend without a store fails.
 */
TEST(backend_factory, missing_store) {
  using namespace std::chrono_literals;
  auto factory = lh::make_backend_factory(std::make_shared<lh::memory_document_store>(), nullptr, 10000ms);
  EXPECT_NO_THROW(factory(lh::backend_kind::conditional_write));
  EXPECT_THROW(factory(lh::backend_kind::ttl_key), std::invalid_argument);
}
