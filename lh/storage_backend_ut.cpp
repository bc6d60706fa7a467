#include "lh/storage_backend.hpp"

#include <gtest/gtest.h>
#include <sstream>

/**
 * @test Verify that backend names are parsed and printed as expected.
 */
TEST(storage_backend, backend_kind) {
  using k = lh::backend_kind;
  EXPECT_EQ(lh::parse_backend_kind("A"), k::conditional_write);
  EXPECT_EQ(lh::parse_backend_kind("conditional-write"), k::conditional_write);
  EXPECT_EQ(lh::parse_backend_kind("B"), k::ttl_key);
  EXPECT_EQ(lh::parse_backend_kind("ttl-key"), k::ttl_key);
  EXPECT_THROW(lh::parse_backend_kind("C"), std::invalid_argument);
  EXPECT_THROW(lh::parse_backend_kind(""), std::invalid_argument);

  std::ostringstream os;
  os << k::conditional_write << " " << k::ttl_key;
  EXPECT_EQ(os.str(), "conditional-write ttl-key");
}
