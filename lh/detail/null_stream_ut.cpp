#include "lh/detail/null_stream.hpp"
#include <lh/node_status.hpp>

#include <gtest/gtest.h>

#include <chrono>
#include <iomanip>
#include <string>

/**
 * @test Verify that anything the engine logs can be discarded.
 */
TEST(null_stream, discards_everything) {
  lh::detail::null_stream n;

  std::string id("node-3");
  EXPECT_NO_THROW(n << id << " is now " << lh::node_status::leader);
  EXPECT_NO_THROW(n << "lease expires at " << std::hex << 1500000010000LL << std::endl);
  auto& r = n << std::chrono::milliseconds(42).count();
  EXPECT_EQ(&r, &n);
}
