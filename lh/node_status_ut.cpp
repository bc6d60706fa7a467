#include "lh/node_status.hpp"

#include <gtest/gtest.h>
#include <sstream>

/**
 * @test Verify that the iostream operator for lh::node_status works as expected.
 */
TEST(node_status, streaming) {
  using s = lh::node_status;
  std::ostringstream os;
  os << s::idle << " " << s::competing << " " << s::leader << " " << s::follower << " " << s::crashed;
  ASSERT_EQ(os.str(), "idle competing leader follower crashed");
}
