#include "lh/detail/append_annotations.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <string>

TEST(append_annotations, basic) {
  std::ostringstream os;
  lh::detail::append_annotations(os);
  EXPECT_EQ(os.str(), "");

  lh::detail::append_annotations(os, "node=", std::string("node-1"), " lease=", 10000, "ms");
  EXPECT_EQ(os.str(), "node=node-1 lease=10000ms");
}
