#include "lh/log_severity.hpp"

#include <gtest/gtest.h>

#include <sstream>

TEST(log_severity, base) {
  ASSERT_LT(lh::severity::LOWEST, lh::severity::HIGHEST);

  using s = lh::severity;
  std::ostringstream os;
  os << s::trace << " " << s::debug << " " << s::info << " " << s::notice << " " << s::warning << " " << s::error << " "
     << s::critical << " " << s::alert << " " << s::fatal;
  ASSERT_EQ(os.str(), "trace debug info notice warning error critical alert fatal");
}

/**
 * @test Verify that severity names can be parsed back.
 */
TEST(log_severity, parse) {
  EXPECT_EQ(lh::parse_severity("trace"), lh::severity::trace);
  EXPECT_EQ(lh::parse_severity("warning"), lh::severity::warning);
  EXPECT_EQ(lh::parse_severity("fatal"), lh::severity::fatal);
  EXPECT_THROW(lh::parse_severity("loud"), std::invalid_argument);
  EXPECT_THROW(lh::parse_severity(""), std::invalid_argument);
}
