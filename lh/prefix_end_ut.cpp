#include "lh/prefix_end.hpp"

#include <gmock/gmock.h>

/**
 * @test Verify that lh::prefix_end works as expected.
 */
TEST(prefix_end, basic) {
  ASSERT_EQ('/' + 1, '0');
  ASSERT_EQ(lh::prefix_end("leasehold/"), std::string("leasehold0"));
  ASSERT_EQ(lh::prefix_end("a"), std::string("b"));

  using namespace ::testing;
  ASSERT_THAT(lh::prefix_end("\xFF\xFF"), ElementsAre('\0'));
  ASSERT_THAT(lh::prefix_end(""), ElementsAre('\0'));
  ASSERT_THAT(lh::prefix_end("ABC\xFF"), ElementsAre('A', 'B', 'D'));
  ASSERT_THAT(lh::prefix_end("A\xFE"), ElementsAre('A', '\xFF'));
}
