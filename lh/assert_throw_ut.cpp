#include "lh/assert_throw.hpp"

#include <gmock/gmock.h>

/**
 * @test Verify that LH_ASSERT_THROW() works as expected.
 */
TEST(assert_throw, basic) {
  ASSERT_THROW(lh::assert_throw_impl("foo", "bar()", "bar.cc", 20), lh::invariant_error);

  ASSERT_THROW(LH_ASSERT_THROW(false), std::runtime_error);
  ASSERT_NO_THROW(LH_ASSERT_THROW(true));
}

/**
 * @test Verify that the exception describes the failed predicate.
 */
TEST(assert_throw, message) {
  try {
    int leases = 2;
    LH_ASSERT_THROW(leases <= 1);
    FAIL() << "LH_ASSERT_THROW() should have raised";
  } catch (lh::invariant_error const& ex) {
    using namespace ::testing;
    EXPECT_EQ(ex.predicate(), "leases <= 1");
    EXPECT_THAT(ex.what(), HasSubstr("invariant (leases <= 1) violated"));
    EXPECT_THAT(ex.what(), HasSubstr("assert_throw_ut.cpp"));
  }
}
