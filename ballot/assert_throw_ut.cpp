#include "ballot/assert_throw.hpp"

#include <gmock/gmock.h>

#include <stdexcept>

/**
 * @test Verify that BALLOT_ASSERT_THROW() works as expected.
 */
TEST(assert_throw, basic) {
  ASSERT_THROW(ballot::assert_throw_impl("foo", "bar()", "bar.cc", 20), std::exception);

  ASSERT_THROW(BALLOT_ASSERT_THROW(false), std::runtime_error);
  ASSERT_NO_THROW(BALLOT_ASSERT_THROW(true));
}

/**
 * @test Verify that the exception describes the failed predicate.
 */
TEST(assert_throw, message) {
  int pending = 2;
  try {
    BALLOT_ASSERT_THROW(pending == 0);
    FAIL() << "the predicate should have failed";
  } catch (std::runtime_error const& ex) {
    EXPECT_THAT(ex.what(), ::testing::HasSubstr("pending == 0"));
    EXPECT_THAT(ex.what(), ::testing::HasSubstr("assert_throw_ut.cpp"));
  }
}
