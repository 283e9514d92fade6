#include <ballot/detail/exponential_backoff.hpp>

#include <gtest/gtest.h>

/**
 * @test Verify that ballot::detail::exponential_backoff rejects invalid arguments.
 */
TEST(exponential_backoff, arguments) {
  using namespace std::chrono_literals;
  EXPECT_THROW(ballot::detail::exponential_backoff(1s, 500ms, 5), std::invalid_argument);
  EXPECT_THROW(ballot::detail::exponential_backoff(1s, 1500ms, -1), std::invalid_argument);
  EXPECT_THROW(ballot::detail::exponential_backoff(1s, 1500ms, 0), std::invalid_argument);
  EXPECT_THROW(ballot::detail::exponential_backoff(0ms, 1500ms, 3), std::invalid_argument);
  EXPECT_NO_THROW(ballot::detail::exponential_backoff(1s, 1500ms, 1));
  EXPECT_NO_THROW(ballot::detail::exponential_backoff(1s, 1s, 1));
}

/**
 * @test Verify that ballot::detail::exponential_backoff doubles the delay up to the maximum.
 */
TEST(exponential_backoff, basic) {
  using namespace std::chrono_literals;
  ballot::detail::exponential_backoff backoff(10ms, 50ms, 5);
  EXPECT_EQ(backoff.current_delay().count(), 10);
  EXPECT_EQ(backoff.record_failure().count(), 20);
  EXPECT_EQ(backoff.current_delay().count(), 20);
  EXPECT_EQ(backoff.record_failure().count(), 40);
  EXPECT_EQ(backoff.record_failure().count(), 50);
  EXPECT_EQ(backoff.record_failure().count(), 50);
  EXPECT_EQ(backoff.failures(), 4);

  backoff.record_success();
  EXPECT_EQ(backoff.current_delay().count(), 10);
  EXPECT_EQ(backoff.failures(), 0);

  // ... only consecutive failures count ...
  EXPECT_NO_THROW(backoff.record_failure());
  EXPECT_NO_THROW(backoff.record_failure());
  EXPECT_NO_THROW(backoff.record_failure());
  EXPECT_NO_THROW(backoff.record_failure());
  EXPECT_THROW(backoff.record_failure(), std::runtime_error);
}
