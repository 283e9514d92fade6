#include "ballot/log_severity.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>

TEST(log_severity, base) {
  ASSERT_LT(ballot::severity::LOWEST, ballot::severity::HIGHEST);

  using s = ballot::severity;
  std::ostringstream os;
  os << s::trace << " " << s::debug << " " << s::info << " " << s::notice << " " << s::warning << " " << s::error
     << " " << s::critical << " " << s::alert << " " << s::fatal;
  ASSERT_EQ(os.str(), "trace debug info notice warning error critical alert fatal");
}

/**
 * @test Verify that ballot::parse_severity() accepts the names printed by operator<<.
 */
TEST(log_severity, parse) {
  using s = ballot::severity;
  for (int i = int(s::LOWEST); i <= int(s::HIGHEST); ++i) {
    std::ostringstream os;
    os << s(i);
    EXPECT_EQ(ballot::parse_severity(os.str()), s(i));
  }
  EXPECT_THROW(ballot::parse_severity("verbose"), std::invalid_argument);
  EXPECT_THROW(ballot::parse_severity(""), std::invalid_argument);
}
