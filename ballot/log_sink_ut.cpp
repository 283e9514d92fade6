#include "ballot/log_sink.hpp"

#include <gtest/gtest.h>

/**
 * @test Verify that ballot::make_log_sink works as expected.
 */
TEST(log_sink, basic) {
  std::string value;
  ballot::severity sev;
  auto ls = ballot::make_log_sink([&value, &sev](ballot::severity s, std::string&& m) {
    value = m;
    sev = s;
  });

  ls->log(ballot::severity::info, std::string("testing 1 2 3"));
  ASSERT_EQ(sev, ballot::severity::info);
  ASSERT_EQ(value, "testing 1 2 3");
}
