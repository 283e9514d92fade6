#include "ballot/detail/async_op_counter.hpp"

#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <vector>

/**
 * @test Verify that ballot::detail::async_op_counter counts operations and blocks until they complete.
 */
TEST(async_op_counter, basic) {
  ballot::detail::async_op_counter counter;

  EXPECT_TRUE(counter.async_op_start());
  EXPECT_TRUE(counter.async_op_start("watch on ", "/leader", " generation=", 42));
  EXPECT_EQ(counter.pending(), 2);

  counter.async_op_done();
  counter.async_op_done("foo is ", 42, " in hex ", std::hex, 42);
  EXPECT_EQ(counter.pending(), 0);

  EXPECT_TRUE(counter.async_op_start());
  EXPECT_TRUE(counter.async_op_start());

  EXPECT_FALSE(counter.in_shutdown());
  counter.shutdown();
  EXPECT_TRUE(counter.in_shutdown());
  EXPECT_FALSE(counter.async_op_start());

  std::thread t([&counter]() {
    counter.async_op_done();
    counter.async_op_done();
  });

  counter.block_until_all_done();
  EXPECT_FALSE(counter.async_op_start());
  EXPECT_EQ(counter.pending(), 0);
  t.join();
}


/**
 * @test Verify that ballot::detail::async_op_counter logs the operations at trace level.
 */
TEST(async_op_counter, trace_logging) {
  ballot::log::instance().clear_sinks();
  std::vector<std::string> lines;
  ballot::log::instance().add_sink(ballot::make_log_sink([&lines](ballot::severity sev, std::string&& x) {
    if (sev == ballot::severity::trace) {
      lines.push_back(std::move(x));
    }
  }));
  auto previous = ballot::log::instance().min_severity();
  ballot::log::instance().min_severity(ballot::severity::trace);

  ballot::detail::async_op_counter counter;
  EXPECT_TRUE(counter.async_op_start("etcd_client/get/range"));
  counter.async_op_done("etcd_client/get/range");

  ballot::log::instance().min_severity(previous);
  ballot::log::instance().clear_sinks();
  if (ballot::severity::trace < ballot::severity::LOWEST_ENABLED) {
    // ... trace messages are disabled at compile-time ...
    EXPECT_TRUE(lines.empty());
    return;
  }
  ASSERT_EQ(lines.size(), 2U);
  EXPECT_NE(lines[0].find("async_op_start(): 0 etcd_client/get/range"), std::string::npos);
  EXPECT_NE(lines[1].find("async_op_done(): 1 etcd_client/get/range"), std::string::npos);
}
