#include "ballot/log.hpp"

#include <gmock/gmock.h>

namespace {
/// Capture the messages sent to a ballot::log.
using captured_logs = std::vector<std::pair<ballot::severity, std::string>>;

std::shared_ptr<ballot::log_sink> capture_to(captured_logs& logs) {
  return ballot::make_log_sink(
      [&logs](ballot::severity sev, std::string&& msg) { logs.emplace_back(sev, std::move(msg)); });
}
} // anonymous namespace

/**
 * @test Verify that the BALLOT_LOG_I() and the supporting classes all work in the normal case.
 */
TEST(log, basic) {
  ballot::log lg;
  // ... without sinks the messages are simply dropped ...
  ASSERT_NO_THROW(BALLOT_LOG_I(error, lg) << "foo" << 4 << 2);
  captured_logs logs;
  lg.add_sink(capture_to(logs));

  using namespace ::testing;
  ASSERT_NO_THROW(BALLOT_LOG_I(error, lg) << "election on "
                                          << "/leader"
                                          << " " << 42);
  ASSERT_EQ(logs.size(), 1UL);
  ASSERT_EQ(logs[0].first, ballot::severity::error);
  ASSERT_THAT(logs[0].second, StartsWith("[error] election on /leader 42"));
  ASSERT_THAT(logs[0].second, HasSubstr("log_ut.cpp"));
}

/**
 * @test Verify that messages below the run-time floor are discarded, without evaluating the expression.
 */
TEST(log, run_time_disable) {
  ballot::log lg;
  captured_logs logs;
  lg.add_sink(capture_to(logs));

  using namespace ::testing;
  ASSERT_NO_THROW(BALLOT_LOG_I(info, lg) << "testing 123"
                                         << " " << 42);
  ASSERT_EQ(logs.size(), 1UL);
  ASSERT_EQ(logs[0].first, ballot::severity::info);
  ASSERT_THAT(logs[0].second, StartsWith("[info] testing 123 42"));

  logs.clear();
  int cnt = 0;
  auto f = [&cnt]() {
    ++cnt;
    return 42;
  };
  lg.min_severity(ballot::severity::warning);
  EXPECT_EQ(lg.min_severity(), ballot::severity::warning);
  ASSERT_NO_THROW(BALLOT_LOG_I(info, lg) << "testing 123"
                                         << " " << f());
  ASSERT_EQ(logs.size(), 0UL);
  // ... also verify that disabled expressions are not even called ...
  ASSERT_EQ(cnt, 0);
  ASSERT_EQ(f(), 42);
  ASSERT_EQ(cnt, 1);
}

/**
 * @test Verify that levels disabled at compile-time do not evaluate the expression.
 */
TEST(log, compile_time_disable) {
  ballot::log lg;
  captured_logs logs;
  lg.add_sink(capture_to(logs));

  int cnt = 0;
  auto f = [&cnt]() {
    ++cnt;
    return 42;
  };
  // ... use a level that is enabled at run-time, but disabled at compile-time ...
  lg.min_severity(ballot::severity::trace);
  ASSERT_NO_THROW(BALLOT_LOG_I(trace, lg) << "testing 123"
                                          << " " << f());
  ASSERT_EQ(logs.size(), 0UL);
  ASSERT_EQ(cnt, 0);
}

/**
 * @test Verify that the BALLOT_LOG() macro and the supporting singleton work as expected.
 */
TEST(log, instance_basic) {
  ballot::log& lg = ballot::log::instance();
  captured_logs logs;
  lg.add_sink(capture_to(logs));

  using namespace ::testing;
  ASSERT_NO_THROW(BALLOT_LOG(info) << "testing 123 " << 42);
  ASSERT_EQ(logs.size(), 1UL);
  ASSERT_EQ(logs[0].first, ballot::severity::info);
  ASSERT_THAT(logs[0].second, StartsWith("[info] testing 123 42"));
  ASSERT_NO_THROW(lg.clear_sinks());
}

/**
 * @test Verify that BALLOT_LOG_I() works with multiple sinks.
 */
TEST(log, multiple_sinks) {
  ballot::log lg;
  captured_logs logs;
  lg.add_sink(capture_to(logs));
  lg.add_sink(ballot::make_log_sink([&logs](ballot::severity sev, std::string&& msg) {
    auto s = std::string("(2) ") + msg;
    logs.emplace_back(sev, std::move(s));
  }));

  using namespace ::testing;
  ASSERT_NO_THROW(BALLOT_LOG_I(error, lg) << "testing 123"
                                          << " " << 42);
  ASSERT_EQ(logs.size(), 2UL);
  ASSERT_EQ(logs[0].first, ballot::severity::error);
  ASSERT_EQ(logs[1].first, ballot::severity::error);
  ASSERT_THAT(logs[0].second, StartsWith("[error] testing 123 42"));
  ASSERT_THAT(logs[1].second, StartsWith("(2) [error] testing 123 42"));
}

/**
 * @test Verify that BALLOT_LOGGER_DECL() builds a message piecemeal.
 */
TEST(log, logger_decl) {
  ballot::log lg;
  captured_logs logs;
  lg.add_sink(capture_to(logs));

  BALLOT_LOGGER_DECL(warning, lg, logger);
  ASSERT_TRUE((bool)logger);
  for (int i = 0; i != 3; ++i) {
    logger.get() << i;
  }
  logger.write_to(lg);
  ASSERT_FALSE((bool)logger);
  ASSERT_EQ(logs.size(), 1UL);
  ASSERT_THAT(logs[0].second, ::testing::StartsWith("[warning] 012"));
}

/**
 * @test Complete code coverage for the ballot::logger<true> class.
 */
TEST(log, logger_disabled) {
  // In the normal operation of the ballot::logger<true> class neither get() nor write_to() are ever used, they are
  // needed to make sure the code compiles.  Make sure they are no-op's:
  ballot::log lg;
  captured_logs logs;
  lg.add_sink(capture_to(logs));
  ballot::logger<true> logger(ballot::severity::error, __func__, __FILE__, __LINE__, lg);

  ASSERT_EQ((bool)logger, false);
  ASSERT_NO_THROW(logger.get() << "testing " << 123 << std::string(" ") << 42);
  ASSERT_TRUE((std::is_same<decltype(logger.get()), ballot::detail::null_stream&>::value));
  ASSERT_NO_THROW(logger.write_to(lg));
  ASSERT_EQ(logs.size(), 0U);
}
