#ifndef ballot_log_hpp
#define ballot_log_hpp
/**
 * @file
 *
 * Define macros, types, and functions for logging in Ballot.
 */
#include <ballot/detail/null_stream.hpp>
#include <ballot/log_severity.hpp>
#include <ballot/log_sink.hpp>

#include <memory>
#include <mutex>
#include <sstream>
#include <vector>

/// Concatenate two pre-processor tokens.
#define BALLOT_PP_CAT(a, b) a##b

/**
 * Create a (most likely) unique identifier for the logger object in BALLOT_LOG_I().
 *
 * The identifier depends on the line number, so it does not collide with application variables in the streaming
 * expression.
 */
#define BALLOT_LOGGER_IDENTIFIER BALLOT_PP_CAT(ballot_log_, __LINE__)

/**
 * Log to an specific @c ballot::log object.
 *
 * Typically this used only in tests, the library and applications use BALLOT_LOG().
 */
#define BALLOT_LOG_I(level, sink)                                                                                      \
  for (auto BALLOT_LOGGER_IDENTIFIER = ballot::logger<ballot::level_compile_time_disabled(ballot::severity::level)>(   \
           ballot::severity::level, __func__, __FILE__, __LINE__, sink);                                               \
       (bool)BALLOT_LOGGER_IDENTIFIER; BALLOT_LOGGER_IDENTIFIER.write_to(sink))                                        \
  BALLOT_LOGGER_IDENTIFIER.get()

/**
 * Declare a logger named @a name, for code that needs to build a message piecemeal.
 */
#define BALLOT_LOGGER_DECL(level, sink, name)                                                                          \
  ballot::logger<ballot::level_compile_time_disabled(ballot::severity::level)> name(                                   \
      ballot::severity::level, __func__, __FILE__, __LINE__, sink)

#ifndef BALLOT_LOG
#define BALLOT_LOG(level) BALLOT_LOG_I(level, ballot::log::instance())
#endif // BALLOT_LOG

/**
 * The main namespace for the Ballot library.
 */
namespace ballot {

/**
 * Determine if a given severity level is disabled at compile-time.
 */
constexpr bool level_compile_time_disabled(severity lvl) {
  return lvl < severity::LOWEST_ENABLED;
}

/**
 * The logging framework core.
 *
 * The library logs from deep inside callbacks running on the completion queue thread, threading a logger through
 * every class would clutter all the interfaces, so there is a process-wide instance.  Tests create their own
 * instances and use BALLOT_LOG_I().
 */
class log {
public:
  log()
      : mu_()
      , min_severity_(severity::LOWEST)
      , sinks_() {
  }

  /// Return the process-wide instance.
  static log& instance();

  /// Add a new sink.
  void add_sink(std::shared_ptr<log_sink> sink);

  /// Remove all the sinks.
  void clear_sinks();

  /// Send a formatted message to all the sinks.
  void write(severity sev, std::string&& msg);

  /// Set the run-time severity floor, messages below it are discarded.
  void min_severity(severity sev) {
    std::lock_guard<std::mutex> guard(mu_);
    min_severity_ = sev;
  }

  /// Return the run-time severity floor.
  severity min_severity() const {
    std::lock_guard<std::mutex> guard(mu_);
    return min_severity_;
  }

private:
  mutable std::mutex mu_;
  severity min_severity_;
  std::vector<std::shared_ptr<log_sink>> sinks_;
};

/**
 * A message container for levels disabled at compile-time.
 *
 * All the streaming operations go into a @c detail::null_stream, and the loop in BALLOT_LOG_I() never executes.
 *
 * @tparam disabled true if the level is disabled at compile-time.
 */
template <bool disabled>
class logger {
public:
  logger(severity, char const*, char const*, int, log&) {
  }

  explicit operator bool() const {
    return false;
  }

  detail::null_stream& get() {
    return os_;
  }

  void write_to(log&) {
  }

private:
  detail::null_stream os_;
};

/**
 * A message container for levels enabled at compile-time.
 *
 * Formats the message into a std::ostringstream and sends it to the log core once the streaming expression is done.
 */
template <>
class logger<false> {
public:
  logger(severity sev, char const* function, char const* filename, int lineno, log& sink);

  explicit operator bool() const {
    return not closed_;
  }

  std::ostream& get() {
    return os_;
  }

  /// Send the message to the log core, at most once.
  void write_to(log& sink);

private:
  std::ostringstream os_;
  severity sev_;
  char const* function_;
  char const* filename_;
  int lineno_;
  bool closed_;
};

} // namespace ballot

#endif // ballot_log_hpp
