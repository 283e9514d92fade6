#ifndef ballot_log_severity_hpp
#define ballot_log_severity_hpp
/**
 * @file
 *
 * Define the log severity values and some macros associated with them.
 */

#include <iosfwd>
#include <string>

#ifndef BALLOT_MIN_SEVERITY
/**
 * All log messages below this level are disabled at compile time.
 *
 * Disabled messages become no-op's that the optimizer can remove, and the expressions streamed into them are never
 * evaluated.  The election driver logs every retry at debug level, define this macro as @c debug or @c trace when
 * building a binary to diagnose a misbehaving coordination service.
 */
#define BALLOT_MIN_SEVERITY info
#endif // BALLOT_MIN_SEVERITY

namespace ballot {
/**
 * Define the severity levels for Ballot logging.
 *
 * These are modelled after the severity levels in syslog(1).
 */
enum class severity {
  /// Entering and leaving functions, tracking of asynchronous operations.
  trace,
  /// Debug messages that should not be present in production, e.g. retries of coordination calls.
  debug,
  /// Normal progress, e.g. election state transitions.
  info,
  /// Unusual, but expected conditions.
  notice,
  /// An indication of problems, users may need to take action.
  warning,
  /// An error has been detected.  Do not use for normal conditions, such as remote servers disconnecting.
  error,
  /// The system is in a critical state, such as running out of local resources.
  critical,
  /// The system is at risk of immediate failure.
  alert,
  /// The system is about to crash or terminate.
  fatal,
  /// The highest possible severity level.
  HIGHEST = int(fatal),
  /// The lowest possible severity level.
  LOWEST = int(trace),
  /// The lowest level that is enabled at compile-time.
  LOWEST_ENABLED = int(BALLOT_MIN_SEVERITY),
};

/// Streaming operator, writes a human readable representation.
std::ostream& operator<<(std::ostream& os, severity x);

/**
 * Convert the name of a severity level, as printed by operator<<, into its value.
 *
 * Used by the command-line tools to configure the run-time log level.
 *
 * @throws std::invalid_argument if @a name is not one of the severity names.
 */
severity parse_severity(std::string const& name);

} // namespace ballot

#endif // ballot_log_severity_hpp
