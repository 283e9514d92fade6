#ifndef ballot_detail_exponential_backoff_hpp
#define ballot_detail_exponential_backoff_hpp

#include <chrono>
#include <stdexcept>

namespace ballot {
namespace detail {
/**
 * Pace the reconnection attempts of the etcd streams.
 *
 * The delay doubles after each consecutive failure, up to @a max_delay, and goes back to @a min_delay after a success.
 * After @a max_attempts consecutive failures record_failure() raises std::runtime_error, the caller should give up.
 */
class exponential_backoff {
public:
  template <typename min_duration_type, typename max_duration_type>
  exponential_backoff(min_duration_type min_delay, max_duration_type max_delay, int max_attempts)
      : min_delay_(std::chrono::duration_cast<std::chrono::milliseconds>(min_delay))
      , max_delay_(std::chrono::duration_cast<std::chrono::milliseconds>(max_delay))
      , max_attempts_(max_attempts)
      , current_delay_(min_delay_)
      , failures_(0) {
    check_arguments();
  }

  /// Record a failed attempt, returns how long to wait before the next one.
  std::chrono::milliseconds record_failure();

  /// Record a successful attempt, the next failure starts over from the minimum delay.
  void record_success();

  std::chrono::milliseconds current_delay() const {
    return current_delay_;
  }

  /// The number of consecutive failures.
  int failures() const {
    return failures_;
  }

private:
  void check_arguments() const;

private:
  std::chrono::milliseconds min_delay_;
  std::chrono::milliseconds max_delay_;
  int max_attempts_;
  std::chrono::milliseconds current_delay_;
  int failures_;
};
} // namespace detail
} // namespace ballot

#endif // ballot_detail_exponential_backoff_hpp
