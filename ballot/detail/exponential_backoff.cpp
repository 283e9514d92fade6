#include "ballot/detail/exponential_backoff.hpp"

#include <algorithm>
#include <sstream>

namespace ballot {
namespace detail {
std::chrono::milliseconds exponential_backoff::record_failure() {
  if (++failures_ >= max_attempts_) {
    std::ostringstream os;
    os << "exponential_backoff::record_failure() - giving up after " << failures_ << " consecutive failures";
    throw std::runtime_error(os.str());
  }
  current_delay_ = std::min(2 * current_delay_, max_delay_);
  return current_delay_;
}

void exponential_backoff::record_success() {
  failures_ = 0;
  current_delay_ = min_delay_;
}

void exponential_backoff::check_arguments() const {
  std::ostringstream os;
  if (min_delay_.count() <= 0) {
    os << "exponential_backoff() - min_delay (" << min_delay_.count() << "ms) must be positive";
  } else if (min_delay_ > max_delay_) {
    os << "exponential_backoff() - min_delay (" << min_delay_.count() << "ms) must not exceed max_delay ("
       << max_delay_.count() << "ms)";
  } else if (max_attempts_ <= 0) {
    os << "exponential_backoff() - max_attempts (" << max_attempts_ << ") must be positive";
  } else {
    return;
  }
  throw std::invalid_argument(os.str());
}

} // namespace detail
} // namespace ballot
