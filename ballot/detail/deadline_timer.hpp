#ifndef ballot_detail_deadline_timer_hpp
#define ballot_detail_deadline_timer_hpp

#include <ballot/detail/base_async_op.hpp>

#include <grpc++/alarm.h>

#include <chrono>
#include <memory>

namespace ballot {
namespace detail {
struct default_grpc_interceptor;

/**
 * The state of a timer posted to the completion queue.
 */
struct deadline_timer : public base_async_op {
  /**
   * Cancel the timer.
   *
   * The callback is still invoked, with ok == false, from the thread running the completion queue.
   */
  void cancel() {
    if ((bool)alarm_) {
      alarm_->Cancel();
    }
  }

  std::chrono::system_clock::time_point deadline;

private:
  friend struct default_grpc_interceptor;
  std::unique_ptr<grpc::Alarm> alarm_;
};

} // namespace detail
} // namespace ballot

#endif // ballot_detail_deadline_timer_hpp
