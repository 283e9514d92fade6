#ifndef ballot_detail_async_op_counter_hpp
#define ballot_detail_async_op_counter_hpp

#include <ballot/detail/append_annotations.hpp>
#include <ballot/log.hpp>

#include <condition_variable>
#include <mutex>
#include <utility>

namespace ballot {
namespace detail {

/**
 * Track pending asynchronous operations.
 *
 * The session and the etcd client start operations whose callbacks capture @c this.  They must block until all those
 * operations complete before they are destroyed, otherwise the callbacks would use a deleted object.
 *
 * @code
 * if (not ops_.async_op_start("session/set_timer/ttl_refresh")) {
 *   return; // ... shutting down ...
 * }
 * queue_.make_relative_timer(d, "session/set_timer/ttl_refresh", [this](auto const&, bool ok) {
 *   ops_.async_op_done("session/set_timer/ttl_refresh");
 *   // ... use this ...
 * });
 * @endcode
 */
class async_op_counter {
public:
  async_op_counter()
      : mu_()
      , cv_()
      , pending_(0)
      , shutdown_(false) {
  }

  /**
   * Stop new operations and block until all pending operations complete.
   *
   * Do not call this from the thread running the completion queue, the operations complete in that thread.
   */
  void block_until_all_done();

  /// Stop new operations from starting, async_op_start() returns false after this call.
  void shutdown() {
    std::lock_guard<std::mutex> lock(mu_);
    shutdown_ = true;
  }

  bool in_shutdown() const {
    std::lock_guard<std::mutex> lock(mu_);
    return shutdown_;
  }

  /// The number of pending operations.
  int pending() const {
    std::lock_guard<std::mutex> lock(mu_);
    return pending_;
  }

  /**
   * Count a new pending operation, unless the owner is shutting down.
   *
   * Must be called before the operation starts, the operation may complete before the function starting it returns.
   * The annotations are logged at trace level.
   *
   * @return true if the operation should be started.
   */
  template <typename... Annotations>
  bool async_op_start(Annotations&&... a) {
    trace("async_op_start(): ", std::forward<Annotations>(a)...);
    std::lock_guard<std::mutex> lock(mu_);
    if (shutdown_) {
      return false;
    }
    ++pending_;
    return true;
  }

  /// Count a completed (or cancelled) operation.
  template <typename... Annotations>
  void async_op_done(Annotations&&... a) {
    trace("async_op_done(): ", std::forward<Annotations>(a)...);
    std::unique_lock<std::mutex> lock(mu_);
    if (--pending_ != 0) {
      return;
    }
    lock.unlock();
    cv_.notify_all();
  }

private:
  template <typename... Annotations>
  void trace(char const* what, Annotations&&... a) {
    BALLOT_LOGGER_DECL(trace, ballot::log::instance(), logger);
    if (not logger) {
      return;
    }
    append_annotations(logger.get(), what, pending(), " ", std::forward<Annotations>(a)...);
    logger.write_to(ballot::log::instance());
  }

private:
  mutable std::mutex mu_;
  std::condition_variable cv_;
  int pending_;
  bool shutdown_;
};

} // namespace detail
} // namespace ballot

#endif // ballot_detail_async_op_counter_hpp
