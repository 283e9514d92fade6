#ifndef ballot_active_completion_queue_hpp
#define ballot_active_completion_queue_hpp

#include <ballot/completion_queue.hpp>

#include <memory>
#include <thread>

namespace ballot {

/**
 * A completion queue with its own thread running the loop.
 *
 * This is the I/O thread of the etcd coordination client, all the callbacks (and therefore all the election
 * notifications) run in it.  The destructor stops the loop and joins the thread, it must not run in that thread.
 */
class active_completion_queue {
public:
  active_completion_queue();
  ~active_completion_queue();

  active_completion_queue(active_completion_queue const&) = delete;
  active_completion_queue& operator=(active_completion_queue const&) = delete;

  completion_queue<>& cq() {
    return *queue_;
  }

  /// Return true if called from the thread running the loop.
  bool in_loop_thread() const {
    return std::this_thread::get_id() == thread_.get_id();
  }

private:
  std::shared_ptr<completion_queue<>> queue_;
  std::thread thread_;
};

} // namespace ballot

#endif // ballot_active_completion_queue_hpp
