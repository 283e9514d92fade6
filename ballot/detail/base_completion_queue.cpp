#include "ballot/detail/base_completion_queue.hpp"
#include <ballot/assert_throw.hpp>
#include <ballot/log.hpp>

#include <sstream>

namespace ballot {
namespace detail {

std::chrono::milliseconds constexpr base_completion_queue::loop_timeout;

base_completion_queue::base_completion_queue()
    : mu_()
    , pending_ops_()
    , queue_()
    , shutdown_(false) {
}

base_completion_queue::~base_completion_queue() {
  // ... the operations may point to objects already deleted, calling them is not safe, the best we can do is to log
  // what was left behind ...
  if (not pending_ops_.empty()) {
    std::ostringstream os;
    for (auto const& op : pending_ops_) {
      os << op.second->name << "\n";
    }
    BALLOT_LOG(error) << "completion queue deleted while holding " << pending_ops_.size()
                      << " pending operations: " << os.str();
  }
  // ... grpc::CompletionQueue requires a Shutdown() and a drained queue before it is destroyed ...
  if (not shutdown_.load()) {
    queue_.Shutdown();
  }
  void* tag = nullptr;
  bool ok = false;
  while (queue_.Next(&tag, &ok)) {
  }
}

void base_completion_queue::run() {
  void* tag = nullptr;
  bool ok = false;
  while (not shutdown_.load()) {
    auto deadline = std::chrono::system_clock::now() + loop_timeout;

    auto status = queue_.AsyncNext(&tag, &ok, deadline);
    if (status == grpc::CompletionQueue::SHUTDOWN) {
      BALLOT_LOG(trace) << "shutdown, exit loop";
      break;
    }
    if (status == grpc::CompletionQueue::TIMEOUT) {
      continue;
    }
    if (tag == nullptr) {
      BALLOT_LOG(warning) << "null tag reported by the completion queue, ignored";
      continue;
    }

    // ... find the operation and remove it from the table, the lock is released before the callback runs ...
    std::shared_ptr<base_async_op> op = unregister_op(tag);
    if (not op) {
      BALLOT_LOG(error) << "unknown tag reported in asynchronous operation: " << std::hex << std::intptr_t(tag);
      continue;
    }
    try {
      op->callback(*op, ok);
    } catch (std::exception const& ex) {
      BALLOT_LOG(error) << "exception raised by callback for " << op->name << ": " << ex.what();
    }
  }
}

void base_completion_queue::shutdown() {
  BALLOT_LOG(trace) << "shutting down queue";
  if (not shutdown_.exchange(true)) {
    queue_.Shutdown();
  }
}

std::size_t base_completion_queue::pending_count() const {
  std::lock_guard<std::mutex> lock(mu_);
  return pending_ops_.size();
}

void* base_completion_queue::register_op(char const* where, std::shared_ptr<base_async_op> op) {
  void* tag = static_cast<void*>(op.get());
  auto key = reinterpret_cast<std::intptr_t>(tag);
  std::lock_guard<std::mutex> lock(mu_);
  auto r = pending_ops_.emplace(key, std::move(op));
  if (not r.second) {
    BALLOT_LOG(error) << where << ": duplicate tag " << std::hex << key;
  }
  BALLOT_ASSERT_THROW(r.second);
  return tag;
}

std::shared_ptr<base_async_op> base_completion_queue::unregister_op(void* tag) {
  std::lock_guard<std::mutex> lock(mu_);
  auto i = pending_ops_.find(reinterpret_cast<std::intptr_t>(tag));
  if (i == pending_ops_.end()) {
    return std::shared_ptr<base_async_op>();
  }
  auto op = std::move(i->second);
  pending_ops_.erase(i);
  return op;
}

} // namespace detail
} // namespace ballot
