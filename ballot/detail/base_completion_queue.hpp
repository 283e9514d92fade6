#ifndef ballot_detail_base_completion_queue_hpp
#define ballot_detail_base_completion_queue_hpp

#include <ballot/detail/base_async_op.hpp>

#include <grpc++/grpc++.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace ballot {
namespace detail {
/// A helper class for testing.
struct base_completion_queue_test_only;

/**
 * The base class for the grpc::CompletionQueue wrappers.
 *
 * Holds the code common to all ballot::completion_queue<> instantiations: the loop, and the table of pending
 * operations indexed by their gRPC tag.
 */
class base_completion_queue {
public:
  /// Wake up the loop this often to check if it should exit.
  static std::chrono::milliseconds constexpr loop_timeout{50};

  base_completion_queue();
  virtual ~base_completion_queue();

  /// Run the loop, invoking the callback of each operation as it completes, until shutdown() is called.
  void run();

  /// Stop the loop.
  void shutdown();

  /// The number of operations started but not yet completed.
  std::size_t pending_count() const;

protected:
  friend struct ::ballot::detail::base_completion_queue_test_only;
  /// The underlying completion queue for the gRPC APIs.
  grpc::CompletionQueue* cq() {
    return &queue_;
  }

  /// Save a newly created operation and return its gRPC tag.
  void* register_op(char const* where, std::shared_ptr<base_async_op> op);

  /// Remove an operation given its gRPC tag, returns nullptr if the tag is unknown.
  std::shared_ptr<base_async_op> unregister_op(void* tag);

private:
  mutable std::mutex mu_;
  using pending_ops_type = std::unordered_map<std::intptr_t, std::shared_ptr<base_async_op>>;
  pending_ops_type pending_ops_;

  grpc::CompletionQueue queue_;
  std::atomic<bool> shutdown_;
};

} // namespace detail
} // namespace ballot

#endif // ballot_detail_base_completion_queue_hpp
