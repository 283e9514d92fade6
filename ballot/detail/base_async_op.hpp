#ifndef ballot_detail_base_async_op_hpp
#define ballot_detail_base_async_op_hpp

#include <functional>
#include <memory>
#include <string>

namespace ballot {
namespace detail {

/**
 * Base class for the state of all asynchronous operations.
 *
 * The completion queue creates one object derived from this class for each asynchronous operation it starts.  The
 * object holds the request, the response, and any other buffers gRPC needs until the operation completes, as well as
 * the functor provided by the caller.  Its address is the tag passed to gRPC.  When the operation completes (or is
 * cancelled) the queue invokes @c callback and then releases the object, callers must copy whatever they need out of
 * the operation before returning.
 */
struct base_async_op {
  base_async_op() {
  }
  virtual ~base_async_op() {
  }

  /**
   * Invoked by the completion queue when the operation completes.
   *
   * The second argument is false if the operation was cancelled, or the stream it belonged to was closed.
   */
  std::function<void(base_async_op&, bool)> callback;

  /// A short description of the operation, used in logs and to match operations in the tests.
  std::string name;
};

} // namespace detail
} // namespace ballot

#endif // ballot_detail_base_async_op_hpp
