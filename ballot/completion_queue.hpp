#ifndef ballot_completion_queue_hpp
#define ballot_completion_queue_hpp

#include <ballot/detail/async_rpc_op.hpp>
#include <ballot/detail/base_completion_queue.hpp>
#include <ballot/detail/deadline_timer.hpp>
#include <ballot/detail/default_grpc_interceptor.hpp>
#include <ballot/detail/grpc_errors.hpp>
#include <ballot/detail/stream_async_ops.hpp>

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace ballot {

/// A tag to request a std::shared_future<> instead of a callback.
struct use_future {};

/**
 * Wrap a gRPC completion queue.
 *
 * grpc::CompletionQueue works with opaque void* tags.  This wrapper makes it easy to write asynchronous operations
 * that call functors (lambdas, std::function<>, etc) when the operation completes.  All the functors are called from
 * the thread running run(), one at a time.
 *
 * @tparam grpc_interceptor_t mediate all calls to the gRPC library.  The default inlines all the calls.  The main
 * reason to change it is to mock the gRPC++ APIs in tests.
 */
template <typename grpc_interceptor_t = detail::default_grpc_interceptor>
class completion_queue : public detail::base_completion_queue {
public:
  //@{
  /// @name type traits
  using grpc_interceptor_type = grpc_interceptor_t;
  //@}

  explicit completion_queue(grpc_interceptor_type interceptor = grpc_interceptor_type())
      : detail::base_completion_queue()
      , interceptor_(std::move(interceptor)) {
  }

  grpc_interceptor_type& interceptor() {
    return interceptor_;
  }

  /**
   * Call the functor when the deadline expires.
   *
   * The functor receives the timer and a flag, the flag is false if the timer was cancelled.
   */
  template <typename Functor>
  std::shared_ptr<detail::deadline_timer> make_deadline_timer(
      std::chrono::system_clock::time_point deadline, std::string name, Functor&& f) {
    auto op = create_op<detail::deadline_timer>(std::move(name), std::forward<Functor>(f));
    void* tag = register_op("make_deadline_timer()", op);
    op->deadline = deadline;
    interceptor_.make_deadline_timer(op, cq(), tag);
    return op;
  }

  /// Call the functor after @a duration.
  template <typename duration_type, typename Functor>
  std::shared_ptr<detail::deadline_timer> make_relative_timer(duration_type duration, std::string name, Functor&& f) {
    auto deadline = std::chrono::system_clock::now() + duration;
    return make_deadline_timer(deadline, std::move(name), std::forward<Functor>(f));
  }

  /**
   * Start an asynchronous unary RPC and invoke a functor with the results.
   *
   * For example, to read a key from etcd:
   *
   * @code
   * ballot::completion_queue<> queue = ...;
   * std::unique_ptr<etcdserverpb::KV::Stub> stub = ...;
   * etcdserverpb::RangeRequest req;
   * queue.async_rpc(stub.get(), &etcdserverpb::KV::Stub::AsyncRange, std::move(req), "my-range",
   *     [](auto const& op, bool ok) { ... op.response ... op.status ... });
   * @endcode
   *
   * The request and response types are deduced from the member function.  The functor receives a
   * detail::async_rpc_op<Request, Response> and a flag, which is false if the operation was cancelled.
   */
  template <typename C, typename M, typename W, typename Functor>
  void async_rpc(C* async_client, M C::*call, W&& request, std::string name, Functor&& f) {
    using requirements = detail::async_rpc_op_requirements<M>;
    static_assert(
        requirements::matches::value,
        "The member function signature does not match: "
        "std::unique_ptr<grpc::ClientAsyncResponseReader<R>>(grpc::ClientContext*,W const&,grpc::CompletionQueue*)");
    using request_type = typename requirements::request_type;
    using response_type = typename requirements::response_type;
    static_assert(
        std::is_same<typename std::decay<W>::type, request_type>::value,
        "Mismatch request parameter type vs. operation signature");

    using op_type = detail::async_rpc_op<request_type, response_type>;
    auto op = create_op<op_type>(std::move(name), std::forward<Functor>(f));
    void* tag = register_op("async_rpc()", op);
    op->request.Swap(&request);
    interceptor_.async_rpc(async_client, call, op, cq(), tag);
  }

  /**
   * Start an asynchronous unary RPC and return a future with the response.
   *
   * The future holds an exception if the operation is cancelled or the RPC fails.
   */
  template <typename C, typename M, typename W>
  std::shared_future<typename detail::async_rpc_op_requirements<M>::response_type>
  async_rpc(C* async_client, M C::*call, W&& request, std::string name, use_future) {
    using response_type = typename detail::async_rpc_op_requirements<M>::response_type;
    auto promise = std::make_shared<std::promise<response_type>>();
    this->async_rpc(
        async_client, call, std::forward<W>(request), std::move(name), [promise](auto const& op, bool ok) {
          if (not ok) {
            promise->set_exception(std::make_exception_ptr(std::runtime_error("async rpc cancelled: " + op.name)));
            return;
          }
          try {
            detail::check_grpc_status(op.status, op.name);
            promise->set_value(op.response);
          } catch (std::exception const&) {
            promise->set_exception(std::current_exception());
          }
        });
    return promise->get_future().share();
  }

  /**
   * Create a bi-directional stream and call the functor when it is ready.
   *
   * The functor receives a std::shared_ptr<detail::async_rdwr_stream<W, R>> and a flag, which is false if the
   * stream could not be established.
   */
  template <typename C, typename M, typename Functor>
  void async_create_rdwr_stream(C* async_client, M C::*call, std::string name, Functor&& f) {
    using requirements = detail::async_stream_create_requirements<M>;
    static_assert(
        requirements::matches::value,
        "The member function signature does not match: "
        "std::unique_ptr<grpc::ClientAsyncReaderWriter<W, R>>(grpc::ClientContext*,grpc::CompletionQueue*,void*)");
    using op_type = detail::create_async_rdwr_stream<typename requirements::write_type, typename requirements::read_type>;
    auto op = std::make_shared<op_type>();
    op->callback = [functor = std::forward<Functor>(f)](detail::base_async_op& bop, bool ok) mutable {
      auto& op = dynamic_cast<op_type&>(bop);
      functor(op.stream, ok);
    };
    op->name = std::move(name);
    void* tag = register_op("async_create_rdwr_stream()", op);
    interceptor_.async_create_rdwr_stream(async_client, call, op, cq(), tag);
  }

  /// Create a bi-directional stream and return a future to wait until it is ready.
  template <typename C, typename M>
  std::shared_future<std::shared_ptr<typename detail::async_stream_create_requirements<M>::stream_type>>
  async_create_rdwr_stream(C* async_client, M C::*call, std::string name, use_future) {
    using ret_type = std::shared_ptr<typename detail::async_stream_create_requirements<M>::stream_type>;
    auto promise = std::make_shared<std::promise<ret_type>>();
    this->async_create_rdwr_stream(async_client, call, std::move(name), [promise](auto stream, bool ok) {
      if (not ok) {
        promise->set_exception(std::make_exception_ptr(std::runtime_error("async create_rdwr_stream cancelled")));
        return;
      }
      promise->set_value(std::move(stream));
    });
    return promise->get_future().share();
  }

  /// Start a Write() on @a stream and call the functor when it completes.
  template <typename W, typename R, typename Functor>
  void async_write(detail::async_rdwr_stream<W, R>& stream, W&& request, std::string name, Functor&& f) {
    auto op = create_op<detail::write_op<W>>(std::move(name), std::forward<Functor>(f));
    void* tag = register_op("async_write()", op);
    op->request.Swap(&request);
    interceptor_.async_write(stream, op, tag);
  }

  /// Start a Read() on @a stream and call the functor when it completes.
  template <typename W, typename R, typename Functor>
  void async_read(detail::async_rdwr_stream<W, R>& stream, std::string name, Functor&& f) {
    auto op = create_op<detail::read_op<R>>(std::move(name), std::forward<Functor>(f));
    void* tag = register_op("async_read()", op);
    interceptor_.async_read(stream, op, tag);
  }

  /// Start a WritesDone() on @a stream and call the functor when it completes.
  template <typename W, typename R, typename Functor>
  void async_writes_done(detail::async_rdwr_stream<W, R>& stream, std::string name, Functor&& f) {
    auto op = create_op<detail::writes_done_op>(std::move(name), std::forward<Functor>(f));
    void* tag = register_op("async_writes_done()", op);
    interceptor_.async_writes_done(stream, op, tag);
  }

  /// Start a WritesDone() on @a stream and return a future to wait until it completes.
  template <typename W, typename R>
  std::shared_future<void> async_writes_done(detail::async_rdwr_stream<W, R>& stream, std::string name, use_future) {
    auto promise = std::make_shared<std::promise<void>>();
    this->async_writes_done(stream, std::move(name), [promise](auto const&, bool ok) {
      if (not ok) {
        promise->set_exception(std::make_exception_ptr(std::runtime_error("async writes done cancelled")));
        return;
      }
      promise->set_value();
    });
    return promise->get_future().share();
  }

  /// Start a Finish() on @a stream and call the functor when it completes.
  template <typename W, typename R, typename Functor>
  void async_finish(detail::async_rdwr_stream<W, R>& stream, std::string name, Functor&& f) {
    auto op = create_op<detail::finish_op>(std::move(name), std::forward<Functor>(f));
    void* tag = register_op("async_finish()", op);
    interceptor_.async_finish(stream, op, tag);
  }

  /// Start a Finish() on @a stream and return a future with the final status of the stream.
  template <typename W, typename R>
  std::shared_future<grpc::Status> async_finish(
      detail::async_rdwr_stream<W, R>& stream, std::string name, use_future) {
    auto promise = std::make_shared<std::promise<grpc::Status>>();
    this->async_finish(stream, std::move(name), [promise](auto const& op, bool ok) {
      if (not ok) {
        promise->set_exception(std::make_exception_ptr(std::runtime_error("async finish cancelled")));
        return;
      }
      promise->set_value(op.status);
    });
    return promise->get_future().share();
  }

  /**
   * Cancel all pending operations on @a stream.
   *
   * The operations complete with ok == false.
   */
  template <typename W, typename R>
  void try_cancel_on(detail::async_rdwr_stream<W, R>& stream) {
    interceptor_.try_cancel(stream);
  }

private:
  /**
   * Create an operation and perform the common initialization.
   *
   * Moves the name and functor into the new operation, and wraps the functor in a callback that downcasts the
   * operation to its real type.
   *
   * @tparam op_type the type derived from ballot::detail::base_async_op to create.
   */
  template <typename op_type, typename Functor>
  std::shared_ptr<op_type> create_op(std::string name, Functor&& f) const {
    auto op = std::make_shared<op_type>();
    op->callback = [functor = std::forward<Functor>(f)](detail::base_async_op& bop, bool ok) mutable {
      auto& op = dynamic_cast<op_type&>(bop);
      functor(op, ok);
    };
    op->name = std::move(name);
    return op;
  }

private:
  grpc_interceptor_type interceptor_;
};

} // namespace ballot

#endif // ballot_completion_queue_hpp
