#ifndef ballot_detail_async_rpc_op_hpp
#define ballot_detail_async_rpc_op_hpp

#include <ballot/detail/base_async_op.hpp>

#include <grpc++/grpc++.h>

#include <memory>
#include <type_traits>

namespace ballot {
namespace detail {

/// Deduce the request and response types of a unary RPC from the stub member function - mismatch case.
template <typename M>
struct async_rpc_op_requirements {
  using matches = std::false_type;
};

/// Deduce the request and response types of a unary RPC from the stub member function - match case.
template <typename W, typename R>
struct async_rpc_op_requirements<std::unique_ptr<grpc::ClientAsyncResponseReader<R>>(
    grpc::ClientContext*, W const&, grpc::CompletionQueue*)> {
  using matches = std::true_type;

  using request_type = W;
  using response_type = R;
};

/**
 * The state of an asynchronous unary RPC.
 *
 * See ballot::completion_queue::async_rpc() for details.
 *
 * @tparam W the type of the request.
 * @tparam R the type of the response.
 */
template <typename W, typename R>
struct async_rpc_op : public base_async_op {
  grpc::ClientContext context;
  grpc::Status status;
  W request;
  R response;
  std::unique_ptr<grpc::ClientAsyncResponseReader<R>> rpc;
};

} // namespace detail
} // namespace ballot

#endif // ballot_detail_async_rpc_op_hpp
