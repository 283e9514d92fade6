#ifndef ballot_detail_default_grpc_interceptor_hpp
#define ballot_detail_default_grpc_interceptor_hpp

#include <ballot/detail/deadline_timer.hpp>
#include <ballot/detail/stream_async_ops.hpp>

#include <grpc++/grpc++.h>

#include <memory>

namespace ballot {
namespace detail {

/**
 * Forward all operations to the gRPC++ library.
 *
 * ballot::completion_queue<> routes every call into gRPC++ through an interceptor.  This is the interceptor used in
 * production, every member function is a thin inline wrapper.  The tests use ballot::detail::mocked_grpc_interceptor
 * to simulate the etcd server.
 */
struct default_grpc_interceptor {
  /// Post a timer to the completion queue.
  template <typename op_type>
  void make_deadline_timer(std::shared_ptr<op_type> op, grpc::CompletionQueue* cq, void* tag) {
    op->alarm_ = std::make_unique<grpc::Alarm>(cq, op->deadline, tag);
  }

  /// Start a unary RPC.
  template <typename C, typename M, typename op_type>
  void async_rpc(C* async_client, M C::*call, std::shared_ptr<op_type> op, grpc::CompletionQueue* cq, void* tag) {
    op->rpc = (async_client->*call)(&op->context, op->request, cq);
    op->rpc->Finish(&op->response, &op->status, tag);
  }

  /// Start the creation of a bi-directional stream.
  template <typename C, typename M, typename op_type>
  void async_create_rdwr_stream(
      C* async_client, M C::*call, std::shared_ptr<op_type> op, grpc::CompletionQueue* cq, void* tag) {
    op->stream->client = (async_client->*call)(&op->stream->context, cq, tag);
  }

  /// Start a Write() on a stream.
  template <typename W, typename R, typename op_type>
  void async_write(async_rdwr_stream<W, R>& stream, std::shared_ptr<op_type> op, void* tag) {
    stream.client->Write(op->request, tag);
  }

  /// Start a Read() on a stream.
  template <typename W, typename R, typename op_type>
  void async_read(async_rdwr_stream<W, R>& stream, std::shared_ptr<op_type> op, void* tag) {
    stream.client->Read(&op->response, tag);
  }

  /// Start a WritesDone() on a stream.
  template <typename W, typename R, typename op_type>
  void async_writes_done(async_rdwr_stream<W, R>& stream, std::shared_ptr<op_type>, void* tag) {
    stream.client->WritesDone(tag);
  }

  /// Start a Finish() on a stream.
  template <typename W, typename R, typename op_type>
  void async_finish(async_rdwr_stream<W, R>& stream, std::shared_ptr<op_type> op, void* tag) {
    stream.client->Finish(&op->status, tag);
  }

  /// Cancel all pending operations on a stream.
  template <typename W, typename R>
  void try_cancel(async_rdwr_stream<W, R>& stream) {
    stream.context.TryCancel();
  }
};

} // namespace detail
} // namespace ballot

#endif // ballot_detail_default_grpc_interceptor_hpp
