#ifndef ballot_detail_mocked_grpc_interceptor_hpp
#define ballot_detail_mocked_grpc_interceptor_hpp

#include <ballot/detail/base_async_op.hpp>
#include <ballot/detail/deadline_timer.hpp>
#include <ballot/detail/stream_async_ops.hpp>

#include <gmock/gmock.h>
#include <grpc++/grpc++.h>

#include <memory>

namespace ballot {
namespace detail {

/**
 * An interceptor that replaces all gRPC++ calls with gmock expectations.
 *
 * The tests set expectations on @c shared_mock, matching the operations by name, and simulate the server by filling
 * the response in the operation and invoking its callback, either from the expectation action or later in the test.
 * Nothing is ever posted to the grpc::CompletionQueue.
 */
struct mocked_grpc_interceptor {
  mocked_grpc_interceptor()
      : shared_mock(std::make_shared<mocked>()) {
  }

  template <typename op_type>
  void make_deadline_timer(std::shared_ptr<op_type> op, grpc::CompletionQueue*, void*) {
    shared_mock->make_deadline_timer(op);
  }

  template <typename C, typename M, typename op_type>
  void async_rpc(C*, M C::*, std::shared_ptr<op_type> op, grpc::CompletionQueue*, void*) {
    shared_mock->async_rpc(op);
  }

  template <typename C, typename M, typename op_type>
  void async_create_rdwr_stream(C*, M C::*, std::shared_ptr<op_type> op, grpc::CompletionQueue*, void*) {
    shared_mock->async_create_rdwr_stream(op);
  }

  template <typename W, typename R, typename op_type>
  void async_write(async_rdwr_stream<W, R>&, std::shared_ptr<op_type> op, void*) {
    shared_mock->async_write(op);
  }

  template <typename W, typename R, typename op_type>
  void async_read(async_rdwr_stream<W, R>&, std::shared_ptr<op_type> op, void*) {
    shared_mock->async_read(op);
  }

  template <typename W, typename R, typename op_type>
  void async_writes_done(async_rdwr_stream<W, R>&, std::shared_ptr<op_type> op, void*) {
    shared_mock->async_writes_done(op);
  }

  template <typename W, typename R, typename op_type>
  void async_finish(async_rdwr_stream<W, R>&, std::shared_ptr<op_type> op, void*) {
    shared_mock->async_finish(op);
  }

  template <typename W, typename R>
  void try_cancel(async_rdwr_stream<W, R>&) {
    shared_mock->try_cancel();
  }

  struct mocked {
    MOCK_CONST_METHOD1(make_deadline_timer, void(std::shared_ptr<base_async_op> op));
    MOCK_CONST_METHOD1(async_rpc, void(std::shared_ptr<base_async_op> op));
    MOCK_CONST_METHOD1(async_create_rdwr_stream, void(std::shared_ptr<base_async_op> op));
    MOCK_CONST_METHOD1(async_write, void(std::shared_ptr<base_async_op> op));
    MOCK_CONST_METHOD1(async_read, void(std::shared_ptr<base_async_op> op));
    MOCK_CONST_METHOD1(async_writes_done, void(std::shared_ptr<base_async_op> op));
    MOCK_CONST_METHOD1(async_finish, void(std::shared_ptr<base_async_op> op));
    MOCK_CONST_METHOD0(try_cancel, void());
  };

  std::shared_ptr<mocked> shared_mock;
};

} // namespace detail
} // namespace ballot

#endif // ballot_detail_mocked_grpc_interceptor_hpp
