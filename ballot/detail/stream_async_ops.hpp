#ifndef ballot_detail_stream_async_ops_hpp
#define ballot_detail_stream_async_ops_hpp
/**
 * @file
 *
 * Define the state of the asynchronous operations on bi-directional streaming RPCs.
 */

#include <ballot/detail/base_async_op.hpp>

#include <grpc++/grpc++.h>

#include <memory>
#include <type_traits>

namespace ballot {
namespace detail {

/// The state of a Write() on a stream, see ballot::completion_queue::async_write().
template <typename W>
struct write_op : public base_async_op {
  W request;
};

/// The state of a Read() on a stream, see ballot::completion_queue::async_read().
template <typename R>
struct read_op : public base_async_op {
  R response;
};

/**
 * A bi-directional streaming RPC.
 *
 * gRPC allows at most one outstanding Write() and one outstanding Read() on each stream, the owner of the stream is
 * responsible for serializing its calls.
 */
template <typename W, typename R>
struct async_rdwr_stream {
  grpc::ClientContext context;
  std::unique_ptr<grpc::ClientAsyncReaderWriter<W, R>> client;

  using write_op = ::ballot::detail::write_op<W>;
  using read_op = ::ballot::detail::read_op<R>;
};

/// Deduce the stream types from the stub member function that creates it - mismatch case.
template <typename M>
struct async_stream_create_requirements {
  using matches = std::false_type;
};

/// Deduce the stream types from the stub member function that creates it - match case.
template <typename W, typename R>
struct async_stream_create_requirements<std::unique_ptr<grpc::ClientAsyncReaderWriter<W, R>>(
    grpc::ClientContext*, grpc::CompletionQueue*, void*)> {
  using matches = std::true_type;

  using write_type = W;
  using read_type = R;
  using stream_type = async_rdwr_stream<write_type, read_type>;
};

/**
 * The state of the operation that creates a bi-directional stream.
 *
 * See ballot::completion_queue::async_create_rdwr_stream() for details.
 */
template <typename W, typename R>
struct create_async_rdwr_stream : public base_async_op {
  create_async_rdwr_stream()
      : stream(new async_rdwr_stream<W, R>) {
  }
  std::shared_ptr<async_rdwr_stream<W, R>> stream;
};

/// The state of a WritesDone() on a stream.
struct writes_done_op : public base_async_op {};

/// The state of a Finish() on a stream.
struct finish_op : public base_async_op {
  grpc::Status status;
};

} // namespace detail
} // namespace ballot

#endif // ballot_detail_stream_async_ops_hpp
