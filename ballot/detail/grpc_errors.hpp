/**
 * @file
 *
 * Helper functions to handle errors reported by gRPC++
 */
#ifndef ballot_detail_grpc_errors_hpp
#define ballot_detail_grpc_errors_hpp

#include <ballot/coordination_client.hpp>
#include <ballot/detail/append_annotations.hpp>

#include <google/protobuf/message.h>
#include <grpc++/grpc++.h>

#include <sstream>
#include <stdexcept>

namespace ballot {
namespace detail {

/**
 * Raise an exception if @a status is not ok.
 *
 * @param status the status to check.
 * @param where a string to let the user know where the error took place.
 * @param a a list of additional annotations appended (using operator<<) to the exception what() message.
 * @throws std::runtime_error if @a status.ok() is false.
 */
template <typename Location, typename... Annotations>
void check_grpc_status(grpc::Status const& status, Location const& where, Annotations&&... a) {
  if (status.ok()) {
    return;
  }
  std::ostringstream os;
  os << where << " grpc error: " << status.error_message() << " [" << status.error_code() << "]";
  append_annotations(os, std::forward<Annotations>(a)...);
  throw std::runtime_error(os.str());
}

/**
 * Convert the outcome of an asynchronous gRPC operation to a coordination result.
 *
 * @param ok false if the operation was cancelled.
 * @param status the status of the RPC, ignored if @a ok is false.
 */
result_code to_result_code(bool ok, grpc::Status const& status);

/// Return true if @a status means the credentials were rejected.
bool is_auth_failure(grpc::Status const& status);

/**
 * Print a protobuf on a std::ostream.
 *
 * @code
 * etcdserverpb::RangeResponse const& response = ...;
 * BALLOT_LOG(debug) << "range response=" << print_to_stream(response);
 * @endcode
 */
struct print_to_stream {
  explicit print_to_stream(google::protobuf::Message const& m)
      : msg(m) {
  }

  google::protobuf::Message const& msg;
};

/// Streaming operator
std::ostream& operator<<(std::ostream& os, print_to_stream const& x);

} // namespace detail
} // namespace ballot

#endif // ballot_detail_grpc_errors_hpp
