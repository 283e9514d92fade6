#include "ballot/detail/grpc_errors.hpp"

#include <google/protobuf/text_format.h>
#include <string>

namespace ballot {
namespace detail {

result_code to_result_code(bool ok, grpc::Status const& status) {
  if (not ok) {
    return result_code::connection_loss;
  }
  switch (status.error_code()) {
  case grpc::StatusCode::OK:
    return result_code::ok;
  case grpc::StatusCode::UNAUTHENTICATED:
  case grpc::StatusCode::PERMISSION_DENIED:
    return result_code::auth_failed;
  case grpc::StatusCode::DEADLINE_EXCEEDED:
    return result_code::operation_timeout;
  case grpc::StatusCode::UNAVAILABLE:
  case grpc::StatusCode::CANCELLED:
    return result_code::connection_loss;
  default:
    break;
  }
  return result_code::system_error;
}

bool is_auth_failure(grpc::Status const& status) {
  return status.error_code() == grpc::StatusCode::UNAUTHENTICATED or
         status.error_code() == grpc::StatusCode::PERMISSION_DENIED;
}

std::ostream& operator<<(std::ostream& os, print_to_stream const& x) {
  // ... on failure we just get an empty string ...
  std::string formatted;
  (void)google::protobuf::TextFormat::PrintToString(x.msg, &formatted);
  return os << formatted;
}

} // namespace detail
} // namespace ballot
