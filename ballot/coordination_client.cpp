#include "ballot/coordination_client.hpp"

#include <iostream>

namespace ballot {

std::ostream& operator<<(std::ostream& os, result_code x) {
  char const* values[] = {
      "ok",
      "node_exists",
      "no_node",
      "connection_loss",
      "operation_timeout",
      "session_expired",
      "auth_failed",
      "invalid_state",
      "system_error",
  };
  return os << values[int(x)];
}

std::ostream& operator<<(std::ostream& os, client_state x) {
  char const* values[] = {"healthy", "connecting", "auth_failed", "closed"};
  return os << values[int(x)];
}

std::ostream& operator<<(std::ostream& os, watch_event_type x) {
  char const* values[] = {"created", "deleted", "data_changed", "other"};
  return os << values[int(x)];
}

acl_list open_acl_unsafe() {
  return acl_list{acl{perm_all, "world", "anyone"}};
}

} // namespace ballot
