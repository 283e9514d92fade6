#include "ballot/election_state.hpp"

#include <iostream>

namespace ballot {

std::ostream& operator<<(std::ostream& os, election_state x) {
  char const* values[] = {
      "created", "electing", "leader", "follower", "done",
  };
  return os << values[int(x)];
}

} // namespace ballot
