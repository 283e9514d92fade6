#include "ballot/detail/election_event.hpp"

#include <iostream>

namespace ballot {
namespace detail {

std::ostream& operator<<(std::ostream& os, election_event_kind x) {
  char const* values[] = {"claim_completed", "resolve_completed", "track_completed", "watch_fired"};
  return os << values[int(x)];
}

std::ostream& operator<<(std::ostream& os, election_action x) {
  char const* values[] = {"idle", "claim", "resolve", "track"};
  return os << values[int(x)];
}

} // namespace detail
} // namespace ballot
