#include "ballot/election_error.hpp"

#include <sstream>

namespace {
std::string format_invalid_state(std::string const& what, ballot::election_state current) {
  std::ostringstream os;
  os << what << " The current state is " << current << ".";
  return os.str();
}
} // anonymous namespace

namespace ballot {

invalid_state::invalid_state(std::string const& what, election_state current)
    : std::logic_error(format_invalid_state(what, current))
    , current_(current) {
}

} // namespace ballot
