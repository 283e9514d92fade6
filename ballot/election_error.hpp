#ifndef ballot_election_error_hpp
#define ballot_election_error_hpp
/**
 * @file
 *
 * Define the exceptions raised when the election (or node reader) API is misused.
 */

#include <ballot/election_state.hpp>

#include <stdexcept>
#include <string>

namespace ballot {

/**
 * Raised by start() when a required collaborator, such as the coordination client, was never configured.
 */
class not_configured : public std::logic_error {
public:
  explicit not_configured(std::string const& what)
      : std::logic_error(what) {
  }
};

/**
 * Raised when an operation is invalid in the current election state.
 *
 * For example, calling start() twice, or changing the configuration of a candidate that has already started.
 */
class invalid_state : public std::logic_error {
public:
  invalid_state(std::string const& what, election_state current);

  /// The state of the candidate when the operation was rejected.
  election_state current() const {
    return current_;
  }

private:
  election_state current_;
};

} // namespace ballot

#endif // ballot_election_error_hpp
