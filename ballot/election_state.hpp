#ifndef ballot_election_state_hpp
#define ballot_election_state_hpp

#include <iosfwd>

namespace ballot {
/**
 * The states of a leader election candidate.
 *
 * @code
 *                     +----------------+
 *                     |  +----------+  |
 *                     |  |  leader  |  |
 *                     |  +----------+  |
 *                     |        ^       |
 *                     |        v       |
 * +---------+         |  +----------+  |
 * | created |----------->| electing |  |
 * +---------+         |  +----------+  |
 *      |              |        ^       |
 *      v              |        v       |
 * +---------+         |  +----------+  |
 * |  done   |<--------|  | follower |  |
 * +---------+         |  +----------+  |
 *                     +----------------+
 * @endcode
 *
 * A candidate starts in @c created.  start() moves it to @c electing, or directly to @c done if the candidate was
 * finished, or the coordination client is closed, before the election began.  The result of an election is either
 * @c leader or @c follower, and the candidate moves back to @c electing whenever the node for the election is deleted.
 * Any live state moves to @c done once the candidate is finished or the coordination client closes; @c done is final.
 */
enum class election_state {
  /// Initial state, the candidate is being configured.
  created,
  /// Trying to claim the election node, or finding out who owns it.
  electing,
  /// This candidate owns the election node.
  leader,
  /// Another candidate owns the election node.
  follower,
  /// Final state, the candidate will not issue any more requests.
  done,
};

/// The streaming operator for @c election_state, used in logging and error messages.
std::ostream& operator<<(std::ostream& os, election_state x);

} // namespace ballot

#endif // ballot_election_state_hpp
