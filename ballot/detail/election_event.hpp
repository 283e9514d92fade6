#ifndef ballot_detail_election_event_hpp
#define ballot_detail_election_event_hpp

#include <ballot/coordination_client.hpp>

#include <cstdint>
#include <iosfwd>
#include <string>
#include <utility>

namespace ballot {
namespace detail {

/// The kinds of events that drive an election.
enum class election_event_kind {
  /// The create() call to claim the election node completed.
  claim_completed,
  /// The get() call to find out who owns the election node completed.
  resolve_completed,
  /// The exists() call that sets the watch on the election node completed.
  track_completed,
  /// The watch on the election node fired.
  watch_fired,
};

/// Streaming operator for @c election_event_kind.
std::ostream& operator<<(std::ostream& os, election_event_kind x);

/// What the election does after handling an event.
enum class election_action {
  /// Nothing, wait for the next event (a watch, or nothing at all once done).
  idle,
  /// Try to create the election node.
  claim,
  /// Read the election node to find out who owns it.
  resolve,
  /// Set a watch on the election node.
  track,
};

/// Streaming operator for @c election_action.
std::ostream& operator<<(std::ostream& os, election_action x);

/**
 * An event delivered to leader_election::handle_event().
 *
 * The coordination client callbacks do nothing but convert their arguments into one of these and hand it over to the
 * election.
 */
struct election_event {
  election_event_kind kind;
  /// The result of the coordination call, unused for watch_fired.
  result_code rc;
  /// The contents of the election node, only for resolve_completed.
  std::string data;
  /// The type of change, only for watch_fired.
  watch_event_type change;
  /// The track request that set the watch, only for watch_fired.
  std::uint64_t watch_generation;

  static election_event claim_completed(result_code rc) {
    return election_event{election_event_kind::claim_completed, rc, std::string(), watch_event_type::other, 0};
  }
  static election_event resolve_completed(result_code rc, std::string data) {
    return election_event{election_event_kind::resolve_completed, rc, std::move(data), watch_event_type::other, 0};
  }
  static election_event track_completed(result_code rc) {
    return election_event{election_event_kind::track_completed, rc, std::string(), watch_event_type::other, 0};
  }
  static election_event watch_fired(watch_event_type change, std::uint64_t generation) {
    return election_event{election_event_kind::watch_fired, result_code::ok, std::string(), change, generation};
  }
};

} // namespace detail
} // namespace ballot

#endif // ballot_detail_election_event_hpp
