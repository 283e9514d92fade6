#ifndef ballot_detail_election_state_machine_hpp
#define ballot_detail_election_state_machine_hpp

#include <ballot/election_state.hpp>

#include <mutex>

namespace ballot {
namespace detail {

/**
 * Implement the state machine for a leader election candidate.
 *
 * This class holds the state of a candidate and its sticky "finish requested" flag, and is the single place that
 * decides which transitions are valid.  The lock is exposed through atomically(), so the election driver can read the
 * state, decide what to do, change the state and notify the listener in one critical section.  The lock is recursive
 * because listeners run inside that critical section and may call back into the candidate.
 */
class election_state_machine {
public:
  election_state_machine();

  /// Return the current state.
  election_state current() const;

  /// Set the sticky flag to finish the election, it is never cleared.
  void request_finish();

  /// Return true if request_finish() was called.
  bool finish_requested() const;

  /**
   * Propose a state change, returns true if accepted.
   *
   * Changing to the current state is accepted and has no effect, @a old_state is set to the state before the call in
   * all cases.
   */
  bool change_state(char const* where, election_state nstate, election_state& old_state);

  /**
   * Run @a functor while holding the lock.
   *
   * The functor can call any other member function, the lock is recursive.
   */
  template <typename Functor>
  auto atomically(Functor&& functor) -> decltype(functor()) {
    std::lock_guard<std::recursive_mutex> lock(mu_);
    return functor();
  }

private:
  /// Checks if a state transition is acceptable.
  bool check_change_state(election_state nstate) const;

private:
  mutable std::recursive_mutex mu_;
  election_state state_;
  bool finish_requested_;
};

} // namespace detail
} // namespace ballot

#endif // ballot_detail_election_state_machine_hpp
