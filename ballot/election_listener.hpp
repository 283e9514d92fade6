#ifndef ballot_election_listener_hpp
#define ballot_election_listener_hpp

#include <ballot/election_state.hpp>

#include <functional>
#include <memory>

namespace ballot {
class leader_election;

/**
 * Receive the lifecycle events of a leader election candidate.
 *
 * All member functions are called from the coordination client's callback thread, while the candidate holds its
 * internal lock.  Listeners may call leader_election::state() and leader_election::finish(), they should not block.
 * Exceptions raised by a listener are logged and discarded, they never stop the election.
 *
 * For a given transition on_state_changed() is always called before the role-specific notification.
 */
class election_listener {
public:
  virtual ~election_listener() = default;

  /**
   * The state of the candidate changed from @a old_state to @a new_state.
   *
   * The two states are equal when a candidate that is already electing finds the slot vacant again.
   */
  virtual void on_state_changed(leader_election& election, election_state old_state, election_state new_state) = 0;

  /// This candidate won the election.
  virtual void on_win(leader_election& election) = 0;

  /// Another candidate is the leader.
  virtual void on_lose(leader_election& election) = 0;

  /// There is no leader, the candidate is running for election again.
  virtual void on_vacant(leader_election& election) = 0;

  /**
   * The candidate stopped, it will not issue any further requests.
   *
   * This may not be called promptly after finish(), the candidate only stops when the pending request (or watch)
   * completes.  In rare cases, e.g. the coordination client is destroyed with a watch pending, it is not called at all.
   *
   * A watch that is lost (@c watch_event_type::other), for example because the client session ended, is ignored like
   * any other event that is not a deletion.  A leader or follower that was waiting on that watch keeps its state and
   * issues no further requests, so it does not receive this notification even after finish().  Applications that must
   * step down when the session ends should also monitor the client state.
   */
  virtual void on_finish(leader_election& election) = 0;
};

/**
 * A set of optional functors, an alternative to implementing @c election_listener.
 *
 * @code
 * ballot::listener_callbacks callbacks;
 * callbacks.on_win = [](ballot::leader_election&) { std::cout << "I am the leader" << std::endl; };
 * election.listener(ballot::make_election_listener(std::move(callbacks)));
 * @endcode
 */
struct listener_callbacks {
  std::function<void(leader_election&, election_state, election_state)> on_state_changed;
  std::function<void(leader_election&)> on_win;
  std::function<void(leader_election&)> on_lose;
  std::function<void(leader_election&)> on_vacant;
  std::function<void(leader_election&)> on_finish;
};

/**
 * Create an @c election_listener that forwards to the functors in @a callbacks.
 *
 * Empty functors are no-ops.
 */
std::shared_ptr<election_listener> make_election_listener(listener_callbacks callbacks);

} // namespace ballot

#endif // ballot_election_listener_hpp
