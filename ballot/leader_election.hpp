#ifndef ballot_leader_election_hpp
#define ballot_leader_election_hpp

#include <ballot/coordination_client.hpp>
#include <ballot/detail/election_event.hpp>
#include <ballot/detail/election_state_machine.hpp>
#include <ballot/election_listener.hpp>
#include <ballot/election_state.hpp>
#include <ballot/identity_generator.hpp>

#include <cstdint>
#include <memory>
#include <string>

namespace ballot {

/**
 * Participate in a leader election over a coordination service.
 *
 * Each candidate tries to create the same ephemeral node, the candidate that succeeds is the leader.  The other
 * candidates find out who won, and set a watch on the node.  When the node disappears (the leader finished, or its
 * session expired) the candidates run again.
 *
 * The election is completely asynchronous, start() returns immediately and the outcome is reported via the listener.
 *
 * @code
 * auto election = ballot::leader_election::create(client);
 * election->path("/services/foo/leader").identity("host-1:8080").listener(my_listener);
 * election->start();
 * // ... eventually ...
 * election->finish();
 * @endcode
 *
 * The configuration is immutable once start() has been called, the setters raise @c invalid_state after that.
 * Objects of this class are always owned by a std::shared_ptr<>, the pending coordination requests keep the object
 * alive until they complete.
 */
class leader_election : public std::enable_shared_from_this<leader_election> {
public:
  /// The node used when no path is configured.
  static char const default_path[];

  //@{
  /// @name factory functions.
  static std::shared_ptr<leader_election> create();
  static std::shared_ptr<leader_election> create(std::shared_ptr<coordination_client> client);
  //@}

  leader_election(leader_election const&) = delete;
  leader_election& operator=(leader_election const&) = delete;

  //@{
  /**
   * @name configuration, only valid before start().
   *
   * Each setter returns the object to allow chaining, and raises @c invalid_state if the election already started.
   */
  leader_election& client(std::shared_ptr<coordination_client> client);
  /// Set the path of the election node, it must start with '/'.
  leader_election& path(std::string path);
  /// Set the identity written to the election node, the default is created by the identity generator.
  leader_election& identity(std::string identity);
  /// Set the permissions for the election node, the default is open_acl_unsafe().
  leader_election& acl(acl_list acl);
  leader_election& listener(std::shared_ptr<election_listener> listener);
  /// Set the functor used to create an identity if none was configured.
  leader_election& identity_generator(identity_generator_type generator);
  //@}

  //@{
  /// @name accessors, before start() the defaults are not applied yet.
  std::shared_ptr<coordination_client> const& client() const {
    return client_;
  }
  std::string const& path() const {
    return path_;
  }
  std::string const& identity() const {
    return identity_;
  }
  acl_list const& acl() const {
    return acl_;
  }
  //@}

  /**
   * Start running for election.
   *
   * Applies the defaults for any unset configuration and sends the first claim request.
   *
   * @throws not_configured if there is no coordination client, or the path is invalid.
   * @throws invalid_state if the election already started.
   */
  void start();

  /**
   * Stop running for election.
   *
   * The request is recorded and honored the next time the election would issue a coordination request.  The election
   * never deletes the node, a leader keeps its node until its session ends.  Calling this more than once is harmless.
   */
  void finish();

  /// The current state of the election.
  election_state state() const {
    return state_machine_.current();
  }

  /**
   * Handle a completion or watch notification.
   *
   * The coordination client callbacks registered by the election call this function, it is public so the election
   * can be driven directly in tests.
   */
  void handle_event(detail::election_event const& event);

private:
  leader_election();

  /// Apply defaults to the configuration, called once from start().
  void setup();

  /// Raise invalid_state if the configuration cannot be changed.
  void check_configurable(char const* what) const;

  /// Compute the effects of @a event and the next action, must be called with the lock held.
  detail::election_action decide(detail::election_event const& event);

  /// Stop the election if finish() was called or the client cannot recover, must be called with the lock held.
  bool gate_closed();

  /// Send the coordination request for @a action.
  void perform(detail::election_action action);

  //@{
  /// @name send each kind of request.
  void claim();
  void resolve();
  void track(std::uint64_t generation);
  //@}

  /// Transition to @a nstate and notify the listener, returns false if the transition was a no-op.
  bool change_state(char const* where, election_state nstate);

  /// Invoke @a functor with the listener, discarding (and logging) any exceptions.
  template <typename Functor>
  void notify(char const* what, Functor&& functor);

private:
  std::shared_ptr<coordination_client> client_;
  std::string path_;
  std::string identity_;
  acl_list acl_;
  std::shared_ptr<election_listener> listener_;
  identity_generator_type identity_generator_;

  detail::election_state_machine state_machine_;
  /// Incremented on each track request, watches from older requests are ignored.
  std::uint64_t watch_generation_;
};

} // namespace ballot

#endif // ballot_leader_election_hpp
