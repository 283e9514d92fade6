#ifndef ballot_testing_fake_coordination_service_hpp
#define ballot_testing_fake_coordination_service_hpp

#include <ballot/coordination_client.hpp>

#include <cstdint>
#include <deque>
#include <functional>
#include <iosfwd>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace ballot {
namespace testing {
class fake_coordination_client;

/// The operations of a coordination client, used to inject failures and count calls.
enum class fake_operation { create, get, exists };

/// Streaming operator for @c fake_operation.
std::ostream& operator<<(std::ostream& os, fake_operation x);

/**
 * An in-memory coordination service for tests.
 *
 * Holds a flat tree of nodes, sessions (one per client), ephemeral nodes and one-shot watches.  The clients never
 * invoke callbacks from the call that starts an operation (unless configured to), the completions are queued and the
 * test delivers them with deliver_one() or deliver_all(), from the test thread, one at a time.  That emulates the
 * I/O thread of a real client and makes the tests deterministic.
 *
 * @code
 * auto service = std::make_shared<ballot::testing::fake_coordination_service>();
 * auto client = service->create_client();
 * auto election = ballot::leader_election::create(client);
 * election->start();
 * service->deliver_all();
 * EXPECT_EQ(election->state(), ballot::election_state::leader);
 * @endcode
 */
class fake_coordination_service : public std::enable_shared_from_this<fake_coordination_service> {
public:
  fake_coordination_service();

  /// Create a client with a new session.
  std::shared_ptr<fake_coordination_client> create_client();

  //@{
  /// @name deliver the queued completions and watch events.
  /// Deliver the oldest completion, returns false if there was none.
  bool deliver_one();
  /// Deliver completions until the queue is empty, or @a max completions were delivered, returns the count.
  std::size_t deliver_all(std::size_t max = 10000);
  /// The number of queued completions.
  std::size_t pending() const;
  //@}

  //@{
  /**
   * @name direct access to the tree, as another client of the service would change it.
   *
   * Changes fire the watches on the node, the notifications are queued.
   */
  bool exists(std::string const& path) const;
  /// The node contents, raises std::out_of_range if the node does not exist.
  std::string data(std::string const& path) const;
  /// The node metadata, raises std::out_of_range if the node does not exist.
  node_stat stat(std::string const& path) const;
  /// Create a persistent node, or change the contents of an existing one.
  void set(std::string const& path, std::string const& data);
  /// Delete a node, no-op if it does not exist.
  void remove(std::string const& path);
  //@}

  /// The number of watches armed on @a path.
  std::size_t watch_count(std::string const& path) const;

  /// End a session, deleting its ephemeral nodes, the client reports client_state::closed from now on.
  void expire_session(std::int64_t session_id);

private:
  friend class fake_coordination_client;

  struct node {
    std::string data;
    node_stat stat;
  };

  struct armed_watch {
    std::int64_t session_id;
    coordination_client::watcher w;
  };

  /// Queue a completion, the lock must be held.
  void enqueue(std::function<void()> completion);

  /// Move the watches on @a path to the completion queue, the lock must be held.
  void fire_watches(std::string const& path, watch_event_type type);

  /// Delete a node and fire its watches, the lock must be held.
  void remove_node(std::string const& path);

  //@{
  /// @name the implementation of the client operations, the lock must be held.
  result_code do_create(std::string const& path, std::string const& data, create_mode mode, std::int64_t session_id);
  result_code do_get(std::string const& path, std::string& data, node_stat& stat) const;
  result_code do_exists(std::string const& path, node_stat& stat) const;
  //@}

private:
  mutable std::mutex mu_;
  std::map<std::string, node> nodes_;
  std::map<std::string, std::vector<armed_watch>> watches_;
  std::deque<std::function<void()>> completions_;
  std::int64_t revision_;
  std::int64_t session_generator_;
  std::map<std::int64_t, std::weak_ptr<fake_coordination_client>> clients_;
};

/**
 * A client of the fake_coordination_service.
 *
 * Besides the coordination_client operations it can inject failures and report how many times each operation was
 * called.
 */
class fake_coordination_client : public coordination_client {
public:
  fake_coordination_client(std::shared_ptr<fake_coordination_service> service, std::int64_t session_id);

  void async_create(
      std::string const& path, std::string const& data, acl_list const& acl, create_mode mode,
      create_callback callback) override;
  void async_get(std::string const& path, get_callback callback) override;
  void async_exists(std::string const& path, watcher w, exists_callback callback) override;
  client_state state() const override;

  /// Change the state reported by the client, the fatal states are never left.
  void state(client_state s);

  std::int64_t session_id() const {
    return session_id_;
  }

  /**
   * Make the next call to @a op fail with @a rc.
   *
   * Injected failures are consumed in order, one per call.  If @a apply is true the operation takes effect in the
   * service anyway, that is how a create that succeeded but whose response was lost looks like.
   */
  void inject_failure(fake_operation op, result_code rc, bool apply = false);

  /// Make all calls to @a op fail with @a rc, until clear_failures() is called.
  void fail_always(fake_operation op, result_code rc);

  /// Remove all the injected failures.
  void clear_failures();

  /// The number of calls to @a op.
  int calls(fake_operation op) const;

  /// The acl received in the last create call.
  acl_list last_acl() const;

  /**
   * Invoke the callbacks before the operation returns.
   *
   * Watch events are still queued, only the operation results are delivered immediately.
   */
  void complete_synchronously(bool value);

private:
  struct injected_failure {
    result_code rc;
    bool apply;
  };

  /// Return true and set @a failure if the next call to @a op must fail.
  bool next_failure(fake_operation op, injected_failure& failure);

  /// Queue the completion, or run it now if complete_synchronously() is set.
  void complete(std::function<void()> completion);

private:
  std::shared_ptr<fake_coordination_service> service_;
  std::int64_t session_id_;

  mutable std::mutex mu_;
  client_state state_;
  std::map<fake_operation, std::deque<injected_failure>> failures_;
  std::map<fake_operation, result_code> persistent_failures_;
  std::map<fake_operation, int> calls_;
  acl_list last_acl_;
  bool synchronous_;
};

} // namespace testing
} // namespace ballot

#endif // ballot_testing_fake_coordination_service_hpp
