#ifndef ballot_coordination_client_hpp
#define ballot_coordination_client_hpp

#include <cstdint>
#include <functional>
#include <iosfwd>
#include <string>
#include <vector>

namespace ballot {

/**
 * The outcome of a coordination service call.
 *
 * The names follow the ZooKeeper return codes.  The election treats @c ok, @c node_exists and @c no_node as
 * definite answers, and every other value as a transient (or ambiguous) failure.
 */
enum class result_code {
  ok,
  /// The node already exists (create).
  node_exists,
  /// The node does not exist (get, exists).
  no_node,
  /// The connection to the service was lost, the operation may or may not have taken effect.
  connection_loss,
  /// The operation did not complete in time, it may or may not have taken effect.
  operation_timeout,
  /// The session expired, session-scoped nodes created by this client are gone.
  session_expired,
  /// The client failed to authenticate, or is not authorized for the operation.
  auth_failed,
  /// The client is shutting down or closed.
  invalid_state,
  /// Any other failure.
  system_error,
};

/// Streaming operator for @c result_code.
std::ostream& operator<<(std::ostream& os, result_code x);

/**
 * The state of the client's session with the coordination service.
 */
enum class client_state {
  /// The session is established.
  healthy,
  /// The session is being established or re-established, requests may fail transiently.
  connecting,
  /// The credentials were rejected, the client will never recover.
  auth_failed,
  /// The session is closed or expired, the client will never recover.
  closed,
};

/// Streaming operator for @c client_state.
std::ostream& operator<<(std::ostream& os, client_state x);

/**
 * Return true if the client cannot recover from @a state.
 */
inline bool is_fatal(client_state state) {
  return state == client_state::auth_failed or state == client_state::closed;
}

/// How a node is created.
enum class create_mode {
  /// The node persists until it is explicitly deleted.
  persistent,
  /// The node is deleted when the session of the client that created it ends.
  ephemeral,
};

//@{
/// @name Permission bits, same values as the ZooKeeper C client.
int constexpr perm_read = 1 << 0;
int constexpr perm_write = 1 << 1;
int constexpr perm_create = 1 << 2;
int constexpr perm_delete = 1 << 3;
int constexpr perm_admin = 1 << 4;
int constexpr perm_all = perm_read | perm_write | perm_create | perm_delete | perm_admin;
//@}

/**
 * An entry in the access control list of a node.
 *
 * The election never interprets these values, it simply passes them to the coordination client when creating nodes.
 */
struct acl {
  int perms;
  std::string scheme;
  std::string id;
};

/// Compare two acl entries.
inline bool operator==(acl const& lhs, acl const& rhs) {
  return lhs.perms == rhs.perms and lhs.scheme == rhs.scheme and lhs.id == rhs.id;
}

/// The permission descriptor for a node.
using acl_list = std::vector<acl>;

/// A completely open acl list: anyone can do anything.
acl_list open_acl_unsafe();

/**
 * Metadata about a node.
 */
struct node_stat {
  /// The revision (or transaction id) that created the node.
  std::int64_t create_revision = 0;
  /// The revision (or transaction id) that last modified the node.
  std::int64_t mod_revision = 0;
  /// The number of changes to the node data.
  std::int64_t version = 0;
  /// The session owning the node if it is ephemeral, 0 otherwise.
  std::int64_t ephemeral_owner = 0;
};

/// The type of change reported to a watcher.
enum class watch_event_type {
  created,
  deleted,
  data_changed,
  /// The watch was lost, for example because the client closed.
  other,
};

/// Streaming operator for @c watch_event_type.
std::ostream& operator<<(std::ostream& os, watch_event_type x);

/// A change notification delivered to a watcher.
struct watch_event {
  watch_event_type type;
  std::string path;
};

/**
 * The capabilities of a hierarchical coordination service that the election needs.
 *
 * All operations are asynchronous, the callbacks are invoked from the client's own I/O thread, one at a time, in the
 * order the results are delivered.  Implementations may invoke the callback before the operation returns, callers
 * must not hold locks needed by the callback when starting an operation.
 */
class coordination_client {
public:
  //@{
  /// @name type traits
  using create_callback = std::function<void(result_code rc, std::string const& path)>;
  using get_callback = std::function<void(result_code rc, std::string const& data, node_stat const& stat)>;
  using exists_callback = std::function<void(result_code rc, node_stat const& stat)>;
  /// Called exactly once for each registration, with the next change on the watched node.
  using watcher = std::function<void(watch_event const& event)>;
  //@}

  virtual ~coordination_client() = default;

  /**
   * Atomically create a node if it does not exist.
   *
   * @param path the path of the node.
   * @param data the contents of the new node.
   * @param acl the permissions for the new node, passed through to the service.
   * @param mode if the node is ephemeral (tied to the client session) or persistent.
   * @param callback receives @c result_code::ok if the node was created, @c result_code::node_exists if it already
   *   existed, and other values on failures.
   */
  virtual void async_create(
      std::string const& path, std::string const& data, acl_list const& acl, create_mode mode,
      create_callback callback) = 0;

  /**
   * Read the contents of a node.
   *
   * @param callback receives @c result_code::ok and the data, @c result_code::no_node if the node does not exist,
   *   and other values on failures.
   */
  virtual void async_get(std::string const& path, get_callback callback) = 0;

  /**
   * Check if a node exists and leave a watch on it.
   *
   * The watch is set whether the node exists or not, @a w is called exactly once, with the first change on the node
   * after the check.  If the check fails the watch may not be set.
   *
   * @param callback receives @c result_code::ok if the node exists, @c result_code::no_node if it does not, and other
   *   values on failures.
   */
  virtual void async_exists(std::string const& path, watcher w, exists_callback callback) = 0;

  /// Return the current state of the client session, never blocks.
  virtual client_state state() const = 0;
};

} // namespace ballot

#endif // ballot_coordination_client_hpp
