#ifndef ballot_session_hpp
#define ballot_session_hpp

#include <ballot/coordination_client.hpp>

#include <chrono>
#include <cstdint>

namespace ballot {

/**
 * Define the interface for a session, an abstraction to create and maintain etcd leases.
 *
 * The ephemeral nodes created by the etcd coordination client are attached to the session lease, they disappear when
 * the lease is revoked or expires.
 */
class session {
public:
  /**
   * Destroy a session, releasing only local resources.
   *
   * No attempt is made to release the lease in etcd, applications that want to release it promptly should call
   * revoke() before destroying the object.
   */
  virtual ~session() noexcept(false) = 0;

  /// The session's lease.
  virtual std::int64_t lease_id() const = 0;

  /// The TTL granted by the etcd server, which may differ from the requested value.
  virtual std::chrono::milliseconds actual_TTL() const = 0;

  /**
   * The state of the session.
   *
   * @c client_state::connecting while the keep alive stream is being re-established, @c client_state::closed once
   * the lease is revoked or known to be expired.
   */
  virtual client_state state() const = 0;

  /// Revoke the lease, blocks until the etcd server confirms it.
  virtual void revoke() = 0;
};

} // namespace ballot

#endif // ballot_session_hpp
