#ifndef ballot_etcd_coordination_client_hpp
#define ballot_etcd_coordination_client_hpp

#include <ballot/active_completion_queue.hpp>
#include <ballot/coordination_client.hpp>

#include <grpc++/grpc++.h>

#include <chrono>
#include <memory>

namespace ballot {
namespace detail {
template <typename completion_queue_type>
class session_impl;
template <typename completion_queue_type>
class etcd_client_impl;
} // namespace detail

/**
 * A coordination client backed by an etcd cluster.
 *
 * The client owns an etcd session (a lease kept alive in the background), ephemeral nodes are attached to that lease.
 * All callbacks run in the thread of the active_completion_queue.
 *
 * @code
 * auto queue = std::make_shared<ballot::active_completion_queue>();
 * auto channel = grpc::CreateChannel("localhost:2379", grpc::InsecureChannelCredentials());
 * auto client = std::make_shared<ballot::etcd_coordination_client>(queue, channel, std::chrono::seconds(10));
 * auto election = ballot::leader_election::create(client);
 * // ... use the election ...
 * client->shutdown();
 * @endcode
 *
 * The watchers registered by the elections keep the elections alive, and the elections keep the client alive.
 * Applications must call shutdown() to break that cycle.  Neither shutdown() nor the destructor may run in the
 * completion queue thread, i.e., from inside a callback.
 */
class etcd_coordination_client : public coordination_client {
public:
  /**
   * Create a client, blocks until the session is established.
   *
   * @param queue the completion queue used for all the etcd requests.
   * @param channel the connection to the etcd cluster.
   * @param desired_TTL the TTL requested for the session lease, etcd may grant a different value.
   * @throws std::runtime_error if the lease cannot be obtained.
   */
  etcd_coordination_client(
      std::shared_ptr<active_completion_queue> queue, std::shared_ptr<grpc::Channel> channel,
      std::chrono::milliseconds desired_TTL);
  ~etcd_coordination_client();

  etcd_coordination_client(etcd_coordination_client const&) = delete;
  etcd_coordination_client& operator=(etcd_coordination_client const&) = delete;

  void async_create(
      std::string const& path, std::string const& data, acl_list const& acl, create_mode mode,
      create_callback callback) override;
  void async_get(std::string const& path, get_callback callback) override;
  void async_exists(std::string const& path, watcher w, exists_callback callback) override;
  client_state state() const override;

  /// The lease holding the ephemeral nodes of this client.
  std::int64_t lease_id() const;

  /// The TTL granted by etcd.
  std::chrono::milliseconds actual_TTL() const;

  /**
   * Revoke the session lease.
   *
   * etcd deletes all the ephemeral nodes created by this client, and the client state becomes closed.
   *
   * @throws std::runtime_error if called from the completion queue thread.
   */
  void revoke();

  /**
   * Stop the client and discard pending watches, blocks until pending requests complete.
   *
   * @throws std::runtime_error if called from the completion queue thread.
   */
  void shutdown();

private:
  std::shared_ptr<active_completion_queue> queue_;
  std::shared_ptr<grpc::Channel> channel_;
  std::shared_ptr<detail::session_impl<completion_queue<>>> session_;
  std::unique_ptr<detail::etcd_client_impl<completion_queue<>>> client_;
};

} // namespace ballot

#endif // ballot_etcd_coordination_client_hpp
