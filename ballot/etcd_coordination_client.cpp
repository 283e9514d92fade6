#include "ballot/etcd_coordination_client.hpp"
#include <ballot/assert_throw.hpp>
#include <ballot/detail/etcd_client_impl.hpp>
#include <ballot/detail/session_impl.hpp>

namespace ballot {

etcd_coordination_client::etcd_coordination_client(
    std::shared_ptr<active_completion_queue> queue, std::shared_ptr<grpc::Channel> channel,
    std::chrono::milliseconds desired_TTL)
    : queue_(std::move(queue))
    , channel_(std::move(channel))
    , session_()
    , client_() {
  session_ = std::make_shared<detail::session_impl<completion_queue<>>>(
      queue_->cq(), etcdserverpb::Lease::NewStub(channel_), desired_TTL);
  client_ = std::make_unique<detail::etcd_client_impl<completion_queue<>>>(
      queue_->cq(), session_, etcdserverpb::KV::NewStub(channel_), etcdserverpb::Watch::NewStub(channel_));
}

etcd_coordination_client::~etcd_coordination_client() {
  // ... the client uses the session, destroy it first ...
  client_.reset();
}

void etcd_coordination_client::async_create(
    std::string const& path, std::string const& data, acl_list const& acl, create_mode mode,
    create_callback callback) {
  client_->async_create(path, data, acl, mode, std::move(callback));
}

void etcd_coordination_client::async_get(std::string const& path, get_callback callback) {
  client_->async_get(path, std::move(callback));
}

void etcd_coordination_client::async_exists(std::string const& path, watcher w, exists_callback callback) {
  client_->async_exists(path, std::move(w), std::move(callback));
}

client_state etcd_coordination_client::state() const {
  return client_->state();
}

std::int64_t etcd_coordination_client::lease_id() const {
  return session_->lease_id();
}

std::chrono::milliseconds etcd_coordination_client::actual_TTL() const {
  return session_->actual_TTL();
}

void etcd_coordination_client::revoke() {
  // ... blocks until the completion queue delivers the response, it would wait forever in that thread ...
  BALLOT_ASSERT_THROW(not queue_->in_loop_thread());
  session_->revoke();
}

void etcd_coordination_client::shutdown() {
  BALLOT_ASSERT_THROW(not queue_->in_loop_thread());
  client_->shutdown();
}

} // namespace ballot
