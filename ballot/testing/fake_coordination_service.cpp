#include "ballot/testing/fake_coordination_service.hpp"
#include <ballot/log.hpp>

#include <iostream>
#include <stdexcept>

namespace ballot {
namespace testing {

std::ostream& operator<<(std::ostream& os, fake_operation x) {
  switch (x) {
  case fake_operation::create:
    return os << "create";
  case fake_operation::get:
    return os << "get";
  case fake_operation::exists:
    return os << "exists";
  }
  return os << "[invalid fake_operation:" << static_cast<int>(x) << "]";
}

fake_coordination_service::fake_coordination_service()
    : mu_()
    , nodes_()
    , watches_()
    , completions_()
    , revision_(1)
    , session_generator_(0)
    , clients_() {
}

std::shared_ptr<fake_coordination_client> fake_coordination_service::create_client() {
  std::lock_guard<std::mutex> lock(mu_);
  auto id = ++session_generator_;
  auto client = std::make_shared<fake_coordination_client>(shared_from_this(), id);
  clients_[id] = client;
  return client;
}

bool fake_coordination_service::deliver_one() {
  std::function<void()> completion;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (completions_.empty()) {
      return false;
    }
    completion = std::move(completions_.front());
    completions_.pop_front();
  }
  completion();
  return true;
}

std::size_t fake_coordination_service::deliver_all(std::size_t max) {
  std::size_t count = 0;
  while (count < max and deliver_one()) {
    ++count;
  }
  return count;
}

std::size_t fake_coordination_service::pending() const {
  std::lock_guard<std::mutex> lock(mu_);
  return completions_.size();
}

bool fake_coordination_service::exists(std::string const& path) const {
  std::lock_guard<std::mutex> lock(mu_);
  return nodes_.find(path) != nodes_.end();
}

std::string fake_coordination_service::data(std::string const& path) const {
  std::lock_guard<std::mutex> lock(mu_);
  return nodes_.at(path).data;
}

node_stat fake_coordination_service::stat(std::string const& path) const {
  std::lock_guard<std::mutex> lock(mu_);
  return nodes_.at(path).stat;
}

void fake_coordination_service::set(std::string const& path, std::string const& data) {
  std::lock_guard<std::mutex> lock(mu_);
  auto i = nodes_.find(path);
  if (i == nodes_.end()) {
    do_create(path, data, create_mode::persistent, 0);
    return;
  }
  i->second.data = data;
  i->second.stat.mod_revision = ++revision_;
  ++i->second.stat.version;
  fire_watches(path, watch_event_type::data_changed);
}

void fake_coordination_service::remove(std::string const& path) {
  std::lock_guard<std::mutex> lock(mu_);
  remove_node(path);
}

std::size_t fake_coordination_service::watch_count(std::string const& path) const {
  std::lock_guard<std::mutex> lock(mu_);
  auto i = watches_.find(path);
  if (i == watches_.end()) {
    return 0;
  }
  return i->second.size();
}

void fake_coordination_service::expire_session(std::int64_t session_id) {
  std::shared_ptr<fake_coordination_client> client;
  {
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<std::string> owned;
    for (auto const& kv : nodes_) {
      if (kv.second.stat.ephemeral_owner == session_id) {
        owned.push_back(kv.first);
      }
    }
    for (auto const& path : owned) {
      remove_node(path);
    }
    auto c = clients_.find(session_id);
    if (c != clients_.end()) {
      client = c->second.lock();
    }
  }
  BALLOT_LOG(debug) << "fake session " << session_id << " expired";
  if (client) {
    client->state(client_state::closed);
  }
}

void fake_coordination_service::enqueue(std::function<void()> completion) {
  completions_.emplace_back(std::move(completion));
}

void fake_coordination_service::fire_watches(std::string const& path, watch_event_type type) {
  auto i = watches_.find(path);
  if (i == watches_.end()) {
    return;
  }
  auto armed = std::move(i->second);
  watches_.erase(i);
  for (auto& a : armed) {
    enqueue([w = std::move(a.w), ev = watch_event{type, path}]() { w(ev); });
  }
}

void fake_coordination_service::remove_node(std::string const& path) {
  if (nodes_.erase(path) == 0) {
    return;
  }
  ++revision_;
  fire_watches(path, watch_event_type::deleted);
}

result_code fake_coordination_service::do_create(
    std::string const& path, std::string const& data, create_mode mode, std::int64_t session_id) {
  if (nodes_.find(path) != nodes_.end()) {
    return result_code::node_exists;
  }
  node n;
  n.data = data;
  n.stat.create_revision = ++revision_;
  n.stat.mod_revision = n.stat.create_revision;
  n.stat.version = 0;
  n.stat.ephemeral_owner = mode == create_mode::ephemeral ? session_id : 0;
  nodes_.emplace(path, std::move(n));
  fire_watches(path, watch_event_type::created);
  return result_code::ok;
}

result_code fake_coordination_service::do_get(std::string const& path, std::string& data, node_stat& stat) const {
  auto i = nodes_.find(path);
  if (i == nodes_.end()) {
    return result_code::no_node;
  }
  data = i->second.data;
  stat = i->second.stat;
  return result_code::ok;
}

result_code fake_coordination_service::do_exists(std::string const& path, node_stat& stat) const {
  auto i = nodes_.find(path);
  if (i == nodes_.end()) {
    return result_code::no_node;
  }
  stat = i->second.stat;
  return result_code::ok;
}

fake_coordination_client::fake_coordination_client(
    std::shared_ptr<fake_coordination_service> service, std::int64_t session_id)
    : service_(std::move(service))
    , session_id_(session_id)
    , mu_()
    , state_(client_state::healthy)
    , failures_()
    , persistent_failures_()
    , calls_()
    , last_acl_()
    , synchronous_(false) {
}

void fake_coordination_client::async_create(
    std::string const& path, std::string const& data, acl_list const& acl, create_mode mode,
    create_callback callback) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    last_acl_ = acl;
  }
  injected_failure failure{result_code::ok, false};
  bool fail = next_failure(fake_operation::create, failure);
  auto rc = failure.rc;
  if (not fail or failure.apply) {
    if (is_fatal(state()) and mode == create_mode::ephemeral) {
      rc = result_code::session_expired;
    } else {
      std::lock_guard<std::mutex> lock(service_->mu_);
      auto applied = service_->do_create(path, data, mode, session_id_);
      if (not fail) {
        rc = applied;
      }
    }
  }
  complete([callback, rc, path]() { callback(rc, path); });
}

void fake_coordination_client::async_get(std::string const& path, get_callback callback) {
  injected_failure failure{result_code::ok, false};
  std::string data;
  node_stat stat;
  auto rc = failure.rc;
  if (next_failure(fake_operation::get, failure)) {
    rc = failure.rc;
  } else {
    std::lock_guard<std::mutex> lock(service_->mu_);
    rc = service_->do_get(path, data, stat);
  }
  complete([callback, rc, data, stat]() { callback(rc, data, stat); });
}

void fake_coordination_client::async_exists(std::string const& path, watcher w, exists_callback callback) {
  injected_failure failure{result_code::ok, false};
  node_stat stat;
  auto rc = failure.rc;
  if (next_failure(fake_operation::exists, failure)) {
    rc = failure.rc;
  } else {
    std::lock_guard<std::mutex> lock(service_->mu_);
    rc = service_->do_exists(path, stat);
    service_->watches_[path].push_back(fake_coordination_service::armed_watch{session_id_, std::move(w)});
  }
  complete([callback, rc, stat]() { callback(rc, stat); });
}

client_state fake_coordination_client::state() const {
  std::lock_guard<std::mutex> lock(mu_);
  return state_;
}

void fake_coordination_client::state(client_state s) {
  std::lock_guard<std::mutex> lock(mu_);
  if (is_fatal(state_)) {
    return;
  }
  state_ = s;
}

void fake_coordination_client::inject_failure(fake_operation op, result_code rc, bool apply) {
  std::lock_guard<std::mutex> lock(mu_);
  failures_[op].push_back(injected_failure{rc, apply});
}

void fake_coordination_client::fail_always(fake_operation op, result_code rc) {
  std::lock_guard<std::mutex> lock(mu_);
  persistent_failures_[op] = rc;
}

void fake_coordination_client::clear_failures() {
  std::lock_guard<std::mutex> lock(mu_);
  failures_.clear();
  persistent_failures_.clear();
}

int fake_coordination_client::calls(fake_operation op) const {
  std::lock_guard<std::mutex> lock(mu_);
  auto i = calls_.find(op);
  if (i == calls_.end()) {
    return 0;
  }
  return i->second;
}

acl_list fake_coordination_client::last_acl() const {
  std::lock_guard<std::mutex> lock(mu_);
  return last_acl_;
}

void fake_coordination_client::complete_synchronously(bool value) {
  std::lock_guard<std::mutex> lock(mu_);
  synchronous_ = value;
}

bool fake_coordination_client::next_failure(fake_operation op, injected_failure& failure) {
  std::lock_guard<std::mutex> lock(mu_);
  ++calls_[op];
  auto p = persistent_failures_.find(op);
  if (p != persistent_failures_.end()) {
    failure = injected_failure{p->second, false};
    return true;
  }
  auto& queue = failures_[op];
  if (queue.empty()) {
    return false;
  }
  failure = queue.front();
  queue.pop_front();
  return true;
}

void fake_coordination_client::complete(std::function<void()> completion) {
  bool synchronous;
  {
    std::lock_guard<std::mutex> lock(mu_);
    synchronous = synchronous_;
  }
  if (synchronous) {
    completion();
    return;
  }
  std::lock_guard<std::mutex> lock(service_->mu_);
  service_->enqueue(std::move(completion));
}

} // namespace testing
} // namespace ballot
