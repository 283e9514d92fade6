#ifndef ballot_detail_etcd_client_impl_hpp
#define ballot_detail_etcd_client_impl_hpp

#include <ballot/completion_queue.hpp>
#include <ballot/coordination_client.hpp>
#include <ballot/detail/async_op_counter.hpp>
#include <ballot/detail/exponential_backoff.hpp>
#include <ballot/detail/grpc_errors.hpp>
#include <ballot/detail/stream_async_ops.hpp>
#include <ballot/log.hpp>
#include <ballot/session.hpp>

#include <etcd/etcdserver/etcdserverpb/rpc.grpc.pb.h>

#include <chrono>
#include <climits>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace ballot {
namespace detail {

/**
 * Implement ballot::coordination_client on top of the etcd v3 API.
 *
 * Nodes are etcd keys, the node path is the key.  The operations map to etcd as follows:
 *   - create: a Txn that puts the key only if its create revision is 0, i.e., if it does not exist.  Ephemeral nodes
 *     are attached to the session lease.
 *   - get: a Range on the key.
 *   - exists: a Range on the key with keys_only.  The watch is a WatchCreateRequest on a shared Watch stream, starting
 *     at the revision after the Range, so no change between the check and the watch is missed.  The watch is cancelled
 *     after its first event, which makes it a one-shot watch.
 *
 * etcd has no per-node access control lists, the acl argument is accepted and ignored.
 *
 * If the Watch stream breaks the client reports @c client_state::connecting, re-creates the stream with an exponential
 * backoff, and re-registers all pending watches at their original revision.  If etcd compacted that revision the client
 * reads the key again and fires the watch if it changed.
 *
 * All callbacks run in the completion queue thread.  The constructor, shutdown() and the destructor block, and must not
 * be called from that thread.
 */
template <typename completion_queue_type>
class etcd_client_impl : public coordination_client {
public:
  //@{
  /// @name type traits
  using watch_stream_type = async_rdwr_stream<etcdserverpb::WatchRequest, etcdserverpb::WatchResponse>;
  //@}

  /// How long to wait before re-reading a key whose watch was cancelled by the server.
  static std::chrono::milliseconds constexpr recheck_delay{1000};

  /// Constructor, blocks until the Watch stream is created.
  etcd_client_impl(
      completion_queue_type& queue, std::shared_ptr<session> s, std::unique_ptr<etcdserverpb::KV::Stub> kv_stub,
      std::unique_ptr<etcdserverpb::Watch::Stub> watch_stub)
      : queue_(queue)
      , session_(std::move(s))
      , kv_client_(std::move(kv_stub))
      , watch_client_(std::move(watch_stub))
      , mu_()
      , watch_stream_()
      , watch_ready_(false)
      , auth_failed_(false)
      , shutdown_(false)
      , token_generator_(0)
      , entries_()
      , pending_creates_()
      , by_id_()
      , writes_()
      , write_in_flight_(false)
      , timer_generator_(0)
      , timers_()
      , backoff_(std::chrono::milliseconds(100), std::chrono::seconds(5), INT_MAX)
      , ops_() {
    preamble();
  }

  etcd_client_impl(etcd_client_impl const&) = delete;
  etcd_client_impl& operator=(etcd_client_impl const&) = delete;

  ~etcd_client_impl() {
    shutdown();
  }

  void async_create(
      std::string const& path, std::string const& data, acl_list const&, create_mode mode,
      create_callback callback) override {
    if (not ops_.async_op_start("etcd_client/create/txn")) {
      safe_invoke("create callback", [&]() { callback(result_code::invalid_state, path); });
      return;
    }
    etcdserverpb::TxnRequest req;
    auto& cmp = *req.add_compare();
    cmp.set_result(etcdserverpb::Compare::EQUAL);
    cmp.set_target(etcdserverpb::Compare::CREATE);
    cmp.set_key(path);
    cmp.set_create_revision(0);
    auto& put = *req.add_success()->mutable_request_put();
    put.set_key(path);
    put.set_value(data);
    if (mode == create_mode::ephemeral) {
      put.set_lease(session_->lease_id());
    }
    queue_.async_rpc(
        kv_client_.get(), &etcdserverpb::KV::Stub::AsyncTxn, std::move(req), "etcd_client/create/txn",
        [this, path, cb = std::move(callback)](auto const& op, bool ok) {
          ops_.async_op_done("etcd_client/create/txn");
          auto rc = this->rpc_result(ok, op.status);
          if (rc == result_code::ok and not op.response.succeeded()) {
            rc = result_code::node_exists;
          }
          this->safe_invoke("create callback", [&]() { cb(rc, path); });
        });
  }

  void async_get(std::string const& path, get_callback callback) override {
    if (not ops_.async_op_start("etcd_client/get/range")) {
      safe_invoke("get callback", [&]() { callback(result_code::invalid_state, std::string(), node_stat()); });
      return;
    }
    etcdserverpb::RangeRequest req;
    req.set_key(path);
    queue_.async_rpc(
        kv_client_.get(), &etcdserverpb::KV::Stub::AsyncRange, std::move(req), "etcd_client/get/range",
        [this, cb = std::move(callback)](auto const& op, bool ok) {
          ops_.async_op_done("etcd_client/get/range");
          auto rc = this->rpc_result(ok, op.status);
          std::string data;
          node_stat stat;
          if (rc == result_code::ok) {
            if (op.response.kvs_size() == 0) {
              rc = result_code::no_node;
            } else {
              data = op.response.kvs(0).value();
              stat = to_node_stat(op.response.kvs(0));
            }
          }
          this->safe_invoke("get callback", [&]() { cb(rc, data, stat); });
        });
  }

  void async_exists(std::string const& path, watcher w, exists_callback callback) override {
    if (not ops_.async_op_start("etcd_client/exists/range")) {
      safe_invoke("exists callback", [&]() { callback(result_code::invalid_state, node_stat()); });
      return;
    }
    etcdserverpb::RangeRequest req;
    req.set_key(path);
    req.set_keys_only(true);
    queue_.async_rpc(
        kv_client_.get(), &etcdserverpb::KV::Stub::AsyncRange, std::move(req), "etcd_client/exists/range",
        [this, path, w = std::move(w), cb = std::move(callback)](auto const& op, bool ok) {
          ops_.async_op_done("etcd_client/exists/range");
          auto rc = this->rpc_result(ok, op.status);
          node_stat stat;
          if (rc == result_code::ok) {
            if (op.response.kvs_size() == 0) {
              rc = result_code::no_node;
            } else {
              stat = to_node_stat(op.response.kvs(0));
            }
          }
          this->safe_invoke("exists callback", [&]() { cb(rc, stat); });
          if (rc == result_code::ok or rc == result_code::no_node) {
            this->add_watch(path, op.response.header().revision() + 1, stat, w);
          }
        });
  }

  client_state state() const override {
    std::lock_guard<std::mutex> lock(mu_);
    if (shutdown_) {
      return client_state::closed;
    }
    if (auth_failed_) {
      return client_state::auth_failed;
    }
    auto s = session_->state();
    if (is_fatal(s) or not watch_ready_) {
      return is_fatal(s) ? s : client_state::connecting;
    }
    return s;
  }

  /// The number of watches waiting for an event.
  std::size_t pending_watches() const {
    std::lock_guard<std::mutex> lock(mu_);
    return entries_.size();
  }

  /**
   * Stop the client.
   *
   * Pending watches are discarded without notification, new operations complete immediately with
   * @c result_code::invalid_state.  Blocks until all pending operations complete.
   */
  void shutdown() {
    std::shared_ptr<watch_stream_type> stream;
    std::map<std::uint64_t, watch_entry> entries;
    std::map<std::uint64_t, std::shared_ptr<deadline_timer>> timers;
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (shutdown_) {
        return;
      }
      shutdown_ = true;
      watch_ready_ = false;
      stream = std::move(watch_stream_);
      entries.swap(entries_);
      timers.swap(timers_);
      pending_creates_.clear();
      by_id_.clear();
      writes_.clear();
    }
    ops_.shutdown();
    for (auto& t : timers) {
      t.second->cancel();
    }
    if (stream) {
      queue_.try_cancel_on(*stream);
    }
    ops_.block_until_all_done();
    if (stream) {
      auto status = queue_.async_finish(*stream, "etcd_client/shutdown/finish", ballot::use_future()).get();
      BALLOT_LOG(debug) << "watch stream closed, status=" << status.error_message() << " [" << status.error_code()
                        << "]";
    }
    BALLOT_LOG(info) << "etcd client shutdown, discarded " << entries.size() << " pending watches";
  }

private:
  /// A watch waiting for its first event.
  struct watch_entry {
    std::string path;
    /// The revision where the watch starts, re-registrations resume from here.
    std::int64_t start_revision;
    /// The node state at the time of the check, create_revision is 0 if it did not exist.
    std::int64_t create_revision;
    std::int64_t mod_revision;
    watcher w;
    /// The etcd watch id, -1 while the watch is not registered.
    std::int64_t watch_id;
  };

  /// A watch ready to be notified, used to call the watchers without holding the lock.
  struct ready_watch {
    watcher w;
    watch_event event;
  };

  static node_stat to_node_stat(mvccpb::KeyValue const& kv) {
    node_stat stat;
    stat.create_revision = kv.create_revision();
    stat.mod_revision = kv.mod_revision();
    stat.version = kv.version();
    stat.ephemeral_owner = kv.lease();
    return stat;
  }

  /// Create the Watch stream and start reading from it.
  void preamble() {
    auto fut = queue_.async_create_rdwr_stream(
        watch_client_.get(), &etcdserverpb::Watch::Stub::AsyncWatch, "etcd_client/preamble/watch_stream",
        ballot::use_future());
    auto stream = fut.get();
    {
      std::lock_guard<std::mutex> lock(mu_);
      watch_stream_ = stream;
      watch_ready_ = true;
    }
    start_read(std::move(stream));
  }

  /// Call a user callback, logging (and discarding) any exceptions.
  template <typename Functor>
  void safe_invoke(char const* what, Functor&& functor) {
    try {
      functor();
    } catch (std::exception const& ex) {
      BALLOT_LOG(warning) << what << " raised an exception, ignored: " << ex.what();
    } catch (...) {
      BALLOT_LOG(warning) << what << " raised an unknown exception, ignored";
    }
  }

  /// Convert the result of an RPC, latching authentication failures.
  result_code rpc_result(bool ok, grpc::Status const& status) {
    auto rc = to_result_code(ok, status);
    if (rc == result_code::ok) {
      return rc;
    }
    if (rc == result_code::auth_failed) {
      std::lock_guard<std::mutex> lock(mu_);
      if (not auth_failed_) {
        BALLOT_LOG(error) << "etcd rejected the credentials: " << status.error_message();
      }
      auth_failed_ = true;
      return rc;
    }
    if (session_->state() == client_state::closed) {
      return result_code::session_expired;
    }
    return rc;
  }

  /// Register a new one-shot watch.
  void add_watch(std::string const& path, std::int64_t start_revision, node_stat const& stat, watcher w) {
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (shutdown_) {
        return;
      }
      auto token = ++token_generator_;
      entries_.emplace(
          token, watch_entry{path, start_revision, stat.create_revision, stat.mod_revision, std::move(w), -1});
      if (watch_stream_) {
        enqueue_create(token);
      }
    }
    flush_writes();
  }

  /// Queue a WatchCreateRequest for the entry, must be called with the lock held.
  void enqueue_create(std::uint64_t token) {
    auto const& e = entries_.at(token);
    etcdserverpb::WatchRequest req;
    auto& create = *req.mutable_create_request();
    create.set_key(e.path);
    create.set_start_revision(e.start_revision);
    writes_.emplace_back(std::move(req));
    pending_creates_.push_back(token);
  }

  /// Queue a WatchCancelRequest, must be called with the lock held.
  void enqueue_cancel(std::int64_t watch_id) {
    etcdserverpb::WatchRequest req;
    req.mutable_cancel_request()->set_watch_id(watch_id);
    writes_.emplace_back(std::move(req));
  }

  /// Start the next Write() on the Watch stream, gRPC allows only one at a time.
  void flush_writes() {
    std::shared_ptr<watch_stream_type> stream;
    etcdserverpb::WatchRequest req;
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (write_in_flight_ or writes_.empty() or not watch_stream_) {
        return;
      }
      stream = watch_stream_;
      req = std::move(writes_.front());
      writes_.pop_front();
      write_in_flight_ = true;
    }
    if (not ops_.async_op_start("etcd_client/watch/write")) {
      return;
    }
    queue_.async_write(*stream, std::move(req), "etcd_client/watch/write", [this, stream](auto const&, bool ok) {
      this->on_write(stream, ok);
    });
  }

  void on_write(std::shared_ptr<watch_stream_type> stream, bool ok) {
    ops_.async_op_done("etcd_client/watch/write");
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (watch_stream_ != stream) {
        return;
      }
      write_in_flight_ = false;
    }
    if (not ok) {
      on_stream_failure(std::move(stream), "write");
      return;
    }
    flush_writes();
  }

  void start_read(std::shared_ptr<watch_stream_type> stream) {
    if (not ops_.async_op_start("etcd_client/watch/read")) {
      return;
    }
    queue_.async_read(*stream, "etcd_client/watch/read", [this, stream](auto const& op, bool ok) {
      this->on_read(stream, op, ok);
    });
  }

  void on_read(std::shared_ptr<watch_stream_type> stream, typename watch_stream_type::read_op const& op, bool ok) {
    ops_.async_op_done("etcd_client/watch/read");
    if (not ok) {
      on_stream_failure(std::move(stream), "read");
      return;
    }
    on_watch_response(op.response);
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (watch_stream_ != stream) {
        return;
      }
    }
    start_read(std::move(stream));
  }

  /// Dispatch a response from the Watch stream.
  void on_watch_response(etcdserverpb::WatchResponse const& resp) {
    std::vector<ready_watch> ready;
    std::vector<std::uint64_t> rechecks;
    {
      std::lock_guard<std::mutex> lock(mu_);
      auto id = resp.watch_id();
      if (resp.created()) {
        // ... etcd answers the create requests in order ...
        if (pending_creates_.empty()) {
          BALLOT_LOG(warning) << "unexpected watch created response " << print_to_stream(resp);
          return;
        }
        auto token = pending_creates_.front();
        pending_creates_.pop_front();
        auto i = entries_.find(token);
        if (i == entries_.end()) {
          enqueue_cancel(id);
        } else if (resp.canceled()) {
          rechecks.push_back(token);
        } else {
          i->second.watch_id = id;
          by_id_[id] = token;
        }
      } else if (resp.canceled()) {
        auto b = by_id_.find(id);
        if (b != by_id_.end()) {
          auto token = b->second;
          by_id_.erase(b);
          auto i = entries_.find(token);
          if (i != entries_.end() and i->second.watch_id == id) {
            BALLOT_LOG(info) << "watch on " << i->second.path << " cancelled by the server, compact_revision="
                             << resp.compact_revision() << ", reason=" << resp.cancel_reason();
            i->second.watch_id = -1;
            rechecks.push_back(token);
          }
        }
      } else if (resp.events_size() > 0) {
        auto b = by_id_.find(id);
        if (b != by_id_.end()) {
          auto token = b->second;
          by_id_.erase(b);
          auto i = entries_.find(token);
          if (i != entries_.end()) {
            auto const& ev = resp.events(0);
            auto type = watch_event_type::data_changed;
            if (ev.type() == mvccpb::Event::DELETE) {
              type = watch_event_type::deleted;
            } else if (ev.kv().version() == 1) {
              type = watch_event_type::created;
            }
            ready.push_back(ready_watch{std::move(i->second.w), watch_event{type, i->second.path}});
            entries_.erase(i);
          }
          // ... the watch is one-shot, the remaining events are not interesting ...
          enqueue_cancel(id);
        }
      }
    }
    flush_writes();
    fire(ready);
    for (auto token : rechecks) {
      recheck(token);
    }
  }

  /// Call the watchers, without holding the lock.
  void fire(std::vector<ready_watch>& ready) {
    for (auto& r : ready) {
      BALLOT_LOG(debug) << "watch on " << r.event.path << " fired with " << r.event.type;
      safe_invoke("watcher", [&r]() { r.w(r.event); });
    }
  }

  /// Notify all pending watches that they are lost.
  void fail_all_watches() {
    std::map<std::uint64_t, watch_entry> entries;
    {
      std::lock_guard<std::mutex> lock(mu_);
      entries.swap(entries_);
      by_id_.clear();
      pending_creates_.clear();
    }
    std::vector<ready_watch> ready;
    for (auto& kv : entries) {
      ready.push_back(ready_watch{std::move(kv.second.w), watch_event{watch_event_type::other, kv.second.path}});
    }
    fire(ready);
  }

  /// The server cancelled a watch, read the key to find out if it changed since the watch started.
  void recheck(std::uint64_t token) {
    std::string path;
    {
      std::lock_guard<std::mutex> lock(mu_);
      auto i = entries_.find(token);
      if (i == entries_.end()) {
        return;
      }
      path = i->second.path;
    }
    if (not ops_.async_op_start("etcd_client/recheck/range")) {
      return;
    }
    etcdserverpb::RangeRequest req;
    req.set_key(path);
    req.set_keys_only(true);
    queue_.async_rpc(
        kv_client_.get(), &etcdserverpb::KV::Stub::AsyncRange, std::move(req), "etcd_client/recheck/range",
        [this, token](auto const& op, bool ok) { this->on_recheck(token, op, ok); });
  }

  void on_recheck(
      std::uint64_t token, async_rpc_op<etcdserverpb::RangeRequest, etcdserverpb::RangeResponse> const& op, bool ok) {
    ops_.async_op_done("etcd_client/recheck/range");
    if (rpc_result(ok, op.status) != result_code::ok) {
      retry_recheck(token);
      return;
    }
    std::vector<ready_watch> ready;
    {
      std::lock_guard<std::mutex> lock(mu_);
      auto i = entries_.find(token);
      if (i == entries_.end()) {
        return;
      }
      auto& e = i->second;
      bool exists = op.response.kvs_size() > 0;
      auto type = watch_event_type::other;
      if (e.create_revision == 0) {
        if (exists) {
          type = watch_event_type::created;
        }
      } else if (not exists or op.response.kvs(0).create_revision() != e.create_revision) {
        type = watch_event_type::deleted;
      } else if (op.response.kvs(0).mod_revision() != e.mod_revision) {
        type = watch_event_type::data_changed;
      }
      if (type != watch_event_type::other) {
        ready.push_back(ready_watch{std::move(e.w), watch_event{type, e.path}});
        entries_.erase(i);
      } else {
        // ... nothing changed, resume watching from the current revision ...
        e.start_revision = op.response.header().revision() + 1;
        if (watch_stream_ and e.watch_id < 0) {
          enqueue_create(token);
        }
      }
    }
    flush_writes();
    fire(ready);
  }

  void retry_recheck(std::uint64_t token) {
    if (is_fatal(state())) {
      fail_all_watches();
      return;
    }
    auto id = start_timer(recheck_delay, "etcd_client/recheck/timer", [this, token]() { this->recheck(token); });
    BALLOT_LOG(debug) << "recheck for watch " << token << " failed, retry scheduled, timer=" << id;
  }

  /**
   * Start a cancellable timer and call @a functor when it expires.
   *
   * @return an identifier for the timer, only useful for logging.
   */
  template <typename Functor>
  std::uint64_t start_timer(std::chrono::milliseconds delay, char const* name, Functor&& functor) {
    if (not ops_.async_op_start(name)) {
      return 0;
    }
    std::uint64_t id;
    {
      std::lock_guard<std::mutex> lock(mu_);
      id = ++timer_generator_;
    }
    auto timer = queue_.make_relative_timer(
        delay, name, [this, id, name, f = std::forward<Functor>(functor)](auto const&, bool ok) mutable {
          {
            std::lock_guard<std::mutex> lock(mu_);
            timers_.erase(id);
          }
          ops_.async_op_done(name);
          if (ok) {
            f();
          }
        });
    std::lock_guard<std::mutex> lock(mu_);
    if (not shutdown_) {
      timers_.emplace(id, std::move(timer));
    }
    return id;
  }

  /// The Watch stream broke, close it and start the reconnect loop.
  void on_stream_failure(std::shared_ptr<watch_stream_type> stream, char const* where) {
    if (ops_.in_shutdown()) {
      return;
    }
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (watch_stream_ != stream) {
        return;
      }
      BALLOT_LOG(info) << "watch stream failed in " << where << ", " << entries_.size() << " pending watches";
      watch_stream_.reset();
      watch_ready_ = false;
      by_id_.clear();
      pending_creates_.clear();
      writes_.clear();
      write_in_flight_ = false;
      for (auto& kv : entries_) {
        kv.second.watch_id = -1;
      }
    }
    finish_and_reconnect(std::move(stream));
  }

  void finish_and_reconnect(std::shared_ptr<watch_stream_type> stream) {
    queue_.try_cancel_on(*stream);
    if (not ops_.async_op_start("etcd_client/watch/finish")) {
      return;
    }
    queue_.async_finish(*stream, "etcd_client/watch/finish", [this, stream](auto const& op, bool ok) {
      this->on_finish(op, ok);
    });
  }

  void on_finish(finish_op const& op, bool ok) {
    ops_.async_op_done("etcd_client/watch/finish");
    if (ok) {
      // ... only to latch authentication failures ...
      (void)rpc_result(true, op.status);
    }
    if (is_fatal(state())) {
      fail_all_watches();
      return;
    }
    auto delay = backoff_.record_failure();
    start_timer(delay, "etcd_client/reconnect/timer", [this]() { this->reconnect(); });
  }

  void reconnect() {
    if (is_fatal(state())) {
      fail_all_watches();
      return;
    }
    if (not ops_.async_op_start("etcd_client/reconnect/create")) {
      return;
    }
    queue_.async_create_rdwr_stream(
        watch_client_.get(), &etcdserverpb::Watch::Stub::AsyncWatch, "etcd_client/reconnect/create",
        [this](auto stream, bool ok) { this->on_reconnect(std::move(stream), ok); });
  }

  void on_reconnect(std::shared_ptr<watch_stream_type> stream, bool ok) {
    ops_.async_op_done("etcd_client/reconnect/create");
    if (ops_.in_shutdown()) {
      if (ok) {
        // ... nobody will use this stream, close it without tracking the operation ...
        queue_.try_cancel_on(*stream);
        queue_.async_finish(*stream, "etcd_client/reconnect/discard", [stream](auto const&, bool) {});
      }
      return;
    }
    if (not ok) {
      finish_and_reconnect(std::move(stream));
      return;
    }
    {
      std::lock_guard<std::mutex> lock(mu_);
      BALLOT_LOG(info) << "watch stream reconnected, re-registering " << entries_.size() << " watches";
      watch_stream_ = stream;
      watch_ready_ = true;
      for (auto const& kv : entries_) {
        enqueue_create(kv.first);
      }
    }
    backoff_.record_success();
    start_read(std::move(stream));
    flush_writes();
  }

private:
  completion_queue_type& queue_;
  std::shared_ptr<session> session_;
  std::unique_ptr<etcdserverpb::KV::Stub> kv_client_;
  std::unique_ptr<etcdserverpb::Watch::Stub> watch_client_;

  /// Protects all the fields below, never held while calling the completion queue or the application.
  mutable std::mutex mu_;
  std::shared_ptr<watch_stream_type> watch_stream_;
  bool watch_ready_;
  bool auth_failed_;
  bool shutdown_;

  std::uint64_t token_generator_;
  std::map<std::uint64_t, watch_entry> entries_;
  /// The entries waiting for a "created" response, in the order of their create requests.
  std::deque<std::uint64_t> pending_creates_;
  /// Map etcd watch ids to entries.
  std::map<std::int64_t, std::uint64_t> by_id_;

  /// Requests waiting for the current Write() to complete.
  std::deque<etcdserverpb::WatchRequest> writes_;
  bool write_in_flight_;

  std::uint64_t timer_generator_;
  std::map<std::uint64_t, std::shared_ptr<deadline_timer>> timers_;

  /// Paces the reconnection attempts, only used in the completion queue thread.
  exponential_backoff backoff_;

  /// Track pending asynchronous operations.
  async_op_counter ops_;
};

/// Define the object.
template <typename completion_queue_type>
std::chrono::milliseconds constexpr etcd_client_impl<completion_queue_type>::recheck_delay;

} // namespace detail
} // namespace ballot

#endif // ballot_detail_etcd_client_impl_hpp
