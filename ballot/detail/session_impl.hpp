#ifndef ballot_detail_session_impl_hpp
#define ballot_detail_session_impl_hpp

#include <ballot/completion_queue.hpp>
#include <ballot/detail/async_op_counter.hpp>
#include <ballot/detail/deadline_timer.hpp>
#include <ballot/detail/exponential_backoff.hpp>
#include <ballot/detail/grpc_errors.hpp>
#include <ballot/detail/stream_async_ops.hpp>
#include <ballot/log.hpp>
#include <ballot/session.hpp>

#include <etcd/etcdserver/etcdserverpb/rpc.grpc.pb.h>

#include <chrono>
#include <climits>
#include <mutex>
#include <sstream>
#include <stdexcept>

namespace ballot {
namespace detail {

/**
 * Implement ballot::session using the etcd Lease service.
 *
 * The constructor blocks until the lease is granted.  After that the lease is kept alive by a timer -> Write() ->
 * Read() cycle on a LeaseKeepAlive stream, several times per TTL.  If the stream breaks the session reports
 * @c client_state::connecting and re-creates the stream with an exponential backoff.  The session closes if it cannot
 * reconnect before the lease expires, and latches @c client_state::auth_failed if the server rejects the credentials.
 *
 * The callbacks run in the completion queue thread, the constructor, revoke() and the destructor block and must not be
 * called from that thread.
 */
template <typename completion_queue_type>
class session_impl : public ::ballot::session {
public:
  //@{
  /// @name type traits

  /// The type of the bi-directional RPC stream for keep alive messages
  using ka_stream_type = async_rdwr_stream<etcdserverpb::LeaseKeepAliveRequest, etcdserverpb::LeaseKeepAliveResponse>;

  /// The preferred units for measuring time in this class
  using duration_type = std::chrono::milliseconds;
  //@}

  /// How many KeepAlive requests we send per TTL cycle.
  static int constexpr keep_alives_per_ttl = 5;

  /// Constructor, blocks until the lease is granted.
  template <typename other_duration_type>
  session_impl(
      completion_queue_type& queue, std::unique_ptr<etcdserverpb::Lease::Stub> lease_stub,
      other_duration_type desired_TTL)
      : queue_(queue)
      , lease_client_(std::move(lease_stub))
      , mu_()
      , ka_stream_()
      , lease_id_(0)
      , desired_TTL_(convert_duration(desired_TTL))
      , actual_TTL_(convert_duration(desired_TTL))
      , last_ack_()
      , state_(client_state::connecting)
      , current_timer_()
      , backoff_(std::chrono::milliseconds(100), std::chrono::seconds(5), INT_MAX)
      , ops_() {
    preamble();
  }

  session_impl(session_impl const&) = delete;
  session_impl& operator=(session_impl const&) = delete;
  session_impl(session_impl&&) = delete;
  session_impl& operator=(session_impl&&) = delete;

  ~session_impl() noexcept(false) override {
    shutdown();
  }

  std::int64_t lease_id() const override {
    return lease_id_;
  }

  std::chrono::milliseconds actual_TTL() const override {
    std::lock_guard<std::mutex> lock(mu_);
    return actual_TTL_;
  }

  client_state state() const override {
    std::lock_guard<std::mutex> lock(mu_);
    return state_;
  }

  /// Convert a duration to the preferred units in this class
  template <typename other_duration_type>
  static duration_type convert_duration(other_duration_type d) {
    return std::chrono::duration_cast<duration_type>(d);
  }

  /// Revoke the lease, the keys attached to it are deleted by the server.
  void revoke() override {
    if (ops_.in_shutdown()) {
      return;
    }
    // ... stop the keep alive cycle before the lease disappears ...
    ops_.shutdown();
    cancel_timer();
    set_state(client_state::closed);

    etcdserverpb::LeaseRevokeRequest req;
    req.set_id(lease_id_);
    auto fut = queue_.async_rpc(
        lease_client_.get(), &etcdserverpb::Lease::Stub::AsyncLeaseRevoke, std::move(req),
        "session/revoke/lease_revoke", ballot::use_future());
    auto resp = fut.get();
    BALLOT_LOG(info) << "lease " << lease_id_ << " revoked, revision=" << resp.header().revision();
    close_stream();
  }

private:
  /// Create the keep alive stream and request the lease.
  void preamble() try {
    // ... block until the keep alive stream is ready, if it cannot be created there is no point in asking for the
    // lease ...
    auto sfut = queue_.async_create_rdwr_stream(
        lease_client_.get(), &etcdserverpb::Lease::Stub::AsyncLeaseKeepAlive, "session/preamble/ka_stream",
        ballot::use_future());
    auto stream = sfut.get();
    {
      std::lock_guard<std::mutex> lock(mu_);
      ka_stream_ = std::move(stream);
    }

    etcdserverpb::LeaseGrantRequest req;
    // ... the TTL is in seconds, convert to the right units ...
    auto ttl_seconds = std::chrono::duration_cast<std::chrono::seconds>(desired_TTL_);
    req.set_ttl(ttl_seconds.count());
    req.set_id(0);

    auto lfut = queue_.async_rpc(
        lease_client_.get(), &etcdserverpb::Lease::Stub::AsyncLeaseGrant, std::move(req),
        "session/preamble/lease_grant", ballot::use_future());
    auto resp = lfut.get();
    if (resp.error() != "") {
      std::ostringstream os;
      os << "Lease grant request rejected response=" << print_to_stream(resp);
      throw std::runtime_error(os.str());
    }

    lease_id_ = resp.id();
    {
      std::lock_guard<std::mutex> lock(mu_);
      actual_TTL_ = convert_duration(std::chrono::seconds(resp.ttl()));
      last_ack_ = std::chrono::steady_clock::now();
      state_ = client_state::healthy;
    }
    BALLOT_LOG(info) << "lease " << lease_id_ << " granted, TTL=" << resp.ttl() << "s";
    set_timer();
  } catch (std::exception const& ex) {
    BALLOT_LOG(error) << "cannot create session: " << ex.what();
    shutdown();
    throw;
  } catch (...) {
    shutdown();
    throw;
  }

  /// Release the local resources, the lease is left to expire.
  void shutdown() {
    ops_.shutdown();
    cancel_timer();
    close_stream();
    ops_.block_until_all_done();
  }

  /// Cancel the current timer, if any.
  void cancel_timer() {
    std::shared_ptr<deadline_timer> timer;
    {
      std::lock_guard<std::mutex> lock(mu_);
      timer = std::move(current_timer_);
    }
    if (timer) {
      timer->cancel();
    }
  }

  /// Cancel any pending operations on the keep alive stream and wait for it to close.
  void close_stream() {
    std::shared_ptr<ka_stream_type> stream;
    {
      std::lock_guard<std::mutex> lock(mu_);
      stream = std::move(ka_stream_);
    }
    if (not stream) {
      ops_.block_until_all_done();
      return;
    }
    queue_.try_cancel_on(*stream);
    ops_.block_until_all_done();
    auto status = queue_.async_finish(*stream, "session/shutdown/finish", ballot::use_future()).get();
    BALLOT_LOG(debug) << "keep alive stream for lease " << lease_id_ << " closed, status=" << status.error_message()
                      << " [" << status.error_code() << "]";
  }

  /// Change the state, the fatal states are never left.
  void set_state(client_state nstate) {
    std::lock_guard<std::mutex> lock(mu_);
    if (is_fatal(state_) or state_ == nstate) {
      return;
    }
    BALLOT_LOG(info) << "session for lease " << lease_id_ << " state change " << state_ << " -> " << nstate;
    state_ = nstate;
  }

  /// Set a timer to start the next Write/Read cycle.
  void set_timer() {
    duration_type ttl;
    {
      std::lock_guard<std::mutex> lock(mu_);
      ttl = actual_TTL_;
    }
    if (not ops_.async_op_start("session/set_timer/ttl_refresh")) {
      return;
    }
    auto timer = queue_.make_relative_timer(
        ttl / keep_alives_per_ttl, "session/set_timer/ttl_refresh",
        [this](auto const&, bool ok) { this->on_timeout(ok); });
    std::lock_guard<std::mutex> lock(mu_);
    current_timer_ = std::move(timer);
  }

  /// Handle the timer expiration, Write() a new LeaseKeepAlive request.
  void on_timeout(bool ok) {
    ops_.async_op_done("session/set_timer/ttl_refresh");
    if (not ok) {
      // ... this is a canceled timer ...
      return;
    }
    std::shared_ptr<ka_stream_type> stream;
    {
      std::lock_guard<std::mutex> lock(mu_);
      stream = ka_stream_;
    }
    if (not stream) {
      // ... the stream is being re-created, the reconnect loop restarts the cycle ...
      return;
    }
    write_keep_alive(std::move(stream));
  }

  /// Write() a LeaseKeepAlive request on @a stream.
  void write_keep_alive(std::shared_ptr<ka_stream_type> stream) {
    if (not ops_.async_op_start("session/on_timeout/write")) {
      return;
    }
    etcdserverpb::LeaseKeepAliveRequest req;
    req.set_id(lease_id_);
    queue_.async_write(*stream, std::move(req), "session/on_timeout/write", [this, stream](auto const&, bool ok) {
      this->on_write(stream, ok);
    });
  }

  /// Handle the Write() completion, schedule a new LeaseKeepAlive Read().
  void on_write(std::shared_ptr<ka_stream_type> stream, bool ok) {
    ops_.async_op_done("session/on_timeout/write");
    if (not ok) {
      on_stream_failure(std::move(stream), "write");
      return;
    }
    if (not ops_.async_op_start("session/on_write/read")) {
      return;
    }
    queue_.async_read(*stream, "session/on_write/read", [this, stream](auto const& op, bool ok) {
      this->on_read(stream, op, ok);
    });
  }

  /// Handle the Read() completion, schedule a new timer.
  void on_read(std::shared_ptr<ka_stream_type> stream, typename ka_stream_type::read_op const& op, bool ok) {
    ops_.async_op_done("session/on_write/read");
    if (not ok) {
      on_stream_failure(std::move(stream), "read");
      return;
    }
    if (op.response.ttl() <= 0) {
      BALLOT_LOG(warning) << "lease " << lease_id_ << " expired in the server, closing session";
      set_state(client_state::closed);
      return;
    }
    {
      std::lock_guard<std::mutex> lock(mu_);
      // ... the server may change the TTL, for example after a leader change ...
      actual_TTL_ = std::chrono::seconds(op.response.ttl());
      last_ack_ = std::chrono::steady_clock::now();
    }
    backoff_.record_success();
    set_state(client_state::healthy);
    set_timer();
  }

  /// The keep alive stream broke, close it and start the reconnect loop.
  void on_stream_failure(std::shared_ptr<ka_stream_type> stream, char const* where) {
    if (ops_.in_shutdown()) {
      return;
    }
    BALLOT_LOG(info) << "keep alive stream for lease " << lease_id_ << " failed in " << where;
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (ka_stream_ == stream) {
        ka_stream_.reset();
      }
    }
    set_state(client_state::connecting);
    if (not ops_.async_op_start("session/on_failure/finish")) {
      return;
    }
    queue_.async_finish(*stream, "session/on_failure/finish", [this, stream](auto const& op, bool ok) {
      this->on_finish(op, ok);
    });
  }

  /// Handle the Finish() completion of a broken stream.
  void on_finish(finish_op const& op, bool ok) {
    ops_.async_op_done("session/on_failure/finish");
    if (ok and is_auth_failure(op.status)) {
      BALLOT_LOG(error) << "keep alive stream for lease " << lease_id_
                        << " rejected the credentials: " << op.status.error_message();
      set_state(client_state::auth_failed);
      return;
    }
    schedule_reconnect();
  }

  /// Wait for the backoff period and then re-create the stream, unless the lease has already expired.
  void schedule_reconnect() {
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (std::chrono::steady_clock::now() > last_ack_ + actual_TTL_) {
        BALLOT_LOG(warning) << "lease " << lease_id_ << " expired before the keep alive stream reconnected";
        state_ = client_state::closed;
        return;
      }
    }
    auto delay = backoff_.record_failure();
    if (not ops_.async_op_start("session/reconnect/timer")) {
      return;
    }
    auto timer = queue_.make_relative_timer(
        delay, "session/reconnect/timer", [this](auto const&, bool ok) { this->on_reconnect_timer(ok); });
    std::lock_guard<std::mutex> lock(mu_);
    current_timer_ = std::move(timer);
  }

  void on_reconnect_timer(bool ok) {
    ops_.async_op_done("session/reconnect/timer");
    if (not ok or not ops_.async_op_start("session/reconnect/create")) {
      return;
    }
    queue_.async_create_rdwr_stream(
        lease_client_.get(), &etcdserverpb::Lease::Stub::AsyncLeaseKeepAlive, "session/reconnect/create",
        [this](auto stream, bool ok) { this->on_reconnect(std::move(stream), ok); });
  }

  void on_reconnect(std::shared_ptr<ka_stream_type> stream, bool ok) {
    ops_.async_op_done("session/reconnect/create");
    if (ops_.in_shutdown()) {
      if (ok) {
        // ... nobody will use this stream, close it without tracking the operation ...
        queue_.try_cancel_on(*stream);
        queue_.async_finish(*stream, "session/reconnect/discard", [stream](auto const&, bool) {});
      }
      return;
    }
    if (not ok) {
      on_stream_failure(std::move(stream), "reconnect");
      return;
    }
    BALLOT_LOG(info) << "keep alive stream for lease " << lease_id_ << " reconnected";
    {
      std::lock_guard<std::mutex> lock(mu_);
      ka_stream_ = stream;
    }
    // ... refresh the lease right away, it may be close to expiring ...
    write_keep_alive(std::move(stream));
  }

private:
  completion_queue_type& queue_;
  std::unique_ptr<etcdserverpb::Lease::Stub> lease_client_;

  /// Protects the stream, the timer, the TTL and the state, never held while calling the completion queue.
  mutable std::mutex mu_;
  std::shared_ptr<ka_stream_type> ka_stream_;

  /// The lease is assigned by etcd during the constructor
  std::int64_t lease_id_;

  /// The requested TTL value.
  duration_type desired_TTL_;

  /// etcd may tell us to use a longer (or shorter?) TTL.
  duration_type actual_TTL_;

  /// When the server last acknowledged the lease.
  std::chrono::steady_clock::time_point last_ack_;

  client_state state_;

  /// The current timer, can be null when waiting for a KeepAlive response.
  std::shared_ptr<deadline_timer> current_timer_;

  /// Paces the reconnection attempts.
  exponential_backoff backoff_;

  /// Track pending asynchronous operations.
  async_op_counter ops_;
};

/// Define the object.
template <typename completion_queue_type>
int constexpr session_impl<completion_queue_type>::keep_alives_per_ttl;

} // namespace detail
} // namespace ballot

#endif // ballot_detail_session_impl_hpp
