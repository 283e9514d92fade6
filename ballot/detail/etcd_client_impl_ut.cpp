#include "ballot/detail/etcd_client_impl.hpp"
#include <ballot/detail/mocked_grpc_interceptor.hpp>

#include <deque>
#include <vector>

/// Define helper types and functions used in these tests
namespace {
using completion_queue_type = ballot::completion_queue<ballot::detail::mocked_grpc_interceptor>;
using client_type = ballot::detail::etcd_client_impl<completion_queue_type>;
using txn_op = ballot::detail::async_rpc_op<etcdserverpb::TxnRequest, etcdserverpb::TxnResponse>;
using range_op = ballot::detail::async_rpc_op<etcdserverpb::RangeRequest, etcdserverpb::RangeResponse>;
using ballot::client_state;
using ballot::result_code;

/// A session with a fixed lease, the tests change its state directly.
class test_session : public ballot::session {
public:
  explicit test_session(std::int64_t lease_id)
      : lease_id_(lease_id)
      , state_(client_state::healthy) {
  }
  ~test_session() noexcept(false) override {
  }

  std::int64_t lease_id() const override {
    return lease_id_;
  }
  std::chrono::milliseconds actual_TTL() const override {
    return std::chrono::milliseconds(10000);
  }
  client_state state() const override {
    return state_;
  }
  void revoke() override {
    state_ = client_state::closed;
  }

  void set_state(client_state s) {
    state_ = s;
  }

private:
  std::int64_t lease_id_;
  client_state state_;
};

/// The Watch stream operations captured by the mocks.
struct watch_stream_mocks {
  /// The pending Read() operations, the tests complete them explicitly.
  std::deque<std::shared_ptr<ballot::detail::base_async_op>> reads;
  /// The requests sent on the stream, in order.
  std::vector<etcdserverpb::WatchRequest> writes;
};

/// Common initialization for all tests
void prepare_mocks_common(completion_queue_type& queue, watch_stream_mocks& mocks);

std::unique_ptr<client_type> make_client(completion_queue_type& queue, std::shared_ptr<test_session> session) {
  return std::make_unique<client_type>(
      queue, std::move(session), std::unique_ptr<etcdserverpb::KV::Stub>(),
      std::unique_ptr<etcdserverpb::Watch::Stub>());
}

/// Complete the oldest pending Read() with a response prepared by @a fill.
void deliver(watch_stream_mocks& mocks, std::function<void(etcdserverpb::WatchResponse&)> const& fill) {
  ASSERT_FALSE(mocks.reads.empty());
  auto bop = mocks.reads.front();
  mocks.reads.pop_front();
  using op_type = ballot::detail::read_op<etcdserverpb::WatchResponse>;
  auto* op = dynamic_cast<op_type*>(bop.get());
  ASSERT_TRUE(op != nullptr);
  fill(op->response);
  bop->callback(*bop, true);
}

/// Fail the oldest pending Read(), as if the stream broke.
void fail_read(watch_stream_mocks& mocks) {
  ASSERT_FALSE(mocks.reads.empty());
  auto bop = mocks.reads.front();
  mocks.reads.pop_front();
  bop->callback(*bop, false);
}

/// Expect the next unary RPC named @a name, @a f prepares the response.
template <typename op_type, typename Functor>
void expect_rpc(completion_queue_type& queue, std::string name, Functor f) {
  using namespace ::testing;
  EXPECT_CALL(*queue.interceptor().shared_mock, async_rpc(Truly([name](auto op) { return op->name == name; })))
      .WillOnce(Invoke([f](auto bop) {
        auto* op = dynamic_cast<op_type*>(bop.get());
        ASSERT_TRUE(op != nullptr);
        f(*op);
        bop->callback(*bop, true);
      }))
      .RetiresOnSaturation();
}

/// Hold the timers named @a name in @a holder, to fire them from the test.
void hold_timers(
    completion_queue_type& queue, char const* name, std::shared_ptr<ballot::detail::deadline_timer>& holder);

/// The response for an exists() call on a node that exists.
auto node_found(std::int64_t revision, std::int64_t create_revision, std::int64_t mod_revision) {
  return [=](range_op& op) {
    op.response.mutable_header()->set_revision(revision);
    auto& kv = *op.response.add_kvs();
    kv.set_key(op.request.key());
    kv.set_create_revision(create_revision);
    kv.set_mod_revision(mod_revision);
    kv.set_version(1);
  };
}

/// The response for an exists() call on a node that does not exist.
auto node_missing(std::int64_t revision) {
  return [=](range_op& op) { op.response.mutable_header()->set_revision(revision); };
}

/// Fill a response with a single event for the watch @a id.
auto one_event(std::int64_t id, mvccpb::Event::EventType type, std::string key, std::int64_t version) {
  return [=](etcdserverpb::WatchResponse& r) {
    r.set_watch_id(id);
    auto& ev = *r.add_events();
    ev.set_type(type);
    ev.mutable_kv()->set_key(key);
    ev.mutable_kv()->set_version(version);
  };
}

/// Fill a response confirming a watch was created.
auto watch_created(std::int64_t id) {
  return [=](etcdserverpb::WatchResponse& r) {
    r.set_watch_id(id);
    r.set_created(true);
  };
}
} // anonymous namespace

/**
 * @test Verify that ballot::detail::etcd_client_impl creates nodes with a transaction.
 */
TEST(etcd_client_impl, create) {
  completion_queue_type queue;
  watch_stream_mocks mocks;
  prepare_mocks_common(queue, mocks);
  auto session = std::make_shared<test_session>(7);
  auto client = make_client(queue, session);
  EXPECT_EQ(client->state(), client_state::healthy);
  EXPECT_EQ(mocks.reads.size(), 1U);

  expect_rpc<txn_op>(queue, "etcd_client/create/txn", [](txn_op& op) {
    ASSERT_EQ(op.request.compare_size(), 1);
    auto const& cmp = op.request.compare(0);
    EXPECT_EQ(cmp.key(), "/election/a");
    EXPECT_EQ(cmp.target(), etcdserverpb::Compare::CREATE);
    EXPECT_EQ(cmp.result(), etcdserverpb::Compare::EQUAL);
    EXPECT_EQ(cmp.create_revision(), 0);
    ASSERT_EQ(op.request.success_size(), 1);
    auto const& put = op.request.success(0).request_put();
    EXPECT_EQ(put.key(), "/election/a");
    EXPECT_EQ(put.value(), "data-a");
    EXPECT_EQ(put.lease(), 7);
    op.response.set_succeeded(true);
  });
  result_code rc = result_code::system_error;
  std::string created;
  client->async_create(
      "/election/a", "data-a", ballot::open_acl_unsafe(), ballot::create_mode::ephemeral,
      [&](result_code r, std::string const& path) {
        rc = r;
        created = path;
      });
  EXPECT_EQ(rc, result_code::ok);
  EXPECT_EQ(created, "/election/a");

  // ... persistent nodes have no lease, and the comparison can fail ...
  expect_rpc<txn_op>(queue, "etcd_client/create/txn", [](txn_op& op) {
    ASSERT_EQ(op.request.success_size(), 1);
    EXPECT_EQ(op.request.success(0).request_put().lease(), 0);
    op.response.set_succeeded(false);
  });
  client->async_create(
      "/election/b", "data-b", ballot::open_acl_unsafe(), ballot::create_mode::persistent,
      [&rc](result_code r, std::string const&) { rc = r; });
  EXPECT_EQ(rc, result_code::node_exists);

  expect_rpc<txn_op>(queue, "etcd_client/create/txn", [](txn_op& op) {
    op.status = grpc::Status(grpc::UNAVAILABLE, "try again");
  });
  client->async_create(
      "/election/c", "data-c", ballot::open_acl_unsafe(), ballot::create_mode::ephemeral,
      [&rc](result_code r, std::string const&) { rc = r; });
  EXPECT_EQ(rc, result_code::connection_loss);

  // ... with the session gone the errors are reported as an expired session ...
  session->set_state(client_state::closed);
  expect_rpc<txn_op>(queue, "etcd_client/create/txn", [](txn_op& op) {
    op.status = grpc::Status(grpc::UNAVAILABLE, "try again");
  });
  client->async_create(
      "/election/d", "data-d", ballot::open_acl_unsafe(), ballot::create_mode::ephemeral,
      [&rc](result_code r, std::string const&) { rc = r; });
  EXPECT_EQ(rc, result_code::session_expired);
  EXPECT_EQ(client->state(), client_state::closed);
}

/**
 * @test Verify that ballot::detail::etcd_client_impl reads nodes with a range request.
 */
TEST(etcd_client_impl, get) {
  completion_queue_type queue;
  watch_stream_mocks mocks;
  prepare_mocks_common(queue, mocks);
  auto client = make_client(queue, std::make_shared<test_session>(7));

  expect_rpc<range_op>(queue, "etcd_client/get/range", [](range_op& op) {
    EXPECT_EQ(op.request.key(), "/election/leader");
    EXPECT_FALSE(op.request.keys_only());
    auto& kv = *op.response.add_kvs();
    kv.set_key("/election/leader");
    kv.set_value("leader-1");
    kv.set_create_revision(3);
    kv.set_mod_revision(4);
    kv.set_version(2);
    kv.set_lease(7);
  });
  result_code rc = result_code::system_error;
  std::string data;
  ballot::node_stat stat;
  client->async_get("/election/leader", [&](result_code r, std::string const& d, ballot::node_stat const& s) {
    rc = r;
    data = d;
    stat = s;
  });
  EXPECT_EQ(rc, result_code::ok);
  EXPECT_EQ(data, "leader-1");
  EXPECT_EQ(stat.create_revision, 3);
  EXPECT_EQ(stat.mod_revision, 4);
  EXPECT_EQ(stat.version, 2);
  EXPECT_EQ(stat.ephemeral_owner, 7);

  expect_rpc<range_op>(queue, "etcd_client/get/range", [](range_op&) {});
  client->async_get("/election/leader", [&](result_code r, std::string const& d, ballot::node_stat const&) {
    rc = r;
    data = d;
  });
  EXPECT_EQ(rc, result_code::no_node);
  EXPECT_EQ(data, "");

  expect_rpc<range_op>(queue, "etcd_client/get/range", [](range_op& op) {
    op.status = grpc::Status(grpc::DEADLINE_EXCEEDED, "too slow");
  });
  client->async_get(
      "/election/leader", [&rc](result_code r, std::string const&, ballot::node_stat const&) { rc = r; });
  EXPECT_EQ(rc, result_code::operation_timeout);
}

/**
 * @test Verify that ballot::detail::etcd_client_impl sets one-shot watches after exists().
 */
TEST(etcd_client_impl, exists_and_watch) {
  completion_queue_type queue;
  watch_stream_mocks mocks;
  prepare_mocks_common(queue, mocks);
  auto client = make_client(queue, std::make_shared<test_session>(7));

  expect_rpc<range_op>(queue, "etcd_client/exists/range", [](range_op& op) {
    EXPECT_EQ(op.request.key(), "/election/a");
    EXPECT_TRUE(op.request.keys_only());
    node_found(10, 5, 5)(op);
  });
  std::vector<ballot::watch_event> events;
  result_code rc = result_code::system_error;
  ballot::node_stat stat;
  client->async_exists(
      "/election/a", [&events](ballot::watch_event const& ev) { events.push_back(ev); },
      [&](result_code r, ballot::node_stat const& s) {
        rc = r;
        stat = s;
      });
  EXPECT_EQ(rc, result_code::ok);
  EXPECT_EQ(stat.create_revision, 5);
  EXPECT_EQ(client->pending_watches(), 1U);

  // ... the watch starts right after the revision of the check ...
  ASSERT_EQ(mocks.writes.size(), 1U);
  ASSERT_TRUE(mocks.writes[0].has_create_request());
  EXPECT_EQ(mocks.writes[0].create_request().key(), "/election/a");
  EXPECT_EQ(mocks.writes[0].create_request().start_revision(), 11);

  deliver(mocks, watch_created(3));
  EXPECT_TRUE(events.empty());

  // ... events for unknown watches are ignored ...
  deliver(mocks, one_event(4, mvccpb::Event::DELETE, "/election/other", 0));
  EXPECT_TRUE(events.empty());

  deliver(mocks, one_event(3, mvccpb::Event::DELETE, "/election/a", 0));
  ASSERT_EQ(events.size(), 1U);
  EXPECT_EQ(events[0].type, ballot::watch_event_type::deleted);
  EXPECT_EQ(events[0].path, "/election/a");
  EXPECT_EQ(client->pending_watches(), 0U);

  // ... the watch is cancelled after its first event ...
  ASSERT_EQ(mocks.writes.size(), 2U);
  ASSERT_TRUE(mocks.writes[1].has_cancel_request());
  EXPECT_EQ(mocks.writes[1].cancel_request().watch_id(), 3);

  deliver(mocks, one_event(3, mvccpb::Event::PUT, "/election/a", 1));
  EXPECT_EQ(events.size(), 1U);
  EXPECT_EQ(mocks.reads.size(), 1U);
}

/**
 * @test Verify that ballot::detail::etcd_client_impl maps the etcd events to the right watch events.
 */
TEST(etcd_client_impl, event_types) {
  completion_queue_type queue;
  watch_stream_mocks mocks;
  prepare_mocks_common(queue, mocks);
  auto client = make_client(queue, std::make_shared<test_session>(7));

  std::vector<ballot::watch_event> events;
  auto watcher = [&events](ballot::watch_event const& ev) { events.push_back(ev); };
  std::vector<result_code> results;
  auto callback = [&results](result_code r, ballot::node_stat const&) { results.push_back(r); };

  expect_rpc<range_op>(queue, "etcd_client/exists/range", node_missing(10));
  client->async_exists("/election/a", watcher, callback);
  expect_rpc<range_op>(queue, "etcd_client/exists/range", node_found(12, 11, 12));
  client->async_exists("/election/b", watcher, callback);
  ASSERT_EQ(results.size(), 2U);
  EXPECT_EQ(results[0], result_code::no_node);
  EXPECT_EQ(results[1], result_code::ok);
  ASSERT_EQ(mocks.writes.size(), 2U);
  EXPECT_EQ(mocks.writes[0].create_request().key(), "/election/a");
  EXPECT_EQ(mocks.writes[1].create_request().key(), "/election/b");
  EXPECT_EQ(mocks.writes[1].create_request().start_revision(), 13);

  // ... the watch ids are assigned in the order of the create requests ...
  deliver(mocks, watch_created(1));
  deliver(mocks, watch_created(2));

  deliver(mocks, one_event(2, mvccpb::Event::PUT, "/election/b", 3));
  ASSERT_EQ(events.size(), 1U);
  EXPECT_EQ(events[0].type, ballot::watch_event_type::data_changed);
  EXPECT_EQ(events[0].path, "/election/b");

  deliver(mocks, one_event(1, mvccpb::Event::PUT, "/election/a", 1));
  ASSERT_EQ(events.size(), 2U);
  EXPECT_EQ(events[1].type, ballot::watch_event_type::created);
  EXPECT_EQ(events[1].path, "/election/a");
  EXPECT_EQ(client->pending_watches(), 0U);
}

/**
 * @test Verify that ballot::detail::etcd_client_impl does not set watches when exists() fails.
 */
TEST(etcd_client_impl, exists_error) {
  completion_queue_type queue;
  watch_stream_mocks mocks;
  prepare_mocks_common(queue, mocks);
  auto client = make_client(queue, std::make_shared<test_session>(7));

  expect_rpc<range_op>(queue, "etcd_client/exists/range", [](range_op& op) {
    op.status = grpc::Status(grpc::UNAVAILABLE, "try again");
  });
  result_code rc = result_code::ok;
  int fired = 0;
  client->async_exists(
      "/election/a", [&fired](ballot::watch_event const&) { ++fired; },
      [&rc](result_code r, ballot::node_stat const&) { rc = r; });
  EXPECT_EQ(rc, result_code::connection_loss);
  EXPECT_EQ(client->pending_watches(), 0U);
  EXPECT_TRUE(mocks.writes.empty());
  EXPECT_EQ(fired, 0);
}

/**
 * @test Verify that ballot::detail::etcd_client_impl recovers watches cancelled by the server.
 */
TEST(etcd_client_impl, compacted_watch) {
  completion_queue_type queue;
  watch_stream_mocks mocks;
  prepare_mocks_common(queue, mocks);
  auto client = make_client(queue, std::make_shared<test_session>(7));

  std::vector<ballot::watch_event> events;
  auto watcher = [&events](ballot::watch_event const& ev) { events.push_back(ev); };
  auto ignored = [](result_code, ballot::node_stat const&) {};

  expect_rpc<range_op>(queue, "etcd_client/exists/range", node_found(10, 5, 5));
  client->async_exists("/election/a", watcher, ignored);
  deliver(mocks, watch_created(3));

  // ... the key did not change, the watch is registered again from the current revision ...
  expect_rpc<range_op>(queue, "etcd_client/recheck/range", [](range_op& op) {
    EXPECT_EQ(op.request.key(), "/election/a");
    node_found(30, 5, 5)(op);
  });
  deliver(mocks, [](etcdserverpb::WatchResponse& r) {
    r.set_watch_id(3);
    r.set_canceled(true);
    r.set_compact_revision(20);
  });
  EXPECT_TRUE(events.empty());
  ASSERT_EQ(mocks.writes.size(), 2U);
  ASSERT_TRUE(mocks.writes[1].has_create_request());
  EXPECT_EQ(mocks.writes[1].create_request().start_revision(), 31);
  EXPECT_EQ(client->pending_watches(), 1U);

  deliver(mocks, watch_created(8));
  deliver(mocks, one_event(8, mvccpb::Event::DELETE, "/election/a", 0));
  ASSERT_EQ(events.size(), 1U);
  EXPECT_EQ(events[0].type, ballot::watch_event_type::deleted);

  // ... the key changed while the watch was not active ...
  expect_rpc<range_op>(queue, "etcd_client/exists/range", node_found(40, 6, 6));
  client->async_exists("/election/b", watcher, ignored);
  deliver(mocks, watch_created(9));
  expect_rpc<range_op>(queue, "etcd_client/recheck/range", node_found(50, 6, 45));
  deliver(mocks, [](etcdserverpb::WatchResponse& r) {
    r.set_watch_id(9);
    r.set_canceled(true);
  });
  ASSERT_EQ(events.size(), 2U);
  EXPECT_EQ(events[1].type, ballot::watch_event_type::data_changed);
  EXPECT_EQ(events[1].path, "/election/b");

  // ... the watch was compacted before it was created, and the node is gone ...
  expect_rpc<range_op>(queue, "etcd_client/exists/range", node_found(60, 7, 7));
  client->async_exists("/election/c", watcher, ignored);
  expect_rpc<range_op>(queue, "etcd_client/recheck/range", node_missing(70));
  deliver(mocks, [](etcdserverpb::WatchResponse& r) {
    r.set_watch_id(10);
    r.set_created(true);
    r.set_canceled(true);
  });
  ASSERT_EQ(events.size(), 3U);
  EXPECT_EQ(events[2].type, ballot::watch_event_type::deleted);
  EXPECT_EQ(events[2].path, "/election/c");
  EXPECT_EQ(client->pending_watches(), 0U);
}

/**
 * @test Verify that ballot::detail::etcd_client_impl retries the range request after a cancelled watch.
 */
TEST(etcd_client_impl, recheck_retries) {
  completion_queue_type queue;
  watch_stream_mocks mocks;
  prepare_mocks_common(queue, mocks);
  std::shared_ptr<ballot::detail::deadline_timer> recheck_timer;
  hold_timers(queue, "etcd_client/recheck/timer", recheck_timer);
  auto client = make_client(queue, std::make_shared<test_session>(7));

  std::vector<ballot::watch_event> events;
  expect_rpc<range_op>(queue, "etcd_client/exists/range", node_missing(10));
  client->async_exists(
      "/election/a", [&events](ballot::watch_event const& ev) { events.push_back(ev); },
      [](result_code, ballot::node_stat const&) {});
  deliver(mocks, watch_created(3));

  expect_rpc<range_op>(queue, "etcd_client/recheck/range", [](range_op& op) {
    op.status = grpc::Status(grpc::UNAVAILABLE, "try again");
  });
  deliver(mocks, [](etcdserverpb::WatchResponse& r) {
    r.set_watch_id(3);
    r.set_canceled(true);
  });
  ASSERT_TRUE((bool)recheck_timer);
  EXPECT_TRUE(events.empty());

  expect_rpc<range_op>(queue, "etcd_client/recheck/range", node_found(20, 15, 15));
  auto p = std::move(recheck_timer);
  p->callback(*p, true);
  ASSERT_EQ(events.size(), 1U);
  EXPECT_EQ(events[0].type, ballot::watch_event_type::created);
}

/**
 * @test Verify that ballot::detail::etcd_client_impl re-creates the Watch stream and its watches.
 */
TEST(etcd_client_impl, reconnect) {
  using namespace ::testing;
  completion_queue_type queue;
  watch_stream_mocks mocks;
  prepare_mocks_common(queue, mocks);
  std::shared_ptr<ballot::detail::deadline_timer> reconnect_timer;
  hold_timers(queue, "etcd_client/reconnect/timer", reconnect_timer);
  EXPECT_CALL(*queue.interceptor().shared_mock, async_finish(Truly([](auto op) {
    return op->name == "etcd_client/watch/finish";
  }))).WillOnce(Invoke([](auto bop) {
    auto* op = dynamic_cast<ballot::detail::finish_op*>(bop.get());
    ASSERT_TRUE(op != nullptr);
    op->status = grpc::Status(grpc::UNAVAILABLE, "connection reset");
    bop->callback(*bop, true);
  }));
  EXPECT_CALL(*queue.interceptor().shared_mock, async_create_rdwr_stream(Truly([](auto op) {
    return op->name == "etcd_client/reconnect/create";
  }))).WillOnce(Invoke([](auto bop) { bop->callback(*bop, true); }));
  auto client = make_client(queue, std::make_shared<test_session>(7));

  std::vector<ballot::watch_event> events;
  expect_rpc<range_op>(queue, "etcd_client/exists/range", node_found(10, 5, 5));
  client->async_exists(
      "/election/a", [&events](ballot::watch_event const& ev) { events.push_back(ev); },
      [](result_code, ballot::node_stat const&) {});
  deliver(mocks, watch_created(3));

  fail_read(mocks);
  EXPECT_EQ(client->state(), client_state::connecting);
  ASSERT_TRUE((bool)reconnect_timer);
  EXPECT_TRUE(mocks.reads.empty());
  EXPECT_EQ(client->pending_watches(), 1U);
  EXPECT_TRUE(events.empty());

  auto p = std::move(reconnect_timer);
  p->callback(*p, true);
  EXPECT_EQ(client->state(), client_state::healthy);
  EXPECT_EQ(mocks.reads.size(), 1U);

  // ... the watch is registered again at its original revision ...
  ASSERT_EQ(mocks.writes.size(), 2U);
  ASSERT_TRUE(mocks.writes[1].has_create_request());
  EXPECT_EQ(mocks.writes[1].create_request().key(), "/election/a");
  EXPECT_EQ(mocks.writes[1].create_request().start_revision(), 11);

  deliver(mocks, watch_created(12));
  deliver(mocks, one_event(12, mvccpb::Event::DELETE, "/election/a", 0));
  ASSERT_EQ(events.size(), 1U);
  EXPECT_EQ(events[0].type, ballot::watch_event_type::deleted);
}

/**
 * @test Verify that ballot::detail::etcd_client_impl stops when the Watch stream rejects the credentials.
 */
TEST(etcd_client_impl, auth_failure_on_stream) {
  using namespace ::testing;
  completion_queue_type queue;
  watch_stream_mocks mocks;
  prepare_mocks_common(queue, mocks);
  EXPECT_CALL(*queue.interceptor().shared_mock, make_deadline_timer(Truly([](auto op) {
    return op->name == "etcd_client/reconnect/timer";
  }))).Times(0);
  EXPECT_CALL(*queue.interceptor().shared_mock, async_finish(Truly([](auto op) {
    return op->name == "etcd_client/watch/finish";
  }))).WillOnce(Invoke([](auto bop) {
    auto* op = dynamic_cast<ballot::detail::finish_op*>(bop.get());
    ASSERT_TRUE(op != nullptr);
    op->status = grpc::Status(grpc::UNAUTHENTICATED, "invalid auth token");
    bop->callback(*bop, true);
  }));
  auto client = make_client(queue, std::make_shared<test_session>(7));

  std::vector<ballot::watch_event> events;
  expect_rpc<range_op>(queue, "etcd_client/exists/range", node_found(10, 5, 5));
  client->async_exists(
      "/election/a", [&events](ballot::watch_event const& ev) { events.push_back(ev); },
      [](result_code, ballot::node_stat const&) {});
  deliver(mocks, watch_created(3));

  fail_read(mocks);
  EXPECT_EQ(client->state(), client_state::auth_failed);
  ASSERT_EQ(events.size(), 1U);
  EXPECT_EQ(events[0].type, ballot::watch_event_type::other);
  EXPECT_EQ(events[0].path, "/election/a");
  EXPECT_EQ(client->pending_watches(), 0U);
}

/**
 * @test Verify that ballot::detail::etcd_client_impl latches authentication failures in unary RPCs.
 */
TEST(etcd_client_impl, auth_failure_on_rpc) {
  completion_queue_type queue;
  watch_stream_mocks mocks;
  prepare_mocks_common(queue, mocks);
  auto client = make_client(queue, std::make_shared<test_session>(7));

  expect_rpc<range_op>(queue, "etcd_client/get/range", [](range_op& op) {
    op.status = grpc::Status(grpc::PERMISSION_DENIED, "not for you");
  });
  result_code rc = result_code::ok;
  client->async_get("/election/a", [&rc](result_code r, std::string const&, ballot::node_stat const&) { rc = r; });
  EXPECT_EQ(rc, result_code::auth_failed);
  EXPECT_EQ(client->state(), client_state::auth_failed);

  // ... the state does not recover after a successful request ...
  expect_rpc<range_op>(queue, "etcd_client/get/range", [](range_op&) {});
  client->async_get("/election/a", [&rc](result_code r, std::string const&, ballot::node_stat const&) { rc = r; });
  EXPECT_EQ(rc, result_code::no_node);
  EXPECT_EQ(client->state(), client_state::auth_failed);
}

/**
 * @test Verify that ballot::detail::etcd_client_impl gives up on its watches when the session closes.
 */
TEST(etcd_client_impl, session_closed) {
  using namespace ::testing;
  completion_queue_type queue;
  watch_stream_mocks mocks;
  prepare_mocks_common(queue, mocks);
  EXPECT_CALL(*queue.interceptor().shared_mock, make_deadline_timer(Truly([](auto op) {
    return op->name == "etcd_client/reconnect/timer";
  }))).Times(0);
  auto session = std::make_shared<test_session>(7);
  auto client = make_client(queue, session);

  std::vector<ballot::watch_event> events;
  expect_rpc<range_op>(queue, "etcd_client/exists/range", node_found(10, 5, 5));
  client->async_exists(
      "/election/a", [&events](ballot::watch_event const& ev) { events.push_back(ev); },
      [](result_code, ballot::node_stat const&) {});
  deliver(mocks, watch_created(3));

  session->set_state(client_state::closed);
  EXPECT_EQ(client->state(), client_state::closed);
  fail_read(mocks);
  ASSERT_EQ(events.size(), 1U);
  EXPECT_EQ(events[0].type, ballot::watch_event_type::other);
  EXPECT_EQ(client->pending_watches(), 0U);
}

/**
 * @test Verify that ballot::detail::etcd_client_impl rejects new operations after shutdown().
 */
TEST(etcd_client_impl, shutdown) {
  completion_queue_type queue;
  watch_stream_mocks mocks;
  prepare_mocks_common(queue, mocks);
  auto client = make_client(queue, std::make_shared<test_session>(7));

  int fired = 0;
  auto watcher = [&fired](ballot::watch_event const&) { ++fired; };
  expect_rpc<range_op>(queue, "etcd_client/exists/range", node_found(10, 5, 5));
  client->async_exists("/election/a", watcher, [](result_code, ballot::node_stat const&) {});
  EXPECT_EQ(client->pending_watches(), 1U);

  client->shutdown();
  EXPECT_EQ(client->state(), client_state::closed);
  EXPECT_EQ(client->pending_watches(), 0U);
  EXPECT_TRUE(mocks.reads.empty());
  EXPECT_EQ(fired, 0);

  std::vector<result_code> results;
  client->async_create(
      "/election/b", "", ballot::open_acl_unsafe(), ballot::create_mode::ephemeral,
      [&results](result_code r, std::string const&) { results.push_back(r); });
  client->async_get(
      "/election/b", [&results](result_code r, std::string const&, ballot::node_stat const&) { results.push_back(r); });
  client->async_exists(
      "/election/b", watcher, [&results](result_code r, ballot::node_stat const&) { results.push_back(r); });
  ASSERT_EQ(results.size(), 3U);
  EXPECT_EQ(results[0], result_code::invalid_state);
  EXPECT_EQ(results[1], result_code::invalid_state);
  EXPECT_EQ(results[2], result_code::invalid_state);
  EXPECT_EQ(fired, 0);
  EXPECT_NO_THROW(client->shutdown());
}

namespace {
void prepare_mocks_common(completion_queue_type& queue, watch_stream_mocks& mocks) {
  using namespace ::testing;
  // ... on most calls we just invoke the application's callback immediately ...
  EXPECT_CALL(*queue.interceptor().shared_mock, async_rpc(_)).WillRepeatedly(Invoke([](auto op) {
    op->callback(*op, true);
  }));
  EXPECT_CALL(*queue.interceptor().shared_mock, async_create_rdwr_stream(_)).WillRepeatedly(Invoke([](auto op) {
    op->callback(*op, true);
  }));
  EXPECT_CALL(*queue.interceptor().shared_mock, async_writes_done(_)).WillRepeatedly(Invoke([](auto op) {
    op->callback(*op, true);
  }));
  EXPECT_CALL(*queue.interceptor().shared_mock, async_finish(_)).WillRepeatedly(Invoke([](auto op) {
    op->callback(*op, true);
  }));
  EXPECT_CALL(*queue.interceptor().shared_mock, make_deadline_timer(_)).WillRepeatedly(Invoke([](auto op) {
    op->callback(*op, true);
  }));
  // ... the Watch stream reads block until the test delivers a response, and the writes are recorded ...
  EXPECT_CALL(*queue.interceptor().shared_mock, async_read(_)).WillRepeatedly(Invoke([&mocks](auto op) {
    mocks.reads.push_back(op);
  }));
  EXPECT_CALL(*queue.interceptor().shared_mock, async_write(_)).WillRepeatedly(Invoke([&mocks](auto bop) {
    using op_type = ballot::detail::write_op<etcdserverpb::WatchRequest>;
    auto* op = dynamic_cast<op_type*>(bop.get());
    ASSERT_TRUE(op != nullptr);
    mocks.writes.push_back(op->request);
    bop->callback(*bop, true);
  }));
  // ... cancelling the stream completes any pending reads ...
  EXPECT_CALL(*queue.interceptor().shared_mock, try_cancel()).WillRepeatedly(Invoke([&mocks]() {
    while (not mocks.reads.empty()) {
      auto op = mocks.reads.front();
      mocks.reads.pop_front();
      op->callback(*op, false);
    }
  }));
}

void hold_timers(
    completion_queue_type& queue, char const* name, std::shared_ptr<ballot::detail::deadline_timer>& holder) {
  using namespace ::testing;
  std::string expected(name);
  EXPECT_CALL(*queue.interceptor().shared_mock, make_deadline_timer(Truly([expected](auto op) {
    return op->name == expected;
  }))).WillRepeatedly(Invoke([r = std::ref(holder)](auto bop) {
    auto* op = dynamic_cast<ballot::detail::deadline_timer*>(bop.get());
    ASSERT_TRUE(op != nullptr);
    r.get() = std::shared_ptr<ballot::detail::deadline_timer>(bop, op);
  }));
}
} // anonymous namespace
