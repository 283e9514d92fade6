#include "ballot/detail/session_impl.hpp"
#include <ballot/detail/mocked_grpc_interceptor.hpp>

#include <thread>

/// Define helper types and functions used in these tests
namespace {
using completion_queue_type = ballot::completion_queue<ballot::detail::mocked_grpc_interceptor>;
using session_type = ballot::detail::session_impl<completion_queue_type>;
using lease_grant_op = ballot::detail::async_rpc_op<etcdserverpb::LeaseGrantRequest, etcdserverpb::LeaseGrantResponse>;

/// Common initialization for all tests
void prepare_mocks_common(completion_queue_type& queue);

/// Grant a lease with the given id and TTL (in seconds).
void expect_lease_grant(completion_queue_type& queue, std::int64_t id, std::int64_t ttl);

/// Hold the timers named @a name in @a holder, to fire them from the test.
void hold_timers(
    completion_queue_type& queue, char const* name, std::shared_ptr<ballot::detail::deadline_timer>& holder);

/// Fire a held timer.
void fire(std::shared_ptr<ballot::detail::deadline_timer>& holder, bool ok) {
  ASSERT_TRUE((bool)holder);
  auto p = std::move(holder);
  p->callback(*p, ok);
}
} // anonymous namespace

/**
 * @test Verify that ballot::detail::session_impl works in the simple case.
 */
TEST(session_impl, basic) {
  using namespace std::chrono_literals;
  using namespace ::testing;

  completion_queue_type queue;
  prepare_mocks_common(queue);
  EXPECT_CALL(*queue.interceptor().shared_mock, async_rpc(Truly([](auto op) {
    return op->name == "session/preamble/lease_grant";
  }))).WillOnce(Invoke([](auto bop) {
    auto* op = dynamic_cast<lease_grant_op*>(bop.get());
    ASSERT_TRUE(op != nullptr);
    // ... verify the request is what we expect ...
    EXPECT_EQ(op->request.ttl(), 5);
    EXPECT_EQ(op->request.id(), 0);
    op->response.set_id(1000);
    op->response.set_ttl(42);
    bop->callback(*bop, true);
  }));

  std::shared_ptr<ballot::detail::deadline_timer> pending_timer;
  hold_timers(queue, "session/set_timer/ttl_refresh", pending_timer);

  auto session = std::make_unique<session_type>(queue, std::unique_ptr<etcdserverpb::Lease::Stub>(), 5000ms);
  EXPECT_EQ(session->lease_id(), 1000);
  EXPECT_EQ(session->actual_TTL().count(), 42000);
  EXPECT_EQ(session->state(), ballot::client_state::healthy);
  ASSERT_TRUE((bool)pending_timer);

  // ... the mocked timers cannot be cancelled, simulate the cancellation ...
  fire(pending_timer, false);
  EXPECT_NO_THROW(session.reset(nullptr));
}

/**
 * @test Verify that ballot::detail::session_impl reports leases rejected by the server.
 */
TEST(session_impl, lease_error) {
  using namespace std::chrono_literals;
  using namespace ::testing;

  completion_queue_type queue;
  prepare_mocks_common(queue);
  EXPECT_CALL(*queue.interceptor().shared_mock, async_rpc(Truly([](auto op) {
    return op->name == "session/preamble/lease_grant";
  }))).WillOnce(Invoke([](auto bop) {
    auto* op = dynamic_cast<lease_grant_op*>(bop.get());
    ASSERT_TRUE(op != nullptr);
    op->response.set_error("something broke");
    bop->callback(*bop, true);
  }));
  EXPECT_CALL(*queue.interceptor().shared_mock, make_deadline_timer(Truly([](auto op) {
    return op->name == "session/set_timer/ttl_refresh";
  }))).Times(0);

  std::unique_ptr<session_type> session;
  EXPECT_THROW(
      session = std::make_unique<session_type>(queue, std::unique_ptr<etcdserverpb::Lease::Stub>(), 5000ms),
      std::runtime_error);
}

/**
 * @test Verify that ballot::detail::session_impl reports RPC errors while requesting the lease.
 */
TEST(session_impl, lease_rpc_error) {
  using namespace std::chrono_literals;
  using namespace ::testing;

  completion_queue_type queue;
  prepare_mocks_common(queue);
  EXPECT_CALL(*queue.interceptor().shared_mock, async_rpc(Truly([](auto op) {
    return op->name == "session/preamble/lease_grant";
  }))).WillOnce(Invoke([](auto bop) {
    auto* op = dynamic_cast<lease_grant_op*>(bop.get());
    ASSERT_TRUE(op != nullptr);
    op->status = grpc::Status(grpc::UNAVAILABLE, "no etcd here");
    bop->callback(*bop, true);
  }));

  std::unique_ptr<session_type> session;
  EXPECT_THROW(
      session = std::make_unique<session_type>(queue, std::unique_ptr<etcdserverpb::Lease::Stub>(), 5000ms),
      std::runtime_error);
}

/**
 * @test Verify that ballot::detail::session_impl does not request a lease if the keep alive stream fails.
 */
TEST(session_impl, stream_error) {
  using namespace std::chrono_literals;
  using namespace ::testing;

  completion_queue_type queue;
  prepare_mocks_common(queue);
  EXPECT_CALL(*queue.interceptor().shared_mock, async_create_rdwr_stream(Truly([](auto op) {
    return op->name == "session/preamble/ka_stream";
  }))).WillOnce(Invoke([](auto bop) { bop->callback(*bop, false); }));
  EXPECT_CALL(*queue.interceptor().shared_mock, async_rpc(Truly([](auto op) {
    return op->name == "session/preamble/lease_grant";
  }))).Times(0);

  std::unique_ptr<session_type> session;
  EXPECT_THROW(
      session = std::make_unique<session_type>(queue, std::unique_ptr<etcdserverpb::Lease::Stub>(), 5000ms),
      std::exception);
}

/**
 * @test Verify that ballot::detail::session_impl works for a full lifecycle (create, get lease, some keep alive, revoke).
 */
TEST(session_impl, full_lifecycle) {
  using namespace std::chrono_literals;
  using namespace ::testing;

  completion_queue_type queue;
  prepare_mocks_common(queue);
  expect_lease_grant(queue, 1000, 42);

  std::shared_ptr<ballot::detail::deadline_timer> pending_timer;
  hold_timers(queue, "session/set_timer/ttl_refresh", pending_timer);

  EXPECT_CALL(*queue.interceptor().shared_mock, async_write(Truly([](auto op) {
    return op->name == "session/on_timeout/write";
  }))).Times(2).WillRepeatedly(Invoke([](auto bop) {
    using op_type = ballot::detail::write_op<etcdserverpb::LeaseKeepAliveRequest>;
    auto* op = dynamic_cast<op_type*>(bop.get());
    ASSERT_TRUE(op != nullptr);
    EXPECT_EQ(op->request.id(), 1000);
    bop->callback(*bop, true);
  }));
  EXPECT_CALL(*queue.interceptor().shared_mock, async_read(Truly([](auto op) {
    return op->name == "session/on_write/read";
  }))).Times(2).WillRepeatedly(Invoke([](auto bop) {
    using op_type = ballot::detail::read_op<etcdserverpb::LeaseKeepAliveResponse>;
    auto* op = dynamic_cast<op_type*>(bop.get());
    ASSERT_TRUE(op != nullptr);
    op->response.set_id(1000);
    op->response.set_ttl(24);
    bop->callback(*bop, true);
  }));

  auto session = std::make_unique<session_type>(queue, std::unique_ptr<etcdserverpb::Lease::Stub>(), 5000ms);
  EXPECT_EQ(session->lease_id(), 1000);
  EXPECT_EQ(session->actual_TTL().count(), 42000);

  // ... a complete timer -> write -> read cycle updates the TTL and sets a new timer ...
  fire(pending_timer, true);
  EXPECT_EQ(session->actual_TTL().count(), 24000);
  ASSERT_TRUE((bool)pending_timer);
  fire(pending_timer, true);
  EXPECT_EQ(session->actual_TTL().count(), 24000);
  ASSERT_TRUE((bool)pending_timer);
  EXPECT_EQ(session->state(), ballot::client_state::healthy);

  // ... revoke the lease, the pending timer fires while the request is in flight ...
  using revoke_op_type =
      ballot::detail::async_rpc_op<etcdserverpb::LeaseRevokeRequest, etcdserverpb::LeaseRevokeResponse>;
  EXPECT_CALL(*queue.interceptor().shared_mock, async_rpc(Truly([](auto op) {
    return op->name == "session/revoke/lease_revoke";
  }))).WillOnce(Invoke([&pending_timer, &session](auto bop) {
    EXPECT_EQ(session->state(), ballot::client_state::closed);
    auto* op = dynamic_cast<revoke_op_type*>(bop.get());
    ASSERT_TRUE(op != nullptr);
    EXPECT_EQ(op->request.id(), 1000);
    // ... the timer must not start a new cycle ...
    fire(pending_timer, true);
    EXPECT_FALSE((bool)pending_timer);
    op->response.mutable_header()->set_revision(17);
    bop->callback(*bop, true);
  }));

  EXPECT_NO_THROW(session->revoke());
  EXPECT_EQ(session->state(), ballot::client_state::closed);
  // ... a second revoke() is a no-op ...
  EXPECT_NO_THROW(session->revoke());
  EXPECT_NO_THROW(session.reset(nullptr));
}

/**
 * @test Verify that ballot::detail::session_impl closes the session when the server reports the lease expired.
 */
TEST(session_impl, lease_expired_in_server) {
  using namespace std::chrono_literals;
  using namespace ::testing;

  completion_queue_type queue;
  prepare_mocks_common(queue);
  expect_lease_grant(queue, 1000, 42);

  std::shared_ptr<ballot::detail::deadline_timer> pending_timer;
  hold_timers(queue, "session/set_timer/ttl_refresh", pending_timer);
  EXPECT_CALL(*queue.interceptor().shared_mock, async_read(Truly([](auto op) {
    return op->name == "session/on_write/read";
  }))).WillOnce(Invoke([](auto bop) {
    using op_type = ballot::detail::read_op<etcdserverpb::LeaseKeepAliveResponse>;
    auto* op = dynamic_cast<op_type*>(bop.get());
    ASSERT_TRUE(op != nullptr);
    op->response.set_id(1000);
    op->response.set_ttl(0);
    bop->callback(*bop, true);
  }));

  auto session = std::make_unique<session_type>(queue, std::unique_ptr<etcdserverpb::Lease::Stub>(), 5000ms);
  fire(pending_timer, true);
  EXPECT_FALSE((bool)pending_timer);
  EXPECT_EQ(session->state(), ballot::client_state::closed);
  EXPECT_NO_THROW(session.reset(nullptr));
}

/**
 * @test Verify that ballot::detail::session_impl reconnects the keep alive stream after a failure.
 */
TEST(session_impl, reconnect) {
  using namespace std::chrono_literals;
  using namespace ::testing;

  completion_queue_type queue;
  prepare_mocks_common(queue);
  expect_lease_grant(queue, 1000, 42);

  std::shared_ptr<ballot::detail::deadline_timer> pending_timer;
  hold_timers(queue, "session/set_timer/ttl_refresh", pending_timer);
  std::shared_ptr<ballot::detail::deadline_timer> reconnect_timer;
  hold_timers(queue, "session/reconnect/timer", reconnect_timer);

  // ... the first write fails, after that the stream works ...
  EXPECT_CALL(*queue.interceptor().shared_mock, async_write(Truly([](auto op) {
    return op->name == "session/on_timeout/write";
  })))
      .WillOnce(Invoke([](auto bop) { bop->callback(*bop, false); }))
      .WillRepeatedly(Invoke([](auto bop) { bop->callback(*bop, true); }));
  EXPECT_CALL(*queue.interceptor().shared_mock, async_finish(Truly([](auto op) {
    return op->name == "session/on_failure/finish";
  }))).WillOnce(Invoke([](auto bop) {
    auto* op = dynamic_cast<ballot::detail::finish_op*>(bop.get());
    ASSERT_TRUE(op != nullptr);
    op->status = grpc::Status(grpc::UNAVAILABLE, "connection reset");
    bop->callback(*bop, true);
  }));
  EXPECT_CALL(*queue.interceptor().shared_mock, async_create_rdwr_stream(Truly([](auto op) {
    return op->name == "session/reconnect/create";
  }))).WillOnce(Invoke([](auto bop) { bop->callback(*bop, true); }));
  EXPECT_CALL(*queue.interceptor().shared_mock, async_read(Truly([](auto op) {
    return op->name == "session/on_write/read";
  }))).WillOnce(Invoke([](auto bop) {
    using op_type = ballot::detail::read_op<etcdserverpb::LeaseKeepAliveResponse>;
    auto* op = dynamic_cast<op_type*>(bop.get());
    ASSERT_TRUE(op != nullptr);
    op->response.set_id(1000);
    op->response.set_ttl(30);
    bop->callback(*bop, true);
  }));

  auto session = std::make_unique<session_type>(queue, std::unique_ptr<etcdserverpb::Lease::Stub>(), 5000ms);
  fire(pending_timer, true);
  EXPECT_EQ(session->state(), ballot::client_state::connecting);
  ASSERT_TRUE((bool)reconnect_timer);
  EXPECT_FALSE((bool)pending_timer);

  // ... the new stream refreshes the lease right away ...
  fire(reconnect_timer, true);
  EXPECT_EQ(session->state(), ballot::client_state::healthy);
  EXPECT_EQ(session->actual_TTL().count(), 30000);
  ASSERT_TRUE((bool)pending_timer);

  fire(pending_timer, false);
  EXPECT_NO_THROW(session.reset(nullptr));
}

/**
 * @test Verify that ballot::detail::session_impl latches authentication failures.
 */
TEST(session_impl, auth_failure) {
  using namespace std::chrono_literals;
  using namespace ::testing;

  completion_queue_type queue;
  prepare_mocks_common(queue);
  expect_lease_grant(queue, 1000, 42);

  std::shared_ptr<ballot::detail::deadline_timer> pending_timer;
  hold_timers(queue, "session/set_timer/ttl_refresh", pending_timer);
  EXPECT_CALL(*queue.interceptor().shared_mock, make_deadline_timer(Truly([](auto op) {
    return op->name == "session/reconnect/timer";
  }))).Times(0);
  EXPECT_CALL(*queue.interceptor().shared_mock, async_read(Truly([](auto op) {
    return op->name == "session/on_write/read";
  }))).WillOnce(Invoke([](auto bop) { bop->callback(*bop, false); }));
  EXPECT_CALL(*queue.interceptor().shared_mock, async_finish(Truly([](auto op) {
    return op->name == "session/on_failure/finish";
  }))).WillOnce(Invoke([](auto bop) {
    auto* op = dynamic_cast<ballot::detail::finish_op*>(bop.get());
    ASSERT_TRUE(op != nullptr);
    op->status = grpc::Status(grpc::UNAUTHENTICATED, "invalid auth token");
    bop->callback(*bop, true);
  }));

  auto session = std::make_unique<session_type>(queue, std::unique_ptr<etcdserverpb::Lease::Stub>(), 5000ms);
  fire(pending_timer, true);
  EXPECT_EQ(session->state(), ballot::client_state::auth_failed);
  EXPECT_NO_THROW(session.reset(nullptr));
}

/**
 * @test Verify that ballot::detail::session_impl closes the session if the lease expires before it reconnects.
 */
TEST(session_impl, expired_while_disconnected) {
  using namespace std::chrono_literals;
  using namespace ::testing;

  completion_queue_type queue;
  prepare_mocks_common(queue);
  expect_lease_grant(queue, 1000, 1);

  std::shared_ptr<ballot::detail::deadline_timer> pending_timer;
  hold_timers(queue, "session/set_timer/ttl_refresh", pending_timer);
  EXPECT_CALL(*queue.interceptor().shared_mock, make_deadline_timer(Truly([](auto op) {
    return op->name == "session/reconnect/timer";
  }))).Times(0);
  EXPECT_CALL(*queue.interceptor().shared_mock, async_write(Truly([](auto op) {
    return op->name == "session/on_timeout/write";
  }))).WillOnce(Invoke([](auto bop) { bop->callback(*bop, false); }));

  auto session = std::make_unique<session_type>(queue, std::unique_ptr<etcdserverpb::Lease::Stub>(), 1000ms);
  EXPECT_EQ(session->actual_TTL().count(), 1000);
  // ... wait until the lease is past its TTL without any acknowledgement ...
  std::this_thread::sleep_for(1100ms);
  fire(pending_timer, true);
  EXPECT_EQ(session->state(), ballot::client_state::closed);
  EXPECT_NO_THROW(session.reset(nullptr));
}

namespace {
void prepare_mocks_common(completion_queue_type& queue) {
  using namespace ::testing;
  // ... on most calls we just invoke the application's callback immediately ...
  EXPECT_CALL(*queue.interceptor().shared_mock, async_rpc(_)).WillRepeatedly(Invoke([](auto op) {
    op->callback(*op, true);
  }));
  EXPECT_CALL(*queue.interceptor().shared_mock, async_read(_)).WillRepeatedly(Invoke([](auto op) {
    op->callback(*op, true);
  }));
  EXPECT_CALL(*queue.interceptor().shared_mock, async_write(_)).WillRepeatedly(Invoke([](auto op) {
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
  EXPECT_CALL(*queue.interceptor().shared_mock, try_cancel()).WillRepeatedly(Return());
}

void expect_lease_grant(completion_queue_type& queue, std::int64_t id, std::int64_t ttl) {
  using namespace ::testing;
  EXPECT_CALL(*queue.interceptor().shared_mock, async_rpc(Truly([](auto op) {
    return op->name == "session/preamble/lease_grant";
  }))).WillOnce(Invoke([id, ttl](auto bop) {
    auto* op = dynamic_cast<lease_grant_op*>(bop.get());
    ASSERT_TRUE(op != nullptr);
    op->response.set_id(id);
    op->response.set_ttl(ttl);
    bop->callback(*bop, true);
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
    // ... the standard trick to downcast shared_ptr<> ...
    r.get() = std::shared_ptr<ballot::detail::deadline_timer>(bop, op);
  }));
}
} // anonymous namespace
