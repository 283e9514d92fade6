#include "ballot/detail/mocked_grpc_interceptor.hpp"
#include <ballot/completion_queue.hpp>

#include <etcd/etcdserver/etcdserverpb/rpc.grpc.pb.h>

namespace {
using completion_queue_type = ballot::completion_queue<ballot::detail::mocked_grpc_interceptor>;
using watch_stream_type = ballot::detail::async_rdwr_stream<etcdserverpb::WatchRequest, etcdserverpb::WatchResponse>;
} // anonymous namespace

/**
 * @test Verify that we can hold timers using ballot::detail::mocked_grpc_interceptor and fire them later.
 */
TEST(mocked_grpc_interceptor, deadline_timer) {
  using namespace std::chrono_literals;
  using namespace ballot::detail;
  using namespace ::testing;

  completion_queue_type queue;

  std::vector<std::shared_ptr<deadline_timer>> held;
  auto hold = [&held](auto bop) {
    auto* op = dynamic_cast<deadline_timer*>(bop.get());
    ASSERT_TRUE(op != nullptr);
    held.push_back(std::shared_ptr<deadline_timer>(bop, op));
  };
  EXPECT_CALL(*queue.interceptor().shared_mock, make_deadline_timer(Truly([](auto op) {
    return op->name == "test/recheck/timer";
  }))).WillOnce(Invoke(hold));
  EXPECT_CALL(*queue.interceptor().shared_mock, make_deadline_timer(Truly([](auto op) {
    return op->name == "test/reconnect/timer";
  }))).WillOnce(Invoke(hold));

  int cnt_ok = 0;
  int cnt_canceled = 0;
  auto handle_timer = [&cnt_ok, &cnt_canceled](auto& op, bool ok) {
    if (ok) {
      ++cnt_ok;
    } else {
      ++cnt_canceled;
    }
  };
  queue.make_relative_timer(1000ms, "test/recheck/timer", handle_timer);
  ASSERT_EQ(held.size(), 1UL);
  EXPECT_EQ(cnt_ok + cnt_canceled, 0);
  held[0]->callback(*held[0], true);
  EXPECT_EQ(cnt_ok, 1);
  EXPECT_EQ(cnt_canceled, 0);
  held.clear();

  auto deadline = std::chrono::system_clock::now() + 100ms;
  queue.make_deadline_timer(deadline, "test/reconnect/timer", handle_timer);
  ASSERT_EQ(held.size(), 1UL);
  EXPECT_EQ(held[0]->deadline, deadline);
  held[0]->callback(*held[0], false);
  EXPECT_EQ(cnt_ok, 1);
  EXPECT_EQ(cnt_canceled, 1);
}

/**
 * @test Verify that unary RPCs are intercepted, and that the test can fill the response later.
 */
TEST(mocked_grpc_interceptor, async_rpc_delayed) {
  using namespace std::chrono_literals;
  using namespace ::testing;

  // ... the stub is never used by the mocks ...
  std::unique_ptr<etcdserverpb::KV::Stub> kv;
  completion_queue_type queue;

  std::shared_ptr<ballot::detail::base_async_op> last_op;
  EXPECT_CALL(*queue.interceptor().shared_mock, async_rpc(_)).WillOnce(Invoke([&last_op](auto op) { last_op = op; }));

  etcdserverpb::RangeRequest req;
  req.set_key("/leader");
  auto fut = queue.async_rpc(kv.get(), &etcdserverpb::KV::Stub::AsyncRange, std::move(req), "test/range", ballot::use_future());
  EXPECT_EQ(fut.wait_for(0ms), std::future_status::timeout);

  ASSERT_TRUE((bool)last_op);
  using op_type = ballot::detail::async_rpc_op<etcdserverpb::RangeRequest, etcdserverpb::RangeResponse>;
  auto* op = dynamic_cast<op_type*>(last_op.get());
  ASSERT_TRUE(op != nullptr);
  EXPECT_EQ(op->request.key(), "/leader");
  op->response.mutable_header()->set_revision(7);
  op->response.add_kvs()->set_value("candidate-a");
  op->response.set_count(1);
  last_op->callback(*last_op, true);

  ASSERT_EQ(fut.wait_for(0ms), std::future_status::ready);
  auto response = fut.get();
  EXPECT_EQ(response.header().revision(), 7);
  ASSERT_EQ(response.kvs_size(), 1);
  EXPECT_EQ(response.kvs(0).value(), "candidate-a");
}

/**
 * @test Verify that cancelled or failed RPCs turn into exceptions in the future.
 */
TEST(mocked_grpc_interceptor, async_rpc_errors) {
  using namespace std::chrono_literals;
  using namespace ::testing;

  std::unique_ptr<etcdserverpb::Lease::Stub> lease;
  completion_queue_type queue;

  EXPECT_CALL(*queue.interceptor().shared_mock, async_rpc(Truly([](auto op) {
    return op->name == "test/lease_grant/cancelled";
  }))).WillOnce(Invoke([](auto bop) { bop->callback(*bop, false); }));
  EXPECT_CALL(*queue.interceptor().shared_mock, async_rpc(Truly([](auto op) {
    return op->name == "test/lease_grant/unavailable";
  }))).WillOnce(Invoke([](auto bop) {
    using op_type = ballot::detail::async_rpc_op<etcdserverpb::LeaseGrantRequest, etcdserverpb::LeaseGrantResponse>;
    auto* op = dynamic_cast<op_type*>(bop.get());
    ASSERT_TRUE(op != nullptr);
    op->status = grpc::Status(grpc::UNAVAILABLE, "try again");
    bop->callback(*bop, true);
  }));

  etcdserverpb::LeaseGrantRequest req;
  req.set_ttl(5);
  auto cancelled = queue.async_rpc(
      lease.get(), &etcdserverpb::Lease::Stub::AsyncLeaseGrant, etcdserverpb::LeaseGrantRequest(req),
      "test/lease_grant/cancelled", ballot::use_future());
  ASSERT_EQ(cancelled.wait_for(0ms), std::future_status::ready);
  EXPECT_THROW(cancelled.get(), std::runtime_error);

  auto unavailable = queue.async_rpc(
      lease.get(), &etcdserverpb::Lease::Stub::AsyncLeaseGrant, std::move(req), "test/lease_grant/unavailable",
      ballot::use_future());
  ASSERT_EQ(unavailable.wait_for(0ms), std::future_status::ready);
  EXPECT_THROW(unavailable.get(), std::runtime_error);
}

/**
 * @test Verify creation of bi-directional streams is intercepted, with both functors and futures.
 */
TEST(mocked_grpc_interceptor, create_rdwr_stream) {
  using namespace std::chrono_literals;
  using namespace ::testing;

  std::unique_ptr<etcdserverpb::Watch::Stub> watch;
  completion_queue_type queue;

  EXPECT_CALL(*queue.interceptor().shared_mock, async_create_rdwr_stream(_))
      .WillOnce(Invoke([](auto op) { op->callback(*op, true); }))
      .WillOnce(Invoke([](auto op) { op->callback(*op, true); }))
      .WillOnce(Invoke([](auto op) { op->callback(*op, false); }));

  int counter = 0;
  queue.async_create_rdwr_stream(
      watch.get(), &etcdserverpb::Watch::Stub::AsyncWatch, "test/watch/create",
      [&counter](auto stream, bool ok) { counter += int(ok and stream); });
  EXPECT_EQ(counter, 1);

  auto fut = queue.async_create_rdwr_stream(
      watch.get(), &etcdserverpb::Watch::Stub::AsyncWatch, "test/watch/create/future", ballot::use_future());
  ASSERT_EQ(fut.wait_for(0ms), std::future_status::ready);
  EXPECT_TRUE((bool)fut.get());

  auto failed = queue.async_create_rdwr_stream(
      watch.get(), &etcdserverpb::Watch::Stub::AsyncWatch, "test/watch/create/failed", ballot::use_future());
  ASSERT_EQ(failed.wait_for(0ms), std::future_status::ready);
  EXPECT_THROW(failed.get(), std::exception);
}

/**
 * @test Verify the operations on bi-directional streams are intercepted.
 */
TEST(mocked_grpc_interceptor, rdwr_stream_operations) {
  using namespace std::chrono_literals;
  using namespace ::testing;

  completion_queue_type queue;
  watch_stream_type stream;

  EXPECT_CALL(*queue.interceptor().shared_mock, async_write(_)).WillOnce(Invoke([](auto bop) {
    auto* op = dynamic_cast<watch_stream_type::write_op*>(bop.get());
    ASSERT_TRUE(op != nullptr);
    EXPECT_EQ(op->request.create_request().key(), "/leader");
    bop->callback(*bop, true);
  }));
  EXPECT_CALL(*queue.interceptor().shared_mock, async_read(_)).WillOnce(Invoke([](auto bop) {
    auto* op = dynamic_cast<watch_stream_type::read_op*>(bop.get());
    ASSERT_TRUE(op != nullptr);
    op->response.set_watch_id(3);
    op->response.set_created(true);
    bop->callback(*bop, true);
  }));
  EXPECT_CALL(*queue.interceptor().shared_mock, try_cancel()).Times(1);
  EXPECT_CALL(*queue.interceptor().shared_mock, async_finish(_)).WillOnce(Invoke([](auto bop) {
    auto* op = dynamic_cast<ballot::detail::finish_op*>(bop.get());
    ASSERT_TRUE(op != nullptr);
    op->status = grpc::Status(grpc::CANCELLED, "cancelled by client");
    bop->callback(*bop, true);
  }));

  int writes = 0;
  etcdserverpb::WatchRequest req;
  req.mutable_create_request()->set_key("/leader");
  queue.async_write(stream, std::move(req), "test/watch/write", [&writes](auto const&, bool ok) { writes += int(ok); });
  EXPECT_EQ(writes, 1);

  std::int64_t watch_id = -1;
  queue.async_read(stream, "test/watch/read", [&watch_id](auto const& op, bool ok) {
    if (ok and op.response.created()) {
      watch_id = op.response.watch_id();
    }
  });
  EXPECT_EQ(watch_id, 3);

  queue.try_cancel_on(stream);
  auto fut = queue.async_finish(stream, "test/watch/finish", ballot::use_future());
  ASSERT_EQ(fut.wait_for(0ms), std::future_status::ready);
  EXPECT_EQ(fut.get().error_code(), grpc::CANCELLED);
}
