#include "ballot/detail/grpc_errors.hpp"
#include <etcd/etcdserver/etcdserverpb/rpc.pb.h>

#include <gtest/gtest.h>

/**
 * @test Verify that check_grpc_status works as expected.
 */
TEST(grpc_errors, check_grpc_status_ok) {
  using namespace ballot::detail;

  grpc::Status status = grpc::Status::OK;
  ASSERT_NO_THROW(check_grpc_status(status, "test"));

  etcdserverpb::LeaseKeepAliveRequest req;
  ASSERT_NO_THROW(check_grpc_status(status, "test", " in iteration=", 42, ", request=", print_to_stream(req)));
}

/**
 * @test Verify that check_grpc_status includes the annotations in the exception.
 */
TEST(grpc_errors, check_grpc_status_error_annotations) {
  using namespace ballot::detail;

  grpc::Status status(grpc::UNKNOWN, "bad thing");
  etcdserverpb::LeaseKeepAliveRequest req;
  req.set_id(42);
  try {
    check_grpc_status(status, "test", " request=", print_to_stream(req));
    FAIL() << "check_grpc_status() should have raised";
  } catch (std::runtime_error const& ex) {
    std::string const expected = R"""(test grpc error: bad thing [2] request=ID: 42
)""";
    ASSERT_EQ(ex.what(), expected);
  }
}

/**
 * @test Verify that check_grpc_status throws what is expected.
 */
TEST(grpc_errors, check_grpc_status_error_bare) {
  using namespace ballot::detail;
  grpc::Status status(grpc::UNKNOWN, "bad thing");
  try {
    check_grpc_status(status, "test");
    FAIL() << "check_grpc_status() should have raised";
  } catch (std::runtime_error const& ex) {
    ASSERT_EQ(std::string(ex.what()), "test grpc error: bad thing [2]");
  }
}

/**
 * @test Verify that print_to_stream works as expected.
 */
TEST(grpc_errors, print_to_stream_basic) {
  using namespace ballot::detail;

  etcdserverpb::LeaseKeepAliveRequest req;
  req.set_id(42);

  std::string expected = R"""(ID: 42
)""";
  std::ostringstream os;
  os << print_to_stream(req);
  ASSERT_EQ(os.str(), expected);
}

/**
 * @test Verify the mapping from gRPC results to coordination results.
 */
TEST(grpc_errors, to_result_code) {
  using namespace ballot::detail;
  using ballot::result_code;

  EXPECT_EQ(to_result_code(true, grpc::Status::OK), result_code::ok);
  // ... a cancelled operation has no status, the outcome is unknown ...
  EXPECT_EQ(to_result_code(false, grpc::Status::OK), result_code::connection_loss);
  EXPECT_EQ(to_result_code(true, grpc::Status(grpc::UNAUTHENTICATED, "")), result_code::auth_failed);
  EXPECT_EQ(to_result_code(true, grpc::Status(grpc::PERMISSION_DENIED, "")), result_code::auth_failed);
  EXPECT_EQ(to_result_code(true, grpc::Status(grpc::DEADLINE_EXCEEDED, "")), result_code::operation_timeout);
  EXPECT_EQ(to_result_code(true, grpc::Status(grpc::UNAVAILABLE, "")), result_code::connection_loss);
  EXPECT_EQ(to_result_code(true, grpc::Status(grpc::CANCELLED, "")), result_code::connection_loss);
  EXPECT_EQ(to_result_code(true, grpc::Status(grpc::INTERNAL, "")), result_code::system_error);
  EXPECT_EQ(to_result_code(true, grpc::Status(grpc::NOT_FOUND, "")), result_code::system_error);

  EXPECT_TRUE(is_auth_failure(grpc::Status(grpc::UNAUTHENTICATED, "")));
  EXPECT_TRUE(is_auth_failure(grpc::Status(grpc::PERMISSION_DENIED, "")));
  EXPECT_FALSE(is_auth_failure(grpc::Status(grpc::UNAVAILABLE, "")));
  EXPECT_FALSE(is_auth_failure(grpc::Status::OK));
}
