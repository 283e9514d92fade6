#include "ballot/coordination_client.hpp"

#include <gtest/gtest.h>
#include <sstream>

namespace {
template <typename T>
std::string as_string(T x) {
  std::ostringstream os;
  os << x;
  return os.str();
}
} // anonymous namespace

/**
 * @test Verify that result codes are printed as expected.
 */
TEST(coordination_client, result_code_streaming) {
  using ballot::result_code;
  EXPECT_EQ(as_string(result_code::ok), "ok");
  EXPECT_EQ(as_string(result_code::node_exists), "node_exists");
  EXPECT_EQ(as_string(result_code::no_node), "no_node");
  EXPECT_EQ(as_string(result_code::connection_loss), "connection_loss");
  EXPECT_EQ(as_string(result_code::operation_timeout), "operation_timeout");
  EXPECT_EQ(as_string(result_code::session_expired), "session_expired");
  EXPECT_EQ(as_string(result_code::auth_failed), "auth_failed");
  EXPECT_EQ(as_string(result_code::invalid_state), "invalid_state");
  EXPECT_EQ(as_string(result_code::system_error), "system_error");
}

/**
 * @test Verify that client states are printed and classified as expected.
 */
TEST(coordination_client, client_state) {
  using ballot::client_state;
  EXPECT_EQ(as_string(client_state::healthy), "healthy");
  EXPECT_EQ(as_string(client_state::connecting), "connecting");
  EXPECT_EQ(as_string(client_state::auth_failed), "auth_failed");
  EXPECT_EQ(as_string(client_state::closed), "closed");

  EXPECT_FALSE(ballot::is_fatal(client_state::healthy));
  EXPECT_FALSE(ballot::is_fatal(client_state::connecting));
  EXPECT_TRUE(ballot::is_fatal(client_state::auth_failed));
  EXPECT_TRUE(ballot::is_fatal(client_state::closed));
}

/**
 * @test Verify that watch event types are printed as expected.
 */
TEST(coordination_client, watch_event_type_streaming) {
  using ballot::watch_event_type;
  EXPECT_EQ(as_string(watch_event_type::created), "created");
  EXPECT_EQ(as_string(watch_event_type::deleted), "deleted");
  EXPECT_EQ(as_string(watch_event_type::data_changed), "data_changed");
  EXPECT_EQ(as_string(watch_event_type::other), "other");
}

/**
 * @test Verify that the open acl grants everything to everyone.
 */
TEST(coordination_client, open_acl_unsafe) {
  auto acl = ballot::open_acl_unsafe();
  ASSERT_EQ(acl.size(), 1UL);
  EXPECT_EQ(acl[0].perms, ballot::perm_all);
  EXPECT_EQ(acl[0].scheme, "world");
  EXPECT_EQ(acl[0].id, "anyone");
  EXPECT_EQ(acl[0], (ballot::acl{0x1f, "world", "anyone"}));
  EXPECT_FALSE(acl[0] == (ballot::acl{ballot::perm_read, "world", "anyone"}));
}
