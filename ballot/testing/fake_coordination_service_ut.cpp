#include "ballot/testing/fake_coordination_service.hpp"

#include <gtest/gtest.h>
#include <sstream>

using ballot::result_code;
using ballot::testing::fake_operation;

/**
 * @test Verify the basic operations of the fake service and its clients.
 */
TEST(fake_coordination_service, basic) {
  auto service = std::make_shared<ballot::testing::fake_coordination_service>();
  auto client = service->create_client();
  EXPECT_EQ(client->state(), ballot::client_state::healthy);
  EXPECT_NE(client->session_id(), 0);

  std::vector<result_code> results;
  client->async_create(
      "/a", "data-a", ballot::open_acl_unsafe(), ballot::create_mode::ephemeral,
      [&results](result_code rc, std::string const& path) {
        results.push_back(rc);
        EXPECT_EQ(path, "/a");
      });
  client->async_create(
      "/a", "data-b", ballot::open_acl_unsafe(), ballot::create_mode::ephemeral,
      [&results](result_code rc, std::string const&) { results.push_back(rc); });
  EXPECT_TRUE(results.empty());
  EXPECT_EQ(service->pending(), 2UL);
  EXPECT_EQ(service->deliver_all(), 2UL);
  ASSERT_EQ(results.size(), 2UL);
  EXPECT_EQ(results[0], result_code::ok);
  EXPECT_EQ(results[1], result_code::node_exists);
  EXPECT_EQ(service->data("/a"), "data-a");
  EXPECT_EQ(service->stat("/a").ephemeral_owner, client->session_id());
  EXPECT_EQ(client->calls(fake_operation::create), 2);
  EXPECT_EQ(client->last_acl(), ballot::open_acl_unsafe());

  std::string data;
  result_code get_rc = result_code::system_error;
  client->async_get("/a", [&](result_code rc, std::string const& d, ballot::node_stat const&) {
    get_rc = rc;
    data = d;
  });
  ASSERT_TRUE(service->deliver_one());
  EXPECT_EQ(get_rc, result_code::ok);
  EXPECT_EQ(data, "data-a");

  client->async_get("/b", [&](result_code rc, std::string const&, ballot::node_stat const&) { get_rc = rc; });
  ASSERT_TRUE(service->deliver_one());
  EXPECT_EQ(get_rc, result_code::no_node);
  EXPECT_FALSE(service->deliver_one());
  EXPECT_THROW(service->data("/b"), std::out_of_range);
  EXPECT_THROW(service->stat("/b"), std::out_of_range);
}

/**
 * @test Verify that watches are one-shot and report the right event types.
 */
TEST(fake_coordination_service, watches) {
  auto service = std::make_shared<ballot::testing::fake_coordination_service>();
  auto client = service->create_client();

  std::vector<ballot::watch_event_type> events;
  auto watcher = [&events](ballot::watch_event const& ev) {
    EXPECT_EQ(ev.path, "/w");
    events.push_back(ev.type);
  };
  result_code exists_rc = result_code::system_error;
  auto on_exists = [&exists_rc](result_code rc, ballot::node_stat const&) { exists_rc = rc; };

  client->async_exists("/w", watcher, on_exists);
  service->deliver_all();
  EXPECT_EQ(exists_rc, result_code::no_node);
  EXPECT_EQ(service->watch_count("/w"), 1UL);

  service->set("/w", "v1");
  service->set("/w", "v2");
  service->deliver_all();
  ASSERT_EQ(events.size(), 1UL);
  EXPECT_EQ(events[0], ballot::watch_event_type::created);
  EXPECT_EQ(service->watch_count("/w"), 0UL);

  client->async_exists("/w", watcher, on_exists);
  service->deliver_all();
  EXPECT_EQ(exists_rc, result_code::ok);
  service->set("/w", "v3");
  service->deliver_all();
  ASSERT_EQ(events.size(), 2UL);
  EXPECT_EQ(events[1], ballot::watch_event_type::data_changed);
  EXPECT_EQ(service->stat("/w").version, 2);

  client->async_exists("/w", watcher, on_exists);
  service->remove("/w");
  service->remove("/w");
  service->deliver_all();
  ASSERT_EQ(events.size(), 3UL);
  EXPECT_EQ(events[2], ballot::watch_event_type::deleted);
  EXPECT_FALSE(service->exists("/w"));
}

/**
 * @test Verify that the node revisions advance on each change.
 */
TEST(fake_coordination_service, revisions) {
  auto service = std::make_shared<ballot::testing::fake_coordination_service>();
  service->set("/r", "v1");
  auto s1 = service->stat("/r");
  EXPECT_EQ(s1.version, 0);
  EXPECT_EQ(s1.create_revision, s1.mod_revision);
  EXPECT_EQ(s1.ephemeral_owner, 0);

  service->set("/r", "v2");
  auto s2 = service->stat("/r");
  EXPECT_EQ(s2.create_revision, s1.create_revision);
  EXPECT_GT(s2.mod_revision, s1.mod_revision);
  EXPECT_EQ(s2.version, 1);
}

/**
 * @test Verify that expiring a session removes its ephemeral nodes and closes the client.
 */
TEST(fake_coordination_service, expire_session) {
  auto service = std::make_shared<ballot::testing::fake_coordination_service>();
  auto a = service->create_client();
  auto b = service->create_client();
  EXPECT_NE(a->session_id(), b->session_id());

  auto ignore = [](result_code, std::string const&) {};
  a->async_create("/eph", "a", ballot::open_acl_unsafe(), ballot::create_mode::ephemeral, ignore);
  a->async_create("/per", "a", ballot::open_acl_unsafe(), ballot::create_mode::persistent, ignore);
  service->deliver_all();

  service->expire_session(a->session_id());
  EXPECT_FALSE(service->exists("/eph"));
  EXPECT_TRUE(service->exists("/per"));
  EXPECT_EQ(a->state(), ballot::client_state::closed);
  EXPECT_EQ(b->state(), ballot::client_state::healthy);

  // ... a closed client cannot create ephemeral nodes, and never recovers ...
  result_code rc = result_code::ok;
  a->async_create("/eph", "a", ballot::open_acl_unsafe(), ballot::create_mode::ephemeral,
                  [&rc](result_code r, std::string const&) { rc = r; });
  service->deliver_all();
  EXPECT_EQ(rc, result_code::session_expired);
  a->state(ballot::client_state::healthy);
  EXPECT_EQ(a->state(), ballot::client_state::closed);
}

/**
 * @test Verify that failures can be injected, once or persistently.
 */
TEST(fake_coordination_service, inject_failures) {
  auto service = std::make_shared<ballot::testing::fake_coordination_service>();
  auto client = service->create_client();

  std::vector<result_code> results;
  auto record = [&results](result_code rc, std::string const&) { results.push_back(rc); };
  client->inject_failure(fake_operation::create, result_code::connection_loss, true);
  client->inject_failure(fake_operation::create, result_code::operation_timeout);
  client->async_create("/x", "1", ballot::open_acl_unsafe(), ballot::create_mode::ephemeral, record);
  client->async_create("/y", "2", ballot::open_acl_unsafe(), ballot::create_mode::ephemeral, record);
  client->async_create("/y", "3", ballot::open_acl_unsafe(), ballot::create_mode::ephemeral, record);
  service->deliver_all();
  std::vector<result_code> expected{result_code::connection_loss, result_code::operation_timeout, result_code::ok};
  EXPECT_EQ(results, expected);
  // ... the first failure was applied anyway, the second was not ...
  EXPECT_EQ(service->data("/x"), "1");
  EXPECT_EQ(service->data("/y"), "3");

  int failures = 0;
  client->fail_always(fake_operation::exists, result_code::system_error);
  for (int i = 0; i != 3; ++i) {
    client->async_exists(
        "/x", [](ballot::watch_event const&) {},
        [&failures](result_code rc, ballot::node_stat const&) { failures += int(rc == result_code::system_error); });
  }
  service->deliver_all();
  EXPECT_EQ(failures, 3);
  // ... failed checks do not arm a watch ...
  EXPECT_EQ(service->watch_count("/x"), 0UL);
  EXPECT_EQ(client->calls(fake_operation::exists), 3);

  client->clear_failures();
  result_code rc = result_code::system_error;
  client->async_exists("/x", [](ballot::watch_event const&) {}, [&rc](result_code r, ballot::node_stat const&) { rc = r; });
  service->deliver_all();
  EXPECT_EQ(rc, result_code::ok);
}

/**
 * @test Verify that clients can complete the operations synchronously.
 */
TEST(fake_coordination_service, complete_synchronously) {
  auto service = std::make_shared<ballot::testing::fake_coordination_service>();
  auto client = service->create_client();
  client->complete_synchronously(true);

  result_code rc = result_code::system_error;
  client->async_create("/s", "v", ballot::open_acl_unsafe(), ballot::create_mode::persistent,
                       [&rc](result_code r, std::string const&) { rc = r; });
  EXPECT_EQ(rc, result_code::ok);
  EXPECT_EQ(service->pending(), 0UL);

  int fired = 0;
  client->async_exists("/s", [&fired](ballot::watch_event const&) { ++fired; }, [](result_code, ballot::node_stat const&) {});
  service->remove("/s");
  EXPECT_EQ(fired, 0);
  EXPECT_EQ(service->pending(), 1UL);
  service->deliver_all();
  EXPECT_EQ(fired, 1);
}

/**
 * @test Verify the streaming operator for fake_operation.
 */
TEST(fake_coordination_service, fake_operation_streaming) {
  std::ostringstream os;
  os << fake_operation::create << " " << fake_operation::get << " " << fake_operation::exists;
  EXPECT_EQ(os.str(), "create get exists");
}
