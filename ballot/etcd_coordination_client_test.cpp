#include "ballot/etcd_coordination_client.hpp"
#include <ballot/node_reader.hpp>
#include <ballot/testing/etcd_server.hpp>

#include <gtest/gtest.h>

#include <future>
#include <sstream>

namespace {
using ballot::result_code;

/// Use a different prefix on each run, the leases are unique.
std::string unique_prefix(ballot::etcd_coordination_client const& client) {
  std::ostringstream os;
  os << "/ballot-test/" << std::hex << client.lease_id();
  return os.str();
}

result_code create_node(ballot::coordination_client& client, std::string const& path, std::string const& data) {
  auto promise = std::make_shared<std::promise<result_code>>();
  auto f = promise->get_future();
  client.async_create(
      path, data, ballot::open_acl_unsafe(), ballot::create_mode::ephemeral,
      [promise](result_code rc, std::string const&) { promise->set_value(rc); });
  return f.get();
}

struct get_result {
  result_code rc;
  std::string data;
  ballot::node_stat stat;
};

get_result get_node(ballot::coordination_client& client, std::string const& path) {
  auto promise = std::make_shared<std::promise<get_result>>();
  auto f = promise->get_future();
  client.async_get(path, [promise](result_code rc, std::string const& data, ballot::node_stat const& stat) {
    promise->set_value(get_result{rc, data, stat});
  });
  return f.get();
}

/// Call exists() and return its result, the watch notification is delivered to @a fired.
result_code exists_node(
    ballot::coordination_client& client, std::string const& path,
    std::shared_ptr<std::promise<ballot::watch_event>> fired) {
  auto promise = std::make_shared<std::promise<result_code>>();
  auto f = promise->get_future();
  client.async_exists(
      path, [fired](ballot::watch_event const& ev) { fired->set_value(ev); },
      [promise](result_code rc, ballot::node_stat const&) { promise->set_value(rc); });
  return f.get();
}
} // anonymous namespace

/**
 * @test Verify that the etcd client creates and reads ephemeral nodes.
 */
TEST(etcd_coordination_client, create_and_get) {
  using namespace std::chrono_literals;
  auto channel = ballot::testing::connect_to_etcd(2000ms);
  if (not channel) {
    GTEST_SKIP() << "no etcd server at " << ballot::testing::etcd_address();
  }
  auto queue = std::make_shared<ballot::active_completion_queue>();
  auto client = std::make_shared<ballot::etcd_coordination_client>(queue, channel, 3000ms);
  EXPECT_EQ(client->state(), ballot::client_state::healthy);
  EXPECT_GT(client->actual_TTL().count(), 0);
  auto path = unique_prefix(*client) + "/a";

  EXPECT_EQ(get_node(*client, path).rc, result_code::no_node);
  EXPECT_EQ(create_node(*client, path, "hello"), result_code::ok);
  EXPECT_EQ(create_node(*client, path, "goodbye"), result_code::node_exists);

  auto r = get_node(*client, path);
  EXPECT_EQ(r.rc, result_code::ok);
  EXPECT_EQ(r.data, "hello");
  EXPECT_EQ(r.stat.ephemeral_owner, client->lease_id());
  EXPECT_GT(r.stat.create_revision, 0);
  EXPECT_EQ(r.stat.version, 1);

  // ... the node disappears with the lease ...
  client->revoke();
  EXPECT_EQ(client->state(), ballot::client_state::closed);
  client->shutdown();

  auto other = std::make_shared<ballot::etcd_coordination_client>(queue, channel, 3000ms);
  EXPECT_EQ(get_node(*other, path).rc, result_code::no_node);
  other->revoke();
  other->shutdown();
}

/**
 * @test Verify that the etcd client watches report the creation and deletion of nodes.
 */
TEST(etcd_coordination_client, watches) {
  using namespace std::chrono_literals;
  auto channel = ballot::testing::connect_to_etcd(2000ms);
  if (not channel) {
    GTEST_SKIP() << "no etcd server at " << ballot::testing::etcd_address();
  }
  auto queue = std::make_shared<ballot::active_completion_queue>();
  auto watcher = std::make_shared<ballot::etcd_coordination_client>(queue, channel, 3000ms);
  auto owner = std::make_shared<ballot::etcd_coordination_client>(queue, channel, 3000ms);
  auto path = unique_prefix(*watcher) + "/watched";

  auto created = std::make_shared<std::promise<ballot::watch_event>>();
  auto created_f = created->get_future();
  EXPECT_EQ(exists_node(*watcher, path, created), result_code::no_node);
  EXPECT_EQ(create_node(*owner, path, "owned"), result_code::ok);
  ASSERT_EQ(created_f.wait_for(10s), std::future_status::ready);
  auto ev = created_f.get();
  EXPECT_EQ(ev.type, ballot::watch_event_type::created);
  EXPECT_EQ(ev.path, path);

  auto deleted = std::make_shared<std::promise<ballot::watch_event>>();
  auto deleted_f = deleted->get_future();
  EXPECT_EQ(exists_node(*watcher, path, deleted), result_code::ok);
  owner->revoke();
  ASSERT_EQ(deleted_f.wait_for(10s), std::future_status::ready);
  EXPECT_EQ(deleted_f.get().type, ballot::watch_event_type::deleted);

  // ... pending watches are discarded on shutdown ...
  auto discarded = std::make_shared<std::promise<ballot::watch_event>>();
  auto discarded_f = discarded->get_future();
  EXPECT_EQ(exists_node(*watcher, path, discarded), result_code::no_node);
  watcher->revoke();
  watcher->shutdown();
  EXPECT_EQ(discarded_f.wait_for(0ms), std::future_status::timeout);
  EXPECT_EQ(create_node(*watcher, path, "late"), result_code::invalid_state);
  owner->shutdown();
}

/**
 * @test Verify that a node_reader waits until the node is created.
 */
TEST(etcd_coordination_client, node_reader) {
  using namespace std::chrono_literals;
  auto channel = ballot::testing::connect_to_etcd(2000ms);
  if (not channel) {
    GTEST_SKIP() << "no etcd server at " << ballot::testing::etcd_address();
  }
  auto queue = std::make_shared<ballot::active_completion_queue>();
  auto reader_client = std::make_shared<ballot::etcd_coordination_client>(queue, channel, 3000ms);
  auto writer_client = std::make_shared<ballot::etcd_coordination_client>(queue, channel, 3000ms);
  auto path = unique_prefix(*reader_client) + "/config";

  auto contents = std::make_shared<std::promise<std::string>>();
  auto f = contents->get_future();
  auto reader = ballot::node_reader::create(reader_client);
  reader->path(path).listener(ballot::make_node_reader_listener(
      [contents](ballot::node_reader&, std::string const& data, ballot::node_stat const&) {
        contents->set_value(data);
      }));
  reader->start();
  EXPECT_EQ(f.wait_for(200ms), std::future_status::timeout);

  EXPECT_EQ(create_node(*writer_client, path, "ready"), result_code::ok);
  ASSERT_EQ(f.wait_for(10s), std::future_status::ready);
  EXPECT_EQ(f.get(), "ready");
  EXPECT_TRUE(reader->done());

  writer_client->revoke();
  reader_client->revoke();
  reader_client->shutdown();
  writer_client->shutdown();
}
