#include "ballot/node_reader.hpp"
#include <ballot/election_error.hpp>
#include <ballot/testing/fake_coordination_service.hpp>

#include <gtest/gtest.h>

namespace {
using ballot::result_code;
using ballot::testing::fake_operation;

struct recorded_reads {
  int reads = 0;
  int gave_up = 0;
  std::string data;
  ballot::node_stat stat;
};

std::shared_ptr<ballot::node_reader_listener> make_recorder(recorded_reads& r) {
  return ballot::make_node_reader_listener(
      [&r](ballot::node_reader&, std::string const& data, ballot::node_stat const& stat) {
        ++r.reads;
        r.data = data;
        r.stat = stat;
      },
      [&r](ballot::node_reader&) { ++r.gave_up; });
}
} // anonymous namespace

/**
 * @test Verify that an existing node is read immediately.
 */
TEST(node_reader, existing_node) {
  auto service = std::make_shared<ballot::testing::fake_coordination_service>();
  service->set("/config", "v1");
  auto client = service->create_client();

  recorded_reads r;
  auto reader = ballot::node_reader::create(client);
  reader->path("/config").listener(make_recorder(r));
  reader->start();
  EXPECT_FALSE(reader->done());
  service->deliver_all();

  EXPECT_TRUE(reader->done());
  EXPECT_EQ(r.reads, 1);
  EXPECT_EQ(r.gave_up, 0);
  EXPECT_EQ(r.data, "v1");
  EXPECT_EQ(r.stat.create_revision, service->stat("/config").create_revision);
  EXPECT_EQ(client->calls(fake_operation::exists), 0);
}

/**
 * @test Verify that the reader waits until the node is created.
 */
TEST(node_reader, wait_for_node) {
  auto service = std::make_shared<ballot::testing::fake_coordination_service>();
  auto client = service->create_client();

  recorded_reads r;
  auto reader = ballot::node_reader::create(client);
  reader->path("/config").listener(make_recorder(r));
  reader->start();
  service->deliver_all();
  EXPECT_FALSE(reader->done());
  EXPECT_EQ(service->watch_count("/config"), 1UL);
  EXPECT_EQ(r.reads, 0);

  service->set("/config", "v2");
  service->deliver_all();
  EXPECT_TRUE(reader->done());
  EXPECT_EQ(r.reads, 1);
  EXPECT_EQ(r.data, "v2");

  // ... later changes are not reported ...
  service->set("/config", "v3");
  service->deliver_all();
  EXPECT_EQ(r.reads, 1);
  EXPECT_EQ(r.data, "v2");
}

/**
 * @test Verify that the reader handles a node created between the read and the watch.
 */
TEST(node_reader, created_before_watch) {
  auto service = std::make_shared<ballot::testing::fake_coordination_service>();
  auto client = service->create_client();

  recorded_reads r;
  auto reader = ballot::node_reader::create(client);
  reader->path("/config").listener(make_recorder(r));
  reader->start();
  service->set("/config", "v1");
  service->deliver_all();

  EXPECT_TRUE(reader->done());
  EXPECT_EQ(r.data, "v1");
  EXPECT_EQ(client->calls(fake_operation::get), 2);
  EXPECT_EQ(client->calls(fake_operation::exists), 1);
}

/**
 * @test Verify that the reader waits again if the node disappears before it is read.
 */
TEST(node_reader, deleted_before_read) {
  auto service = std::make_shared<ballot::testing::fake_coordination_service>();
  auto client = service->create_client();

  recorded_reads r;
  auto reader = ballot::node_reader::create(client);
  reader->path("/config").listener(make_recorder(r));
  reader->start();
  service->deliver_all();
  ASSERT_EQ(service->watch_count("/config"), 1UL);

  service->set("/config", "short-lived");
  service->remove("/config");
  service->deliver_all();
  EXPECT_FALSE(reader->done());
  EXPECT_EQ(service->watch_count("/config"), 1UL);

  service->set("/config", "v2");
  service->deliver_all();
  EXPECT_TRUE(reader->done());
  EXPECT_EQ(r.reads, 1);
  EXPECT_EQ(r.data, "v2");
}

/**
 * @test Verify that transient errors are retried.
 */
TEST(node_reader, transient_errors) {
  auto service = std::make_shared<ballot::testing::fake_coordination_service>();
  auto client = service->create_client();
  client->inject_failure(fake_operation::get, result_code::connection_loss);
  client->inject_failure(fake_operation::exists, result_code::operation_timeout);

  recorded_reads r;
  auto reader = ballot::node_reader::create(client);
  reader->path("/config").listener(make_recorder(r));
  reader->start();
  service->deliver_all();
  EXPECT_FALSE(reader->done());
  EXPECT_EQ(client->calls(fake_operation::get), 2);
  EXPECT_EQ(client->calls(fake_operation::exists), 2);

  service->set("/config", "v1");
  service->deliver_all();
  EXPECT_TRUE(reader->done());
  EXPECT_EQ(r.data, "v1");
}

/**
 * @test Verify that finish() stops the reader at the next request.
 */
TEST(node_reader, finish) {
  auto service = std::make_shared<ballot::testing::fake_coordination_service>();
  auto client = service->create_client();

  recorded_reads r;
  auto reader = ballot::node_reader::create(client);
  reader->path("/config").listener(make_recorder(r));
  reader->start();
  service->deliver_all();
  reader->finish();
  EXPECT_FALSE(reader->done());

  service->set("/config", "v1");
  service->deliver_all();
  EXPECT_TRUE(reader->done());
  EXPECT_EQ(r.reads, 0);
  EXPECT_EQ(r.gave_up, 1);
  EXPECT_EQ(client->calls(fake_operation::get), 1);
}

/**
 * @test Verify that the reader gives up when the client closes.
 */
TEST(node_reader, client_closed) {
  auto service = std::make_shared<ballot::testing::fake_coordination_service>();
  auto client = service->create_client();
  client->fail_always(fake_operation::get, result_code::connection_loss);

  recorded_reads r;
  auto reader = ballot::node_reader::create(client);
  reader->path("/config").listener(make_recorder(r));
  reader->start();
  EXPECT_EQ(service->deliver_all(20), 20UL);
  EXPECT_FALSE(reader->done());

  client->state(ballot::client_state::closed);
  service->deliver_all();
  EXPECT_TRUE(reader->done());
  EXPECT_EQ(r.gave_up, 1);
  EXPECT_EQ(service->pending(), 0UL);
}

/**
 * @test Verify the configuration checks.
 */
TEST(node_reader, configuration) {
  auto service = std::make_shared<ballot::testing::fake_coordination_service>();

  auto no_client = ballot::node_reader::create();
  no_client->path("/config");
  EXPECT_THROW(no_client->start(), ballot::not_configured);

  auto bad_path = ballot::node_reader::create(service->create_client());
  EXPECT_THROW(bad_path->start(), ballot::not_configured);
  bad_path->path("config");
  EXPECT_THROW(bad_path->start(), ballot::not_configured);

  auto reader = ballot::node_reader::create(service->create_client());
  reader->path("/config");
  reader->start();
  EXPECT_EQ(reader->path(), "/config");
  EXPECT_THROW(reader->start(), std::logic_error);
  EXPECT_THROW(reader->path("/other"), std::logic_error);
  EXPECT_THROW(reader->client(service->create_client()), std::logic_error);
  recorded_reads unused;
  EXPECT_THROW(reader->listener(make_recorder(unused)), std::logic_error);

  // ... without a listener the outcome is simply discarded ...
  service->set("/config", "v1");
  service->deliver_all();
  EXPECT_TRUE(reader->done());
}

/**
 * @test Verify that exceptions raised by the listener are discarded.
 */
TEST(node_reader, throwing_listener) {
  auto service = std::make_shared<ballot::testing::fake_coordination_service>();
  service->set("/config", "v1");
  auto reader = ballot::node_reader::create(service->create_client());
  reader->path("/config").listener(ballot::make_node_reader_listener(
      [](ballot::node_reader&, std::string const&, ballot::node_stat const&) { throw std::runtime_error("oops"); }));
  reader->start();
  EXPECT_NO_THROW(service->deliver_all());
  EXPECT_TRUE(reader->done());
}
