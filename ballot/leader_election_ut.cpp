#include "ballot/leader_election.hpp"
#include <ballot/election_error.hpp>
#include <ballot/log.hpp>
#include <ballot/testing/fake_coordination_service.hpp>
#include <ballot/testing/mocked_coordination_client.hpp>

#include <gmock/gmock.h>
#include <algorithm>
#include <atomic>
#include <sstream>
#include <thread>

namespace {
using ballot::election_state;
using ballot::result_code;
using ballot::testing::fake_operation;

/// Record the notifications as strings, to verify their order.
class recording_listener : public ballot::election_listener {
public:
  void on_state_changed(ballot::leader_election&, election_state old_state, election_state new_state) override {
    std::ostringstream os;
    os << old_state << "->" << new_state;
    events.push_back(os.str());
  }
  void on_win(ballot::leader_election&) override {
    events.push_back("win");
  }
  void on_lose(ballot::leader_election&) override {
    events.push_back("lose");
  }
  void on_vacant(ballot::leader_election&) override {
    events.push_back("vacant");
  }
  void on_finish(ballot::leader_election&) override {
    events.push_back("finish");
  }

  int count(std::string const& name) const {
    return int(std::count(events.begin(), events.end(), name));
  }

  std::vector<std::string> events;
};

/// A listener that raises on every notification.
class throwing_listener : public ballot::election_listener {
public:
  void on_state_changed(ballot::leader_election&, election_state, election_state) override {
    throw std::runtime_error("on_state_changed");
  }
  void on_win(ballot::leader_election&) override {
    throw std::runtime_error("on_win");
  }
  void on_lose(ballot::leader_election&) override {
    throw 42;
  }
  void on_vacant(ballot::leader_election&) override {
    throw std::runtime_error("on_vacant");
  }
  void on_finish(ballot::leader_election&) override {
    throw std::runtime_error("on_finish");
  }
};

struct candidate {
  std::shared_ptr<ballot::testing::fake_coordination_client> client;
  std::shared_ptr<recording_listener> listener;
  std::shared_ptr<ballot::leader_election> election;
};

candidate make_candidate(
    std::shared_ptr<ballot::testing::fake_coordination_service> const& service, std::string const& identity) {
  candidate c;
  c.client = service->create_client();
  c.listener = std::make_shared<recording_listener>();
  c.election = ballot::leader_election::create(c.client);
  c.election->path("/election/test").identity(identity).listener(c.listener);
  return c;
}
} // anonymous namespace

/**
 * @test Verify that a candidate without competition becomes the leader.
 */
TEST(leader_election, no_contender) {
  auto service = std::make_shared<ballot::testing::fake_coordination_service>();
  auto a = make_candidate(service, "candidate-a");

  a.election->start();
  EXPECT_EQ(a.election->state(), election_state::electing);
  service->deliver_all();

  EXPECT_EQ(a.election->state(), election_state::leader);
  std::vector<std::string> expected{"created->electing", "electing->leader", "win"};
  EXPECT_EQ(a.listener->events, expected);
  EXPECT_EQ(service->data("/election/test"), "candidate-a");
  EXPECT_EQ(service->stat("/election/test").ephemeral_owner, a.client->session_id());
  EXPECT_EQ(service->watch_count("/election/test"), 1UL);
  EXPECT_EQ(a.client->calls(fake_operation::create), 1);
  EXPECT_EQ(a.client->calls(fake_operation::get), 0);
}

/**
 * @test Verify that a candidate loses when the node is already held.
 */
TEST(leader_election, existing_holder) {
  auto service = std::make_shared<ballot::testing::fake_coordination_service>();
  service->set("/election/test", "X");
  auto a = make_candidate(service, "candidate-a");

  a.election->start();
  service->deliver_all();

  EXPECT_EQ(a.election->state(), election_state::follower);
  std::vector<std::string> expected{"created->electing", "electing->follower", "lose"};
  EXPECT_EQ(a.listener->events, expected);
  EXPECT_EQ(service->data("/election/test"), "X");
  EXPECT_EQ(service->watch_count("/election/test"), 1UL);
}

/**
 * @test Verify that a follower runs again, and wins, when the node is deleted.
 */
TEST(leader_election, follower_wins_after_delete) {
  auto service = std::make_shared<ballot::testing::fake_coordination_service>();
  service->set("/election/test", "X");
  auto a = make_candidate(service, "candidate-a");
  a.election->start();
  service->deliver_all();
  ASSERT_EQ(a.election->state(), election_state::follower);

  service->remove("/election/test");
  service->deliver_all();

  EXPECT_EQ(a.election->state(), election_state::leader);
  std::vector<std::string> expected{"created->electing", "electing->follower", "lose",    "follower->electing",
                                    "vacant",            "electing->leader",   "win"};
  EXPECT_EQ(a.listener->events, expected);
  EXPECT_EQ(service->data("/election/test"), "candidate-a");
  EXPECT_EQ(a.client->calls(fake_operation::create), 2);
}

/**
 * @test Verify that a leader runs again if its node is deleted.
 */
TEST(leader_election, leader_node_deleted) {
  auto service = std::make_shared<ballot::testing::fake_coordination_service>();
  auto a = make_candidate(service, "candidate-a");
  a.election->start();
  service->deliver_all();
  ASSERT_EQ(a.election->state(), election_state::leader);

  service->remove("/election/test");
  service->deliver_all();
  EXPECT_EQ(a.election->state(), election_state::leader);
  EXPECT_EQ(a.listener->count("vacant"), 1);
  EXPECT_EQ(a.listener->count("win"), 2);
  EXPECT_EQ(a.listener->count("leader->electing"), 1);
}

/**
 * @test Verify that changes to the node contents do not affect the election.
 */
TEST(leader_election, data_changes_ignored) {
  auto service = std::make_shared<ballot::testing::fake_coordination_service>();
  service->set("/election/test", "X");
  auto a = make_candidate(service, "candidate-a");
  a.election->start();
  service->deliver_all();
  ASSERT_EQ(a.election->state(), election_state::follower);
  auto events = a.listener->events;

  service->set("/election/test", "Y");
  service->deliver_all();
  EXPECT_EQ(a.election->state(), election_state::follower);
  EXPECT_EQ(a.listener->events, events);
  EXPECT_EQ(a.client->calls(fake_operation::create), 1);
}

/**
 * @test Verify that an ambiguous claim is resolved by reading the node, without a second create.
 */
TEST(leader_election, ambiguous_claim_resolves_to_self) {
  auto service = std::make_shared<ballot::testing::fake_coordination_service>();
  auto a = make_candidate(service, "candidate-a");
  a.client->inject_failure(fake_operation::create, result_code::connection_loss, true);

  a.election->start();
  service->deliver_all();

  EXPECT_EQ(a.election->state(), election_state::leader);
  EXPECT_EQ(a.client->calls(fake_operation::create), 1);
  EXPECT_EQ(a.client->calls(fake_operation::get), 1);
  std::vector<std::string> expected{"created->electing", "electing->leader", "win"};
  EXPECT_EQ(a.listener->events, expected);
}

/**
 * @test Verify that an ambiguous claim that did not take effect is retried after reading the node.
 */
TEST(leader_election, ambiguous_claim_vacant) {
  auto service = std::make_shared<ballot::testing::fake_coordination_service>();
  auto a = make_candidate(service, "candidate-a");
  a.client->inject_failure(fake_operation::create, result_code::operation_timeout);

  a.election->start();
  service->deliver_all();

  EXPECT_EQ(a.election->state(), election_state::leader);
  EXPECT_EQ(a.client->calls(fake_operation::create), 2);
  EXPECT_EQ(a.client->calls(fake_operation::get), 1);
  // ... the candidate was already electing, the step is still reported before the vacancy ...
  std::vector<std::string> expected{
      "created->electing", "electing->electing", "vacant", "electing->leader", "win"};
  EXPECT_EQ(a.listener->events, expected);
}

/**
 * @test Verify that an ambiguous claim resolves to the other candidate when it holds the node.
 */
TEST(leader_election, ambiguous_claim_resolves_to_other) {
  auto service = std::make_shared<ballot::testing::fake_coordination_service>();
  service->set("/election/test", "X");
  auto a = make_candidate(service, "candidate-a");
  a.client->inject_failure(fake_operation::create, result_code::connection_loss);
  a.client->inject_failure(fake_operation::get, result_code::connection_loss);

  a.election->start();
  service->deliver_all();

  EXPECT_EQ(a.election->state(), election_state::follower);
  EXPECT_EQ(a.client->calls(fake_operation::create), 1);
  EXPECT_EQ(a.client->calls(fake_operation::get), 2);
  EXPECT_EQ(a.listener->count("lose"), 1);
}

/**
 * @test Verify the exact calls made by the election with a mocked client.
 */
TEST(leader_election, ambiguous_claim_exact_calls) {
  using namespace ::testing;
  auto client = std::make_shared<ballot::testing::mocked_coordination_client>();
  ballot::acl_list acl{ballot::acl{ballot::perm_read, "digest", "user:secret"}};

  EXPECT_CALL(*client, state()).WillRepeatedly(Return(ballot::client_state::healthy));
  EXPECT_CALL(*client, async_create("/election/mocked", "id-1", acl, ballot::create_mode::ephemeral, _))
      .WillOnce(Invoke([](std::string const& path, std::string const&, ballot::acl_list const&, ballot::create_mode,
                          ballot::coordination_client::create_callback cb) { cb(result_code::connection_loss, path); }));
  EXPECT_CALL(*client, async_get("/election/mocked", _))
      .WillOnce(Invoke([](std::string const&, ballot::coordination_client::get_callback cb) {
        cb(result_code::ok, "id-1", ballot::node_stat{});
      }));
  ballot::coordination_client::watcher watcher;
  EXPECT_CALL(*client, async_exists("/election/mocked", _, _))
      .WillOnce(Invoke([&watcher](std::string const&, ballot::coordination_client::watcher w,
                                  ballot::coordination_client::exists_callback cb) {
        watcher = std::move(w);
        cb(result_code::ok, ballot::node_stat{});
      }));

  auto election = ballot::leader_election::create(client);
  election->path("/election/mocked").identity("id-1").acl(acl);
  election->start();
  EXPECT_EQ(election->state(), election_state::leader);
  ASSERT_TRUE((bool)watcher);

  // ... once finished, the deletion stops the election instead of running again ...
  election->finish();
  watcher(ballot::watch_event{ballot::watch_event_type::deleted, "/election/mocked"});
  EXPECT_EQ(election->state(), election_state::done);
}

/**
 * @test Verify that a node deleted before the watch is set triggers a new claim.
 */
TEST(leader_election, track_finds_no_node) {
  auto service = std::make_shared<ballot::testing::fake_coordination_service>();
  service->set("/election/test", "X");
  auto a = make_candidate(service, "candidate-a");
  a.election->start();
  // ... the holder goes away after the claim is rejected, but before the track request ...
  service->remove("/election/test");
  ASSERT_TRUE(service->deliver_one());
  ASSERT_EQ(a.election->state(), election_state::follower);
  EXPECT_EQ(service->watch_count("/election/test"), 1UL);
  service->deliver_all();

  EXPECT_EQ(a.election->state(), election_state::leader);
  EXPECT_EQ(a.listener->count("vacant"), 1);
}

/**
 * @test Verify that finish() stops the election at the next request, with exactly one finish notification.
 */
TEST(leader_election, finish_while_electing) {
  auto service = std::make_shared<ballot::testing::fake_coordination_service>();
  auto a = make_candidate(service, "candidate-a");
  a.election->start();
  a.election->finish();
  a.election->finish();
  EXPECT_EQ(a.election->state(), election_state::electing);
  service->deliver_all();

  EXPECT_EQ(a.election->state(), election_state::done);
  EXPECT_EQ(a.listener->count("finish"), 1);
  EXPECT_EQ(a.client->calls(fake_operation::exists), 0);
  std::vector<std::string> expected{"created->electing", "electing->leader", "win", "leader->done", "finish"};
  EXPECT_EQ(a.listener->events, expected);

  // ... the node is not deleted by the election ...
  EXPECT_TRUE(service->exists("/election/test"));

  a.election->finish();
  service->deliver_all();
  EXPECT_EQ(a.election->state(), election_state::done);
  EXPECT_EQ(a.listener->count("finish"), 1);
}

/**
 * @test Verify that a finished follower stops when the watch fires.
 */
TEST(leader_election, finish_while_following) {
  auto service = std::make_shared<ballot::testing::fake_coordination_service>();
  service->set("/election/test", "X");
  auto a = make_candidate(service, "candidate-a");
  a.election->start();
  service->deliver_all();
  ASSERT_EQ(a.election->state(), election_state::follower);

  a.election->finish();
  EXPECT_EQ(a.election->state(), election_state::follower);
  service->remove("/election/test");
  service->deliver_all();

  EXPECT_EQ(a.election->state(), election_state::done);
  EXPECT_EQ(a.listener->count("finish"), 1);
  EXPECT_EQ(a.client->calls(fake_operation::create), 1);
  EXPECT_FALSE(service->exists("/election/test"));
}

/**
 * @test Verify that finish() before start() goes directly to done.
 */
TEST(leader_election, finish_before_start) {
  auto service = std::make_shared<ballot::testing::fake_coordination_service>();
  auto a = make_candidate(service, "candidate-a");
  a.election->finish();
  a.election->start();
  EXPECT_EQ(a.election->state(), election_state::done);
  std::vector<std::string> expected{"created->done", "finish"};
  EXPECT_EQ(a.listener->events, expected);
  EXPECT_EQ(service->pending(), 0UL);
  EXPECT_EQ(a.client->calls(fake_operation::create), 0);
}

/**
 * @test Verify that a client that cannot recover stops the election at start().
 */
TEST(leader_election, fatal_client_at_start) {
  auto service = std::make_shared<ballot::testing::fake_coordination_service>();
  auto a = make_candidate(service, "candidate-a");
  a.client->state(ballot::client_state::auth_failed);
  a.election->start();
  EXPECT_EQ(a.election->state(), election_state::done);
  EXPECT_EQ(a.listener->count("finish"), 1);
  EXPECT_EQ(a.client->calls(fake_operation::create), 0);
}

/**
 * @test Verify that state() has no side effects.
 */
TEST(leader_election, state_is_read_only) {
  auto service = std::make_shared<ballot::testing::fake_coordination_service>();
  auto a = make_candidate(service, "candidate-a");
  EXPECT_EQ(a.election->state(), election_state::created);
  EXPECT_EQ(a.election->state(), election_state::created);
  a.election->start();
  for (int i = 0; i != 5; ++i) {
    EXPECT_EQ(a.election->state(), election_state::electing);
  }
  EXPECT_EQ(service->pending(), 1UL);
  EXPECT_EQ(a.listener->events.size(), 1UL);
}

/**
 * @test Verify that the identity written by the leader is read back, unchanged, by another candidate.
 */
TEST(leader_election, identity_round_trip) {
  auto service = std::make_shared<ballot::testing::fake_coordination_service>();
  std::string const identity = "host-1.example.com:8080 \xc3\xb1";
  auto a = make_candidate(service, identity);
  a.election->start();
  service->deliver_all();
  ASSERT_EQ(a.election->state(), election_state::leader);
  EXPECT_EQ(service->data("/election/test"), identity);

  // ... a candidate with the same identity resolves to itself after an ambiguous claim ...
  auto b = make_candidate(service, identity);
  b.client->inject_failure(fake_operation::create, result_code::connection_loss);
  b.election->start();
  service->deliver_all();
  EXPECT_EQ(b.election->state(), election_state::leader);

  // ... and one with a different identity does not ...
  auto c = make_candidate(service, "candidate-c");
  c.client->inject_failure(fake_operation::create, result_code::connection_loss);
  c.election->start();
  service->deliver_all();
  EXPECT_EQ(c.election->state(), election_state::follower);
  EXPECT_EQ(c.client->calls(fake_operation::get), 1);
}

/**
 * @test Verify that exceptions raised by the listener do not stop the election.
 */
TEST(leader_election, throwing_listener) {
  auto service = std::make_shared<ballot::testing::fake_coordination_service>();
  service->set("/election/test", "X");
  auto client = service->create_client();
  auto election = ballot::leader_election::create(client);
  election->path("/election/test").identity("candidate-a").listener(std::make_shared<throwing_listener>());

  EXPECT_NO_THROW(election->start());
  EXPECT_NO_THROW(service->deliver_all());
  EXPECT_EQ(election->state(), election_state::follower);

  service->remove("/election/test");
  EXPECT_NO_THROW(service->deliver_all());
  EXPECT_EQ(election->state(), election_state::leader);

  election->finish();
  service->remove("/election/test");
  EXPECT_NO_THROW(service->deliver_all());
  EXPECT_EQ(election->state(), election_state::done);
}

/**
 * @test Verify that an election without a listener works.
 */
TEST(leader_election, no_listener) {
  auto service = std::make_shared<ballot::testing::fake_coordination_service>();
  auto election = ballot::leader_election::create(service->create_client());
  election->path("/election/test").identity("candidate-a");
  election->start();
  service->deliver_all();
  EXPECT_EQ(election->state(), election_state::leader);
}

/**
 * @test Verify the configuration errors detected by start().
 */
TEST(leader_election, configuration_errors) {
  auto service = std::make_shared<ballot::testing::fake_coordination_service>();

  auto no_client = ballot::leader_election::create();
  EXPECT_THROW(no_client->start(), ballot::not_configured);
  EXPECT_EQ(no_client->state(), election_state::created);

  auto bad_path = ballot::leader_election::create(service->create_client());
  bad_path->path("election/test");
  EXPECT_THROW(bad_path->start(), ballot::not_configured);

  auto no_identity = ballot::leader_election::create(service->create_client());
  no_identity->identity_generator(ballot::identity_generator_type());
  EXPECT_THROW(no_identity->start(), ballot::not_configured);
  EXPECT_EQ(service->pending(), 0UL);
}

/**
 * @test Verify that the configuration is immutable after start(), and start() can only be called once.
 */
TEST(leader_election, immutable_after_start) {
  auto service = std::make_shared<ballot::testing::fake_coordination_service>();
  auto a = make_candidate(service, "candidate-a");
  a.election->start();

  EXPECT_THROW(a.election->start(), ballot::invalid_state);
  EXPECT_THROW(a.election->path("/other"), ballot::invalid_state);
  EXPECT_THROW(a.election->identity("other"), ballot::invalid_state);
  EXPECT_THROW(a.election->acl(ballot::open_acl_unsafe()), ballot::invalid_state);
  EXPECT_THROW(a.election->client(service->create_client()), ballot::invalid_state);
  EXPECT_THROW(a.election->listener(std::make_shared<recording_listener>()), ballot::invalid_state);
  EXPECT_THROW(a.election->identity_generator(ballot::random_identity_generator()), ballot::invalid_state);

  try {
    a.election->start();
  } catch (ballot::invalid_state const& ex) {
    EXPECT_EQ(ex.current(), election_state::electing);
  }
  EXPECT_EQ(a.election->path(), "/election/test");
  EXPECT_EQ(a.election->identity(), "candidate-a");

  service->deliver_all();
  EXPECT_EQ(a.election->state(), election_state::leader);
}

/**
 * @test Verify the default configuration values.
 */
TEST(leader_election, defaults) {
  auto service = std::make_shared<ballot::testing::fake_coordination_service>();
  auto client = service->create_client();
  auto election = ballot::leader_election::create(client);
  EXPECT_TRUE(election->path().empty());
  EXPECT_TRUE(election->identity().empty());

  election->identity_generator([]() { return std::string("generated-7"); });
  election->start();
  service->deliver_all();

  EXPECT_EQ(election->path(), ballot::leader_election::default_path);
  EXPECT_EQ(election->path(), "/leader");
  EXPECT_EQ(election->identity(), "generated-7");
  EXPECT_EQ(election->acl(), ballot::open_acl_unsafe());
  EXPECT_EQ(client->last_acl(), ballot::open_acl_unsafe());
  EXPECT_EQ(service->data("/leader"), "generated-7");
  EXPECT_EQ(election->state(), election_state::leader);
}

/**
 * @test Verify that the random identity is a non-negative integer.
 */
TEST(leader_election, random_identity) {
  auto service = std::make_shared<ballot::testing::fake_coordination_service>();
  auto election = ballot::leader_election::create(service->create_client());
  election->start();
  service->deliver_all();
  auto id = election->identity();
  ASSERT_FALSE(id.empty());
  EXPECT_EQ(id.find_first_not_of("0123456789"), std::string::npos);
  EXPECT_EQ(service->data("/leader"), id);
}

/**
 * @test Verify that a follower takes over when the session of the leader expires.
 */
TEST(leader_election, leader_session_expires) {
  auto service = std::make_shared<ballot::testing::fake_coordination_service>();
  auto a = make_candidate(service, "candidate-a");
  auto b = make_candidate(service, "candidate-b");
  a.election->start();
  service->deliver_all();
  b.election->start();
  service->deliver_all();
  ASSERT_EQ(a.election->state(), election_state::leader);
  ASSERT_EQ(b.election->state(), election_state::follower);

  service->expire_session(a.client->session_id());
  service->deliver_all();

  EXPECT_EQ(a.election->state(), election_state::done);
  EXPECT_EQ(a.listener->count("finish"), 1);
  EXPECT_EQ(b.election->state(), election_state::leader);
  EXPECT_EQ(b.listener->count("win"), 1);
  EXPECT_EQ(service->data("/election/test"), "candidate-b");
  EXPECT_EQ(service->stat("/election/test").ephemeral_owner, b.client->session_id());
}

/**
 * @test Verify that persistent transient errors are retried until the client closes.
 */
TEST(leader_election, retries_until_closed) {
  auto service = std::make_shared<ballot::testing::fake_coordination_service>();
  auto a = make_candidate(service, "candidate-a");
  a.client->fail_always(fake_operation::create, result_code::connection_loss);
  a.client->fail_always(fake_operation::get, result_code::connection_loss);

  a.election->start();
  EXPECT_EQ(service->deliver_all(50), 50UL);
  EXPECT_EQ(a.election->state(), election_state::electing);
  EXPECT_EQ(a.client->calls(fake_operation::create), 1);
  EXPECT_GE(a.client->calls(fake_operation::get), 49);

  a.client->state(ballot::client_state::closed);
  service->deliver_all();
  EXPECT_EQ(a.election->state(), election_state::done);
  EXPECT_EQ(a.listener->count("finish"), 1);
  EXPECT_EQ(service->pending(), 0UL);
}

/**
 * @test Verify that track errors are retried.
 */
TEST(leader_election, track_retried) {
  auto service = std::make_shared<ballot::testing::fake_coordination_service>();
  auto a = make_candidate(service, "candidate-a");
  a.client->inject_failure(fake_operation::exists, result_code::connection_loss);
  a.client->inject_failure(fake_operation::exists, result_code::system_error);

  a.election->start();
  service->deliver_all();
  EXPECT_EQ(a.election->state(), election_state::leader);
  EXPECT_EQ(a.client->calls(fake_operation::exists), 3);
  EXPECT_EQ(service->watch_count("/election/test"), 1UL);
}

/**
 * @test Verify that a client completing the requests synchronously does not deadlock.
 */
TEST(leader_election, synchronous_client) {
  auto service = std::make_shared<ballot::testing::fake_coordination_service>();
  auto a = make_candidate(service, "candidate-a");
  a.client->complete_synchronously(true);
  a.client->inject_failure(fake_operation::create, result_code::connection_loss, true);

  a.election->start();
  EXPECT_EQ(a.election->state(), election_state::leader);
  EXPECT_EQ(service->pending(), 0UL);

  // ... watch notifications are still queued ...
  a.election->finish();
  service->remove("/election/test");
  EXPECT_EQ(a.election->state(), election_state::leader);
  service->deliver_all();
  EXPECT_EQ(a.election->state(), election_state::done);
}

/**
 * @test Verify that a listener can call finish() from inside a notification.
 */
TEST(leader_election, finish_from_listener) {
  auto service = std::make_shared<ballot::testing::fake_coordination_service>();
  auto client = service->create_client();
  auto election = ballot::leader_election::create(client);
  int finished = 0;
  ballot::listener_callbacks callbacks;
  callbacks.on_win = [](ballot::leader_election& e) { e.finish(); };
  callbacks.on_finish = [&finished](ballot::leader_election& e) {
    ++finished;
    EXPECT_EQ(e.state(), election_state::done);
  };
  election->path("/election/test").listener(ballot::make_election_listener(std::move(callbacks)));
  election->start();
  service->deliver_all();

  EXPECT_EQ(election->state(), election_state::done);
  EXPECT_EQ(finished, 1);
  EXPECT_EQ(client->calls(fake_operation::exists), 0);
}

/**
 * @test Verify that stale or unrelated events are ignored.
 */
TEST(leader_election, stale_events) {
  using ballot::detail::election_event;
  auto service = std::make_shared<ballot::testing::fake_coordination_service>();
  service->set("/election/test", "X");
  auto a = make_candidate(service, "candidate-a");
  a.election->start();
  service->deliver_all();
  ASSERT_EQ(a.election->state(), election_state::follower);
  auto events = a.listener->events;

  // ... a deletion from an older watch ...
  a.election->handle_event(election_event::watch_fired(ballot::watch_event_type::deleted, 0));
  EXPECT_EQ(a.election->state(), election_state::follower);
  // ... other changes from the current watch ...
  a.election->handle_event(election_event::watch_fired(ballot::watch_event_type::created, 1));
  a.election->handle_event(election_event::watch_fired(ballot::watch_event_type::other, 1));
  EXPECT_EQ(a.election->state(), election_state::follower);
  EXPECT_EQ(a.listener->events, events);
  EXPECT_EQ(service->pending(), 0UL);

  // ... nothing changes once the election is done ...
  a.election->finish();
  service->remove("/election/test");
  service->deliver_all();
  ASSERT_EQ(a.election->state(), election_state::done);
  a.election->handle_event(election_event::claim_completed(result_code::ok));
  a.election->handle_event(election_event::resolve_completed(result_code::no_node, ""));
  EXPECT_EQ(a.election->state(), election_state::done);
  EXPECT_EQ(service->pending(), 0UL);
  EXPECT_EQ(a.listener->count("finish"), 1);
}

/**
 * @test Verify that finish() can be called from another thread while start() fills in the configuration.
 */
TEST(leader_election, finish_concurrent_with_start) {
  std::atomic<int> messages(0);
  ballot::log::instance().add_sink(
      ballot::make_log_sink([&messages](ballot::severity, std::string&&) { ++messages; }));

  for (int i = 0; i != 50; ++i) {
    auto service = std::make_shared<ballot::testing::fake_coordination_service>();
    auto client = service->create_client();
    auto listener = std::make_shared<recording_listener>();
    // ... no path or identity, start() computes both while finish() logs them ...
    auto election = ballot::leader_election::create(client);
    election->listener(listener);

    std::thread t([election, i]() {
      std::this_thread::sleep_for(std::chrono::microseconds(i % 25));
      election->finish();
    });
    election->start();
    t.join();
    service->deliver_all();

    EXPECT_EQ(election->state(), election_state::done);
    EXPECT_EQ(listener->count("finish"), 1);
  }
  ballot::log::instance().clear_sinks();
  EXPECT_LT(0, messages.load());
}

/**
 * @test Verify that a lost watch does not change the state of a leader, even after the client is closed.
 */
TEST(leader_election, lost_watch_is_ignored) {
  using namespace ::testing;
  auto client = std::make_shared<ballot::testing::mocked_coordination_client>();
  std::atomic<ballot::client_state> client_state(ballot::client_state::healthy);

  EXPECT_CALL(*client, state()).WillRepeatedly(Invoke([&client_state]() { return client_state.load(); }));
  EXPECT_CALL(*client, async_create("/election/mocked", "id-1", _, ballot::create_mode::ephemeral, _))
      .WillOnce(Invoke([](std::string const& path, std::string const&, ballot::acl_list const&, ballot::create_mode,
                          ballot::coordination_client::create_callback cb) { cb(result_code::ok, path); }));
  ballot::coordination_client::watcher watcher;
  EXPECT_CALL(*client, async_exists("/election/mocked", _, _))
      .WillOnce(Invoke([&watcher](std::string const&, ballot::coordination_client::watcher w,
                                  ballot::coordination_client::exists_callback cb) {
        watcher = std::move(w);
        cb(result_code::ok, ballot::node_stat{});
      }));

  auto listener = std::make_shared<recording_listener>();
  auto election = ballot::leader_election::create(client);
  election->path("/election/mocked").identity("id-1").listener(listener);
  election->start();
  ASSERT_EQ(election->state(), election_state::leader);
  ASSERT_TRUE((bool)watcher);

  // ... the session ends, the client reports every pending watch as lost ...
  client_state.store(ballot::client_state::closed);
  watcher(ballot::watch_event{ballot::watch_event_type::other, "/election/mocked"});
  EXPECT_EQ(election->state(), election_state::leader);

  // ... without a pending request nothing reaches the termination gate ...
  election->finish();
  EXPECT_EQ(election->state(), election_state::leader);
  EXPECT_EQ(listener->count("finish"), 0);
}
