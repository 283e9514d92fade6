#include "ballot/leader_election.hpp"
#include <ballot/etcd_coordination_client.hpp>
#include <ballot/testing/etcd_server.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <condition_variable>
#include <future>
#include <mutex>
#include <sstream>

namespace {
/// Record the notifications of an election, and let the test wait for them.
class election_recorder : public std::enable_shared_from_this<election_recorder> {
public:
  std::shared_ptr<ballot::election_listener> listener() {
    auto self = shared_from_this();
    ballot::listener_callbacks callbacks;
    callbacks.on_win = [self](ballot::leader_election&) { self->record("win"); };
    callbacks.on_lose = [self](ballot::leader_election&) { self->record("lose"); };
    callbacks.on_vacant = [self](ballot::leader_election&) { self->record("vacant"); };
    callbacks.on_finish = [self](ballot::leader_election&) { self->record("finish"); };
    return ballot::make_election_listener(std::move(callbacks));
  }

  void record(std::string event) {
    std::lock_guard<std::mutex> lock(mu_);
    events_.push_back(std::move(event));
    cv_.notify_all();
  }

  /// Wait until @a event is recorded, return false on timeout.
  bool wait_for(std::string const& event, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mu_);
    return cv_.wait_for(
        lock, timeout, [this, &event]() { return std::find(events_.begin(), events_.end(), event) != events_.end(); });
  }

private:
  std::mutex mu_;
  std::condition_variable cv_;
  std::vector<std::string> events_;
};

/// Use a different path on each run, the leases are unique.
std::string unique_path(ballot::etcd_coordination_client const& client) {
  std::ostringstream os;
  os << "/ballot-test/" << std::hex << client.lease_id() << "/leader";
  return os.str();
}

std::string read_node(ballot::coordination_client& client, std::string const& path) {
  auto promise = std::make_shared<std::promise<std::string>>();
  auto f = promise->get_future();
  client.async_get(path, [promise](ballot::result_code rc, std::string const& data, ballot::node_stat const&) {
    promise->set_value(rc == ballot::result_code::ok ? data : "<no data>");
  });
  return f.get();
}
} // anonymous namespace

/**
 * @test Verify that a single candidate wins the election, and finishes when its session ends.
 */
TEST(leader_election, basic) {
  using namespace std::chrono_literals;
  auto channel = ballot::testing::connect_to_etcd(2000ms);
  if (not channel) {
    GTEST_SKIP() << "no etcd server at " << ballot::testing::etcd_address();
  }
  auto queue = std::make_shared<ballot::active_completion_queue>();
  auto client = std::make_shared<ballot::etcd_coordination_client>(queue, channel, 3000ms);
  EXPECT_NE(client->lease_id(), 0);
  auto path = unique_path(*client);
  EXPECT_TRUE(true) << "testing with path=" << path;

  auto recorder = std::make_shared<election_recorder>();
  auto candidate = ballot::leader_election::create(client);
  candidate->path(path).identity("candidate-a").listener(recorder->listener());
  EXPECT_EQ(candidate->state(), ballot::election_state::created);
  candidate->start();
  ASSERT_TRUE(recorder->wait_for("win", 10s));
  EXPECT_EQ(candidate->state(), ballot::election_state::leader);

  // ... the node holds the identity of the leader ...
  EXPECT_EQ(read_node(*client, path), "candidate-a");

  // ... revoking the lease deletes the node, the watch on it fires and the candidate stops ...
  candidate->finish();
  client->revoke();
  ASSERT_TRUE(recorder->wait_for("finish", 10s));
  EXPECT_EQ(candidate->state(), ballot::election_state::done);
  client->shutdown();
}

/**
 * @test Verify that a follower takes over when the leader's session ends.
 */
TEST(leader_election, switch_leader) {
  using namespace std::chrono_literals;
  auto channel = ballot::testing::connect_to_etcd(2000ms);
  if (not channel) {
    GTEST_SKIP() << "no etcd server at " << ballot::testing::etcd_address();
  }
  auto queue = std::make_shared<ballot::active_completion_queue>();
  auto client_a = std::make_shared<ballot::etcd_coordination_client>(queue, channel, 3000ms);
  auto client_b = std::make_shared<ballot::etcd_coordination_client>(queue, channel, 3000ms);
  auto path = unique_path(*client_a);

  auto recorder_a = std::make_shared<election_recorder>();
  auto candidate_a = ballot::leader_election::create(client_a);
  candidate_a->path(path).identity("candidate-a").listener(recorder_a->listener());
  candidate_a->start();
  ASSERT_TRUE(recorder_a->wait_for("win", 10s));

  auto recorder_b = std::make_shared<election_recorder>();
  auto candidate_b = ballot::leader_election::create(client_b);
  candidate_b->path(path).identity("candidate-b").listener(recorder_b->listener());
  candidate_b->start();
  ASSERT_TRUE(recorder_b->wait_for("lose", 10s));
  EXPECT_EQ(candidate_b->state(), ballot::election_state::follower);
  EXPECT_EQ(read_node(*client_b, path), "candidate-a");

  EXPECT_TRUE(true) << "a::revoke";
  client_a->revoke();
  ASSERT_TRUE(recorder_b->wait_for("vacant", 10s));
  ASSERT_TRUE(recorder_b->wait_for("win", 10s));
  EXPECT_EQ(candidate_b->state(), ballot::election_state::leader);
  EXPECT_EQ(read_node(*client_b, path), "candidate-b");

  // ... the old leader cannot continue without its session ...
  ASSERT_TRUE(recorder_a->wait_for("finish", 10s));
  EXPECT_EQ(candidate_a->state(), ballot::election_state::done);

  EXPECT_TRUE(true) << "cleanup";
  candidate_b->finish();
  client_b->revoke();
  ASSERT_TRUE(recorder_b->wait_for("finish", 10s));
  client_a->shutdown();
  client_b->shutdown();
}

/**
 * @test Verify that a candidate finished before start() never touches the service.
 */
TEST(leader_election, finish_before_start) {
  using namespace std::chrono_literals;
  auto channel = ballot::testing::connect_to_etcd(2000ms);
  if (not channel) {
    GTEST_SKIP() << "no etcd server at " << ballot::testing::etcd_address();
  }
  auto queue = std::make_shared<ballot::active_completion_queue>();
  auto client = std::make_shared<ballot::etcd_coordination_client>(queue, channel, 3000ms);
  auto path = unique_path(*client);

  auto recorder = std::make_shared<election_recorder>();
  auto candidate = ballot::leader_election::create(client);
  candidate->path(path).identity("candidate-a").listener(recorder->listener());
  candidate->finish();
  candidate->start();
  EXPECT_TRUE(recorder->wait_for("finish", 0ms));
  EXPECT_EQ(candidate->state(), ballot::election_state::done);
  EXPECT_EQ(read_node(*client, path), "<no data>");

  client->revoke();
  client->shutdown();
}
