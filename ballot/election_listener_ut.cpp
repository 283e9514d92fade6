#include "ballot/election_listener.hpp"
#include <ballot/leader_election.hpp>

#include <gtest/gtest.h>

/**
 * @test Verify that make_election_listener() forwards to the functors, and tolerates missing ones.
 */
TEST(election_listener, callbacks) {
  auto election = ballot::leader_election::create();

  int wins = 0;
  int finishes = 0;
  std::vector<std::pair<ballot::election_state, ballot::election_state>> changes;
  ballot::listener_callbacks callbacks;
  callbacks.on_state_changed = [&changes](ballot::leader_election&, ballot::election_state o, ballot::election_state n) {
    changes.emplace_back(o, n);
  };
  callbacks.on_win = [&wins](ballot::leader_election&) { ++wins; };
  callbacks.on_finish = [&finishes](ballot::leader_election&) { ++finishes; };
  auto listener = ballot::make_election_listener(std::move(callbacks));

  listener->on_state_changed(*election, ballot::election_state::created, ballot::election_state::electing);
  listener->on_win(*election);
  EXPECT_NO_THROW(listener->on_lose(*election));
  EXPECT_NO_THROW(listener->on_vacant(*election));
  listener->on_finish(*election);

  ASSERT_EQ(changes.size(), 1UL);
  EXPECT_EQ(changes[0].first, ballot::election_state::created);
  EXPECT_EQ(changes[0].second, ballot::election_state::electing);
  EXPECT_EQ(wins, 1);
  EXPECT_EQ(finishes, 1);

  auto empty = ballot::make_election_listener(ballot::listener_callbacks());
  EXPECT_NO_THROW(empty->on_win(*election));
  EXPECT_NO_THROW(empty->on_finish(*election));
}
