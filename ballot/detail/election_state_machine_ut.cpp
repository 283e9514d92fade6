#include "ballot/detail/election_state_machine.hpp"

#include <gtest/gtest.h>

using ballot::election_state;

/**
 * @test Verify the valid transitions of the election state machine.
 */
TEST(election_state_machine, valid_transitions) {
  ballot::detail::election_state_machine machine;
  EXPECT_EQ(machine.current(), election_state::created);

  election_state old;
  EXPECT_TRUE(machine.change_state("test", election_state::electing, old));
  EXPECT_EQ(old, election_state::created);
  EXPECT_TRUE(machine.change_state("test", election_state::leader, old));
  EXPECT_EQ(old, election_state::electing);
  EXPECT_TRUE(machine.change_state("test", election_state::electing, old));
  EXPECT_TRUE(machine.change_state("test", election_state::follower, old));
  EXPECT_TRUE(machine.change_state("test", election_state::electing, old));
  EXPECT_TRUE(machine.change_state("test", election_state::done, old));
  EXPECT_EQ(old, election_state::electing);
  EXPECT_EQ(machine.current(), election_state::done);
}

/**
 * @test Verify that self-transitions are accepted without effect.
 */
TEST(election_state_machine, self_transitions) {
  ballot::detail::election_state_machine machine;
  election_state old;
  EXPECT_TRUE(machine.change_state("test", election_state::created, old));
  EXPECT_EQ(old, election_state::created);
  EXPECT_TRUE(machine.change_state("test", election_state::done, old));
  EXPECT_TRUE(machine.change_state("test", election_state::done, old));
  EXPECT_EQ(old, election_state::done);
}

/**
 * @test Verify that invalid transitions are rejected and leave the state unchanged.
 */
TEST(election_state_machine, invalid_transitions) {
  election_state old;
  {
    ballot::detail::election_state_machine machine;
    EXPECT_FALSE(machine.change_state("test", election_state::leader, old));
    EXPECT_FALSE(machine.change_state("test", election_state::follower, old));
    EXPECT_EQ(machine.current(), election_state::created);
  }
  {
    ballot::detail::election_state_machine machine;
    ASSERT_TRUE(machine.change_state("test", election_state::electing, old));
    ASSERT_TRUE(machine.change_state("test", election_state::leader, old));
    EXPECT_FALSE(machine.change_state("test", election_state::follower, old));
    EXPECT_FALSE(machine.change_state("test", election_state::created, old));
    EXPECT_EQ(machine.current(), election_state::leader);
  }
  {
    ballot::detail::election_state_machine machine;
    ASSERT_TRUE(machine.change_state("test", election_state::done, old));
    EXPECT_FALSE(machine.change_state("test", election_state::electing, old));
    EXPECT_FALSE(machine.change_state("test", election_state::leader, old));
    EXPECT_FALSE(machine.change_state("test", election_state::created, old));
    EXPECT_EQ(old, election_state::done);
    EXPECT_EQ(machine.current(), election_state::done);
  }
}

/**
 * @test Verify that the finish flag is sticky and atomically() allows reentrant calls.
 */
TEST(election_state_machine, finish_and_atomically) {
  ballot::detail::election_state_machine machine;
  EXPECT_FALSE(machine.finish_requested());
  machine.request_finish();
  EXPECT_TRUE(machine.finish_requested());
  machine.request_finish();
  EXPECT_TRUE(machine.finish_requested());

  auto r = machine.atomically([&machine]() {
    election_state old;
    machine.change_state("test", election_state::done, old);
    return machine.current();
  });
  EXPECT_EQ(r, election_state::done);
}
