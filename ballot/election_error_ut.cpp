#include "ballot/election_error.hpp"

#include <gtest/gtest.h>

/**
 * @test Verify that invalid_state reports the current state.
 */
TEST(election_error, invalid_state) {
  try {
    throw ballot::invalid_state("leader_election::path() cannot change the configuration.", ballot::election_state::leader);
  } catch (std::logic_error const& ex) {
    EXPECT_EQ(
        std::string(ex.what()), "leader_election::path() cannot change the configuration. The current state is leader.");
  }

  ballot::invalid_state ex("bad", ballot::election_state::done);
  EXPECT_EQ(ex.current(), ballot::election_state::done);
}

/**
 * @test Verify that not_configured is a std::logic_error with the right message.
 */
TEST(election_error, not_configured) {
  EXPECT_THROW(throw ballot::not_configured("missing client"), std::logic_error);
  ballot::not_configured ex("missing client");
  EXPECT_EQ(std::string(ex.what()), "missing client");
}
