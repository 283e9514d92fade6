#include "ballot/election_state.hpp"

#include <gtest/gtest.h>
#include <sstream>

/**
 * @test Verify that election states are printed as expected.
 */
TEST(election_state, streaming) {
  auto as_string = [](ballot::election_state s) {
    std::ostringstream os;
    os << s;
    return os.str();
  };
  EXPECT_EQ(as_string(ballot::election_state::created), "created");
  EXPECT_EQ(as_string(ballot::election_state::electing), "electing");
  EXPECT_EQ(as_string(ballot::election_state::leader), "leader");
  EXPECT_EQ(as_string(ballot::election_state::follower), "follower");
  EXPECT_EQ(as_string(ballot::election_state::done), "done");
}
