#include "ballot/detail/election_event.hpp"

#include <gtest/gtest.h>
#include <sstream>

/**
 * @test Verify the election_event factory functions.
 */
TEST(election_event, factories) {
  using namespace ballot::detail;
  using ballot::result_code;

  auto claim = election_event::claim_completed(result_code::node_exists);
  EXPECT_EQ(claim.kind, election_event_kind::claim_completed);
  EXPECT_EQ(claim.rc, result_code::node_exists);

  auto resolve = election_event::resolve_completed(result_code::ok, "candidate-a");
  EXPECT_EQ(resolve.kind, election_event_kind::resolve_completed);
  EXPECT_EQ(resolve.data, "candidate-a");

  auto track = election_event::track_completed(result_code::no_node);
  EXPECT_EQ(track.kind, election_event_kind::track_completed);
  EXPECT_EQ(track.rc, result_code::no_node);

  auto fired = election_event::watch_fired(ballot::watch_event_type::deleted, 7);
  EXPECT_EQ(fired.kind, election_event_kind::watch_fired);
  EXPECT_EQ(fired.change, ballot::watch_event_type::deleted);
  EXPECT_EQ(fired.watch_generation, 7U);
}

/**
 * @test Verify election_event_kind and election_action are printed as expected.
 */
TEST(election_event, streaming) {
  using namespace ballot::detail;
  std::ostringstream os;
  os << election_event_kind::claim_completed << " " << election_event_kind::resolve_completed << " "
     << election_event_kind::track_completed << " " << election_event_kind::watch_fired;
  EXPECT_EQ(os.str(), "claim_completed resolve_completed track_completed watch_fired");

  os.str("");
  os << election_action::idle << " " << election_action::claim << " " << election_action::resolve << " "
     << election_action::track;
  EXPECT_EQ(os.str(), "idle claim resolve track");
}
