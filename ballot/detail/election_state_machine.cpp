#include "ballot/detail/election_state_machine.hpp"
#include <ballot/log.hpp>

namespace ballot {
namespace detail {

election_state_machine::election_state_machine()
    : mu_()
    , state_(election_state::created)
    , finish_requested_(false) {
}

election_state election_state_machine::current() const {
  std::lock_guard<std::recursive_mutex> lock(mu_);
  return state_;
}

void election_state_machine::request_finish() {
  std::lock_guard<std::recursive_mutex> lock(mu_);
  finish_requested_ = true;
}

bool election_state_machine::finish_requested() const {
  std::lock_guard<std::recursive_mutex> lock(mu_);
  return finish_requested_;
}

bool election_state_machine::change_state(char const* where, election_state nstate, election_state& old_state) {
  std::lock_guard<std::recursive_mutex> lock(mu_);
  old_state = state_;
  if (not check_change_state(nstate)) {
    BALLOT_LOG(notice) << where << ": rejected transition " << state_ << " -> " << nstate;
    return false;
  }
  if (state_ != election_state::done) {
    BALLOT_LOG(info) << where << ": " << state_ << " -> " << nstate;
  }
  state_ = nstate;
  return true;
}

bool election_state_machine::check_change_state(election_state nstate) const {
  using s = election_state;
  if (nstate == state_) {
    return true;
  }
  switch (state_) {
  case s::done:
    return false;
  case s::follower:
    return nstate == s::electing or nstate == s::done;
  case s::leader:
    return nstate == s::electing or nstate == s::done;
  case s::electing:
    return nstate == s::leader or nstate == s::follower or nstate == s::done;
  case s::created:
    return nstate == s::electing or nstate == s::done;
  }
  return false;
}

} // namespace detail
} // namespace ballot
