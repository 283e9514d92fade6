#include "ballot/election_listener.hpp"

namespace {
/// Adapt ballot::listener_callbacks to the ballot::election_listener interface.
class callbacks_listener : public ballot::election_listener {
public:
  explicit callbacks_listener(ballot::listener_callbacks&& callbacks)
      : callbacks_(std::move(callbacks)) {
  }

  void on_state_changed(
      ballot::leader_election& election, ballot::election_state old_state, ballot::election_state new_state) override {
    if (callbacks_.on_state_changed) {
      callbacks_.on_state_changed(election, old_state, new_state);
    }
  }
  void on_win(ballot::leader_election& election) override {
    invoke(callbacks_.on_win, election);
  }
  void on_lose(ballot::leader_election& election) override {
    invoke(callbacks_.on_lose, election);
  }
  void on_vacant(ballot::leader_election& election) override {
    invoke(callbacks_.on_vacant, election);
  }
  void on_finish(ballot::leader_election& election) override {
    invoke(callbacks_.on_finish, election);
  }

private:
  static void invoke(std::function<void(ballot::leader_election&)> const& f, ballot::leader_election& election) {
    if (f) {
      f(election);
    }
  }

private:
  ballot::listener_callbacks callbacks_;
};
} // anonymous namespace

namespace ballot {

std::shared_ptr<election_listener> make_election_listener(listener_callbacks callbacks) {
  return std::make_shared<callbacks_listener>(std::move(callbacks));
}

} // namespace ballot
