#include "ballot/leader_election.hpp"
#include <ballot/election_error.hpp>
#include <ballot/log.hpp>

namespace ballot {

char const leader_election::default_path[] = "/leader";

template <typename Functor>
void leader_election::notify(char const* what, Functor&& functor) {
  if (not listener_) {
    return;
  }
  try {
    functor(*listener_);
  } catch (std::exception const& ex) {
    BALLOT_LOG(warning) << "listener " << what << " raised an exception, ignored: " << ex.what();
  } catch (...) {
    BALLOT_LOG(warning) << "listener " << what << " raised an unknown exception, ignored";
  }
}

std::shared_ptr<leader_election> leader_election::create() {
  return std::shared_ptr<leader_election>(new leader_election);
}

std::shared_ptr<leader_election> leader_election::create(std::shared_ptr<coordination_client> client) {
  auto election = create();
  election->client(std::move(client));
  return election;
}

leader_election::leader_election()
    : client_()
    , path_()
    , identity_()
    , acl_()
    , listener_()
    , identity_generator_(random_identity_generator())
    , state_machine_()
    , watch_generation_(0) {
}

leader_election& leader_election::client(std::shared_ptr<coordination_client> client) {
  check_configurable("client()");
  client_ = std::move(client);
  return *this;
}

leader_election& leader_election::path(std::string path) {
  check_configurable("path()");
  path_ = std::move(path);
  return *this;
}

leader_election& leader_election::identity(std::string identity) {
  check_configurable("identity()");
  identity_ = std::move(identity);
  return *this;
}

leader_election& leader_election::acl(acl_list acl) {
  check_configurable("acl()");
  acl_ = std::move(acl);
  return *this;
}

leader_election& leader_election::listener(std::shared_ptr<election_listener> listener) {
  check_configurable("listener()");
  listener_ = std::move(listener);
  return *this;
}

leader_election& leader_election::identity_generator(identity_generator_type generator) {
  check_configurable("identity_generator()");
  identity_generator_ = std::move(generator);
  return *this;
}

void leader_election::check_configurable(char const* what) const {
  auto current = state_machine_.current();
  if (current != election_state::created) {
    throw invalid_state(std::string(what) + " cannot change the configuration after start().", current);
  }
}

void leader_election::start() {
  auto action = state_machine_.atomically([this]() {
    if (not client_) {
      throw not_configured("leader_election::start() requires a coordination client.");
    }
    auto current = state_machine_.current();
    if (current != election_state::created) {
      throw invalid_state("leader_election::start() can only be called once.", current);
    }
    setup();
    if (gate_closed()) {
      return detail::election_action::idle;
    }
    change_state("start()", election_state::electing);
    return detail::election_action::claim;
  });
  perform(action);
}

void leader_election::finish() {
  // ... start() fills in the defaults for path_ and identity_ under the same lock ...
  state_machine_.atomically([this]() {
    BALLOT_LOG(info) << "finish requested for " << path_ << " [" << identity_ << "]";
    state_machine_.request_finish();
  });
}

void leader_election::setup() {
  if (path_.empty()) {
    path_ = default_path;
  }
  if (path_[0] != '/') {
    throw not_configured("leader_election path must start with '/', got <" + path_ + ">");
  }
  if (identity_.empty()) {
    if (not identity_generator_) {
      throw not_configured("leader_election requires an identity or an identity generator.");
    }
    identity_ = identity_generator_();
  }
  if (acl_.empty()) {
    acl_ = open_acl_unsafe();
  }
  BALLOT_LOG(info) << "starting election on " << path_ << " as [" << identity_ << "]";
}

void leader_election::handle_event(detail::election_event const& event) {
  auto action = state_machine_.atomically([this, &event]() { return decide(event); });
  perform(action);
}

detail::election_action leader_election::decide(detail::election_event const& event) {
  using detail::election_action;
  using detail::election_event_kind;

  auto current = state_machine_.current();
  BALLOT_LOG(trace) << path_ << " [" << identity_ << "] " << event.kind << " rc=" << event.rc
                    << " in state=" << current;
  if (current == election_state::done) {
    return election_action::idle;
  }

  switch (event.kind) {
  case election_event_kind::claim_completed:
    if (event.rc == result_code::ok) {
      change_state("claim", election_state::leader);
      notify("on_win", [this](election_listener& l) { l.on_win(*this); });
      return election_action::track;
    }
    if (event.rc == result_code::node_exists) {
      change_state("claim", election_state::follower);
      notify("on_lose", [this](election_listener& l) { l.on_lose(*this); });
      return election_action::track;
    }
    // ... the create may or may not have succeeded, find out who owns the node ...
    BALLOT_LOG(debug) << "claim on " << path_ << " failed with " << event.rc << ", resolving";
    return election_action::resolve;

  case election_event_kind::resolve_completed:
    if (event.rc == result_code::ok) {
      if (event.data == identity_) {
        change_state("resolve", election_state::leader);
        notify("on_win", [this](election_listener& l) { l.on_win(*this); });
      } else {
        change_state("resolve", election_state::follower);
        notify("on_lose", [this](election_listener& l) { l.on_lose(*this); });
      }
      return election_action::track;
    }
    if (event.rc == result_code::no_node) {
      change_state("resolve", election_state::electing);
      notify("on_vacant", [this](election_listener& l) { l.on_vacant(*this); });
      return election_action::claim;
    }
    BALLOT_LOG(debug) << "resolve on " << path_ << " failed with " << event.rc << ", retrying";
    return election_action::resolve;

  case election_event_kind::track_completed:
    if (event.rc == result_code::ok) {
      return election_action::idle;
    }
    if (event.rc == result_code::no_node) {
      change_state("track", election_state::electing);
      notify("on_vacant", [this](election_listener& l) { l.on_vacant(*this); });
      return election_action::claim;
    }
    BALLOT_LOG(debug) << "track on " << path_ << " failed with " << event.rc << ", retrying";
    return election_action::track;

  case election_event_kind::watch_fired:
    if (event.change != watch_event_type::deleted) {
      return election_action::idle;
    }
    if (event.watch_generation != watch_generation_) {
      BALLOT_LOG(debug) << "ignoring stale watch on " << path_ << " generation=" << event.watch_generation
                        << ", current=" << watch_generation_;
      return election_action::idle;
    }
    if (current != election_state::leader and current != election_state::follower) {
      return election_action::idle;
    }
    change_state("watch", election_state::electing);
    notify("on_vacant", [this](election_listener& l) { l.on_vacant(*this); });
    return election_action::claim;
  }
  return election_action::idle;
}

bool leader_election::gate_closed() {
  bool finish_requested = state_machine_.finish_requested();
  auto cstate = client_->state();
  if (not finish_requested and not is_fatal(cstate)) {
    return false;
  }
  BALLOT_LOG(info) << "election on " << path_ << " [" << identity_ << "] stopping, finish_requested=" << finish_requested
                   << ", client state=" << cstate;
  if (change_state("gate", election_state::done)) {
    notify("on_finish", [this](election_listener& l) { l.on_finish(*this); });
  }
  return true;
}

void leader_election::perform(detail::election_action action) {
  using detail::election_action;
  if (action == election_action::idle) {
    return;
  }
  std::uint64_t generation = 0;
  bool closed = state_machine_.atomically([this, action, &generation]() {
    if (gate_closed()) {
      return true;
    }
    if (action == election_action::track) {
      generation = ++watch_generation_;
    }
    return false;
  });
  if (closed) {
    return;
  }
  // ... the request is sent without holding the lock, the client may invoke the callback immediately ...
  switch (action) {
  case election_action::claim:
    claim();
    break;
  case election_action::resolve:
    resolve();
    break;
  case election_action::track:
    track(generation);
    break;
  case election_action::idle:
    break;
  }
}

void leader_election::claim() {
  auto self = shared_from_this();
  client_->async_create(path_, identity_, acl_, create_mode::ephemeral, [self](result_code rc, std::string const&) {
    self->handle_event(detail::election_event::claim_completed(rc));
  });
}

void leader_election::resolve() {
  auto self = shared_from_this();
  client_->async_get(path_, [self](result_code rc, std::string const& data, node_stat const&) {
    self->handle_event(detail::election_event::resolve_completed(rc, data));
  });
}

void leader_election::track(std::uint64_t generation) {
  auto self = shared_from_this();
  client_->async_exists(
      path_,
      [self, generation](watch_event const& ev) {
        self->handle_event(detail::election_event::watch_fired(ev.type, generation));
      },
      [self](result_code rc, node_stat const&) { self->handle_event(detail::election_event::track_completed(rc)); });
}

bool leader_election::change_state(char const* where, election_state nstate) {
  election_state old_state;
  if (not state_machine_.change_state(where, nstate, old_state)) {
    return false;
  }
  if (old_state == nstate and nstate == election_state::done) {
    return false;
  }
  notify("on_state_changed", [this, old_state, nstate](election_listener& l) {
    l.on_state_changed(*this, old_state, nstate);
  });
  return true;
}

} // namespace ballot
