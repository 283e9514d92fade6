#include "ballot/node_reader.hpp"
#include <ballot/election_error.hpp>
#include <ballot/log.hpp>

namespace ballot {

namespace {
class callbacks_node_reader_listener : public node_reader_listener {
public:
  callbacks_node_reader_listener(
      std::function<void(node_reader&, std::string const&, node_stat const&)> on_read,
      std::function<void(node_reader&)> on_gave_up)
      : on_read_(std::move(on_read))
      , on_gave_up_(std::move(on_gave_up)) {
  }

  void on_read(node_reader& reader, std::string const& data, node_stat const& stat) override {
    if (on_read_) {
      on_read_(reader, data, stat);
    }
  }
  void on_gave_up(node_reader& reader) override {
    if (on_gave_up_) {
      on_gave_up_(reader);
    }
  }

private:
  std::function<void(node_reader&, std::string const&, node_stat const&)> on_read_;
  std::function<void(node_reader&)> on_gave_up_;
};
} // anonymous namespace

std::shared_ptr<node_reader_listener> make_node_reader_listener(
    std::function<void(node_reader&, std::string const&, node_stat const&)> on_read,
    std::function<void(node_reader&)> on_gave_up) {
  return std::make_shared<callbacks_node_reader_listener>(std::move(on_read), std::move(on_gave_up));
}

template <typename Functor>
void node_reader::notify(char const* what, Functor&& functor) {
  if (not listener_) {
    return;
  }
  try {
    functor(*listener_);
  } catch (std::exception const& ex) {
    BALLOT_LOG(warning) << "node_reader listener " << what << " raised an exception, ignored: " << ex.what();
  } catch (...) {
    BALLOT_LOG(warning) << "node_reader listener " << what << " raised an unknown exception, ignored";
  }
}

std::shared_ptr<node_reader> node_reader::create() {
  return std::shared_ptr<node_reader>(new node_reader);
}

std::shared_ptr<node_reader> node_reader::create(std::shared_ptr<coordination_client> client) {
  auto reader = create();
  reader->client(std::move(client));
  return reader;
}

node_reader::node_reader()
    : mu_()
    , client_()
    , path_()
    , listener_()
    , started_(false)
    , finish_requested_(false)
    , done_(false)
    , watch_generation_(0) {
}

node_reader& node_reader::client(std::shared_ptr<coordination_client> client) {
  check_configurable("client()");
  client_ = std::move(client);
  return *this;
}

node_reader& node_reader::path(std::string path) {
  check_configurable("path()");
  path_ = std::move(path);
  return *this;
}

node_reader& node_reader::listener(std::shared_ptr<node_reader_listener> listener) {
  check_configurable("listener()");
  listener_ = std::move(listener);
  return *this;
}

void node_reader::check_configurable(char const* what) const {
  std::lock_guard<std::recursive_mutex> lock(mu_);
  if (started_) {
    throw std::logic_error(std::string("node_reader::") + what + " cannot change the configuration after start().");
  }
}

void node_reader::start() {
  {
    std::lock_guard<std::recursive_mutex> lock(mu_);
    if (not client_) {
      throw not_configured("node_reader::start() requires a coordination client.");
    }
    if (path_.empty() or path_[0] != '/') {
      throw not_configured("node_reader::start() requires a path starting with '/', got <" + path_ + ">");
    }
    if (started_) {
      throw std::logic_error("node_reader::start() can only be called once.");
    }
    started_ = true;
  }
  read();
}

void node_reader::finish() {
  std::lock_guard<std::recursive_mutex> lock(mu_);
  finish_requested_ = true;
}

bool node_reader::done() const {
  std::lock_guard<std::recursive_mutex> lock(mu_);
  return done_;
}

bool node_reader::gate_closed() {
  if (done_) {
    return true;
  }
  if (not finish_requested_ and not is_fatal(client_->state())) {
    return false;
  }
  BALLOT_LOG(info) << "node_reader for " << path_ << " giving up, finish_requested=" << finish_requested_
                   << ", client state=" << client_->state();
  done_ = true;
  notify("on_gave_up", [this](node_reader_listener& l) { l.on_gave_up(*this); });
  return true;
}

void node_reader::read() {
  {
    std::lock_guard<std::recursive_mutex> lock(mu_);
    if (gate_closed()) {
      return;
    }
  }
  auto self = shared_from_this();
  client_->async_get(path_, [self](result_code rc, std::string const& data, node_stat const& stat) {
    self->on_read_completed(rc, data, stat);
  });
}

void node_reader::wait(std::uint64_t generation) {
  {
    std::lock_guard<std::recursive_mutex> lock(mu_);
    if (gate_closed()) {
      return;
    }
  }
  auto self = shared_from_this();
  client_->async_exists(
      path_, [self, generation](watch_event const& ev) { self->on_watch(ev, generation); },
      [self](result_code rc, node_stat const&) { self->on_exists_completed(rc); });
}

void node_reader::on_read_completed(result_code rc, std::string const& data, node_stat const& stat) {
  std::uint64_t generation = 0;
  {
    std::lock_guard<std::recursive_mutex> lock(mu_);
    if (done_) {
      return;
    }
    if (rc == result_code::ok) {
      done_ = true;
      notify("on_read", [this, &data, &stat](node_reader_listener& l) { l.on_read(*this, data, stat); });
      return;
    }
    if (rc != result_code::no_node) {
      BALLOT_LOG(debug) << "node_reader get(" << path_ << ") failed with " << rc << ", retrying";
    } else {
      generation = ++watch_generation_;
    }
  }
  if (generation == 0) {
    read();
    return;
  }
  wait(generation);
}

void node_reader::on_exists_completed(result_code rc) {
  std::uint64_t generation = 0;
  {
    std::lock_guard<std::recursive_mutex> lock(mu_);
    if (done_) {
      return;
    }
    if (rc == result_code::no_node) {
      // ... the watch is armed, wait for it ...
      return;
    }
    // ... either way the current watch is no longer interesting ...
    generation = ++watch_generation_;
    if (rc != result_code::ok) {
      BALLOT_LOG(debug) << "node_reader exists(" << path_ << ") failed with " << rc << ", retrying";
    }
  }
  if (rc == result_code::ok) {
    read();
    return;
  }
  wait(generation);
}

void node_reader::on_watch(watch_event const& ev, std::uint64_t generation) {
  std::uint64_t next = 0;
  {
    std::lock_guard<std::recursive_mutex> lock(mu_);
    if (done_ or generation != watch_generation_) {
      return;
    }
    next = ++watch_generation_;
    BALLOT_LOG(debug) << "node_reader watch on " << path_ << " fired with " << ev.type;
  }
  if (ev.type == watch_event_type::created or ev.type == watch_event_type::data_changed) {
    read();
    return;
  }
  wait(next);
}

} // namespace ballot
