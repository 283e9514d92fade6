#include "ballot/active_completion_queue.hpp"
#include <ballot/log.hpp>

namespace ballot {

active_completion_queue::active_completion_queue()
    : queue_(std::make_shared<completion_queue<>>())
    , thread_([q = queue_]() { q->run(); }) {
}

active_completion_queue::~active_completion_queue() {
  BALLOT_LOG(trace) << "shutdown active completion queue";
  queue_->shutdown();
  if (thread_.joinable()) {
    thread_.join();
  }
}

} // namespace ballot
