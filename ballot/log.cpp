#include "ballot/log.hpp"

namespace ballot {

log& log::instance() {
  // Function-local static, initialized once in a thread-safe manner and never destroyed, so callbacks running while
  // the process exits can still log.
  static log* singleton = new log;
  return *singleton;
}

void log::add_sink(std::shared_ptr<log_sink> sink) {
  std::lock_guard<std::mutex> guard(mu_);
  sinks_.push_back(std::move(sink));
}

void log::clear_sinks() {
  std::lock_guard<std::mutex> guard(mu_);
  sinks_.clear();
}

void log::write(severity sev, std::string&& msg) {
  std::vector<std::shared_ptr<log_sink>> sinks;
  {
    std::lock_guard<std::mutex> guard(mu_);
    if (sinks_.empty() or sev < min_severity_) {
      return;
    }
    sinks = sinks_;
  }
  // ... the common case is a single sink, avoid copying the message ...
  if (sinks.size() == 1) {
    sinks[0]->log(sev, std::move(msg));
    return;
  }
  for (auto const& s : sinks) {
    std::string copy(msg);
    s->log(sev, std::move(copy));
  }
}

logger<false>::logger(severity sev, char const* function, char const* filename, int lineno, log& sink)
    : os_()
    , sev_(sev)
    , function_(function)
    , filename_(filename)
    , lineno_(lineno)
    , closed_(sev < sink.min_severity()) {
  if (closed_) {
    return;
  }
  os_ << "[" << sev_ << "] ";
}

void logger<false>::write_to(log& sink) {
  closed_ = true;
  os_ << " in " << function_ << "(" << filename_ << ":" << lineno_ << ")";
  sink.write(sev_, os_.str());
}

} // namespace ballot
