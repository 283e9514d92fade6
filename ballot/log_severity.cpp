#include "ballot/log_severity.hpp"

#include <iostream>
#include <stdexcept>

namespace {
char const* const severity_names[] = {
    "trace", "debug", "info", "notice", "warning", "error", "critical", "alert", "fatal",
};
} // anonymous namespace

namespace ballot {

std::ostream& operator<<(std::ostream& os, severity x) {
  return os << severity_names[int(x)];
}

severity parse_severity(std::string const& name) {
  for (int i = int(severity::LOWEST); i <= int(severity::HIGHEST); ++i) {
    if (name == severity_names[i]) {
      return severity(i);
    }
  }
  throw std::invalid_argument("unknown log severity <" + name + ">");
}

} // namespace ballot
