#include "ballot/identity_generator.hpp"

#include <cstdint>
#include <limits>

namespace ballot {

random_identity_generator::random_identity_generator()
    : engine_() {
  std::random_device rd;
  std::seed_seq seq{rd(), rd(), rd(), rd()};
  engine_ = std::make_shared<std::mt19937_64>(seq);
}

random_identity_generator::random_identity_generator(std::uint64_t seed)
    : engine_(std::make_shared<std::mt19937_64>(seed)) {
}

std::string random_identity_generator::operator()() {
  std::uniform_int_distribution<std::int64_t> dist(0, std::numeric_limits<std::int64_t>::max());
  return std::to_string(dist(*engine_));
}

} // namespace ballot
