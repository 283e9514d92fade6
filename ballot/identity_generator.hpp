#ifndef ballot_identity_generator_hpp
#define ballot_identity_generator_hpp

#include <cstdint>
#include <functional>
#include <memory>
#include <random>
#include <string>

namespace ballot {

/// The type of the functors used to create candidate identities.
using identity_generator_type = std::function<std::string()>;

/**
 * Generate random candidate identities.
 *
 * Each identity is a non-negative 63-bit integer rendered in decimal.  Each generator owns its own engine, seeded
 * from std::random_device, there is no process-wide source of randomness.
 */
class random_identity_generator {
public:
  random_identity_generator();

  /// Create a generator with a known seed, the sequence is deterministic.
  explicit random_identity_generator(std::uint64_t seed);

  std::string operator()();

private:
  // std::function<> requires copyable functors, and the engine state must be shared by those copies.
  std::shared_ptr<std::mt19937_64> engine_;
};

} // namespace ballot

#endif // ballot_identity_generator_hpp
