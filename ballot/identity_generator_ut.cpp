#include "ballot/identity_generator.hpp"

#include <gtest/gtest.h>
#include <set>

/**
 * @test Verify that generated identities are non-negative decimal integers.
 */
TEST(identity_generator, format) {
  ballot::random_identity_generator generator;
  for (int i = 0; i != 100; ++i) {
    auto id = generator();
    ASSERT_FALSE(id.empty());
    EXPECT_EQ(id.find_first_not_of("0123456789"), std::string::npos) << "id=" << id;
    EXPECT_LE(id.size(), 19UL) << "id=" << id;
    EXPECT_NO_THROW(std::stoll(id));
  }
}

/**
 * @test Verify that seeded generators are deterministic, and copies share the engine.
 */
TEST(identity_generator, seeded) {
  ballot::random_identity_generator a(42);
  ballot::random_identity_generator b(42);
  EXPECT_EQ(a(), b());
  EXPECT_EQ(a(), b());

  ballot::identity_generator_type f = a;
  std::set<std::string> ids;
  ids.insert(a());
  ids.insert(f());
  ids.insert(a());
  EXPECT_EQ(ids.size(), 3UL);
}
