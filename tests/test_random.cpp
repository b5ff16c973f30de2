// tests/test_random.cpp

#include <doctest/doctest.h>

#include "core/common/random.hpp"

#include <stdexcept>

using manor::random_t;

TEST_SUITE("random") {

TEST_CASE("same seed, same sequence") {
  random_t a(7u);
  random_t b(7u);
  for (int i = 0; i < 20; ++i)
    CHECK(a.uniform(0, 1000) == b.uniform(0, 1000));
  CHECK(a.get_seed() == 7u);
}

TEST_CASE("chance is certain at the bounds") {
  random_t rng(1u);
  for (int i = 0; i < 50; ++i) {
    CHECK(rng.chance(1.0));
    CHECK_FALSE(rng.chance(0.0));
  }
}

TEST_CASE("weighted_index skips zero weights") {
  random_t rng(3u);
  for (int i = 0; i < 50; ++i)
    CHECK(rng.weighted_index({0.0, 2.0, 0.0}) == 1);

  // All zero: any index, but in range
  for (int i = 0; i < 20; ++i)
    CHECK(rng.weighted_index({0.0, 0.0, 0.0}) < 3);
}

TEST_CASE("index of an empty range throws") {
  random_t rng(3u);
  CHECK_THROWS_AS(rng.index(0), std::invalid_argument);
  CHECK(rng.index(1) == 0);
}

}
