#pragma once

#include <algorithm>
#include <cstdint>
#include <optional>
#include <random>
#include <vector>

namespace manor
{

/**
 * @brief Seeded gameplay RNG. Every random decision of a session goes through
 * one instance so that a seed replays the same mansion.
 */
class random_t
{
public:
  // No seed: draw one from std::random_device
  explicit random_t(std::optional<std::uint32_t> seed = std::nullopt);

  auto get_seed() const -> std::uint32_t
  {
    return m_seed;
  }

  // [0, 1)
  auto next01() -> double;
  // true with probability p (p <= 0 never, p >= 1 always)
  auto chance(double p) -> bool;
  // inclusive
  auto uniform(int lo, int hi) -> int;
  // [0, n), n must be > 0
  auto index(size_t n) -> size_t;
  // Index picked proportionally to weights; uniform when all weights are zero.
  auto weighted_index(const std::vector<double> &weights) -> size_t;

  template <typename T>
  auto shuffle(std::vector<T> &items) -> void
  {
    std::shuffle(items.begin(), items.end(), m_engine);
  }

private:
  std::uint32_t m_seed;
  std::mt19937 m_engine;
};

} // namespace manor
