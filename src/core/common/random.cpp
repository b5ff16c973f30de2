#include "core/common/random.hpp"
#include <numeric>
#include <stdexcept>

namespace manor
{

random_t::random_t(std::optional<std::uint32_t> seed)
    : m_seed(seed ? *seed : std::random_device{}()), m_engine(m_seed)
{
}

auto random_t::next01() -> double
{
  return std::uniform_real_distribution<double>(0.0, 1.0)(m_engine);
}

auto random_t::chance(double p) -> bool
{
  if (p <= 0.0)
    return false;
  if (p >= 1.0)
    return true;
  return next01() < p;
}

auto random_t::uniform(int lo, int hi) -> int
{
  return std::uniform_int_distribution<int>(lo, hi)(m_engine);
}

auto random_t::index(size_t n) -> size_t
{
  if (n == 0)
    throw std::invalid_argument("random_t::index called with an empty range");
  return std::uniform_int_distribution<size_t>(0, n - 1)(m_engine);
}

auto random_t::weighted_index(const std::vector<double> &weights) -> size_t
{
  double total = std::accumulate(weights.begin(), weights.end(), 0.0);
  if (total <= 0.0)
    return index(weights.size());

  double r = next01() * total;
  double cumulative = 0.0;
  for (size_t i = 0; i < weights.size(); ++i)
  {
    cumulative += weights[i];
    if (r < cumulative)
      return i;
  }
  // Rounding can leave r == total; the last positive weight wins.
  for (size_t i = weights.size(); i-- > 0;)
  {
    if (weights[i] > 0.0)
      return i;
  }
  return weights.size() - 1;
}

} // namespace manor
