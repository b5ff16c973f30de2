#include "core/common/direction.hpp"

namespace manor
{

auto to_string(direction_t dir) -> std::string
{
  switch (dir)
  {
  case direction_t::up:
    return "up";
  case direction_t::down:
    return "down";
  case direction_t::left:
    return "left";
  case direction_t::right:
    return "right";
  }
  return "unknown";
}

auto parse_direction(std::string_view name) -> std::optional<direction_t>
{
  for (auto dir : ALL_DIRECTIONS)
  {
    if (to_string(dir) == name)
      return dir;
  }
  return std::nullopt;
}

} // namespace manor
