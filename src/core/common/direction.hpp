#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace manor
{

enum class direction_t
{
  up = 0,
  down,
  left,
  right
};

constexpr std::array<direction_t, 4> ALL_DIRECTIONS = {direction_t::up, direction_t::down, direction_t::left,
                                                       direction_t::right};

struct grid_offset_t
{
  int row;
  int col;
};

constexpr auto opposite(direction_t dir) -> direction_t
{
  switch (dir)
  {
  case direction_t::up:
    return direction_t::down;
  case direction_t::down:
    return direction_t::up;
  case direction_t::left:
    return direction_t::right;
  case direction_t::right:
    return direction_t::left;
  }
  return direction_t::up;
}

// Rows grow downward: row 0 is the top of the mansion.
constexpr auto offset_of(direction_t dir) -> grid_offset_t
{
  switch (dir)
  {
  case direction_t::up:
    return {-1, 0};
  case direction_t::down:
    return {1, 0};
  case direction_t::left:
    return {0, -1};
  case direction_t::right:
    return {0, 1};
  }
  return {0, 0};
}

constexpr auto index_of(direction_t dir) -> size_t
{
  return static_cast<size_t>(dir);
}

auto to_string(direction_t dir) -> std::string;
auto parse_direction(std::string_view name) -> std::optional<direction_t>;

} // namespace manor
