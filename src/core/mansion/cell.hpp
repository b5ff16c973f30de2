#pragma once

#include "core/common/direction.hpp"
#include "core/content/fixture.hpp"
#include "core/content/room.hpp"
#include <array>
#include <optional>

namespace manor
{

struct grid_pos_t
{
  int row = 0;
  int col = 0;

  auto operator==(const grid_pos_t &other) const -> bool
  {
    return row == other.row && col == other.col;
  }
  auto operator!=(const grid_pos_t &other) const -> bool
  {
    return !(*this == other);
  }
};

constexpr auto step(grid_pos_t pos, direction_t dir) -> grid_pos_t
{
  auto off = offset_of(dir);
  return {pos.row + off.row, pos.col + off.col};
}

// Door lock levels
constexpr int LOCK_OPEN = 0;
constexpr int LOCK_LOCKED = 1;
constexpr int LOCK_DOUBLE = 2;

/**
 * @brief One square of the mansion: empty until a room is drafted into it.
 */
struct cell_t
{
  const room_definition_t *room = nullptr;

  // Lock level per side, set when the connecting room is drafted
  std::array<std::optional<int>, 4> doors{};

  std::optional<fixture_instance_t> fixture;
  bool visited = false;

  auto is_placed() const -> bool
  {
    return room != nullptr;
  }

  // Unset doors count as open
  auto lock_level(direction_t dir) const -> int
  {
    return doors[index_of(dir)].value_or(LOCK_OPEN);
  }

  auto has_unopened_fixture() const -> bool
  {
    return fixture && !fixture->opened;
  }
};

} // namespace manor
