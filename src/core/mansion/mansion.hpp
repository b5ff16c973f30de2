#pragma once

#include "core/mansion/cell.hpp"
#include <vector>

namespace manor
{

/**
 * @brief The rows x cols grid of cells. Row 0 is the top (the far end of the
 * mansion), the entrance sits on the bottom row.
 */
class mansion_t
{
public:
  mansion_t(int rows, int cols);

  auto get_rows() const -> int
  {
    return m_rows;
  }
  auto get_cols() const -> int
  {
    return m_cols;
  }

  auto in_bounds(grid_pos_t pos) const -> bool;
  auto is_edge(grid_pos_t pos) const -> bool;

  // Bottom row, middle column
  auto entrance_position() const -> grid_pos_t;

  // Throws std::out_of_range outside the grid
  auto get_cell(grid_pos_t pos) -> cell_t &;
  auto get_cell(grid_pos_t pos) const -> const cell_t &;

  // Placement rules for drafting `room` into `pos`, entered through `from_dir`
  // (the direction the player moves to reach pos):
  //  - the room has a door back toward the origin
  //  - none of its doors leads off the grid
  //  - doors agree with every placed neighbour, in both directions
  //  - edge rooms only go on the border
  auto can_place(const room_definition_t &room, grid_pos_t pos, direction_t from_dir) const -> bool;

  auto place(const room_definition_t &room, grid_pos_t pos) -> void;

  // Sets the lock of the door between pos and its neighbour in dir, on both sides
  auto set_door_lock(grid_pos_t pos, direction_t dir, int level) -> void;

  auto placed_count() const -> int;

private:
  auto index(grid_pos_t pos) const -> size_t;

  int m_rows;
  int m_cols;
  std::vector<cell_t> m_cells;
};

} // namespace manor
