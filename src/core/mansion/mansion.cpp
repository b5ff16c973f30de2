#include "core/mansion/mansion.hpp"
#include <stdexcept>
#include <string>

namespace manor
{

mansion_t::mansion_t(int rows, int cols) : m_rows(rows), m_cols(cols)
{
  if (rows <= 0 || cols <= 0)
    throw std::invalid_argument("mansion size must be positive");
  m_cells.resize(static_cast<size_t>(rows) * cols);
}

auto mansion_t::in_bounds(grid_pos_t pos) const -> bool
{
  return pos.row >= 0 && pos.row < m_rows && pos.col >= 0 && pos.col < m_cols;
}

auto mansion_t::is_edge(grid_pos_t pos) const -> bool
{
  return pos.row == 0 || pos.row == m_rows - 1 || pos.col == 0 || pos.col == m_cols - 1;
}

auto mansion_t::entrance_position() const -> grid_pos_t
{
  return {m_rows - 1, m_cols / 2};
}

auto mansion_t::index(grid_pos_t pos) const -> size_t
{
  if (!in_bounds(pos))
    throw std::out_of_range("cell " + std::to_string(pos.row) + "," + std::to_string(pos.col) + " outside mansion");
  return static_cast<size_t>(pos.row) * m_cols + pos.col;
}

auto mansion_t::get_cell(grid_pos_t pos) -> cell_t &
{
  return m_cells[index(pos)];
}

auto mansion_t::get_cell(grid_pos_t pos) const -> const cell_t &
{
  return m_cells[index(pos)];
}

auto mansion_t::can_place(const room_definition_t &room, grid_pos_t pos, direction_t from_dir) const -> bool
{
  if (!in_bounds(pos) || get_cell(pos).is_placed())
    return false;

  if (room.placement == placement_t::edge && !is_edge(pos))
    return false;

  // 1. a door back to where the player comes from
  if (!room.has_door(opposite(from_dir)))
    return false;

  for (auto dir : ALL_DIRECTIONS)
  {
    grid_pos_t n = step(pos, dir);

    // 2. no door opens onto the outside
    if (!in_bounds(n))
    {
      if (room.has_door(dir))
        return false;
      continue;
    }

    // 3. agree with placed neighbours
    const auto &neighbour = get_cell(n);
    if (!neighbour.is_placed())
      continue;
    bool ours = room.has_door(dir);
    bool theirs = neighbour.room->has_door(opposite(dir));
    if (ours != theirs)
      return false;
  }
  return true;
}

auto mansion_t::place(const room_definition_t &room, grid_pos_t pos) -> void
{
  get_cell(pos).room = &room;
}

auto mansion_t::set_door_lock(grid_pos_t pos, direction_t dir, int level) -> void
{
  get_cell(pos).doors[index_of(dir)] = level;
  grid_pos_t n = step(pos, dir);
  if (in_bounds(n))
    get_cell(n).doors[index_of(opposite(dir))] = level;
}

auto mansion_t::placed_count() const -> int
{
  int count = 0;
  for (const auto &cell : m_cells)
  {
    if (cell.is_placed())
      ++count;
  }
  return count;
}

} // namespace manor
