#include "core/mansion/room_drafter.hpp"
#include <algorithm>
#include <iterator>

namespace manor
{

static auto is_affordable(const room_definition_t &room, int gems) -> bool
{
  return room.gem_cost == 0 || room.gem_cost <= gems;
}

room_drafter_t::room_drafter_t(random_t &rng) : m_rng(rng)
{
}

auto room_drafter_t::build_deck() -> void
{
  m_deck.clear();
  for (const auto &[id, def] : room_registry_t::get().get_all_rooms())
  {
    if (!def.draftable)
      continue;
    for (int i = 0; i < def.deck_copies(); ++i)
      m_deck.push_back(&def);
  }
  m_rng.shuffle(m_deck);
}

auto room_drafter_t::copies_of(const room_definition_t &room) const -> int
{
  return static_cast<int>(std::count(m_deck.begin(), m_deck.end(), &room));
}

auto room_drafter_t::placeable(const mansion_t &mansion, grid_pos_t target, direction_t from_dir) const
    -> std::vector<const room_definition_t *>
{
  std::vector<const room_definition_t *> pool;
  for (const auto *room : m_deck)
  {
    if (mansion.can_place(*room, target, from_dir))
      pool.push_back(room);
  }
  return pool;
}

auto room_drafter_t::draw(const mansion_t &mansion, grid_pos_t target, direction_t from_dir, int gems, int count)
    -> std::vector<const room_definition_t *>
{
  auto pool = placeable(mansion, target, from_dir);
  if (pool.empty() || count <= 0)
    return {};

  std::vector<const room_definition_t *> affordable;
  std::copy_if(pool.begin(), pool.end(), std::back_inserter(affordable),
               [gems](const room_definition_t *r) { return is_affordable(*r, gems); });
  if (!affordable.empty())
    pool = std::move(affordable);

  // Collapse copies into one weighted entry per room
  std::vector<const room_definition_t *> rooms;
  std::vector<double> weights;
  for (const auto *room : pool)
  {
    auto it = std::find(rooms.begin(), rooms.end(), room);
    if (it == rooms.end())
    {
      rooms.push_back(room);
      weights.push_back(room->draft_weight());
    }
    else
    {
      weights[static_cast<size_t>(it - rooms.begin())] += room->draft_weight();
    }
  }

  std::vector<const room_definition_t *> picks;
  while (static_cast<int>(picks.size()) < count && !rooms.empty())
  {
    size_t i = m_rng.weighted_index(weights);
    picks.push_back(rooms[i]);
    rooms.erase(rooms.begin() + static_cast<std::ptrdiff_t>(i));
    weights.erase(weights.begin() + static_cast<std::ptrdiff_t>(i));
  }

  // Never leave the player with only paid rooms if a free one fits
  bool any_free = std::any_of(picks.begin(), picks.end(), [](const room_definition_t *r) { return r->gem_cost == 0; });
  if (!any_free)
  {
    std::vector<const room_definition_t *> free_rooms;
    for (const auto *room : pool)
    {
      if (room->gem_cost == 0 && std::find(free_rooms.begin(), free_rooms.end(), room) == free_rooms.end())
        free_rooms.push_back(room);
    }
    if (!free_rooms.empty())
      picks.back() = free_rooms[m_rng.index(free_rooms.size())];
  }

  return picks;
}

auto room_drafter_t::has_affordable(const mansion_t &mansion, grid_pos_t target, direction_t from_dir,
                                    int gems) const -> bool
{
  for (const auto *room : m_deck)
  {
    if (is_affordable(*room, gems) && mansion.can_place(*room, target, from_dir))
      return true;
  }
  return false;
}

auto room_drafter_t::remove_one(const room_definition_t &room) -> bool
{
  auto it = std::find(m_deck.begin(), m_deck.end(), &room);
  if (it == m_deck.end())
    return false;
  m_deck.erase(it);
  return true;
}

auto room_drafter_t::add_copies(const room_definition_t &room, int count) -> void
{
  for (int i = 0; i < count; ++i)
    m_deck.push_back(&room);
}

auto room_drafter_t::roll_lock_level(int row, int rows) -> int
{
  if (rows <= 1 || row >= rows - 1)
    return LOCK_OPEN;
  if (row <= 0)
    return LOCK_DOUBLE;

  // 0 at the bottom row, 1 at the top row
  double t = static_cast<double>(rows - 1 - row) / static_cast<double>(rows - 1);
  double p2 = 0.1 + 0.7 * t;
  double p0 = 0.7 - 0.6 * t;
  double p1 = std::max(0.0, 1.0 - p0 - p2);

  double r = m_rng.next01();
  if (r < p0)
    return LOCK_OPEN;
  if (r < p0 + p1)
    return LOCK_LOCKED;
  return LOCK_DOUBLE;
}

} // namespace manor
