#pragma once

#include "core/common/random.hpp"
#include "core/content/room.hpp"
#include "core/mansion/mansion.hpp"
#include <vector>

namespace manor
{

/**
 * @brief The deck of rooms still available for drafting, and the draw rules.
 *
 * A room appears in the deck once per copy; drafting removes one copy. Draws
 * offer distinct rooms, each weighted by its rarity weight times its copies.
 */
class room_drafter_t
{
public:
  explicit room_drafter_t(random_t &rng);

  // Every draftable registered room, deck_copies() times, shuffled
  auto build_deck() -> void;

  auto get_deck() const -> const std::vector<const room_definition_t *> &
  {
    return m_deck;
  }
  auto copies_of(const room_definition_t &room) const -> int;

  // Deck entries that may go into target, entered through from_dir
  auto placeable(const mansion_t &mansion, grid_pos_t target, direction_t from_dir) const
      -> std::vector<const room_definition_t *>;

  // Up to `count` distinct candidates. Affordable rooms are preferred when
  // there are any, and at least one free room is offered when the pool has one.
  auto draw(const mansion_t &mansion, grid_pos_t target, direction_t from_dir, int gems, int count)
      -> std::vector<const room_definition_t *>;

  // Some placeable room costs nothing or at most `gems`
  auto has_affordable(const mansion_t &mansion, grid_pos_t target, direction_t from_dir, int gems) const -> bool;

  // Removes one copy; false when the room is not in the deck
  auto remove_one(const room_definition_t &room) -> bool;
  auto add_copies(const room_definition_t &room, int count) -> void;

  // Lock level of a door leading into `row`: 0 on the bottom row, 2 on the top
  // row, skewed toward heavier locks further up in between.
  auto roll_lock_level(int row, int rows) -> int;

private:
  random_t &m_rng;
  std::vector<const room_definition_t *> m_deck;
};

} // namespace manor
