#include "core/game/game_state.hpp"
#include "core/content/fixture.hpp"
#include "core/content/item.hpp"
#include <iostream>
#include <iterator>
#include <stdexcept>

namespace manor
{

static auto item_name(const resource_id_t &id) -> std::string
{
  const auto *def = item_registry_t::get().get_item(id);
  return def ? def->name : id.get_path();
}

auto to_string(game_mode_t mode) -> std::string
{
  switch (mode)
  {
  case game_mode_t::exploring:
    return "exploring";
  case game_mode_t::drafting:
    return "drafting";
  case game_mode_t::won:
    return "won";
  case game_mode_t::lost:
    return "lost";
  }
  return "unknown";
}

game_state_t::game_state_t(const game_config_t &config)
    : m_config(config), m_rng(config.seed), m_mansion(config.rows, config.cols), m_drafter(m_rng),
      m_inventory(inventory_t::from_registry())
{
  const auto *entrance = room_registry_t::get().find_by_enter_effect(enter_effect_kind_t::start);
  if (!entrance)
    throw std::runtime_error("no entrance room registered (a room with onEnter type 'start')");

  m_drafter.build_deck();

  m_player = m_mansion.entrance_position();
  m_mansion.place(*entrance, m_player);
  m_mansion.get_cell(m_player).visited = true;

  m_message = "Welcome to the manor.";
  std::cout << "New game, seed " << m_rng.get_seed() << ", deck of " << m_drafter.get_deck().size() << " rooms"
            << std::endl;
}

auto game_state_t::can_pass(const cell_t &target, direction_t dir) const -> bool
{
  const auto &here = m_mansion.get_cell(m_player);
  return here.room && here.room->has_door(dir) && target.room && target.room->has_door(opposite(dir));
}

auto game_state_t::move(direction_t dir) -> bool
{
  if (m_mode != game_mode_t::exploring)
    return false;

  grid_pos_t target = step(m_player, dir);
  if (!m_mansion.in_bounds(target))
  {
    m_message = "A wall. Can't go there.";
    return false;
  }

  const auto &here = m_mansion.get_cell(m_player);
  if (!here.room || !here.room->has_door(dir))
  {
    m_message = "There is no door on that side.";
    return false;
  }

  auto &cell = m_mansion.get_cell(target);
  if (!cell.is_placed())
    return start_draft(target, dir);

  if (!can_pass(cell, dir))
  {
    m_message = "There is no door on that side.";
    return false;
  }

  if (m_inventory.count(items::STEPS) <= 0)
  {
    m_message = "No steps left! You can't move.";
    return false;
  }

  std::string door_message;
  int lock = cell.lock_level(opposite(dir));
  if (lock > LOCK_OPEN)
  {
    if (lock == LOCK_LOCKED && m_inventory.has(items::LOCKPICK_KIT))
    {
      door_message = "Picked the lock.";
    }
    else if (m_inventory.remove(items::KEYS, 1))
    {
      door_message = "Used a key to open the door.";
    }
    else
    {
      m_message = "The door is locked and you have no key or kit.";
      return false;
    }
    m_mansion.set_door_lock(m_player, dir, LOCK_OPEN);
  }

  m_inventory.remove(items::STEPS, 1);
  enter_cell(target);
  if (!door_message.empty())
    m_message = door_message + " " + m_message;
  return true;
}

auto game_state_t::start_draft(grid_pos_t target, direction_t dir) -> bool
{
  draft_t draft;
  draft.target = target;
  draft.from_dir = dir;
  draft.candidates = m_drafter.draw(m_mansion, target, dir, m_inventory.count(items::GEMS), m_config.draft_size);
  if (draft.candidates.empty())
  {
    m_message = "No room fits there.";
    return false;
  }
  // A draft of paid rooms only could never be closed
  if (!m_drafter.has_affordable(m_mansion, target, dir, m_inventory.count(items::GEMS)))
  {
    m_message = "You can't afford any room that fits there.";
    return false;
  }

  m_draft = std::move(draft);
  m_mode = game_mode_t::drafting;
  m_message = "Choose a room (ENTER) or press R to redraw (spend a die).";
  return false;
}

auto game_state_t::select_previous() -> void
{
  if (m_draft && m_draft->selection > 0)
    --m_draft->selection;
}

auto game_state_t::select_next() -> void
{
  if (m_draft && m_draft->selection + 1 < static_cast<int>(m_draft->candidates.size()))
    ++m_draft->selection;
}

auto game_state_t::confirm() -> bool
{
  if (m_mode != game_mode_t::drafting || !m_draft)
    return false;

  const room_definition_t &choice = *m_draft->candidates[static_cast<size_t>(m_draft->selection)];
  if (choice.gem_cost > 0 && !m_inventory.remove(items::GEMS, choice.gem_cost))
  {
    m_message = "Not enough gems to choose that room.";
    return false;
  }

  grid_pos_t target = m_draft->target;
  direction_t dir = m_draft->from_dir;

  m_mansion.place(choice, target);
  int lock = m_drafter.roll_lock_level(target.row, m_mansion.get_rows());
  m_mansion.set_door_lock(m_player, dir, lock);
  m_drafter.remove_one(choice);

  std::string draft_message = apply_draft_effect(choice);
  if (draft_message.empty())
    draft_message = "Placed " + choice.name + ".";

  m_draft.reset();
  m_mode = game_mode_t::exploring;

  bool moved = move(dir);
  m_message = draft_message + " " + m_message;
  return moved;
}

auto game_state_t::redraw() -> void
{
  auto candidates =
      m_drafter.draw(m_mansion, m_draft->target, m_draft->from_dir, m_inventory.count(items::GEMS), m_config.draft_size);
  if (!candidates.empty())
    m_draft->candidates = std::move(candidates);
  m_draft->selection = 0;
}

auto game_state_t::reroll() -> bool
{
  if (m_inventory.count(items::DICE) <= 0)
  {
    m_message = "No dice to spend.";
    return false;
  }
  if (m_mode != game_mode_t::drafting || !m_draft)
  {
    m_message = "Nothing to redraw.";
    return false;
  }

  m_inventory.remove(items::DICE, 1);
  redraw();
  m_message = "Redrew the rooms (spent a die).";
  return true;
}

auto game_state_t::interact() -> bool
{
  if (m_mode != game_mode_t::exploring)
    return false;

  auto &cell = m_mansion.get_cell(m_player);
  if (!cell.fixture || !cell.fixture->definition)
  {
    m_message = "Nothing to interact with.";
    return false;
  }

  auto &fixture = *cell.fixture;
  const auto &def = *fixture.definition;
  if (fixture.opened)
  {
    m_message = def.empty_message;
    return false;
  }

  std::string how;
  for (const auto &method : def.unlock)
  {
    if (method.kind == unlock_kind_t::key && m_inventory.remove(items::KEYS, 1))
    {
      how = "Used a key.";
      break;
    }
    if (method.kind == unlock_kind_t::item && m_inventory.has(method.item_id))
    {
      how = "Used the " + item_name(method.item_id) + ".";
      break;
    }
  }
  if (how.empty() && !def.unlock.empty())
  {
    m_message = def.locked_message;
    return false;
  }

  fixture.opened = true;
  m_message = how.empty() ? def.opened_message : how + " " + def.opened_message;
  for (const auto &loot : roll_loot(def.loot, m_rng))
  {
    m_inventory.give(loot.item_id, loot.amount);
    m_message += " -> +" + std::to_string(loot.amount) + " " + item_name(loot.item_id);
  }
  return true;
}

auto game_state_t::enter_cell(grid_pos_t pos) -> void
{
  m_player = pos;
  auto &cell = m_mansion.get_cell(pos);
  bool first_visit = !cell.visited;
  cell.visited = true;

  apply_enter_effect(cell, first_visit);
  if (m_mode != game_mode_t::won)
    random_find();
}

auto game_state_t::apply_enter_effect(cell_t &cell, bool first_visit) -> void
{
  const auto &room = *cell.room;
  const auto &effect = room.on_enter;
  m_message = "Entered " + room.name + ".";

  switch (effect.kind)
  {
  case enter_effect_kind_t::none:
    break;
  case enter_effect_kind_t::start:
    m_message = "Back at the " + room.name + ".";
    break;
  case enter_effect_kind_t::goal:
    m_message = "You reached the " + room.name + "! You win!";
    m_mode = game_mode_t::won;
    std::cout << "Game won, " << m_mansion.placed_count() << " rooms drafted" << std::endl;
    break;
  case enter_effect_kind_t::coins:
    if (first_visit)
    {
      m_inventory.add(items::COINS, effect.amount);
      m_message = "Found " + std::to_string(effect.amount) + " coins!";
    }
    break;
  case enter_effect_kind_t::food:
    if (first_visit)
    {
      m_inventory.add(items::STEPS, effect.amount);
      m_message = "Ate food and regained " + std::to_string(effect.amount) + " steps!";
    }
    break;
  case enter_effect_kind_t::maybe_gem:
    if (first_visit && m_rng.chance(effect.chance))
    {
      m_inventory.add(items::GEMS, 1);
      m_message = "Found a gem in the " + room.name + "!";
    }
    break;
  case enter_effect_kind_t::spawn:
    if (cell.has_unopened_fixture())
    {
      m_message = "There is still " + cell.fixture->definition->label + " here.";
    }
    else if (!cell.fixture)
    {
      const auto *def = fixture_registry_t::get().get_fixture(effect.fixture);
      if (!def)
      {
        std::cerr << "Warning: Room " << room.id << " spawns unknown fixture " << effect.fixture << std::endl;
        break;
      }
      cell.fixture = fixture_instance_t{def, false};
      m_message = "You found " + def->label + "! Press E to interact.";
    }
    break;
  }
}

auto game_state_t::apply_draft_effect(const room_definition_t &room) -> std::string
{
  const auto &effect = room.on_draft;
  switch (effect.kind)
  {
  case draft_effect_kind_t::none:
    return "";
  case draft_effect_kind_t::gem:
    m_inventory.add(items::GEMS, 1);
    return "You drafted the " + room.name + " and found a gem!";
  case draft_effect_kind_t::deck_add:
  {
    std::vector<const room_definition_t *> matches;
    if (!effect.room.empty())
    {
      if (const auto *r = room_registry_t::get().get_room(effect.room))
        matches.push_back(r);
    }
    else
    {
      matches = room_registry_t::get().find_by_color(effect.color);
    }
    if (matches.empty())
      return "";
    for (int i = 0; i < effect.count; ++i)
      m_drafter.add_copies(*matches[m_rng.index(matches.size())], 1);
    return "The " + room.name + " makes " + (effect.color.empty() ? matches.front()->name : effect.color) +
           " rooms more common.";
  }
  case draft_effect_kind_t::grant:
    m_inventory.give(effect.item, 1);
    return "The " + room.name + " gives you the " + item_name(effect.item) + ".";
  }
  return "";
}

auto game_state_t::random_find() -> void
{
  float chance = m_config.find_chance;
  if (m_inventory.has(items::RABBIT_FOOT))
    chance += m_config.rabbit_foot_bonus;
  if (m_inventory.has(items::METAL_DETECTOR))
    chance += m_config.metal_detector_bonus;
  if (!m_rng.chance(chance))
    return;

  struct find_t
  {
    const resource_id_t &item;
    int amount;
    const char *text;
  };
  static const find_t finds[] = {
      {items::GEMS, 1, " Found 1 gem."},       {items::KEYS, 1, " Found 1 key."},
      {items::DICE, 1, " Found 1 die."},       {items::COINS, 5, " Found some coins."},
      {items::STEPS, 3, " Found 3 steps."},
  };
  const auto &found = finds[m_rng.index(std::size(finds))];
  m_inventory.add(found.item, found.amount);
  m_message += found.text;
}

auto game_state_t::has_legal_moves() const -> bool
{
  const auto &here = m_mansion.get_cell(m_player);
  if (!here.room)
    return false;

  int gems = m_inventory.count(items::GEMS);
  int keys = m_inventory.count(items::KEYS);
  bool has_kit = m_inventory.has(items::LOCKPICK_KIT);

  for (auto dir : ALL_DIRECTIONS)
  {
    grid_pos_t target = step(m_player, dir);
    if (!m_mansion.in_bounds(target) || !here.room->has_door(dir))
      continue;

    const auto &cell = m_mansion.get_cell(target);
    if (cell.is_placed())
    {
      if (!can_pass(cell, dir))
        continue;
      int lock = cell.lock_level(opposite(dir));
      if (lock == LOCK_OPEN)
        return true;
      if (lock == LOCK_LOCKED && (has_kit || keys > 0))
        return true;
      if (lock == LOCK_DOUBLE && keys > 0)
        return true;
    }
    else if (m_drafter.has_affordable(m_mansion, target, dir, gems))
    {
      return true;
    }
  }
  return false;
}

auto game_state_t::check_end_conditions() -> void
{
  if (is_over())
    return;

  if (m_inventory.count(items::STEPS) <= 0)
  {
    m_message = "You ran out of steps! Game Over.";
    m_mode = game_mode_t::lost;
  }
  else if (m_mode == game_mode_t::exploring && !has_legal_moves())
  {
    m_message = "Stuck: no legal move left. Game Over.";
    m_mode = game_mode_t::lost;
  }

  if (m_mode == game_mode_t::lost)
    std::cout << "Game lost: " << m_message << std::endl;
}

} // namespace manor
