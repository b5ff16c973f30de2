#pragma once

#include "core/common/random.hpp"
#include "core/game/game_config.hpp"
#include "core/game/inventory.hpp"
#include "core/mansion/mansion.hpp"
#include "core/mansion/room_drafter.hpp"
#include <optional>
#include <string>
#include <vector>

namespace manor
{

enum class game_mode_t
{
  exploring,
  drafting,
  won,
  lost
};

auto to_string(game_mode_t mode) -> std::string;

// Rooms on offer for an empty cell the player tried to walk into
struct draft_t
{
  grid_pos_t target;
  direction_t from_dir = direction_t::up;
  std::vector<const room_definition_t *> candidates;
  int selection = 0;
};

/**
 * @brief All rules of a session: movement through doors, drafting, dice,
 * fixtures and the win/lose checks. Every operation leaves a one-line
 * message for the HUD in get_message().
 *
 * Needs the room, item and fixture registries loaded before construction.
 */
class game_state_t
{
public:
  // Throws std::runtime_error when no room has the "start" on-enter effect
  explicit game_state_t(const game_config_t &config);

  // One step toward dir: walk into a placed room or start drafting an empty cell.
  // Returns true when the player changed cell.
  auto move(direction_t dir) -> bool;

  auto select_previous() -> void;
  auto select_next() -> void;
  // Places the selected candidate and walks into it
  auto confirm() -> bool;
  // Spends one die to redraw the candidates
  auto reroll() -> bool;
  // Opens the fixture of the current cell
  auto interact() -> bool;

  auto toggle_inventory() -> void
  {
    m_inventory_visible = !m_inventory_visible;
  }
  auto quit() -> void
  {
    m_running = false;
  }

  auto has_legal_moves() const -> bool;
  // Out of steps or stuck -> lost. Called once per frame.
  auto check_end_conditions() -> void;

  auto get_mode() const -> game_mode_t
  {
    return m_mode;
  }
  auto is_over() const -> bool
  {
    return m_mode == game_mode_t::won || m_mode == game_mode_t::lost;
  }
  auto is_running() const -> bool
  {
    return m_running;
  }
  auto is_inventory_visible() const -> bool
  {
    return m_inventory_visible;
  }
  auto get_message() const -> const std::string &
  {
    return m_message;
  }
  auto get_player_position() const -> grid_pos_t
  {
    return m_player;
  }
  auto get_draft() const -> const std::optional<draft_t> &
  {
    return m_draft;
  }
  auto get_seed() const -> std::uint32_t
  {
    return m_rng.get_seed();
  }
  auto get_config() const -> const game_config_t &
  {
    return m_config;
  }

  auto get_mansion() -> mansion_t &
  {
    return m_mansion;
  }
  auto get_mansion() const -> const mansion_t &
  {
    return m_mansion;
  }
  auto get_inventory() -> inventory_t &
  {
    return m_inventory;
  }
  auto get_inventory() const -> const inventory_t &
  {
    return m_inventory;
  }
  auto get_drafter() -> room_drafter_t &
  {
    return m_drafter;
  }

private:
  auto start_draft(grid_pos_t target, direction_t dir) -> bool;
  auto redraw() -> void;
  auto enter_cell(grid_pos_t pos) -> void;
  auto apply_enter_effect(cell_t &cell, bool first_visit) -> void;
  auto apply_draft_effect(const room_definition_t &room) -> std::string;
  auto random_find() -> void;
  auto can_pass(const cell_t &target, direction_t dir) const -> bool;

  game_config_t m_config;
  random_t m_rng;
  mansion_t m_mansion;
  room_drafter_t m_drafter;
  inventory_t m_inventory;

  grid_pos_t m_player;
  game_mode_t m_mode = game_mode_t::exploring;
  std::optional<draft_t> m_draft;
  std::string m_message;
  bool m_inventory_visible = true;
  bool m_running = true;
};

} // namespace manor
