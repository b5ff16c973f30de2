#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace manor
{

class game_state_t;

enum class action_t
{
  move_up,
  move_down,
  move_left,
  move_right,
  interact,
  confirm,
  reroll,
  toggle_inventory,
  quit
};

auto to_string(action_t action) -> std::string;
auto parse_action(const std::string &name) -> std::optional<action_t>;

/**
 * @brief Key name -> action table. Key names are what the player sees on the
 * keycap ("Z", "Q", "ENTER", "UP"), so the AZERTY defaults follow the active
 * keyboard layout.
 */
class input_map_t
{
public:
  // Default AZERTY bindings
  input_map_t();

  // Replaces the keys of each listed action; unknown action names are reported and skipped
  auto apply_overrides(const std::map<std::string, std::vector<std::string>> &bindings) -> void;

  auto bind(const std::string &key_name, action_t action) -> void;
  auto unbind_action(action_t action) -> void;
  auto lookup(const std::string &key_name) const -> std::optional<action_t>;
  auto keys_for(action_t action) const -> std::vector<std::string>;

  // Routes an action to the game. While drafting, left/right move the
  // selection instead of the player. Returns true when the action applied.
  static auto dispatch(action_t action, game_state_t &game) -> bool;

  auto handle_key(const std::string &key_name, game_state_t &game) const -> bool;

private:
  std::map<std::string, action_t> m_bindings;
};

} // namespace manor
