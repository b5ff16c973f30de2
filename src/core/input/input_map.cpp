#include "core/input/input_map.hpp"
#include "core/game/game_state.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>

namespace manor
{

static const std::pair<action_t, const char *> ACTION_NAMES[] = {
    {action_t::move_up, "move_up"},
    {action_t::move_down, "move_down"},
    {action_t::move_left, "move_left"},
    {action_t::move_right, "move_right"},
    {action_t::interact, "interact"},
    {action_t::confirm, "confirm"},
    {action_t::reroll, "reroll"},
    {action_t::toggle_inventory, "toggle_inventory"},
    {action_t::quit, "quit"},
};

static auto normalize(const std::string &key_name) -> std::string
{
  std::string out = key_name;
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return out;
}

auto to_string(action_t action) -> std::string
{
  for (const auto &[a, name] : ACTION_NAMES)
  {
    if (a == action)
      return name;
  }
  return "unknown";
}

auto parse_action(const std::string &name) -> std::optional<action_t>
{
  for (const auto &[a, n] : ACTION_NAMES)
  {
    if (name == n)
      return a;
  }
  return std::nullopt;
}

input_map_t::input_map_t()
{
  bind("Z", action_t::move_up);
  bind("UP", action_t::move_up);
  bind("S", action_t::move_down);
  bind("DOWN", action_t::move_down);
  bind("Q", action_t::move_left);
  bind("LEFT", action_t::move_left);
  bind("D", action_t::move_right);
  bind("RIGHT", action_t::move_right);
  bind("SPACE", action_t::interact);
  bind("E", action_t::interact);
  bind("ENTER", action_t::confirm);
  bind("R", action_t::reroll);
  bind("I", action_t::toggle_inventory);
  bind("ESCAPE", action_t::quit);
}

auto input_map_t::apply_overrides(const std::map<std::string, std::vector<std::string>> &bindings) -> void
{
  for (const auto &[action_name, keys] : bindings)
  {
    auto action = parse_action(action_name);
    if (!action)
    {
      std::cerr << "Warning: Unknown action in key bindings: " << action_name << std::endl;
      continue;
    }
    unbind_action(*action);
    for (const auto &key : keys)
      bind(key, *action);
  }
}

auto input_map_t::bind(const std::string &key_name, action_t action) -> void
{
  m_bindings[normalize(key_name)] = action;
}

auto input_map_t::unbind_action(action_t action) -> void
{
  for (auto it = m_bindings.begin(); it != m_bindings.end();)
  {
    if (it->second == action)
      it = m_bindings.erase(it);
    else
      ++it;
  }
}

auto input_map_t::lookup(const std::string &key_name) const -> std::optional<action_t>
{
  auto it = m_bindings.find(normalize(key_name));
  if (it == m_bindings.end())
    return std::nullopt;
  return it->second;
}

auto input_map_t::keys_for(action_t action) const -> std::vector<std::string>
{
  std::vector<std::string> keys;
  for (const auto &[key, a] : m_bindings)
  {
    if (a == action)
      keys.push_back(key);
  }
  return keys;
}

auto input_map_t::dispatch(action_t action, game_state_t &game) -> bool
{
  if (action == action_t::quit)
  {
    game.quit();
    return true;
  }
  if (action == action_t::toggle_inventory)
  {
    game.toggle_inventory();
    return true;
  }
  if (game.is_over())
    return false;

  if (game.get_mode() == game_mode_t::drafting)
  {
    switch (action)
    {
    case action_t::move_left:
      game.select_previous();
      return true;
    case action_t::move_right:
      game.select_next();
      return true;
    case action_t::confirm:
      return game.confirm();
    case action_t::reroll:
      return game.reroll();
    default:
      return false;
    }
  }

  switch (action)
  {
  case action_t::move_up:
    return game.move(direction_t::up);
  case action_t::move_down:
    return game.move(direction_t::down);
  case action_t::move_left:
    return game.move(direction_t::left);
  case action_t::move_right:
    return game.move(direction_t::right);
  case action_t::interact:
    return game.interact();
  case action_t::reroll:
    return game.reroll();
  default:
    return false;
  }
}

auto input_map_t::handle_key(const std::string &key_name, game_state_t &game) const -> bool
{
  auto action = lookup(key_name);
  if (!action)
    return false;
  return dispatch(*action, game);
}

} // namespace manor
