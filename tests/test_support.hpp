#pragma once

// Content helpers shared by the test files. Each helper registers straight
// into the singleton registries, so tests start with reset_content().

#include "core/content/fixture.hpp"
#include "core/content/item.hpp"
#include "core/content/room.hpp"
#include "core/game/game_config.hpp"
#include <initializer_list>
#include <string>

namespace manor::test
{

inline auto reset_content() -> void
{
  room_registry_t::get().clear();
  item_registry_t::get().clear();
  fixture_registry_t::get().clear();
}

inline auto register_item(const char *code, item_kind_t kind, int start, int order) -> void
{
  item_definition_t def;
  def.id = resource_id_t(code);
  def.name = code;
  def.kind = kind;
  def.starting_amount = start;
  def.order = order;
  item_registry_t::get().register_item(def);
}

// The stock items with the usual starting amounts
inline auto register_default_items() -> void
{
  register_item("steps", item_kind_t::consumable, 70, 0);
  register_item("coins", item_kind_t::consumable, 0, 1);
  register_item("gems", item_kind_t::consumable, 2, 2);
  register_item("keys", item_kind_t::consumable, 0, 3);
  register_item("dice", item_kind_t::consumable, 0, 4);
  register_item("shovel", item_kind_t::permanent, 0, 5);
  register_item("hammer", item_kind_t::permanent, 0, 6);
  register_item("lockpick_kit", item_kind_t::permanent, 0, 7);
  register_item("metal_detector", item_kind_t::permanent, 0, 8);
  register_item("rabbit_foot", item_kind_t::permanent, 0, 9);
}

inline auto make_room(const std::string &name, std::initializer_list<direction_t> doors, int cost = 0,
                      int rarity = 0) -> room_definition_t
{
  room_definition_t def;
  def.id = resource_id_t::from_name(name);
  def.name = name;
  def.image = def.id.get_path() + ".png";
  for (auto dir : doors)
    def.doors[index_of(dir)] = true;
  def.gem_cost = cost;
  def.rarity = rarity;
  return def;
}

inline auto register_room(const room_definition_t &def) -> const room_definition_t *
{
  room_registry_t::get().register_room(def);
  return room_registry_t::get().get_room(def.id);
}

// Entrance with a single door up, never drafted
inline auto register_entrance() -> const room_definition_t *
{
  auto def = make_room("Entrance Hall", {direction_t::up});
  def.draftable = false;
  def.on_enter.kind = enter_effect_kind_t::start;
  return register_room(def);
}

inline auto register_chest(float chance = 1.0f) -> const fixture_definition_t *
{
  fixture_definition_t def;
  def.id = resource_id_t("chest");
  def.label = "a chest";
  def.badge = "[C]";
  def.unlock = {{unlock_kind_t::key, {}}, {unlock_kind_t::item, resource_id_t("hammer")}};
  def.loot = {{resource_id_t("coins"), 15, chance}};
  def.opened_message = "Chest opened";
  def.empty_message = "The chest is empty.";
  def.locked_message = "A chest is here. You need a key or the hammer.";
  fixture_registry_t::get().register_fixture(def);
  return fixture_registry_t::get().get_fixture(def.id);
}

// 2 x 3 grid: the entrance is at (1, 1) and every door into the top row
// rolls a double lock, so outcomes do not depend on the seed
inline auto small_config() -> game_config_t
{
  game_config_t config;
  config.rows = 2;
  config.cols = 3;
  config.seed = 42u;
  config.find_chance = 0.0f;
  config.rabbit_foot_bonus = 0.0f;
  config.metal_detector_bonus = 0.0f;
  return config;
}

} // namespace manor::test
