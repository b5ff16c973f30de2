#pragma once

#include "core/common/direction.hpp"
#include "core/common/resource_id.hpp"
#include <array>
#include <map>
#include <string>
#include <vector>

namespace manor {

enum class placement_t { anywhere, edge };

enum class enter_effect_kind_t { none, start, goal, coins, food, maybe_gem, spawn };

enum class draft_effect_kind_t { none, gem, deck_add, grant };

struct enter_effect_t {
  enter_effect_kind_t kind = enter_effect_kind_t::none;
  int amount = 0;          // coins / food
  float chance = 0.0f;     // maybe_gem
  resource_id_t fixture;   // spawn
};

struct draft_effect_t {
  draft_effect_kind_t kind = draft_effect_kind_t::none;
  // deck_add: copies of rooms matching either a colour or a single room
  std::string color;
  resource_id_t room;
  int count = 0;
  // grant: permanent item
  resource_id_t item;
};

/**
 * @brief Static data for one kind of room, loaded from assets/rooms.
 */
struct room_definition_t {
  resource_id_t id;
  std::string name;   // e.g. "Entrance Hall"
  std::string image;  // file name under images/, may not exist

  std::array<bool, 4> doors{}; // indexed by direction_t

  int gem_cost = 0;
  int rarity = 0; // 0 common .. 3 rare
  placement_t placement = placement_t::anywhere;
  std::string color = "blue";
  bool draftable = true;

  enter_effect_t on_enter;
  draft_effect_t on_draft;

  auto has_door(direction_t dir) const -> bool { return doors[index_of(dir)]; }

  // 1 / 3^rarity
  auto draft_weight() const -> double;

  // Copies placed in a fresh deck
  auto deck_copies() const -> int;
};

/**
 * @brief Registry for all room definitions.
 */
class room_registry_t {
public:
  static auto get() -> room_registry_t &;

  room_registry_t(const room_registry_t &) = delete;
  auto operator=(const room_registry_t &) -> room_registry_t & = delete;

  auto register_room(const room_definition_t &definition) -> void;
  auto get_room(const resource_id_t &id) const -> const room_definition_t *;
  auto get_all_rooms() const
      -> const std::map<resource_id_t, room_definition_t> &;

  // First room whose on-enter effect has the given kind
  auto find_by_enter_effect(enter_effect_kind_t kind) const
      -> const room_definition_t *;
  auto find_by_color(const std::string &color) const
      -> std::vector<const room_definition_t *>;

  auto clear() -> void;

private:
  room_registry_t() = default;
  std::map<resource_id_t, room_definition_t> m_room_map;
};

} // namespace manor
