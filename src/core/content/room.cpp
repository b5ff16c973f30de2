#include "core/content/room.hpp"
#include <cmath>
#include <iostream>

namespace manor {

auto room_definition_t::draft_weight() const -> double {
  return 1.0 / std::pow(3.0, rarity);
}

auto room_definition_t::deck_copies() const -> int {
  if (rarity >= 3)
    return 1;
  if (rarity == 2)
    return 3;
  if (rarity == 1)
    return 5;
  return 7;
}

auto room_registry_t::get() -> room_registry_t & {
  static room_registry_t instance;
  return instance;
}

auto room_registry_t::register_room(const room_definition_t &definition)
    -> void {
  if (m_room_map.find(definition.id) != m_room_map.end()) {
    std::cerr << "Warning: Overwriting room definition for " << definition.id
              << std::endl;
  }
  m_room_map[definition.id] = definition;
}

auto room_registry_t::get_room(const resource_id_t &id) const
    -> const room_definition_t * {
  auto it = m_room_map.find(id);
  if (it != m_room_map.end()) {
    return &it->second;
  }
  return nullptr;
}

auto room_registry_t::get_all_rooms() const
    -> const std::map<resource_id_t, room_definition_t> & {
  return m_room_map;
}

auto room_registry_t::find_by_enter_effect(enter_effect_kind_t kind) const
    -> const room_definition_t * {
  for (const auto &[id, def] : m_room_map) {
    if (def.on_enter.kind == kind)
      return &def;
  }
  return nullptr;
}

auto room_registry_t::find_by_color(const std::string &color) const
    -> std::vector<const room_definition_t *> {
  std::vector<const room_definition_t *> out;
  for (const auto &[id, def] : m_room_map) {
    if (def.color == color && def.draftable)
      out.push_back(&def);
  }
  return out;
}

auto room_registry_t::clear() -> void { m_room_map.clear(); }

} // namespace manor
