#include "core/content/fixture.hpp"
#include "core/content/item.hpp"
#include <iostream>

namespace manor {

auto roll_loot(const std::vector<loot_entry_t> &table, random_t &rng)
    -> std::vector<loot_entry_t> {
  std::vector<loot_entry_t> out;
  for (const auto &entry : table) {
    if (rng.chance(entry.chance)) {
      out.push_back(entry);
    }
  }
  if (out.empty()) {
    out.push_back({items::COINS, CONSOLATION_COINS, 1.0f});
  }
  return out;
}

auto fixture_registry_t::get() -> fixture_registry_t & {
  static fixture_registry_t instance;
  return instance;
}

auto fixture_registry_t::register_fixture(
    const fixture_definition_t &definition) -> void {
  if (m_fixture_map.find(definition.id) != m_fixture_map.end()) {
    std::cerr << "Warning: Overwriting fixture definition for "
              << definition.id << std::endl;
  }
  m_fixture_map[definition.id] = definition;
}

auto fixture_registry_t::get_fixture(const resource_id_t &id) const
    -> const fixture_definition_t * {
  auto it = m_fixture_map.find(id);
  if (it != m_fixture_map.end()) {
    return &it->second;
  }
  return nullptr;
}

auto fixture_registry_t::get_all_fixtures() const
    -> const std::map<resource_id_t, fixture_definition_t> & {
  return m_fixture_map;
}

auto fixture_registry_t::clear() -> void { m_fixture_map.clear(); }

} // namespace manor
