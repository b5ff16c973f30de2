#include "core/content/item.hpp"
#include <algorithm>
#include <iostream>

namespace manor {

auto item_registry_t::get() -> item_registry_t & {
  static item_registry_t instance;
  return instance;
}

auto item_registry_t::register_item(const item_definition_t &definition)
    -> void {
  if (m_item_map.find(definition.id) != m_item_map.end()) {
    std::cerr << "Warning: Overwriting item definition for " << definition.id
              << std::endl;
  }
  m_item_map[definition.id] = definition;
}

auto item_registry_t::get_item(const resource_id_t &id) const
    -> const item_definition_t * {
  auto it = m_item_map.find(id);
  if (it != m_item_map.end()) {
    return &it->second;
  }
  return nullptr;
}

auto item_registry_t::get_all_items() const
    -> const std::map<resource_id_t, item_definition_t> & {
  return m_item_map;
}

auto item_registry_t::get_items_of_kind(item_kind_t kind) const
    -> std::vector<const item_definition_t *> {
  std::vector<const item_definition_t *> out;
  for (const auto &[id, def] : m_item_map) {
    if (def.kind == kind)
      out.push_back(&def);
  }
  std::stable_sort(out.begin(), out.end(),
                   [](const item_definition_t *a, const item_definition_t *b) {
                     return a->order < b->order;
                   });
  return out;
}

auto item_registry_t::clear() -> void { m_item_map.clear(); }

} // namespace manor
