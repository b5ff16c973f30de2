#pragma once

#include "core/common/resource_id.hpp"
#include <map>
#include <string>
#include <vector>

namespace manor {

enum class item_kind_t { consumable, permanent };

/**
 * @brief Represents the data for a single type of item.
 * Consumables are counted (steps, coins, gems, keys, dice), permanents are
 * owned or not (shovel, hammer, ...).
 */
struct item_definition_t {
  resource_id_t id;
  std::string name;
  item_kind_t kind = item_kind_t::consumable;

  // Consumables: amount at game start. Permanents: 1 if owned at start.
  int starting_amount = 0;

  // Display order in the inventory panel
  int order = 0;
};

// Ids the rules refer to directly
namespace items {
inline const resource_id_t STEPS("manor", "steps");
inline const resource_id_t COINS("manor", "coins");
inline const resource_id_t GEMS("manor", "gems");
inline const resource_id_t KEYS("manor", "keys");
inline const resource_id_t DICE("manor", "dice");
inline const resource_id_t SHOVEL("manor", "shovel");
inline const resource_id_t HAMMER("manor", "hammer");
inline const resource_id_t LOCKPICK_KIT("manor", "lockpick_kit");
inline const resource_id_t METAL_DETECTOR("manor", "metal_detector");
inline const resource_id_t RABBIT_FOOT("manor", "rabbit_foot");
} // namespace items

/**
 * @brief Registry for all item definitions.
 */
class item_registry_t {
public:
  static auto get() -> item_registry_t &;

  item_registry_t(const item_registry_t &) = delete;
  auto operator=(const item_registry_t &) -> item_registry_t & = delete;

  auto register_item(const item_definition_t &definition) -> void;
  auto get_item(const resource_id_t &id) const -> const item_definition_t *;
  auto get_all_items() const
      -> const std::map<resource_id_t, item_definition_t> &;

  // Items of one kind sorted by display order
  auto get_items_of_kind(item_kind_t kind) const
      -> std::vector<const item_definition_t *>;

  auto clear() -> void;

private:
  item_registry_t() = default;
  std::map<resource_id_t, item_definition_t> m_item_map;
};

} // namespace manor
