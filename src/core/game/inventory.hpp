#pragma once

#include "core/common/resource_id.hpp"
#include <map>

namespace manor
{

/**
 * @brief Consumable counters and owned permanent items.
 */
class inventory_t
{
public:
  inventory_t() = default;

  // Starting amounts of every registered item
  static auto from_registry() -> inventory_t;

  auto count(const resource_id_t &id) const -> int;
  auto add(const resource_id_t &id, int amount) -> void;
  // Takes `amount` only if that many are held
  auto remove(const resource_id_t &id, int amount) -> bool;

  auto has(const resource_id_t &id) const -> bool;
  auto grant(const resource_id_t &id) -> void;

  // Routes to add() or grant() by the registered kind of the item
  auto give(const resource_id_t &id, int amount) -> void;

  auto get_consumables() const -> const std::map<resource_id_t, int> &
  {
    return m_consumables;
  }
  auto get_permanents() const -> const std::map<resource_id_t, bool> &
  {
    return m_permanents;
  }

private:
  std::map<resource_id_t, int> m_consumables;
  std::map<resource_id_t, bool> m_permanents;
};

} // namespace manor
