#include "core/game/inventory.hpp"
#include "core/content/item.hpp"

namespace manor
{

auto inventory_t::from_registry() -> inventory_t
{
  inventory_t inv;
  for (const auto &[id, def] : item_registry_t::get().get_all_items())
  {
    if (def.kind == item_kind_t::permanent)
      inv.m_permanents[id] = def.starting_amount > 0;
    else
      inv.m_consumables[id] = def.starting_amount;
  }
  return inv;
}

auto inventory_t::count(const resource_id_t &id) const -> int
{
  auto it = m_consumables.find(id);
  return it != m_consumables.end() ? it->second : 0;
}

auto inventory_t::add(const resource_id_t &id, int amount) -> void
{
  m_consumables[id] += amount;
}

auto inventory_t::remove(const resource_id_t &id, int amount) -> bool
{
  auto it = m_consumables.find(id);
  if (it == m_consumables.end() || it->second < amount)
    return false;
  it->second -= amount;
  return true;
}

auto inventory_t::has(const resource_id_t &id) const -> bool
{
  auto it = m_permanents.find(id);
  return it != m_permanents.end() && it->second;
}

auto inventory_t::grant(const resource_id_t &id) -> void
{
  m_permanents[id] = true;
}

auto inventory_t::give(const resource_id_t &id, int amount) -> void
{
  const auto *def = item_registry_t::get().get_item(id);
  if (def && def->kind == item_kind_t::permanent)
    grant(id);
  else
    add(id, amount);
}

} // namespace manor
