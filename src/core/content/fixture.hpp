#pragma once

#include "core/common/random.hpp"
#include "core/common/resource_id.hpp"
#include <map>
#include <string>
#include <vector>

namespace manor {

struct loot_entry_t {
  resource_id_t item_id;
  int amount = 1;
  float chance = 1.0f;
};

enum class unlock_kind_t {
  key,  // consumes one key
  item  // needs a permanent item, nothing consumed
};

struct unlock_method_t {
  unlock_kind_t kind = unlock_kind_t::key;
  resource_id_t item_id;
};

/**
 * @brief Something a room can hold and the player can open once:
 * chests, lockers, dig sites.
 */
struct fixture_definition_t {
  resource_id_t id;
  std::string label;   // "a chest"
  std::string badge;   // short marker drawn on the cell
  std::vector<unlock_method_t> unlock; // tried in order
  std::vector<loot_entry_t> loot;

  std::string opened_message;  // "Chest opened"
  std::string empty_message;   // "The chest is empty."
  std::string locked_message;  // "A chest is here. You need a key or the hammer."
};

// One placed fixture in a mansion cell
struct fixture_instance_t {
  const fixture_definition_t *definition = nullptr;
  bool opened = false;
};

// Rolls each entry independently; nothing dropped gives CONSOLATION_COINS coins.
auto roll_loot(const std::vector<loot_entry_t> &table, random_t &rng)
    -> std::vector<loot_entry_t>;

constexpr int CONSOLATION_COINS = 5;

/**
 * @brief Registry for all fixture definitions.
 */
class fixture_registry_t {
public:
  static auto get() -> fixture_registry_t &;

  fixture_registry_t(const fixture_registry_t &) = delete;
  auto operator=(const fixture_registry_t &) -> fixture_registry_t & = delete;

  auto register_fixture(const fixture_definition_t &definition) -> void;
  auto get_fixture(const resource_id_t &id) const
      -> const fixture_definition_t *;
  auto get_all_fixtures() const
      -> const std::map<resource_id_t, fixture_definition_t> &;

  auto clear() -> void;

private:
  fixture_registry_t() = default;
  std::map<resource_id_t, fixture_definition_t> m_fixture_map;
};

} // namespace manor
