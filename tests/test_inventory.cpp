// tests/test_inventory.cpp

#include <doctest/doctest.h>

#include "core/game/inventory.hpp"
#include "test_support.hpp"

using namespace manor;

TEST_SUITE("inventory") {

TEST_CASE("starts from the registered amounts") {
  test::reset_content();
  test::register_default_items();

  auto inventory = inventory_t::from_registry();
  CHECK(inventory.count(items::STEPS) == 70);
  CHECK(inventory.count(items::GEMS) == 2);
  CHECK(inventory.count(items::KEYS) == 0);
  CHECK_FALSE(inventory.has(items::SHOVEL));
  CHECK(inventory.get_consumables().size() == 5);
  CHECK(inventory.get_permanents().size() == 5);
}

TEST_CASE("remove only takes what is there") {
  inventory_t inventory;
  inventory.add(items::KEYS, 2);

  CHECK_FALSE(inventory.remove(items::KEYS, 3));
  CHECK(inventory.count(items::KEYS) == 2);
  CHECK(inventory.remove(items::KEYS, 2));
  CHECK(inventory.count(items::KEYS) == 0);
  CHECK_FALSE(inventory.remove(items::DICE, 1));
}

TEST_CASE("give routes permanents and consumables") {
  test::reset_content();
  test::register_default_items();

  auto inventory = inventory_t::from_registry();
  inventory.give(items::LOCKPICK_KIT, 1);
  inventory.give(items::COINS, 15);

  CHECK(inventory.has(items::LOCKPICK_KIT));
  CHECK(inventory.count(items::LOCKPICK_KIT) == 0);
  CHECK(inventory.count(items::COINS) == 15);
}

}
