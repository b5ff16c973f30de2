// tests/test_room_drafter.cpp

#include <doctest/doctest.h>

#include "core/mansion/room_drafter.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <set>

using namespace manor;
using D = direction_t;

TEST_SUITE("room_drafter") {

TEST_CASE("deck copies follow rarity and skip undraftable rooms") {
  test::reset_content();
  const auto *common = test::register_room(test::make_room("Empty", {D::up, D::down}, 0, 0));
  const auto *uncommon = test::register_room(test::make_room("Den", {D::up, D::down}, 0, 1));
  const auto *rare = test::register_room(test::make_room("Garden", {D::up, D::down}, 0, 2));
  const auto *unique = test::register_room(test::make_room("Vault", {D::up, D::down}, 3, 3));
  const auto *entrance = test::register_entrance();

  random_t rng(5u);
  room_drafter_t drafter(rng);
  drafter.build_deck();

  CHECK(drafter.copies_of(*common) == 7);
  CHECK(drafter.copies_of(*uncommon) == 5);
  CHECK(drafter.copies_of(*rare) == 3);
  CHECK(drafter.copies_of(*unique) == 1);
  CHECK(drafter.copies_of(*entrance) == 0);
  CHECK(drafter.get_deck().size() == 16);
}

TEST_CASE("removing and adding copies") {
  test::reset_content();
  const auto *vault = test::register_room(test::make_room("Vault", {D::up, D::down}, 3, 3));

  random_t rng(5u);
  room_drafter_t drafter(rng);
  drafter.build_deck();

  CHECK(drafter.remove_one(*vault));
  CHECK(drafter.copies_of(*vault) == 0);
  CHECK_FALSE(drafter.remove_one(*vault));

  drafter.add_copies(*vault, 2);
  CHECK(drafter.copies_of(*vault) == 2);
}

TEST_CASE("draws offer distinct placeable rooms") {
  test::reset_content();
  test::register_room(test::make_room("Empty", {D::up, D::down, D::left, D::right}, 0, 0));
  test::register_room(test::make_room("Den", {D::up, D::down, D::left, D::right}, 0, 1));
  test::register_room(test::make_room("Hall", {D::up, D::down}, 0, 1));
  test::register_room(test::make_room("Closet", {D::up}, 0, 0)); // no door back down

  random_t rng(11u);
  room_drafter_t drafter(rng);
  drafter.build_deck();

  mansion_t mansion(9, 5);
  for (int i = 0; i < 30; ++i) {
    auto picks = drafter.draw(mansion, {7, 2}, D::up, 0, 3);
    REQUIRE(picks.size() == 3);
    std::set<const room_definition_t *> distinct(picks.begin(), picks.end());
    CHECK(distinct.size() == 3);
    for (const auto *room : picks) {
      CHECK(mansion.can_place(*room, {7, 2}, D::up));
      CHECK(room->name != "Closet");
    }
  }
}

TEST_CASE("extra copies make a room more likely") {
  test::reset_content();
  const auto *plain = test::register_room(test::make_room("Garden", {D::up, D::down}, 0, 3));
  const auto *boosted = test::register_room(test::make_room("Furnace", {D::up, D::down}, 0, 3));

  random_t rng(21u);
  room_drafter_t drafter(rng);
  drafter.build_deck();
  drafter.add_copies(*boosted, 30);

  mansion_t mansion(9, 5);
  int boosted_picks = 0;
  for (int i = 0; i < 400; ++i) {
    auto picks = drafter.draw(mansion, {7, 2}, D::up, 0, 1);
    REQUIRE(picks.size() == 1);
    if (picks[0] == boosted)
      ++boosted_picks;
  }
  // 31 copies against 1 at the same rarity
  CHECK(boosted_picks > 300);
  CHECK(drafter.copies_of(*plain) == 1);
}

TEST_CASE("fewer candidates when the pool is small, none when empty") {
  test::reset_content();
  test::register_room(test::make_room("Hall", {D::up, D::down}, 0, 0));

  random_t rng(11u);
  room_drafter_t drafter(rng);
  drafter.build_deck();

  mansion_t mansion(9, 5);
  CHECK(drafter.draw(mansion, {7, 2}, D::up, 0, 3).size() == 1);
  // Walking left into (8, 1): Hall has no right door
  CHECK(drafter.draw(mansion, {8, 1}, D::left, 0, 3).empty());
  CHECK_FALSE(drafter.has_affordable(mansion, {8, 1}, D::left, 10));
}

TEST_CASE("a free room is always offered when one fits") {
  test::reset_content();
  // The paid room is far more likely on its own
  test::register_room(test::make_room("Vault", {D::up, D::down}, 2, 0));
  const auto *free_room = test::register_room(test::make_room("Antechamber", {D::up, D::down}, 0, 3));

  random_t rng(21u);
  room_drafter_t drafter(rng);
  drafter.build_deck();

  mansion_t mansion(9, 5);
  for (int i = 0; i < 20; ++i) {
    auto picks = drafter.draw(mansion, {7, 2}, D::up, 5, 1);
    REQUIRE(picks.size() == 1);
    CHECK(picks[0] == free_room);
  }
}

TEST_CASE("unaffordable rooms are left out when something cheaper fits") {
  test::reset_content();
  const auto *pricey = test::register_room(test::make_room("Vault", {D::up, D::down}, 3, 0));
  test::register_room(test::make_room("Empty", {D::up, D::down}, 0, 0));
  test::register_room(test::make_room("Den", {D::up, D::down}, 1, 0));

  random_t rng(2u);
  room_drafter_t drafter(rng);
  drafter.build_deck();

  mansion_t mansion(9, 5);
  for (int i = 0; i < 20; ++i) {
    auto picks = drafter.draw(mansion, {7, 2}, D::up, 1, 3);
    CHECK(picks.size() == 2);
    CHECK(std::find(picks.begin(), picks.end(), pricey) == picks.end());
  }
  CHECK(drafter.has_affordable(mansion, {7, 2}, D::up, 0));
}

TEST_CASE("lock levels by row") {
  random_t rng(8u);
  room_drafter_t drafter(rng);

  for (int i = 0; i < 50; ++i) {
    CHECK(drafter.roll_lock_level(8, 9) == LOCK_OPEN);
    CHECK(drafter.roll_lock_level(0, 9) == LOCK_DOUBLE);
    int middle = drafter.roll_lock_level(4, 9);
    CHECK(middle >= LOCK_OPEN);
    CHECK(middle <= LOCK_DOUBLE);
  }
}

TEST_CASE("doors further up lock more often") {
  random_t rng(99u);
  room_drafter_t drafter(rng);

  int low_open = 0, high_open = 0;
  for (int i = 0; i < 2000; ++i) {
    if (drafter.roll_lock_level(7, 9) == LOCK_OPEN)
      ++low_open;
    if (drafter.roll_lock_level(1, 9) == LOCK_OPEN)
      ++high_open;
  }
  CHECK(low_open > high_open);
}

}
