// tests/test_json_loader.cpp

#include <doctest/doctest.h>

#include "core/assets/json_loader.hpp"
#include "test_support.hpp"

#include <filesystem>
#include <fstream>

using namespace manor;

TEST_SUITE("json_loader") {

TEST_CASE("room files accept comments, trailing commas and bare keys") {
  test::reset_content();

  const char *json = R"({
    // Drafting it adds green rooms
    name: "Veranda",
    image: "veranda.webp",
    doors: ["up", "down", "left",],
    cost: 2,
    rarity: 2,
    placement: "edge",
    color: "green",
    onDraft: { type: "deck_add", color: "green", count: 2 },
  })";

  REQUIRE(json_loader_t::parse_and_register_room(json, "veranda.json"));

  const auto *room = room_registry_t::get().get_room("veranda");
  REQUIRE(room != nullptr);
  CHECK(room->name == "Veranda");
  CHECK(room->image == "veranda.webp");
  CHECK(room->has_door(direction_t::up));
  CHECK(room->has_door(direction_t::down));
  CHECK(room->has_door(direction_t::left));
  CHECK_FALSE(room->has_door(direction_t::right));
  CHECK(room->gem_cost == 2);
  CHECK(room->rarity == 2);
  CHECK(room->placement == placement_t::edge);
  CHECK(room->color == "green");
  CHECK(room->draftable);
  CHECK(room->on_draft.kind == draft_effect_kind_t::deck_add);
  CHECK(room->on_draft.color == "green");
  CHECK(room->on_draft.count == 2);
}

TEST_CASE("room id comes from the name unless a code is given") {
  test::reset_content();

  REQUIRE(json_loader_t::parse_and_register_room(
      R"({"name": "Maid's Chamber", "doors": ["up"], "onDraft": {"type": "grant", "item": "rabbit_foot"}})", "a.json"));
  REQUIRE(json_loader_t::parse_and_register_room(R"({"name": "Odd Room", "code": "mod:odd", "doors": ["down"]})",
                                                 "b.json"));

  const auto *maid = room_registry_t::get().get_room("maids_chamber");
  REQUIRE(maid != nullptr);
  CHECK(maid->on_draft.kind == draft_effect_kind_t::grant);
  CHECK(maid->on_draft.item == resource_id_t("rabbit_foot"));
  CHECK(room_registry_t::get().get_room("mod:odd") != nullptr);
}

TEST_CASE("enter effects") {
  test::reset_content();

  REQUIRE(json_loader_t::parse_and_register_room(
      R"({"name": "Storage", "doors": ["up"], "onEnter": {"type": "spawn", "fixture": "chest"}})", "s.json"));
  REQUIRE(json_loader_t::parse_and_register_room(
      R"({"name": "Garden", "doors": ["up"], "onEnter": {"type": "maybe_gem", "chance": 0.5}})", "g.json"));
  REQUIRE(json_loader_t::parse_and_register_room(
      R"({"name": "Entrance Hall", "doors": ["up"], "draftable": false, "onEnter": {"type": "start"}})", "e.json"));

  auto &rooms = room_registry_t::get();
  CHECK(rooms.get_room("storage")->on_enter.kind == enter_effect_kind_t::spawn);
  CHECK(rooms.get_room("storage")->on_enter.fixture == resource_id_t("chest"));
  CHECK(rooms.get_room("garden")->on_enter.chance == doctest::Approx(0.5f));
  CHECK_FALSE(rooms.get_room("entrance_hall")->draftable);
  CHECK(rooms.find_by_enter_effect(enter_effect_kind_t::start) == rooms.get_room("entrance_hall"));
}

TEST_CASE("broken room files are rejected") {
  test::reset_content();
  CHECK_FALSE(json_loader_t::parse_and_register_room("{ name: ", "broken.json"));
  CHECK(room_registry_t::get().get_all_rooms().empty());
}

TEST_CASE("items keep file order unless told otherwise") {
  test::reset_content();

  json_loader_t::parse_items(R"({
    "items": [
      { "code": "steps", "name": "Steps", "start": 70 },
      { "code": "gems", "name": "Gems", "start": 2 },
      { "code": "shovel", "name": "Shovel", "kind": "permanent" },
    ]
  })");

  auto &items = item_registry_t::get();
  REQUIRE(items.get_all_items().size() == 3);
  CHECK(items.get_item(items::STEPS)->starting_amount == 70);
  CHECK(items.get_item(items::SHOVEL)->kind == item_kind_t::permanent);

  auto consumables = items.get_items_of_kind(item_kind_t::consumable);
  REQUIRE(consumables.size() == 2);
  CHECK(consumables[0]->id == items::STEPS);
  CHECK(consumables[1]->id == items::GEMS);
}

TEST_CASE("fixtures with unlock methods, loot and messages") {
  test::reset_content();

  json_loader_t::parse_fixtures(R"({
    "fixtures": [
      {
        "code": "chest",
        "label": "a chest",
        "unlock": ["key", "item:hammer"],
        "loot": [ { "item": "coins", "amount": 15, "chance": 0.5 } ],
        "messages": { "empty": "The chest is empty." }
      }
    ]
  })");

  const auto *chest = fixture_registry_t::get().get_fixture("chest");
  REQUIRE(chest != nullptr);
  REQUIRE(chest->unlock.size() == 2);
  CHECK(chest->unlock[0].kind == unlock_kind_t::key);
  CHECK(chest->unlock[1].kind == unlock_kind_t::item);
  CHECK(chest->unlock[1].item_id == items::HAMMER);
  REQUIRE(chest->loot.size() == 1);
  CHECK(chest->loot[0].amount == 15);
  CHECK(chest->empty_message == "The chest is empty.");
  // Defaults fill the rest
  CHECK_FALSE(chest->locked_message.empty());
  CHECK_FALSE(chest->opened_message.empty());
}

TEST_CASE("game config overrides defaults") {
  game_config_t config;
  json_loader_t::parse_game_config(R"({
    grid: { rows: 7, cols: 3 },
    display: { cellSize: 64 },
    seed: 1234,
    finds: { chance: 0.2 },
    endDelay: 3.0,
    bindings: { move_up: ["W"] },
  })",
                                   config);

  CHECK(config.rows == 7);
  CHECK(config.cols == 3);
  CHECK(config.cell_size == 64);
  CHECK(config.cell_margin == 3);
  REQUIRE(config.seed.has_value());
  CHECK(*config.seed == 1234u);
  CHECK(config.find_chance == doctest::Approx(0.2f));
  CHECK(config.rabbit_foot_bonus == doctest::Approx(0.05f));
  CHECK(config.end_delay == doctest::Approx(3.0f));
  REQUIRE(config.key_bindings.count("move_up") == 1);
  CHECK(config.key_bindings["move_up"] == (std::vector<std::string>{"W"}));
  CHECK(config.window_width() == 3 * 64 + 400);
}

TEST_CASE("a grid too small to play falls back to 9x5") {
  game_config_t config;
  json_loader_t::parse_game_config(R"({"grid": {"rows": 1, "cols": 5}})", config);
  CHECK(config.rows == 9);
  CHECK(config.cols == 5);
}

TEST_CASE("out of range draft and cell sizes are clamped") {
  game_config_t config;
  json_loader_t::parse_game_config(R"({draft: {size: 0}, display: {cellSize: 2, cellMargin: 3}})", config);
  CHECK(config.draft_size == 1);
  CHECK(config.cell_size == 70);
  CHECK(config.cell_margin == 3);

  game_config_t wide_margin;
  json_loader_t::parse_game_config(R"({display: {cellSize: 40, cellMargin: 12}})", wide_margin);
  CHECK(wide_margin.cell_size == 40);
  CHECK(wide_margin.cell_margin == 0);
}

TEST_CASE("missing config file keeps defaults") {
  game_config_t config;
  CHECK_FALSE(json_loader_t::load_game_config("does/not/exist.json", config));
  CHECK(config.rows == 9);
  CHECK(config.cols == 5);
  CHECK_FALSE(config.seed.has_value());
}

TEST_CASE("shipped content loads and is consistent") {
  test::reset_content();

  // Tests run from the source tree
  REQUIRE(std::filesystem::is_directory("assets/rooms"));
  json_loader_t::load_content("assets");

  auto &rooms = room_registry_t::get();
  CHECK(rooms.get_all_rooms().size() == 13);
  CHECK(rooms.find_by_enter_effect(enter_effect_kind_t::start) != nullptr);
  CHECK(rooms.find_by_enter_effect(enter_effect_kind_t::goal) != nullptr);
  CHECK(item_registry_t::get().get_item(items::STEPS)->starting_amount == 70);
  CHECK(fixture_registry_t::get().get_fixture("dig_site") != nullptr);

  game_config_t config;
  CHECK(json_loader_t::load_game_config("assets/config/game.json", config));
  CHECK(config.rows == 9);
  CHECK(config.cols == 5);
  CHECK(config.key_bindings.at("move_up") == (std::vector<std::string>{"Z", "UP"}));
}

}
