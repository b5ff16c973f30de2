// tests/test_input_map.cpp

#include <doctest/doctest.h>

#include "core/game/game_state.hpp"
#include "core/input/input_map.hpp"
#include "test_support.hpp"

using namespace manor;
using D = direction_t;

namespace {

void setup_two_rooms() {
  test::reset_content();
  test::register_default_items();
  test::register_entrance();
  test::register_room(test::make_room("Hall", {D::down, D::left, D::right}));
  test::register_room(test::make_room("Den", {D::down, D::left, D::right}));
}

} // namespace

TEST_SUITE("input_map") {

TEST_CASE("AZERTY defaults") {
  input_map_t input;
  CHECK(input.lookup("Z") == action_t::move_up);
  CHECK(input.lookup("Q") == action_t::move_left);
  CHECK(input.lookup("S") == action_t::move_down);
  CHECK(input.lookup("D") == action_t::move_right);
  CHECK(input.lookup("UP") == action_t::move_up);
  CHECK(input.lookup("SPACE") == action_t::interact);
  CHECK(input.lookup("E") == action_t::interact);
  CHECK(input.lookup("ENTER") == action_t::confirm);
  CHECK(input.lookup("R") == action_t::reroll);
  CHECK(input.lookup("I") == action_t::toggle_inventory);
  CHECK(input.lookup("ESCAPE") == action_t::quit);
  // Key names are case-insensitive
  CHECK(input.lookup("z") == action_t::move_up);
  CHECK_FALSE(input.lookup("W").has_value());
}

TEST_CASE("overrides replace the keys of an action") {
  input_map_t input;
  input.apply_overrides({{"move_up", {"W"}}, {"jump", {"J"}}});

  CHECK(input.lookup("W") == action_t::move_up);
  CHECK_FALSE(input.lookup("Z").has_value());
  CHECK_FALSE(input.lookup("UP").has_value());
  CHECK_FALSE(input.lookup("J").has_value());
  CHECK(input.keys_for(action_t::move_up) == (std::vector<std::string>{"W"}));
  // Untouched actions keep their defaults
  CHECK(input.lookup("Q") == action_t::move_left);
}

TEST_CASE("action names") {
  CHECK(parse_action("toggle_inventory") == action_t::toggle_inventory);
  CHECK(to_string(action_t::reroll) == "reroll");
  CHECK_FALSE(parse_action("fly").has_value());
}

TEST_CASE("left and right move the draft cursor while choosing") {
  setup_two_rooms();
  auto config = test::small_config();
  game_state_t game(config);
  input_map_t input;

  CHECK_FALSE(input.handle_key("Z", game));
  REQUIRE(game.get_mode() == game_mode_t::drafting);
  REQUIRE(game.get_draft()->candidates.size() == 2);

  CHECK(input.handle_key("D", game));
  CHECK(game.get_draft()->selection == 1);
  CHECK(game.get_player_position() == (grid_pos_t{1, 1}));
  CHECK(input.handle_key("Q", game));
  CHECK(game.get_draft()->selection == 0);

  // Interact does nothing until a room is chosen
  CHECK_FALSE(input.handle_key("E", game));

  const auto *chosen = game.get_draft()->candidates[0];
  game.get_inventory().add(items::KEYS, 1);
  CHECK(input.handle_key("ENTER", game));
  CHECK(game.get_mode() == game_mode_t::exploring);
  CHECK(game.get_mansion().get_cell({0, 1}).room == chosen);
}

TEST_CASE("quit and inventory work even after the game ended") {
  setup_two_rooms();
  game_state_t game(test::small_config());
  input_map_t input;

  game.get_inventory().remove(items::STEPS, 70);
  game.check_end_conditions();
  REQUIRE(game.is_over());

  CHECK_FALSE(input.handle_key("Z", game));
  CHECK(game.get_mode() == game_mode_t::lost);

  CHECK(input.handle_key("I", game));
  CHECK_FALSE(game.is_inventory_visible());
  CHECK(input.handle_key("ESCAPE", game));
  CHECK_FALSE(game.is_running());
}

TEST_CASE("unbound keys are ignored") {
  setup_two_rooms();
  game_state_t game(test::small_config());
  input_map_t input;
  CHECK_FALSE(input.handle_key("F12", game));
  CHECK(game.get_mode() == game_mode_t::exploring);
}

}
