// tests/test_content_check.cpp

#include <doctest/doctest.h>

#include "core/assets/json_loader.hpp"
#include "core/content/content_check.hpp"
#include "test_support.hpp"

#include <algorithm>

using namespace manor;
using D = direction_t;

namespace {

void register_minimal_content() {
  test::reset_content();
  test::register_default_items();
  test::register_chest();
  test::register_entrance();

  auto goal = test::make_room("Antechamber", {D::down, D::left, D::right}, 0, 3);
  goal.on_enter.kind = enter_effect_kind_t::goal;
  test::register_room(goal);

  auto storage = test::make_room("Storage", {D::up, D::down});
  storage.on_enter.kind = enter_effect_kind_t::spawn;
  storage.on_enter.fixture = "chest";
  test::register_room(storage);
}

bool mentions(const std::vector<content_issue_t> &issues, const std::string &text) {
  return std::any_of(issues.begin(), issues.end(), [&](const content_issue_t &issue) {
    return issue.message.find(text) != std::string::npos;
  });
}

} // namespace

TEST_SUITE("content_check") {

TEST_CASE("complete content has no errors") {
  register_minimal_content();
  auto issues = check_content();
  CHECK(count_errors(issues) == 0);
}

TEST_CASE("missing start or goal room") {
  register_minimal_content();
  room_registry_t::get().clear();
  test::register_room(test::make_room("Empty", {D::up, D::down}));

  auto issues = check_content();
  CHECK(count_errors(issues) == 2);
  CHECK(mentions(issues, "no room starts the game"));
  CHECK(mentions(issues, "no goal room"));
}

TEST_CASE("dangling references") {
  register_minimal_content();

  auto bad_spawn = test::make_room("Locker Room", {D::up, D::down});
  bad_spawn.on_enter.kind = enter_effect_kind_t::spawn;
  bad_spawn.on_enter.fixture = "locker";
  test::register_room(bad_spawn);

  auto bad_grant = test::make_room("Maid's Chamber", {D::up, D::down});
  bad_grant.on_draft.kind = draft_effect_kind_t::grant;
  bad_grant.on_draft.item = "crown";
  test::register_room(bad_grant);

  auto doorless = test::make_room("Cupboard", {});
  test::register_room(doorless);

  auto issues = check_content();
  CHECK(count_errors(issues) == 3);
  CHECK(mentions(issues, "unknown fixture manor:locker"));
  CHECK(mentions(issues, "unknown item manor:crown"));
  CHECK(mentions(issues, "has no doors"));
}

TEST_CASE("fixtures that open for free or need an item nobody gives") {
  register_minimal_content();

  fixture_definition_t crate;
  crate.id = resource_id_t("crate");
  crate.label = "a crate";
  fixture_registry_t::get().register_fixture(crate);

  // The test chest needs the hammer, and nothing drops or grants it yet
  auto issues = check_content();
  CHECK(count_errors(issues) == 0);
  CHECK(mentions(issues, "has no unlock method, it opens for free"));
  CHECK(mentions(issues, "unlocks with manor:hammer but nothing gives it"));

  auto workshop = test::make_room("Workshop", {D::up, D::down});
  workshop.on_draft.kind = draft_effect_kind_t::grant;
  workshop.on_draft.item = "hammer";
  test::register_room(workshop);
  CHECK_FALSE(mentions(check_content(), "nothing gives it"));
}

TEST_CASE("shipped assets pass") {
  test::reset_content();
  json_loader_t::load_content("assets");
  auto issues = check_content();
  CHECK(count_errors(issues) == 0);
  // Every tool a fixture asks for can be found
  CHECK_FALSE(mentions(issues, "nothing gives it"));
}

}
