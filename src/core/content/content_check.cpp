#include "core/content/content_check.hpp"
#include "core/content/fixture.hpp"
#include "core/content/item.hpp"
#include "core/content/room.hpp"
#include <algorithm>

namespace manor {

static auto error(const resource_id_t &subject, const std::string &message)
    -> content_issue_t {
  return {issue_severity_t::error, subject.to_string(), message};
}

static auto warning(const resource_id_t &subject, const std::string &message)
    -> content_issue_t {
  return {issue_severity_t::warning, subject.to_string(), message};
}

static auto check_rooms(std::vector<content_issue_t> &issues) -> void {
  auto &rooms = room_registry_t::get();
  auto &items = item_registry_t::get();
  auto &fixtures = fixture_registry_t::get();

  auto starts = std::count_if(rooms.get_all_rooms().begin(), rooms.get_all_rooms().end(), [](const auto &entry) {
    return entry.second.on_enter.kind == enter_effect_kind_t::start;
  });
  if (starts == 0)
    issues.push_back({issue_severity_t::error, "", "no room starts the game (onEnter start)"});
  else if (starts > 1)
    issues.push_back({issue_severity_t::warning, "",
                      "several start rooms, the first one is used"});

  if (!rooms.find_by_enter_effect(enter_effect_kind_t::goal))
    issues.push_back({issue_severity_t::error, "", "no goal room, the game cannot be won"});

  int draftable = 0;
  for (const auto &[id, room] : rooms.get_all_rooms()) {
    if (room.draftable)
      ++draftable;

    if (std::none_of(room.doors.begin(), room.doors.end(), [](bool d) { return d; }))
      issues.push_back(error(id, "has no doors"));

    if (room.gem_cost < 0)
      issues.push_back(error(id, "negative gem cost"));

    if (room.on_enter.kind == enter_effect_kind_t::spawn &&
        !fixtures.get_fixture(room.on_enter.fixture))
      issues.push_back(error(id, "spawns unknown fixture " + room.on_enter.fixture.to_string()));

    const auto &draft = room.on_draft;
    if (draft.kind == draft_effect_kind_t::grant) {
      const auto *item = items.get_item(draft.item);
      if (!item)
        issues.push_back(error(id, "grants unknown item " + draft.item.to_string()));
      else if (item->kind != item_kind_t::permanent)
        issues.push_back(warning(id, "grants consumable " + draft.item.to_string() + ", one is added"));
    }

    if (draft.kind == draft_effect_kind_t::deck_add) {
      if (!draft.room.empty() && !rooms.get_room(draft.room))
        issues.push_back(error(id, "adds unknown room " + draft.room.to_string()));
      if (draft.room.empty() && rooms.find_by_color(draft.color).empty())
        issues.push_back(warning(id, "adds " + draft.color + " rooms but none is draftable"));
    }
  }

  if (draftable == 0)
    issues.push_back({issue_severity_t::error, "", "no draftable room"});
}

// Held at start, dropped by some fixture or granted by some room
static auto is_obtainable(const resource_id_t &item_id) -> bool {
  const auto *item = item_registry_t::get().get_item(item_id);
  if (item && item->starting_amount > 0)
    return true;

  for (const auto &[id, fixture] : fixture_registry_t::get().get_all_fixtures()) {
    for (const auto &entry : fixture.loot) {
      if (entry.item_id == item_id && entry.chance > 0.0f)
        return true;
    }
  }
  for (const auto &[id, room] : room_registry_t::get().get_all_rooms()) {
    if (room.on_draft.kind == draft_effect_kind_t::grant && room.on_draft.item == item_id)
      return true;
  }
  return false;
}

static auto check_fixtures(std::vector<content_issue_t> &issues) -> void {
  auto &items = item_registry_t::get();

  for (const auto &[id, fixture] : fixture_registry_t::get().get_all_fixtures()) {
    if (fixture.unlock.empty())
      issues.push_back(warning(id, "has no unlock method, it opens for free"));

    for (const auto &method : fixture.unlock) {
      if (method.kind != unlock_kind_t::item)
        continue;
      if (!items.get_item(method.item_id))
        issues.push_back(error(id, "unlocks with unknown item " + method.item_id.to_string()));
      else if (!is_obtainable(method.item_id))
        issues.push_back(warning(id, "unlocks with " + method.item_id.to_string() + " but nothing gives it"));
    }

    for (const auto &entry : fixture.loot) {
      if (!items.get_item(entry.item_id))
        issues.push_back(error(id, "drops unknown item " + entry.item_id.to_string()));
      if (entry.chance < 0.0f || entry.chance > 1.0f)
        issues.push_back(warning(id, "loot chance outside [0, 1] for " + entry.item_id.to_string()));
    }
  }
}

static auto check_items(std::vector<content_issue_t> &issues) -> void {
  auto &registry = item_registry_t::get();
  for (const auto *id : {&items::STEPS, &items::COINS, &items::GEMS, &items::KEYS, &items::DICE}) {
    if (!registry.get_item(*id))
      issues.push_back(error(*id, "required consumable is not defined"));
  }
}

auto check_content() -> std::vector<content_issue_t> {
  std::vector<content_issue_t> issues;
  check_items(issues);
  check_rooms(issues);
  check_fixtures(issues);
  return issues;
}

auto count_errors(const std::vector<content_issue_t> &issues) -> int {
  return (int)std::count_if(issues.begin(), issues.end(), [](const content_issue_t &issue) {
    return issue.severity == issue_severity_t::error;
  });
}

} // namespace manor
