#include "core/assets/json_loader.hpp"
#include "core/content/fixture.hpp"
#include "core/content/item.hpp"
#include "core/content/room.hpp"
#include "core/common/resource_id.hpp"

#include <iostream>
#include <fstream>
#include <algorithm>
#include <filesystem>
#include <sstream>
#include <nlohmann/json.hpp>

#include <regex>

namespace manor
{

// Internal helper to handle loose JSON (comments, unquoted keys, trailing commas)
static auto standardize_json(const std::string &input) -> std::string
{
  // 1. Strip single-line comments //
  std::string result = std::regex_replace(input, std::regex("//.*"), "");

  // 2. Fix trailing commas before closing braces/brackets
  result = std::regex_replace(result, std::regex(",\\s*([}\\]])"), "$1");

  // 3. Quote unquoted keys
  result = std::regex_replace(result, std::regex("([{,])\\s*([a-zA-Z_][a-zA-Z0-9_]*)\\s*:"), "$1\"$2\":");
  result = std::regex_replace(result, std::regex("(^|\\n)\\s*([a-zA-Z_][a-zA-Z0-9_]*)\\s*:"), "$1\"$2\":");

  return result;
}

static auto parse_loose(const std::string &content) -> nlohmann::json
{
  return nlohmann::json::parse(standardize_json(content), nullptr, true, true);
}

static auto read_file(const std::string &path, std::string &out) -> bool
{
  std::ifstream f(path);
  if (!f.is_open())
    return false;
  std::stringstream buffer;
  buffer << f.rdbuf();
  out = buffer.str();
  return true;
}

// "coins" -> manor:coins, "other:thing" stays as is
static auto to_id(const std::string &code) -> resource_id_t
{
  return resource_id_t(code);
}

static auto parse_enter_effect(const nlohmann::json &j) -> enter_effect_t
{
  enter_effect_t effect;
  std::string type = j.value("type", "none");
  if (type == "start")
    effect.kind = enter_effect_kind_t::start;
  else if (type == "goal")
    effect.kind = enter_effect_kind_t::goal;
  else if (type == "coins")
    effect.kind = enter_effect_kind_t::coins;
  else if (type == "food")
    effect.kind = enter_effect_kind_t::food;
  else if (type == "maybe_gem")
    effect.kind = enter_effect_kind_t::maybe_gem;
  else if (type == "spawn")
    effect.kind = enter_effect_kind_t::spawn;
  else if (type != "none")
    std::cerr << "Warning: Unknown onEnter type '" << type << "'" << std::endl;

  effect.amount = j.value("amount", 0);
  effect.chance = j.value("chance", 0.0f);
  if (j.contains("fixture"))
    effect.fixture = to_id(j["fixture"].get<std::string>());
  return effect;
}

static auto parse_draft_effect(const nlohmann::json &j) -> draft_effect_t
{
  draft_effect_t effect;
  std::string type = j.value("type", "none");
  if (type == "gem")
    effect.kind = draft_effect_kind_t::gem;
  else if (type == "deck_add")
    effect.kind = draft_effect_kind_t::deck_add;
  else if (type == "grant")
    effect.kind = draft_effect_kind_t::grant;
  else if (type != "none")
    std::cerr << "Warning: Unknown onDraft type '" << type << "'" << std::endl;

  effect.color = j.value("color", "");
  effect.count = j.value("count", 0);
  if (j.contains("room"))
    effect.room = to_id(j["room"].get<std::string>());
  if (j.contains("item"))
    effect.item = to_id(j["item"].get<std::string>());
  return effect;
}

auto json_loader_t::load_content(const std::string &assets_dir) -> void
{
  load_items(assets_dir + "/items.json");
  load_fixtures(assets_dir + "/fixtures.json");
  load_rooms_from_directory(assets_dir + "/rooms");
}

auto json_loader_t::load_rooms_from_directory(const std::string &directory_path) -> void
{
  if (!std::filesystem::exists(directory_path))
  {
    std::cerr << "Warning: Room directory not found: " << directory_path << std::endl;
    return;
  }

  // Sorted so registration order does not depend on the filesystem
  std::vector<std::filesystem::path> files;
  for (const auto &entry : std::filesystem::recursive_directory_iterator(directory_path))
  {
    if (entry.is_regular_file() && entry.path().extension() == ".json")
      files.push_back(entry.path());
  }
  std::sort(files.begin(), files.end());

  for (const auto &path : files)
  {
    std::string content;
    if (!read_file(path.string(), content))
      continue;
    parse_and_register_room(content, path.filename().string());
  }
}

auto json_loader_t::parse_and_register_room(const std::string &json_content, const std::string &filename) -> bool
{
  try
  {
    auto j = parse_loose(json_content);

    room_definition_t def;
    def.name = j.value("name", "Unknown");
    def.id = j.contains("code") ? to_id(j["code"].get<std::string>()) : resource_id_t::from_name(def.name);
    def.image = j.value("image", "");

    if (j.contains("doors"))
    {
      for (const auto &d : j["doors"])
      {
        auto dir = parse_direction(d.get<std::string>());
        if (!dir)
        {
          std::cerr << "Warning: Bad door direction in " << filename << ": " << d << std::endl;
          continue;
        }
        def.doors[index_of(*dir)] = true;
      }
    }

    def.gem_cost = j.value("cost", 0);
    def.rarity = j.value("rarity", 0);
    def.color = j.value("color", "blue");
    def.draftable = j.value("draftable", true);
    def.placement = j.value("placement", "anywhere") == "edge" ? placement_t::edge : placement_t::anywhere;

    if (j.contains("onEnter"))
      def.on_enter = parse_enter_effect(j["onEnter"]);
    if (j.contains("onDraft"))
      def.on_draft = parse_draft_effect(j["onDraft"]);

    room_registry_t::get().register_room(def);
    return true;
  }
  catch (const std::exception &e)
  {
    std::cerr << "Failed to parse room " << filename << ": " << e.what() << std::endl;
    return false;
  }
}

auto json_loader_t::load_items(const std::string &file_path) -> void
{
  std::string content;
  if (!read_file(file_path, content))
  {
    std::cerr << "Failed to open item config: " << file_path << std::endl;
    return;
  }
  parse_items(content);
}

auto json_loader_t::parse_items(const std::string &json_content) -> void
{
  try
  {
    auto j = parse_loose(json_content);
    if (!j.contains("items") || !j["items"].is_array())
    {
      std::cerr << "Item config must contain an 'items' array." << std::endl;
      return;
    }

    int order = 0;
    for (const auto &entry : j["items"])
    {
      item_definition_t def;
      def.id = to_id(entry.value("code", "unknown"));
      def.name = entry.value("name", def.id.get_path());
      def.kind = entry.value("kind", "consumable") == "permanent" ? item_kind_t::permanent : item_kind_t::consumable;
      def.starting_amount = entry.value("start", 0);
      def.order = entry.value("order", order);
      ++order;
      item_registry_t::get().register_item(def);
    }
  }
  catch (const std::exception &e)
  {
    std::cerr << "Failed to parse items: " << e.what() << std::endl;
  }
}

auto json_loader_t::load_fixtures(const std::string &file_path) -> void
{
  std::string content;
  if (!read_file(file_path, content))
  {
    std::cerr << "Failed to open fixture config: " << file_path << std::endl;
    return;
  }
  parse_fixtures(content);
}

auto json_loader_t::parse_fixtures(const std::string &json_content) -> void
{
  try
  {
    auto j = parse_loose(json_content);
    if (!j.contains("fixtures") || !j["fixtures"].is_array())
    {
      std::cerr << "Fixture config must contain a 'fixtures' array." << std::endl;
      return;
    }

    for (const auto &entry : j["fixtures"])
    {
      fixture_definition_t def;
      def.id = to_id(entry.value("code", "unknown"));
      def.label = entry.value("label", def.id.get_path());
      def.badge = entry.value("badge", "?");

      if (entry.contains("unlock"))
      {
        for (const auto &u : entry["unlock"])
        {
          std::string method = u.get<std::string>();
          if (method == "key")
          {
            def.unlock.push_back({unlock_kind_t::key, {}});
          }
          else if (method.rfind("item:", 0) == 0)
          {
            def.unlock.push_back({unlock_kind_t::item, to_id(method.substr(5))});
          }
          else
          {
            std::cerr << "Warning: Unknown unlock method '" << method << "' for " << def.id << std::endl;
          }
        }
      }

      if (entry.contains("loot"))
      {
        for (const auto &l : entry["loot"])
        {
          loot_entry_t loot;
          loot.item_id = to_id(l.value("item", "coins"));
          loot.amount = l.value("amount", 1);
          loot.chance = l.value("chance", 1.0f);
          def.loot.push_back(loot);
        }
      }

      if (entry.contains("messages"))
      {
        const auto &m = entry["messages"];
        def.opened_message = m.value("opened", "");
        def.empty_message = m.value("empty", "");
        def.locked_message = m.value("locked", "");
      }
      if (def.opened_message.empty())
        def.opened_message = "You opened " + def.label + ".";
      if (def.empty_message.empty())
        def.empty_message = "Nothing left here.";
      if (def.locked_message.empty())
        def.locked_message = "You can't open " + def.label + ".";

      fixture_registry_t::get().register_fixture(def);
    }
  }
  catch (const std::exception &e)
  {
    std::cerr << "Failed to parse fixtures: " << e.what() << std::endl;
  }
}

auto json_loader_t::load_game_config(const std::string &file_path, game_config_t &config) -> bool
{
  std::string content;
  if (!read_file(file_path, content))
  {
    std::cerr << "Failed to open game config: " << file_path << " (using defaults)" << std::endl;
    return false;
  }

  try
  {
    parse_game_config(content, config);
  }
  catch (const std::exception &e)
  {
    std::cerr << "JSON Parse Error in " << file_path << ": " << e.what() << std::endl;
    return false;
  }
  return true;
}

auto json_loader_t::parse_game_config(const std::string &json_content, game_config_t &config) -> void
{
  auto j = parse_loose(json_content);

  if (j.contains("grid"))
  {
    const auto &g = j["grid"];
    config.rows = g.value("rows", config.rows);
    config.cols = g.value("cols", config.cols);
  }

  if (j.contains("display"))
  {
    const auto &d = j["display"];
    config.title = d.value("title", config.title);
    config.cell_size = d.value("cellSize", config.cell_size);
    config.cell_margin = d.value("cellMargin", config.cell_margin);
    config.panel_width = d.value("panelWidth", config.panel_width);
    config.vsync = d.value("vsync", config.vsync);
  }

  config.images_dir = j.value("images", config.images_dir);

  if (j.contains("seed") && j["seed"].is_number_unsigned())
    config.seed = j["seed"].get<std::uint32_t>();

  if (j.contains("draft"))
    config.draft_size = j["draft"].value("size", config.draft_size);

  if (j.contains("finds"))
  {
    const auto &f = j["finds"];
    config.find_chance = f.value("chance", config.find_chance);
    config.rabbit_foot_bonus = f.value("rabbitFootBonus", config.rabbit_foot_bonus);
    config.metal_detector_bonus = f.value("metalDetectorBonus", config.metal_detector_bonus);
  }

  config.end_delay = j.value("endDelay", config.end_delay);

  if (j.contains("bindings"))
  {
    for (auto &[action, keys] : j["bindings"].items())
    {
      config.key_bindings[action] = keys.get<std::vector<std::string>>();
    }
  }

  if (config.rows < 2 || config.cols < 1)
  {
    std::cerr << "Warning: Grid " << config.rows << "x" << config.cols << " too small, using 9x5" << std::endl;
    config.rows = 9;
    config.cols = 5;
  }

  if (config.draft_size < 1)
  {
    std::cerr << "Warning: Draft size " << config.draft_size << " too small, using 1" << std::endl;
    config.draft_size = 1;
  }

  if (config.cell_size < 8)
  {
    std::cerr << "Warning: Cell size " << config.cell_size << " too small, using 70" << std::endl;
    config.cell_size = 70;
  }

  // The visual keeps at least half the cell
  if (config.cell_margin < 0 || config.cell_margin * 4 > config.cell_size)
  {
    std::cerr << "Warning: Cell margin " << config.cell_margin << " out of range, using 0" << std::endl;
    config.cell_margin = 0;
  }
}

} // namespace manor
