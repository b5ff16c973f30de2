#include "core/assets/asset_manager.hpp"
#include "core/assets/json_loader.hpp"
#include "core/content/content_check.hpp"
#include "core/content/fixture.hpp"
#include "core/content/item.hpp"
#include "core/content/room.hpp"
#include "core/game/game_config.hpp"
#include <exception>
#include <iostream>
#include <string>

int main(int argc, char *argv[])
{
  std::string assets_dir = "assets";
  std::string images_dir;

  for (int i = 1; i < argc; ++i)
  {
    std::string arg = argv[i];
    if (arg == "--assets" && i + 1 < argc)
      assets_dir = argv[++i];
    else if (arg == "--images" && i + 1 < argc)
      images_dir = argv[++i];
    else
    {
      std::cerr << "Usage: " << argv[0] << " [--assets <dir>] [--images <dir>]" << std::endl;
      return 1;
    }
  }

  std::cout << "Manor Content Check Starting..." << std::endl;

  try
  {
    manor::game_config_t config;
    manor::json_loader_t::load_game_config(assets_dir + "/config/game.json", config);
    if (!images_dir.empty())
      config.images_dir = images_dir;

    manor::json_loader_t::load_content(assets_dir);

    // The game shares the same registries
    auto &room_registry = manor::room_registry_t::get();
    auto &item_registry = manor::item_registry_t::get();
    auto &fixture_registry = manor::fixture_registry_t::get();

    std::cout << "Loaded " << room_registry.get_all_rooms().size() << " rooms." << std::endl;
    std::cout << "Loaded " << item_registry.get_all_items().size() << " items." << std::endl;
    std::cout << "Loaded " << fixture_registry.get_all_fixtures().size() << " fixtures." << std::endl;

    int visual_size = config.cell_size - 2 * config.cell_margin;
    auto &asset_mgr = manor::asset_manager_t::get();
    asset_mgr.initialize(config.images_dir, visual_size, visual_size);
    asset_mgr.load_all_images_from_registry();

    auto missing = asset_mgr.get_missing_images();
    if (!missing.empty())
    {
      std::cout << missing.size() << " image(s) missing from " << config.images_dir << ", placeholders will be drawn:"
                << std::endl;
      for (const auto &name : missing)
        std::cout << "  " << name << std::endl;
    }

    auto issues = manor::check_content();
    for (const auto &issue : issues)
    {
      auto &out = issue.severity == manor::issue_severity_t::error ? std::cerr : std::cout;
      out << (issue.severity == manor::issue_severity_t::error ? "ERROR: " : "Warning: ");
      if (!issue.subject.empty())
        out << issue.subject << ": ";
      out << issue.message << std::endl;
    }

    int errors = manor::count_errors(issues);
    std::cout << "Manor Content Check Done: " << errors << " error(s), " << (issues.size() - errors) << " warning(s)."
              << std::endl;
    return errors == 0 ? 0 : 1;
  }
  catch (const std::exception &e)
  {
    std::cerr << "Fatal: " << e.what() << std::endl;
    return 1;
  }
}
