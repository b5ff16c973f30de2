#include "core/assets/asset_manager.hpp"
#include "core/assets/json_loader.hpp"
#include "core/content/room.hpp"
#include "core/game/game_state.hpp"
#include "core/graphics/hud.hpp"
#include "core/graphics/layout.hpp"
#include "core/graphics/mansion_renderer.hpp"
#include "core/graphics/window.hpp"
#include "core/input/input_map.hpp"
#include <glad/glad.h>
#include <exception>
#include <iostream>
#include <optional>
#include <string>

struct options_t
{
  std::string assets_dir = "assets";
  std::optional<std::string> images_dir;
  std::optional<std::uint32_t> seed;
};

static void print_usage(const char *program)
{
  std::cerr << "Usage: " << program << " [--assets <dir>] [--images <dir>] [--seed <n>]" << std::endl;
}

// nullopt on a malformed command line
static auto parse_options(int argc, char *argv[]) -> std::optional<options_t>
{
  options_t options;
  for (int i = 1; i < argc; ++i)
  {
    std::string arg = argv[i];
    bool has_value = i + 1 < argc;

    if (arg == "--assets" && has_value)
    {
      options.assets_dir = argv[++i];
    }
    else if (arg == "--images" && has_value)
    {
      options.images_dir = argv[++i];
    }
    else if (arg == "--seed" && has_value)
    {
      try
      {
        options.seed = static_cast<std::uint32_t>(std::stoul(argv[++i]));
      }
      catch (const std::exception &)
      {
        std::cerr << "Invalid seed: " << argv[i] << std::endl;
        return std::nullopt;
      }
    }
    else
    {
      std::cerr << "Unknown argument: " << arg << std::endl;
      return std::nullopt;
    }
  }
  return options;
}

int main(int argc, char *argv[])
{
  auto options = parse_options(argc, argv);
  if (!options)
  {
    print_usage(argv[0]);
    return 1;
  }

  std::cout << "Manor Starting..." << std::endl;

  try
  {
    manor::game_config_t config;
    manor::json_loader_t::load_game_config(options->assets_dir + "/config/game.json", config);
    if (options->images_dir)
      config.images_dir = *options->images_dir;
    if (options->seed)
      config.seed = options->seed;

    // Load Content
    std::cout << "Loading Content..." << std::endl;
    manor::json_loader_t::load_content(options->assets_dir);
    std::cout << "Loaded " << manor::room_registry_t::get().get_all_rooms().size() << " rooms." << std::endl;

    int visual_size = config.cell_size - 2 * config.cell_margin;
    auto &asset_mgr = manor::asset_manager_t::get();
    asset_mgr.initialize(config.images_dir, visual_size, visual_size);
    asset_mgr.load_all_images_from_registry();

    manor::game_state_t game(config);

    manor::input_map_t input;
    input.apply_overrides(config.key_bindings);

    manor::window_t::properties_t props;
    props.title = config.title;
    props.width = config.window_width();
    props.height = config.window_height();
    props.vsync = config.vsync;
    props.key_callback = [&input, &game](const std::string &key_name) { input.handle_key(key_name, game); };

    manor::window_t window(props);

    manor::screen_layout_t layout(config);
    manor::mansion_renderer_t renderer(layout);
    manor::hud_t hud(window, layout);

    std::optional<double> ended_at;

    // Main Loop
    while (!window.should_close())
    {
      window.update();

      if (!game.is_running())
      {
        window.close();
        continue;
      }

      game.check_end_conditions();
      if (game.is_over())
      {
        double now = window.get_time();
        if (!ended_at)
        {
          ended_at = now;
          std::cout << "Game ended (" << manor::to_string(game.get_mode()) << "): " << game.get_message() << std::endl;
        }
        else if (now - *ended_at >= config.end_delay)
        {
          window.close();
        }
      }

      // Render
      glClearColor(30 / 255.0f, 30 / 255.0f, 30 / 255.0f, 1.0f);
      glClear(GL_COLOR_BUFFER_BIT);

      hud.begin_frame();
      renderer.render(game);
      hud.render(game);
      hud.end_frame();

      window.swap_buffers();
    }
  }
  catch (const std::exception &e)
  {
    std::cerr << "Fatal: " << e.what() << std::endl;
    return 1;
  }

  std::cout << "Manor Shutting Down." << std::endl;
  return 0;
}
