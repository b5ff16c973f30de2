#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace manor
{

/**
 * @brief Session settings, read from assets/config/game.json.
 * Every field has a default so a missing or partial file still plays.
 */
struct game_config_t
{
  // Mansion grid
  int rows = 9;
  int cols = 5;

  // Display
  std::string title = "Blue Manor";
  int cell_size = 70;
  int cell_margin = 3;
  int panel_width = 400; // inventory panel to the right of the grid
  bool vsync = true;

  std::string images_dir = "images";
  std::optional<std::uint32_t> seed;

  // Drafting
  int draft_size = 3;

  // Random finds on room entry
  float find_chance = 0.08f;
  float rabbit_foot_bonus = 0.05f;
  float metal_detector_bonus = 0.05f;

  // Seconds the end banner stays up before the window closes
  float end_delay = 1.5f;

  // action name -> key names, replaces the default binding of that action
  std::map<std::string, std::vector<std::string>> key_bindings;

  auto window_width() const -> int
  {
    return cols * cell_size + panel_width;
  }
  auto window_height() const -> int
  {
    return rows * cell_size + 80;
  }
};

} // namespace manor
