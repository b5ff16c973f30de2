#pragma once

#include "core/game/game_config.hpp"
#include <string>
#include <vector>

namespace manor
{

class json_loader_t
{
public:
  // items.json, fixtures.json and every room under rooms/
  static auto load_content(const std::string &assets_dir) -> void;

  static auto load_rooms_from_directory(const std::string &directory_path) -> void;
  static auto load_items(const std::string &file_path) -> void;
  static auto load_fixtures(const std::string &file_path) -> void;
  // Returns false when the file is missing or unreadable; config keeps its defaults then.
  static auto load_game_config(const std::string &file_path, game_config_t &config) -> bool;

  // Registers internally, exposed so content can come from memory
  static auto parse_and_register_room(const std::string &json_content, const std::string &filename) -> bool;
  static auto parse_items(const std::string &json_content) -> void;
  static auto parse_fixtures(const std::string &json_content) -> void;
  static auto parse_game_config(const std::string &json_content, game_config_t &config) -> void;
};

} // namespace manor
