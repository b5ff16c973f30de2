#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace manor
{

struct color_t
{
  std::uint8_t r, g, b;

  auto operator==(const color_t &other) const -> bool
  {
    return r == other.r && g == other.g && b == other.b;
  }
};

// Decoded RGBA8 pixels
struct image_data_t
{
  int width = 0;
  int height = 0;
  std::vector<unsigned char> pixels;
};

enum class visual_kind_t
{
  image,
  placeholder
};

/**
 * @brief What to draw for one room or candidate: a decoded image, or a
 * solid colour rectangle of the placeholder size when the image is missing.
 */
struct visual_t
{
  visual_kind_t kind = visual_kind_t::placeholder;
  std::string image_name;
  const image_data_t *image = nullptr; // owned by asset_manager_t, set for kind == image
  color_t color{120, 120, 120};
  int width = 0;
  int height = 0;
};

/**
 * @brief Loads room images from the images directory and falls back to
 * coloured placeholders. Resolution never fails.
 */
class asset_manager_t
{
public:
  static auto get() -> asset_manager_t &;

  asset_manager_t(const asset_manager_t &) = delete;
  auto operator=(const asset_manager_t &) -> asset_manager_t & = delete;

  // Drops every cached image
  auto initialize(const std::string &images_dir, int placeholder_width, int placeholder_height) -> void;

  // Image when images/<image_name> exists and decodes, placeholder otherwise
  auto resolve(const std::string &image_name, const std::string &color_name) -> visual_t;

  auto has_image(const std::string &image_name) -> bool;

  // Loads every image referenced by registered rooms
  auto load_all_images_from_registry() -> void;

  // Names that were looked up and could not be loaded
  auto get_missing_images() const -> std::vector<std::string>;

  auto get_images_dir() const -> const std::string &
  {
    return m_images_dir;
  }

  static auto placeholder_color(const std::string &color_name) -> color_t;

private:
  asset_manager_t() = default;

  auto load_image(const std::string &image_name) -> const image_data_t *;

  std::string m_images_dir = "images";
  int m_placeholder_width = 64;
  int m_placeholder_height = 64;

  // nullopt marks a name already known to be missing
  std::map<std::string, std::optional<image_data_t>> m_images;
};

} // namespace manor
