#include "core/assets/asset_manager.hpp"
#include "core/content/room.hpp"
#include <filesystem>
#include <iostream>

#define STB_IMAGE_IMPLEMENTATION
#include "stb_image.h"

namespace manor
{

auto asset_manager_t::get() -> asset_manager_t &
{
  static asset_manager_t instance;
  return instance;
}

auto asset_manager_t::initialize(const std::string &images_dir, int placeholder_width, int placeholder_height) -> void
{
  m_images_dir = images_dir;
  m_placeholder_width = placeholder_width;
  m_placeholder_height = placeholder_height;
  m_images.clear();

  if (!std::filesystem::is_directory(m_images_dir))
  {
    std::cout << "No image directory at " << m_images_dir << ", drawing placeholders." << std::endl;
  }
}

auto asset_manager_t::placeholder_color(const std::string &color_name) -> color_t
{
  if (color_name == "green")
    return {60, 130, 60};
  if (color_name == "purple")
    return {110, 60, 110};
  if (color_name == "orange")
    return {200, 120, 60};
  if (color_name == "blue")
    return {60, 90, 160};
  return {120, 120, 120};
}

auto asset_manager_t::load_image(const std::string &image_name) -> const image_data_t *
{
  auto it = m_images.find(image_name);
  if (it != m_images.end())
  {
    return it->second ? &*it->second : nullptr;
  }

  // Remember the outcome either way so a missing file is only probed once
  auto &slot = m_images[image_name];
  if (image_name.empty())
    return nullptr;

  std::filesystem::path path = std::filesystem::path(m_images_dir) / image_name;
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec))
  {
    std::cerr << "Image not found: " << path.string() << " (placeholder used)" << std::endl;
    return nullptr;
  }

  int width, height, channels;
  unsigned char *data = stbi_load(path.string().c_str(), &width, &height, &channels, 4); // Force RGBA
  if (!data)
  {
    std::cerr << "Failed to decode image " << path.string() << ": " << stbi_failure_reason() << " (placeholder used)"
              << std::endl;
    return nullptr;
  }

  image_data_t image;
  image.width = width;
  image.height = height;
  image.pixels.assign(data, data + static_cast<size_t>(width) * height * 4);
  stbi_image_free(data);

  slot = std::move(image);
  return &*slot;
}

auto asset_manager_t::resolve(const std::string &image_name, const std::string &color_name) -> visual_t
{
  visual_t visual;
  visual.image_name = image_name;
  visual.color = placeholder_color(color_name);

  if (const auto *image = load_image(image_name))
  {
    visual.kind = visual_kind_t::image;
    visual.image = image;
    visual.width = image->width;
    visual.height = image->height;
    return visual;
  }

  visual.kind = visual_kind_t::placeholder;
  visual.width = m_placeholder_width;
  visual.height = m_placeholder_height;
  return visual;
}

auto asset_manager_t::has_image(const std::string &image_name) -> bool
{
  return load_image(image_name) != nullptr;
}

auto asset_manager_t::load_all_images_from_registry() -> void
{
  int loaded = 0;
  const auto &rooms = room_registry_t::get().get_all_rooms();
  for (const auto &[id, def] : rooms)
  {
    if (load_image(def.image))
      ++loaded;
  }
  std::cout << "Loaded " << loaded << " of " << rooms.size() << " room images." << std::endl;
}

auto asset_manager_t::get_missing_images() const -> std::vector<std::string>
{
  std::vector<std::string> missing;
  for (const auto &[name, image] : m_images)
  {
    if (!image && !name.empty())
      missing.push_back(name);
  }
  return missing;
}

} // namespace manor
