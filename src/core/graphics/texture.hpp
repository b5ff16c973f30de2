#pragma once

#include "core/assets/asset_manager.hpp"
#include <map>
#include <memory>
#include <string>

namespace manor
{

class texture_t
{
public:
  explicit texture_t(const image_data_t &image);
  ~texture_t();

  texture_t(const texture_t &) = delete;
  auto operator=(const texture_t &) -> texture_t & = delete;

  auto bind(unsigned int unit = 0) const -> void;

  auto get_width() const -> int
  {
    return m_width;
  }
  auto get_height() const -> int
  {
    return m_height;
  }
  auto get_id() const -> unsigned int
  {
    return m_id;
  }

private:
  unsigned int m_id = 0;
  int m_width = 0;
  int m_height = 0;
};

/**
 * @brief GPU copies of the images the asset manager decoded, uploaded on first use.
 */
class texture_cache_t
{
public:
  // nullptr for placeholders
  auto get(const visual_t &visual) -> const texture_t *;

private:
  std::map<std::string, std::unique_ptr<texture_t>> m_textures;
};

} // namespace manor
