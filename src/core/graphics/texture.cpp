#include "core/graphics/texture.hpp"
#include <glad/glad.h>

namespace manor
{

texture_t::texture_t(const image_data_t &image) : m_width(image.width), m_height(image.height)
{
  glGenTextures(1, &m_id);
  glBindTexture(GL_TEXTURE_2D, m_id);

  glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
  glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA, m_width, m_height, 0, GL_RGBA, GL_UNSIGNED_BYTE, image.pixels.data());
  glGenerateMipmap(GL_TEXTURE_2D);

  // Room art is scaled down to the cell, so filter smoothly
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_LINEAR_MIPMAP_LINEAR);
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_LINEAR);
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
}

texture_t::~texture_t()
{
  if (m_id != 0)
  {
    glDeleteTextures(1, &m_id);
  }
}

auto texture_t::bind(unsigned int unit) const -> void
{
  glActiveTexture(GL_TEXTURE0 + unit);
  glBindTexture(GL_TEXTURE_2D, m_id);
}

auto texture_cache_t::get(const visual_t &visual) -> const texture_t *
{
  if (visual.kind != visual_kind_t::image || !visual.image)
    return nullptr;

  auto it = m_textures.find(visual.image_name);
  if (it != m_textures.end())
    return it->second.get();

  auto texture = std::make_unique<texture_t>(*visual.image);
  auto *ptr = texture.get();
  m_textures[visual.image_name] = std::move(texture);
  return ptr;
}

} // namespace manor
