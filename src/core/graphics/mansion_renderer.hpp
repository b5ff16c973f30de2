#pragma once

#include <memory>
#include <vector>
#include <glm/glm.hpp>
#include "core/game/game_state.hpp"
#include "core/graphics/layout.hpp"
#include "core/graphics/shader.hpp"
#include "core/graphics/texture.hpp"

namespace manor
{

/**
 * @brief Draws the grid, the player, door locks and the draft box in pixel
 * coordinates. Text is left to the HUD.
 */
class mansion_renderer_t
{
public:
  explicit mansion_renderer_t(const screen_layout_t &layout);
  ~mansion_renderer_t();

  mansion_renderer_t(const mansion_renderer_t &) = delete;
  auto operator=(const mansion_renderer_t &) -> mansion_renderer_t & = delete;

  auto render(const game_state_t &game) -> void;

private:
  auto render_cell(const game_state_t &game, grid_pos_t pos) -> void;
  auto render_draft(const draft_t &draft) -> void;

  auto push_rect(const rect_t &rect, const glm::vec4 &color) -> void;
  auto push_outline(const rect_t &rect, const glm::vec4 &color, float thickness) -> void;
  auto push_disc(float cx, float cy, float radius, const glm::vec4 &color) -> void;
  auto draw_image(const rect_t &rect, const texture_t &texture) -> void;
  auto push_visual(const rect_t &rect, const visual_t &visual) -> void;

  // Draws what has been pushed so far
  auto flush(const texture_t *texture = nullptr) -> void;

  const screen_layout_t &m_layout;
  texture_cache_t m_textures;

  unsigned int m_vao;
  unsigned int m_vbo;

  std::unique_ptr<shader_t> m_shader;
  std::vector<float> m_vertices;
};

} // namespace manor
