#include "core/graphics/mansion_renderer.hpp"
#include <glad/glad.h>
#include <glm/gtc/matrix_transform.hpp>
#include <cmath>

#include "core/assets/asset_manager.hpp"

namespace manor
{

const std::string vertex_shader_src = R"(
#version 330 core
layout (location = 0) in vec2 aPos;
layout (location = 1) in vec2 aTexCoord;
layout (location = 2) in vec4 aColor;

out vec2 TexCoord;
out vec4 vColor;

uniform mat4 uProjection;

void main() {
    gl_Position = uProjection * vec4(aPos, 0.0, 1.0);
    TexCoord = aTexCoord;
    vColor = aColor;
}
)";

const std::string fragment_shader_src = R"(
#version 330 core
out vec4 FragColor;

in vec2 TexCoord;
in vec4 vColor;

uniform sampler2D uTexture;
uniform int uUseTexture;

void main() {
    if (uUseTexture == 1)
        FragColor = texture(uTexture, TexCoord) * vColor;
    else
        FragColor = vColor;
}
)";

// Pos(2), UV(2), Color(4)
constexpr int FLOATS_PER_VERTEX = 8;

static auto rgb(int r, int g, int b, int a = 255) -> glm::vec4
{
  return {r / 255.0f, g / 255.0f, b / 255.0f, a / 255.0f};
}

static auto to_vec4(const color_t &color) -> glm::vec4
{
  return rgb(color.r, color.g, color.b);
}

static const glm::vec4 CELL_BACKGROUND = rgb(60, 60, 60);
static const glm::vec4 UNEXPLORED = rgb(20, 20, 20);
static const glm::vec4 PLAYER_OUTLINE = rgb(255, 255, 0);
static const glm::vec4 DOOR_OPEN = rgb(150, 150, 150);
static const glm::vec4 DOOR_LOCKED = rgb(200, 120, 60);
static const glm::vec4 DOOR_DOUBLE = rgb(200, 60, 60);

mansion_renderer_t::mansion_renderer_t(const screen_layout_t &layout) : m_layout(layout)
{
  m_shader = std::make_unique<shader_t>(vertex_shader_src, fragment_shader_src);

  glGenVertexArrays(1, &m_vao);
  glGenBuffers(1, &m_vbo);

  glBindVertexArray(m_vao);
  glBindBuffer(GL_ARRAY_BUFFER, m_vbo);

  int stride = FLOATS_PER_VERTEX * sizeof(float);
  glEnableVertexAttribArray(0);
  glVertexAttribPointer(0, 2, GL_FLOAT, GL_FALSE, stride, (void *)0);
  glEnableVertexAttribArray(1);
  glVertexAttribPointer(1, 2, GL_FLOAT, GL_FALSE, stride, (void *)(2 * sizeof(float)));
  glEnableVertexAttribArray(2);
  glVertexAttribPointer(2, 4, GL_FLOAT, GL_FALSE, stride, (void *)(4 * sizeof(float)));

  glBindVertexArray(0);
}

mansion_renderer_t::~mansion_renderer_t()
{
  glDeleteBuffers(1, &m_vbo);
  glDeleteVertexArrays(1, &m_vao);
}

auto mansion_renderer_t::render(const game_state_t &game) -> void
{
  glEnable(GL_BLEND);
  glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);

  m_shader->bind();
  // Top-left origin, y down, one unit per window pixel
  m_shader->set_mat4("uProjection", glm::ortho(0.0f, m_layout.get_width(), m_layout.get_height(), 0.0f));
  m_shader->set_int("uTexture", 0);

  glBindVertexArray(m_vao);

  const auto &mansion = game.get_mansion();
  for (int row = 0; row < mansion.get_rows(); ++row)
  {
    for (int col = 0; col < mansion.get_cols(); ++col)
    {
      render_cell(game, {row, col});
    }
  }
  flush();

  if (game.get_draft())
  {
    render_draft(*game.get_draft());
  }

  glBindVertexArray(0);
  m_shader->unbind();
}

auto mansion_renderer_t::render_cell(const game_state_t &game, grid_pos_t pos) -> void
{
  const auto &cell = game.get_mansion().get_cell(pos);
  auto rect = m_layout.cell_rect(pos);

  push_rect(rect, CELL_BACKGROUND);

  if (cell.is_placed())
  {
    auto visual = asset_manager_t::get().resolve(cell.room->image, cell.room->color);
    push_visual(rect, visual);
  }
  else
  {
    push_rect(rect, UNEXPLORED);
  }

  if (pos == game.get_player_position())
  {
    push_outline(rect, PLAYER_OUTLINE, 3.0f);
  }

  for (auto dir : ALL_DIRECTIONS)
  {
    const auto &level = cell.doors[index_of(dir)];
    if (!level)
      continue;

    float px = rect.center_x();
    float py = rect.center_y();
    switch (dir)
    {
    case direction_t::up:
      py = rect.y + 3.0f;
      break;
    case direction_t::down:
      py = rect.bottom() - 6.0f;
      break;
    case direction_t::left:
      px = rect.x + 3.0f;
      break;
    case direction_t::right:
      px = rect.right() - 6.0f;
      break;
    }

    const auto &color = *level == LOCK_OPEN ? DOOR_OPEN : *level == LOCK_LOCKED ? DOOR_LOCKED : DOOR_DOUBLE;
    push_disc(px, py, 6.0f, color);
  }
}

auto mansion_renderer_t::render_draft(const draft_t &draft) -> void
{
  // Darken everything behind the box
  push_rect({0.0f, 0.0f, m_layout.get_width(), m_layout.get_height()}, rgb(0, 0, 0, 150));
  push_rect(m_layout.draft_panel_rect(), rgb(50, 50, 60));
  push_rect(m_layout.draft_header_rect(), rgb(200, 200, 220));

  int count = (int)draft.candidates.size();
  for (int i = 0; i < count; ++i)
  {
    const auto *room = draft.candidates[i];
    auto slot = m_layout.candidate_rect(i, count);
    push_rect(slot, rgb(80, 80, 90));

    auto visual = asset_manager_t::get().resolve(room->image, room->color);
    push_visual(m_layout.candidate_image_rect(i, count), visual);

    if (i == draft.selection)
    {
      push_outline(slot, PLAYER_OUTLINE, 3.0f);
    }
  }
  flush();
}

auto mansion_renderer_t::push_visual(const rect_t &rect, const visual_t &visual) -> void
{
  const auto *texture = m_textures.get(visual);
  if (texture)
  {
    draw_image(rect, *texture);
  }
  else
  {
    push_rect(rect, to_vec4(visual.color));
  }
}

auto mansion_renderer_t::push_rect(const rect_t &rect, const glm::vec4 &color) -> void
{
  float x1 = rect.x, y1 = rect.y, x2 = rect.right(), y2 = rect.bottom();
  float r = color.r, g = color.g, b = color.b, a = color.a;

  // clang-format off
  m_vertices.insert(m_vertices.end(), {
    x1, y1, 0.0f, 0.0f, r, g, b, a,
    x2, y1, 1.0f, 0.0f, r, g, b, a,
    x2, y2, 1.0f, 1.0f, r, g, b, a,
    x1, y1, 0.0f, 0.0f, r, g, b, a,
    x2, y2, 1.0f, 1.0f, r, g, b, a,
    x1, y2, 0.0f, 1.0f, r, g, b, a});
  // clang-format on
}

auto mansion_renderer_t::push_outline(const rect_t &rect, const glm::vec4 &color, float thickness) -> void
{
  push_rect({rect.x, rect.y, rect.w, thickness}, color);
  push_rect({rect.x, rect.bottom() - thickness, rect.w, thickness}, color);
  push_rect({rect.x, rect.y + thickness, thickness, rect.h - 2.0f * thickness}, color);
  push_rect({rect.right() - thickness, rect.y + thickness, thickness, rect.h - 2.0f * thickness}, color);
}

auto mansion_renderer_t::push_disc(float cx, float cy, float radius, const glm::vec4 &color) -> void
{
  constexpr int SEGMENTS = 12;
  constexpr float TWO_PI = 6.28318530718f;

  for (int i = 0; i < SEGMENTS; ++i)
  {
    float a0 = TWO_PI * i / SEGMENTS;
    float a1 = TWO_PI * (i + 1) / SEGMENTS;
    m_vertices.insert(m_vertices.end(), {cx, cy, 0.5f, 0.5f, color.r, color.g, color.b, color.a});
    m_vertices.insert(m_vertices.end(), {cx + radius * std::cos(a0), cy + radius * std::sin(a0), 0.5f, 0.5f, color.r,
                                         color.g, color.b, color.a});
    m_vertices.insert(m_vertices.end(), {cx + radius * std::cos(a1), cy + radius * std::sin(a1), 0.5f, 0.5f, color.r,
                                         color.g, color.b, color.a});
  }
}

auto mansion_renderer_t::draw_image(const rect_t &rect, const texture_t &texture) -> void
{
  // Keep draw order: whatever came before the image goes first
  flush();
  push_rect(rect, glm::vec4(1.0f));
  flush(&texture);
}

auto mansion_renderer_t::flush(const texture_t *texture) -> void
{
  if (m_vertices.empty())
    return;

  if (texture)
  {
    texture->bind(0);
  }
  m_shader->set_int("uUseTexture", texture ? 1 : 0);

  glBindBuffer(GL_ARRAY_BUFFER, m_vbo);
  glBufferData(GL_ARRAY_BUFFER, m_vertices.size() * sizeof(float), m_vertices.data(), GL_DYNAMIC_DRAW);
  glDrawArrays(GL_TRIANGLES, 0, (GLsizei)(m_vertices.size() / FLOATS_PER_VERTEX));

  m_vertices.clear();
}

} // namespace manor
