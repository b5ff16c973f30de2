#pragma once

#include "core/game/game_config.hpp"
#include "core/mansion/cell.hpp"

namespace manor
{

struct rect_t
{
  float x = 0.0f;
  float y = 0.0f;
  float w = 0.0f;
  float h = 0.0f;

  auto right() const -> float
  {
    return x + w;
  }
  auto bottom() const -> float
  {
    return y + h;
  }
  auto center_x() const -> float
  {
    return x + w * 0.5f;
  }
  auto center_y() const -> float
  {
    return y + h * 0.5f;
  }
};

/**
 * @brief Pixel positions of everything on screen, origin top-left.
 * Shared by the GL renderer and the ImGui overlay so both agree.
 */
class screen_layout_t
{
public:
  explicit screen_layout_t(const game_config_t &config);

  auto get_width() const -> float
  {
    return m_width;
  }
  auto get_height() const -> float
  {
    return m_height;
  }

  // Inner rectangle of a cell, margins removed
  auto cell_rect(grid_pos_t pos) const -> rect_t;

  // Inventory panel right of the grid
  auto panel_rect() const -> rect_t;
  auto message_pos() const -> rect_t;

  // Centered draft box and its candidate slots
  auto draft_panel_rect() const -> rect_t;
  auto draft_header_rect() const -> rect_t;
  auto candidate_rect(int index, int count) const -> rect_t;
  // Square picture area inside a candidate slot
  auto candidate_image_rect(int index, int count) const -> rect_t;

  static constexpr float ORIGIN_X = 20.0f;
  static constexpr float ORIGIN_Y = 20.0f;
  static constexpr float DRAFT_WIDTH = 520.0f;
  static constexpr float DRAFT_HEIGHT = 200.0f;
  static constexpr float DRAFT_HEADER = 24.0f;
  static constexpr float CANDIDATE_TEXT = 34.0f;

private:
  int m_rows;
  int m_cols;
  float m_cell;
  float m_margin;
  float m_width;
  float m_height;
};

} // namespace manor
