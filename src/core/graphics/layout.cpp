#include "core/graphics/layout.hpp"
#include <algorithm>

namespace manor
{

screen_layout_t::screen_layout_t(const game_config_t &config)
    : m_rows(config.rows), m_cols(config.cols), m_cell((float)config.cell_size), m_margin((float)config.cell_margin),
      m_width((float)config.window_width()), m_height((float)config.window_height())
{
}

auto screen_layout_t::cell_rect(grid_pos_t pos) const -> rect_t
{
  float x = ORIGIN_X + pos.col * m_cell;
  float y = ORIGIN_Y + pos.row * m_cell;
  return {x + m_margin, y + m_margin, m_cell - 2.0f * m_margin, m_cell - 2.0f * m_margin};
}

auto screen_layout_t::panel_rect() const -> rect_t
{
  float x = m_cols * m_cell + 25.0f;
  return {x, 10.0f, m_width - x - 10.0f, m_height - 20.0f};
}

auto screen_layout_t::message_pos() const -> rect_t
{
  return {ORIGIN_X, ORIGIN_Y + m_rows * m_cell + 10.0f, m_cols * m_cell, 40.0f};
}

auto screen_layout_t::draft_panel_rect() const -> rect_t
{
  return {(m_width - DRAFT_WIDTH) * 0.5f, (m_height - DRAFT_HEIGHT) * 0.5f, DRAFT_WIDTH, DRAFT_HEIGHT};
}

auto screen_layout_t::draft_header_rect() const -> rect_t
{
  auto panel = draft_panel_rect();
  return {panel.x, panel.y, panel.w, DRAFT_HEADER};
}

auto screen_layout_t::candidate_rect(int index, int count) const -> rect_t
{
  auto panel = draft_panel_rect();
  int slots = std::max(count, 1);
  float slot_w = panel.w / slots;
  float top = panel.y + DRAFT_HEADER + 12.0f;
  return {panel.x + 10.0f + index * slot_w, top, slot_w - 10.0f, panel.bottom() - top - 10.0f};
}

auto screen_layout_t::candidate_image_rect(int index, int count) const -> rect_t
{
  auto slot = candidate_rect(index, count);
  float size = std::min(slot.w - 8.0f, slot.h - CANDIDATE_TEXT - 4.0f);
  return {slot.center_x() - size * 0.5f, slot.y + 4.0f, size, size};
}

} // namespace manor
