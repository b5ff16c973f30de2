#pragma once

#include "core/game/game_state.hpp"
#include "core/graphics/layout.hpp"
#include "core/graphics/window.hpp"

namespace manor
{

/**
 * @brief Dear ImGui overlay: room labels, fixture badges, the inventory
 * panel, the turn message, draft texts and the end banner.
 *
 * Owns the ImGui context for its lifetime.
 */
class hud_t
{
public:
  hud_t(window_t &window, const screen_layout_t &layout);
  ~hud_t();

  hud_t(const hud_t &) = delete;
  auto operator=(const hud_t &) -> hud_t & = delete;

  auto begin_frame() -> void;
  auto render(const game_state_t &game) -> void;
  auto end_frame() -> void;

private:
  auto render_cell_labels(const game_state_t &game) -> void;
  auto render_inventory(const game_state_t &game) -> void;
  auto render_message(const game_state_t &game) -> void;
  auto render_draft(const draft_t &draft) -> void;
  auto render_end_banner(const game_state_t &game) -> void;

  const screen_layout_t &m_layout;
};

} // namespace manor
