#include "core/graphics/hud.hpp"
#include "core/assets/asset_manager.hpp"
#include "core/content/item.hpp"

#include "imgui.h"
#include "backends/imgui_impl_glfw.h"
#include "backends/imgui_impl_opengl3.h"

#include <string>

namespace manor
{

static const ImU32 TEXT_WHITE = IM_COL32(255, 255, 255, 255);
static const ImU32 TEXT_GREY = IM_COL32(210, 210, 210, 255);
static const ImU32 TEXT_DIM = IM_COL32(120, 120, 120, 255);
static const ImU32 TEXT_BLACK = IM_COL32(0, 0, 0, 255);

// Fixed HUD windows, no chrome
static const ImGuiWindowFlags PANEL_FLAGS = ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_NoMove |
                                            ImGuiWindowFlags_NoSavedSettings | ImGuiWindowFlags_NoFocusOnAppearing |
                                            ImGuiWindowFlags_NoNav | ImGuiWindowFlags_NoInputs;

hud_t::hud_t(window_t &window, const screen_layout_t &layout) : m_layout(layout)
{
  IMGUI_CHECKVERSION();
  ImGui::CreateContext();
  ImGuiIO &io = ImGui::GetIO();
  // HUD windows are fixed, nothing to remember between runs
  io.IniFilename = nullptr;

  ImGui::StyleColorsDark();

  ImGui_ImplGlfw_InitForOpenGL(window.get_native_window(), true);
  ImGui_ImplOpenGL3_Init("#version 330");
}

hud_t::~hud_t()
{
  ImGui_ImplOpenGL3_Shutdown();
  ImGui_ImplGlfw_Shutdown();
  ImGui::DestroyContext();
}

auto hud_t::begin_frame() -> void
{
  ImGui_ImplOpenGL3_NewFrame();
  ImGui_ImplGlfw_NewFrame();
  ImGui::NewFrame();
}

auto hud_t::end_frame() -> void
{
  ImGui::Render();
  ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
}

auto hud_t::render(const game_state_t &game) -> void
{
  render_cell_labels(game);

  if (game.is_inventory_visible())
    render_inventory(game);

  render_message(game);

  if (game.get_draft())
    render_draft(*game.get_draft());

  if (game.is_over())
    render_end_banner(game);
}

auto hud_t::render_cell_labels(const game_state_t &game) -> void
{
  auto *draw_list = ImGui::GetBackgroundDrawList();
  const auto &mansion = game.get_mansion();
  // Labels sit under the draft box darkening
  ImU32 name_color = game.get_draft() ? TEXT_DIM : TEXT_WHITE;

  for (int row = 0; row < mansion.get_rows(); ++row)
  {
    for (int col = 0; col < mansion.get_cols(); ++col)
    {
      const auto &cell = mansion.get_cell({row, col});
      if (!cell.is_placed())
        continue;

      auto rect = m_layout.cell_rect({row, col});

      // Placeholders carry the room name, images speak for themselves
      if (!asset_manager_t::get().has_image(cell.room->image))
      {
        std::string name = cell.room->name.substr(0, 10);
        draw_list->AddText(ImVec2(rect.x + 4.0f, rect.y + 4.0f), name_color, name.c_str());
      }

      if (cell.has_unopened_fixture())
      {
        const auto &badge = cell.fixture->definition->badge;
        draw_list->AddText(ImVec2(rect.right() - 24.0f, rect.y + 2.0f), name_color, badge.c_str());
      }
    }
  }
}

auto hud_t::render_inventory(const game_state_t &game) -> void
{
  auto panel = m_layout.panel_rect();
  ImGui::SetNextWindowPos(ImVec2(panel.x, panel.y), ImGuiCond_Always);
  ImGui::SetNextWindowSize(ImVec2(panel.w, panel.h - 50.0f), ImGuiCond_Always);
  ImGui::SetNextWindowBgAlpha(0.9f);

  if (ImGui::Begin("Inventory", nullptr, PANEL_FLAGS))
  {
    const auto &inventory = game.get_inventory();
    auto &items = item_registry_t::get();

    ImGui::TextUnformatted("Inventory");
    ImGui::Separator();

    ImGui::TextColored(ImVec4(0.82f, 0.82f, 1.0f, 1.0f), "Consumables");
    for (const auto *item : items.get_items_of_kind(item_kind_t::consumable))
    {
      int amount = inventory.count(item->id);
      ImGui::Text("%-10s : %d", item->name.c_str(), amount);
      ImGui::SameLine(170.0f);
      // Small visual bar, capped
      float fraction = amount > 60 ? 1.0f : amount / 60.0f;
      ImGui::ProgressBar(fraction, ImVec2(120.0f, 6.0f), "");
    }

    ImGui::Spacing();
    ImGui::TextColored(ImVec4(0.82f, 0.82f, 1.0f, 1.0f), "Permanents");
    for (const auto *item : items.get_items_of_kind(item_kind_t::permanent))
    {
      if (inventory.has(item->id))
        ImGui::TextColored(ImVec4(0.4f, 0.86f, 0.4f, 1.0f), "[x] %s", item->name.c_str());
      else
        ImGui::TextColored(ImVec4(0.63f, 0.63f, 0.63f, 1.0f), "[ ] %s", item->name.c_str());
    }

    ImGui::Spacing();
    ImGui::Separator();
    ImGui::TextDisabled("Seed %u", game.get_seed());
    ImGui::TextDisabled("Rooms placed: %d", game.get_mansion().placed_count());
  }
  ImGui::End();
}

auto hud_t::render_message(const game_state_t &game) -> void
{
  auto area = m_layout.message_pos();
  auto *draw_list = ImGui::GetBackgroundDrawList();
  std::string line = "Msg: " + game.get_message();
  draw_list->AddText(nullptr, 0.0f, ImVec2(area.x, area.y), IM_COL32(240, 240, 240, 255), line.c_str(), nullptr,
                     m_layout.get_width() - area.x - 10.0f);
}

auto hud_t::render_draft(const draft_t &draft) -> void
{
  auto *draw_list = ImGui::GetForegroundDrawList();

  auto header = m_layout.draft_header_rect();
  draw_list->AddText(ImVec2(header.x + 6.0f, header.y + 4.0f), TEXT_BLACK,
                     "Choose a room (ENTER) or R to redraw (spend a die)");

  int count = (int)draft.candidates.size();
  for (int i = 0; i < count; ++i)
  {
    const auto *room = draft.candidates[i];
    auto slot = m_layout.candidate_rect(i, count);

    draw_list->AddText(ImVec2(slot.x + 6.0f, slot.bottom() - 32.0f), TEXT_WHITE, room->name.c_str());

    std::string details = "Cost: " + std::to_string(room->gem_cost) + "  Rarity: " + std::to_string(room->rarity);
    draw_list->AddText(ImVec2(slot.x + 6.0f, slot.bottom() - 16.0f), TEXT_GREY, details.c_str());
  }
}

auto hud_t::render_end_banner(const game_state_t &game) -> void
{
  bool won = game.get_mode() == game_mode_t::won;

  ImGui::SetNextWindowPos(ImVec2(m_layout.get_width() * 0.5f, m_layout.get_height() * 0.5f), ImGuiCond_Always,
                          ImVec2(0.5f, 0.5f));
  ImGui::SetNextWindowBgAlpha(0.85f);
  if (ImGui::Begin("Game Over", nullptr, PANEL_FLAGS | ImGuiWindowFlags_AlwaysAutoResize))
  {
    ImGui::SetWindowFontScale(2.0f);
    if (won)
      ImGui::TextColored(ImVec4(0.4f, 0.86f, 0.4f, 1.0f), "YOU WIN");
    else
      ImGui::TextColored(ImVec4(0.86f, 0.3f, 0.3f, 1.0f), "GAME OVER");
    ImGui::SetWindowFontScale(1.0f);
    ImGui::TextUnformatted(game.get_message().c_str());
  }
  ImGui::End();
}

} // namespace manor
