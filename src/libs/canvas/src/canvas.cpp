#include <canvas/canvas.hpp>
#include <flex_layout/logging.hpp>
#include <flex_render/renderer.hpp>
#include "imgui.h"
#include <cmath>

namespace {

struct KeyBinding {
    ImGuiKey imgui_key;
    flex_model::Key key;
};

const KeyBinding forwarded_keys[] = {
    {ImGuiKey_Enter, flex_model::Key::Enter},
    {ImGuiKey_Escape, flex_model::Key::Escape},
    {ImGuiKey_Backspace, flex_model::Key::Backspace},
    {ImGuiKey_LeftArrow, flex_model::Key::Left},
    {ImGuiKey_RightArrow, flex_model::Key::Right},
    {ImGuiKey_UpArrow, flex_model::Key::Up},
    {ImGuiKey_DownArrow, flex_model::Key::Down},
};

} // namespace

namespace canvas {

FlexCanvas::FlexCanvas() = default;

FlexCanvas::~FlexCanvas() = default;

void FlexCanvas::set_layout(flex_widgets::BuiltLayout* layout) {
    layout_ = layout;
    focused_ = nullptr;
    if (layout_ && layout_->root) {
        set_focus(layout_->root.get());
    }
}

flex_layout::FocusDelegate FlexCanvas::focus_delegate() {
    return [this](flex_layout::Primitive* p) { set_focus(p); };
}

void FlexCanvas::set_focus(flex_layout::Primitive* primitive) {
    if (focused_ == primitive) return;
    if (focused_) focused_->blur();
    focused_ = primitive;
    if (focused_) focused_->focus(focus_delegate());
}

bool FlexCanvas::toggle_visibility_at(std::size_t ordinal) {
    if (!layout_ || ordinal >= layout_->toggle_ids.size()) return false;
    return toggle_visibility(layout_->toggle_ids[ordinal]);
}

bool FlexCanvas::toggle_visibility(const std::string& id) {
    if (!layout_) return false;
    auto* toggle = layout_->find_toggle(id);
    if (!toggle) return false;
    const bool shown = toggle->toggle();
    flex_layout::layout_logger()->info("visibility_toggled id={} shown={}", id, shown);
    return true;
}

void FlexCanvas::focus_next() {
    if (!layout_ || layout_->panels.empty()) return;
    const auto& panels = layout_->panels;

    std::size_t start = 0;
    for (std::size_t i = 0; i < panels.size(); ++i) {
        if (panels[i].panel.get() == focused_) {
            start = i + 1;
            break;
        }
    }
    for (std::size_t k = 0; k < panels.size(); ++k) {
        const auto& ref = panels[(start + k) % panels.size()];
        if (layout_->is_shown(ref)) {
            set_focus(ref.panel.get());
            return;
        }
    }
}

void FlexCanvas::refocus_if_hidden() {
    if (!layout_ || !layout_->root) return;
    for (const auto& ref : layout_->panels) {
        if (ref.panel.get() != focused_) continue;
        if (layout_->is_shown(ref)) return;
        // A hidden panel keeps no focus; fall back to the root's preferred child.
        focused_->blur();
        focused_ = nullptr;
        set_focus(layout_->root.get());
        return;
    }
}

void FlexCanvas::handle_input(ImVec2 region_min, float region_width, float region_height) {
    if (!layout_ || !layout_->root) return;
    ImGuiIO& io = ImGui::GetIO();
    auto root = layout_->root;
    const auto delegate = focus_delegate();

    for (int i = 0; i < 9; ++i) {
        if (ImGui::IsKeyPressed(static_cast<ImGuiKey>(ImGuiKey_1 + i), false)) {
            toggle_visibility_at(static_cast<std::size_t>(i));
        }
    }
    if (ImGui::IsKeyPressed(ImGuiKey_Tab, false)) {
        focus_next();
    }
    for (const auto& binding : forwarded_keys) {
        if (ImGui::IsKeyPressed(binding.imgui_key)) {
            flex_model::KeyEvent event;
            event.key = binding.key;
            event.ctrl = io.KeyCtrl;
            event.alt = io.KeyAlt;
            event.shift = io.KeyShift;
            root->handle_key(event, delegate);
        }
    }
    for (int i = 0; i < io.InputQueueCharacters.Size; ++i) {
        const char32_t ch = io.InputQueueCharacters[i];
        if ((ch >= U'1' && ch <= U'9') || ch == U'\t') continue;
        flex_model::KeyEvent event;
        event.key = flex_model::Key::Rune;
        event.rune = ch;
        event.ctrl = io.KeyCtrl;
        event.alt = io.KeyAlt;
        event.shift = io.KeyShift;
        root->handle_key(event, delegate);
    }

    const ImVec2 mouse = io.MousePos;
    const bool in_region = mouse.x >= region_min.x && mouse.x < region_min.x + region_width &&
                           mouse.y >= region_min.y && mouse.y < region_min.y + region_height;
    if (!in_region) return;

    flex_model::MouseEvent event;
    event.x = static_cast<int>(std::floor((mouse.x - region_min.x) / cell_.width));
    event.y = static_cast<int>(std::floor((mouse.y - region_min.y) / cell_.height));
    if (ImGui::IsMouseClicked(0)) {
        event.action = flex_model::MouseAction::LeftDown;
        root->handle_mouse(event, delegate);
    }
    if (ImGui::IsMouseReleased(0)) {
        event.action = flex_model::MouseAction::LeftUp;
        root->handle_mouse(event, delegate);
    }
    if (ImGui::IsMouseClicked(1)) {
        event.action = flex_model::MouseAction::RightDown;
        root->handle_mouse(event, delegate);
    }
    if (io.MouseWheel != 0.0f) {
        event.action = io.MouseWheel > 0 ? flex_model::MouseAction::WheelUp : flex_model::MouseAction::WheelDown;
        root->handle_mouse(event, delegate);
    }
}

bool FlexCanvas::update_and_draw(float region_width, float region_height) {
    if (region_width <= 0 || region_height <= 0) return false;

    cell_.width = ImGui::CalcTextSize("M").x;
    cell_.height = ImGui::GetTextLineHeight();
    if (cell_.width <= 0 || cell_.height <= 0) return false;

    const int columns = static_cast<int>(region_width / cell_.width);
    const int rows = static_cast<int>(region_height / cell_.height);
    if (surface_.width() != columns || surface_.height() != rows) {
        surface_.resize(columns, rows);
        flex_layout::layout_logger()->debug("surface resized to {}x{}", columns, rows);
    }

    const ImVec2 region_min = ImGui::GetCursorScreenPos();
    handle_input(region_min, region_width, region_height);

    surface_.clear();
    if (layout_ && layout_->root) {
        layout_->root->set_rect(flex_model::Rect{0, 0, columns, rows});
        layout_->root->draw(surface_);
        refocus_if_hidden();
    }

    ImDrawList* draw_list = ImGui::GetWindowDrawList();
    if (!draw_list) return true;
    flex_render::render_surface(draw_list, surface_, region_min.x, region_min.y, cell_);
    return true;
}

} // namespace canvas
