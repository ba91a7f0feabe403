#pragma once

#include <cell_surface/surface.hpp>
#include <flex_layout/primitive.hpp>
#include <flex_render/renderer.hpp>
#include <flex_widgets/builder.hpp>
#include <cstddef>
#include <string>

struct ImVec2;

namespace canvas {

// Hosts a widget tree inside an ImGui child region: sizes the cell surface to the region,
// draws the tree into it every frame and turns ImGui input into widget events.
class FlexCanvas {
public:
    FlexCanvas();
    ~FlexCanvas();

    // The layout is not owned and must outlive the canvas or be replaced first.
    void set_layout(flex_widgets::BuiltLayout* layout);
    flex_widgets::BuiltLayout* layout() const { return layout_; }

    // Flips the n-th toggle (document order). Returns false if there is none.
    bool toggle_visibility_at(std::size_t ordinal);
    bool toggle_visibility(const std::string& id);

    void set_focus(flex_layout::Primitive* primitive);
    flex_layout::Primitive* focused() const { return focused_; }
    // Moves focus to the next shown panel after the focused one.
    void focus_next();

    const cell_surface::CellSurface& surface() const { return surface_; }

    bool update_and_draw(float region_width, float region_height);

private:
    flex_widgets::BuiltLayout* layout_ = nullptr;
    flex_layout::Primitive* focused_ = nullptr;
    cell_surface::CellSurface surface_;
    flex_render::CellMetrics cell_;

    flex_layout::FocusDelegate focus_delegate();
    void refocus_if_hidden();
    void handle_input(ImVec2 region_min, float region_width, float region_height);
};

} // namespace canvas
