#pragma once

#include <flex_model/types.hpp>

struct ImDrawList;

namespace cell_surface {
class CellSurface;
}

namespace flex_render {

// Size of one surface cell in screen pixels.
struct CellMetrics {
    float width = 8.0f;
    float height = 16.0f;
};

// Packs c as IM_COL32; default colors map to fallback.
unsigned int to_im_color(const flex_model::Color& c, unsigned int fallback);

// Paints every cell of surface with its top-left corner at (origin_x, origin_y).
// Cells with a default background are left transparent.
void render_surface(ImDrawList* draw_list, const cell_surface::CellSurface& surface,
    float origin_x, float origin_y, const CellMetrics& cell);

} // namespace flex_render
