#include <flex_render/renderer.hpp>
#include <cell_surface/surface.hpp>
#include "imgui.h"
#include <string>

namespace flex_render {

namespace {

const unsigned int default_text_color = IM_COL32(220, 220, 220, 255);

} // namespace

unsigned int to_im_color(const flex_model::Color& c, unsigned int fallback) {
    if (c.is_default) return fallback;
    return IM_COL32(c.r, c.g, c.b, 255);
}

void render_surface(ImDrawList* draw_list, const cell_surface::CellSurface& surface,
    float origin_x, float origin_y, const CellMetrics& cell)
{
    if (!draw_list) return;

    // Backgrounds first, merged into runs of equal color per row.
    for (int y = 0; y < surface.height(); ++y) {
        const float top = origin_y + y * cell.height;
        int run_start = 0;
        while (run_start < surface.width()) {
            const flex_model::Color bg = surface.at(run_start, y).bg;
            int run_end = run_start + 1;
            while (run_end < surface.width() && surface.at(run_end, y).bg == bg) ++run_end;
            if (!bg.is_default) {
                draw_list->AddRectFilled(
                    ImVec2(origin_x + run_start * cell.width, top),
                    ImVec2(origin_x + run_end * cell.width, top + cell.height),
                    to_im_color(bg, 0));
            }
            run_start = run_end;
        }
    }

    std::string glyph;
    for (int y = 0; y < surface.height(); ++y) {
        for (int x = 0; x < surface.width(); ++x) {
            const auto& c = surface.at(x, y);
            if (c.ch == U' ' || c.ch == 0) continue;
            glyph.clear();
            cell_surface::append_utf8(glyph, c.ch);
            draw_list->AddText(ImVec2(origin_x + x * cell.width, origin_y + y * cell.height),
                to_im_color(c.fg, default_text_color), glyph.c_str());
        }
    }
}

} // namespace flex_render
