#pragma once

#include <flex_model/types.hpp>
#include <string>
#include <vector>

namespace cell_surface {

struct Cell {
    char32_t ch = U' ';
    flex_model::Color fg;
    flex_model::Color bg;

    friend bool operator==(const Cell& a, const Cell& b) {
        return a.ch == b.ch && a.fg == b.fg && a.bg == b.bg;
    }
    friend bool operator!=(const Cell& a, const Cell& b) { return !(a == b); }
};

// Character grid that widgets draw into. All writes are clipped to the grid.
class CellSurface {
public:
    CellSurface() = default;
    CellSurface(int width, int height);

    void resize(int width, int height);
    int width() const { return width_; }
    int height() const { return height_; }

    void clear(const Cell& fill_cell = Cell{});

    void set_content(int x, int y, char32_t ch, flex_model::Color fg, flex_model::Color bg);
    void fill(const flex_model::Rect& rect, char32_t ch, flex_model::Color fg, flex_model::Color bg);

    // Writes ASCII/UTF-8 text starting at (x, y), at most max_width cells (negative: unbounded).
    // Returns the number of cells written.
    int draw_text(int x, int y, const std::string& text, flex_model::Color fg, flex_model::Color bg,
        int max_width = -1);

    // Single-line box outline on the edge of rect; interior is untouched.
    void draw_box(const flex_model::Rect& rect, flex_model::Color fg, flex_model::Color bg);

    const Cell& at(int x, int y) const;
    bool in_bounds(int x, int y) const { return x >= 0 && y >= 0 && x < width_ && y < height_; }

    // UTF-8 text of one row, for logging and tests.
    std::string row_text(int y) const;

private:
    int width_ = 0;
    int height_ = 0;
    std::vector<Cell> cells_;
};

// Appends the UTF-8 encoding of ch to out.
void append_utf8(std::string& out, char32_t ch);

} // namespace cell_surface
