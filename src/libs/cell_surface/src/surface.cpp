#include <cell_surface/surface.hpp>
#include <algorithm>

namespace cell_surface {

namespace {

constexpr char32_t box_horizontal = U'─';
constexpr char32_t box_vertical = U'│';
constexpr char32_t box_top_left = U'┌';
constexpr char32_t box_top_right = U'┐';
constexpr char32_t box_bottom_left = U'└';
constexpr char32_t box_bottom_right = U'┘';

// Decodes one UTF-8 sequence at text[i], advancing i. Invalid bytes map to U+FFFD.
char32_t next_code_point(const std::string& text, std::size_t& i) {
    const auto lead = static_cast<unsigned char>(text[i++]);
    if (lead < 0x80) return lead;

    int extra = 0;
    char32_t cp = 0;
    if ((lead & 0xE0) == 0xC0) {
        extra = 1;
        cp = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        extra = 2;
        cp = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
        extra = 3;
        cp = lead & 0x07;
    } else {
        return U'�';
    }
    for (int k = 0; k < extra; ++k) {
        if (i >= text.size()) return U'�';
        const auto cont = static_cast<unsigned char>(text[i]);
        if ((cont & 0xC0) != 0x80) return U'�';
        cp = (cp << 6) | (cont & 0x3F);
        ++i;
    }
    return cp;
}

} // namespace

CellSurface::CellSurface(int width, int height) {
    resize(width, height);
}

void CellSurface::resize(int width, int height) {
    width_ = std::max(0, width);
    height_ = std::max(0, height);
    cells_.assign(static_cast<std::size_t>(width_) * static_cast<std::size_t>(height_), Cell{});
}

void CellSurface::clear(const Cell& fill_cell) {
    std::fill(cells_.begin(), cells_.end(), fill_cell);
}

void CellSurface::set_content(int x, int y, char32_t ch, flex_model::Color fg, flex_model::Color bg) {
    if (!in_bounds(x, y)) return;
    Cell& cell = cells_[static_cast<std::size_t>(y) * width_ + x];
    cell.ch = ch;
    cell.fg = fg;
    cell.bg = bg;
}

void CellSurface::fill(const flex_model::Rect& rect, char32_t ch, flex_model::Color fg, flex_model::Color bg) {
    if (rect.empty()) return;
    const int x0 = std::max(0, rect.x);
    const int y0 = std::max(0, rect.y);
    const int x1 = std::min(width_, rect.x + rect.width);
    const int y1 = std::min(height_, rect.y + rect.height);
    for (int y = y0; y < y1; ++y) {
        for (int x = x0; x < x1; ++x) {
            set_content(x, y, ch, fg, bg);
        }
    }
}

int CellSurface::draw_text(int x, int y, const std::string& text, flex_model::Color fg, flex_model::Color bg,
    int max_width)
{
    int written = 0;
    std::size_t i = 0;
    while (i < text.size()) {
        if (max_width >= 0 && written >= max_width) break;
        const char32_t cp = next_code_point(text, i);
        set_content(x + written, y, cp, fg, bg);
        ++written;
    }
    return written;
}

void CellSurface::draw_box(const flex_model::Rect& rect, flex_model::Color fg, flex_model::Color bg) {
    if (rect.empty()) return;
    const int right = rect.x + rect.width - 1;
    const int bottom = rect.y + rect.height - 1;

    for (int x = rect.x; x <= right; ++x) {
        set_content(x, rect.y, box_horizontal, fg, bg);
        set_content(x, bottom, box_horizontal, fg, bg);
    }
    for (int y = rect.y; y <= bottom; ++y) {
        set_content(rect.x, y, box_vertical, fg, bg);
        set_content(right, y, box_vertical, fg, bg);
    }
    if (rect.width >= 2 && rect.height >= 2) {
        set_content(rect.x, rect.y, box_top_left, fg, bg);
        set_content(right, rect.y, box_top_right, fg, bg);
        set_content(rect.x, bottom, box_bottom_left, fg, bg);
        set_content(right, bottom, box_bottom_right, fg, bg);
    }
}

const Cell& CellSurface::at(int x, int y) const {
    static const Cell empty;
    if (!in_bounds(x, y)) return empty;
    return cells_[static_cast<std::size_t>(y) * width_ + x];
}

std::string CellSurface::row_text(int y) const {
    std::string out;
    if (y < 0 || y >= height_) return out;
    for (int x = 0; x < width_; ++x) {
        append_utf8(out, at(x, y).ch);
    }
    return out;
}

void append_utf8(std::string& out, char32_t ch) {
    if (ch < 0x80) {
        out.push_back(static_cast<char>(ch));
    } else if (ch < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (ch >> 6)));
        out.push_back(static_cast<char>(0x80 | (ch & 0x3F)));
    } else if (ch < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (ch >> 12)));
        out.push_back(static_cast<char>(0x80 | ((ch >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (ch & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (ch >> 18)));
        out.push_back(static_cast<char>(0x80 | ((ch >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((ch >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (ch & 0x3F)));
    }
}

} // namespace cell_surface
