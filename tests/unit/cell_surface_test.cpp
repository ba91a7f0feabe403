#include <cell_surface/surface.hpp>

#include <gtest/gtest.h>

using cell_surface::Cell;
using cell_surface::CellSurface;
using flex_model::Color;
using flex_model::Rect;

TEST(CellSurfaceTest, StartsBlank) {
    CellSurface surface(4, 2);
    EXPECT_EQ(surface.width(), 4);
    EXPECT_EQ(surface.height(), 2);
    EXPECT_EQ(surface.row_text(0), "    ");
    EXPECT_EQ(surface.at(3, 1), Cell{});
}

TEST(CellSurfaceTest, NegativeSizeClampsToEmpty) {
    CellSurface surface(-3, 5);
    EXPECT_EQ(surface.width(), 0);
    EXPECT_EQ(surface.height(), 5);
    EXPECT_EQ(surface.row_text(0), "");
}

TEST(CellSurfaceTest, WritesOutsideAreClipped) {
    CellSurface surface(3, 3);
    surface.set_content(-1, 0, U'x', Color{}, Color{});
    surface.set_content(3, 0, U'x', Color{}, Color{});
    surface.set_content(0, 5, U'x', Color{}, Color{});
    for (int y = 0; y < 3; ++y) {
        EXPECT_EQ(surface.row_text(y), "   ");
    }
    EXPECT_FALSE(surface.in_bounds(3, 0));
    // Out-of-range reads return a blank cell.
    EXPECT_EQ(surface.at(-1, -1), Cell{});
}

TEST(CellSurfaceTest, FillClipsToSurface) {
    CellSurface surface(4, 3);
    const Color bg = Color::rgb(10, 20, 30);
    surface.fill(Rect{2, 1, 10, 10}, U'#', Color{}, bg);
    EXPECT_EQ(surface.row_text(0), "    ");
    EXPECT_EQ(surface.row_text(1), "  ##");
    EXPECT_EQ(surface.row_text(2), "  ##");
    EXPECT_EQ(surface.at(3, 2).bg, bg);

    surface.fill(Rect{0, 0, 0, 3}, U'!', Color{}, bg);
    EXPECT_EQ(surface.row_text(0), "    ");
}

TEST(CellSurfaceTest, DrawTextHonoursMaxWidth) {
    CellSurface surface(10, 1);
    EXPECT_EQ(surface.draw_text(1, 0, "hello", Color{}, Color{}, 3), 3);
    EXPECT_EQ(surface.row_text(0), " hel      ");
    EXPECT_EQ(surface.draw_text(0, 0, "abc", Color{}, Color{}, 0), 0);
}

TEST(CellSurfaceTest, DrawTextDecodesUtf8) {
    CellSurface surface(4, 1);
    EXPECT_EQ(surface.draw_text(0, 0, "a\xC3\xA9\xE2\x94\x80", Color{}, Color{}), 3);
    EXPECT_EQ(surface.at(0, 0).ch, U'a');
    EXPECT_EQ(surface.at(1, 0).ch, U'é');
    EXPECT_EQ(surface.at(2, 0).ch, U'─');
    EXPECT_EQ(surface.row_text(0), "a\xC3\xA9\xE2\x94\x80 ");
}

TEST(CellSurfaceTest, DrawBoxOutlinesRect) {
    CellSurface surface(4, 3);
    surface.draw_box(Rect{0, 0, 4, 3}, Color{}, Color{});
    EXPECT_EQ(surface.row_text(0), "\xE2\x94\x8C\xE2\x94\x80\xE2\x94\x80\xE2\x94\x90");
    EXPECT_EQ(surface.row_text(1), "\xE2\x94\x82  \xE2\x94\x82");
    EXPECT_EQ(surface.row_text(2), "\xE2\x94\x94\xE2\x94\x80\xE2\x94\x80\xE2\x94\x98");
}

TEST(CellSurfaceTest, ClearResetsEveryCell) {
    CellSurface surface(2, 2);
    surface.draw_text(0, 0, "ab", Color{}, Color{});
    Cell fill;
    fill.ch = U'.';
    surface.clear(fill);
    EXPECT_EQ(surface.row_text(0), "..");
    EXPECT_EQ(surface.row_text(1), "..");
}

TEST(CellSurfaceTest, AppendUtf8EncodesAllLengths) {
    std::string out;
    cell_surface::append_utf8(out, U'A');
    cell_surface::append_utf8(out, U'é');
    cell_surface::append_utf8(out, U'└');
    cell_surface::append_utf8(out, U'\U0001F600');
    EXPECT_EQ(out, "A\xC3\xA9\xE2\x94\x94\xF0\x9F\x98\x80");
}
