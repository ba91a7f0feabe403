#pragma once

#include <cstdint>

namespace flex_model {

// Integer cell rectangle. Sizes may come out negative for degenerate containers;
// consumers treat non-positive width/height as empty.
struct Rect {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;

    bool contains(int px, int py) const {
        return px >= x && px < x + width && py >= y && py < y + height;
    }
    bool empty() const { return width <= 0 || height <= 0; }

    friend bool operator==(const Rect& a, const Rect& b) {
        return a.x == b.x && a.y == b.y && a.width == b.width && a.height == b.height;
    }
    friend bool operator!=(const Rect& a, const Rect& b) { return !(a == b); }
};

// Axis along which a container distributes space.
enum class Direction {
    AlongWidth,  // children side by side, primary axis horizontal
    AlongHeight, // children stacked, primary axis vertical
};

struct Color {
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;
    // Terminal default: the host decides what to paint.
    bool is_default = true;

    static Color rgb(std::uint8_t red, std::uint8_t green, std::uint8_t blue) {
        return Color{red, green, blue, false};
    }

    friend bool operator==(const Color& a, const Color& b) {
        if (a.is_default || b.is_default) return a.is_default == b.is_default;
        return a.r == b.r && a.g == b.g && a.b == b.b;
    }
    friend bool operator!=(const Color& a, const Color& b) { return !(a == b); }
};

enum class Key {
    Rune,
    Enter,
    Escape,
    Tab,
    Backspace,
    Left,
    Right,
    Up,
    Down,
};

struct KeyEvent {
    Key key = Key::Rune;
    char32_t rune = 0;
    bool ctrl = false;
    bool alt = false;
    bool shift = false;
};

enum class MouseAction {
    Move,
    LeftDown,
    LeftUp,
    LeftClick,
    RightDown,
    RightUp,
    WheelUp,
    WheelDown,
};

// Mouse position in surface cells.
struct MouseEvent {
    MouseAction action = MouseAction::Move;
    int x = 0;
    int y = 0;
};

} // namespace flex_model
