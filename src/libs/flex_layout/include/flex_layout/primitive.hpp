#pragma once

#include <flex_model/types.hpp>
#include <functional>

namespace cell_surface {
class CellSurface;
}

namespace flex_layout {

class Primitive;

// Host callback that moves keyboard focus to the given primitive.
using FocusDelegate = std::function<void(Primitive*)>;

// Capability set every child of a container implements. The layout core only calls
// set_rect() and visible(); the rest is used by the widget layer and the host.
class Primitive {
public:
    virtual ~Primitive() = default;

    // Evaluated fresh on every call; may depend on the rect last set.
    virtual bool visible() const = 0;
    virtual bool has_focus() const = 0;

    virtual void set_rect(const flex_model::Rect& rect) = 0;
    virtual flex_model::Rect rect() const = 0;

    virtual void draw(cell_surface::CellSurface& surface) = 0;

    // Called by the host when focus is set on this primitive. Containers pass it on.
    virtual void focus(const FocusDelegate& delegate) = 0;
    virtual void blur() = 0;

    virtual void handle_key(const flex_model::KeyEvent& event, const FocusDelegate& set_focus) {
        (void)event;
        (void)set_focus;
    }
    // Returns true when the event was consumed.
    virtual bool handle_mouse(const flex_model::MouseEvent& event, const FocusDelegate& set_focus) {
        (void)event;
        (void)set_focus;
        return false;
    }
};

} // namespace flex_layout
