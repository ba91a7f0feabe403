#pragma once

#include <flex_layout/primitive.hpp>
#include <functional>
#include <memory>

namespace flex_widgets {

// Visibility predicate of a widget. Receives the widget itself so it can look at the
// rect the container just assigned.
using VisibleFunc = std::function<bool(const flex_layout::Primitive&)>;

VisibleFunc always_visible();
VisibleFunc never_visible();
// Hidden while the widget's rect is narrower than min_width or shorter than min_height.
VisibleFunc visible_when_at_least(int min_width, int min_height);
VisibleFunc all_of(VisibleFunc first, VisibleFunc second);

// Runtime on/off switch shared between the host and the predicates built from it.
class VisibilityToggle {
public:
    explicit VisibilityToggle(bool shown = true);

    void set(bool shown) { *shown_ = shown; }
    bool is_shown() const { return *shown_; }
    // Flips the state and returns the new one.
    bool toggle();

    VisibleFunc predicate() const;

private:
    std::shared_ptr<bool> shown_;
};

} // namespace flex_widgets
