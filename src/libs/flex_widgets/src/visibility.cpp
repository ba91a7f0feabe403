#include <flex_widgets/visibility.hpp>
#include <utility>

namespace flex_widgets {

VisibleFunc always_visible() {
    return [](const flex_layout::Primitive&) { return true; };
}

VisibleFunc never_visible() {
    return [](const flex_layout::Primitive&) { return false; };
}

VisibleFunc visible_when_at_least(int min_width, int min_height) {
    return [min_width, min_height](const flex_layout::Primitive& p) {
        const auto r = p.rect();
        return r.width >= min_width && r.height >= min_height;
    };
}

VisibleFunc all_of(VisibleFunc first, VisibleFunc second) {
    return [first = std::move(first), second = std::move(second)](const flex_layout::Primitive& p) {
        return (!first || first(p)) && (!second || second(p));
    };
}

VisibilityToggle::VisibilityToggle(bool shown)
    : shown_(std::make_shared<bool>(shown))
{
}

bool VisibilityToggle::toggle() {
    *shown_ = !*shown_;
    return *shown_;
}

VisibleFunc VisibilityToggle::predicate() const {
    std::shared_ptr<bool> shown = shown_;
    return [shown](const flex_layout::Primitive&) { return *shown; };
}

} // namespace flex_widgets
