#include <flex_widgets/visible_flex.hpp>
#include <flex_layout/logging.hpp>
#include <cell_surface/surface.hpp>

namespace flex_widgets {

VisibleFlex::VisibleFlex() = default;

void VisibleFlex::add_item(std::shared_ptr<flex_layout::Primitive> item, int fixed_size, int proportion, bool focus) {
    container_.add_item(std::move(item), fixed_size, proportion, focus);
}

std::size_t VisibleFlex::remove_item(const flex_layout::Primitive* item) {
    return container_.remove_item(item);
}

void VisibleFlex::clear() {
    container_.clear();
}

bool VisibleFlex::resize_item(const flex_layout::Primitive* item, int fixed_size, int proportion) {
    return container_.resize_item(item, fixed_size, proportion);
}

bool VisibleFlex::set_consumers(const flex_layout::Primitive* item, const std::vector<std::size_t>& consumers) {
    return container_.set_consumers(item, consumers);
}

std::vector<flex_layout::Placement> VisibleFlex::layout() const {
    return container_.layout(rect_);
}

bool VisibleFlex::visible() const {
    return !visible_ || visible_(*this);
}

bool VisibleFlex::has_focus() const {
    for (const auto& entry : container_.registry().entries()) {
        if (entry.item.content && entry.item.content->has_focus()) return true;
    }
    return false;
}

void VisibleFlex::draw(cell_surface::CellSurface& surface) {
    // Blank the whole area first so a child hidden since the last frame leaves nothing behind.
    surface.fill(rect_, U' ', flex_model::Color{}, background_);
    if (!visible()) return;

    auto logger = flex_layout::layout_logger();
    logger->debug("Drawing flex container rect=({}, {}, {}, {})", rect_.x, rect_.y, rect_.width, rect_.height);

    std::vector<flex_layout::Primitive*> focused;
    for (const auto& placement : layout()) {
        if (!placement.content) continue;
        placement.content->set_rect(placement.rect);
        if (placement.content->has_focus()) {
            focused.push_back(placement.content.get());
            continue;
        }
        placement.content->draw(surface);
    }
    // Focused children last so they end up on top.
    for (auto* child : focused) {
        child->draw(surface);
    }
}

void VisibleFlex::focus(const flex_layout::FocusDelegate& delegate) {
    for (const auto& entry : container_.registry().entries()) {
        const auto& item = entry.item;
        if (item.content && item.focus && item.content->visible()) {
            if (delegate) delegate(item.content.get());
            return;
        }
    }
}

void VisibleFlex::handle_key(const flex_model::KeyEvent& event, const flex_layout::FocusDelegate& set_focus) {
    for (const auto& entry : container_.registry().entries()) {
        const auto& content = entry.item.content;
        if (content && content->has_focus()) {
            content->handle_key(event, set_focus);
            return;
        }
    }
}

bool VisibleFlex::handle_mouse(const flex_model::MouseEvent& event, const flex_layout::FocusDelegate& set_focus) {
    if (!rect_.contains(event.x, event.y)) return false;
    for (const auto& entry : container_.registry().entries()) {
        const auto& content = entry.item.content;
        if (!content || !content->visible()) continue;
        if (content->handle_mouse(event, set_focus)) return true;
    }
    return false;
}

} // namespace flex_widgets
