#include <flex_widgets/panel.hpp>
#include <cell_surface/surface.hpp>

namespace flex_widgets {

namespace {

const flex_model::Color border_color = flex_model::Color::rgb(110, 110, 118);
const flex_model::Color focus_border_color = flex_model::Color::rgb(230, 190, 60);
const flex_model::Color text_color = flex_model::Color::rgb(220, 220, 220);

} // namespace

Panel::Panel(std::string label)
    : label_(std::move(label))
{
}

bool Panel::visible() const {
    return !visible_ || visible_(*this);
}

void Panel::draw(cell_surface::CellSurface& surface) {
    if (rect_.empty()) return;

    surface.fill(rect_, U' ', text_color, color_);
    if (rect_.width >= 3 && rect_.height >= 3) {
        surface.draw_box(rect_, focused_ ? focus_border_color : border_color, color_);
        surface.draw_text(rect_.x + 1, rect_.y + 1, label_, text_color, color_, rect_.width - 2);
    } else {
        surface.draw_text(rect_.x, rect_.y, label_, focused_ ? focus_border_color : text_color, color_,
            rect_.width);
    }
}

void Panel::focus(const flex_layout::FocusDelegate& delegate) {
    (void)delegate;
    focused_ = true;
}

void Panel::handle_key(const flex_model::KeyEvent& event, const flex_layout::FocusDelegate& set_focus) {
    (void)set_focus;
    if (key_handler_) key_handler_(event);
}

bool Panel::handle_mouse(const flex_model::MouseEvent& event, const flex_layout::FocusDelegate& set_focus) {
    if (!rect_.contains(event.x, event.y)) return false;
    if (event.action != flex_model::MouseAction::LeftDown && event.action != flex_model::MouseAction::LeftClick)
        return false;
    if (set_focus) set_focus(this);
    return true;
}

} // namespace flex_widgets
