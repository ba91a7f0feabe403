#pragma once

#include <flex_layout/primitive.hpp>
#include <flex_widgets/visibility.hpp>
#include <flex_model/types.hpp>
#include <functional>
#include <string>
#include <utility>

namespace flex_widgets {

// Bordered, labelled leaf widget.
class Panel : public flex_layout::Primitive {
public:
    using KeyHandler = std::function<void(const flex_model::KeyEvent&)>;

    explicit Panel(std::string label = {});

    void set_label(std::string label) { label_ = std::move(label); }
    const std::string& label() const { return label_; }
    void set_color(flex_model::Color color) { color_ = color; }
    flex_model::Color color() const { return color_; }
    void set_visibility(VisibleFunc visible) { visible_ = std::move(visible); }
    void set_key_handler(KeyHandler handler) { key_handler_ = std::move(handler); }

    bool visible() const override;
    bool has_focus() const override { return focused_; }
    void set_rect(const flex_model::Rect& rect) override { rect_ = rect; }
    flex_model::Rect rect() const override { return rect_; }
    void draw(cell_surface::CellSurface& surface) override;
    void focus(const flex_layout::FocusDelegate& delegate) override;
    void blur() override { focused_ = false; }
    void handle_key(const flex_model::KeyEvent& event, const flex_layout::FocusDelegate& set_focus) override;
    bool handle_mouse(const flex_model::MouseEvent& event, const flex_layout::FocusDelegate& set_focus) override;

private:
    std::string label_;
    flex_model::Color color_;
    VisibleFunc visible_ = always_visible();
    KeyHandler key_handler_;
    flex_model::Rect rect_;
    bool focused_ = false;
};

} // namespace flex_widgets
