#pragma once

#include <flex_layout/container.hpp>
#include <flex_layout/primitive.hpp>
#include <flex_widgets/visibility.hpp>
#include <flex_model/types.hpp>
#include <cstddef>
#include <memory>
#include <utility>
#include <vector>

namespace flex_widgets {

// Container widget: lays its children out with flex_layout::Container, draws the visible
// ones and routes focus, keys and mouse events to them. Hidden children never receive
// focus or mouse input.
class VisibleFlex : public flex_layout::Primitive {
public:
    VisibleFlex();

    void set_visibility(VisibleFunc visible) { visible_ = std::move(visible); }
    void set_direction(flex_model::Direction direction) { container_.set_direction(direction); }
    flex_model::Direction direction() const { return container_.direction(); }
    void set_background(flex_model::Color color) { background_ = color; }
    flex_model::Color background() const { return background_; }

    void add_item(std::shared_ptr<flex_layout::Primitive> item, int fixed_size, int proportion, bool focus);
    std::size_t remove_item(const flex_layout::Primitive* item);
    void clear();
    bool resize_item(const flex_layout::Primitive* item, int fixed_size, int proportion);
    bool set_consumers(const flex_layout::Primitive* item, const std::vector<std::size_t>& consumers);

    const flex_layout::Container& container() const { return container_; }

    // Placements for the current rect. Also leaves every child at its provisional rect.
    std::vector<flex_layout::Placement> layout() const;

    bool visible() const override;
    bool has_focus() const override;
    void set_rect(const flex_model::Rect& rect) override { rect_ = rect; }
    flex_model::Rect rect() const override { return rect_; }
    void draw(cell_surface::CellSurface& surface) override;
    void focus(const flex_layout::FocusDelegate& delegate) override;
    void blur() override {}
    void handle_key(const flex_model::KeyEvent& event, const flex_layout::FocusDelegate& set_focus) override;
    bool handle_mouse(const flex_model::MouseEvent& event, const flex_layout::FocusDelegate& set_focus) override;

private:
    flex_layout::Container container_;
    VisibleFunc visible_ = always_visible();
    flex_model::Color background_;
    flex_model::Rect rect_;
};

} // namespace flex_widgets
