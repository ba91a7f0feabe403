#pragma once

#include <flex_layout/item_registry.hpp>
#include <flex_layout/layout_passes.hpp>
#include <flex_model/types.hpp>
#include <cstddef>
#include <memory>
#include <vector>

namespace flex_layout {

// Single-axis container: fixed and proportional children, with the space of hidden
// children handed to their consumers. Nothing is cached between layouts.
class Container {
public:
    Container() = default;

    void add_item(std::shared_ptr<Primitive> content, int fixed_size, int proportion, bool focus);
    std::size_t remove_item(const Primitive* content);
    void clear();
    bool resize_item(const Primitive* content, int fixed_size, int proportion);
    bool set_consumers(const Primitive* content, const std::vector<std::size_t>& consumers);

    void set_direction(flex_model::Direction direction) { direction_ = direction; }
    flex_model::Direction direction() const { return direction_; }

    const ItemRegistry& registry() const { return registry_; }

    // Runs both passes for area. Children get a provisional rect during the first pass;
    // applying the returned placements is up to the caller.
    std::vector<Placement> layout(const flex_model::Rect& area) const;

private:
    ItemRegistry registry_;
    flex_model::Direction direction_ = flex_model::Direction::AlongWidth;
};

} // namespace flex_layout
