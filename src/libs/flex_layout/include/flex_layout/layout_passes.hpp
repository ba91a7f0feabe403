#pragma once

#include <flex_layout/item_registry.hpp>
#include <flex_model/types.hpp>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace flex_layout {

// Output of the first pass: totals shared with the second pass, the visibility seen by
// the probe, and what each consumer inherits from hidden donors.
struct Redistribution {
    std::int64_t scale = 1;          // L
    int distributable = 0;           // extent minus every fixed reservation
    std::int64_t proportion_sum = 0; // sum of proportion * L over proportional items
    std::vector<int> provisional_sizes;
    std::vector<bool> visible;
    std::vector<int> fixed_delta;
    std::vector<std::int64_t> proportion_delta;
};

struct Placement {
    std::shared_ptr<Primitive> content; // null for spacers
    std::size_t index = 0;              // position in the registry
    flex_model::Rect rect;
};

// Splits value into count parts; the first (value mod count) parts get one extra unit.
std::vector<std::int64_t> split_evenly(std::int64_t value, std::size_t count);

int primary_extent(const flex_model::Rect& area, flex_model::Direction direction);
int primary_origin(const flex_model::Rect& area, flex_model::Direction direction);
// Rect of a child at pos with size along the primary axis, spanning the cross axis.
flex_model::Rect child_rect(const flex_model::Rect& area, flex_model::Direction direction, int pos, int size);

// Pass 1. Sets each child's provisional rect so its visibility predicate sees its
// would-be size, then records the deltas hidden donors hand to their consumers.
Redistribution redistribute(const std::vector<LayoutEntry>& entries, flex_model::Direction direction,
    const flex_model::Rect& area);

// Pass 2. Distributes the space among visible items and returns their placements in order.
std::vector<Placement> allocate(const std::vector<LayoutEntry>& entries, flex_model::Direction direction,
    const flex_model::Rect& area, const Redistribution& redistribution);

} // namespace flex_layout
