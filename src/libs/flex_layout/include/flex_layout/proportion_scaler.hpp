#pragma once

#include <flex_layout/item_registry.hpp>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace flex_layout {

// Least common multiple of all non-zero consumption-group sizes; 1 when there are none.
// Scaling every proportion by it makes the split of a hidden item's weight among its
// consumers exact.
std::int64_t scale_factor(const std::vector<std::size_t>& group_sizes);

std::vector<std::size_t> consumption_group_sizes(const std::vector<LayoutEntry>& entries);

} // namespace flex_layout
