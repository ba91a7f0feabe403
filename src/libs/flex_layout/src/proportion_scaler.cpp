#include <flex_layout/proportion_scaler.hpp>
#include <numeric>

namespace flex_layout {

std::int64_t scale_factor(const std::vector<std::size_t>& group_sizes) {
    std::int64_t result = 1;
    for (const std::size_t size : group_sizes) {
        if (size == 0) continue;
        result = std::lcm(result, static_cast<std::int64_t>(size));
    }
    return result;
}

std::vector<std::size_t> consumption_group_sizes(const std::vector<LayoutEntry>& entries) {
    std::vector<std::size_t> sizes;
    sizes.reserve(entries.size());
    for (const auto& entry : entries) {
        sizes.push_back(entry.consumers.size());
    }
    return sizes;
}

} // namespace flex_layout
