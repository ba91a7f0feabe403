#include <flex_layout/layout_passes.hpp>
#include <flex_layout/logging.hpp>

namespace flex_layout {

std::vector<Placement> allocate(const std::vector<LayoutEntry>& entries, flex_model::Direction direction,
    const flex_model::Rect& area, const Redistribution& redistribution)
{
    auto logger = layout_logger();
    std::vector<Placement> placements;
    placements.reserve(entries.size());

    std::int64_t proportion_left = redistribution.proportion_sum;
    std::int64_t dist_left = redistribution.distributable;
    int pos = primary_origin(area, direction);

    for (std::size_t i = 0; i < entries.size(); ++i) {
        const LayoutItem& item = entries[i].item;
        if (!redistribution.visible[i]) {
            logger->trace("allocate: item {} hidden, skipped", i);
            continue;
        }

        int size = (item.is_fixed() ? item.fixed_size : 0) + redistribution.fixed_delta[i];
        const std::int64_t weight = (item.is_fixed()
            ? 0 : static_cast<std::int64_t>(item.proportion) * redistribution.scale)
            + redistribution.proportion_delta[i];
        if (proportion_left > 0) {
            const std::int64_t share = dist_left * weight / proportion_left;
            dist_left -= share;
            proportion_left -= weight;
            size += static_cast<int>(share);
        }

        Placement placement;
        placement.content = item.content;
        placement.index = i;
        placement.rect = child_rect(area, direction, pos, size);
        logger->trace("allocate: item {} weight={} pos={} size={}", i, weight, pos, size);
        placements.push_back(std::move(placement));

        pos += size;
    }

    logger->debug("allocate: placed={} unused_distributable={} unused_weight={}",
        placements.size(), dist_left, proportion_left);
    return placements;
}

} // namespace flex_layout
