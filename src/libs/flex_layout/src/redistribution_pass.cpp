#include <flex_layout/layout_passes.hpp>
#include <flex_layout/logging.hpp>
#include <flex_layout/proportion_scaler.hpp>

namespace flex_layout {

namespace {

// Fixed items never compete proportionally, so their own proportion carries no weight.
std::int64_t scaled_weight(const LayoutItem& item, std::int64_t scale) {
    return item.is_fixed() ? 0 : static_cast<std::int64_t>(item.proportion) * scale;
}

} // namespace

std::vector<std::int64_t> split_evenly(std::int64_t value, std::size_t count) {
    std::vector<std::int64_t> parts;
    if (count == 0) return parts;
    const auto k = static_cast<std::int64_t>(count);
    const std::int64_t quotient = value / k;
    const std::int64_t remainder = value % k;
    parts.reserve(count);
    for (std::int64_t i = 0; i < k; ++i) {
        parts.push_back(quotient + (i < remainder ? 1 : 0));
    }
    return parts;
}

int primary_extent(const flex_model::Rect& area, flex_model::Direction direction) {
    return direction == flex_model::Direction::AlongWidth ? area.width : area.height;
}

int primary_origin(const flex_model::Rect& area, flex_model::Direction direction) {
    return direction == flex_model::Direction::AlongWidth ? area.x : area.y;
}

flex_model::Rect child_rect(const flex_model::Rect& area, flex_model::Direction direction, int pos, int size) {
    if (direction == flex_model::Direction::AlongWidth) {
        return flex_model::Rect{pos, area.y, size, area.height};
    }
    return flex_model::Rect{area.x, pos, area.width, size};
}

Redistribution redistribute(const std::vector<LayoutEntry>& entries, flex_model::Direction direction,
    const flex_model::Rect& area)
{
    auto logger = layout_logger();
    const std::size_t count = entries.size();

    Redistribution out;
    out.scale = scale_factor(consumption_group_sizes(entries));
    out.provisional_sizes.assign(count, 0);
    out.visible.assign(count, true);
    out.fixed_delta.assign(count, 0);
    out.proportion_delta.assign(count, 0);

    out.distributable = primary_extent(area, direction);
    for (const auto& entry : entries) {
        if (entry.item.is_fixed()) {
            out.distributable -= entry.item.fixed_size;
        } else {
            out.proportion_sum += scaled_weight(entry.item, out.scale);
        }
    }
    logger->debug("redistribute: items={} scale={} distributable={} proportion_sum={}",
        count, out.scale, out.distributable, out.proportion_sum);

    // Provisional sizes, then probe visibility at that size.
    std::int64_t proportion_left = out.proportion_sum;
    std::int64_t dist_left = out.distributable;
    int pos = primary_origin(area, direction);
    for (std::size_t i = 0; i < count; ++i) {
        const LayoutItem& item = entries[i].item;
        int size = item.fixed_size;
        if (!item.is_fixed()) {
            size = 0;
            if (proportion_left > 0) {
                const std::int64_t weight = scaled_weight(item, out.scale);
                const std::int64_t share = dist_left * weight / proportion_left;
                dist_left -= share;
                proportion_left -= weight;
                size = static_cast<int>(share);
            }
        }
        out.provisional_sizes[i] = size;

        if (item.content) {
            item.content->set_rect(child_rect(area, direction, pos, size));
            out.visible[i] = item.content->visible();
        }
        pos += size;
    }

    // Hidden donors hand their weight and fixed cells to their consumers.
    for (std::size_t i = 0; i < count; ++i) {
        if (out.visible[i] || entries[i].consumers.empty()) continue;

        std::vector<std::size_t> consumers;
        consumers.reserve(entries[i].consumers.size());
        for (const std::size_t c : entries[i].consumers) {
            if (c < count) {
                consumers.push_back(c);
            } else {
                logger->debug("redistribute: item {} names missing consumer {}", i, c);
            }
        }
        if (consumers.empty()) continue;

        const LayoutItem& item = entries[i].item;
        const auto weight_parts = split_evenly(scaled_weight(item, out.scale), consumers.size());
        const auto fixed_parts = split_evenly(item.is_fixed() ? item.fixed_size : 0, consumers.size());
        for (std::size_t j = 0; j < consumers.size(); ++j) {
            out.proportion_delta[consumers[j]] += weight_parts[j];
            out.fixed_delta[consumers[j]] += static_cast<int>(fixed_parts[j]);
        }
        logger->debug("redistribute: hidden item {} donates to {} consumers", i, consumers.size());
    }

    if (logger->should_log(spdlog::level::trace)) {
        for (std::size_t i = 0; i < count; ++i) {
            logger->trace("  item {} provisional={} visible={} fixed_delta={} proportion_delta={}",
                i, out.provisional_sizes[i], static_cast<bool>(out.visible[i]),
                out.fixed_delta[i], out.proportion_delta[i]);
        }
    }
    return out;
}

} // namespace flex_layout
