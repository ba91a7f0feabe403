#pragma once

#include <flex_layout/primitive.hpp>
#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

namespace flex_layout {

struct LayoutItem {
    std::shared_ptr<Primitive> content; // null for an empty spacer
    int fixed_size = 0;                 // > 0 reserves exactly this many cells
    int proportion = 0;                 // weight when fixed_size <= 0
    bool focus = false;                 // attracts the container's focus

    bool is_fixed() const { return fixed_size > 0; }
};

struct LayoutEntry {
    LayoutItem item;
    // Siblings that absorb this item's space while it is hidden, in split order.
    std::vector<std::size_t> consumers;
};

// Ordered layout records of one container. Content lookups are linear scans; a null
// handle addresses spacers.
class ItemRegistry {
public:
    void add(std::shared_ptr<Primitive> content, int fixed_size, int proportion, bool focus);

    // Removes every entry holding content, keeping the order of the rest.
    std::size_t remove(const Primitive* content);
    void clear();

    // Updates every entry holding content. Returns false if none does.
    bool resize(const Primitive* content, int fixed_size, int proportion);

    // Replaces the consumer list of every entry holding content. Duplicates are dropped;
    // an out-of-range index or the entry's own index rejects the list for that entry.
    // Spacers take no consumers. Rejections are logged here.
    bool set_consumers(const Primitive* content, const std::vector<std::size_t>& consumers);

    std::optional<std::size_t> index_of(const Primitive* content) const;

    const std::vector<LayoutEntry>& entries() const { return entries_; }
    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

private:
    std::vector<LayoutEntry> entries_;
};

} // namespace flex_layout
