#include <flex_layout/item_registry.hpp>
#include <flex_layout/logging.hpp>
#include <algorithm>

namespace flex_layout {

namespace {

// A null handle matches spacers.
bool matches(const LayoutEntry& entry, const Primitive* content) {
    return entry.item.content.get() == content;
}

} // namespace

void ItemRegistry::add(std::shared_ptr<Primitive> content, int fixed_size, int proportion, bool focus) {
    LayoutEntry entry;
    entry.item.content = std::move(content);
    entry.item.fixed_size = fixed_size;
    entry.item.proportion = proportion;
    entry.item.focus = focus;
    entries_.push_back(std::move(entry));
}

std::size_t ItemRegistry::remove(const Primitive* content) {
    const auto before = entries_.size();
    entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                       [content](const LayoutEntry& e) { return matches(e, content); }),
        entries_.end());
    return before - entries_.size();
}

void ItemRegistry::clear() {
    entries_.clear();
}

bool ItemRegistry::resize(const Primitive* content, int fixed_size, int proportion) {
    bool found = false;
    for (auto& entry : entries_) {
        if (!matches(entry, content)) continue;
        entry.item.fixed_size = fixed_size;
        entry.item.proportion = proportion;
        found = true;
    }
    return found;
}

bool ItemRegistry::set_consumers(const Primitive* content, const std::vector<std::size_t>& consumers) {
    // Spacers are always visible and never donate.
    if (!content) {
        layout_logger()->warn("set_consumers: spacers take no consumers");
        return false;
    }
    bool found = false;
    bool applied = false;
    for (std::size_t i = 0; i < entries_.size(); ++i) {
        if (!matches(entries_[i], content)) continue;
        found = true;

        std::vector<std::size_t> unique;
        bool valid = true;
        for (const std::size_t c : consumers) {
            if (c >= entries_.size() || c == i) {
                layout_logger()->warn("set_consumers: rejected consumer {} for item {} (size={})",
                    c, i, entries_.size());
                valid = false;
                break;
            }
            if (std::find(unique.begin(), unique.end(), c) == unique.end()) unique.push_back(c);
        }
        if (!valid) continue;

        entries_[i].consumers = std::move(unique);
        applied = true;
    }
    if (!found) layout_logger()->warn("set_consumers: content not in container");
    return applied;
}

std::optional<std::size_t> ItemRegistry::index_of(const Primitive* content) const {
    for (std::size_t i = 0; i < entries_.size(); ++i) {
        if (matches(entries_[i], content)) return i;
    }
    return std::nullopt;
}

} // namespace flex_layout
