#include <flex_layout/container.hpp>
#include <flex_layout/logging.hpp>

namespace flex_layout {

void Container::add_item(std::shared_ptr<Primitive> content, int fixed_size, int proportion, bool focus) {
    registry_.add(std::move(content), fixed_size, proportion, focus);
}

std::size_t Container::remove_item(const Primitive* content) {
    const std::size_t removed = registry_.remove(content);
    if (removed > 0) {
        layout_logger()->debug("remove_item: removed {} entries, {} left", removed, registry_.size());
    }
    return removed;
}

void Container::clear() {
    registry_.clear();
}

bool Container::resize_item(const Primitive* content, int fixed_size, int proportion) {
    if (registry_.resize(content, fixed_size, proportion)) return true;
    layout_logger()->warn("resize_item: content not in container");
    return false;
}

bool Container::set_consumers(const Primitive* content, const std::vector<std::size_t>& consumers) {
    return registry_.set_consumers(content, consumers);
}

std::vector<Placement> Container::layout(const flex_model::Rect& area) const {
    const auto& entries = registry_.entries();
    const Redistribution redistribution = redistribute(entries, direction_, area);
    return allocate(entries, direction_, area, redistribution);
}

} // namespace flex_layout
