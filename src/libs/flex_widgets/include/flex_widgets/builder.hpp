#pragma once

#include <flex_layout/primitive.hpp>
#include <flex_model/layout_document.hpp>
#include <flex_widgets/panel.hpp>
#include <flex_widgets/visibility.hpp>
#include <flex_widgets/visible_flex.hpp>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace flex_widgets {

// Widget tree built from a layout description.
struct BuiltLayout {
    struct PanelRef {
        std::shared_ptr<Panel> panel;
        // Enclosing containers, outermost first.
        std::vector<std::shared_ptr<VisibleFlex>> ancestors;
    };

    std::shared_ptr<flex_layout::Primitive> root; // null when the root is a spacer
    std::vector<std::string> toggle_ids;          // document order
    std::unordered_map<std::string, VisibilityToggle> toggles;
    std::vector<PanelRef> panels;                 // document order

    VisibilityToggle* find_toggle(const std::string& id);
    // True when the panel and every enclosing container currently report visible.
    bool is_shown(const PanelRef& ref) const;
};

BuiltLayout build_layout(const flex_model::NodeDesc& root);

} // namespace flex_widgets
