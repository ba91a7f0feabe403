#include <flex_widgets/builder.hpp>
#include <flex_layout/logging.hpp>

namespace flex_widgets {

namespace {

class Builder {
public:
    explicit Builder(BuiltLayout& out) : out_(out) {}

    std::shared_ptr<flex_layout::Primitive> build(const flex_model::NodeDesc& node) {
        switch (node.kind) {
        case flex_model::NodeDesc::Kind::Spacer:
            return nullptr;
        case flex_model::NodeDesc::Kind::Panel:
            return build_panel(node);
        case flex_model::NodeDesc::Kind::Flex:
            return build_flex(node);
        }
        return nullptr;
    }

private:
    VisibleFunc toggle_predicate(const flex_model::NodeDesc& node) {
        if (node.id.empty()) {
            return node.hidden ? never_visible() : always_visible();
        }
        auto [it, inserted] = out_.toggles.emplace(node.id, VisibilityToggle(!node.hidden));
        if (inserted) {
            out_.toggle_ids.push_back(node.id);
        } else {
            flex_layout::layout_logger()->warn("build_layout: duplicate id '{}' shares one toggle", node.id);
        }
        return it->second.predicate();
    }

    std::shared_ptr<flex_layout::Primitive> build_panel(const flex_model::NodeDesc& node) {
        auto panel = std::make_shared<Panel>(node.label.empty() ? node.id : node.label);
        panel->set_color(node.color);
        VisibleFunc visible = toggle_predicate(node);
        if (node.min_width > 0 || node.min_height > 0) {
            visible = all_of(std::move(visible), visible_when_at_least(node.min_width, node.min_height));
        }
        panel->set_visibility(std::move(visible));
        out_.panels.push_back(BuiltLayout::PanelRef{panel, ancestors_});
        return panel;
    }

    std::shared_ptr<flex_layout::Primitive> build_flex(const flex_model::NodeDesc& node) {
        auto flex = std::make_shared<VisibleFlex>();
        flex->set_direction(node.direction);
        flex->set_background(node.background);
        flex->set_visibility(toggle_predicate(node));

        ancestors_.push_back(flex);
        std::vector<std::shared_ptr<flex_layout::Primitive>> children;
        children.reserve(node.items.size());
        for (const auto& item : node.items) {
            auto child = build(item.content);
            flex->add_item(child, item.fixed_size, item.proportion, item.focus);
            children.push_back(std::move(child));
        }
        ancestors_.pop_back();

        for (std::size_t i = 0; i < node.items.size(); ++i) {
            if (node.items[i].consumers.empty()) continue;
            if (!children[i]) {
                // Spacers are never hidden, so they never donate.
                flex_layout::layout_logger()->debug("build_layout: consumers on spacer {} ignored", i);
                continue;
            }
            if (!flex->set_consumers(children[i].get(), node.items[i].consumers)) {
                flex_layout::layout_logger()->debug("build_layout: consumers of item {} in '{}' dropped", i, node.id);
            }
        }
        return flex;
    }

    BuiltLayout& out_;
    std::vector<std::shared_ptr<VisibleFlex>> ancestors_;
};

} // namespace

VisibilityToggle* BuiltLayout::find_toggle(const std::string& id) {
    auto it = toggles.find(id);
    if (it == toggles.end()) return nullptr;
    return &it->second;
}

bool BuiltLayout::is_shown(const PanelRef& ref) const {
    if (!ref.panel || !ref.panel->visible()) return false;
    for (const auto& flex : ref.ancestors) {
        if (!flex->visible()) return false;
    }
    return true;
}

BuiltLayout build_layout(const flex_model::NodeDesc& root) {
    BuiltLayout out;
    Builder builder(out);
    out.root = builder.build(root);
    flex_layout::layout_logger()->info("build_layout: panels={} toggles={}", out.panels.size(), out.toggles.size());
    return out;
}

} // namespace flex_widgets
