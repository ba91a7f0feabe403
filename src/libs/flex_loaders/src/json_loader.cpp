#include <flex_loaders/json_loader.hpp>
#include <flex_layout/logging.hpp>
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <fstream>
#include <unordered_set>

namespace flex_loaders {

namespace {

using flex_model::NodeDesc;

std::optional<flex_model::Direction> direction_from_string(const std::string& s) {
    if (s == "along_width" || s == "row" || s == "horizontal") return flex_model::Direction::AlongWidth;
    if (s == "along_height" || s == "column" || s == "vertical") return flex_model::Direction::AlongHeight;
    return std::nullopt;
}

std::optional<flex_model::Color> parse_color(const nlohmann::json& c) {
    if (c.is_string()) {
        const auto s = c.get<std::string>();
        if (s == "default") return flex_model::Color{};
        if (s.size() != 7 || s[0] != '#') return std::nullopt;
        char* end = nullptr;
        const unsigned long value = std::strtoul(s.c_str() + 1, &end, 16);
        if (end != s.c_str() + s.size()) return std::nullopt;
        return flex_model::Color::rgb(static_cast<std::uint8_t>((value >> 16) & 0xFF),
            static_cast<std::uint8_t>((value >> 8) & 0xFF), static_cast<std::uint8_t>(value & 0xFF));
    }
    if (c.is_array() && c.size() == 3) {
        std::uint8_t rgb[3] = {};
        for (std::size_t i = 0; i < 3; ++i) {
            if (!c[i].is_number_integer()) return std::nullopt;
            const int v = c[i].get<int>();
            if (v < 0 || v > 255) return std::nullopt;
            rgb[i] = static_cast<std::uint8_t>(v);
        }
        return flex_model::Color::rgb(rgb[0], rgb[1], rgb[2]);
    }
    return std::nullopt;
}

class DocumentParser {
public:
    std::optional<NodeDesc> parse_node(const nlohmann::json& n) {
        if (!n.is_object()) return fail("content must be an object");
        if (!n.contains("type") || !n["type"].is_string()) return fail("node without a type");
        const auto type = n["type"].get<std::string>();

        NodeDesc node;
        if (n.contains("id")) {
            if (!n["id"].is_string()) return fail("id must be a string");
            node.id = n["id"].get<std::string>();
            if (!node.id.empty() && !seen_ids_.insert(node.id).second)
                return fail("duplicate id '" + node.id + "'");
        }
        node.hidden = n.contains("hidden") && n["hidden"].is_boolean() && n["hidden"].get<bool>();

        if (type == "spacer") {
            node.kind = NodeDesc::Kind::Spacer;
            return node;
        }
        if (type == "panel") {
            node.kind = NodeDesc::Kind::Panel;
            node.label = n.contains("label") && n["label"].is_string() ? n["label"].get<std::string>() : "";
            node.min_width = n.contains("min_width") && n["min_width"].is_number_integer()
                ? n["min_width"].get<int>() : 0;
            node.min_height = n.contains("min_height") && n["min_height"].is_number_integer()
                ? n["min_height"].get<int>() : 0;
            if (n.contains("color")) {
                auto color = parse_color(n["color"]);
                if (!color) return fail("bad panel color");
                node.color = *color;
            }
            return node;
        }
        if (type == "flex") {
            node.kind = NodeDesc::Kind::Flex;
            if (n.contains("direction")) {
                if (!n["direction"].is_string()) return fail("direction must be a string");
                auto direction = direction_from_string(n["direction"].get<std::string>());
                if (!direction) return fail("unknown direction");
                node.direction = *direction;
            }
            if (n.contains("background")) {
                auto color = parse_color(n["background"]);
                if (!color) return fail("bad background color");
                node.background = *color;
            }
            if (n.contains("items")) {
                if (!n["items"].is_array()) return fail("items must be an array");
                if (!parse_items(n["items"], node)) return std::nullopt;
            }
            return node;
        }
        return fail("unknown node type '" + type + "'");
    }

private:
    bool parse_items(const nlohmann::json& items, NodeDesc& node) {
        // Consumers may name siblings declared later, so resolve after all items are read.
        std::vector<nlohmann::json> pending_consumers;
        for (const auto& it : items) {
            if (!it.is_object()) {
                fail("item must be an object");
                return false;
            }
            flex_model::ItemDesc item;
            const bool has_fixed = it.contains("fixed");
            const bool has_proportion = it.contains("proportion");
            if (has_fixed && !it["fixed"].is_number_integer()) return fail_bool("fixed must be an integer");
            if (has_proportion && !it["proportion"].is_number_integer())
                return fail_bool("proportion must be an integer");
            item.fixed_size = has_fixed ? it["fixed"].get<int>() : 0;
            item.proportion = has_proportion ? it["proportion"].get<int>() : (has_fixed ? 0 : 1);
            if (item.fixed_size < 0 || item.proportion < 0) return fail_bool("negative size");
            item.focus = it.contains("focus") && it["focus"].is_boolean() && it["focus"].get<bool>();

            if (it.contains("content")) {
                auto content = parse_node(it["content"]);
                if (!content) return false;
                item.content = std::move(*content);
            }
            pending_consumers.push_back(it.contains("consumers") ? it["consumers"] : nlohmann::json::array());
            node.items.push_back(std::move(item));
        }

        for (std::size_t i = 0; i < node.items.size(); ++i) {
            const auto& consumers = pending_consumers[i];
            if (!consumers.is_array()) return fail_bool("consumers must be an array");
            for (const auto& c : consumers) {
                auto index = resolve_consumer(c, node);
                if (!index || *index == i) return fail_bool("bad consumer reference in item " + std::to_string(i));
                node.items[i].consumers.push_back(*index);
            }
        }
        return true;
    }

    std::optional<std::size_t> resolve_consumer(const nlohmann::json& c, const NodeDesc& node) const {
        if (c.is_number_unsigned()) {
            const auto index = c.get<std::size_t>();
            if (index < node.items.size()) return index;
            return std::nullopt;
        }
        if (c.is_string()) {
            const auto id = c.get<std::string>();
            for (std::size_t j = 0; j < node.items.size(); ++j) {
                if (!id.empty() && node.items[j].content.id == id) return j;
            }
        }
        return std::nullopt;
    }

    std::nullopt_t fail(const std::string& message) {
        flex_layout::layout_logger()->warn("layout document rejected: {}", message);
        return std::nullopt;
    }

    bool fail_bool(const std::string& message) {
        fail(message);
        return false;
    }

    std::unordered_set<std::string> seen_ids_;
};

void parse_logging(const nlohmann::json& j, flex_model::LoggingSettings& out) {
    if (!j.is_object()) return;
    if (j.contains("level") && j["level"].is_string()) out.level = j["level"].get<std::string>();
    if (j.contains("flush_level") && j["flush_level"].is_string()) out.flush_level = j["flush_level"].get<std::string>();
    if (j.contains("file") && j["file"].is_string()) out.file = j["file"].get<std::string>();
}

std::optional<flex_model::LayoutDocument> parse_json(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("root")) {
        flex_layout::layout_logger()->warn("layout document rejected: no root node");
        return std::nullopt;
    }

    flex_model::LayoutDocument doc;
    if (j.contains("name") && j["name"].is_string()) doc.name = j["name"].get<std::string>();
    if (j.contains("logging")) parse_logging(j["logging"], doc.logging);

    DocumentParser parser;
    auto root = parser.parse_node(j["root"]);
    if (!root) return std::nullopt;
    doc.root = std::move(*root);
    return doc;
}

} // namespace

std::optional<flex_model::LayoutDocument> load_layout_from_json(std::istream& in) {
    try {
        nlohmann::json j = nlohmann::json::parse(in);
        return parse_json(j);
    } catch (const nlohmann::json::exception& e) {
        flex_layout::layout_logger()->warn("layout document is not valid JSON: {}", e.what());
        return std::nullopt;
    }
}

std::optional<flex_model::LayoutDocument> load_layout_from_json_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) return std::nullopt;
    auto doc = load_layout_from_json(f);
    if (doc) flex_layout::layout_logger()->info("Loaded layout document '{}' from {}", doc->name, path);
    return doc;
}

flex_model::LayoutDocument default_layout_document() {
    using flex_model::ItemDesc;

    NodeDesc sidebar;
    sidebar.kind = NodeDesc::Kind::Panel;
    sidebar.id = "sidebar";
    sidebar.label = "Sidebar";
    sidebar.color = flex_model::Color::rgb(40, 44, 52);

    NodeDesc main;
    main.kind = NodeDesc::Kind::Panel;
    main.id = "main";
    main.label = "Main";
    main.color = flex_model::Color::rgb(30, 30, 36);

    NodeDesc status;
    status.kind = NodeDesc::Kind::Panel;
    status.id = "status";
    status.label = "Status";
    status.color = flex_model::Color::rgb(50, 40, 60);

    NodeDesc body;
    body.kind = NodeDesc::Kind::Flex;
    body.id = "body";
    body.direction = flex_model::Direction::AlongWidth;
    body.items.push_back(ItemDesc{sidebar, 0, 1, false, {1}});
    body.items.push_back(ItemDesc{main, 0, 3, true, {0}});

    flex_model::LayoutDocument doc;
    doc.name = "default";
    doc.root.kind = NodeDesc::Kind::Flex;
    doc.root.id = "root";
    doc.root.direction = flex_model::Direction::AlongHeight;
    doc.root.items.push_back(ItemDesc{body, 0, 1, true, {1}});
    doc.root.items.push_back(ItemDesc{status, 3, 0, false, {0}});
    return doc;
}

} // namespace flex_loaders
