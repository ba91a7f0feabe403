#pragma once

#include <flex_model/types.hpp>
#include <cstddef>
#include <string>
#include <vector>

namespace flex_model {

struct ItemDesc;

struct NodeDesc {
    enum class Kind { Spacer, Panel, Flex };
    Kind kind = Kind::Spacer;
    std::string id;
    bool hidden = false;

    // Panel
    std::string label;
    Color color;
    int min_width = 0;
    int min_height = 0;

    // Flex
    Direction direction = Direction::AlongWidth;
    Color background;
    std::vector<ItemDesc> items;
};

struct ItemDesc {
    NodeDesc content;
    int fixed_size = 0;
    int proportion = 0;
    bool focus = false;
    // Sibling indices, already resolved from ids by the loader.
    std::vector<std::size_t> consumers;
};

struct LoggingSettings {
    std::string level = "info";
    std::string flush_level = "warn";
    std::string file; // empty: keep the default sinks
};

struct LayoutDocument {
    std::string name;
    LoggingSettings logging;
    NodeDesc root;
};

} // namespace flex_model
