#pragma once

#include <flex_model/layout_document.hpp>
#include <istream>
#include <optional>
#include <string>

namespace flex_loaders {

std::optional<flex_model::LayoutDocument> load_layout_from_json(std::istream& in);
std::optional<flex_model::LayoutDocument> load_layout_from_json_file(const std::string& path);

// Small two-pane document used when no file is available.
flex_model::LayoutDocument default_layout_document();

} // namespace flex_loaders
