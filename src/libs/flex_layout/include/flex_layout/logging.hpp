#pragma once

#include <flex_model/layout_document.hpp>
#include <spdlog/spdlog.h>
#include <memory>

namespace flex_layout {

inline constexpr const char* logger_name = "visible_flex";

// Shared logger for the layout and widget libraries. Created on first use from the
// default logger's sinks at info level.
std::shared_ptr<spdlog::logger> layout_logger();

// Applies level, flush level and optional log file. Returns false if the file sink could
// not be created; the previous logger stays in place in that case.
bool configure_logging(const flex_model::LoggingSettings& settings);

} // namespace flex_layout
