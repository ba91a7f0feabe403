#include <flex_layout/logging.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <filesystem>
#include <memory>
#include <utility>

namespace flex_layout {

std::shared_ptr<spdlog::logger> layout_logger() {
    if (auto existing = spdlog::get(logger_name)) return existing;

    auto logger = spdlog::default_logger()->clone(logger_name);
    logger->set_level(spdlog::level::info);
    try {
        spdlog::register_logger(logger);
    } catch (const spdlog::spdlog_ex&) {
        // Registered concurrently by another thread.
        if (auto existing = spdlog::get(logger_name)) return existing;
    }
    return logger;
}

bool configure_logging(const flex_model::LoggingSettings& settings) {
    const auto level = spdlog::level::from_str(settings.level);
    const auto flush_level = spdlog::level::from_str(settings.flush_level);

    if (settings.file.empty()) {
        auto logger = layout_logger();
        logger->set_level(level);
        logger->flush_on(flush_level);
        return true;
    }

    try {
        const std::filesystem::path log_file(settings.file);
        if (log_file.has_parent_path()) {
            std::filesystem::create_directories(log_file.parent_path());
        }
        // Open the file before dropping the current logger so a failure leaves it in place.
        auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file.string(), true);
        spdlog::drop(logger_name);
        auto logger = std::make_shared<spdlog::logger>(logger_name, std::move(sink));
        spdlog::register_logger(logger);
        logger->set_level(level);
        logger->flush_on(flush_level);
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
        logger->info("Layout logger initialized. file={}", log_file.string());
        return true;
    } catch (const spdlog::spdlog_ex& e) {
        auto logger = layout_logger();
        logger->set_level(level);
        logger->warn("could not open log file {}: {}", settings.file, e.what());
        return false;
    } catch (const std::filesystem::filesystem_error& e) {
        auto logger = layout_logger();
        logger->set_level(level);
        logger->warn("could not create log directory for {}: {}", settings.file, e.what());
        return false;
    }
}

} // namespace flex_layout
