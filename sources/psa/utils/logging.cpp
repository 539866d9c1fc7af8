#include "psa/utils/logging.h"
#include "psa/utils/string_utils.h"

#include <mutex>
#include <vector>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace psa::utils {

namespace {

std::mutex logger_mutex;

std::shared_ptr<spdlog::logger> make_fallback_logger() {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto fallback = std::make_shared<spdlog::logger>(LOGGER_NAME, sink);
    fallback->set_level(spdlog::level::warn);
    return fallback;
}

}

core::Result<spdlog::level::level_enum> parse_log_level(const std::string& level) {
    const auto name = to_lower(trim(level));
    if (name == "trace") return core::Result<spdlog::level::level_enum>::success(spdlog::level::trace);
    if (name == "debug") return core::Result<spdlog::level::level_enum>::success(spdlog::level::debug);
    if (name == "info") return core::Result<spdlog::level::level_enum>::success(spdlog::level::info);
    if (name == "warn" || name == "warning") return core::Result<spdlog::level::level_enum>::success(spdlog::level::warn);
    if (name == "error") return core::Result<spdlog::level::level_enum>::success(spdlog::level::err);
    if (name == "critical") return core::Result<spdlog::level::level_enum>::success(spdlog::level::critical);
    if (name == "off") return core::Result<spdlog::level::level_enum>::success(spdlog::level::off);
    return core::Result<spdlog::level::level_enum>::failure(core::ErrorCode::INVALID_CONFIG,
                                                            "Unknown log level '" + level + "'");
}

core::Result<void> init_logging(const core::LoggingConfig& config) {
    auto level = parse_log_level(config.level);
    if (level.is_failure()) {
        return core::Result<void>::failure(level.error());
    }

    std::vector<spdlog::sink_ptr> sinks;
    if (config.console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    }

    if (!config.file.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.file, true));
        } catch (const spdlog::spdlog_ex& ex) {
            return core::Result<void>::failure(core::make_error_with_context(
                core::ErrorCode::FILE_WRITE_ERROR, "Cannot open log file: " + std::string(ex.what()), config.file));
        }
    }

    auto configured = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
    configured->set_level(level.value());
    configured->set_pattern(config.pattern);
    configured->flush_on(spdlog::level::warn);

    std::lock_guard lock(logger_mutex);
    spdlog::drop(LOGGER_NAME);
    spdlog::set_default_logger(configured);

    return core::Result<void>::success();
}

std::shared_ptr<spdlog::logger> logger() {
    std::lock_guard lock(logger_mutex);
    if (auto existing = spdlog::get(LOGGER_NAME)) {
        return existing;
    }

    auto fallback = make_fallback_logger();
    spdlog::set_default_logger(fallback);
    return fallback;
}

}  // namespace psa::utils
