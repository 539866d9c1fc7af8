#ifndef PSA_UTILS_LOGGING_H
#define PSA_UTILS_LOGGING_H

#include "psa/core/config.h"
#include "psa/core/result.h"

#include <memory>
#include <spdlog/spdlog.h>

namespace psa::utils
{
    /**
     * Name of the process-wide logger.
     */
    inline constexpr const char* LOGGER_NAME = "psa";

    /**
     * Build the "psa" logger from the [logging] configuration and make it the spdlog default.
     *
     * Console output goes to stderr so report sinks writing to stdout stay clean.
     * Calling this again replaces the previous logger.
     *
     * @return INVALID_CONFIG for an unknown level, FILE_WRITE_ERROR if the log file cannot be opened.
     */
    core::Result<void> init_logging(const core::LoggingConfig& config);

    /**
     * The configured logger. Falls back to a stderr logger at "warn" if init_logging was never called.
     */
    std::shared_ptr<spdlog::logger> logger();

    /**
     * Parse a level name (trace, debug, info, warn, error, critical, off).
     */
    core::Result<spdlog::level::level_enum> parse_log_level(const std::string& level);

}

#endif //PSA_UTILS_LOGGING_H
