// file Logging.hpp:

#pragma once

#include <string>

/**
 * @brief Logger settings for the command-line front end and tests.
 */
struct LoggingConfig
{
    std::string level;   /**< spdlog level name ("trace", "debug", "info", ...) */
    std::string pattern; /**< spdlog pattern, empty selects the default */

    /**
     * @brief Initialize configuration with default values.
     */
    LoggingConfig()
        : level("info")
    {
    }
};

/**
 * @brief Install a stderr logger as the spdlog default logger.
 *
 * SQLITE_COMPAT_LOG_LEVEL and SQLITE_COMPAT_LOG_PATTERN override the
 * configured level and pattern.
 *
 * @param[in] config Logger settings
 */
void InitializeLogging(const LoggingConfig& config);

/**
 * @brief Flush and drop all registered loggers.
 */
void ShutdownLogging();
