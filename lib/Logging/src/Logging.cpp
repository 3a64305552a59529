// file Logging.cpp

#include "Logging/Logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>

namespace
{
constexpr const char* LoggerName = "sqlite-compat";
constexpr const char* DefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

std::string ResolveLevel(const LoggingConfig& config)
{
    if (const char* level = std::getenv("SQLITE_COMPAT_LOG_LEVEL"))
    {
        return level;
    }
    if (false == config.level.empty())
    {
        return config.level;
    }
    return "info";
}

std::string ResolvePattern(const LoggingConfig& config)
{
    if (const char* pattern = std::getenv("SQLITE_COMPAT_LOG_PATTERN"))
    {
        return pattern;
    }
    if (false == config.pattern.empty())
    {
        return config.pattern;
    }
    return DefaultPattern;
}
}

void InitializeLogging(const LoggingConfig& config)
{
    auto logger = spdlog::get(LoggerName);
    if (nullptr == logger)
    {
        logger = spdlog::stderr_color_mt(LoggerName);
    }
    logger->set_pattern(ResolvePattern(config));
    logger->set_level(spdlog::level::from_str(ResolveLevel(config)));
    spdlog::set_default_logger(logger);
    spdlog::flush_on(spdlog::level::warn);
}

void ShutdownLogging()
{
    spdlog::shutdown();
}
