/**
 * @file logging_tests.cpp
 * @brief Tests for installing the default spdlog logger.
 */
#include "Logging/Logging.hpp"

#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

#include <cstdlib>

class LoggingTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        unsetenv("SQLITE_COMPAT_LOG_LEVEL");
        unsetenv("SQLITE_COMPAT_LOG_PATTERN");
    }

    void TearDown() override
    {
        unsetenv("SQLITE_COMPAT_LOG_LEVEL");
        ShutdownLogging();
    }
};

TEST_F(LoggingTest, InstallsNamedDefaultLogger)
{
    LoggingConfig config;
    config.level = "warn";
    InitializeLogging(config);

    auto logger = spdlog::get("sqlite-compat");
    ASSERT_NE(nullptr, logger);
    EXPECT_EQ(logger, spdlog::default_logger());
    EXPECT_EQ(spdlog::level::warn, logger->level());
}

TEST_F(LoggingTest, EnvironmentOverridesConfiguredLevel)
{
    setenv("SQLITE_COMPAT_LOG_LEVEL", "debug", 1);

    LoggingConfig config;
    config.level = "error";
    InitializeLogging(config);

    EXPECT_EQ(spdlog::level::debug, spdlog::get("sqlite-compat")->level());
}

TEST_F(LoggingTest, ReinitializingReusesTheLogger)
{
    InitializeLogging(LoggingConfig());
    auto first = spdlog::get("sqlite-compat");

    LoggingConfig config;
    config.level = "trace";
    InitializeLogging(config);

    EXPECT_EQ(first, spdlog::get("sqlite-compat"));
    EXPECT_EQ(spdlog::level::trace, first->level());
}
