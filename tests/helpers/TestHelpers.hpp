#pragma once

#include "SQLite/SQLiteValue.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <filesystem>
#include <string>
#include <system_error>
#include <variant>

namespace fs = std::filesystem;

/**
 * @brief Build a per-test database path in the system temp directory.
 *
 * The name is derived from the running test so that tests never share a file.
 * The directory is canonical so the path matches the one SQLite locks.
 *
 * @return Path of a database file that does not exist yet
 */
inline fs::path TestDatabasePath()
{
    const auto* testInfo = ::testing::UnitTest::GetInstance()->current_test_info();
    const std::string name = std::string("sqlite_compat_") + testInfo->test_suite_name() + "_" + testInfo->name() + ".db";
    return fs::canonical(fs::temp_directory_path()) / name;
}

/**
 * @brief Remove a database file together with its journal, WAL, shared-memory and lock artifacts.
 *
 * @param[in] databasePath Path of the database file
 */
inline void RemoveDatabaseFiles(const fs::path& databasePath)
{
    for (const char* suffix : {"", "-wal", "-journal", "-shm", ".lock"})
    {
        fs::path path = databasePath;
        path += suffix;
        std::error_code errorCode;
        fs::remove_all(path, errorCode);
    }
}

/**
 * @brief Read an INTEGER column from a row.
 */
inline std::int64_t IntegerAt(const Row& row, const std::string& column)
{
    return std::get<std::int64_t>(row.At(column));
}

/**
 * @brief Read a TEXT column from a row.
 */
inline std::string TextAt(const Row& row, const std::string& column)
{
    return std::get<std::string>(row.At(column));
}
