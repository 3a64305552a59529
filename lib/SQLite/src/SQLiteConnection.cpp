// file SQLiteConnection.cpp

#include "SQLite/SQLiteConnection.hpp"

#include "SQLite/SQLiteError.hpp"

#include <sqlite3.h>

#include <utility>

namespace
{
constexpr int SqlTextLengthAuto = -1;

int OpenFlags(const SQLiteOpenOptions& options)
{
    if (true == options.readOnly)
    {
        return SQLITE_OPEN_READONLY;
    }
    if (true == options.fileMustExist)
    {
        return SQLITE_OPEN_READWRITE;
    }
    return SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
}
}

SQLiteConnection::SQLiteConnection(const std::string& databasePath, const SQLiteOpenOptions& options) : _database(nullptr)
{
    const char* vfs = options.vfs.empty() ? nullptr : options.vfs.c_str();
    int result = sqlite3_open_v2(databasePath.c_str(), &_database, OpenFlags(options), vfs);
    if (SQLITE_OK != result)
    {
        SQLiteError error = MakeSqliteError(_database, result, "Failed to open SQLite DB " + databasePath + ": ");
        sqlite3_close(_database);
        _database = nullptr;
        throw error;
    }

    sqlite3_extended_result_codes(_database, 1);

    if (SQLITE_OK != sqlite3_busy_timeout(_database, options.busyTimeoutMs))
    {
        sqlite3_close(_database);
        _database = nullptr;
        throw SQLiteError(SQLITE_ERROR, "Failed to set SQLite busy timeout.");
    }

    if (true == options.enableWriteAheadLogging)
    {
        try
        {
            EnableWriteAheadLoggingMode();
        }
        catch (const SQLiteError&)
        {
            sqlite3_close(_database);
            _database = nullptr;
            throw;
        }
    }
}

SQLiteConnection::~SQLiteConnection()
{
    if (nullptr != _database)
    {
        // close_v2 defers the release until outstanding statements are finalized.
        sqlite3_close_v2(_database);
    }
}

SQLiteConnection::SQLiteConnection(SQLiteConnection&& other) noexcept : _database(std::exchange(other._database, nullptr))
{
}

SQLiteConnection& SQLiteConnection::operator=(SQLiteConnection&& other) noexcept
{
    if (this != &other)
    {
        if (nullptr != _database)
        {
            sqlite3_close_v2(_database);
        }
        _database = std::exchange(other._database, nullptr);
    }
    return *this;
}

void SQLiteConnection::Execute(const std::string& sqlStatement)
{
    EnsureOpen();

    char* errorMessage = nullptr;
    int result = sqlite3_exec(_database, sqlStatement.c_str(), nullptr, nullptr, &errorMessage);
    if (SQLITE_OK != result)
    {
        std::string error = (nullptr != errorMessage) ? errorMessage : "Unknown SQLite error";
        sqlite3_free(errorMessage);
        throw SQLiteError(sqlite3_extended_errcode(_database), error);
    }
}

SQLiteStatement SQLiteConnection::Prepare(const std::string& sqlStatement)
{
    EnsureOpen();

    sqlite3_stmt* statement = nullptr;
    int result = sqlite3_prepare_v2(_database, sqlStatement.c_str(), SqlTextLengthAuto, &statement, nullptr);
    if (SQLITE_OK != result)
    {
        throw MakeSqliteError(_database, result, "");
    }
    if (nullptr == statement)
    {
        throw SQLiteError(SQLITE_MISUSE, "The supplied SQL string contains no statements");
    }
    return SQLiteStatement(statement);
}

int SQLiteConnection::Close() noexcept
{
    if (nullptr == _database)
    {
        return SQLITE_MISUSE;
    }

    int result = sqlite3_close(_database);
    if (SQLITE_OK == result)
    {
        _database = nullptr;
    }
    return result;
}

bool SQLiteConnection::InTransaction() const
{
    return (nullptr != _database) && (0 == sqlite3_get_autocommit(_database));
}

void SQLiteConnection::EnsureOpen() const
{
    if (nullptr == _database)
    {
        throw SQLiteError(SQLITE_MISUSE, "The database connection is not open");
    }
}

/**
 * @brief Switch the connection to write-ahead logging.
 */
void SQLiteConnection::EnableWriteAheadLoggingMode()
{
    char* errorMessage = nullptr;
    int result = sqlite3_exec(_database, "PRAGMA journal_mode=WAL;", nullptr, nullptr, &errorMessage);
    if (SQLITE_OK != result)
    {
        std::string error = (nullptr != errorMessage) ? errorMessage : "Unknown SQLite error enabling WAL";
        sqlite3_free(errorMessage);
        throw SQLiteError(result, error);
    }
}
