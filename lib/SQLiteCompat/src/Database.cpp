// file Database.cpp

#include "SQLiteCompat/Database.hpp"

#include "LockArtifact/LockArtifact.hpp"
#include "SQLite/SQLiteError.hpp"

#include <sqlite3.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace
{
constexpr const char* PragmaKeyword = "PRAGMA";

SQLiteOpenOptions ToOpenOptions(const DatabaseOptions& options)
{
    SQLiteOpenOptions openOptions;
    openOptions.readOnly = options.readonly;
    openOptions.fileMustExist = options.fileMustExist;
    openOptions.busyTimeoutMs = options.busyTimeoutMs;
    openOptions.vfs = options.vfs;
    return openOptions;
}

bool StartsWithPragmaKeyword(const std::string& text)
{
    const std::string keyword = PragmaKeyword;
    if (text.size() < keyword.size())
    {
        return false;
    }
    return std::equal(keyword.begin(), keyword.end(), text.begin(),
                      [](char expected, char actual) { return expected == std::toupper(static_cast<unsigned char>(actual)); });
}

std::string ToPragmaStatement(const std::string& pragma)
{
    if (StartsWithPragmaKeyword(pragma))
    {
        return pragma;
    }
    return std::string(PragmaKeyword) + " " + pragma;
}

bool IsFileBacked(const std::string& path)
{
    return (false == path.empty()) && (SQLiteConnection::InMemoryPath != path);
}
}

Database::Database(const std::string& path, const DatabaseOptions& options) : _path(path), _connection(path, ToOpenOptions(options))
{
    spdlog::debug("Opened database {} (readonly={}, fileMustExist={})", _path, options.readonly, options.fileMustExist);
}

Database::~Database()
{
    Close();
}

Statement Database::Prepare(const std::string& sql)
{
    // Compiling once surfaces malformed SQL here; the handle itself is
    // finalized right away and re-prepared by each statement call.
    _connection.Prepare(sql);
    return Statement(_connection, sql);
}

void Database::Exec(const std::string& sql)
{
    _connection.Execute(sql);
}

std::vector<Row> Database::Pragma(const std::string& pragma)
{
    const std::string sql = ToPragmaStatement(pragma);
    try
    {
        return _connection.Prepare(sql).All();
    }
    catch (const SQLiteError& error)
    {
        spdlog::debug("{} produced no result: {}", sql, error.what());
        return {};
    }
}

std::optional<Value> Database::PragmaValue(const std::string& pragma)
{
    const std::string sql = ToPragmaStatement(pragma);
    try
    {
        std::optional<Row> row = _connection.Prepare(sql).Get();
        if ((false == row.has_value()) || row->Empty())
        {
            return std::nullopt;
        }
        return row->Columns().front().second;
    }
    catch (const SQLiteError& error)
    {
        spdlog::debug("{} produced no result: {}", sql, error.what());
        return std::nullopt;
    }
}

void Database::Close() noexcept
{
    // Closing twice or after a failed close is allowed; the status only matters for diagnostics.
    int result = _connection.Close();
    if (SQLITE_OK == result)
    {
        spdlog::debug("Closed database {}", _path);
    }
    else if (SQLITE_MISUSE != result)
    {
        spdlog::debug("Close of {} reported: {}", _path, sqlite3_errstr(result));
    }

    if (IsFileBacked(_path))
    {
        // An undeletable lock directory can only surface on the next open.
        std::error_code errorCode = RemoveLockArtifact(_path);
        if (errorCode)
        {
            spdlog::debug("Could not remove {}: {}", LockArtifactPath(_path).string(), errorCode.message());
        }
    }
}

void Database::BeginTransaction()
{
    _connection.Execute("BEGIN TRANSACTION");
}

void Database::CommitTransaction()
{
    _connection.Execute("COMMIT");
}

/**
 * @brief Roll back the active transaction while an exception is propagating.
 *
 * A rollback failure is logged rather than thrown so the caller sees the
 * exception raised by the transaction body.
 */
void Database::RollbackTransaction() noexcept
{
    if (false == _connection.InTransaction())
    {
        // SQLite already rolled back (for example after SQLITE_FULL).
        return;
    }

    try
    {
        _connection.Execute("ROLLBACK");
    }
    catch (const SQLiteError& error)
    {
        spdlog::debug("Rollback of {} failed: {}", _path, error.what());
    }
}
