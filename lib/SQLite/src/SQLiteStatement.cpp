// file SQLiteStatement.cpp

#include "SQLite/SQLiteStatement.hpp"

#include "SQLite/SQLiteError.hpp"

#include <sqlite3.h>

#include <utility>

namespace
{
/**
 * @brief Build a SQLite error for a statement with context prefix.
 *
 * @param[in] statement SQLite statement handle
 * @param[in] resultCode Result code returned by the failing call
 * @param[in] prefix Context prefix for the error message
 * @return Error describing the SQLite failure
 */
SQLiteError MakeStatementError(sqlite3_stmt* statement, int resultCode, const std::string& prefix)
{
    return MakeSqliteError(sqlite3_db_handle(statement), resultCode, prefix);
}
}

SQLiteStatement::SQLiteStatement(sqlite3_stmt* statement) : _statement(statement)
{
    if (nullptr == _statement)
    {
        throw SQLiteError(SQLITE_MISUSE, "SQLite statement is null.");
    }
}

SQLiteStatement::~SQLiteStatement()
{
    // The result only repeats the outcome of the last step, which the caller has already seen.
    static_cast<void>(Finalize());
}

SQLiteStatement::SQLiteStatement(SQLiteStatement&& other) noexcept : _statement(std::exchange(other._statement, nullptr))
{
}

SQLiteStatement& SQLiteStatement::operator=(SQLiteStatement&& other) noexcept
{
    if (this != &other)
    {
        static_cast<void>(Finalize());
        _statement = std::exchange(other._statement, nullptr);
    }
    return *this;
}

void SQLiteStatement::Bind(const BindParameters& parameters)
{
    EnsureLive();
    Reset();
    sqlite3_clear_bindings(_statement);

    if (const auto* single = std::get_if<Value>(&parameters))
    {
        BindValue(1, *single);
    }
    else if (const auto* positional = std::get_if<std::vector<Value>>(&parameters))
    {
        int index = 1;
        for (const auto& value : *positional)
        {
            BindValue(index, value);
            ++index;
        }
    }
    else if (const auto* named = std::get_if<NamedValues>(&parameters))
    {
        for (const auto& entry : *named)
        {
            int index = sqlite3_bind_parameter_index(_statement, entry.first.c_str());
            if (0 == index)
            {
                throw SQLiteError(SQLITE_RANGE, "Unknown named parameter: " + entry.first);
            }
            BindValue(index, entry.second);
        }
    }
}

bool SQLiteStatement::FetchRow()
{
    EnsureLive();
    int result = sqlite3_step(_statement);
    if (SQLITE_ROW == result)
    {
        return true;
    }
    if (SQLITE_DONE == result)
    {
        return false;
    }
    throw MakeStatementError(_statement, result, "Failed to step statement: ");
}

bool SQLiteStatement::ExecuteStatement()
{
    EnsureLive();
    int result = sqlite3_step(_statement);
    if (SQLITE_DONE == result)
    {
        return true;
    }
    if (SQLITE_ROW == result)
    {
        return false;
    }
    throw MakeStatementError(_statement, result, "Failed to execute statement: ");
}

int SQLiteStatement::ColumnCount() const
{
    EnsureLive();
    return sqlite3_column_count(_statement);
}

std::string SQLiteStatement::ColumnName(int index) const
{
    EnsureLive();
    const char* name = sqlite3_column_name(_statement, index);
    if (nullptr == name)
    {
        return {};
    }
    return name;
}

Value SQLiteStatement::ColumnValue(int index) const
{
    EnsureLive();
    switch (sqlite3_column_type(_statement, index))
    {
    case SQLITE_INTEGER:
        return static_cast<std::int64_t>(sqlite3_column_int64(_statement, index));
    case SQLITE_FLOAT:
        return sqlite3_column_double(_statement, index);
    case SQLITE_TEXT:
    {
        const unsigned char* text = sqlite3_column_text(_statement, index);
        int length = sqlite3_column_bytes(_statement, index);
        return std::string(reinterpret_cast<const char*>(text), static_cast<std::size_t>(length));
    }
    case SQLITE_BLOB:
    {
        const auto* data = static_cast<const std::uint8_t*>(sqlite3_column_blob(_statement, index));
        int length = sqlite3_column_bytes(_statement, index);
        if (nullptr == data)
        {
            return Blob{};
        }
        return Blob(data, data + length);
    }
    default:
        return nullptr;
    }
}

Row SQLiteStatement::ReadRow() const
{
    Row row;
    const int columnCount = ColumnCount();
    for (int index = 0; index < columnCount; ++index)
    {
        row.Append(ColumnName(index), ColumnValue(index));
    }
    return row;
}

std::vector<Row> SQLiteStatement::All(const BindParameters& parameters)
{
    Bind(parameters);

    std::vector<Row> rows;
    while (FetchRow())
    {
        rows.push_back(ReadRow());
    }
    Reset();
    return rows;
}

std::optional<Row> SQLiteStatement::Get(const BindParameters& parameters)
{
    Bind(parameters);

    std::optional<Row> row;
    if (FetchRow())
    {
        row = ReadRow();
    }
    Reset();
    return row;
}

RunResult SQLiteStatement::Run(const BindParameters& parameters)
{
    Bind(parameters);

    while (false == ExecuteStatement())
    {
    }

    sqlite3* database = sqlite3_db_handle(_statement);
    RunResult result{sqlite3_changes64(database), sqlite3_last_insert_rowid(database)};
    Reset();
    return result;
}

int SQLiteStatement::Finalize() noexcept
{
    if (nullptr == _statement)
    {
        return SQLITE_OK;
    }
    int result = sqlite3_finalize(_statement);
    _statement = nullptr;
    return result;
}

void SQLiteStatement::EnsureLive() const
{
    if (nullptr == _statement)
    {
        throw SQLiteError(SQLITE_MISUSE, "SQLite statement has been finalized.");
    }
}

/**
 * @brief Rewind the statement so it can be stepped again.
 */
void SQLiteStatement::Reset() noexcept
{
    // sqlite3_reset reports the outcome of the previous step, which has already been surfaced.
    static_cast<void>(sqlite3_reset(_statement));
}

void SQLiteStatement::BindValue(int index, const Value& value)
{
    int result = SQLITE_OK;
    if (std::holds_alternative<std::nullptr_t>(value))
    {
        result = sqlite3_bind_null(_statement, index);
    }
    else if (const auto* integer = std::get_if<std::int64_t>(&value))
    {
        result = sqlite3_bind_int64(_statement, index, *integer);
    }
    else if (const auto* real = std::get_if<double>(&value))
    {
        result = sqlite3_bind_double(_statement, index, *real);
    }
    else if (const auto* text = std::get_if<std::string>(&value))
    {
        result = sqlite3_bind_text64(_statement, index, text->data(), text->size(), SQLITE_TRANSIENT, SQLITE_UTF8);
    }
    else
    {
        const auto& blob = std::get<Blob>(value);
        // A null data pointer would bind NULL instead of an empty blob.
        result = blob.empty() ? sqlite3_bind_zeroblob(_statement, index, 0)
                              : sqlite3_bind_blob64(_statement, index, blob.data(), blob.size(), SQLITE_TRANSIENT);
    }

    if (SQLITE_OK != result)
    {
        throw MakeStatementError(_statement, result, "Failed to bind parameter " + std::to_string(index) + ": ");
    }
}
