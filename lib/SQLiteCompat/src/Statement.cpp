// file Statement.cpp

#include "SQLiteCompat/Statement.hpp"

#include <sqlite3.h>
#include <spdlog/spdlog.h>

/**
 * @brief Scoped acquisition of a statement's SQLite handle.
 *
 * The handle is released when the lease goes out of scope, including
 * during exception unwinding.
 */
class StatementLease
{
  public:
    explicit StatementLease(Statement& statement) : _statement(statement), _handle(statement.Acquire())
    {
    }

    ~StatementLease()
    {
        _statement.Release();
    }

    StatementLease(const StatementLease&) = delete;
    StatementLease& operator=(const StatementLease&) = delete;

    SQLiteStatement* operator->() { return &_handle; }

  private:
    Statement& _statement;
    SQLiteStatement& _handle;
};

Statement::Statement(SQLiteConnection& connection, std::string sql)
    : _connection(connection), _sql(std::move(sql)), _prefix(DetectParameterPrefix(_sql))
{
}

std::vector<Row> Statement::AllWith(const ArgumentList& arguments)
{
    const BindParameters parameters = NormalizeParameters(arguments, _prefix);
    StatementLease lease(*this);
    return lease->All(parameters);
}

std::optional<Row> Statement::GetWith(const ArgumentList& arguments)
{
    const BindParameters parameters = NormalizeParameters(arguments, _prefix);
    StatementLease lease(*this);
    return lease->Get(parameters);
}

RunResult Statement::RunWith(const ArgumentList& arguments)
{
    const BindParameters parameters = NormalizeParameters(arguments, _prefix);
    StatementLease lease(*this);
    return lease->Run(parameters);
}

/**
 * @brief Prepare the SQLite statement if no handle is held.
 *
 * @return The live statement handle
 */
SQLiteStatement& Statement::Acquire()
{
    if (false == _statement.has_value())
    {
        _statement.emplace(_connection.Prepare(_sql));
    }
    return *_statement;
}

/**
 * @brief Finalize the held handle, if any, and forget it.
 */
void Statement::Release() noexcept
{
    if (false == _statement.has_value())
    {
        return;
    }

    // A non-OK result repeats the error of the failed step or reports a finalize
    // failure; either way the handle is gone and the statement stays usable.
    int result = _statement->Finalize();
    if (SQLITE_OK != result)
    {
        spdlog::debug("Finalize of \"{}\" reported: {}", _sql, sqlite3_errstr(result));
    }
    _statement.reset();
}
