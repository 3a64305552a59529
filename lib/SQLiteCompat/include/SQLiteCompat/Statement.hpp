// file Statement.hpp:

#pragma once

#include "SQLite/SQLiteConnection.hpp"
#include "SQLite/SQLiteStatement.hpp"
#include "SQLiteCompat/Parameters.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

/**
 * @brief Prepared query that holds its SQLite statement only for the duration of one call.
 *
 * A live sqlite3_stmt keeps its lock on the database file until it is
 * finalized. Every All, Get and Run call prepares the statement, executes
 * it and finalizes it again before returning, on success and on failure,
 * so no statement lock outlives a single call.
 *
 * The statement refers to the connection it was prepared on without owning
 * it; the Database it came from must outlive it.
 */
class Statement
{
  public:
    /**
     * @brief Create a statement for SQL text on a connection.
     *
     * @param[in] connection Connection used to prepare the statement on each call
     * @param[in] sql SQL text
     */
    Statement(SQLiteConnection& connection, std::string sql);

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;
    Statement(Statement&&) = default;
    Statement& operator=(Statement&&) = delete;

    /**
     * @brief Execute the query and return every matching row.
     *
     * Accepts positional values, a single ValueList, or a single
     * NamedArguments mapping whose keys may omit the placeholder prefix.
     *
     * @return Rows in result order, empty if nothing matches
     */
    template <typename... Args>
    std::vector<Row> All(Args&&... args)
    {
        return AllWith(ArgumentList{ToArgument(std::forward<Args>(args))...});
    }

    /**
     * @brief Execute the query and return the first matching row.
     *
     * @return First row, or std::nullopt if nothing matches
     */
    template <typename... Args>
    std::optional<Row> Get(Args&&... args)
    {
        return GetWith(ArgumentList{ToArgument(std::forward<Args>(args))...});
    }

    /**
     * @brief Execute a mutating statement.
     *
     * @return Number of changed rows and the last inserted rowid
     */
    template <typename... Args>
    RunResult Run(Args&&... args)
    {
        return RunWith(ArgumentList{ToArgument(std::forward<Args>(args))...});
    }

    std::vector<Row> AllWith(const ArgumentList& arguments);
    std::optional<Row> GetWith(const ArgumentList& arguments);
    RunResult RunWith(const ArgumentList& arguments);

    const std::string& Sql() const { return _sql; }
    char Prefix() const { return _prefix; }

    /**
     * @brief Check whether a prepared SQLite statement is currently held.
     *
     * Always false between calls.
     */
    bool IsAcquired() const { return _statement.has_value(); }

  private:
    friend class StatementLease;

    SQLiteStatement& Acquire();
    void Release() noexcept;

    SQLiteConnection& _connection;
    std::string _sql;
    char _prefix;
    std::optional<SQLiteStatement> _statement;
};
