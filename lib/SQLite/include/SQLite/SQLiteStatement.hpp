// file SQLiteStatement.hpp:

#pragma once

#include "SQLite/SQLiteValue.hpp"

#include <optional>
#include <string>
#include <vector>

struct sqlite3_stmt;

/**
 * @brief RAII wrapper for a prepared SQLite statement.
 *
 * A prepared statement keeps its read or write lock on the database file
 * until it is reset or finalized.
 */
class SQLiteStatement
{
  public:
    /**
     * @brief Construct a SQLite statement wrapper.
     *
     * @param[in] statement Raw SQLite statement pointer
     */
    explicit SQLiteStatement(sqlite3_stmt* statement);
    /**
     * @brief Finalize the SQLite statement.
     */
    ~SQLiteStatement();

    SQLiteStatement(const SQLiteStatement&) = delete;
    SQLiteStatement& operator=(const SQLiteStatement&) = delete;

    /**
     * @brief Move-construct a SQLite statement.
     *
     * @param[in] other Statement to move from
     */
    SQLiteStatement(SQLiteStatement&& other) noexcept;
    /**
     * @brief Move-assign a SQLite statement.
     *
     * @param[in] other Statement to move from
     * @return Reference to this statement
     */
    SQLiteStatement& operator=(SQLiteStatement&& other) noexcept;

    /**
     * @brief Reset the statement and bind a new parameter set.
     *
     * Named keys are resolved with sqlite3_bind_parameter_index and must
     * carry the same prefix as the placeholder in the SQL text.
     *
     * @param[in] parameters Parameters to bind
     * @throws SQLiteError if a key is unknown or a value cannot be bound
     */
    void Bind(const BindParameters& parameters);

    /**
     * @brief Fetch the next row from the statement.
     *
     * @return true if a row is available, false if done
     */
    bool FetchRow();
    /**
     * @brief Execute the statement to completion.
     *
     * @return true if execution completes, false if a row is returned
     */
    bool ExecuteStatement();

    int ColumnCount() const;
    std::string ColumnName(int index) const;

    /**
     * @brief Read a column value from the current row.
     *
     * @param[in] index Zero-based column index
     * @return Column value converted according to its storage class
     */
    Value ColumnValue(int index) const;

    /**
     * @brief Read every column of the current row.
     */
    Row ReadRow() const;

    /**
     * @brief Bind parameters and collect every result row.
     *
     * @param[in] parameters Parameters to bind
     * @return Result rows in the order produced by SQLite
     */
    std::vector<Row> All(const BindParameters& parameters = NoParameters{});
    /**
     * @brief Bind parameters and return the first result row, if any.
     *
     * @param[in] parameters Parameters to bind
     * @return First row or std::nullopt when the query yields no rows
     */
    std::optional<Row> Get(const BindParameters& parameters = NoParameters{});
    /**
     * @brief Bind parameters and execute a mutating statement.
     *
     * @param[in] parameters Parameters to bind
     * @return Affected row count and last inserted rowid
     */
    RunResult Run(const BindParameters& parameters = NoParameters{});

    /**
     * @brief Finalize the statement and release its locks.
     *
     * Safe to call repeatedly.
     *
     * @return SQLite result code of sqlite3_finalize, SQLITE_OK if already finalized
     */
    int Finalize() noexcept;

    bool IsFinalized() const { return nullptr == _statement; }

  private:
    void EnsureLive() const;
    void Reset() noexcept;
    void BindValue(int index, const Value& value);

    sqlite3_stmt* _statement;
};
