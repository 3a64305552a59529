// file SQLiteValue.hpp:

#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <variant>
#include <vector>

/**
 * @brief Binary payload bound to or read from a BLOB column.
 */
using Blob = std::vector<std::uint8_t>;

/**
 * @brief Scalar SQLite value: NULL, INTEGER, REAL, TEXT or BLOB.
 */
using Value = std::variant<std::nullptr_t, std::int64_t, double, std::string, Blob>;

/**
 * @brief Named parameter values keyed exactly as they are bound.
 */
using NamedValues = std::map<std::string, Value>;

/**
 * @brief No bound parameters.
 */
struct NoParameters
{
};

/**
 * @brief Parameter set in the shape accepted by SQLiteStatement.
 *
 * Named keys must include the placeholder prefix used in the SQL text
 * (for example "@id" for "@id" in the statement).
 */
using BindParameters = std::variant<NoParameters, Value, std::vector<Value>, NamedValues>;

/**
 * @brief Outcome of a mutating statement.
 */
struct RunResult
{
    std::int64_t changes;         /**< Rows inserted, updated or deleted */
    std::int64_t lastInsertRowid; /**< Rowid of the most recent successful insert */
};

/**
 * @brief One result row with columns in result-set order.
 */
class Row
{
  public:
    Row() = default;

    /**
     * @brief Append a column to the row.
     *
     * @param[in] name Column name as reported by SQLite
     * @param[in] value Column value
     */
    void Append(std::string name, Value value);

    /**
     * @brief Look up a column value by name.
     *
     * @param[in] name Column name
     * @return Column value
     * @throws std::out_of_range if the row has no such column
     */
    const Value& At(const std::string& name) const;

    /**
     * @brief Check whether the row has a column with the given name.
     */
    bool Contains(const std::string& name) const;

    std::size_t Size() const { return _columns.size(); }
    bool Empty() const { return _columns.empty(); }

    const std::vector<std::pair<std::string, Value>>& Columns() const { return _columns; }

    bool operator==(const Row& other) const { return _columns == other._columns; }
    bool operator!=(const Row& other) const { return !(*this == other); }

  private:
    std::vector<std::pair<std::string, Value>> _columns;
};

/**
 * @brief Render a value as text for display.
 *
 * @param[in] value Value to render
 * @return "NULL", a decimal number, the text itself, or "x'..'" for blobs
 */
std::string ValueToString(const Value& value);
