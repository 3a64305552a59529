// file Database.hpp:

#pragma once

#include "SQLite/SQLiteConnection.hpp"
#include "SQLiteCompat/Statement.hpp"

#include <functional>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

/**
 * @brief Options accepted when opening a Database.
 */
struct DatabaseOptions
{
    bool readonly;       /**< Open the database read-only */
    bool fileMustExist;  /**< Fail if the database file does not exist */
    int busyTimeoutMs;   /**< Time to wait on a locked database before failing */
    std::string vfs;     /**< SQLite VFS name, e.g. "unix-dotfile"; empty selects the default */

    /**
     * @brief Initialize options with default values.
     */
    DatabaseOptions()
        : readonly(false)
        , fileMustExist(false)
        , busyTimeoutMs(SQLiteOpenOptions::DefaultBusyTimeoutMs)
    {
    }
};

/**
 * @brief Synchronous database handle with prepare/exec/pragma/transaction/close operations.
 */
class Database
{
  public:
    /**
     * @brief Open a database.
     *
     * @param[in] path Database file path or ":memory:"
     * @param[in] options Open options
     * @throws SQLiteError if the database cannot be opened
     */
    explicit Database(const std::string& path, const DatabaseOptions& options = DatabaseOptions());
    /**
     * @brief Close the database if it is still open.
     */
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;
    Database(Database&&) = delete;
    Database& operator=(Database&&) = delete;

    /**
     * @brief Compile SQL into a reusable statement.
     *
     * @param[in] sql SQL text with positional or named placeholders
     * @return Statement bound to this database
     * @throws SQLiteError if the SQL is malformed
     */
    Statement Prepare(const std::string& sql);

    /**
     * @brief Run one or more semicolon-separated statements without parameters.
     *
     * @param[in] sql SQL script
     */
    void Exec(const std::string& sql);

    /**
     * @brief Run a PRAGMA and return its rows.
     *
     * The PRAGMA keyword is added when missing. A PRAGMA that fails or
     * produces no result set yields an empty vector.
     *
     * @param[in] pragma PRAGMA name or assignment, e.g. "table_info(users)"
     * @return Result rows
     */
    std::vector<Row> Pragma(const std::string& pragma);

    /**
     * @brief Run a PRAGMA and return the first column of its first row.
     *
     * @param[in] pragma PRAGMA name or assignment, e.g. "foreign_keys"
     * @return The value, or std::nullopt if the PRAGMA produced no row or failed
     */
    std::optional<Value> PragmaValue(const std::string& pragma);

    /**
     * @brief Wrap a function so that each call runs inside BEGIN/COMMIT.
     *
     * The returned callable forwards its arguments to @p function and
     * returns its result. If the function throws, the transaction is rolled
     * back and the original exception propagates unchanged. Transactions do
     * not nest. The callable refers to this Database, which must outlive it.
     *
     * @param[in] function Callable to wrap
     * @return Callable with the same parameters as @p function
     */
    template <typename Function>
    auto Transaction(Function function)
    {
        return [this, function = std::move(function)](auto&&... arguments) mutable
        {
            using Result = std::invoke_result_t<Function&, decltype(arguments)...>;

            BeginTransaction();
            try
            {
                if constexpr (std::is_void<Result>::value)
                {
                    std::invoke(function, std::forward<decltype(arguments)>(arguments)...);
                    CommitTransaction();
                }
                else
                {
                    Result result = std::invoke(function, std::forward<decltype(arguments)>(arguments)...);
                    CommitTransaction();
                    return result;
                }
            }
            catch (...)
            {
                RollbackTransaction();
                throw;
            }
        };
    }

    /**
     * @brief Close the database.
     *
     * Safe to call repeatedly. For file databases, also removes the
     * "<path>.lock" directory a dot-lock VFS may leave behind.
     */
    void Close() noexcept;

    bool IsOpen() const { return _connection.IsOpen(); }
    bool InTransaction() const { return _connection.InTransaction(); }
    const std::string& Path() const { return _path; }

  private:
    void BeginTransaction();
    void CommitTransaction();
    void RollbackTransaction() noexcept;

    std::string _path;
    SQLiteConnection _connection;
};
