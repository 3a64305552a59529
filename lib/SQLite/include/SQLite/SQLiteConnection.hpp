// file SQLiteConnection.hpp:

#pragma once

#include "SQLite/SQLiteStatement.hpp"

#include <string>

struct sqlite3;

/**
 * @brief Open-mode options for a SQLite connection.
 */
struct SQLiteOpenOptions
{
    bool readOnly;                 /**< Open without write access */
    bool fileMustExist;            /**< Fail instead of creating a missing database file */
    int busyTimeoutMs;             /**< Busy handler timeout in milliseconds, 0 disables it */
    bool enableWriteAheadLogging;  /**< Switch the database to WAL journal mode after opening */
    std::string vfs;               /**< VFS module name, empty selects the default */

    /**
     * @brief Initialize options with default values.
     */
    SQLiteOpenOptions()
        : readOnly(false)
        , fileMustExist(false)
        , busyTimeoutMs(DefaultBusyTimeoutMs)
        , enableWriteAheadLogging(false)
    {
    }

    /**
     * @brief Default busy timeout for SQLite connections.
     */
    static constexpr int DefaultBusyTimeoutMs = 5000;
};

/**
 * @brief RAII wrapper for a SQLite database connection.
 */
class SQLiteConnection
{
  public:
    /**
     * @brief Path that opens a private in-memory database.
     */
    static constexpr const char* InMemoryPath = ":memory:";

    /**
     * @brief Open a SQLite connection to the specified database file.
     *
     * @param[in] databasePath Path to the SQLite database file or ":memory:"
     * @param[in] options Open-mode options
     * @throws SQLiteError if the database cannot be opened
     */
    SQLiteConnection(const std::string& databasePath, const SQLiteOpenOptions& options);
    /**
     * @brief Close the SQLite connection.
     */
    ~SQLiteConnection();

    SQLiteConnection(const SQLiteConnection&) = delete;
    SQLiteConnection& operator=(const SQLiteConnection&) = delete;

    /**
     * @brief Move-construct a SQLite connection.
     *
     * @param[in] other Connection to move from
     */
    SQLiteConnection(SQLiteConnection&& other) noexcept;
    /**
     * @brief Move-assign a SQLite connection.
     *
     * @param[in] other Connection to move from
     * @return Reference to this connection
     */
    SQLiteConnection& operator=(SQLiteConnection&& other) noexcept;

    /**
     * @brief Execute one or more SQL statements without results.
     *
     * @param[in] sqlStatement SQL statements to execute
     */
    void Execute(const std::string& sqlStatement);
    /**
     * @brief Prepare a SQL statement.
     *
     * @param[in] sqlStatement SQL statement to prepare
     * @return Prepared SQLite statement
     */
    SQLiteStatement Prepare(const std::string& sqlStatement);

    /**
     * @brief Close the connection.
     *
     * On failure the connection stays open and the call may be repeated.
     *
     * @return SQLite result code, SQLITE_MISUSE if the connection is already closed
     */
    int Close() noexcept;

    bool IsOpen() const { return nullptr != _database; }

    /**
     * @brief Check whether an explicit transaction is active.
     */
    bool InTransaction() const;

  private:
    void EnsureOpen() const;
    void EnableWriteAheadLoggingMode();

    sqlite3* _database;
};
