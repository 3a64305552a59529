// file SQLiteError.hpp:

#pragma once

#include <stdexcept>
#include <string>

struct sqlite3;

/**
 * @brief Error raised by the SQLite engine binding.
 */
class SQLiteError : public std::runtime_error
{
  public:
    /**
     * @brief Construct an error from an extended SQLite result code.
     *
     * @param[in] extendedCode Extended SQLite result code
     * @param[in] message Error description
     */
    SQLiteError(int extendedCode, const std::string& message);

    /**
     * @brief Primary result code (for example SQLITE_BUSY, SQLITE_CONSTRAINT).
     */
    int Code() const { return _extendedCode & 0xff; }

    /**
     * @brief Extended result code as reported by SQLite.
     */
    int ExtendedCode() const { return _extendedCode; }

  private:
    int _extendedCode;
};

/**
 * @brief Build a SQLite error from the last error recorded on a connection.
 *
 * @param[in] database SQLite connection handle, may be null
 * @param[in] resultCode Result code returned by the failing call
 * @param[in] prefix Context prefix for the error message
 * @return Error describing the SQLite failure
 */
SQLiteError MakeSqliteError(sqlite3* database, int resultCode, const std::string& prefix);
