// file SQLiteError.cpp

#include "SQLite/SQLiteError.hpp"

#include <sqlite3.h>

SQLiteError::SQLiteError(int extendedCode, const std::string& message) : std::runtime_error(message), _extendedCode(extendedCode)
{
}

SQLiteError MakeSqliteError(sqlite3* database, int resultCode, const std::string& prefix)
{
    if (nullptr == database)
    {
        return SQLiteError(resultCode, prefix + sqlite3_errstr(resultCode));
    }
    return SQLiteError(sqlite3_extended_errcode(database), prefix + sqlite3_errmsg(database));
}
