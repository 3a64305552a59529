/**
 * @file database_file_tests.cpp
 * @brief Tests for file-backed databases: open modes, persistence and lock cleanup.
 */
#include "LockArtifact/LockArtifact.hpp"
#include "SQLite/SQLiteError.hpp"
#include "SQLiteCompat/Database.hpp"
#include "helpers/TestHelpers.hpp"

#include <gtest/gtest.h>
#include <sqlite3.h>

#include <fstream>
#include <optional>
#include <string>
#include <vector>

class DatabaseFileTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        databasePath = TestDatabasePath();
        RemoveDatabaseFiles(databasePath);
    }

    void TearDown() override
    {
        RemoveDatabaseFiles(databasePath);
    }

    fs::path databasePath;
};

TEST_F(DatabaseFileTest, PersistsDataAndReopensReadOnly)
{
    Database writer(databasePath.string());
    writer.Exec("CREATE TABLE test (id INTEGER PRIMARY KEY, val TEXT)");
    writer.Prepare("INSERT INTO test VALUES (?, ?)").Run(1, "hello");
    writer.Close();

    DatabaseOptions options;
    options.readonly = true;
    Database reader(databasePath.string(), options);

    std::optional<Row> row = reader.Prepare("SELECT * FROM test WHERE id = ?").Get(1);
    ASSERT_TRUE(row.has_value());
    EXPECT_EQ(1, IntegerAt(*row, "id"));
    EXPECT_EQ("hello", TextAt(*row, "val"));
    reader.Close();
}

TEST_F(DatabaseFileTest, ReadOnlyDatabaseRejectsWrites)
{
    {
        Database writer(databasePath.string());
        writer.Exec("CREATE TABLE test (id INTEGER PRIMARY KEY, val TEXT)");
    }

    DatabaseOptions options;
    options.readonly = true;
    Database reader(databasePath.string(), options);

    try
    {
        reader.Prepare("INSERT INTO test VALUES (?, ?)").Run(1, "hello");
        FAIL() << "write succeeded on a read-only database";
    }
    catch (const SQLiteError& error)
    {
        EXPECT_EQ(SQLITE_READONLY, error.Code());
    }
}

TEST_F(DatabaseFileTest, FileMustExistFailsForMissingFile)
{
    DatabaseOptions options;
    options.fileMustExist = true;

    EXPECT_THROW(Database(databasePath.string(), options), SQLiteError);
    EXPECT_FALSE(fs::exists(databasePath));
}

TEST_F(DatabaseFileTest, FileMustExistOpensExistingFile)
{
    {
        Database creator(databasePath.string());
        creator.Exec("CREATE TABLE test (id INTEGER PRIMARY KEY)");
    }

    DatabaseOptions options;
    options.fileMustExist = true;
    Database database(databasePath.string(), options);

    EXPECT_EQ(1u, database.Pragma("table_info(test)").size());
}

TEST_F(DatabaseFileTest, MissingFileIsCreatedByDefault)
{
    Database database(databasePath.string());

    EXPECT_TRUE(fs::exists(databasePath));
    EXPECT_EQ(databasePath.string(), database.Path());
}

TEST_F(DatabaseFileTest, CloseRemovesLeftoverLockDirectory)
{
    const fs::path lockPath = LockArtifactPath(databasePath);
    Database database(databasePath.string());
    database.Exec("CREATE TABLE test (id INTEGER PRIMARY KEY)");

    fs::create_directories(lockPath / "owner");
    std::ofstream(lockPath / "owner" / "pid") << "1234";

    database.Close();

    EXPECT_FALSE(fs::exists(lockPath));
    EXPECT_TRUE(fs::exists(databasePath));
}

TEST_F(DatabaseFileTest, CloseTwiceWithoutLockDirectoryDoesNotThrow)
{
    Database database(databasePath.string());

    EXPECT_NO_THROW(database.Close());
    EXPECT_NO_THROW(database.Close());
    EXPECT_FALSE(fs::exists(LockArtifactPath(databasePath)));
}

TEST_F(DatabaseFileTest, DestructorClosesAndCleansUp)
{
    const fs::path lockPath = LockArtifactPath(databasePath);
    {
        Database database(databasePath.string());
        fs::create_directories(lockPath);
    }

    EXPECT_FALSE(fs::exists(lockPath));

    DatabaseOptions options;
    options.fileMustExist = true;
    EXPECT_NO_THROW(Database(databasePath.string(), options));
}

/* ============================================================================ */
/* unix-dotfile VFS */
/* ============================================================================ */

TEST_F(DatabaseFileTest, DotfileVfsReleasesItsLockAfterEachCall)
{
    DatabaseOptions options;
    options.vfs = "unix-dotfile";
    Database database(databasePath.string(), options);

    database.Exec("CREATE TABLE test (id INTEGER PRIMARY KEY, val TEXT)");
    Statement insert = database.Prepare("INSERT INTO test VALUES (?, ?)");
    insert.Run(1, "one");
    EXPECT_FALSE(fs::exists(LockArtifactPath(databasePath)));

    std::vector<Row> rows = database.Prepare("SELECT * FROM test").All();
    ASSERT_EQ(1u, rows.size());
    EXPECT_EQ("one", TextAt(rows[0], "val"));
    EXPECT_FALSE(fs::exists(LockArtifactPath(databasePath)));

    database.Close();
    EXPECT_FALSE(fs::exists(LockArtifactPath(databasePath)));
}

TEST_F(DatabaseFileTest, StaleDotfileLockBlocksUntilCloseRemovesIt)
{
    {
        Database setup(databasePath.string());
        setup.Exec("CREATE TABLE test (id INTEGER PRIMARY KEY, val TEXT);"
                   "INSERT INTO test VALUES (1, 'one');");
    }

    const fs::path lockPath = LockArtifactPath(databasePath);
    fs::create_directory(lockPath);

    DatabaseOptions options;
    options.vfs = "unix-dotfile";
    options.busyTimeoutMs = 0;

    Database blocked(databasePath.string(), options);
    try
    {
        blocked.Prepare("SELECT * FROM test").All();
        FAIL() << "read succeeded while " << lockPath << " existed";
    }
    catch (const SQLiteError& error)
    {
        EXPECT_EQ(SQLITE_BUSY, error.Code());
    }

    blocked.Close();
    EXPECT_FALSE(fs::exists(lockPath));

    Database reopened(databasePath.string(), options);
    std::optional<Row> row = reopened.Prepare("SELECT val FROM test WHERE id = ?").Get(1);
    ASSERT_TRUE(row.has_value());
    EXPECT_EQ("one", TextAt(*row, "val"));
}

TEST_F(DatabaseFileTest, UnknownVfsFailsToOpen)
{
    DatabaseOptions options;
    options.vfs = "no-such-vfs";

    EXPECT_THROW(Database(databasePath.string(), options), SQLiteError);
    EXPECT_FALSE(fs::exists(databasePath));
}

TEST_F(DatabaseFileTest, InMemoryCloseLeavesFilesystemAlone)
{
    const fs::path memoryLock = fs::current_path() / ":memory:.lock";
    std::error_code errorCode;
    if (false == fs::create_directory(memoryLock, errorCode))
    {
        GTEST_SKIP() << "cannot create " << memoryLock << ": " << errorCode.message();
    }

    {
        Database database(SQLiteConnection::InMemoryPath);
        database.Close();
    }

    EXPECT_TRUE(fs::exists(memoryLock));
    fs::remove_all(memoryLock, errorCode);
}
