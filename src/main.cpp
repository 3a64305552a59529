// file main.cpp:

#include "Logging/Logging.hpp"
#include "SQLite/SQLiteError.hpp"
#include "SQLiteCompat/Database.hpp"
#include "cxxopts.hpp"

#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace
{

/**
 * @brief Settings collected from the command line.
 */
struct ShellConfig
{
    std::string databasePath;
    DatabaseOptions databaseOptions;
    std::optional<std::string> script;
    std::optional<std::string> query;
    std::optional<std::string> pragma;
    bool simplePragma;
    bool verbose;

    ShellConfig()
        : simplePragma(false)
        , verbose(false)
    {
    }
};

/**
 * @brief Parses command-line arguments using cxxopts.
 *
 * @param[in] argc Argument count.
 * @param[in] argv Argument values.
 * @return std::optional<cxxopts::ParseResult> if parsing is successful and help is not requested,
 *         otherwise returns an empty optional.
 */
std::optional<cxxopts::ParseResult> ParseCommandLineOptions(int argc, char* argv[])
{
    cxxopts::Options options("sqlite-compat", "Run SQL against a SQLite database");

    // clang-format off
    options.add_options()
        ("d,database",     "Database file, or :memory:", cxxopts::value<std::string>())
        ("readonly",       "Open the database read-only")
        ("must-exist",     "Fail if the database file does not exist")
        ("busy-timeout",   "Busy timeout in milliseconds", cxxopts::value<int>()->default_value("5000"))
        ("vfs",            "SQLite VFS name, e.g. unix-dotfile", cxxopts::value<std::string>())
        ("e,exec",         "SQL script to execute", cxxopts::value<std::string>())
        ("q,query",        "Query whose rows are printed", cxxopts::value<std::string>())
        ("p,pragma",       "PRAGMA to run", cxxopts::value<std::string>())
        ("simple",         "Print only the first value of the PRAGMA result")
        ("v,verbose",      "Verbose output")
        ("h,help",         "Print help");
    // clang-format on

    auto parseResult = options.parse(argc, argv);

    if ((true == parseResult.count("help")) || (false == parseResult.count("database")))
    {
        std::cout << options.help() << '\n';
        return std::nullopt;
    }

    return parseResult;
}

/**
 * @brief Build the shell configuration from parsed options.
 *
 * @param[in] parseResult The parsed command-line options.
 * @return Shell configuration.
 */
ShellConfig SetupShellConfiguration(const cxxopts::ParseResult& parseResult)
{
    ShellConfig config;

    config.databasePath = parseResult["database"].as<std::string>();
    config.databaseOptions.readonly = (0 < parseResult.count("readonly"));
    config.databaseOptions.fileMustExist = (0 < parseResult.count("must-exist"));
    config.databaseOptions.busyTimeoutMs = parseResult["busy-timeout"].as<int>();
    if (0 < parseResult.count("vfs"))
    {
        config.databaseOptions.vfs = parseResult["vfs"].as<std::string>();
    }
    config.simplePragma = (0 < parseResult.count("simple"));
    config.verbose = (0 < parseResult.count("verbose"));

    if (0 < parseResult.count("exec"))
    {
        config.script = parseResult["exec"].as<std::string>();
    }
    if (0 < parseResult.count("query"))
    {
        config.query = parseResult["query"].as<std::string>();
    }
    if (0 < parseResult.count("pragma"))
    {
        config.pragma = parseResult["pragma"].as<std::string>();
    }

    return config;
}

void PrintRow(const Row& row)
{
    bool first = true;
    for (const auto& column : row.Columns())
    {
        if (false == first)
        {
            std::cout << ' ';
        }
        first = false;
        std::cout << column.first << '=' << ValueToString(column.second);
    }
    std::cout << '\n';
}

void PrintRows(const std::vector<Row>& rows)
{
    for (const auto& row : rows)
    {
        PrintRow(row);
    }
}

/**
 * @brief Execute the requested script, pragma and query in that order.
 *
 * @param[in] config Shell configuration.
 */
void RunShell(const ShellConfig& config)
{
    Database database(config.databasePath, config.databaseOptions);

    if (true == config.script.has_value())
    {
        database.Exec(config.script.value());
    }

    if (true == config.pragma.has_value())
    {
        if (true == config.simplePragma)
        {
            std::optional<Value> value = database.PragmaValue(config.pragma.value());
            if (true == value.has_value())
            {
                std::cout << ValueToString(value.value()) << '\n';
            }
        }
        else
        {
            PrintRows(database.Pragma(config.pragma.value()));
        }
    }

    if (true == config.query.has_value())
    {
        PrintRows(database.Prepare(config.query.value()).All());
    }

    database.Close();
}

} // namespace

int main(int argc, char* argv[])
{
    std::optional<cxxopts::ParseResult> parseResult;
    try
    {
        parseResult = ParseCommandLineOptions(argc, argv);
    }
    catch (const cxxopts::exceptions::exception& error)
    {
        std::cerr << error.what() << '\n';
        return 1;
    }

    if (false == parseResult.has_value())
    {
        return 0; // Help was shown, exit gracefully.
    }

    const ShellConfig config = SetupShellConfiguration(parseResult.value());

    LoggingConfig loggingConfig;
    loggingConfig.level = (true == config.verbose) ? "debug" : "warn";
    InitializeLogging(loggingConfig);

    try
    {
        RunShell(config);
    }
    catch (const SQLiteError& error)
    {
        std::cerr << error.what() << '\n';
        ShutdownLogging();
        return 1;
    }

    ShutdownLogging();
    return 0;
}
