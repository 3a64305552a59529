// file Parameters.hpp:

#pragma once

#include "SQLite/SQLiteValue.hpp"
#include "SQLiteCompat/ParameterPrefix.hpp"

#include <cstdint>
#include <limits>
#include <map>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

/**
 * @brief Ordered sequence of values passed as one argument.
 */
using ValueList = std::vector<Value>;

/**
 * @brief Named parameters keyed by bare name ("id") or prefixed name ("@id").
 */
using NamedArguments = std::map<std::string, Value>;

/**
 * @brief One caller-supplied argument of Statement::All, Get or Run.
 */
using Argument = std::variant<Value, ValueList, NamedArguments>;

/**
 * @brief The full argument list of one statement call, in call order.
 */
using ArgumentList = std::vector<Argument>;

/**
 * @brief Convert caller arguments into the parameter shape the engine binds.
 *
 * - no arguments: no parameters
 * - a single NamedArguments: named parameters, bare keys get @p prefix prepended
 * - a single value or ValueList: passed through unchanged
 * - several arguments: positional values in call order
 *
 * @param[in] arguments Caller arguments
 * @param[in] prefix Placeholder prefix detected in the SQL text
 * @return Parameters ready for SQLiteStatement::Bind
 */
BindParameters NormalizeParameters(const ArgumentList& arguments, char prefix = DefaultParameterPrefix);

inline Argument ToArgument(std::nullptr_t)
{
    return Value(nullptr);
}

/**
 * @brief Convert a C string; a null pointer binds NULL.
 */
inline Argument ToArgument(const char* text)
{
    if (nullptr == text)
    {
        return Value(nullptr);
    }
    return Value(std::string(text));
}

inline Argument ToArgument(std::string text)
{
    return Value(std::move(text));
}

inline Argument ToArgument(Blob blob)
{
    return Value(std::move(blob));
}

inline Argument ToArgument(Value value)
{
    return value;
}

inline Argument ToArgument(ValueList values)
{
    return values;
}

inline Argument ToArgument(NamedArguments named)
{
    return named;
}

inline Argument ToArgument(Argument argument)
{
    return argument;
}

/**
 * @brief Convert an integer to a 64-bit SQLite INTEGER.
 *
 * @throws std::out_of_range if an unsigned value does not fit in std::int64_t
 */
template <typename T, std::enable_if_t<std::is_integral<T>::value, int> = 0>
Argument ToArgument(T value)
{
    if constexpr (std::is_unsigned<T>::value && (sizeof(T) >= sizeof(std::int64_t)))
    {
        if (static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()) < static_cast<std::uint64_t>(value))
        {
            throw std::out_of_range("Unsigned argument " + std::to_string(value) + " does not fit in a SQLite INTEGER");
        }
    }
    return Value(static_cast<std::int64_t>(value));
}

template <typename T, std::enable_if_t<std::is_floating_point<T>::value, int> = 0>
Argument ToArgument(T value)
{
    return Value(static_cast<double>(value));
}
