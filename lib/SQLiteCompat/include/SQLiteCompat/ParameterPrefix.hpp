// file ParameterPrefix.hpp:

#pragma once

#include <string>

/**
 * @brief Prefix assumed for bare named-parameter keys when the SQL has no named placeholder.
 */
constexpr char DefaultParameterPrefix = '@';

/**
 * @brief Check whether a character introduces a named placeholder ('@', '$' or ':').
 */
bool IsParameterPrefix(char character);

/**
 * @brief Detect the prefix character of the first named placeholder in SQL text.
 *
 * String literals, quoted identifiers and comments are skipped, so a
 * character such as '@' inside 'user@example.com' is not a placeholder.
 *
 * @param[in] sql SQL text to scan
 * @return '@', '$' or ':' for the first "<prefix><identifier>" token, DefaultParameterPrefix if none
 */
char DetectParameterPrefix(const std::string& sql);
