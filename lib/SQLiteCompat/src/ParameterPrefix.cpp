// file ParameterPrefix.cpp

#include "SQLiteCompat/ParameterPrefix.hpp"

namespace
{
bool IsIdentifierStart(char character)
{
    return ((character >= 'a') && (character <= 'z')) || ((character >= 'A') && (character <= 'Z')) || ('_' == character);
}

/**
 * @brief Skip a quoted region; a doubled closing quote is an escaped quote.
 *
 * @param[in] sql SQL text
 * @param[in] start Index of the opening quote
 * @param[in] closing Closing quote character
 * @return Index just past the closing quote, or the text length if unterminated
 */
std::size_t SkipQuoted(const std::string& sql, std::size_t start, char closing)
{
    std::size_t index = start + 1;
    while (index < sql.size())
    {
        if (closing == sql[index])
        {
            if (((index + 1) < sql.size()) && (closing == sql[index + 1]) && (']' != closing))
            {
                index += 2;
                continue;
            }
            return index + 1;
        }
        ++index;
    }
    return sql.size();
}

std::size_t SkipLineComment(const std::string& sql, std::size_t start)
{
    std::size_t end = sql.find('\n', start);
    return (std::string::npos == end) ? sql.size() : end + 1;
}

std::size_t SkipBlockComment(const std::string& sql, std::size_t start)
{
    std::size_t end = sql.find("*/", start + 2);
    return (std::string::npos == end) ? sql.size() : end + 2;
}
}

bool IsParameterPrefix(char character)
{
    return ('@' == character) || ('$' == character) || (':' == character);
}

char DetectParameterPrefix(const std::string& sql)
{
    std::size_t index = 0;
    while (index < sql.size())
    {
        const char current = sql[index];
        const char next = ((index + 1) < sql.size()) ? sql[index + 1] : '\0';

        switch (current)
        {
        case '\'':
        case '"':
        case '`':
            index = SkipQuoted(sql, index, current);
            continue;
        case '[':
            index = SkipQuoted(sql, index, ']');
            continue;
        case '-':
            if ('-' == next)
            {
                index = SkipLineComment(sql, index);
                continue;
            }
            break;
        case '/':
            if ('*' == next)
            {
                index = SkipBlockComment(sql, index);
                continue;
            }
            break;
        default:
            if (IsParameterPrefix(current) && IsIdentifierStart(next))
            {
                return current;
            }
            break;
        }
        ++index;
    }
    return DefaultParameterPrefix;
}
