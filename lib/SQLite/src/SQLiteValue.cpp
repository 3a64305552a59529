// file SQLiteValue.cpp

#include "SQLite/SQLiteValue.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>

void Row::Append(std::string name, Value value)
{
    _columns.emplace_back(std::move(name), std::move(value));
}

const Value& Row::At(const std::string& name) const
{
    for (const auto& column : _columns)
    {
        if (column.first == name)
        {
            return column.second;
        }
    }
    throw std::out_of_range("No such column: " + name);
}

bool Row::Contains(const std::string& name) const
{
    for (const auto& column : _columns)
    {
        if (column.first == name)
        {
            return true;
        }
    }
    return false;
}

std::string ValueToString(const Value& value)
{
    std::ostringstream outputStream;
    if (std::holds_alternative<std::nullptr_t>(value))
    {
        outputStream << "NULL";
    }
    else if (const auto* integer = std::get_if<std::int64_t>(&value))
    {
        outputStream << *integer;
    }
    else if (const auto* real = std::get_if<double>(&value))
    {
        outputStream << *real;
    }
    else if (const auto* text = std::get_if<std::string>(&value))
    {
        outputStream << *text;
    }
    else
    {
        outputStream << "x'" << std::hex << std::setfill('0');
        for (std::uint8_t byte : std::get<Blob>(value))
        {
            outputStream << std::setw(2) << static_cast<int>(byte);
        }
        outputStream << "'";
    }
    return outputStream.str();
}
