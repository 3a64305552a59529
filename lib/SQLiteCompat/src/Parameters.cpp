// file Parameters.cpp

#include "SQLiteCompat/Parameters.hpp"

#include <stdexcept>

namespace
{
NamedValues PrefixNamedArguments(const NamedArguments& named, char prefix)
{
    NamedValues prefixed;
    for (const auto& entry : named)
    {
        const std::string& key = entry.first;
        if ((false == key.empty()) && IsParameterPrefix(key.front()))
        {
            prefixed[key] = entry.second;
        }
        else
        {
            prefixed[std::string(1, prefix) + key] = entry.second;
        }
    }
    return prefixed;
}

Value ToPositionalValue(const Argument& argument)
{
    if (const auto* value = std::get_if<Value>(&argument))
    {
        return *value;
    }
    throw std::invalid_argument("Only scalar values can be combined with other positional parameters");
}
}

BindParameters NormalizeParameters(const ArgumentList& arguments, char prefix)
{
    if (arguments.empty())
    {
        return NoParameters{};
    }

    if (1 == arguments.size())
    {
        const Argument& single = arguments.front();
        if (const auto* named = std::get_if<NamedArguments>(&single))
        {
            return PrefixNamedArguments(*named, prefix);
        }
        if (const auto* values = std::get_if<ValueList>(&single))
        {
            return *values;
        }
        return std::get<Value>(single);
    }

    std::vector<Value> positional;
    positional.reserve(arguments.size());
    for (const auto& argument : arguments)
    {
        positional.push_back(ToPositionalValue(argument));
    }
    return positional;
}
