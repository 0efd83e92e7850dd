// Copyright (c) 2025 Christopher Broschard
// All rights reserved.
//
// This source code is provided for personal, educational, and
// non-commercial use only. Redistribution, modification, or use
// of this code in whole or in part for any other purpose is
// strictly prohibited without the prior written consent of the author.
#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>
#include "Host/ScriptUtils.h"

uint32_t parseNumber(const std::string& arg, uint32_t maxValue)
{
    std::string s = trimCopy(arg);
    s.erase(std::remove(s.begin(), s.end(), '_'), s.end());

    if (s.empty())
    {
        throw std::runtime_error("Invalid number format: empty");
    }

    int base = 10;
    if (s[0] == '$')
    {
        base = 16;
        s = s.substr(1);
    }
    else if (s.rfind("0x", 0) == 0 || s.rfind("0X", 0) == 0)
    {
        base = 16;
        s = s.substr(2);
    }
    else if (s[0] == '%')
    {
        base = 2;
        s = s.substr(1);
    }

    if (s.empty() || !std::isxdigit(static_cast<unsigned char>(s[0])))
        throw std::runtime_error("Invalid number format: " + arg);

    size_t used = 0;
    unsigned long value = 0;
    try
    {
        value = std::stoul(s, &used, base);
    }
    catch (const std::logic_error&)
    {
        throw std::runtime_error("Invalid number format: " + arg);
    }

    if (used != s.size())
        throw std::runtime_error("Invalid number format: " + arg);
    if (value > maxValue)
        throw std::runtime_error("Value out of range: " + arg);

    return static_cast<uint32_t>(value);
}

std::optional<RegisterId> parseRegister(const std::string& arg)
{
    std::string lower = trimCopy(arg);
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    for (size_t i = 0; i < REGISTER_COUNT; ++i)
    {
        std::string name(RegisterNames[i]);
        std::transform(name.begin(), name.end(), name.begin(), ::tolower);
        if (lower == name)
            return static_cast<RegisterId>(i);
    }

    if (lower.size() == 1 && lower[0] >= '0' && lower[0] < static_cast<char>('0' + REGISTER_COUNT))
        return static_cast<RegisterId>(lower[0] - '0');

    return std::nullopt;
}

std::string trimCopy(std::string s)
{
    auto notSpace = [](int ch){ return !std::isspace(ch); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), notSpace));
    s.erase(std::find_if(s.rbegin(), s.rend(), notSpace).base(), s.end());
    return s;
}

std::vector<std::string> splitTokens(const std::string& line)
{
    std::vector<std::string> tokens;
    std::istringstream ss(line);
    std::string item;
    while (ss >> item)
        tokens.push_back(item);
    return tokens;
}

std::vector<std::string> splitCSV(const std::string& input)
{
    std::vector<std::string> tokens;
    std::istringstream ss(input);
    std::string item;
    while (std::getline(ss, item, ','))
    {
        item = trimCopy(item);
        if (!item.empty())
            tokens.push_back(item);
    }
    return tokens;
}
