// Copyright (c) 2025 Christopher Broschard
// All rights reserved.
//
// This source code is provided for personal, educational, and
// non-commercial use only. Redistribution, modification, or use
// of this code in whole or in part for any other purpose is
// strictly prohibited without the prior written consent of the author.
#ifndef SCRIPTUTILS_H_INCLUDED
#define SCRIPTUTILS_H_INCLUDED

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "Common/RegisterMap.h"

// Accept $hex, 0xhex, %binary or decimal. Underscores are ignored so frames
// can be written as %1_0000010_11110000. Throws std::runtime_error.
uint32_t parseNumber(const std::string& arg, uint32_t maxValue);

// Register by name (any case) or by index 0..4
std::optional<RegisterId> parseRegister(const std::string& arg);

// Helpers
std::string trimCopy(std::string s);
std::vector<std::string> splitTokens(const std::string& line);
std::vector<std::string> splitCSV(const std::string& input);

#endif // SCRIPTUTILS_H_INCLUDED
