// Copyright (c) 2025 Christopher Broschard
// All rights reserved.
//
// This source code is provided for personal, educational, and
// non-commercial use only. Redistribution, modification, or use
// of this code in whole or in part for any other purpose is
// strictly prohibited without the prior written consent of the author.
#ifndef HEXFORMAT_H_INCLUDED
#define HEXFORMAT_H_INCLUDED

#include <bitset>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>

// Hex helpers
inline std::string toHex(uint16_t value, int width = 4)
{
    std::stringstream ss;
    ss << std::uppercase << std::hex << std::setfill('0') << std::setw(width) << static_cast<int>(value);
    return ss.str();
}

inline std::string toHex(uint8_t value, int width = 2)
{
    std::stringstream ss;
    ss << std::uppercase << std::hex << std::setfill('0') << std::setw(width) << static_cast<int>(value);
    return ss.str();
}

// Frame words are shown as W_TTTTTTT_PPPPPPPP
inline std::string toFrameBits(uint16_t word)
{
    const std::string bits = std::bitset<16>(word).to_string();
    return bits.substr(0, 1) + "_" + bits.substr(1, 7) + "_" + bits.substr(8, 8);
}

#endif // HEXFORMAT_H_INCLUDED
