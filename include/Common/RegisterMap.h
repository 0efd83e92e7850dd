// Copyright (c) 2025 Christopher Broschard
// All rights reserved.
//
// This source code is provided for personal, educational, and
// non-commercial use only. Redistribution, modification, or use
// of this code in whole or in part for any other purpose is
// strictly prohibited without the prior written consent of the author.
#ifndef REGISTERMAP_H_INCLUDED
#define REGISTERMAP_H_INCLUDED

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Configuration registers, indexed by the frame target field
enum class RegisterId : uint8_t
{
    OutputEnableLow = 0,
    OutputEnableHigh = 1,
    PwmEnableLow = 2,
    PwmEnableHigh = 3,
    DutyCycle = 4
};

static constexpr size_t REGISTER_COUNT = 5;

// Frame layout
static constexpr uint16_t FRAME_BITS = 16;
static constexpr uint16_t FRAME_WRITE_FLAG = 0x8000;
static constexpr uint8_t FRAME_TARGET_SHIFT = 8;
static constexpr uint8_t FRAME_TARGET_MASK = 0x7F;
static constexpr uint8_t FRAME_PAYLOAD_MASK = 0xFF;

inline constexpr std::array<std::string_view, REGISTER_COUNT> RegisterNames =
{
    "outputEnableLow",
    "outputEnableHigh",
    "pwmEnableLow",
    "pwmEnableHigh",
    "dutyCycle"
};

// Map a 7 bit target index to a register. 5..127 are reserved.
inline constexpr std::optional<RegisterId> targetToRegister(uint8_t target)
{
    if (target < REGISTER_COUNT) return static_cast<RegisterId>(target);
    return std::nullopt;
}

inline constexpr std::string_view registerName(RegisterId id)
{
    return RegisterNames[static_cast<size_t>(id)];
}

#endif // REGISTERMAP_H_INCLUDED
