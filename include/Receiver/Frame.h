// Copyright (c) 2025 Christopher Broschard
// All rights reserved.
//
// This source code is provided for personal, educational, and
// non-commercial use only. Redistribution, modification, or use
// of this code in whole or in part for any other purpose is
// strictly prohibited without the prior written consent of the author.
#ifndef FRAME_H_INCLUDED
#define FRAME_H_INCLUDED

#include <cstdint>
#include "Common/RegisterMap.h"

// A fully assembled 16 bit command word.
//   bit 15      write enable
//   bits 14..8  target register index
//   bits 7..0   payload
struct CompletedFrame
{
    uint16_t word = 0;

    inline constexpr bool opcodeTag() const { return (word & FRAME_WRITE_FLAG) != 0; }
    inline constexpr uint8_t target() const { return static_cast<uint8_t>((word >> FRAME_TARGET_SHIFT) & FRAME_TARGET_MASK); }
    inline constexpr uint8_t payload() const { return static_cast<uint8_t>(word & FRAME_PAYLOAD_MASK); }

    static constexpr CompletedFrame make(bool writeEnable, uint8_t target, uint8_t payload)
    {
        return CompletedFrame{ static_cast<uint16_t>((writeEnable ? FRAME_WRITE_FLAG : 0) |
                                                     ((target & FRAME_TARGET_MASK) << FRAME_TARGET_SHIFT) |
                                                     payload) };
    }
};

#endif // FRAME_H_INCLUDED
