// Copyright (c) 2025 Christopher Broschard
// All rights reserved.
//
// This source code is provided for personal, educational, and
// non-commercial use only. Redistribution, modification, or use
// of this code in whole or in part for any other purpose is
// strictly prohibited without the prior written consent of the author.
#include "Common/HexFormat.h"
#include "Receiver/FrameAssembler.h"

FrameAssembler::FrameAssembler() :
    logger(nullptr),
    setLogging(false)
{
    reset();
}

FrameAssembler::~FrameAssembler() = default;

void FrameAssembler::reset()
{
    shiftReg = 0;
    bitCount = 0;
    armed = false;
    abortedBits = 0;
}

std::optional<CompletedFrame> FrameAssembler::tick(const EdgeEvents& events, const SyncedSignal& synced)
{
    abortedBits = 0;

    // Every falling edge starts a fresh frame, even part way through one
    if (events.selectFalling)
    {
        if (bitCount != 0)
        {
            abortedBits = bitCount;
            if (setLogging && logger)
            {
                logger->WriteLog(LogSet::FrameAssembler, Logging::LogLevel::INFO,
                    "Frame aborted after " + std::to_string(bitCount) + " bits");
            }
        }

        shiftReg = 0;
        bitCount = 0;
        armed = true;
        return std::nullopt;
    }

    if (!armed || !synced.selectAsserted() || !events.clockRising)
        return std::nullopt;

    shiftReg = static_cast<uint16_t>((shiftReg << 1) | (synced.data ? 1 : 0));

    if (bitCount < FRAME_BITS - 1)
    {
        ++bitCount;
        return std::nullopt;
    }

    // 16th bit: hand the word on and get ready for a back to back frame
    bitCount = 0;
    const CompletedFrame frame{ shiftReg };

    if (setLogging && logger)
    {
        logger->WriteLog(LogSet::FrameAssembler, Logging::LogLevel::INFO,
            "Frame complete $" + toHex(frame.word, 4) + " (" + toFrameBits(frame.word) + ")");
    }

    return frame;
}

void FrameAssembler::saveState(StateWriter& wrtr) const
{
    wrtr.beginChunk("FASM");
    wrtr.writeU32(1); // version
    wrtr.writeU16(shiftReg);
    wrtr.writeU8(bitCount);
    wrtr.writeBool(armed);
    wrtr.endChunk();
}

bool FrameAssembler::loadState(const StateReader::Chunk& chunk, StateReader& rdr)
{
    if (!chunk.is("FASM"))
        return false;

    rdr.enterChunkPayload(chunk);

    uint32_t ver = 0;
    uint16_t shift = 0;
    uint8_t count = 0;
    bool arm = false;
    const bool ok = rdr.readU32(ver) && ver == 1 &&
                    rdr.readU16(shift) &&
                    rdr.readU8(count) &&
                    rdr.readBool(arm);

    rdr.exitChunkPayload(chunk);

    if (!ok || count >= FRAME_BITS)
        return false;

    shiftReg = shift;
    bitCount = count;
    armed = arm;
    abortedBits = 0;
    return true;
}
