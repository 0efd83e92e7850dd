// Copyright (c) 2025 Christopher Broschard
// All rights reserved.
//
// This source code is provided for personal, educational, and
// non-commercial use only. Redistribution, modification, or use
// of this code in whole or in part for any other purpose is
// strictly prohibited without the prior written consent of the author.
#include "Receiver/EdgeDetector.h"

EdgeDetector::EdgeDetector() :
    logger(nullptr),
    setLogging(false)
{
    reset();
}

EdgeDetector::~EdgeDetector() = default;

void EdgeDetector::reset()
{
    // Idle levels, so the first tick after reset sees no edge
    prevSelect = true;
    prevClock = false;
}

EdgeEvents EdgeDetector::tick(const SyncedSignal& synced)
{
    EdgeEvents events;
    events.selectFalling = (prevSelect && !synced.select);
    events.clockRising = (!prevClock && synced.clock);

    prevSelect = synced.select;
    prevClock = synced.clock;

    if (setLogging && logger && events.selectFalling)
    {
        logger->WriteLog(LogSet::EdgeDetector, Logging::LogLevel::DEBUG, "nCS falling edge");
    }

    return events;
}

void EdgeDetector::saveState(StateWriter& wrtr) const
{
    wrtr.beginChunk("EDGE");
    wrtr.writeU32(1); // version
    wrtr.writeBool(prevSelect);
    wrtr.writeBool(prevClock);
    wrtr.endChunk();
}

bool EdgeDetector::loadState(const StateReader::Chunk& chunk, StateReader& rdr)
{
    if (!chunk.is("EDGE"))
        return false;

    rdr.enterChunkPayload(chunk);

    uint32_t ver = 0;
    bool sel = true;
    bool clk = false;
    const bool ok = rdr.readU32(ver) && ver == 1 && rdr.readBool(sel) && rdr.readBool(clk);

    rdr.exitChunkPayload(chunk);
    if (!ok)
        return false;

    prevSelect = sel;
    prevClock = clk;
    return true;
}
