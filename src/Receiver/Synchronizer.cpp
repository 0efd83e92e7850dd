// Copyright (c) 2025 Christopher Broschard
// All rights reserved.
//
// This source code is provided for personal, educational, and
// non-commercial use only. Redistribution, modification, or use
// of this code in whole or in part for any other purpose is
// strictly prohibited without the prior written consent of the author.
#include "Receiver/Synchronizer.h"

#include <initializer_list>

Synchronizer::Synchronizer() :
    logger(nullptr),
    setLogging(false)
{
    reset();
}

Synchronizer::~Synchronizer() = default;

void Synchronizer::reset()
{
    select.resetTo(true);
    clock.resetTo(false);
    data.resetTo(false);

    lastOutput = SyncedSignal{};
}

SyncedSignal Synchronizer::tick(const RawSignal& raw)
{
    SyncedSignal out;
    out.select = select.shift(raw.select);
    out.clock = clock.shift(raw.clock);
    out.data = data.shift(raw.data);

    if (setLogging && logger && (out.select != lastOutput.select || out.clock != lastOutput.clock || out.data != lastOutput.data))
    {
        logger->WriteLog(LogSet::Synchronizer, Logging::LogLevel::DEBUG,
            std::string("synced lines now nCS=") + (out.select ? "1" : "0") +
            " SCLK=" + (out.clock ? "1" : "0") +
            " COPI=" + (out.data ? "1" : "0"));
    }

    lastOutput = out;
    return out;
}

SyncedSignal Synchronizer::getOutput() const
{
    return lastOutput;
}

void Synchronizer::saveState(StateWriter& wrtr) const
{
    wrtr.beginChunk("SYNC");
    wrtr.writeU32(2); // version

    for (const SyncChain* chain : { &select, &clock, &data })
    {
        wrtr.writeBool(chain->capture);
        wrtr.writeBool(chain->settle);
    }

    wrtr.writeBool(lastOutput.select);
    wrtr.writeBool(lastOutput.clock);
    wrtr.writeBool(lastOutput.data);

    wrtr.endChunk();
}

bool Synchronizer::loadState(const StateReader::Chunk& chunk, StateReader& rdr)
{
    if (!chunk.is("SYNC"))
        return false;

    rdr.enterChunkPayload(chunk);

    uint32_t ver = 0;
    if (!rdr.readU32(ver) || ver != 2) { rdr.exitChunkPayload(chunk); return false; }

    SyncChain loaded[3];
    for (SyncChain& chain : loaded)
    {
        if (!rdr.readBool(chain.capture) || !rdr.readBool(chain.settle))
        {
            rdr.exitChunkPayload(chunk);
            return false;
        }
    }

    SyncedSignal output;
    if (!rdr.readBool(output.select) || !rdr.readBool(output.clock) || !rdr.readBool(output.data))
    {
        rdr.exitChunkPayload(chunk);
        return false;
    }

    select = loaded[0];
    clock = loaded[1];
    data = loaded[2];
    lastOutput = output;

    rdr.exitChunkPayload(chunk);
    return true;
}
