// Copyright (c) 2025 Christopher Broschard
// All rights reserved.
//
// This source code is provided for personal, educational, and
// non-commercial use only. Redistribution, modification, or use
// of this code in whole or in part for any other purpose is
// strictly prohibited without the prior written consent of the author.
#include "Common/HexFormat.h"
#include "SPIPeripheral.h"

SPIPeripheral::SPIPeripheral() :
    lineBus(std::make_unique<SignalLines>()),
    sync(std::make_unique<Synchronizer>()),
    edges(std::make_unique<EdgeDetector>()),
    assembler(std::make_unique<FrameAssembler>()),
    dispatcher(std::make_unique<RegisterDispatcher>()),
    bank(std::make_unique<RegisterBank>()),
    resetCtl(std::make_unique<ResetController>(*sync, *edges, *assembler, *bank)),
    logger(nullptr),
    traceMgr(nullptr),
    tickCount(0)
{

}

SPIPeripheral::~SPIPeripheral() noexcept
{
    if (logger) logger->flush();
}

void SPIPeripheral::attachLogInstance(Logging* logger)
{
    this->logger = logger;

    sync->attachLogInstance(logger);
    edges->attachLogInstance(logger);
    assembler->attachLogInstance(logger);
    dispatcher->attachLogInstance(logger);
    bank->attachLogInstance(logger);
    resetCtl->attachLogInstance(logger);
}

void SPIPeripheral::setLogging(LogSet type, bool enable)
{
    switch (type)
    {
        case LogSet::Synchronizer: sync->setLog(enable); break;
        case LogSet::EdgeDetector: edges->setLog(enable); break;
        case LogSet::FrameAssembler: assembler->setLog(enable); break;
        case LogSet::Dispatcher: dispatcher->setLog(enable); break;
        case LogSet::RegisterBank: bank->setLog(enable); break;
        case LogSet::Host: break; // owned by SPIHost
    }
}

void SPIPeripheral::powerOnReset()
{
    lineBus->release();
    lineBus->setResetLine(true);
    resetCtl->powerOnReset();
    tickCount = 0;
    stats = Statistics{};
}

void SPIPeripheral::run(uint64_t ticks)
{
    for (uint64_t i = 0; i < ticks; ++i)
        tick();
}

void SPIPeripheral::tick()
{
    const TraceManager::Stamp stamp{ tickCount++ };

    if (lineBus->inReset())
    {
        if (!resetCtl->isHeld() && traceMgr)
            traceMgr->recordReset(true, stamp);

        resetCtl->holdReset();
        return;
    }

    if (resetCtl->isHeld())
    {
        resetCtl->releaseReset();
        if (traceMgr) traceMgr->recordReset(false, stamp);
    }

    const SyncedSignal synced = sync->tick(lineBus->sample());
    const EdgeEvents events = edges->tick(synced);

    if (traceMgr) traceMgr->recordEdges(events, synced, stamp);

    const auto frame = assembler->tick(events, synced);

    if (assembler->getAbortedBits() != 0)
    {
        ++stats.framesAborted;
        if (traceMgr) traceMgr->recordAbort(assembler->getAbortedBits(), stamp);
    }

    if (frame)
        handleFrame(*frame, stamp);
}

void SPIPeripheral::handleFrame(const CompletedFrame& frame, TraceManager::Stamp stamp)
{
    ++stats.framesCompleted;
    if (traceMgr) traceMgr->recordFrame(frame, stamp);

    const auto target = targetToRegister(frame.target());
    const uint8_t before = target ? bank->read(*target) : 0;

    const RegisterDispatcher::Outcome outcome = dispatcher->dispatch(frame, *bank);

    switch (outcome)
    {
        case RegisterDispatcher::Outcome::Written: ++stats.framesWritten; break;
        case RegisterDispatcher::Outcome::WriteDisabled: ++stats.framesWriteDisabled; break;
        case RegisterDispatcher::Outcome::UnknownTarget: ++stats.framesUnknownTarget; break;
    }

    if (traceMgr)
    {
        traceMgr->recordDispatch(frame, outcome, stamp);
        if (outcome == RegisterDispatcher::Outcome::Written)
            traceMgr->recordRegisterWrite(*target, before, bank->read(*target), stamp);
    }
}

std::string SPIPeripheral::dumpState() const
{
    std::ostringstream out;

    const SyncedSignal synced = sync->getOutput();
    out << "Tick " << tickCount << (isInReset() ? " (in reset)" : "") << "\n";
    out << "Pins     nCS=" << lineBus->getSelectLine()
        << " SCLK=" << lineBus->getClockLine()
        << " COPI=" << lineBus->getDataLine()
        << " rst_n=" << lineBus->getResetLine() << "\n";
    out << "Toggles  nCS=" << lineBus->getSelectTransitions()
        << " SCLK=" << lineBus->getClockTransitions()
        << " COPI=" << lineBus->getDataTransitions() << "\n";
    out << "Synced   nCS=" << synced.select
        << " SCLK=" << synced.clock
        << " COPI=" << synced.data << "\n";
    out << "Frame    bits=" << static_cast<int>(assembler->getBitCount())
        << " shift=$" << toHex(assembler->getShiftRegister(), 4)
        << (assembler->isArmed() ? " armed" : " idle") << "\n";
    out << "Frames   completed=" << stats.framesCompleted
        << " written=" << stats.framesWritten
        << " writeDisabled=" << stats.framesWriteDisabled
        << " unknownTarget=" << stats.framesUnknownTarget
        << " aborted=" << stats.framesAborted << "\n";
    out << bank->dumpRegisters();

    return out.str();
}

void SPIPeripheral::saveState(StateWriter& wrtr) const
{
    wrtr.beginFile();

    wrtr.beginChunk("PERI");
    wrtr.writeU32(1); // version
    wrtr.writeU64(tickCount);
    wrtr.writeBool(resetCtl->isHeld());
    wrtr.writeU64(stats.framesCompleted);
    wrtr.writeU64(stats.framesWritten);
    wrtr.writeU64(stats.framesWriteDisabled);
    wrtr.writeU64(stats.framesUnknownTarget);
    wrtr.writeU64(stats.framesAborted);
    wrtr.endChunk();

    sync->saveState(wrtr);
    edges->saveState(wrtr);
    assembler->saveState(wrtr);
    bank->saveState(wrtr);
}

bool SPIPeripheral::loadState(StateReader& rdr)
{
    // Keep a copy so a bad snapshot leaves us where we were
    StateWriter backup(STATE_FILE_VERSION);
    saveState(backup);

    if (applyState(rdr))
        return true;

    StateReader restore;
    if (!restore.loadFromMemory(backup.data()) || !applyState(restore))
    {
        if (logger) logger->WriteLog(Logging::LogLevel::ERROR, "Unable to restore receiver state after failed load");
    }

    if (logger) logger->WriteLog(Logging::LogLevel::WARNING, "State load rejected");
    return false;
}

bool SPIPeripheral::applyState(StateReader& rdr)
{
    if (!rdr.readFileHeader() || rdr.version() != STATE_FILE_VERSION)
        return false;

    bool havePeri = false, haveSync = false, haveEdge = false, haveFasm = false, haveRegs = false;

    StateReader::Chunk chunk{};
    while (!rdr.atEnd())
    {
        if (!rdr.nextChunk(chunk))
            return false;

        if (chunk.is("PERI"))
        {
            rdr.enterChunkPayload(chunk);

            uint32_t ver = 0;
            uint64_t ticks = 0;
            bool held = false;
            Statistics loaded;
            const bool ok = rdr.readU32(ver) && ver == 1 &&
                            rdr.readU64(ticks) &&
                            rdr.readBool(held) &&
                            rdr.readU64(loaded.framesCompleted) &&
                            rdr.readU64(loaded.framesWritten) &&
                            rdr.readU64(loaded.framesWriteDisabled) &&
                            rdr.readU64(loaded.framesUnknownTarget) &&
                            rdr.readU64(loaded.framesAborted);
            rdr.exitChunkPayload(chunk);
            if (!ok) return false;

            tickCount = ticks;
            stats = loaded;
            resetCtl->restoreHeld(held);
            havePeri = true;
        }
        else if (chunk.is("SYNC"))
        {
            if (!(haveSync = sync->loadState(chunk, rdr))) return false;
        }
        else if (chunk.is("EDGE"))
        {
            if (!(haveEdge = edges->loadState(chunk, rdr))) return false;
        }
        else if (chunk.is("FASM"))
        {
            if (!(haveFasm = assembler->loadState(chunk, rdr))) return false;
        }
        else if (chunk.is("REGS"))
        {
            if (!(haveRegs = bank->loadState(chunk, rdr))) return false;
        }
        else
        {
            // Newer snapshot, skip what we don't know
            rdr.exitChunkPayload(chunk);
        }
    }

    return havePeri && haveSync && haveEdge && haveFasm && haveRegs;
}

bool SPIPeripheral::saveStateToFile(const std::string& path) const
{
    StateWriter wrtr(STATE_FILE_VERSION);
    saveState(wrtr);
    return wrtr.writeToFile(path);
}

bool SPIPeripheral::loadStateFromFile(const std::string& path)
{
    StateReader rdr;
    if (!rdr.loadFromFile(path))
        return false;

    return loadState(rdr);
}
