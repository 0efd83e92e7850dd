// Copyright (c) 2025 Christopher Broschard
// All rights reserved.
//
// This source code is provided for personal, educational, and
// non-commercial use only. Redistribution, modification, or use
// of this code in whole or in part for any other purpose is
// strictly prohibited without the prior written consent of the author.
#include "Common/HexFormat.h"
#include "Receiver/RegisterBank.h"

RegisterBank::RegisterBank() :
    logger(nullptr),
    writeCount(0),
    setLogging(false)
{
    reset();
}

RegisterBank::~RegisterBank() = default;

void RegisterBank::reset()
{
    for (auto& cell : cells)
        cell.store(0, std::memory_order_release);

    writeCount = 0;
}

uint8_t RegisterBank::read(RegisterId id) const
{
    return cells[static_cast<size_t>(id)].load(std::memory_order_acquire);
}

void RegisterBank::write(RegisterId id, uint8_t value)
{
    auto& cell = cells[static_cast<size_t>(id)];
    const uint8_t old = cell.exchange(value, std::memory_order_acq_rel);
    ++writeCount;

    if (setLogging && logger)
    {
        logger->WriteLog(LogSet::RegisterBank, Logging::LogLevel::INFO,
            std::string(registerName(id)) + " $" + toHex(old, 2) + " -> $" + toHex(value, 2));
    }
}

RegisterValues RegisterBank::values() const
{
    RegisterValues v;
    v.outputEnableLow = getOutputEnableLow();
    v.outputEnableHigh = getOutputEnableHigh();
    v.pwmEnableLow = getPwmEnableLow();
    v.pwmEnableHigh = getPwmEnableHigh();
    v.dutyCycle = getDutyCycle();
    return v;
}

std::string RegisterBank::dumpRegisters() const
{
    std::ostringstream out;

    out << "IDX  NAME              HEX  BINARY\n";
    for (size_t i = 0; i < REGISTER_COUNT; ++i)
    {
        const uint8_t value = read(static_cast<RegisterId>(i));
        out << " " << i << "   "
            << std::left << std::setw(16) << std::setfill(' ') << RegisterNames[i] << std::right
            << "  $" << toHex(value, 2)
            << "  %" << std::bitset<8>(value) << "\n";
    }

    return out.str();
}

void RegisterBank::saveState(StateWriter& wrtr) const
{
    wrtr.beginChunk("REGS");
    wrtr.writeU32(1); // version

    wrtr.writeU8(static_cast<uint8_t>(REGISTER_COUNT));
    for (const auto& cell : cells)
        wrtr.writeU8(cell.load(std::memory_order_acquire));
    wrtr.writeU64(writeCount);

    wrtr.endChunk();
}

bool RegisterBank::loadState(const StateReader::Chunk& chunk, StateReader& rdr)
{
    if (!chunk.is("REGS"))
        return false;

    rdr.enterChunkPayload(chunk);

    uint32_t ver = 0;
    uint8_t count = 0;
    if (!rdr.readU32(ver) || ver != 1 || !rdr.readU8(count) || count != REGISTER_COUNT)
    {
        rdr.exitChunkPayload(chunk);
        return false;
    }

    std::array<uint8_t, REGISTER_COUNT> loaded{};
    uint64_t writes = 0;
    for (auto& value : loaded)
    {
        if (!rdr.readU8(value))
        {
            rdr.exitChunkPayload(chunk);
            return false;
        }
    }
    if (!rdr.readU64(writes))
    {
        rdr.exitChunkPayload(chunk);
        return false;
    }

    for (size_t i = 0; i < REGISTER_COUNT; ++i)
        cells[i].store(loaded[i], std::memory_order_release);
    writeCount = writes;

    rdr.exitChunkPayload(chunk);
    return true;
}
