// Copyright (c) 2025 Christopher Broschard
// All rights reserved.
//
// This source code is provided for personal, educational, and
// non-commercial use only. Redistribution, modification, or use
// of this code in whole or in part for any other purpose is
// strictly prohibited without the prior written consent of the author.
#include <stdexcept>
#include "Common/HexFormat.h"
#include "Host/SPIHost.h"
#include "Receiver/Frame.h"
#include "SPIPeripheral.h"

SPIHost::SPIHost(SPIPeripheral& target) :
    SPIHost(target, Timing{})
{

}

SPIHost::SPIHost(SPIPeripheral& target, const Timing& timing) :
    target(target),
    logger(nullptr),
    transactions(0),
    setLogging(false)
{
    setTiming(timing);
}

SPIHost::~SPIHost() = default;

void SPIHost::setTiming(const Timing& timing)
{
    if (timing.halfPeriodTicks == 0)
        throw std::invalid_argument("SCLK half period must be at least one tick");
    if (timing.idleTicks == 0)
        throw std::invalid_argument("nCS must stay high for at least one tick between transactions");
    if (timing.resetTicks == 0)
        throw std::invalid_argument("Reset pulse must be at least one tick");

    this->timing = timing;
}

void SPIHost::writeRegister(RegisterId id, uint8_t value)
{
    sendFrame(true, static_cast<unsigned>(id), value);
}

void SPIHost::sendFrame(bool writeEnable, unsigned targetIndex, uint8_t payload)
{
    if (targetIndex > FRAME_TARGET_MASK)
        throw std::invalid_argument("Target must be 7-bit (0-127), got " + std::to_string(targetIndex));

    sendWord(CompletedFrame::make(writeEnable, static_cast<uint8_t>(targetIndex), payload).word);
}

void SPIHost::sendWord(uint16_t word)
{
    sendBits(word, FRAME_BITS, true);
}

void SPIHost::sendBits(uint16_t word, unsigned count, bool releaseSelect)
{
    if (count == 0 || count > FRAME_BITS)
        throw std::invalid_argument("Bit count must be 1-16, got " + std::to_string(count));

    if (setLogging && logger)
    {
        logger->WriteLog(LogSet::Host, Logging::LogLevel::DEBUG,
            "Sending " + std::to_string(count) + " bits of $" + toHex(word, 4) +
            (releaseSelect ? "" : " (nCS held)"));
    }

    beginTransaction();

    for (unsigned i = 0; i < count; ++i)
        shiftBit(((word >> (FRAME_BITS - 1 - i)) & 0x1) != 0);

    if (releaseSelect)
        endTransaction();
}

void SPIHost::sendBackToBack(const std::vector<uint16_t>& words)
{
    if (words.empty())
        return;

    if (setLogging && logger)
    {
        logger->WriteLog(LogSet::Host, Logging::LogLevel::DEBUG,
            "Sending " + std::to_string(words.size()) + " frames in one nCS window");
    }

    beginTransaction();

    for (uint16_t word : words)
    {
        for (unsigned i = 0; i < FRAME_BITS; ++i)
            shiftBit(((word >> (FRAME_BITS - 1 - i)) & 0x1) != 0);
    }

    endTransaction();
}

void SPIHost::pulseReset()
{
    if (setLogging && logger)
        logger->WriteLog(LogSet::Host, Logging::LogLevel::DEBUG, "Pulsing rst_n");

    SignalLines& pins = target.lines();
    pins.release();
    pins.setResetLine(false);
    target.run(timing.resetTicks);
    pins.setResetLine(true);
    target.run(timing.resetTicks);
}

void SPIHost::idle(uint64_t ticks)
{
    target.run(ticks);
}

void SPIHost::beginTransaction()
{
    SignalLines& pins = target.lines();

    // nCS still low from a partial frame, so give the receiver a rising edge first
    if (!pins.getSelectLine())
    {
        pins.drive(true, false, false);
        target.run(timing.halfPeriodTicks);
    }

    // Start transaction - pull CS low
    pins.drive(false, false, false);
    target.run(1);

    ++transactions;
}

void SPIHost::shiftBit(bool bit)
{
    SignalLines& pins = target.lines();

    // SCLK low, set COPI
    pins.setClockLine(false);
    pins.setDataLine(bit);
    target.run(timing.halfPeriodTicks);

    // SCLK high, keep COPI
    pins.setClockLine(true);
    target.run(timing.halfPeriodTicks);
}

void SPIHost::endTransaction()
{
    // End transaction - return CS high
    target.lines().release();
    target.run(timing.idleTicks);
}
