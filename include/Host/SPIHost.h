// Copyright (c) 2025 Christopher Broschard
// All rights reserved.
//
// This source code is provided for personal, educational, and
// non-commercial use only. Redistribution, modification, or use
// of this code in whole or in part for any other purpose is
// strictly prohibited without the prior written consent of the author.
#ifndef SPIHOST_H
#define SPIHOST_H

#include <cstdint>
#include <vector>
#include "Common/RegisterMap.h"
#include "Logging.h"

// Forward declarations
class SPIPeripheral;

// Bus master that bit-bangs transactions onto the receiver pins and advances
// the receiver's timebase while doing so. All timing is in receiver ticks.
class SPIHost
{
    public:
        struct Timing
        {
            uint32_t halfPeriodTicks = 50;  // SCLK low/high time, 100 kHz on a 10 MHz timebase
            uint32_t idleTicks = 600;       // gap after nCS is released
            uint32_t resetTicks = 5;        // rst_n low time, then the same again high
        };

        explicit SPIHost(SPIPeripheral& target);
        SPIHost(SPIPeripheral& target, const Timing& timing);
        virtual ~SPIHost();

        // Pointers
        inline void attachLogInstance(Logging* logger) { this->logger = logger; }
        inline void setLog(bool enable) { setLogging = enable; }

        // Throws std::invalid_argument if any period is zero
        void setTiming(const Timing& timing);
        inline const Timing& getTiming() const { return timing; }

        // One full transaction, write enable set
        void writeRegister(RegisterId id, uint8_t value);

        // One full transaction. target must be 0..127.
        void sendFrame(bool writeEnable, unsigned target, uint8_t payload);
        void sendWord(uint16_t word);

        // Only the first count bits of word, MSB first. With releaseSelect false
        // nCS stays low and the next transaction starts with a new falling edge.
        void sendBits(uint16_t word, unsigned count, bool releaseSelect);

        // Several frames inside a single nCS low window
        void sendBackToBack(const std::vector<uint16_t>& words);

        void pulseReset();
        void idle(uint64_t ticks);

        inline uint64_t getTransactionCount() const { return transactions; }

    protected:

    private:

        // Non-owning
        SPIPeripheral& target;
        Logging* logger;

        Timing timing;
        uint64_t transactions;
        bool setLogging;

        void beginTransaction();
        void shiftBit(bool bit);
        void endTransaction();
};

#endif // SPIHOST_H
