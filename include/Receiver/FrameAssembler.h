// Copyright (c) 2025 Christopher Broschard
// All rights reserved.
//
// This source code is provided for personal, educational, and
// non-commercial use only. Redistribution, modification, or use
// of this code in whole or in part for any other purpose is
// strictly prohibited without the prior written consent of the author.
#ifndef FRAMEASSEMBLER_H
#define FRAMEASSEMBLER_H

#include <cstdint>
#include <optional>
#include "Common/SignalTypes.h"
#include "Logging.h"
#include "Receiver/Frame.h"
#include "StateReader.h"
#include "StateWriter.h"

class FrameAssembler
{
    public:
        FrameAssembler();
        virtual ~FrameAssembler();

        // Pointers
        inline void attachLogInstance(Logging* logger) { this->logger = logger; }
        inline void setLog(bool enable) { setLogging = enable; }

        // State management
        void saveState(StateWriter& wrtr) const;
        bool loadState(const StateReader::Chunk& chunk, StateReader& rdr);

        void reset();

        // Advance one tick. Returns the frame on the tick the 16th bit arrives.
        std::optional<CompletedFrame> tick(const EdgeEvents& events, const SyncedSignal& synced);

        // Getters
        inline uint8_t getBitCount() const { return bitCount; }
        inline uint16_t getShiftRegister() const { return shiftReg; }
        inline bool isArmed() const { return armed; }

        // Bits thrown away by a falling edge on the last tick, 0 if none
        inline uint8_t getAbortedBits() const { return abortedBits; }

    protected:

    private:

        // Non-owning pointers
        Logging* logger;

        // Serial shift register state
        uint16_t shiftReg; // last 16 bits shifted in, newest at bit 0
        uint8_t bitCount; // bits collected toward the current frame

        // Set by the first nCS falling edge after reset
        bool armed;

        uint8_t abortedBits;

        bool setLogging;
};

#endif // FRAMEASSEMBLER_H
