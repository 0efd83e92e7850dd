// Copyright (c) 2025 Christopher Broschard
// All rights reserved.
//
// This source code is provided for personal, educational, and
// non-commercial use only. Redistribution, modification, or use
// of this code in whole or in part for any other purpose is
// strictly prohibited without the prior written consent of the author.
#ifndef REGISTERBANK_H
#define REGISTERBANK_H

#include <array>
#include <atomic>
#include <cstdint>
#include <string>
#include "Common/RegisterMap.h"
#include "Logging.h"
#include "StateReader.h"
#include "StateWriter.h"

// Plain copy of all five registers at one instant
struct RegisterValues
{
    uint8_t outputEnableLow = 0;
    uint8_t outputEnableHigh = 0;
    uint8_t pwmEnableLow = 0;
    uint8_t pwmEnableHigh = 0;
    uint8_t dutyCycle = 0;

    bool operator==(const RegisterValues& other) const = default;
};

// Five persistent configuration registers read by the duty cycle generator.
// Each cell is a single atomic byte: a reader on another thread sees either
// the old or the new value of a write, never a mix.
class RegisterBank
{
    public:
        RegisterBank();
        virtual ~RegisterBank();

        RegisterBank(const RegisterBank&) = delete;
        RegisterBank& operator=(const RegisterBank&) = delete;

        // Pointers
        inline void attachLogInstance(Logging* logger) { this->logger = logger; }
        inline void setLog(bool enable) { setLogging = enable; }

        // State management
        void saveState(StateWriter& wrtr) const;
        bool loadState(const StateReader::Chunk& chunk, StateReader& rdr);

        // Everything back to zero
        void reset();

        uint8_t read(RegisterId id) const;
        void write(RegisterId id, uint8_t value);

        // Consumer side getters
        inline uint8_t getOutputEnableLow() const { return read(RegisterId::OutputEnableLow); }
        inline uint8_t getOutputEnableHigh() const { return read(RegisterId::OutputEnableHigh); }
        inline uint8_t getPwmEnableLow() const { return read(RegisterId::PwmEnableLow); }
        inline uint8_t getPwmEnableHigh() const { return read(RegisterId::PwmEnableHigh); }
        inline uint8_t getDutyCycle() const { return read(RegisterId::DutyCycle); }

        RegisterValues values() const;

        // Number of writes since reset, including writes of an unchanged value
        inline uint64_t getWriteCount() const { return writeCount; }

        // Debug dump
        std::string dumpRegisters() const;

    protected:

    private:

        // Non-owning pointers
        Logging* logger;

        std::array<std::atomic<uint8_t>, REGISTER_COUNT> cells;
        uint64_t writeCount;

        bool setLogging;
};

#endif // REGISTERBANK_H
