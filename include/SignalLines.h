// Copyright (c) 2025 Christopher Broschard
// All rights reserved.
//
// This source code is provided for personal, educational, and
// non-commercial use only. Redistribution, modification, or use
// of this code in whole or in part for any other purpose is
// strictly prohibited without the prior written consent of the author.
#ifndef SIGNALLINES_H
#define SIGNALLINES_H

#include <cstdint>
#include "Common/SignalTypes.h"

// Input pins of the receiver. The host side drives them at any time, the
// receiver samples them once per tick.
class SignalLines
{
    public:
        SignalLines();
        virtual ~SignalLines();

        // Line state management called by the host
        void setSelectLine(bool state); // nCS, low = asserted
        void setClockLine(bool state);  // SCLK
        void setDataLine(bool state);   // COPI
        void setResetLine(bool state);  // rst_n, low = in reset

        // Drive all three bus lines in one go
        void drive(bool select, bool clock, bool data);

        // Return to idle: nCS high, SCLK low, COPI low
        void release();

        // Bus state getters
        inline bool getSelectLine() const { return lines.select; }
        inline bool getClockLine() const { return lines.clock; }
        inline bool getDataLine() const { return lines.data; }
        inline bool getResetLine() const { return resetN; }
        inline bool inReset() const { return !resetN; }

        // Sampled by the synchronizer every tick
        inline RawSignal sample() const { return lines; }

        // Diagnostics
        inline uint64_t getSelectTransitions() const { return selectTransitions; }
        inline uint64_t getClockTransitions() const { return clockTransitions; }
        inline uint64_t getDataTransitions() const { return dataTransitions; }

    protected:

    private:

        RawSignal lines;
        bool resetN;

        uint64_t selectTransitions;
        uint64_t clockTransitions;
        uint64_t dataTransitions;
};

#endif // SIGNALLINES_H
