// Copyright (c) 2025 Christopher Broschard
// All rights reserved.
//
// This source code is provided for personal, educational, and
// non-commercial use only. Redistribution, modification, or use
// of this code in whole or in part for any other purpose is
// strictly prohibited without the prior written consent of the author.
#ifndef SYNCHRONIZER_H
#define SYNCHRONIZER_H

#include <cstdint>
#include "Common/SignalTypes.h"
#include "Logging.h"
#include "StateReader.h"
#include "StateWriter.h"

// Two flip-flop synchronizer for each of the select, clock and data inputs.
//
// A raw level sampled on tick n lands in the capture stage, moves to the
// settle stage on tick n+1 and is presented on the synced output during tick
// n+2. Select resets to its idle (high) level, clock and data to low, so a
// freshly reset receiver looks exactly like one with no transaction running.
class Synchronizer
{
    public:
        Synchronizer();
        virtual ~Synchronizer();

        static constexpr int LATENCY_TICKS = 2;

        // Pointers
        inline void attachLogInstance(Logging* logger) { this->logger = logger; }
        inline void setLog(bool enable) { setLogging = enable; }

        // State management
        void saveState(StateWriter& wrtr) const;
        bool loadState(const StateReader::Chunk& chunk, StateReader& rdr);

        void reset();

        // Sample the raw pins and return what is visible on the synced side this tick
        SyncedSignal tick(const RawSignal& raw);

        // Synced lines returned by the last tick, what the edge detector saw
        SyncedSignal getOutput() const;

        // Debug access
        inline RawSignal getCaptureStage() const { return { select.capture, clock.capture, data.capture }; }
        inline RawSignal getSettleStage() const { return { select.settle, clock.settle, data.settle }; }

    protected:

    private:

        // Non-owning pointers
        Logging* logger;

        struct SyncChain
        {
            bool capture;
            bool settle;

            void resetTo(bool level) { capture = settle = level; }

            // Shift one sample in, return the value that was on the output
            bool shift(bool sample)
            {
                const bool out = settle;
                settle = capture;
                capture = sample;
                return out;
            }
        };

        SyncChain select;
        SyncChain clock;
        SyncChain data;

        bool setLogging;

        // Output of the last tick
        SyncedSignal lastOutput;
};

#endif // SYNCHRONIZER_H
