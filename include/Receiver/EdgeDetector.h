// Copyright (c) 2025 Christopher Broschard
// All rights reserved.
//
// This source code is provided for personal, educational, and
// non-commercial use only. Redistribution, modification, or use
// of this code in whole or in part for any other purpose is
// strictly prohibited without the prior written consent of the author.
#ifndef EDGEDETECTOR_H
#define EDGEDETECTOR_H

#include <cstdint>
#include "Common/SignalTypes.h"
#include "Logging.h"
#include "StateReader.h"
#include "StateWriter.h"

class EdgeDetector
{
    public:
        EdgeDetector();
        virtual ~EdgeDetector();

        // Pointers
        inline void attachLogInstance(Logging* logger) { this->logger = logger; }
        inline void setLog(bool enable) { setLogging = enable; }

        // State management
        void saveState(StateWriter& wrtr) const;
        bool loadState(const StateReader::Chunk& chunk, StateReader& rdr);

        void reset();

        // Compare this tick's synced lines against last tick's
        EdgeEvents tick(const SyncedSignal& synced);

        // Getters
        inline bool getPrevSelect() const { return prevSelect; }
        inline bool getPrevClock() const { return prevClock; }

    protected:

    private:

        // Non-owning pointers
        Logging* logger;

        // One tick of history
        bool prevSelect;
        bool prevClock;

        bool setLogging;
};

#endif // EDGEDETECTOR_H
