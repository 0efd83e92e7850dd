// Copyright (c) 2025 Christopher Broschard
// All rights reserved.
//
// This source code is provided for personal, educational, and
// non-commercial use only. Redistribution, modification, or use
// of this code in whole or in part for any other purpose is
// strictly prohibited without the prior written consent of the author.
#ifndef SPIPERIPHERAL_H
#define SPIPERIPHERAL_H

#include <cstdint>
#include <memory>
#include <string>
#include "Common/LoggingTypes.h"
#include "Debug/TraceManager.h"
#include "Logging.h"
#include "Receiver/EdgeDetector.h"
#include "Receiver/FrameAssembler.h"
#include "Receiver/RegisterBank.h"
#include "Receiver/RegisterDispatcher.h"
#include "Receiver/Synchronizer.h"
#include "ResetController.h"
#include "SignalLines.h"
#include "StateReader.h"
#include "StateWriter.h"

// The serial command receiver: pins in, five configuration registers out.
//
// Each tick runs the whole pipeline once, in order:
//   synchronizer -> edge detector -> frame assembler -> register dispatcher
// Every stage only looks at the stage before it on the same tick, plus its
// own state from the previous tick.
class SPIPeripheral
{
    public:
        SPIPeripheral();
        virtual ~SPIPeripheral();

        static constexpr uint32_t STATE_FILE_VERSION = 1;

        struct Statistics
        {
            uint64_t framesCompleted = 0;
            uint64_t framesWritten = 0;
            uint64_t framesWriteDisabled = 0;
            uint64_t framesUnknownTarget = 0;
            uint64_t framesAborted = 0;
        };

        // Pointers
        void attachLogInstance(Logging* logger);
        inline void attachTraceManagerInstance(TraceManager* traceMgr) { this->traceMgr = traceMgr; }

        // Per component logging
        void setLogging(LogSet type, bool enable);

        // Pins the host drives
        inline SignalLines& lines() { return *lineBus; }
        inline const SignalLines& lines() const { return *lineBus; }

        // Output surface for the duty cycle generator
        inline const RegisterBank& registers() const { return *bank; }

        // Main emulation cycle
        void tick();
        void run(uint64_t ticks);

        // Force every block idle, clear counters
        void powerOnReset();

        // Getters
        inline uint64_t getTickCount() const { return tickCount; }
        inline const Statistics& getStatistics() const { return stats; }
        inline bool isInReset() const { return resetCtl->isHeld(); }

        // Debug access
        inline const Synchronizer& getSynchronizer() const { return *sync; }
        inline const EdgeDetector& getEdgeDetector() const { return *edges; }
        inline const FrameAssembler& getFrameAssembler() const { return *assembler; }
        std::string dumpState() const;

        // State management
        void saveState(StateWriter& wrtr) const;
        bool loadState(StateReader& rdr);
        bool saveStateToFile(const std::string& path) const;
        bool loadStateFromFile(const std::string& path);

    protected:

    private:

        std::unique_ptr<SignalLines> lineBus;
        std::unique_ptr<Synchronizer> sync;
        std::unique_ptr<EdgeDetector> edges;
        std::unique_ptr<FrameAssembler> assembler;
        std::unique_ptr<RegisterDispatcher> dispatcher;
        std::unique_ptr<RegisterBank> bank;
        std::unique_ptr<ResetController> resetCtl;

        // Non-owning pointers
        Logging* logger;
        TraceManager* traceMgr;

        uint64_t tickCount;
        Statistics stats;

        void handleFrame(const CompletedFrame& frame, TraceManager::Stamp stamp);
        bool applyState(StateReader& rdr);
};

#endif // SPIPERIPHERAL_H
