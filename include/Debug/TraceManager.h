// Copyright (c) 2025 Christopher Broschard
// All rights reserved.
//
// This source code is provided for personal, educational, and
// non-commercial use only. Redistribution, modification, or use
// of this code in whole or in part for any other purpose is
// strictly prohibited without the prior written consent of the author.
#ifndef TRACEMANAGER_H
#define TRACEMANAGER_H

#include <cstdint>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include "Common/RegisterMap.h"
#include "Common/SignalTypes.h"
#include "Receiver/Frame.h"
#include "Receiver/RegisterDispatcher.h"

class TraceManager
{
    public:
        TraceManager();
        virtual ~TraceManager();

        enum class TraceCat : uint32_t
        {
            EDGE     = 1u<<0,
            FRAME    = 1u<<1,
            DISPATCH = 1u<<2,
            REGISTER = 1u<<3,
            RESET    = 1u<<4
        };

        static constexpr uint32_t ALL_CATEGORIES = 0x1F;

        // Getters
        inline bool isEnabled() const { return tracing; }
        inline uint32_t categories() const { return cats; }
        inline bool catOn(TraceCat c) const { return (cats & catToMask(c)) != 0; }
        inline const std::vector<std::string>& getBuffer() const { return buffer; }

        // Setters
        inline void setCategories(uint32_t mask) { cats = mask & ALL_CATEGORIES; }
        void enable(bool on);

        // Lines go to the file instead of the buffer while it is open
        bool setFileOutput(const std::string& path);

        // "edge,frame,dispatch,register,reset" or "all". Throws std::runtime_error on an unknown name.
        static uint32_t parseCategories(const std::string& list);

        // Helpers
        void dumpBuffer(std::ostream& out = std::cout);
        std::string listCategoryStatus() const;

        // Standard stamping for logging
        struct Stamp
        {
            uint64_t tick;
        };

        // Component specific traces
        void recordEdges(const EdgeEvents& events, const SyncedSignal& synced, Stamp stamp);
        void recordFrame(const CompletedFrame& frame, Stamp stamp);
        void recordAbort(uint8_t bitsDiscarded, Stamp stamp);
        void recordDispatch(const CompletedFrame& frame, RegisterDispatcher::Outcome outcome, Stamp stamp);
        void recordRegisterWrite(RegisterId id, uint8_t oldValue, uint8_t newValue, Stamp stamp);
        void recordReset(bool asserted, Stamp stamp);
        void recordCustomEvent(const std::string& text);

    protected:

    private:

        // Status
        bool tracing;
        std::ofstream file;
        std::vector<std::string> buffer;

        // Categories
        uint32_t cats;

        // Helpers
        std::string formatStamp(const Stamp& stamp) const;
        static uint32_t catToMask(TraceCat cat);
        void emit(const std::string& line);
};

#endif // TRACEMANAGER_H
