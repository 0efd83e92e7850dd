// Copyright (c) 2025 Christopher Broschard
// All rights reserved.
//
// This source code is provided for personal, educational, and
// non-commercial use only. Redistribution, modification, or use
// of this code in whole or in part for any other purpose is
// strictly prohibited without the prior written consent of the author.
#ifndef REGISTERDISPATCHER_H
#define REGISTERDISPATCHER_H

#include <cstdint>
#include <string>
#include "Logging.h"
#include "Receiver/Frame.h"
#include "Receiver/RegisterBank.h"

class RegisterDispatcher
{
    public:
        RegisterDispatcher();
        virtual ~RegisterDispatcher();

        // What happened to a frame. None of these are errors.
        enum class Outcome : uint8_t
        {
            Written,        // payload stored in the target register
            WriteDisabled,  // bit 15 clear, frame ignored
            UnknownTarget   // write requested for a reserved target, nothing stored
        };

        // Pointers
        inline void attachLogInstance(Logging* logger) { this->logger = logger; }
        inline void setLog(bool enable) { setLogging = enable; }

        // Decode a completed frame and apply it to the bank
        Outcome dispatch(const CompletedFrame& frame, RegisterBank& bank);

        static std::string outcomeToString(Outcome outcome);

    protected:

    private:

        // Non-owning pointers
        Logging* logger;

        bool setLogging;
};

#endif // REGISTERDISPATCHER_H
