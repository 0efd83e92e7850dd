// Copyright (c) 2025 Christopher Broschard
// All rights reserved.
//
// This source code is provided for personal, educational, and
// non-commercial use only. Redistribution, modification, or use
// of this code in whole or in part for any other purpose is
// strictly prohibited without the prior written consent of the author.
#include "Common/HexFormat.h"
#include "Receiver/RegisterDispatcher.h"

RegisterDispatcher::RegisterDispatcher() :
    logger(nullptr),
    setLogging(false)
{

}

RegisterDispatcher::~RegisterDispatcher() = default;

RegisterDispatcher::Outcome RegisterDispatcher::dispatch(const CompletedFrame& frame, RegisterBank& bank)
{
    Outcome outcome = Outcome::WriteDisabled;

    if (frame.opcodeTag())
    {
        if (auto id = targetToRegister(frame.target()))
        {
            bank.write(*id, frame.payload());
            outcome = Outcome::Written;
        }
        else
        {
            outcome = Outcome::UnknownTarget;
        }
    }

    if (setLogging && logger)
    {
        const auto level = (outcome == Outcome::UnknownTarget) ? Logging::LogLevel::WARNING : Logging::LogLevel::INFO;
        logger->WriteLog(LogSet::Dispatcher, level,
            outcomeToString(outcome) + " target=$" + toHex(frame.target(), 2) + " payload=$" + toHex(frame.payload(), 2));
    }

    return outcome;
}

std::string RegisterDispatcher::outcomeToString(Outcome outcome)
{
    switch (outcome)
    {
        case Outcome::Written: return "Written";
        case Outcome::WriteDisabled: return "WriteDisabled";
        case Outcome::UnknownTarget: return "UnknownTarget";
    }

    return "Unknown";
}
