// Copyright (c) 2025 Christopher Broschard
// All rights reserved.
//
// This source code is provided for personal, educational, and
// non-commercial use only. Redistribution, modification, or use
// of this code in whole or in part for any other purpose is
// strictly prohibited without the prior written consent of the author.
#include "ResetController.h"

#include "Logging.h"
#include "Receiver/EdgeDetector.h"
#include "Receiver/FrameAssembler.h"
#include "Receiver/RegisterBank.h"
#include "Receiver/Synchronizer.h"

ResetController::ResetController(
    Synchronizer& sync,
    EdgeDetector& edges,
    FrameAssembler& assembler,
    RegisterBank& bank)
    : sync_(sync)
    , edges_(edges)
    , assembler_(assembler)
    , bank_(bank)
    , logger_(nullptr)
    , held_(false)
{
}

void ResetController::resetAll()
{
    sync_.reset();
    edges_.reset();
    assembler_.reset();
    bank_.reset();
}

void ResetController::holdReset()
{
    if (!held_ && logger_)
        logger_->WriteLog(Logging::LogLevel::INFO, "rst_n asserted, receiver held in reset");

    held_ = true;
    resetAll();
}

void ResetController::releaseReset()
{
    if (held_ && logger_)
        logger_->WriteLog(Logging::LogLevel::INFO, "rst_n released");

    held_ = false;
}

void ResetController::powerOnReset()
{
    held_ = false;
    resetAll();

    if (logger_)
        logger_->WriteLog(Logging::LogLevel::DEBUG, "Power on reset");
}
