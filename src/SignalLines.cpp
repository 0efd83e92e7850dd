// Copyright (c) 2025 Christopher Broschard
// All rights reserved.
//
// This source code is provided for personal, educational, and
// non-commercial use only. Redistribution, modification, or use
// of this code in whole or in part for any other purpose is
// strictly prohibited without the prior written consent of the author.
#include "SignalLines.h"

SignalLines::SignalLines() :
    resetN(true),
    selectTransitions(0),
    clockTransitions(0),
    dataTransitions(0)
{
    release();
}

SignalLines::~SignalLines() = default;

void SignalLines::setSelectLine(bool state)
{
    if (lines.select != state) ++selectTransitions;
    lines.select = state;
}

void SignalLines::setClockLine(bool state)
{
    if (lines.clock != state) ++clockTransitions;
    lines.clock = state;
}

void SignalLines::setDataLine(bool state)
{
    if (lines.data != state) ++dataTransitions;
    lines.data = state;
}

void SignalLines::setResetLine(bool state)
{
    resetN = state;
}

void SignalLines::drive(bool select, bool clock, bool data)
{
    setSelectLine(select);
    setClockLine(clock);
    setDataLine(data);
}

void SignalLines::release()
{
    drive(true, false, false);
}
