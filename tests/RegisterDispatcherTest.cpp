// Copyright (c) 2025 Christopher Broschard
// All rights reserved.
//
// This source code is provided for personal, educational, and
// non-commercial use only. Redistribution, modification, or use
// of this code in whole or in part for any other purpose is
// strictly prohibited without the prior written consent of the author.
#include <gtest/gtest.h>
#include "Receiver/RegisterDispatcher.h"

using Outcome = RegisterDispatcher::Outcome;

TEST(RegisterDispatcherTest, WriteEnabledFrameStoresPayload)
{
    RegisterDispatcher dispatcher;
    RegisterBank bank;

    EXPECT_EQ(dispatcher.dispatch(CompletedFrame{ 0x82F0 }, bank), Outcome::Written);

    RegisterValues expected;
    expected.pwmEnableLow = 0xF0;
    EXPECT_EQ(bank.values(), expected);
}

TEST(RegisterDispatcherTest, EveryTargetMapsToItsRegister)
{
    RegisterDispatcher dispatcher;
    RegisterBank bank;

    for (uint8_t t = 0; t < REGISTER_COUNT; ++t)
        dispatcher.dispatch(CompletedFrame::make(true, t, static_cast<uint8_t>(0x10 + t)), bank);

    EXPECT_EQ(bank.getOutputEnableLow(), 0x10);
    EXPECT_EQ(bank.getOutputEnableHigh(), 0x11);
    EXPECT_EQ(bank.getPwmEnableLow(), 0x12);
    EXPECT_EQ(bank.getPwmEnableHigh(), 0x13);
    EXPECT_EQ(bank.getDutyCycle(), 0x14);
}

TEST(RegisterDispatcherTest, WriteDisabledFrameChangesNothing)
{
    RegisterDispatcher dispatcher;
    RegisterBank bank;

    EXPECT_EQ(dispatcher.dispatch(CompletedFrame{ 0x02F0 }, bank), Outcome::WriteDisabled);
    EXPECT_EQ(bank.values(), RegisterValues{});
    EXPECT_EQ(bank.getWriteCount(), 0u);
}

TEST(RegisterDispatcherTest, ReservedTargetsChangeNothing)
{
    RegisterDispatcher dispatcher;
    RegisterBank bank;

    EXPECT_EQ(dispatcher.dispatch(CompletedFrame::make(true, 5, 0xAA), bank), Outcome::UnknownTarget);
    EXPECT_EQ(dispatcher.dispatch(CompletedFrame::make(true, 0x30, 0xAA), bank), Outcome::UnknownTarget);
    EXPECT_EQ(dispatcher.dispatch(CompletedFrame::make(true, 127, 0xAA), bank), Outcome::UnknownTarget);
    EXPECT_EQ(dispatcher.dispatch(CompletedFrame::make(false, 0x41, 0xEF), bank), Outcome::WriteDisabled);

    EXPECT_EQ(bank.values(), RegisterValues{});
    EXPECT_EQ(bank.getWriteCount(), 0u);
}

TEST(RegisterDispatcherTest, RepeatedFrameIsIdempotent)
{
    RegisterDispatcher dispatcher;
    RegisterBank bank;
    const CompletedFrame frame = CompletedFrame::make(true, 4, 0xCF);

    dispatcher.dispatch(frame, bank);
    const RegisterValues once = bank.values();
    dispatcher.dispatch(frame, bank);

    EXPECT_EQ(bank.values(), once);
    EXPECT_EQ(bank.getWriteCount(), 2u);
}

TEST(RegisterDispatcherTest, OutcomeNames)
{
    EXPECT_EQ(RegisterDispatcher::outcomeToString(Outcome::Written), "Written");
    EXPECT_EQ(RegisterDispatcher::outcomeToString(Outcome::WriteDisabled), "WriteDisabled");
    EXPECT_EQ(RegisterDispatcher::outcomeToString(Outcome::UnknownTarget), "UnknownTarget");
}
