// Copyright (c) 2025 Christopher Broschard
// All rights reserved.
//
// This source code is provided for personal, educational, and
// non-commercial use only. Redistribution, modification, or use
// of this code in whole or in part for any other purpose is
// strictly prohibited without the prior written consent of the author.
#include <gtest/gtest.h>
#include "Receiver/Synchronizer.h"

TEST(SynchronizerTest, ResetPresentsIdleLevels)
{
    Synchronizer sync;
    const SyncedSignal out = sync.getOutput();
    EXPECT_TRUE(out.select);
    EXPECT_FALSE(out.clock);
    EXPECT_FALSE(out.data);
}

TEST(SynchronizerTest, RawLevelAppearsTwoTicksLater)
{
    Synchronizer sync;
    const RawSignal raw{ false, true, true };

    const SyncedSignal t0 = sync.tick(raw);
    EXPECT_TRUE(t0.select);
    EXPECT_FALSE(t0.clock);
    EXPECT_FALSE(t0.data);

    const SyncedSignal t1 = sync.tick(raw);
    EXPECT_TRUE(t1.select);
    EXPECT_FALSE(t1.clock);

    const SyncedSignal t2 = sync.tick(raw);
    EXPECT_FALSE(t2.select);
    EXPECT_TRUE(t2.clock);
    EXPECT_TRUE(t2.data);
}

TEST(SynchronizerTest, SingleTickPulseIsDelayedNotStretched)
{
    Synchronizer sync;
    const RawSignal idle{};
    const RawSignal pulse{ true, true, false };

    EXPECT_FALSE(sync.tick(pulse).clock);
    EXPECT_FALSE(sync.tick(idle).clock);
    EXPECT_TRUE(sync.tick(idle).clock);
    EXPECT_FALSE(sync.tick(idle).clock);
}

TEST(SynchronizerTest, StagesShiftOnePerTick)
{
    Synchronizer sync;
    sync.tick(RawSignal{ false, false, true });

    EXPECT_FALSE(sync.getCaptureStage().select);
    EXPECT_TRUE(sync.getCaptureStage().data);
    EXPECT_TRUE(sync.getSettleStage().select);
    EXPECT_FALSE(sync.getSettleStage().data);

    sync.tick(RawSignal{});
    EXPECT_TRUE(sync.getCaptureStage().select);
    EXPECT_FALSE(sync.getSettleStage().select);
}

TEST(SynchronizerTest, OutputMatchesLastTick)
{
    Synchronizer sync;
    const RawSignal active{ false, true, true };

    for (int i = 0; i < 4; ++i)
    {
        const SyncedSignal out = sync.tick(active);
        EXPECT_EQ(sync.getOutput().select, out.select);
        EXPECT_EQ(sync.getOutput().clock, out.clock);
        EXPECT_EQ(sync.getOutput().data, out.data);
    }
}

TEST(SynchronizerTest, OutputHoldsIdleForLatencyTicks)
{
    Synchronizer sync;
    const RawSignal active{ false, true, true };

    for (int i = 0; i < Synchronizer::LATENCY_TICKS; ++i)
    {
        sync.tick(active);
        EXPECT_TRUE(sync.getOutput().select);
        EXPECT_FALSE(sync.getOutput().clock);
    }

    sync.tick(active);
    EXPECT_FALSE(sync.getOutput().select);
    EXPECT_TRUE(sync.getOutput().clock);
}

TEST(SynchronizerTest, ResetDiscardsInFlightSamples)
{
    Synchronizer sync;
    const RawSignal active{ false, true, true };
    sync.tick(active);
    sync.tick(active);

    sync.reset();

    const SyncedSignal out = sync.tick(active);
    EXPECT_TRUE(out.select);
    EXPECT_FALSE(out.clock);
    EXPECT_FALSE(out.data);
}
