// Copyright (c) 2025 Christopher Broschard
// All rights reserved.
//
// This source code is provided for personal, educational, and
// non-commercial use only. Redistribution, modification, or use
// of this code in whole or in part for any other purpose is
// strictly prohibited without the prior written consent of the author.
#include <cstdio>
#include <gtest/gtest.h>
#include "Host/SPIHost.h"
#include "SPIPeripheral.h"
#include "StateReader.h"
#include "StateWriter.h"

class SaveStateTest : public ::testing::Test
{
    protected:
        SPIPeripheral peripheral;
        SPIHost host{ peripheral };

        void SetUp() override
        {
            peripheral.powerOnReset();
            host.writeRegister(RegisterId::OutputEnableLow, 0xF0);
            host.writeRegister(RegisterId::DutyCycle, 0x80);
        }

        std::vector<uint8_t> snapshot() const
        {
            StateWriter wrtr(SPIPeripheral::STATE_FILE_VERSION);
            peripheral.saveState(wrtr);
            return wrtr.data();
        }

        static bool load(SPIPeripheral& target, std::vector<uint8_t> bytes)
        {
            StateReader rdr;
            if (!rdr.loadFromMemory(std::move(bytes))) return false;
            return target.loadState(rdr);
        }
};

TEST_F(SaveStateTest, SnapshotStartsWithMagicAndVersion)
{
    const auto bytes = snapshot();
    ASSERT_GE(bytes.size(), 8u);
    EXPECT_EQ(std::string(bytes.begin(), bytes.begin() + 4), "SPIS");
    EXPECT_EQ(bytes[4], 1);
    EXPECT_EQ(bytes[5], 0);
}

TEST_F(SaveStateTest, RestoresRegistersCountersAndTicks)
{
    SPIPeripheral copy;
    copy.powerOnReset();
    ASSERT_TRUE(load(copy, snapshot()));

    EXPECT_EQ(copy.registers().values(), peripheral.registers().values());
    EXPECT_EQ(copy.registers().getWriteCount(), 2u);
    EXPECT_EQ(copy.getTickCount(), peripheral.getTickCount());
    EXPECT_EQ(copy.getStatistics().framesWritten, 2u);
}

TEST_F(SaveStateTest, RestoresPartialFrame)
{
    host.sendBits(0x8155, 6, false);

    SPIPeripheral copy;
    copy.powerOnReset();
    ASSERT_TRUE(load(copy, snapshot()));

    EXPECT_EQ(copy.getFrameAssembler().getBitCount(), 6);
    EXPECT_EQ(copy.getFrameAssembler().getShiftRegister(), peripheral.getFrameAssembler().getShiftRegister());
    EXPECT_TRUE(copy.getFrameAssembler().isArmed());
    EXPECT_EQ(copy.dumpState().substr(copy.dumpState().find("Synced")),
              peripheral.dumpState().substr(peripheral.dumpState().find("Synced")));
}

TEST_F(SaveStateTest, BadMagicLeavesStateUntouched)
{
    auto bytes = snapshot();
    bytes[0] = 'X';

    SPIPeripheral other;
    other.powerOnReset();
    SPIHost otherHost(other);
    otherHost.writeRegister(RegisterId::PwmEnableHigh, 0x42);
    const RegisterValues before = other.registers().values();
    const uint64_t ticks = other.getTickCount();

    EXPECT_FALSE(load(other, bytes));
    EXPECT_EQ(other.registers().values(), before);
    EXPECT_EQ(other.getTickCount(), ticks);
}

TEST_F(SaveStateTest, TruncatedSnapshotIsRolledBack)
{
    auto bytes = snapshot();
    bytes.resize(bytes.size() - 3);

    SPIPeripheral other;
    other.powerOnReset();
    SPIHost otherHost(other);
    otherHost.writeRegister(RegisterId::PwmEnableHigh, 0x42);
    const RegisterValues before = other.registers().values();
    const auto stats = other.getStatistics();

    EXPECT_FALSE(load(other, bytes));
    EXPECT_EQ(other.registers().values(), before);
    EXPECT_EQ(other.getStatistics().framesWritten, stats.framesWritten);
    EXPECT_EQ(other.getTickCount(), otherHost.getTiming().idleTicks + 1u + 16u * 2u * otherHost.getTiming().halfPeriodTicks);
}

TEST_F(SaveStateTest, WrongFileVersionRejected)
{
    StateWriter wrtr(SPIPeripheral::STATE_FILE_VERSION + 1);
    peripheral.saveState(wrtr);

    SPIPeripheral other;
    other.powerOnReset();
    EXPECT_FALSE(load(other, wrtr.data()));
    EXPECT_EQ(other.registers().values(), RegisterValues{});
}

TEST_F(SaveStateTest, MissingChunkRejected)
{
    StateWriter wrtr(SPIPeripheral::STATE_FILE_VERSION);
    wrtr.beginFile();
    peripheral.getSynchronizer().saveState(wrtr);
    peripheral.getEdgeDetector().saveState(wrtr);

    SPIPeripheral other;
    other.powerOnReset();
    EXPECT_FALSE(load(other, wrtr.data()));
}

TEST_F(SaveStateTest, UnknownChunkSkipped)
{
    StateWriter wrtr(SPIPeripheral::STATE_FILE_VERSION);
    peripheral.saveState(wrtr);
    wrtr.beginChunk("XTRA");
    wrtr.writeU32(1);
    wrtr.writeU64(0xDEADBEEF);
    wrtr.endChunk();

    SPIPeripheral other;
    other.powerOnReset();
    ASSERT_TRUE(load(other, wrtr.data()));
    EXPECT_EQ(other.registers().getDutyCycle(), 0x80);
}

TEST_F(SaveStateTest, FileRoundTripAndMissingFile)
{
    const std::string path = ::testing::TempDir() + "spiperipheral_state.bin";
    ASSERT_TRUE(peripheral.saveStateToFile(path));

    SPIPeripheral other;
    other.powerOnReset();
    ASSERT_TRUE(other.loadStateFromFile(path));
    EXPECT_EQ(other.registers().getOutputEnableLow(), 0xF0);

    std::remove(path.c_str());
    EXPECT_FALSE(other.loadStateFromFile(path));
}

TEST_F(SaveStateTest, RestoredReceiverKeepsWorking)
{
    SPIPeripheral copy;
    copy.powerOnReset();
    ASSERT_TRUE(load(copy, snapshot()));

    SPIHost copyHost(copy);
    copyHost.writeRegister(RegisterId::PwmEnableLow, 0x0F);
    EXPECT_EQ(copy.registers().getPwmEnableLow(), 0x0F);
    EXPECT_EQ(copy.registers().getDutyCycle(), 0x80);
}
