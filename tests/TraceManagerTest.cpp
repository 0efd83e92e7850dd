// Copyright (c) 2025 Christopher Broschard
// All rights reserved.
//
// This source code is provided for personal, educational, and
// non-commercial use only. Redistribution, modification, or use
// of this code in whole or in part for any other purpose is
// strictly prohibited without the prior written consent of the author.
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <gtest/gtest.h>
#include "Debug/TraceManager.h"
#include "Host/SPIHost.h"
#include "SPIPeripheral.h"

namespace
{
    bool contains(const std::vector<std::string>& lines, const std::string& text)
    {
        for (const auto& line : lines)
            if (line.find(text) != std::string::npos) return true;
        return false;
    }
}

class TraceManagerTest : public ::testing::Test
{
    protected:
        TraceManager trace;
        SPIPeripheral peripheral;
        SPIHost host{ peripheral };

        void SetUp() override
        {
            peripheral.attachTraceManagerInstance(&trace);
            peripheral.powerOnReset();
        }
};

TEST(TraceCategoryTest, ParseNames)
{
    using Cat = TraceManager::TraceCat;
    EXPECT_EQ(TraceManager::parseCategories("edge, FRAME"),
              static_cast<uint32_t>(Cat::EDGE) | static_cast<uint32_t>(Cat::FRAME));
    EXPECT_EQ(TraceManager::parseCategories("all"), TraceManager::ALL_CATEGORIES);
    EXPECT_EQ(TraceManager::parseCategories(""), 0u);
    EXPECT_THROW(TraceManager::parseCategories("edge,bogus"), std::runtime_error);
}

TEST_F(TraceManagerTest, DisabledRecordsNothing)
{
    trace.setCategories(TraceManager::ALL_CATEGORIES);
    host.writeRegister(RegisterId::PwmEnableLow, 0xF0);
    EXPECT_TRUE(trace.getBuffer().empty());
}

TEST_F(TraceManagerTest, FrameDispatchAndRegisterWrite)
{
    trace.setCategories(TraceManager::parseCategories("frame,dispatch,register"));
    trace.enable(true);

    host.writeRegister(RegisterId::PwmEnableLow, 0xF0);

    const auto& lines = trace.getBuffer();
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0].front(), '[');
    EXPECT_TRUE(contains(lines, "FRAME $82F0 1_0000010_11110000"));
    EXPECT_TRUE(contains(lines, "DISPATCH Written W=1 T=$02 D=$F0"));
    EXPECT_TRUE(contains(lines, "REG pwmEnableLow $00 -> $F0"));
}

TEST_F(TraceManagerTest, EdgesFollowCategoryMask)
{
    trace.setCategories(TraceManager::parseCategories("edge"));
    trace.enable(true);

    host.writeRegister(RegisterId::OutputEnableLow, 0x01);

    // One nCS fall and sixteen SCLK rises
    const auto& lines = trace.getBuffer();
    ASSERT_EQ(lines.size(), 17u);
    EXPECT_NE(lines[0].find("nCS fall"), std::string::npos);
    EXPECT_NE(lines[16].find("SCLK rise COPI=1"), std::string::npos);
    EXPECT_FALSE(contains(lines, "FRAME"));
}

TEST_F(TraceManagerTest, AbortAndResetEvents)
{
    trace.setCategories(TraceManager::parseCategories("frame,reset"));
    trace.enable(true);

    host.sendBits(0xFFFF, 10, false);
    host.sendWord(0x0000);
    host.pulseReset();

    const auto& lines = trace.getBuffer();
    EXPECT_TRUE(contains(lines, "ABORT after 10 bits"));
    EXPECT_TRUE(contains(lines, "RESET asserted"));
    EXPECT_TRUE(contains(lines, "RESET released"));
}

TEST_F(TraceManagerTest, DumpBufferPrintsAndClears)
{
    trace.setCategories(TraceManager::ALL_CATEGORIES);
    trace.enable(true);
    trace.recordCustomEvent("marker");

    std::ostringstream out;
    trace.dumpBuffer(out);
    EXPECT_EQ(out.str(), "marker\n");
    EXPECT_TRUE(trace.getBuffer().empty());
}

TEST_F(TraceManagerTest, FileOutputBypassesBuffer)
{
    const std::string path = ::testing::TempDir() + "spiperipheral_trace.txt";
    ASSERT_TRUE(trace.setFileOutput(path));
    trace.setCategories(TraceManager::parseCategories("register"));
    trace.enable(true);

    host.writeRegister(RegisterId::DutyCycle, 0x80);
    host.writeRegister(RegisterId::DutyCycle, 0x81);
    EXPECT_TRUE(trace.getBuffer().empty());

    trace.setFileOutput(path + ".closed");

    std::ifstream in(path);
    std::string line;
    ASSERT_TRUE(std::getline(in, line));
    EXPECT_NE(line.find("REG dutyCycle $00 -> $80"), std::string::npos);
    ASSERT_TRUE(std::getline(in, line));
    EXPECT_NE(line.find("REG dutyCycle $80 -> $81"), std::string::npos);
}

TEST_F(TraceManagerTest, CategoryStatusListsEveryCategory)
{
    trace.setCategories(TraceManager::parseCategories("dispatch"));
    const std::string status = trace.listCategoryStatus();
    EXPECT_NE(status.find("Trace OFF"), std::string::npos);
    EXPECT_NE(status.find("dispatch=on"), std::string::npos);
    EXPECT_NE(status.find("edge=off"), std::string::npos);
}
