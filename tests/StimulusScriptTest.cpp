// Copyright (c) 2025 Christopher Broschard
// All rights reserved.
//
// This source code is provided for personal, educational, and
// non-commercial use only. Redistribution, modification, or use
// of this code in whole or in part for any other purpose is
// strictly prohibited without the prior written consent of the author.
#include <sstream>
#include <stdexcept>
#include <gtest/gtest.h>
#include "Host/ScriptUtils.h"
#include "Host/SPIHost.h"
#include "Host/StimulusScript.h"
#include "SPIPeripheral.h"

class StimulusScriptTest : public ::testing::Test
{
    protected:
        SPIPeripheral peripheral;
        SPIHost host{ peripheral };
        StimulusScript script;
        std::ostringstream out;

        void SetUp() override
        {
            peripheral.powerOnReset();
        }

        size_t runText(const std::string& text)
        {
            std::istringstream in(text);
            script.parse(in);
            return script.run(host, peripheral, out);
        }
};

TEST_F(StimulusScriptTest, WritesAndExpectsPass)
{
    const size_t failures = runText(
        "# bring up\n"
        "reset\n"
        "write 0 $F0\n"
        "write 1 0xCC   # second register\n"
        "\n"
        "write 0x30 $AA\n"
        "read  $30 $BE\n"
        "expect outputEnableLow $F0\n"
        "expect OUTPUTENABLEHIGH 204\n"
        "expect 2 0\n");

    EXPECT_EQ(failures, 0u);
    EXPECT_EQ(script.getCommands().size(), 8u);
    EXPECT_TRUE(out.str().empty());
}

TEST_F(StimulusScriptTest, FailedExpectIsCountedAndReported)
{
    const size_t failures = runText(
        "write 4 $80\n"
        "expect dutyCycle $81\n"
        "expect dutyCycle $80\n"
        "expect pwmEnableHigh 1\n");

    EXPECT_EQ(failures, 2u);
    EXPECT_NE(out.str().find("FAIL line 2: dutyCycle expected $81 got $80"), std::string::npos);
    EXPECT_NE(out.str().find("FAIL line 4"), std::string::npos);
}

TEST_F(StimulusScriptTest, FrameBurstAndAbort)
{
    const size_t failures = runText(
        "frame %1_0000010_11110000\n"
        "abort 10 $FFFF\n"
        "burst $8011 $8122\n"
        "idle 50\n"
        "expect pwmEnableLow $F0\n"
        "expect outputEnableLow $11\n"
        "expect outputEnableHigh $22\n");

    EXPECT_EQ(failures, 0u);
    EXPECT_EQ(peripheral.getStatistics().framesAborted, 1u);
    EXPECT_EQ(peripheral.getStatistics().framesCompleted, 3u);
}

TEST_F(StimulusScriptTest, DumpPrintsRegisterTable)
{
    runText("write 3 $3C\ndump\n");
    EXPECT_NE(out.str().find("pwmEnableHigh"), std::string::npos);
    EXPECT_NE(out.str().find("$3C"), std::string::npos);
}

TEST_F(StimulusScriptTest, ParseErrorsNameTheLine)
{
    std::istringstream unknown("reset\nidle 10\nwiggle 3\n");
    try
    {
        script.parse(unknown);
        FAIL() << "expected a parse error";
    }
    catch (const std::runtime_error& e)
    {
        EXPECT_NE(std::string(e.what()).find("Line 3"), std::string::npos);
    }

    // A failed parse adds nothing
    EXPECT_TRUE(script.empty());
}

TEST_F(StimulusScriptTest, ArgumentsAreRangeChecked)
{
    std::istringstream target("write 128 1\n");
    EXPECT_THROW(script.parse(target), std::runtime_error);

    std::istringstream payload("write 1 256\n");
    EXPECT_THROW(script.parse(payload), std::runtime_error);

    std::istringstream bits("abort 16\n");
    EXPECT_THROW(script.parse(bits), std::runtime_error);

    std::istringstream reg("expect pwm 1\n");
    EXPECT_THROW(script.parse(reg), std::runtime_error);

    std::istringstream args("write 1\n");
    EXPECT_THROW(script.parse(args), std::runtime_error);
}

TEST_F(StimulusScriptTest, MissingFileThrows)
{
    EXPECT_THROW(script.parseFile("no/such/script.txt"), std::runtime_error);
}

TEST(ScriptUtilsTest, NumberFormats)
{
    EXPECT_EQ(parseNumber("$F0", 0xFF), 0xF0u);
    EXPECT_EQ(parseNumber("0xcc", 0xFF), 0xCCu);
    EXPECT_EQ(parseNumber("%1010", 0xFF), 10u);
    EXPECT_EQ(parseNumber("  42 ", 0xFF), 42u);
    EXPECT_EQ(parseNumber("%1_0000010_11110000", 0xFFFF), 0x82F0u);

    EXPECT_THROW(parseNumber("", 0xFF), std::runtime_error);
    EXPECT_THROW(parseNumber("$", 0xFF), std::runtime_error);
    EXPECT_THROW(parseNumber("12z", 0xFF), std::runtime_error);
    EXPECT_THROW(parseNumber("-1", 0xFF), std::runtime_error);
    EXPECT_THROW(parseNumber("300", 0xFF), std::runtime_error);
}

TEST(ScriptUtilsTest, RegisterNamesAndIndices)
{
    EXPECT_TRUE(parseRegister("dutycycle") == RegisterId::DutyCycle);
    EXPECT_TRUE(parseRegister("PwmEnableLow") == RegisterId::PwmEnableLow);
    EXPECT_TRUE(parseRegister("1") == RegisterId::OutputEnableHigh);
    EXPECT_FALSE(parseRegister("5").has_value());
    EXPECT_FALSE(parseRegister("pwm").has_value());
}

TEST(ScriptUtilsTest, SplitHelpers)
{
    const auto csv = splitCSV(" edge, frame ,,reset ");
    ASSERT_EQ(csv.size(), 3u);
    EXPECT_EQ(csv[0], "edge");
    EXPECT_EQ(csv[1], "frame");
    EXPECT_EQ(csv[2], "reset");

    const auto tokens = splitTokens("  write\t1   $CC ");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[2], "$CC");
}
