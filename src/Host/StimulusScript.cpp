// Copyright (c) 2025 Christopher Broschard
// All rights reserved.
//
// This source code is provided for personal, educational, and
// non-commercial use only. Redistribution, modification, or use
// of this code in whole or in part for any other purpose is
// strictly prohibited without the prior written consent of the author.
#include <algorithm>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include "Common/HexFormat.h"
#include "Host/ScriptUtils.h"
#include "Host/SPIHost.h"
#include "Host/StimulusScript.h"
#include "SPIPeripheral.h"

namespace
{
    void requireArgs(const std::vector<std::string>& tokens, size_t min, size_t max, const std::string& usage)
    {
        const size_t args = tokens.size() - 1;
        if (args < min || args > max)
            throw std::runtime_error("Usage: " + usage);
    }
}

StimulusScript::StimulusScript() = default;

StimulusScript::~StimulusScript() = default;

void StimulusScript::parseFile(const std::string& path)
{
    std::ifstream in(path);
    if (!in)
        throw std::runtime_error("Unable to open script: " + path);

    parse(in);
}

void StimulusScript::parse(std::istream& in)
{
    std::vector<Command> parsed;
    std::string text;
    size_t lineNo = 0;

    while (std::getline(in, text))
    {
        ++lineNo;

        const auto hash = text.find('#');
        if (hash != std::string::npos)
            text.erase(hash);

        const auto tokens = splitTokens(text);
        if (tokens.empty())
            continue;

        try
        {
            parsed.push_back(parseLine(tokens, lineNo));
        }
        catch (const std::runtime_error& e)
        {
            throw std::runtime_error("Line " + std::to_string(lineNo) + ": " + e.what());
        }
    }

    commands.insert(commands.end(), parsed.begin(), parsed.end());
}

StimulusScript::Command StimulusScript::parseLine(const std::vector<std::string>& tokens, size_t line)
{
    std::string verb = tokens[0];
    std::transform(verb.begin(), verb.end(), verb.begin(), ::tolower);

    Command cmd{};
    cmd.line = line;

    if (verb == "reset")
    {
        requireArgs(tokens, 0, 0, "reset");
        cmd.op = Op::Reset;
    }
    else if (verb == "write" || verb == "read")
    {
        requireArgs(tokens, 2, 2, verb + " <target> <value>");
        cmd.op = (verb == "write") ? Op::Write : Op::Read;
        cmd.target = parseNumber(tokens[1], FRAME_TARGET_MASK);
        cmd.value = parseNumber(tokens[2], 0xFF);
    }
    else if (verb == "frame")
    {
        requireArgs(tokens, 1, 1, "frame <word>");
        cmd.op = Op::Frame;
        cmd.value = parseNumber(tokens[1], 0xFFFF);
    }
    else if (verb == "abort")
    {
        requireArgs(tokens, 1, 2, "abort <bits> [word]");
        cmd.op = Op::Abort;
        cmd.value = parseNumber(tokens[1], FRAME_BITS - 1);
        if (cmd.value == 0)
            throw std::runtime_error("abort needs at least one bit");
        cmd.word = (tokens.size() > 2) ? static_cast<uint16_t>(parseNumber(tokens[2], 0xFFFF)) : 0xFFFF;
    }
    else if (verb == "burst")
    {
        if (tokens.size() < 2)
            throw std::runtime_error("Usage: burst <word> <word> ...");
        cmd.op = Op::Burst;
        for (size_t i = 1; i < tokens.size(); ++i)
            cmd.words.push_back(static_cast<uint16_t>(parseNumber(tokens[i], 0xFFFF)));
    }
    else if (verb == "idle")
    {
        requireArgs(tokens, 1, 1, "idle <ticks>");
        cmd.op = Op::Idle;
        cmd.value = parseNumber(tokens[1], 0xFFFFFFFFu);
    }
    else if (verb == "expect")
    {
        requireArgs(tokens, 2, 2, "expect <register> <value>");
        cmd.op = Op::Expect;
        const auto reg = parseRegister(tokens[1]);
        if (!reg)
            throw std::runtime_error("Unknown register: " + tokens[1]);
        cmd.reg = *reg;
        cmd.value = parseNumber(tokens[2], 0xFF);
    }
    else if (verb == "dump")
    {
        requireArgs(tokens, 0, 0, "dump");
        cmd.op = Op::Dump;
    }
    else
    {
        throw std::runtime_error("Unknown command: " + tokens[0]);
    }

    return cmd;
}

size_t StimulusScript::run(SPIHost& host, SPIPeripheral& peripheral, std::ostream& out) const
{
    size_t failures = 0;

    for (const auto& cmd : commands)
    {
        switch (cmd.op)
        {
            case Op::Reset:
                host.pulseReset();
                break;
            case Op::Write:
            case Op::Read:
                host.sendFrame(cmd.op == Op::Write, cmd.target, static_cast<uint8_t>(cmd.value));
                break;
            case Op::Frame:
                host.sendWord(static_cast<uint16_t>(cmd.value));
                break;
            case Op::Abort:
                host.sendBits(cmd.word, cmd.value, false);
                break;
            case Op::Burst:
                host.sendBackToBack(cmd.words);
                break;
            case Op::Idle:
                host.idle(cmd.value);
                break;
            case Op::Expect:
            {
                const uint8_t actual = peripheral.registers().read(cmd.reg);
                if (actual != cmd.value)
                {
                    ++failures;
                    out << "FAIL line " << cmd.line << ": " << registerName(cmd.reg)
                        << " expected $" << toHex(static_cast<uint8_t>(cmd.value))
                        << " got $" << toHex(actual) << "\n";
                }
                break;
            }
            case Op::Dump:
                out << peripheral.registers().dumpRegisters();
                break;
        }
    }

    return failures;
}
