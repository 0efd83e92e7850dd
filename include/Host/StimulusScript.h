// Copyright (c) 2025 Christopher Broschard
// All rights reserved.
//
// This source code is provided for personal, educational, and
// non-commercial use only. Redistribution, modification, or use
// of this code in whole or in part for any other purpose is
// strictly prohibited without the prior written consent of the author.
#ifndef STIMULUSSCRIPT_H
#define STIMULUSSCRIPT_H

#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>
#include "Common/RegisterMap.h"

// Forward declarations
class SPIHost;
class SPIPeripheral;

// Line oriented list of bus transactions and register checks.
//
//   reset
//   write  <target> <value>
//   read   <target> <value>
//   frame  <word>
//   abort  <bits> [word]
//   burst  <word> <word> ...
//   idle   <ticks>
//   expect <register> <value>
//   dump
//
// Anything after '#' is a comment.
class StimulusScript
{
    public:
        enum class Op
        {
            Reset,
            Write,
            Read,
            Frame,
            Abort,
            Burst,
            Idle,
            Expect,
            Dump
        };

        struct Command
        {
            Op op;
            size_t line = 0;
            uint32_t target = 0;            // write/read
            uint32_t value = 0;             // payload, word, bit count or ticks
            uint16_t word = 0;              // abort
            RegisterId reg = RegisterId::OutputEnableLow; // expect
            std::vector<uint16_t> words;    // burst
        };

        StimulusScript();
        virtual ~StimulusScript();

        // Both throw std::runtime_error naming the offending line
        void parse(std::istream& in);
        void parseFile(const std::string& path);

        // Returns the number of failed expects
        size_t run(SPIHost& host, SPIPeripheral& peripheral, std::ostream& out) const;

        inline const std::vector<Command>& getCommands() const { return commands; }
        inline bool empty() const { return commands.empty(); }

    protected:

    private:

        std::vector<Command> commands;

        static Command parseLine(const std::vector<std::string>& tokens, size_t line);
};

#endif // STIMULUSSCRIPT_H
