// Copyright (c) 2025 Christopher Broschard
// All rights reserved.
//
// This source code is provided for personal, educational, and
// non-commercial use only. Redistribution, modification, or use
// of this code in whole or in part for any other purpose is
// strictly prohibited without the prior written consent of the author.
#ifndef LOGGINGTYPES_H_INCLUDED
#define LOGGINGTYPES_H_INCLUDED

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>

// Logging
enum class LogSet { Synchronizer, EdgeDetector, FrameAssembler, Dispatcher, RegisterBank, Host };

inline std::optional<LogSet> stringToLogSet(const std::string& name)
{
    // Convert to lower before checking
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    if (lower == "synchronizer") return LogSet::Synchronizer;
    else if (lower == "edgedetector" || lower == "edge") return LogSet::EdgeDetector;
    else if (lower == "frameassembler" || lower == "frame") return LogSet::FrameAssembler;
    else if (lower == "dispatcher") return LogSet::Dispatcher;
    else if (lower == "registerbank" || lower == "registers") return LogSet::RegisterBank;
    else if (lower == "host") return LogSet::Host;

    return std::nullopt;
}

inline std::string logSetToString(LogSet type)
{
    switch (type)
    {
        case LogSet::Synchronizer: return "Synchronizer";
        case LogSet::EdgeDetector: return "EdgeDetector";
        case LogSet::FrameAssembler: return "FrameAssembler";
        case LogSet::Dispatcher: return "Dispatcher";
        case LogSet::RegisterBank: return "RegisterBank";
        case LogSet::Host: return "Host";
    }

    // Default not found
    return "Unknown";
}

#endif // LOGGINGTYPES_H_INCLUDED
