// Copyright (c) 2025 Christopher Broschard
// All rights reserved.
//
// This source code is provided for personal, educational, and
// non-commercial use only. Redistribution, modification, or use
// of this code in whole or in part for any other purpose is
// strictly prohibited without the prior written consent of the author.
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include "Common/HexFormat.h"
#include "Debug/TraceManager.h"

namespace
{
    struct CatName { TraceManager::TraceCat cat; const char* name; };

    constexpr CatName catNames[] =
    {
        { TraceManager::TraceCat::EDGE,     "edge" },
        { TraceManager::TraceCat::FRAME,    "frame" },
        { TraceManager::TraceCat::DISPATCH, "dispatch" },
        { TraceManager::TraceCat::REGISTER, "register" },
        { TraceManager::TraceCat::RESET,    "reset" }
    };
}

TraceManager::TraceManager() :
    tracing(false),
    cats(0u)
{

}

TraceManager::~TraceManager()
{
    if (file.is_open()) file.close();
}

void TraceManager::enable(bool on)
{
    tracing = on;
}

bool TraceManager::setFileOutput(const std::string& path)
{
    if (file.is_open()) file.close();
    file.open(path, std::ios::out | std::ios::trunc);
    return file.is_open();
}

uint32_t TraceManager::parseCategories(const std::string& list)
{
    uint32_t mask = 0;
    std::istringstream ss(list);
    std::string item;

    while (std::getline(ss, item, ','))
    {
        item.erase(std::remove_if(item.begin(), item.end(), ::isspace), item.end());
        std::transform(item.begin(), item.end(), item.begin(), ::tolower);
        if (item.empty()) continue;

        if (item == "all")
        {
            mask |= ALL_CATEGORIES;
            continue;
        }

        bool found = false;
        for (const auto& entry : catNames)
        {
            if (item == entry.name)
            {
                mask |= catToMask(entry.cat);
                found = true;
                break;
            }
        }

        if (!found)
            throw std::runtime_error("Unknown trace category: " + item);
    }

    return mask;
}

void TraceManager::dumpBuffer(std::ostream& out)
{
    for (auto& line : buffer) out << line << "\n";
    buffer.clear();
}

std::string TraceManager::listCategoryStatus() const
{
    std::ostringstream out;
    out << "Trace " << (isEnabled() ? "ON" : "OFF")
        << "  mask=0x" << std::hex << std::uppercase << std::setw(2)
        << std::setfill('0') << categories() << std::dec << "\n";

    bool first = true;
    for (const auto& entry : catNames)
    {
        if (!first) out << ", ";
        first = false;
        out << entry.name << "=" << (catOn(entry.cat) ? "on" : "off");
    }
    return out.str();
}

void TraceManager::emit(const std::string& line)
{
    if (file.is_open())
        file << line << "\n";
    else
        buffer.push_back(line);
}

void TraceManager::recordEdges(const EdgeEvents& events, const SyncedSignal& synced, Stamp stamp)
{
    if (!tracing || !catOn(TraceCat::EDGE) || !events.any()) return;

    std::stringstream out;
    out << formatStamp(stamp);
    if (events.selectFalling) out << " nCS fall";
    if (events.clockRising) out << " SCLK rise COPI=" << (synced.data ? 1 : 0);

    emit(out.str());
}

void TraceManager::recordFrame(const CompletedFrame& frame, Stamp stamp)
{
    if (!tracing || !catOn(TraceCat::FRAME)) return;

    emit(formatStamp(stamp) + " FRAME $" + toHex(frame.word, 4) + " " + toFrameBits(frame.word));
}

void TraceManager::recordAbort(uint8_t bitsDiscarded, Stamp stamp)
{
    if (!tracing || !catOn(TraceCat::FRAME)) return;

    emit(formatStamp(stamp) + " ABORT after " + std::to_string(bitsDiscarded) + " bits");
}

void TraceManager::recordDispatch(const CompletedFrame& frame, RegisterDispatcher::Outcome outcome, Stamp stamp)
{
    if (!tracing || !catOn(TraceCat::DISPATCH)) return;

    std::stringstream out;
    out << formatStamp(stamp) << " DISPATCH " << RegisterDispatcher::outcomeToString(outcome)
        << " W=" << (frame.opcodeTag() ? 1 : 0)
        << " T=$" << toHex(frame.target(), 2)
        << " D=$" << toHex(frame.payload(), 2);

    emit(out.str());
}

void TraceManager::recordRegisterWrite(RegisterId id, uint8_t oldValue, uint8_t newValue, Stamp stamp)
{
    if (!tracing || !catOn(TraceCat::REGISTER)) return;

    emit(formatStamp(stamp) + " REG " + std::string(registerName(id)) +
         " $" + toHex(oldValue, 2) + " -> $" + toHex(newValue, 2));
}

void TraceManager::recordReset(bool asserted, Stamp stamp)
{
    if (!tracing || !catOn(TraceCat::RESET)) return;

    emit(formatStamp(stamp) + (asserted ? " RESET asserted" : " RESET released"));
}

void TraceManager::recordCustomEvent(const std::string& text)
{
    if (tracing)
        emit(text);
}

std::string TraceManager::formatStamp(const Stamp& stamp) const
{
    return "[" + std::to_string(stamp.tick) + "]";
}

uint32_t TraceManager::catToMask(TraceCat cat)
{
    return static_cast<uint32_t>(cat);
}
