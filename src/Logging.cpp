// Copyright (c) 2025 Christopher Broschard
// All rights reserved.
//
// This source code is provided for personal, educational, and
// non-commercial use only. Redistribution, modification, or use
// of this code in whole or in part for any other purpose is
// strictly prohibited without the prior written consent of the author.
#include "Logging.h"

#include <algorithm>
#include <cctype>
#include <iostream>

#if defined(_WIN32)
  #include <time.h> // localtime_s
#endif

Logging::Logging(const std::string& filename,
                 size_t flushThresholdBytes_,
                 size_t fileBufferBytes)
    : flushThresholdBytes(flushThresholdBytes_)
{
    if (filename.empty())
    {
        toConsole = true;
    }
    else
    {
        // Give the filebuf a larger buffer to reduce kernel writes. Must happen before open().
        fileIoBuffer.resize(fileBufferBytes);
        logfile.rdbuf()->pubsetbuf(fileIoBuffer.data(),
                                   static_cast<std::streamsize>(fileIoBuffer.size()));

        logfile.open(filename, std::ios::app | std::ios::binary);
        if (!logfile.is_open())
        {
            std::cerr << "Unable to open log file " << filename << "\n";
            return;
        }
    }

    outBuffer.reserve(flushThresholdBytes + 1024);
}

Logging::~Logging() noexcept
{
    flush();
    if (logfile.is_open())
        logfile.close();
}

void Logging::setLogLevel(LogLevel level) noexcept
{
    minLevel = level;
}

std::optional<Logging::LogLevel> Logging::parseLevel(const std::string& name)
{
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warning" || lower == "warn") return LogLevel::WARNING;
    if (lower == "error") return LogLevel::ERROR;
    return std::nullopt;
}

void Logging::appendTimestamp()
{
    if (!timestampsEnabled)
        return;

    const std::time_t now = std::time(nullptr);
    if (now == cachedSec && cachedTimestamp[0] != '\0')
        return;

    cachedSec = now;

    std::tm tmLocal{};
#if defined(_WIN32)
    localtime_s(&tmLocal, &now);
#else
    localtime_r(&now, &tmLocal);
#endif

    // Produces: [YYYY-mm-dd HH:MM:SS]
    std::strftime(cachedTimestamp, sizeof(cachedTimestamp),
                  "[%Y-%m-%d %H:%M:%S]", &tmLocal);
}

void Logging::WriteLog(LogLevel level, std::string_view message)
{
    appendLine(level, {}, message);
}

void Logging::WriteLog(LogSet source, LogLevel level, std::string_view message)
{
    if (!isOpen() || !wouldLog(level))
        return;

    const std::string tag = "[" + logSetToString(source) + "]";
    appendLine(level, tag, message);
}

void Logging::appendLine(LogLevel level, std::string_view tag, std::string_view message)
{
    if (!isOpen())
        return;

    // Fast reject before doing any work
    if (!wouldLog(level))
        return;

    appendTimestamp();

    outBuffer.reserve(outBuffer.size() + message.size() + tag.size() + 64);

    if (timestampsEnabled)
        outBuffer.append(cachedTimestamp);

    outBuffer.append(LevelTags[static_cast<size_t>(level)]);
    outBuffer.push_back(' ');
    if (!tag.empty())
    {
        outBuffer.append(tag.data(), tag.size());
        outBuffer.push_back(' ');
    }
    outBuffer.append(message.data(), message.size());
    outBuffer.push_back('\n');

    if (outBuffer.size() >= flushThresholdBytes)
        writeOut();
}

void Logging::writeOut()
{
    if (outBuffer.empty())
        return;

    if (toConsole)
        std::clog.write(outBuffer.data(), static_cast<std::streamsize>(outBuffer.size()));
    else
        logfile.write(outBuffer.data(), static_cast<std::streamsize>(outBuffer.size()));

    outBuffer.clear(); // keeps capacity
}

void Logging::flush() noexcept
{
    try
    {
        if (!isOpen())
            return;

        writeOut();

        if (toConsole)
            std::clog.flush();
        else
            logfile.flush();
    }
    catch (const std::exception& e)
    {
        std::cerr << "Log flush failed: " << e.what() << "\n";
    }
}
