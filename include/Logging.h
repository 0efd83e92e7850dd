// Copyright (c) 2025 Christopher Broschard
// All rights reserved.
//
// This source code is provided for personal, educational, and
// non-commercial use only. Redistribution, modification, or use
// of this code in whole or in part for any other purpose is
// strictly prohibited without the prior written consent of the author.
#ifndef LOGGING_H
#define LOGGING_H

#include <array>
#include <cstdint>
#include <ctime>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "Common/LoggingTypes.h"

class Logging
{
public:
    enum class LogLevel : uint8_t { DEBUG = 0, INFO = 1, WARNING = 2, ERROR = 3 };

    // An empty filename sends everything to std::clog instead of a file
    explicit Logging(const std::string& filename,
                     size_t flushThresholdBytes = 64 * 1024,
                     size_t fileBufferBytes     = 256 * 1024);

    ~Logging() noexcept;

    // Treat this as "minimum level to log"
    void setLogLevel(LogLevel minLevel) noexcept;
    inline LogLevel getLogLevel() const noexcept { return minLevel; }
    inline bool wouldLog(LogLevel level) const noexcept
    {
        return static_cast<uint8_t>(level) >= static_cast<uint8_t>(minLevel);
    }

    // Compatibility: logs at INFO
    void WriteLog(const std::string& message) { WriteLog(LogLevel::INFO, message); }

    // Fast path
    void WriteLog(LogLevel level, std::string_view message);

    // Component tagged: "[INFO] [FrameAssembler] ..."
    void WriteLog(LogSet source, LogLevel level, std::string_view message);

    // Forces buffered data to the stream + flush()
    void flush() noexcept;

    void enableTimestamps(bool enabled) noexcept { timestampsEnabled = enabled; }

    inline bool isOpen() const noexcept { return toConsole || logfile.is_open(); }

    // "debug", "info", "warning", "error" (any case)
    static std::optional<LogLevel> parseLevel(const std::string& name);

private:
    void appendTimestamp();
    void appendLine(LogLevel level, std::string_view tag, std::string_view message);
    void writeOut();

    static constexpr std::array<std::string_view, 4> LevelTags = {
        "[DEBUG]", "[INFO]", "[WARNING]", "[ERROR]"
    };

    LogLevel minLevel = LogLevel::INFO;

    bool toConsole = false;
    std::ofstream logfile;

    // Bigger OS/stdio buffer
    std::vector<char> fileIoBuffer;

    // One big accumulation buffer
    std::string outBuffer;
    size_t flushThresholdBytes;

    // Timestamp cache (updates once/sec)
    bool timestampsEnabled = true;
    std::time_t cachedSec = 0;
    char cachedTimestamp[32] = {0}; // e.g. "[2025-12-13 21:03:59]"
};

#endif // LOGGING_H
