// Copyright (c) 2025 Christopher Broschard
// All rights reserved.
//
// This source code is provided for personal, educational, and
// non-commercial use only. Redistribution, modification, or use
// of this code in whole or in part for any other purpose is
// strictly prohibited without the prior written consent of the author.
#include "StateReader.h"

StateReader::StateReader() :
    pos(0),
    fileVersion(0)
{

}

StateReader::~StateReader() = default;

bool StateReader::loadFromFile(const std::string& path)
{
    std::ifstream f(path, std::ios::binary);
    if (!f) return false;

    f.seekg(0, std::ios::end);
    const std::streamsize len = f.tellg();
    if (len <= 0) return false;
    f.seekg(0, std::ios::beg);

    std::vector<uint8_t> bytes(static_cast<size_t>(len));
    if (!f.read(reinterpret_cast<char*>(bytes.data()), len)) return false;

    return loadFromMemory(std::move(bytes));
}

bool StateReader::loadFromMemory(std::vector<uint8_t> bytes)
{
    buffer = std::move(bytes);
    pos = 0;
    fileVersion = 0;
    return !buffer.empty();
}

bool StateReader::ensure(size_t bytes) const
{
    return (pos + bytes) <= buffer.size();
}

bool StateReader::readFileHeader()
{
    if (!ensure(8)) return false;

    char magic[4];
    if (!readBytes(magic, 4)) return false;

    if (std::memcmp(magic, "SPIS", 4) != 0)
        return false;

    return readU32(fileVersion);
}

bool StateReader::readU8(uint8_t& out)
{
    if (!ensure(1)) return false;
    out = buffer[pos++];
    return true;
}

bool StateReader::readU16(uint16_t& out)
{
    if (!ensure(2)) return false;
    const uint16_t b0 = buffer[pos + 0];
    const uint16_t b1 = buffer[pos + 1];
    out = static_cast<uint16_t>(b0 | (b1 << 8));
    pos += 2;
    return true;
}

bool StateReader::readU32(uint32_t& out)
{
    uint16_t lo = 0;
    uint16_t hi = 0;
    if (!ensure(4)) return false;
    if (!readU16(lo) || !readU16(hi)) return false;
    out = static_cast<uint32_t>(lo) | (static_cast<uint32_t>(hi) << 16);
    return true;
}

bool StateReader::readU64(uint64_t& out)
{
    uint32_t lo = 0;
    uint32_t hi = 0;
    if (!ensure(8)) return false;
    if (!readU32(lo) || !readU32(hi)) return false;
    out = static_cast<uint64_t>(lo) | (static_cast<uint64_t>(hi) << 32);
    return true;
}

bool StateReader::readBool(bool& out)
{
    uint8_t b = 0;
    if (!readU8(b)) return false;
    out = (b != 0);
    return true;
}

bool StateReader::readBytes(void* dst, size_t len)
{
    if (len == 0) return true;
    if (!dst) return false;
    if (!ensure(len)) return false;

    std::memcpy(dst, buffer.data() + pos, len);
    pos += len;
    return true;
}

bool StateReader::nextChunk(Chunk& out)
{
    // Need at least tag(4) + length(4)
    if (!ensure(8)) return false;

    std::memcpy(out.tag, buffer.data() + pos, 4);
    pos += 4;

    uint32_t len = 0;
    if (!readU32(len)) return false;

    if (!ensure(len)) return false; // payload must exist
    out.length = len;
    out.payloadOffset = pos;
    return true;
}

void StateReader::enterChunkPayload(const Chunk& c)
{
    pos = c.payloadOffset;
}

void StateReader::exitChunkPayload(const Chunk& c)
{
    pos = c.payloadOffset + c.length;
}
