// Copyright (c) 2025 Christopher Broschard
// All rights reserved.
//
// This source code is provided for personal, educational, and
// non-commercial use only. Redistribution, modification, or use
// of this code in whole or in part for any other purpose is
// strictly prohibited without the prior written consent of the author.
#include "StateWriter.h"

StateWriter::StateWriter(uint32_t version) :
    fileVersion(version)
{

}

StateWriter::~StateWriter() = default;

void StateWriter::beginFile()
{
    buffer.clear();
    chunkStack.clear();

    const char magic[4] = { 'S','P','I','S' };
    writeBytes(magic, 4);
    writeU32(fileVersion);
}

bool StateWriter::writeToFile(const std::string& path) const
{
    std::ofstream f(path, std::ios::binary);
    if (!f) return false;
    f.write(reinterpret_cast<const char*>(buffer.data()),
            static_cast<std::streamsize>(buffer.size()));
    return static_cast<bool>(f);
}

void StateWriter::writeU8(uint8_t value)
{
    buffer.push_back(value);
}

void StateWriter::writeU16(uint16_t value)
{
    writeU8(static_cast<uint8_t>(value & 0xFF));
    writeU8(static_cast<uint8_t>((value >> 8) & 0xFF));
}

void StateWriter::writeU32(uint32_t value)
{
    writeU16(static_cast<uint16_t>(value & 0xFFFF));
    writeU16(static_cast<uint16_t>((value >> 16) & 0xFFFF));
}

void StateWriter::writeU64(uint64_t value)
{
    writeU32(static_cast<uint32_t>(value & 0xFFFFFFFF));
    writeU32(static_cast<uint32_t>((value >> 32) & 0xFFFFFFFF));
}

void StateWriter::writeBool(bool value)
{
    writeU8(value ? 1 : 0);
}

void StateWriter::writeBytes(const void* ptr, size_t len)
{
    if (!ptr || len == 0) return;
    const auto* b = reinterpret_cast<const uint8_t*>(ptr);
    buffer.insert(buffer.end(), b, b + len);
}

void StateWriter::patchU32(size_t offset, uint32_t value)
{
    for (size_t i = 0; i < 4; ++i)
        buffer[offset + i] = static_cast<uint8_t>((value >> (8 * i)) & 0xFF);
}

void StateWriter::beginChunk(const char tag[4])
{
    writeBytes(tag, 4);

    // Reserve length (u32) and remember where it is
    const size_t lengthOffset = buffer.size();
    writeU32(0);

    chunkStack.push_back(ChunkFrame{ lengthOffset, buffer.size() });
}

void StateWriter::endChunk()
{
    if (chunkStack.empty())
        return;

    ChunkFrame frame = chunkStack.back();
    chunkStack.pop_back();

    const uint32_t payloadLen = static_cast<uint32_t>(buffer.size() - frame.payloadStartOffset);
    patchU32(frame.lengthFieldOffset, payloadLen);
}
