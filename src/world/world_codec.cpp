// Cubiq World System
// world_codec.cpp - Binary world stream format

#include <bit>
#include <cubiq/world/world_codec.hpp>
#include <fmt/format.h>
#include <istream>
#include <ostream>

namespace cubiq::world {

// ============================================================================
// BinaryWriter
// ============================================================================

void BinaryWriter::write_u32(uint32_t value) {
    const uint8_t bytes[4] = {static_cast<uint8_t>(value & 0xFF), static_cast<uint8_t>((value >> 8) & 0xFF),
                              static_cast<uint8_t>((value >> 16) & 0xFF), static_cast<uint8_t>((value >> 24) & 0xFF)};
    write_bytes(bytes, sizeof(bytes));
}

void BinaryWriter::write_i32(int32_t value) {
    write_u32(static_cast<uint32_t>(value));
}

void BinaryWriter::write_f32(float value) {
    write_u32(std::bit_cast<uint32_t>(value));
}

void BinaryWriter::write_bytes(const uint8_t* data, size_t size) {
    if (size == 0) {
        return;
    }
    stream_.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
    if (!stream_) {
        throw SerializationError(fmt::format("Failed to write {} bytes", size));
    }
}

// ============================================================================
// BinaryReader
// ============================================================================

void BinaryReader::read_exact(uint8_t* out, size_t size) {
    if (size == 0) {
        return;
    }
    stream_.read(reinterpret_cast<char*>(out), static_cast<std::streamsize>(size));
    if (stream_.gcount() != static_cast<std::streamsize>(size)) {
        throw SerializationError(
            fmt::format("Unexpected end of stream: wanted {} bytes, got {}", size, stream_.gcount()));
    }
}

uint32_t BinaryReader::read_u32() {
    uint8_t bytes[4];
    read_exact(bytes, sizeof(bytes));
    return static_cast<uint32_t>(bytes[0]) | (static_cast<uint32_t>(bytes[1]) << 8) |
           (static_cast<uint32_t>(bytes[2]) << 16) | (static_cast<uint32_t>(bytes[3]) << 24);
}

int32_t BinaryReader::read_i32() {
    return static_cast<int32_t>(read_u32());
}

float BinaryReader::read_f32() {
    return std::bit_cast<float>(read_u32());
}

std::vector<uint8_t> BinaryReader::read_bytes(size_t size) {
    std::vector<uint8_t> data(size);
    read_exact(data.data(), size);
    return data;
}

bool BinaryReader::try_read_u32(uint32_t& value) {
    uint8_t bytes[4];
    stream_.read(reinterpret_cast<char*>(bytes), sizeof(bytes));
    if (stream_.gcount() != static_cast<std::streamsize>(sizeof(bytes))) {
        return false;
    }
    value = static_cast<uint32_t>(bytes[0]) | (static_cast<uint32_t>(bytes[1]) << 8) |
            (static_cast<uint32_t>(bytes[2]) << 16) | (static_cast<uint32_t>(bytes[3]) << 24);
    return true;
}

// ============================================================================
// World envelope
// ============================================================================

void write_world_header(BinaryWriter& writer, const WorldHeader& header) {
    writer.write_u32(WORLD_MAGIC);
    writer.write_i32(header.seed);
    writer.write_i32(header.chunk_count);
}

bool read_world_magic(BinaryReader& reader) {
    uint32_t magic = 0;
    return reader.try_read_u32(magic) && magic == WORLD_MAGIC;
}

WorldHeader read_world_header(BinaryReader& reader) {
    WorldHeader header;
    header.seed = reader.read_i32();
    header.chunk_count = reader.read_i32();
    if (header.chunk_count < 0) {
        throw SerializationError(fmt::format("Invalid chunk count: {}", header.chunk_count));
    }
    return header;
}

void write_chunk_index(BinaryWriter& writer, const ChunkIndex& index) {
    writer.write_i32(index.x);
    writer.write_i32(index.y);
    writer.write_i32(index.z);
}

ChunkIndex read_chunk_index(BinaryReader& reader) {
    ChunkIndex index;
    index.x = reader.read_i32();
    index.y = reader.read_i32();
    index.z = reader.read_i32();
    return index;
}

}  // namespace cubiq::world
