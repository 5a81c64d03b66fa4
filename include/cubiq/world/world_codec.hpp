// Cubiq World System
// world_codec.hpp - Binary world stream format
//
// Layout (all fields little-endian):
//   u32 magic        0x444C5257, the bytes "WRLD"
//   i32 seed
//   i32 chunk count
//   repeated chunk count times:
//     i32 index x, i32 index y, i32 index z
//     chunk payload (see Chunk::save_to)

#pragma once

#include "types.hpp"

#include <cstdint>
#include <iosfwd>
#include <stdexcept>
#include <string>
#include <vector>

namespace cubiq::world {

inline constexpr uint32_t WORLD_MAGIC = 0x444C5257;

// Thrown on short reads, failed writes and impossible field values
class SerializationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ============================================================================
// Little-endian primitive I/O over iostreams
// ============================================================================

class BinaryWriter {
public:
    explicit BinaryWriter(std::ostream& stream) : stream_(stream) {}

    void write_u32(uint32_t value);
    void write_i32(int32_t value);
    void write_f32(float value);
    void write_bytes(const uint8_t* data, size_t size);

private:
    std::ostream& stream_;
};

class BinaryReader {
public:
    explicit BinaryReader(std::istream& stream) : stream_(stream) {}

    [[nodiscard]] uint32_t read_u32();
    [[nodiscard]] int32_t read_i32();
    [[nodiscard]] float read_f32();
    [[nodiscard]] std::vector<uint8_t> read_bytes(size_t size);

    // Non-throwing variant; false if fewer than 4 bytes remain
    [[nodiscard]] bool try_read_u32(uint32_t& value);

private:
    void read_exact(uint8_t* out, size_t size);

    std::istream& stream_;
};

// ============================================================================
// World envelope
// ============================================================================

struct WorldHeader {
    int32_t seed = 0;
    int32_t chunk_count = 0;
};

// Writes magic, seed and chunk count
void write_world_header(BinaryWriter& writer, const WorldHeader& header);

// False when the stream is too short or does not start with WORLD_MAGIC. Never throws.
[[nodiscard]] bool read_world_magic(BinaryReader& reader);

// Reads seed and chunk count following the magic. Throws SerializationError.
[[nodiscard]] WorldHeader read_world_header(BinaryReader& reader);

void write_chunk_index(BinaryWriter& writer, const ChunkIndex& index);
[[nodiscard]] ChunkIndex read_chunk_index(BinaryReader& reader);

}  // namespace cubiq::world
