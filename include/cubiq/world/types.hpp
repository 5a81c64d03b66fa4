// Cubiq World System
// types.hpp - Chunk addressing, block types and constants

#pragma once

#include <glm/glm.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>

namespace cubiq::world {

// ============================================================================
// Chunk Constants
// ============================================================================

// Blocks along each axis of a chunk
inline constexpr int32_t CHUNK_SIZE = 8;
inline constexpr int32_t CHUNK_VOLUME = CHUNK_SIZE * CHUNK_SIZE * CHUNK_SIZE;

// Distance units covered by one chunk along each axis
inline constexpr float CHUNK_WORLD_SIZE = 8.0f;

// ============================================================================
// Chunk Index
// ============================================================================

// Integer grid coordinate of a chunk, in chunk-size units. Compared and
// hashed by value; no bounds restriction.
using ChunkIndex = glm::ivec3;

// World-space position of the chunk's minimum corner
[[nodiscard]] inline glm::vec3 chunk_index_to_world(const ChunkIndex& index) {
    return glm::vec3(static_cast<float>(index.x) * CHUNK_WORLD_SIZE, static_cast<float>(index.y) * CHUNK_WORLD_SIZE,
                     static_cast<float>(index.z) * CHUNK_WORLD_SIZE);
}

// ============================================================================
// Blocks
// ============================================================================

enum class BlockType : uint8_t {
    Air = 0,
    Stone = 1,
    Dirt = 2,
    Grass = 3,
    Count
};

[[nodiscard]] inline bool is_valid_block(uint8_t raw) {
    return raw < static_cast<uint8_t>(BlockType::Count);
}

using ChunkBlocks = std::array<BlockType, CHUNK_VOLUME>;

using LocalBlockPos = glm::ivec3;

// Y-major layout
[[nodiscard]] inline size_t local_to_index(const LocalBlockPos& pos) {
    return static_cast<size_t>(pos.y * CHUNK_SIZE * CHUNK_SIZE + pos.z * CHUNK_SIZE + pos.x);
}

[[nodiscard]] inline bool is_valid_local(const LocalBlockPos& pos) {
    return pos.x >= 0 && pos.x < CHUNK_SIZE && pos.y >= 0 && pos.y < CHUNK_SIZE && pos.z >= 0 && pos.z < CHUNK_SIZE;
}

// ============================================================================
// Face Directions
// ============================================================================

enum class Direction : uint8_t {
    NegX = 0,  // West
    PosX = 1,  // East
    NegY = 2,  // Down
    PosY = 3,  // Up
    NegZ = 4,  // North
    PosZ = 5,  // South
    Count = 6
};

inline constexpr glm::ivec3 DIRECTION_OFFSETS[6] = {{-1, 0, 0}, {1, 0, 0},  {0, -1, 0},
                                                    {0, 1, 0},  {0, 0, -1}, {0, 0, 1}};

[[nodiscard]] inline glm::ivec3 direction_offset(Direction dir) {
    return DIRECTION_OFFSETS[static_cast<uint8_t>(dir)];
}

}  // namespace cubiq::world

// ============================================================================
// Hash for using chunk indices as map keys
// ============================================================================

namespace std {

template <>
struct hash<cubiq::world::ChunkIndex> {
    size_t operator()(const cubiq::world::ChunkIndex& index) const noexcept {
        size_t h1 = std::hash<int32_t>{}(index.x);
        size_t h2 = std::hash<int32_t>{}(index.y);
        size_t h3 = std::hash<int32_t>{}(index.z);
        size_t result = h1;
        result ^= h2 * 0x9e3779b97f4a7c15ULL + (result << 6) + (result >> 2);
        result ^= h3 * 0x9e3779b97f4a7c15ULL + (result << 6) + (result >> 2);
        return result;
    }
};

}  // namespace std
