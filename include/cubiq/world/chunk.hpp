// Cubiq World System
// chunk.hpp - Fixed-size block volume with its own mesh and binary payload

#pragma once

#include "types.hpp"

#include <cubiq/rendering/frustum.hpp>
#include <cubiq/rendering/render_device.hpp>
#include <iosfwd>
#include <memory>
#include <vector>

namespace cubiq::rendering {
class Effect;
}

namespace cubiq::world {

class World;

// Payload magic, the bytes "CHNK"
inline constexpr uint32_t CHUNK_MAGIC = 0x4B4E4843;

// ============================================================================
// Chunk
// ============================================================================

// Blocks and mesh are built once at construction and never change afterwards,
// so a chunk published in the store can be drawn without further locking.
class Chunk {
public:
    // Generates blocks at position through the world's terrain generator
    Chunk(World& world, const glm::vec3& position);
    ~Chunk();

    Chunk(const Chunk&) = delete;
    Chunk& operator=(const Chunk&) = delete;

    // Payload layout (little-endian):
    //   u32 magic 'CHNK', f32 x3 position, u32 uncompressed size,
    //   u32 compressed size, zlib-compressed blocks
    void save_to(std::ostream& stream) const;

    // Returns nullptr for a payload that is framed correctly but whose content
    // is invalid; the stream is left at the start of the next record.
    // Throws SerializationError when the framing itself cannot be read.
    [[nodiscard]] static std::unique_ptr<Chunk> read_from(std::istream& stream, World& world);

    void draw(const rendering::Effect& effect);

    // Releases the mesh; later draws are no-ops
    void dispose();
    [[nodiscard]] bool is_disposed() const { return disposed_; }

    [[nodiscard]] const glm::vec3& get_position() const { return position_; }
    [[nodiscard]] const rendering::AABB& get_bounds() const { return bounds_; }
    [[nodiscard]] BlockType get_block(const LocalBlockPos& pos) const;

    // Minimum corner of a local block in world space
    [[nodiscard]] glm::vec3 local_to_world(const LocalBlockPos& pos) const { return position_ + glm::vec3(pos); }
    [[nodiscard]] const ChunkBlocks& get_blocks() const { return blocks_; }
    [[nodiscard]] size_t get_quad_count() const { return quads_.size(); }
    [[nodiscard]] bool is_empty() const;

private:
    Chunk(World& world, const glm::vec3& position, const ChunkBlocks& blocks);

    void build_mesh();

    World& world_;
    glm::vec3 position_;
    rendering::AABB bounds_;
    ChunkBlocks blocks_{};
    std::vector<rendering::MeshQuad> quads_;
    bool disposed_ = false;
};

}  // namespace cubiq::world
