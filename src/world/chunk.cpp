// Cubiq World System
// chunk.cpp - Fixed-size block volume with its own mesh and binary payload

#include <cubiq/core/logger.hpp>
#include <cubiq/rendering/effect.hpp>
#include <cubiq/rendering/sprite_sheet.hpp>
#include <cubiq/world/chunk.hpp>
#include <cubiq/world/terrain_generator.hpp>
#include <cubiq/world/world.hpp>
#include <cubiq/world/world_codec.hpp>
#include <fmt/format.h>
#include <istream>
#include <ostream>
#include <zlib.h>

namespace cubiq::world {

namespace {

// Sprite indices in the block atlas
constexpr uint32_t SPRITE_GRASS_TOP = 0;
constexpr uint32_t SPRITE_GRASS_SIDE = 1;
constexpr uint32_t SPRITE_DIRT = 2;
constexpr uint32_t SPRITE_STONE = 3;

uint32_t sprite_for_face(BlockType block, Direction face) {
    switch (block) {
        case BlockType::Grass:
            if (face == Direction::PosY) {
                return SPRITE_GRASS_TOP;
            }
            return face == Direction::NegY ? SPRITE_DIRT : SPRITE_GRASS_SIDE;
        case BlockType::Dirt:
            return SPRITE_DIRT;
        case BlockType::Stone:
        default:
            return SPRITE_STONE;
    }
}

}  // namespace

// ============================================================================
// Construction
// ============================================================================

Chunk::Chunk(World& world, const glm::vec3& position)
    : world_(world), position_(position), bounds_(rendering::AABB::from_cube(position, CHUNK_WORLD_SIZE)) {
    world_.get_terrain_generator().generate(position_, blocks_);
    build_mesh();
}

Chunk::Chunk(World& world, const glm::vec3& position, const ChunkBlocks& blocks)
    : world_(world),
      position_(position),
      bounds_(rendering::AABB::from_cube(position, CHUNK_WORLD_SIZE)),
      blocks_(blocks) {
    build_mesh();
}

Chunk::~Chunk() = default;

void Chunk::build_mesh() {
    const auto& sprites = world_.get_sprite_sheet();
    quads_.clear();

    for (int32_t y = 0; y < CHUNK_SIZE; ++y) {
        for (int32_t z = 0; z < CHUNK_SIZE; ++z) {
            for (int32_t x = 0; x < CHUNK_SIZE; ++x) {
                LocalBlockPos pos(x, y, z);
                BlockType block = blocks_[local_to_index(pos)];
                if (block == BlockType::Air) {
                    continue;
                }

                for (uint8_t d = 0; d < static_cast<uint8_t>(Direction::Count); ++d) {
                    auto dir = static_cast<Direction>(d);
                    LocalBlockPos neighbor = pos + direction_offset(dir);

                    // Faces on the chunk border are always emitted
                    if (is_valid_local(neighbor) && blocks_[local_to_index(neighbor)] != BlockType::Air) {
                        continue;
                    }

                    rendering::MeshQuad quad;
                    quad.origin = local_to_world(pos);
                    quad.face = d;
                    quad.uv = sprites.get_uv(sprite_for_face(block, dir));
                    quads_.push_back(quad);
                }
            }
        }
    }
}

// ============================================================================
// Queries
// ============================================================================

BlockType Chunk::get_block(const LocalBlockPos& pos) const {
    if (!is_valid_local(pos)) {
        return BlockType::Air;
    }
    return blocks_[local_to_index(pos)];
}

bool Chunk::is_empty() const {
    for (BlockType block : blocks_) {
        if (block != BlockType::Air) {
            return false;
        }
    }
    return true;
}

// ============================================================================
// Drawing
// ============================================================================

void Chunk::draw(const rendering::Effect& effect) {
    if (disposed_ || quads_.empty()) {
        return;
    }

    rendering::ChunkDrawCall call;
    call.origin = position_;
    call.bounds = bounds_;
    call.quads = quads_;
    world_.get_render_device().draw_chunk(effect, call);
}

void Chunk::dispose() {
    quads_.clear();
    quads_.shrink_to_fit();
    disposed_ = true;
}

// ============================================================================
// Serialization
// ============================================================================

void Chunk::save_to(std::ostream& stream) const {
    const auto* raw = reinterpret_cast<const Bytef*>(blocks_.data());
    const auto raw_size = static_cast<uLong>(sizeof(ChunkBlocks));

    uLongf compressed_size = compressBound(raw_size);
    std::vector<uint8_t> compressed(compressed_size);
    int result = compress2(compressed.data(), &compressed_size, raw, raw_size, Z_DEFAULT_COMPRESSION);
    if (result != Z_OK) {
        throw SerializationError(fmt::format("zlib compression failed: {}", result));
    }

    BinaryWriter writer(stream);
    writer.write_u32(CHUNK_MAGIC);
    writer.write_f32(position_.x);
    writer.write_f32(position_.y);
    writer.write_f32(position_.z);
    writer.write_u32(static_cast<uint32_t>(raw_size));
    writer.write_u32(static_cast<uint32_t>(compressed_size));
    writer.write_bytes(compressed.data(), compressed_size);
}

std::unique_ptr<Chunk> Chunk::read_from(std::istream& stream, World& world) {
    BinaryReader reader(stream);

    uint32_t magic = reader.read_u32();
    glm::vec3 position;
    position.x = reader.read_f32();
    position.y = reader.read_f32();
    position.z = reader.read_f32();
    uint32_t uncompressed_size = reader.read_u32();
    uint32_t compressed_size = reader.read_u32();

    // A compressed size beyond the zlib bound for a chunk means the record
    // boundary is lost; nothing after it can be trusted.
    if (compressed_size > compressBound(static_cast<uLong>(sizeof(ChunkBlocks)))) {
        throw SerializationError(fmt::format("Chunk payload size out of range: {}", compressed_size));
    }
    std::vector<uint8_t> compressed = reader.read_bytes(compressed_size);

    if (magic != CHUNK_MAGIC) {
        CUBIQ_LOG_WARN(core::log_category::IO, "Chunk payload has bad magic 0x{:08X}", magic);
        return nullptr;
    }
    if (uncompressed_size != sizeof(ChunkBlocks)) {
        CUBIQ_LOG_WARN(core::log_category::IO, "Chunk payload has wrong block count: {}", uncompressed_size);
        return nullptr;
    }

    ChunkBlocks blocks{};
    uLongf dest_size = static_cast<uLongf>(sizeof(ChunkBlocks));
    int result = uncompress(reinterpret_cast<Bytef*>(blocks.data()), &dest_size, compressed.data(),
                            static_cast<uLong>(compressed.size()));
    if (result != Z_OK || dest_size != sizeof(ChunkBlocks)) {
        CUBIQ_LOG_WARN(core::log_category::IO, "zlib decompression of chunk payload failed: {}", result);
        return nullptr;
    }

    for (BlockType block : blocks) {
        if (!is_valid_block(static_cast<uint8_t>(block))) {
            CUBIQ_LOG_WARN(core::log_category::IO, "Chunk payload contains unknown block {}",
                           static_cast<uint32_t>(block));
            return nullptr;
        }
    }

    return std::unique_ptr<Chunk>(new Chunk(world, position, blocks));
}

}  // namespace cubiq::world
