// Cubiq World System
// terrain_generator.cpp - Height-field terrain using FastNoise2

#include <FastNoise/FastNoise.h>
#include <fmt/format.h>
#include <algorithm>
#include <atomic>
#include <cmath>
#include <cubiq/world/terrain_generator.hpp>
#include <stdexcept>

namespace cubiq::world {

struct TerrainGenerator::Impl {
    TerrainConfig config;
    std::atomic<int32_t> seed{0};

    // FastNoise2 node; GenSingle calls are safe from several threads
    FastNoise::SmartNode<FastNoise::Generator> surface_node;

    void build_nodes() {
        auto simplex = FastNoise::New<FastNoise::Simplex>();
        auto fractal = FastNoise::New<FastNoise::FractalFBm>();
        fractal->SetSource(simplex);
        fractal->SetOctaveCount(config.octaves);
        fractal->SetGain(config.gain);
        fractal->SetLacunarity(config.lacunarity);
        surface_node = fractal;
    }

    [[nodiscard]] float compute_height(float world_x, float world_z) const {
        float noise = surface_node->GenSingle2D(world_x * config.scale, world_z * config.scale, seed.load());
        return config.base_height + noise * config.height_variation;
    }
};

TerrainGenerator::TerrainGenerator(const TerrainConfig& config) : impl_(std::make_unique<Impl>()) {
    impl_->config = config;
    impl_->seed = config.seed;
    impl_->build_nodes();
}

TerrainGenerator::~TerrainGenerator() = default;

TerrainGenerator::TerrainGenerator(TerrainGenerator&&) noexcept = default;
TerrainGenerator& TerrainGenerator::operator=(TerrainGenerator&&) noexcept = default;

void TerrainGenerator::generate(const glm::vec3& chunk_origin, ChunkBlocks& blocks) const {
    // Far beyond any reachable block row, small enough for exact int64 math
    constexpr double HEIGHT_LIMIT = 1e15;

    const auto& config = impl_->config;
    // Chunk origins are whole block coordinates within +/-2^34
    const int64_t base_y = std::llround(chunk_origin.y);

    for (int32_t x = 0; x < CHUNK_SIZE; ++x) {
        for (int32_t z = 0; z < CHUNK_SIZE; ++z) {
            float world_x = chunk_origin.x + static_cast<float>(x);
            float world_z = chunk_origin.z + static_cast<float>(z);
            float height = impl_->compute_height(world_x, world_z);
            if (!std::isfinite(height)) {
                throw std::runtime_error(
                    fmt::format("Terrain height at ({}, {}) is not finite", world_x, world_z));
            }

            auto surface = static_cast<int64_t>(
                std::floor(std::clamp(static_cast<double>(height), -HEIGHT_LIMIT, HEIGHT_LIMIT)));
            int64_t dirt_top = surface - config.dirt_depth;

            for (int32_t y = 0; y < CHUNK_SIZE; ++y) {
                int64_t world_y = base_y + y;

                BlockType block = BlockType::Air;
                if (world_y < dirt_top) {
                    block = BlockType::Stone;
                } else if (world_y < surface) {
                    block = BlockType::Dirt;
                } else if (world_y == surface) {
                    block = BlockType::Grass;
                }

                blocks[local_to_index(LocalBlockPos(x, y, z))] = block;
            }
        }
    }
}

float TerrainGenerator::get_height(float world_x, float world_z) const {
    return impl_->compute_height(world_x, world_z);
}

int32_t TerrainGenerator::get_seed() const {
    return impl_->seed.load();
}

void TerrainGenerator::set_seed(int32_t seed) {
    impl_->seed = seed;
}

const TerrainConfig& TerrainGenerator::get_config() const {
    return impl_->config;
}

}  // namespace cubiq::world
