// Cubiq World System
// terrain_generator.hpp - Height-field terrain using FastNoise2

#pragma once

#include "types.hpp"

#include <cstdint>
#include <memory>

namespace cubiq::world {

struct TerrainConfig {
    int32_t seed = 0;

    // Height parameters, in blocks (one block per distance unit)
    float base_height = 0.0f;        // Average surface height
    float height_variation = 12.0f;  // Max deviation from base height

    // Fractal noise shaping the surface
    float scale = 0.02f;
    int octaves = 4;
    float gain = 0.5f;
    float lacunarity = 2.0f;

    int32_t dirt_depth = 3;  // Dirt layer thickness below the grass
};

class TerrainGenerator {
public:
    explicit TerrainGenerator(const TerrainConfig& config = {});
    ~TerrainGenerator();

    // Non-copyable but movable
    TerrainGenerator(const TerrainGenerator&) = delete;
    TerrainGenerator& operator=(const TerrainGenerator&) = delete;
    TerrainGenerator(TerrainGenerator&&) noexcept;
    TerrainGenerator& operator=(TerrainGenerator&&) noexcept;

    /// Fill a chunk whose minimum corner sits at chunk_origin (thread-safe).
    /// Throws std::runtime_error if the configuration yields a non-finite height.
    void generate(const glm::vec3& chunk_origin, ChunkBlocks& blocks) const;

    /// Surface height at world X,Z
    [[nodiscard]] float get_height(float world_x, float world_z) const;

    // The seed may be changed at any time; chunks generated afterwards use it
    [[nodiscard]] int32_t get_seed() const;
    void set_seed(int32_t seed);

    [[nodiscard]] const TerrainConfig& get_config() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace cubiq::world
