// Cubiq World System
// world.hpp - Chunk container, background population, drawing and persistence

#pragma once

#include "types.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

namespace cubiq::core {
class Config;
}

namespace cubiq::rendering {
class Effect;
class ICameraView;
class RenderDevice;
class SpriteSheet;
}  // namespace cubiq::rendering

namespace cubiq::world {

class Chunk;
class TerrainGenerator;
class WorldRenderer;

struct WorldConfig {
    bool populate_on_start = true;
    int32_t population_radius = 3;
    std::chrono::milliseconds worker_join_timeout{1000};
    double stats_window_seconds = 1.0;

    // Reads the "world" and "render" sections; out-of-range values fall back to defaults
    [[nodiscard]] static WorldConfig from_config(const core::Config& config);
};

enum class LoadError : uint8_t {
    None = 0,
    InvalidFormat,    // Stream does not start with the world magic
    Deserialization,  // Envelope or chunk framing could not be read
    Io                // File could not be read
};

[[nodiscard]] const char* load_error_name(LoadError error);

class World;

struct LoadResult {
    LoadError error = LoadError::None;
    std::string message;
    std::unique_ptr<World> world;

    [[nodiscard]] bool ok() const { return error == LoadError::None && world != nullptr; }
    explicit operator bool() const { return ok(); }
};

// ============================================================================
// World
// ============================================================================

// Owns the chunk store exclusively. The render device, effect, sprite sheet and
// terrain generator are borrowed and must outlive the world.
class World {
public:
    // Starts background population when config.populate_on_start is set.
    // The world is usable immediately.
    World(rendering::RenderDevice& device, rendering::Effect& effect, rendering::SpriteSheet& sprites,
          TerrainGenerator& terrain, const WorldConfig& config = {});

    // Stops and joins the population worker, then disposes all chunks
    ~World();

    World(const World&) = delete;
    World& operator=(const World&) = delete;
    World(World&&) = delete;
    World& operator=(World&&) = delete;

    /// Creates the chunk at (x*8, y*8, z*8) unless the index is taken.
    /// Safe from any thread. Returns true if a chunk was inserted.
    bool create_chunk(int32_t x, int32_t y, int32_t z);
    bool create_chunk(const ChunkIndex& index);

    /// Draws visible chunks and feeds the rolling statistics.
    /// Returns the number of chunks drawn by this call.
    uint32_t draw(double frame_seconds, const rendering::ICameraView& camera);

    /// Writes the world stream. The store stays locked until every chunk is
    /// written. Throws SerializationError if the stream fails.
    void save_to(std::ostream& stream) const;
    bool save_to_file(const std::filesystem::path& path) const;

    /// Builds a world from a stream. Never throws; failures are logged and
    /// reported through LoadResult. The terrain seed is only updated on
    /// success. Loaded worlds do not start population.
    [[nodiscard]] static LoadResult read_from(std::istream& stream, rendering::RenderDevice& device,
                                              rendering::Effect& effect, rendering::SpriteSheet& sprites,
                                              TerrainGenerator& terrain, const WorldConfig& config = {});
    [[nodiscard]] static LoadResult load_from_file(const std::filesystem::path& path, rendering::RenderDevice& device,
                                                   rendering::Effect& effect, rendering::SpriteSheet& sprites,
                                                   TerrainGenerator& terrain, const WorldConfig& config = {});

    /// Cancels population and waits up to the timeout for the worker. On
    /// timeout nothing is disposed and false is returned; call again later.
    bool dispose();
    bool dispose(std::chrono::milliseconds timeout);
    [[nodiscard]] bool is_disposed() const;

    // Chunk queries
    [[nodiscard]] size_t chunk_count() const;
    [[nodiscard]] bool has_chunk(const ChunkIndex& index) const;
    [[nodiscard]] Chunk* get_chunk(const ChunkIndex& index);
    [[nodiscard]] const Chunk* get_chunk(const ChunkIndex& index) const;
    [[nodiscard]] std::vector<ChunkIndex> chunk_indices() const;

    // Population state
    [[nodiscard]] bool is_population_complete() const;
    [[nodiscard]] bool wait_for_population(std::chrono::milliseconds timeout);
    [[nodiscard]] bool population_failed() const;

    // Collaborators
    [[nodiscard]] rendering::RenderDevice& get_render_device() const;
    [[nodiscard]] rendering::Effect& get_effect() const;
    [[nodiscard]] const rendering::SpriteSheet& get_sprite_sheet() const;
    [[nodiscard]] TerrainGenerator& get_terrain_generator() const;
    [[nodiscard]] const WorldRenderer& get_renderer() const;
    [[nodiscard]] const WorldConfig& get_config() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace cubiq::world
