// Cubiq World System
// world.cpp - Chunk container, background population, drawing and persistence

#include <atomic>
#include <cubiq/core/config.hpp>
#include <cubiq/core/logger.hpp>
#include <cubiq/platform/file_io.hpp>
#include <cubiq/rendering/camera.hpp>
#include <cubiq/rendering/effect.hpp>
#include <cubiq/rendering/render_device.hpp>
#include <cubiq/rendering/sprite_sheet.hpp>
#include <cubiq/world/chunk.hpp>
#include <cubiq/world/chunk_store.hpp>
#include <cubiq/world/population_worker.hpp>
#include <cubiq/world/terrain_generator.hpp>
#include <cubiq/world/world.hpp>
#include <cubiq/world/world_codec.hpp>
#include <cubiq/world/world_renderer.hpp>
#include <span>
#include <sstream>
#include <utility>

namespace cubiq::world {

// ============================================================================
// WorldConfig
// ============================================================================

WorldConfig WorldConfig::from_config(const core::Config& config) {
    WorldConfig result;

    result.populate_on_start =
        config.get_bool(core::config_section::WORLD, core::config_key::POPULATE_ON_START, result.populate_on_start);

    int radius =
        config.get_int(core::config_section::WORLD, core::config_key::POPULATION_RADIUS, result.population_radius);
    if (radius < 0 || radius > MAX_POPULATION_RADIUS) {
        CUBIQ_LOG_WARN(core::log_category::CONFIG, "Ignoring population radius {} outside [0, {}]", radius,
                       MAX_POPULATION_RADIUS);
    } else {
        result.population_radius = radius;
    }

    int timeout_ms = config.get_int(core::config_section::WORLD, core::config_key::WORKER_JOIN_TIMEOUT_MS,
                                    static_cast<int>(result.worker_join_timeout.count()));
    if (timeout_ms < 0) {
        CUBIQ_LOG_WARN(core::log_category::CONFIG, "Ignoring negative worker join timeout {}ms", timeout_ms);
    } else {
        result.worker_join_timeout = std::chrono::milliseconds(timeout_ms);
    }

    double window = config.get_double(core::config_section::RENDER, core::config_key::STATS_WINDOW_SECONDS,
                                      result.stats_window_seconds);
    if (!(window > 0.0)) {
        CUBIQ_LOG_WARN(core::log_category::CONFIG, "Ignoring non-positive statistics window {}", window);
    } else {
        result.stats_window_seconds = window;
    }

    return result;
}

const char* load_error_name(LoadError error) {
    switch (error) {
        case LoadError::None:
            return "none";
        case LoadError::InvalidFormat:
            return "invalid format";
        case LoadError::Deserialization:
            return "deserialization";
        case LoadError::Io:
            return "io";
    }
    return "unknown";
}

// ============================================================================
// World Implementation
// ============================================================================

struct World::Impl {
    rendering::RenderDevice& device;
    rendering::Effect& effect;
    rendering::SpriteSheet& sprites;
    TerrainGenerator& terrain;
    WorldConfig config;

    ChunkStore store;
    WorldRenderer renderer;

    // Declared after the store so it is destroyed first
    std::unique_ptr<PopulationWorker> worker;

    std::atomic<bool> disposed{false};

    Impl(rendering::RenderDevice& device_, rendering::Effect& effect_, rendering::SpriteSheet& sprites_,
         TerrainGenerator& terrain_, const WorldConfig& config_)
        : device(device_),
          effect(effect_),
          sprites(sprites_),
          terrain(terrain_),
          config(config_),
          renderer(config_.stats_window_seconds) {}
};

World::World(rendering::RenderDevice& device, rendering::Effect& effect, rendering::SpriteSheet& sprites,
             TerrainGenerator& terrain, const WorldConfig& config)
    : impl_(std::make_unique<Impl>(device, effect, sprites, terrain, config)) {
    if (config.populate_on_start) {
        impl_->worker = std::make_unique<PopulationWorker>(config.population_radius,
                                                           [this](const ChunkIndex& index) { create_chunk(index); });
        impl_->worker->start();
        CUBIQ_LOG_DEBUG(core::log_category::WORLD, "World population started (radius {})", config.population_radius);
    }
}

World::~World() {
    if (impl_->disposed) {
        return;
    }
    if (impl_->worker) {
        impl_->worker->request_stop();
        impl_->worker->join();
    }
    impl_->disposed = true;
    impl_->store.dispose_all();
}

// ============================================================================
// Chunk Creation
// ============================================================================

bool World::create_chunk(int32_t x, int32_t y, int32_t z) {
    return create_chunk(ChunkIndex(x, y, z));
}

bool World::create_chunk(const ChunkIndex& index) {
    if (impl_->disposed) {
        return false;
    }

    return impl_->store.insert_if_absent(index, [this, &index]() -> std::unique_ptr<Chunk> {
        // Re-checked under the store lock so nothing lands after dispose_all()
        if (impl_->disposed) {
            return nullptr;
        }
        return std::make_unique<Chunk>(*this, chunk_index_to_world(index));
    });
}

// ============================================================================
// Drawing
// ============================================================================

uint32_t World::draw(double frame_seconds, const rendering::ICameraView& camera) {
    if (impl_->disposed) {
        return 0;
    }
    return impl_->renderer.draw(impl_->store, impl_->effect, camera, frame_seconds);
}

// ============================================================================
// Persistence
// ============================================================================

void World::save_to(std::ostream& stream) const {
    std::ostringstream records(std::ios::binary);
    BinaryWriter record_writer(records);
    int32_t count = 0;

    std::as_const(impl_->store).for_each([&](const ChunkIndex& index, const Chunk& chunk) {
        write_chunk_index(record_writer, index);
        chunk.save_to(records);
        ++count;
    });

    WorldHeader header;
    header.seed = impl_->terrain.get_seed();
    header.chunk_count = count;

    BinaryWriter writer(stream);
    write_world_header(writer, header);
    std::string body = records.str();
    writer.write_bytes(reinterpret_cast<const uint8_t*>(body.data()), body.size());

    CUBIQ_LOG_DEBUG(core::log_category::IO, "Saved world: {} chunks, seed {}", count, header.seed);
}

bool World::save_to_file(const std::filesystem::path& path) const {
    std::ostringstream stream(std::ios::binary);
    try {
        save_to(stream);
    } catch (const SerializationError& e) {
        CUBIQ_LOG_ERROR(core::log_category::IO, "Failed to serialize world: {}", e.what());
        return false;
    }

    std::string bytes = stream.str();
    if (!platform::FileSystem::write_binary(
            path, std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(bytes.data()), bytes.size()))) {
        CUBIQ_LOG_ERROR(core::log_category::IO, "Failed to write world file: {}", path.string());
        return false;
    }

    CUBIQ_LOG_INFO(core::log_category::IO, "Saved world to {} ({} bytes)", path.string(), bytes.size());
    return true;
}

LoadResult World::read_from(std::istream& stream, rendering::RenderDevice& device, rendering::Effect& effect,
                            rendering::SpriteSheet& sprites, TerrainGenerator& terrain, const WorldConfig& config) {
    LoadResult result;
    BinaryReader reader(stream);

    if (!read_world_magic(reader)) {
        CUBIQ_LOG_ERROR(core::log_category::IO, "Encountered invalid world in stream.");
        result.error = LoadError::InvalidFormat;
        result.message = "Encountered invalid world in stream.";
        return result;
    }

    try {
        WorldHeader header = read_world_header(reader);

        WorldConfig load_config = config;
        load_config.populate_on_start = false;
        auto world = std::make_unique<World>(device, effect, sprites, terrain, load_config);

        size_t skipped = 0;
        for (int32_t i = 0; i < header.chunk_count; ++i) {
            ChunkIndex index = read_chunk_index(reader);
            std::unique_ptr<Chunk> chunk = Chunk::read_from(stream, *world);

            if (!chunk) {
                CUBIQ_LOG_WARN(core::log_category::IO, "Skipping unreadable chunk ({}, {}, {})", index.x, index.y,
                               index.z);
                ++skipped;
                continue;
            }

            if (chunk->get_position() != chunk_index_to_world(index)) {
                CUBIQ_LOG_WARN(core::log_category::IO, "Skipping chunk ({}, {}, {}) stored at wrong position", index.x,
                               index.y, index.z);
                chunk->dispose();
                ++skipped;
                continue;
            }

            if (!world->impl_->store.insert(index, chunk)) {
                CUBIQ_LOG_WARN(core::log_category::IO, "Skipping duplicate chunk ({}, {}, {})", index.x, index.y,
                               index.z);
                chunk->dispose();
                ++skipped;
            }
        }

        terrain.set_seed(header.seed);
        CUBIQ_LOG_INFO(core::log_category::IO, "Loaded world: {} chunks, {} skipped, seed {}",
                       world->chunk_count(), skipped, header.seed);

        result.world = std::move(world);
        return result;
    } catch (const std::exception& e) {
        CUBIQ_LOG_ERROR(core::log_category::IO, "Failed to load world.");
        CUBIQ_LOG_ERROR(core::log_category::IO, "-- {}", e.what());
        result.error = LoadError::Deserialization;
        result.message = e.what();
        return result;
    }
}

LoadResult World::load_from_file(const std::filesystem::path& path, rendering::RenderDevice& device,
                                 rendering::Effect& effect, rendering::SpriteSheet& sprites,
                                 TerrainGenerator& terrain, const WorldConfig& config) {
    auto data = platform::FileSystem::read_binary(path);
    if (!data) {
        LoadResult result;
        result.error = LoadError::Io;
        result.message = "Could not read world file: " + path.string();
        CUBIQ_LOG_ERROR(core::log_category::IO, "{}", result.message);
        return result;
    }

    std::istringstream stream(std::string(data->begin(), data->end()), std::ios::binary);
    return read_from(stream, device, effect, sprites, terrain, config);
}

// ============================================================================
// Disposal
// ============================================================================

bool World::dispose() {
    return dispose(impl_->config.worker_join_timeout);
}

bool World::dispose(std::chrono::milliseconds timeout) {
    if (impl_->disposed) {
        return true;
    }

    if (impl_->worker) {
        impl_->worker->request_stop();
        if (!impl_->worker->wait_for(timeout)) {
            CUBIQ_LOG_ERROR(core::log_category::WORLD,
                            "Population worker still running after {}ms; chunks left undisposed", timeout.count());
            return false;
        }
    }

    impl_->disposed = true;
    size_t count = impl_->store.size();
    impl_->store.dispose_all();
    CUBIQ_LOG_DEBUG(core::log_category::WORLD, "World disposed ({} chunks)", count);
    return true;
}

bool World::is_disposed() const {
    return impl_->disposed;
}

// ============================================================================
// Queries
// ============================================================================

size_t World::chunk_count() const {
    return impl_->store.size();
}

bool World::has_chunk(const ChunkIndex& index) const {
    return impl_->store.contains(index);
}

Chunk* World::get_chunk(const ChunkIndex& index) {
    return impl_->store.find(index);
}

const Chunk* World::get_chunk(const ChunkIndex& index) const {
    return std::as_const(impl_->store).find(index);
}

std::vector<ChunkIndex> World::chunk_indices() const {
    return impl_->store.indices();
}

bool World::is_population_complete() const {
    return !impl_->worker || impl_->worker->is_finished();
}

bool World::wait_for_population(std::chrono::milliseconds timeout) {
    return !impl_->worker || impl_->worker->wait_for(timeout);
}

bool World::population_failed() const {
    return impl_->worker && impl_->worker->has_failed();
}

rendering::RenderDevice& World::get_render_device() const {
    return impl_->device;
}

rendering::Effect& World::get_effect() const {
    return impl_->effect;
}

const rendering::SpriteSheet& World::get_sprite_sheet() const {
    return impl_->sprites;
}

TerrainGenerator& World::get_terrain_generator() const {
    return impl_->terrain;
}

const WorldRenderer& World::get_renderer() const {
    return impl_->renderer;
}

const WorldConfig& World::get_config() const {
    return impl_->config;
}

}  // namespace cubiq::world
