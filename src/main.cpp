// Cubiq - Voxel World Core
// main.cpp - Headless demo host

#include <cubiq/core/config.hpp>
#include <cubiq/core/logger.hpp>
#include <cubiq/platform/file_io.hpp>
#include <cubiq/platform/timer.hpp>
#include <cubiq/rendering/camera.hpp>
#include <cubiq/rendering/effect.hpp>
#include <cubiq/rendering/render_device.hpp>
#include <cubiq/rendering/sprite_sheet.hpp>
#include <cubiq/world/terrain_generator.hpp>
#include <cubiq/world/world.hpp>

#include <algorithm>
#include <cmath>
#include <vector>

namespace {

constexpr const char* VERSION = "0.1.0";
constexpr float ASPECT_RATIO = 16.0f / 9.0f;
constexpr float ORBIT_RADIUS = 40.0f;
constexpr float ORBIT_HEIGHT = 12.0f;
constexpr auto POPULATION_TIMEOUT = std::chrono::seconds(30);

std::vector<cubiq::world::ChunkIndex> sorted_indices(const cubiq::world::World& world) {
    auto indices = world.chunk_indices();
    std::sort(indices.begin(), indices.end(), [](const auto& a, const auto& b) {
        if (a.x != b.x) {
            return a.x < b.x;
        }
        if (a.y != b.y) {
            return a.y < b.y;
        }
        return a.z < b.z;
    });
    return indices;
}

}  // namespace

int main(int argc, char* argv[]) {
    using namespace cubiq;

    // Configuration
    std::filesystem::path config_path = argc > 1
                                            ? std::filesystem::path(argv[1])
                                            : platform::FileSystem::get_user_config_directory() / "config.json";
    core::Config config;
    bool config_ok = config.load_or_create_default(config_path);

    core::LoggerConfig log_config;
    log_config.console_level = core::parse_log_level(
        config.get_string(core::config_section::DEBUG, core::config_key::LOG_LEVEL, "info"));
    core::Logger::initialize(log_config);

    CUBIQ_LOG_INFO(core::log_category::ENGINE, "Cubiq {} starting", VERSION);
    if (!config_ok) {
        CUBIQ_LOG_WARN(core::log_category::CONFIG, "Could not load {}, using defaults", config_path.string());
    }

    // Collaborators
    world::TerrainConfig terrain_config;
    terrain_config.seed = config.get_int(core::config_section::WORLD, core::config_key::SEED, 12345);
    world::TerrainGenerator terrain(terrain_config);

    rendering::HeadlessRenderDevice device;
    rendering::Effect effect("chunk");
    rendering::SpriteSheet sprites(64, 64, 16);

    rendering::CameraConfig camera_config;
    camera_config.fov_degrees =
        config.get_float(core::config_section::RENDER, core::config_key::FOV_DEGREES, camera_config.fov_degrees);
    rendering::Camera camera(camera_config);

    world::WorldConfig world_config = world::WorldConfig::from_config(config);
    int frames = config.get_int(core::config_section::RENDER, core::config_key::FRAMES, 240);

    int exit_code = 0;
    {
        world::World world(device, effect, sprites, terrain, world_config);

        // Orbit the origin while the worker fills the region
        platform::FrameTimer frame_timer;
        frame_timer.set_target_fps(60.0);
        frame_timer.set_frame_limiting_enabled(true);

        for (int frame = 0; frame < frames; ++frame) {
            frame_timer.begin_frame();

            float angle = static_cast<float>(frame) * 0.02f;
            camera.set_position(
                glm::vec3(std::cos(angle) * ORBIT_RADIUS, ORBIT_HEIGHT, std::sin(angle) * ORBIT_RADIUS));
            camera.look_at(glm::vec3(0.0f));
            camera.update_frustum(ASPECT_RATIO);
            effect.set_view_projection(camera.get_view_projection_matrix(ASPECT_RATIO));

            world.draw(frame_timer.get_delta_time(), camera);

            frame_timer.wait_for_target_frame_time();
            frame_timer.end_frame();
        }

        CUBIQ_LOG_INFO(core::log_category::RENDER, "{} frames, avg {:.2f}ms, {} draw calls, {} quads",
                       frame_timer.get_frame_count(), frame_timer.get_average_frame_time(),
                       device.get_draw_call_count(), device.get_quad_count());

        if (!world.wait_for_population(POPULATION_TIMEOUT)) {
            CUBIQ_LOG_WARN(core::log_category::WORLD, "Population still running, saving a partial world");
        }

        // Save, reload and compare
        std::filesystem::path save_path =
            platform::FileSystem::get_user_saves_directory() /
            config.get_string(core::config_section::WORLD, core::config_key::SAVE_FILE, "world.cwld");

        if (!world.save_to_file(save_path)) {
            exit_code = 1;
        } else {
            auto loaded = world::World::load_from_file(save_path, device, effect, sprites, terrain, world_config);
            if (!loaded) {
                CUBIQ_LOG_ERROR(core::log_category::ENGINE, "Reload failed ({}): {}",
                                world::load_error_name(loaded.error), loaded.message);
                exit_code = 1;
            } else if (sorted_indices(*loaded.world) != sorted_indices(world)) {
                CUBIQ_LOG_ERROR(core::log_category::ENGINE, "Reloaded world differs: {} vs {} chunks",
                                loaded.world->chunk_count(), world.chunk_count());
                exit_code = 1;
            } else {
                CUBIQ_LOG_INFO(core::log_category::ENGINE, "Reloaded {} chunks from {}",
                               loaded.world->chunk_count(), save_path.string());
            }

            if (loaded.world && !loaded.world->dispose()) {
                exit_code = 1;
            }
        }

        if (!world.dispose()) {
            exit_code = 1;
        }
    }

    CUBIQ_LOG_INFO(core::log_category::ENGINE, "Cubiq exiting with code {}", exit_code);
    core::Logger::shutdown();
    return exit_code;
}
