// Cubiq Engine Core
// config.hpp - JSON-backed settings with section/key addressing

#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace cubiq::core {

// Settings document of the form { "<section>": { "<key>": value } }.
// Getters never throw: a missing key or a value of the wrong JSON type
// yields the supplied fallback.
class Config {
public:
    using ChangeCallback = std::function<void(std::string_view section, std::string_view key)>;

    Config();
    ~Config();

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;
    Config(Config&&) noexcept;
    Config& operator=(Config&&) noexcept;

    bool load(const std::filesystem::path& path);
    bool load_from_string(std::string_view content);
    bool load_or_create_default(const std::filesystem::path& path);
    bool save(const std::filesystem::path& path) const;
    bool save() const;

    [[nodiscard]] const std::filesystem::path& get_path() const;

    [[nodiscard]] int get_int(std::string_view section, std::string_view key, int fallback = 0) const;
    [[nodiscard]] double get_double(std::string_view section, std::string_view key, double fallback = 0.0) const;
    [[nodiscard]] float get_float(std::string_view section, std::string_view key, float fallback = 0.0f) const;
    [[nodiscard]] bool get_bool(std::string_view section, std::string_view key, bool fallback = false) const;
    [[nodiscard]] std::string get_string(std::string_view section, std::string_view key,
                                         std::string_view fallback = {}) const;

    void set_int(std::string_view section, std::string_view key, int value);
    void set_double(std::string_view section, std::string_view key, double value);
    void set_float(std::string_view section, std::string_view key, float value);
    void set_bool(std::string_view section, std::string_view key, bool value);
    void set_string(std::string_view section, std::string_view key, std::string_view value);

    [[nodiscard]] bool has(std::string_view section, std::string_view key) const;
    [[nodiscard]] bool has_section(std::string_view section) const;
    bool remove(std::string_view section, std::string_view key);
    bool remove_section(std::string_view section);

    // Invoked after every successful set_*
    void set_change_callback(ChangeCallback callback);

    [[nodiscard]] bool is_dirty() const;
    void mark_clean();

    // Replace the document with the built-in world/render/debug settings
    void set_defaults();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

namespace config_section {
    inline constexpr const char* WORLD = "world";
    inline constexpr const char* RENDER = "render";
    inline constexpr const char* DEBUG = "debug";
}  // namespace config_section

namespace config_key {
    // world
    inline constexpr const char* SEED = "seed";
    inline constexpr const char* POPULATE_ON_START = "populate_on_start";
    inline constexpr const char* POPULATION_RADIUS = "population_radius";
    inline constexpr const char* WORKER_JOIN_TIMEOUT_MS = "worker_join_timeout_ms";
    inline constexpr const char* SAVE_FILE = "save_file";

    // render
    inline constexpr const char* STATS_WINDOW_SECONDS = "stats_window_seconds";
    inline constexpr const char* FOV_DEGREES = "fov_degrees";
    inline constexpr const char* FRAMES = "frames";

    // debug
    inline constexpr const char* LOG_LEVEL = "log_level";
}  // namespace config_key

}  // namespace cubiq::core
