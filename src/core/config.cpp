// Cubiq Engine Core
// config.cpp - JSON-backed settings implementation

#include <nlohmann/json.hpp>

#include <cubiq/core/config.hpp>
#include <cubiq/core/logger.hpp>
#include <cubiq/platform/file_io.hpp>

namespace cubiq::core {

using json = nlohmann::json;

namespace {

json::json_pointer pointer_to(std::string_view section, std::string_view key) {
    return json::json_pointer("/" + std::string(section) + "/" + std::string(key));
}

json default_document() {
    return {
        {config_section::WORLD,
         {
             {config_key::SEED, 12345},
             {config_key::POPULATE_ON_START, true},
             {config_key::POPULATION_RADIUS, 3},
             {config_key::WORKER_JOIN_TIMEOUT_MS, 1000},
             {config_key::SAVE_FILE, "world.cwld"},
         }},
        {config_section::RENDER,
         {
             {config_key::STATS_WINDOW_SECONDS, 1.0},
             {config_key::FOV_DEGREES, 70.0},
             {config_key::FRAMES, 240},
         }},
        {config_section::DEBUG, {{config_key::LOG_LEVEL, "info"}}},
    };
}

}  // namespace

struct Config::Impl {
    json document = default_document();
    std::filesystem::path path;
    ChangeCallback on_change;
    bool dirty = true;

    template<typename T>
    T read(std::string_view section, std::string_view key, T fallback) const {
        auto ptr = pointer_to(section, key);
        if (!document.contains(ptr)) {
            return fallback;
        }
        try {
            return document.at(ptr).get<T>();
        } catch (const json::type_error&) {
            return fallback;
        }
    }

    template<typename T>
    void write(std::string_view section, std::string_view key, T&& value) {
        document[pointer_to(section, key)] = std::forward<T>(value);
        dirty = true;
        if (on_change) {
            on_change(section, key);
        }
    }
};

Config::Config() : impl_(std::make_unique<Impl>()) {}

Config::~Config() = default;

Config::Config(Config&&) noexcept = default;
Config& Config::operator=(Config&&) noexcept = default;

bool Config::load(const std::filesystem::path& path) {
    auto text = platform::FileSystem::read_text(path);
    if (!text) {
        CUBIQ_LOG_ERROR(log_category::CONFIG, "Cannot read {}", path.string());
        return false;
    }
    if (!load_from_string(*text)) {
        return false;
    }

    impl_->path = path;
    CUBIQ_LOG_INFO(log_category::CONFIG, "Loaded settings from {}", path.string());
    return true;
}

bool Config::load_from_string(std::string_view content) {
    json parsed = json::parse(content, nullptr, false);
    if (parsed.is_discarded()) {
        CUBIQ_LOG_ERROR(log_category::CONFIG, "Settings are not valid JSON");
        return false;
    }
    if (!parsed.is_object()) {
        CUBIQ_LOG_ERROR(log_category::CONFIG, "Settings root must be an object, got {}", parsed.type_name());
        return false;
    }

    impl_->document = std::move(parsed);
    impl_->dirty = false;
    return true;
}

bool Config::load_or_create_default(const std::filesystem::path& path) {
    if (platform::FileSystem::exists(path)) {
        return load(path);
    }

    set_defaults();
    impl_->path = path;
    if (!save(path)) {
        CUBIQ_LOG_WARN(log_category::CONFIG, "Keeping default settings in memory only");
    }
    return true;
}

bool Config::save(const std::filesystem::path& path) const {
    if (path.has_parent_path() && !platform::FileSystem::create_directories(path.parent_path())) {
        CUBIQ_LOG_ERROR(log_category::CONFIG, "Cannot create {}", path.parent_path().string());
        return false;
    }
    if (!platform::FileSystem::write_text(path, impl_->document.dump(4))) {
        CUBIQ_LOG_ERROR(log_category::CONFIG, "Cannot write {}", path.string());
        return false;
    }

    CUBIQ_LOG_INFO(log_category::CONFIG, "Saved settings to {}", path.string());
    return true;
}

bool Config::save() const {
    if (impl_->path.empty()) {
        CUBIQ_LOG_ERROR(log_category::CONFIG, "Settings have no file to save to");
        return false;
    }
    return save(impl_->path);
}

const std::filesystem::path& Config::get_path() const {
    return impl_->path;
}

int Config::get_int(std::string_view section, std::string_view key, int fallback) const {
    return impl_->read(section, key, fallback);
}

double Config::get_double(std::string_view section, std::string_view key, double fallback) const {
    return impl_->read(section, key, fallback);
}

float Config::get_float(std::string_view section, std::string_view key, float fallback) const {
    return impl_->read(section, key, fallback);
}

bool Config::get_bool(std::string_view section, std::string_view key, bool fallback) const {
    return impl_->read(section, key, fallback);
}

std::string Config::get_string(std::string_view section, std::string_view key, std::string_view fallback) const {
    return impl_->read(section, key, std::string(fallback));
}

void Config::set_int(std::string_view section, std::string_view key, int value) {
    impl_->write(section, key, value);
}

void Config::set_double(std::string_view section, std::string_view key, double value) {
    impl_->write(section, key, value);
}

void Config::set_float(std::string_view section, std::string_view key, float value) {
    impl_->write(section, key, static_cast<double>(value));
}

void Config::set_bool(std::string_view section, std::string_view key, bool value) {
    impl_->write(section, key, value);
}

void Config::set_string(std::string_view section, std::string_view key, std::string_view value) {
    impl_->write(section, key, std::string(value));
}

bool Config::has(std::string_view section, std::string_view key) const {
    return impl_->document.contains(pointer_to(section, key));
}

bool Config::has_section(std::string_view section) const {
    auto it = impl_->document.find(std::string(section));
    return it != impl_->document.end() && it->is_object();
}

bool Config::remove(std::string_view section, std::string_view key) {
    if (!has(section, key)) {
        return false;
    }
    impl_->document[std::string(section)].erase(std::string(key));
    impl_->dirty = true;
    return true;
}

bool Config::remove_section(std::string_view section) {
    if (impl_->document.erase(std::string(section)) == 0) {
        return false;
    }
    impl_->dirty = true;
    return true;
}

void Config::set_change_callback(ChangeCallback callback) {
    impl_->on_change = std::move(callback);
}

bool Config::is_dirty() const {
    return impl_->dirty;
}

void Config::mark_clean() {
    impl_->dirty = false;
}

void Config::set_defaults() {
    impl_->document = default_document();
    impl_->dirty = true;
}

}  // namespace cubiq::core
