// Cubiq Platform Abstraction Layer
// file_io.hpp - Whole-file reads/writes and per-user directories

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace cubiq::platform {

namespace fs = std::filesystem;

// Failures are logged and reported through the return value, never thrown.
class FileSystem {
public:
    FileSystem() = delete;

    // Linux: $XDG_DATA_HOME/Cubiq, falling back to ~/.local/share/Cubiq
    static fs::path get_user_data_directory();
    // Linux: $XDG_CONFIG_HOME/Cubiq, falling back to ~/.config/Cubiq
    static fs::path get_user_config_directory();
    static fs::path get_user_saves_directory();
    static fs::path get_temp_directory();

    static std::optional<std::vector<uint8_t>> read_binary(const fs::path& path);
    static std::optional<std::string> read_text(const fs::path& path);

    // Parent directories are created as needed; existing files are truncated
    static bool write_binary(const fs::path& path, std::span<const uint8_t> data);
    static bool write_text(const fs::path& path, std::string_view content);

    // True when the directory exists afterwards
    static bool create_directories(const fs::path& path);
    static bool exists(const fs::path& path);
    static bool remove_all(const fs::path& path);
};

}  // namespace cubiq::platform
