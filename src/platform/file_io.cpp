// Cubiq Platform Abstraction Layer
// file_io.cpp - File system implementation

#include <cubiq/platform/file_io.hpp>

#include <spdlog/spdlog.h>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <system_error>

#if defined(CUBIQ_PLATFORM_WINDOWS)
#include <shlobj.h>
#include <windows.h>
#else
#include <pwd.h>
#include <sys/types.h>
#include <unistd.h>
#endif

namespace cubiq::platform {

namespace {

constexpr const char* APP_DIRECTORY = "Cubiq";

// Non-empty environment variable as a path
std::optional<fs::path> env_path(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return fs::path(value);
}

#if !defined(CUBIQ_PLATFORM_WINDOWS)
fs::path home_directory() {
    if (auto home = env_path("HOME")) {
        return *home;
    }
    if (const passwd* entry = getpwuid(getuid())) {
        return fs::path(entry->pw_dir);
    }
    return fs::current_path();
}
#endif

template<typename Container>
std::optional<Container> slurp(const fs::path& path, std::ios::openmode mode) {
    std::ifstream in(path, mode);
    if (!in) {
        spdlog::warn("Cannot open {} for reading", path.string());
        return std::nullopt;
    }

    Container content{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    if (in.bad()) {
        spdlog::warn("Read error on {}", path.string());
        return std::nullopt;
    }
    return content;
}

bool spill(const fs::path& path, const char* data, std::size_t size, std::ios::openmode mode) {
    if (path.has_parent_path() && !FileSystem::create_directories(path.parent_path())) {
        return false;
    }

    std::ofstream out(path, mode | std::ios::trunc);
    if (!out) {
        spdlog::warn("Cannot open {} for writing", path.string());
        return false;
    }

    out.write(data, static_cast<std::streamsize>(size));
    out.flush();
    if (!out) {
        spdlog::warn("Write error on {}", path.string());
        return false;
    }
    return true;
}

}  // namespace

fs::path FileSystem::get_user_data_directory() {
#if defined(CUBIQ_PLATFORM_WINDOWS)
    wchar_t* known = nullptr;
    fs::path result = fs::current_path() / "data";
    if (SUCCEEDED(SHGetKnownFolderPath(FOLDERID_LocalAppData, 0, nullptr, &known))) {
        result = fs::path(known) / APP_DIRECTORY;
    }
    CoTaskMemFree(known);
    return result;
#elif defined(CUBIQ_PLATFORM_MACOS)
    return home_directory() / "Library" / "Application Support" / APP_DIRECTORY;
#else
    return env_path("XDG_DATA_HOME").value_or(home_directory() / ".local" / "share") / APP_DIRECTORY;
#endif
}

fs::path FileSystem::get_user_config_directory() {
#if defined(CUBIQ_PLATFORM_WINDOWS)
    return get_user_data_directory() / "config";
#elif defined(CUBIQ_PLATFORM_MACOS)
    return get_user_data_directory();
#else
    return env_path("XDG_CONFIG_HOME").value_or(home_directory() / ".config") / APP_DIRECTORY;
#endif
}

fs::path FileSystem::get_user_saves_directory() {
    return get_user_data_directory() / "saves";
}

fs::path FileSystem::get_temp_directory() {
    std::error_code ec;
    fs::path base = fs::temp_directory_path(ec);
    if (ec) {
        base = fs::current_path() / "tmp";
    }
    return base / APP_DIRECTORY;
}

std::optional<std::vector<uint8_t>> FileSystem::read_binary(const fs::path& path) {
    return slurp<std::vector<uint8_t>>(path, std::ios::binary);
}

std::optional<std::string> FileSystem::read_text(const fs::path& path) {
    return slurp<std::string>(path, std::ios::in);
}

bool FileSystem::write_binary(const fs::path& path, std::span<const uint8_t> data) {
    return spill(path, reinterpret_cast<const char*>(data.data()), data.size(), std::ios::binary);
}

bool FileSystem::write_text(const fs::path& path, std::string_view content) {
    return spill(path, content.data(), content.size(), std::ios::out);
}

bool FileSystem::create_directories(const fs::path& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) {
        spdlog::error("Cannot create directory {}: {}", path.string(), ec.message());
        return false;
    }
    return true;
}

bool FileSystem::exists(const fs::path& path) {
    std::error_code ec;
    bool found = fs::exists(path, ec);
    if (ec) {
        spdlog::warn("Cannot stat {}: {}", path.string(), ec.message());
        return false;
    }
    return found;
}

bool FileSystem::remove_all(const fs::path& path) {
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec) {
        spdlog::error("Cannot remove {}: {}", path.string(), ec.message());
        return false;
    }
    return true;
}

}  // namespace cubiq::platform
