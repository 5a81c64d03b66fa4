// Cubiq Engine Core
// logger.hpp - Category-based logging over spdlog

#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace cubiq::core {

// Numeric values mirror spdlog::level::level_enum
enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Critical = 5,
    Off = 6
};

// Parse "trace", "debug", "info", "warn", "error", "critical" or "off".
// Unknown names map to fallback.
[[nodiscard]] LogLevel parse_log_level(std::string_view name, LogLevel fallback = LogLevel::Info);

struct LoggerConfig {
    LogLevel console_level = LogLevel::Info;
    LogLevel file_level = LogLevel::Debug;
    std::filesystem::path log_directory;  // Empty = <user data dir>/logs
    std::string log_filename = "cubiq.log";
    std::size_t max_file_size = 5 * 1024 * 1024;
    std::size_t max_files = 3;
    bool enable_file_output = true;
    bool include_timestamps = true;
};

// Process-wide logger. Messages are tagged with a category whose threshold
// can be tuned independently; unconfigured categories use the global level.
// Before initialize() messages go to spdlog's default logger.
class Logger {
public:
    Logger() = delete;

    static void initialize(const LoggerConfig& config = {});
    static void shutdown();
    [[nodiscard]] static bool is_initialized();

    static void set_category_level(std::string_view category, LogLevel level);
    [[nodiscard]] static LogLevel get_category_level(std::string_view category);

    static void set_global_level(LogLevel level);
    [[nodiscard]] static LogLevel get_global_level();

    static void flush();

    template<typename... Args>
    static void log(LogLevel level, std::string_view category,
                    fmt::format_string<Args...> format, Args&&... args) {
        if (!enabled(level, category)) {
            return;
        }
        write(level, category, fmt::format(format, std::forward<Args>(args)...));
    }

private:
    [[nodiscard]] static bool enabled(LogLevel level, std::string_view category);
    static void write(LogLevel level, std::string_view category, const std::string& message);
};

namespace log_category {
    inline constexpr const char* ENGINE = "engine";
    inline constexpr const char* WORLD = "world";
    inline constexpr const char* RENDER = "render";
    inline constexpr const char* IO = "io";
    inline constexpr const char* CONFIG = "config";
}  // namespace log_category

}  // namespace cubiq::core

#define CUBIQ_LOG_AT(level, category, ...) \
    ::cubiq::core::Logger::log(::cubiq::core::LogLevel::level, category, __VA_ARGS__)

#define CUBIQ_LOG_TRACE(category, ...) CUBIQ_LOG_AT(Trace, category, __VA_ARGS__)
#define CUBIQ_LOG_DEBUG(category, ...) CUBIQ_LOG_AT(Debug, category, __VA_ARGS__)
#define CUBIQ_LOG_INFO(category, ...) CUBIQ_LOG_AT(Info, category, __VA_ARGS__)
#define CUBIQ_LOG_WARN(category, ...) CUBIQ_LOG_AT(Warn, category, __VA_ARGS__)
#define CUBIQ_LOG_ERROR(category, ...) CUBIQ_LOG_AT(Error, category, __VA_ARGS__)
#define CUBIQ_LOG_CRITICAL(category, ...) CUBIQ_LOG_AT(Critical, category, __VA_ARGS__)
