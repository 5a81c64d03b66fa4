// Cubiq Engine Core
// logger.cpp - Logging system implementation

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <array>
#include <cubiq/core/logger.hpp>
#include <cubiq/platform/file_io.hpp>
#include <mutex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace cubiq::core {

namespace {

std::mutex g_mutex;
std::shared_ptr<spdlog::logger> g_logger;
LogLevel g_global_level = LogLevel::Info;
std::unordered_map<std::string, LogLevel> g_category_levels;

spdlog::level::level_enum to_spdlog(LogLevel level) {
    return static_cast<spdlog::level::level_enum>(level);
}

std::shared_ptr<spdlog::logger> active_logger() {
    std::lock_guard lock(g_mutex);
    return g_logger ? g_logger : spdlog::default_logger();
}

spdlog::sink_ptr make_console_sink(const LoggerConfig& config) {
    auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    sink->set_level(to_spdlog(config.console_level));
    sink->set_pattern(config.include_timestamps ? "[%H:%M:%S] [%^%l%$] %v" : "[%^%l%$] %v");
    return sink;
}

spdlog::sink_ptr make_file_sink(const LoggerConfig& config, std::filesystem::path& log_path) {
    std::filesystem::path directory = config.log_directory;
    if (directory.empty()) {
        directory = platform::FileSystem::get_user_data_directory() / "logs";
    }
    platform::FileSystem::create_directories(directory);

    log_path = directory / config.log_filename;
    auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        log_path.string(), config.max_file_size, config.max_files);
    sink->set_level(to_spdlog(config.file_level));
    sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
    return sink;
}

}  // namespace

LogLevel parse_log_level(std::string_view name, LogLevel fallback) {
    static constexpr std::array<std::pair<std::string_view, LogLevel>, 8> names = {{
        {"trace", LogLevel::Trace},
        {"debug", LogLevel::Debug},
        {"info", LogLevel::Info},
        {"warn", LogLevel::Warn},
        {"warning", LogLevel::Warn},
        {"error", LogLevel::Error},
        {"critical", LogLevel::Critical},
        {"off", LogLevel::Off},
    }};

    for (const auto& [key, level] : names) {
        if (key == name) {
            return level;
        }
    }
    return fallback;
}

void Logger::initialize(const LoggerConfig& config) {
    std::filesystem::path log_path;

    {
        std::lock_guard lock(g_mutex);
        if (g_logger) {
            return;
        }

        std::vector<spdlog::sink_ptr> sinks{make_console_sink(config)};
        if (config.enable_file_output) {
            try {
                sinks.push_back(make_file_sink(config, log_path));
            } catch (const spdlog::spdlog_ex& ex) {
                spdlog::error("Log file unavailable, console only: {}", ex.what());
                log_path.clear();
            }
        }

        g_logger = std::make_shared<spdlog::logger>("cubiq", sinks.begin(), sinks.end());
        g_logger->set_level(spdlog::level::trace);
        g_logger->flush_on(spdlog::level::info);
        g_global_level = config.console_level;
    }

    CUBIQ_LOG_INFO(log_category::ENGINE, "Logger initialized");
    if (!log_path.empty()) {
        CUBIQ_LOG_INFO(log_category::ENGINE, "Log file: {}", log_path.string());
    }
}

void Logger::shutdown() {
    std::lock_guard lock(g_mutex);
    if (!g_logger) {
        return;
    }

    g_logger->flush();
    g_logger.reset();
    g_category_levels.clear();
    g_global_level = LogLevel::Info;
    spdlog::default_logger()->flush();
}

bool Logger::is_initialized() {
    std::lock_guard lock(g_mutex);
    return g_logger != nullptr;
}

void Logger::set_category_level(std::string_view category, LogLevel level) {
    std::lock_guard lock(g_mutex);
    g_category_levels.insert_or_assign(std::string(category), level);
}

LogLevel Logger::get_category_level(std::string_view category) {
    std::lock_guard lock(g_mutex);
    auto it = g_category_levels.find(std::string(category));
    return it != g_category_levels.end() ? it->second : g_global_level;
}

void Logger::set_global_level(LogLevel level) {
    std::lock_guard lock(g_mutex);
    g_global_level = level;
}

LogLevel Logger::get_global_level() {
    std::lock_guard lock(g_mutex);
    return g_global_level;
}

void Logger::flush() {
    active_logger()->flush();
}

bool Logger::enabled(LogLevel level, std::string_view category) {
    if (level == LogLevel::Off) {
        return false;
    }
    return level >= get_category_level(category);
}

void Logger::write(LogLevel level, std::string_view category, const std::string& message) {
    active_logger()->log(to_spdlog(level), "[{}] {}", category, message);
}

}  // namespace cubiq::core
