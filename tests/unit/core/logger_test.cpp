// Cubiq Core Tests
// logger_test.cpp - Logger facade tests

#include <gtest/gtest.h>

#include <cubiq/core/logger.hpp>
#include <cubiq/platform/file_io.hpp>

#include <filesystem>

namespace cubiq::core {
namespace {

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        log_dir_ = platform::FileSystem::get_temp_directory() / "cubiq_test_logs";
        Logger::shutdown();
    }

    void TearDown() override {
        Logger::shutdown();
        std::filesystem::remove_all(log_dir_);
    }

    LoggerConfig file_config() const {
        LoggerConfig config;
        config.log_directory = log_dir_;
        config.log_filename = "test.log";
        return config;
    }

    std::filesystem::path log_dir_;
};

TEST_F(LoggerTest, ParseLogLevelNames) {
    EXPECT_EQ(parse_log_level("trace"), LogLevel::Trace);
    EXPECT_EQ(parse_log_level("debug"), LogLevel::Debug);
    EXPECT_EQ(parse_log_level("info"), LogLevel::Info);
    EXPECT_EQ(parse_log_level("warn"), LogLevel::Warn);
    EXPECT_EQ(parse_log_level("warning"), LogLevel::Warn);
    EXPECT_EQ(parse_log_level("error"), LogLevel::Error);
    EXPECT_EQ(parse_log_level("critical"), LogLevel::Critical);
    EXPECT_EQ(parse_log_level("off"), LogLevel::Off);
}

TEST_F(LoggerTest, ParseUnknownLevelUsesFallback) {
    EXPECT_EQ(parse_log_level("loud"), LogLevel::Info);
    EXPECT_EQ(parse_log_level("", LogLevel::Error), LogLevel::Error);
}

TEST_F(LoggerTest, LoggingBeforeInitializeIsSafe) {
    ASSERT_FALSE(Logger::is_initialized());
    CUBIQ_LOG_INFO(log_category::WORLD, "pre-init message {}", 1);
    SUCCEED();
}

TEST_F(LoggerTest, InitializeCreatesLogFile) {
    Logger::initialize(file_config());
    ASSERT_TRUE(Logger::is_initialized());

    CUBIQ_LOG_INFO(log_category::IO, "written to file");
    Logger::flush();

    EXPECT_TRUE(std::filesystem::exists(log_dir_ / "test.log"));
}

TEST_F(LoggerTest, InitializeTwiceIsNoOp) {
    Logger::initialize(file_config());
    Logger::set_global_level(LogLevel::Error);
    Logger::initialize(file_config());

    EXPECT_EQ(Logger::get_global_level(), LogLevel::Error);
}

TEST_F(LoggerTest, CategoryLevelOverridesGlobal) {
    LoggerConfig config = file_config();
    config.enable_file_output = false;
    Logger::initialize(config);

    Logger::set_global_level(LogLevel::Warn);
    Logger::set_category_level(log_category::RENDER, LogLevel::Trace);

    EXPECT_EQ(Logger::get_category_level(log_category::RENDER), LogLevel::Trace);
    EXPECT_EQ(Logger::get_category_level(log_category::WORLD), LogLevel::Warn);
}

TEST_F(LoggerTest, ShutdownClearsCategoryLevels) {
    LoggerConfig config = file_config();
    config.enable_file_output = false;
    Logger::initialize(config);
    Logger::set_category_level(log_category::WORLD, LogLevel::Critical);
    Logger::shutdown();

    EXPECT_FALSE(Logger::is_initialized());

    Logger::initialize(config);
    EXPECT_EQ(Logger::get_category_level(log_category::WORLD), config.console_level);
}

}  // namespace
}  // namespace cubiq::core
