// Cubiq Platform Tests
// file_io_test.cpp - File system helper tests

#include <gtest/gtest.h>
#include <cubiq/platform/file_io.hpp>

#include <string>
#include <vector>

using namespace cubiq::platform;

class FileIOTest : public ::testing::Test {
protected:
    fs::path test_dir_;

    void SetUp() override {
        test_dir_ = FileSystem::get_temp_directory() / "cubiq_test_io";
        FileSystem::create_directories(test_dir_);
    }

    void TearDown() override { FileSystem::remove_all(test_dir_); }
};

TEST_F(FileIOTest, UserDirectoriesAreNamedAfterProject) {
    EXPECT_EQ(FileSystem::get_user_data_directory().filename(), "Cubiq");
    EXPECT_FALSE(FileSystem::get_user_config_directory().empty());
    EXPECT_FALSE(FileSystem::get_user_saves_directory().empty());
    EXPECT_FALSE(FileSystem::get_temp_directory().empty());
}

TEST_F(FileIOTest, WriteBinaryCreatesParents) {
    auto path = test_dir_ / "saves" / "nested" / "world.cwld";
    std::vector<uint8_t> data = {0x57, 0x52, 0x4C, 0x44, 0x00, 0xFF};

    EXPECT_TRUE(FileSystem::write_binary(path, data));

    auto result = FileSystem::read_binary(path);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, data);
}

TEST_F(FileIOTest, WriteAndReadText) {
    auto path = test_dir_ / "config.json";
    std::string content = "{\n  \"world\": {}\n}\n";

    EXPECT_TRUE(FileSystem::write_text(path, content));

    auto result = FileSystem::read_text(path);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, content);
}

TEST_F(FileIOTest, ReadMissingFileReturnsNullopt) {
    EXPECT_FALSE(FileSystem::read_binary(test_dir_ / "missing.cwld").has_value());
    EXPECT_FALSE(FileSystem::read_text(test_dir_ / "missing.json").has_value());
}

TEST_F(FileIOTest, RemoveAllDeletesTree) {
    auto nested = test_dir_ / "a" / "b";
    EXPECT_TRUE(FileSystem::create_directories(nested));
    EXPECT_TRUE(FileSystem::exists(nested));

    EXPECT_TRUE(FileSystem::remove_all(test_dir_ / "a"));
    EXPECT_FALSE(FileSystem::exists(test_dir_ / "a"));
}

TEST_F(FileIOTest, CreateDirectoriesOnExistingDirectorySucceeds) {
    EXPECT_TRUE(FileSystem::create_directories(test_dir_));
    EXPECT_TRUE(FileSystem::create_directories(test_dir_));
}

TEST_F(FileIOTest, WriteTextTruncatesExistingFile) {
    auto path = test_dir_ / "settings.json";
    ASSERT_TRUE(FileSystem::write_text(path, "a much longer first version"));
    ASSERT_TRUE(FileSystem::write_text(path, "short"));

    auto result = FileSystem::read_text(path);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, "short");
}
