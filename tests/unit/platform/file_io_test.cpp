// Prism Platform Tests
// file_io_test.cpp - File I/O unit tests

#include <gtest/gtest.h>
#include <prism/platform/file_io.hpp>

using namespace prism::platform;

class FileIOTest : public ::testing::Test {
protected:
    fs::path test_dir_;
    fs::path test_file_;

    void SetUp() override {
        test_dir_ = FileSystem::get_temp_directory() / "file_io_test";
        FileSystem::create_directories(test_dir_);
        test_file_ = test_dir_ / "basic.vert";
    }

    void TearDown() override {
        FileSystem::remove_all(test_dir_);
    }
};

TEST_F(FileIOTest, GetTempDirectory) {
    auto dir = FileSystem::get_temp_directory();
    EXPECT_FALSE(dir.empty());
    EXPECT_EQ(dir.filename(), "prism");
}

TEST_F(FileIOTest, CreateDirectories) {
    auto nested = test_dir_ / "a" / "b" / "c";
    EXPECT_TRUE(FileSystem::create_directories(nested));
    EXPECT_TRUE(FileSystem::exists(nested));
    EXPECT_FALSE(FileSystem::is_file(nested));
}

TEST_F(FileIOTest, WriteAndReadText) {
    std::string content = "#version 330 core\nvoid main() {}\n";

    EXPECT_TRUE(FileSystem::write_text(test_file_, content));
    EXPECT_TRUE(FileSystem::exists(test_file_));
    EXPECT_TRUE(FileSystem::is_file(test_file_));

    auto result = FileSystem::read_text(test_file_);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, content);
}

TEST_F(FileIOTest, WriteCreatesParentDirectories) {
    auto path = test_dir_ / "lib" / "common.glsl";
    EXPECT_TRUE(FileSystem::write_text(path, "float x;"));
    EXPECT_TRUE(FileSystem::is_file(path));
}

TEST_F(FileIOTest, ReadNonexistentFile) {
    auto result = FileSystem::read_text(test_dir_ / "nonexistent.frag");
    EXPECT_FALSE(result.has_value());
}

TEST_F(FileIOTest, NormalizeCollapsesDotSegments) {
    FileSystem::create_directories(test_dir_ / "lib");
    auto a = FileSystem::normalize(test_dir_ / "lib" / ".." / "lib" / "." / "x.glsl");
    auto b = FileSystem::normalize(test_dir_ / "lib" / "x.glsl");
    EXPECT_EQ(a, b);
}

TEST_F(FileIOTest, MakeAbsolute) {
    EXPECT_TRUE(FileSystem::make_absolute("shaders/basic.vert").is_absolute());
    EXPECT_EQ(FileSystem::make_absolute(test_file_), test_file_);
}

TEST_F(FileIOTest, RemoveAll) {
    FileSystem::write_text(test_dir_ / "x" / "y.glsl", "y");
    EXPECT_TRUE(FileSystem::remove_all(test_dir_ / "x"));
    EXPECT_FALSE(FileSystem::exists(test_dir_ / "x"));
}
