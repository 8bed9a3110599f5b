#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "filesystem/virtual_filesystem.hpp"

namespace {

using pysandbox::filesystem::VirtualFilesystem;

class VirtualFilesystemTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = std::filesystem::temp_directory_path() /
                (std::string("pysandbox_vfs_") +
                 ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::remove_all(root_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    std::filesystem::path root_;
};

TEST_F(VirtualFilesystemTest, WriteCreatesParentsAndRoundTrips) {
    VirtualFilesystem vfs;
    const auto path = (root_ / "a" / "b" / "c.txt").string();
    const std::string content("line one\nline two\0with nul", 26);

    const auto written = vfs.WriteFile(path, content);
    ASSERT_TRUE(written.ok) << written.error;

    const auto read = vfs.ReadFile(path);
    ASSERT_TRUE(read.ok) << read.error;
    EXPECT_EQ(read.content, content);
}

TEST_F(VirtualFilesystemTest, RepeatWritesOverwriteInPlace) {
    VirtualFilesystem vfs(root_);
    ASSERT_TRUE(vfs.WriteFile("note.txt", "a much longer first version").ok);
    ASSERT_TRUE(vfs.WriteFile("note.txt", "short").ok);
    EXPECT_EQ(vfs.ReadFile("note.txt").content, "short");
    EXPECT_TRUE(std::filesystem::exists(root_ / "note.txt"));
}

TEST_F(VirtualFilesystemTest, ReadMissingFileNamesThePath) {
    VirtualFilesystem vfs(root_);
    const auto read = vfs.ReadFile("missing.txt");
    EXPECT_FALSE(read.ok);
    EXPECT_EQ(read.error, "Failed to read file missing.txt: no such file or directory");
}

TEST_F(VirtualFilesystemTest, WriteUnderRegularFileFails) {
    VirtualFilesystem vfs(root_);
    ASSERT_TRUE(vfs.WriteFile("blocker", "x").ok);
    const auto written = vfs.WriteFile("blocker/child.txt", "y");
    EXPECT_FALSE(written.ok);
    EXPECT_EQ(written.error.rfind("Failed to write file blocker/child.txt: ", 0), 0u);
}

TEST_F(VirtualFilesystemTest, DirectoriesAreNotFiles) {
    VirtualFilesystem vfs(root_);
    std::filesystem::create_directories(root_ / "dir");
    EXPECT_EQ(vfs.WriteFile("dir", "x").error, "Failed to write file dir: is a directory");
    EXPECT_EQ(vfs.ReadFile("dir").error, "Failed to read file dir: is a directory");
}

TEST_F(VirtualFilesystemTest, EmptyPathIsRejected) {
    VirtualFilesystem vfs(root_);
    EXPECT_FALSE(vfs.WriteFile("", "x").ok);
    EXPECT_FALSE(vfs.ReadFile("").ok);
}

}  // namespace
