/**
 * @file test_remote_path.cpp
 * @brief Unit tests for forward-slash remote path helpers
 */

#include <gtest/gtest.h>

#include <kcenon/file_ripper/core/remote_path.h>

namespace kcenon::file_ripper::test {

class RemotePathTest : public ::testing::Test {};

TEST_F(RemotePathTest, CleanCollapsesAndResolves) {
    EXPECT_EQ(remote_path::clean(""), ".");
    EXPECT_EQ(remote_path::clean("."), ".");
    EXPECT_EQ(remote_path::clean("a//b/./c/"), "a/b/c");
    EXPECT_EQ(remote_path::clean("a/b/../c"), "a/c");
    EXPECT_EQ(remote_path::clean("../x"), "../x");
    EXPECT_EQ(remote_path::clean("/../x"), "/x");
    EXPECT_EQ(remote_path::clean("/"), "/");
    EXPECT_EQ(remote_path::clean("a/.."), ".");
}

TEST_F(RemotePathTest, Join) {
    EXPECT_EQ(remote_path::join("backup", "photos/a.jpg"), "backup/photos/a.jpg");
    EXPECT_EQ(remote_path::join("backup/", "/photos"), "backup/photos");
    EXPECT_EQ(remote_path::join("", "photos"), "photos");
    EXPECT_EQ(remote_path::join(".", "photos"), "photos");
    EXPECT_EQ(remote_path::join("/", "photos"), "/photos");
}

TEST_F(RemotePathTest, BaseNameAndParent) {
    EXPECT_EQ(remote_path::base_name("a/b/c.txt"), "c.txt");
    EXPECT_EQ(remote_path::base_name("a/b/"), "b");
    EXPECT_EQ(remote_path::base_name("c.txt"), "c.txt");
    EXPECT_EQ(remote_path::base_name("/"), "/");

    EXPECT_EQ(remote_path::parent("a/b/c.txt"), "a/b");
    EXPECT_EQ(remote_path::parent("c.txt"), ".");
    EXPECT_EQ(remote_path::parent("/c.txt"), "/");
}

TEST_F(RemotePathTest, Relative) {
    EXPECT_EQ(remote_path::relative("data", "data/x/y.bin"), "x/y.bin");
    EXPECT_EQ(remote_path::relative("data", "data"), ".");
    EXPECT_EQ(remote_path::relative("/", "/etc/hosts"), "etc/hosts");
    EXPECT_EQ(remote_path::relative(".", "logs/a.log"), "logs/a.log");
    // Sibling with a common prefix is not below base
    EXPECT_EQ(remote_path::relative("data", "database/z"), "database/z");
}

TEST_F(RemotePathTest, ToSlashAndBareName) {
    EXPECT_EQ(remote_path::to_slash(std::filesystem::path("photos") / "2024" / "a.jpg"),
              "photos/2024/a.jpg");

    EXPECT_TRUE(remote_path::is_bare_name("report.pdf"));
    EXPECT_TRUE(remote_path::is_bare_name("."));
    EXPECT_FALSE(remote_path::is_bare_name("docs/report.pdf"));
    EXPECT_FALSE(remote_path::is_bare_name("/report.pdf"));
}

}  // namespace kcenon::file_ripper::test
