/**
 * @file test_local_scanner.cpp
 * @brief Unit tests for the upload-side source walk
 */

#include <gtest/gtest.h>

#include "integration/test_fixtures.h"

#include <kcenon/file_ripper/engine/local_scanner.h>

#include <atomic>
#include <string>
#include <vector>

namespace kcenon::file_ripper::test {

class LocalScannerTest : public TempDirectoryFixture {
protected:
    static auto remote_paths(const scan_result& scan) -> std::vector<std::string> {
        std::vector<std::string> paths;
        for (const auto& job : scan.files) {
            paths.push_back(job.remote_path);
        }
        return paths;
    }
};

TEST_F(LocalScannerTest, MapsTreeBelowDestination) {
    create_source_file("photos/a.jpg", 100);
    create_source_file("photos/b.jpg", 200);
    create_source_file("photos/2024/c.jpg", 300);

    local_scanner scanner;
    auto scanned = scanner.scan(source_dir_ / "photos", "backup");

    ASSERT_TRUE(scanned.has_value()) << scanned.error().message;
    const auto& scan = scanned.value();
    EXPECT_EQ(scan.directories,
              (std::vector<std::string>{"backup/photos", "backup/photos/2024"}));
    EXPECT_EQ(remote_paths(scan),
              (std::vector<std::string>{"backup/photos/2024/c.jpg", "backup/photos/a.jpg",
                                        "backup/photos/b.jpg"}));
    EXPECT_EQ(scan.total_bytes, 600u);
    EXPECT_TRUE(scan.issues.empty());
    for (const auto& job : scan.files) {
        EXPECT_EQ(job.direction, transfer_direction::upload);
        EXPECT_TRUE(job.local_path.is_absolute());
    }
}

TEST_F(LocalScannerTest, RelativeSourceAndTrailingSlash) {
    create_source_file("docs/readme.md", 10);

    auto cwd = std::filesystem::current_path();
    std::filesystem::current_path(source_dir_);
    local_scanner scanner;
    auto scanned = scanner.scan("docs/", "dest");
    std::filesystem::current_path(cwd);

    ASSERT_TRUE(scanned.has_value());
    EXPECT_TRUE(std::filesystem::equivalent(scanned.value().source, source_dir_ / "docs"));
    EXPECT_EQ(remote_paths(scanned.value()), (std::vector<std::string>{"dest/docs/readme.md"}));
}

TEST_F(LocalScannerTest, SingleFilePlansDestinationRoot) {
    auto file = create_source_file("only.txt", 42);

    local_scanner scanner;
    auto scanned = scanner.scan(file, "inbox/today");

    ASSERT_TRUE(scanned.has_value());
    EXPECT_EQ(scanned.value().directories, (std::vector<std::string>{"inbox/today"}));
    EXPECT_EQ(remote_paths(scanned.value()), (std::vector<std::string>{"inbox/today/only.txt"}));
    EXPECT_EQ(scanned.value().total_bytes, 42u);
}

TEST_F(LocalScannerTest, SingleFileIntoRemoteRootPlansNothing) {
    auto file = create_source_file("only.txt", 1);

    local_scanner scanner;
    auto scanned = scanner.scan(file, ".");

    ASSERT_TRUE(scanned.has_value());
    EXPECT_TRUE(scanned.value().directories.empty());
    EXPECT_EQ(remote_paths(scanned.value()), (std::vector<std::string>{"only.txt"}));
}

TEST_F(LocalScannerTest, EmptyDirectoryStillPlanned) {
    std::filesystem::create_directories(source_dir_ / "empty" / "inner");

    local_scanner scanner;
    auto scanned = scanner.scan(source_dir_ / "empty", "d");

    ASSERT_TRUE(scanned.has_value());
    EXPECT_EQ(scanned.value().directories, (std::vector<std::string>{"d/empty", "d/empty/inner"}));
    EXPECT_TRUE(scanned.value().files.empty());
}

TEST_F(LocalScannerTest, MissingSourceIsSetupError) {
    local_scanner scanner;
    auto scanned = scanner.scan(source_dir_ / "nope", "d");

    ASSERT_FALSE(scanned.has_value());
    EXPECT_EQ(scanned.error().code, error_code::invalid_source_path);
    EXPECT_TRUE(is_setup_error(scanned.error().code));
}

TEST_F(LocalScannerTest, FollowsFileSymlinks) {
    auto target = create_source_file("outside/data.bin", 77);
    std::filesystem::create_directories(source_dir_ / "tree");
    std::filesystem::create_symlink(target, source_dir_ / "tree" / "link.bin");

    local_scanner scanner;
    auto scanned = scanner.scan(source_dir_ / "tree", "d");

    ASSERT_TRUE(scanned.has_value());
    EXPECT_EQ(remote_paths(scanned.value()), (std::vector<std::string>{"d/tree/link.bin"}));
    EXPECT_EQ(scanned.value().total_bytes, 77u);
}

TEST_F(LocalScannerTest, SymlinkLoopReportedOnce) {
    create_source_file("loop/a.txt", 5);
    create_source_file("loop/sub/b.txt", 6);
    std::filesystem::create_directory_symlink(source_dir_ / "loop",
                                              source_dir_ / "loop" / "sub" / "back");

    local_scanner scanner;
    auto scanned = scanner.scan(source_dir_ / "loop", "d");

    ASSERT_TRUE(scanned.has_value());
    const auto& scan = scanned.value();
    EXPECT_EQ(remote_paths(scan), (std::vector<std::string>{"d/loop/a.txt", "d/loop/sub/b.txt"}));
    ASSERT_EQ(scan.issues.size(), 1u);
    EXPECT_EQ(scan.issues[0].err.code, error_code::scan_error);
    EXPECT_NE(scan.issues[0].path.find("back"), std::string::npos);
}

TEST_F(LocalScannerTest, SiblingAliasIsNotALoop) {
    create_source_file("src/shared/a.txt", 8);
    std::filesystem::create_directory_symlink("shared", source_dir_ / "src" / "alias");

    local_scanner scanner;
    auto scanned = scanner.scan(source_dir_ / "src", "dest");

    ASSERT_TRUE(scanned.has_value());
    const auto& scan = scanned.value();
    EXPECT_EQ(scan.directories,
              (std::vector<std::string>{"dest/src", "dest/src/alias", "dest/src/shared"}));
    EXPECT_EQ(remote_paths(scan),
              (std::vector<std::string>{"dest/src/alias/a.txt", "dest/src/shared/a.txt"}));
    EXPECT_TRUE(scan.issues.empty());
}

TEST_F(LocalScannerTest, BrokenLinkIsIssueNotFailure) {
    create_source_file("broken/ok.txt", 3);
    std::filesystem::create_symlink(source_dir_ / "missing.txt",
                                    source_dir_ / "broken" / "dangling.txt");

    local_scanner scanner;
    auto scanned = scanner.scan(source_dir_ / "broken", "d");

    ASSERT_TRUE(scanned.has_value());
    EXPECT_EQ(remote_paths(scanned.value()), (std::vector<std::string>{"d/broken/ok.txt"}));
    EXPECT_EQ(scanned.value().issues.size(), 1u);
}

TEST_F(LocalScannerTest, CancelledScanStops) {
    create_source_file("many/a.txt", 1);
    std::atomic<bool> cancelled{true};

    local_scanner scanner(&cancelled);
    auto scanned = scanner.scan(source_dir_ / "many", "d");

    ASSERT_FALSE(scanned.has_value());
    EXPECT_EQ(scanned.error().code, error_code::transfer_cancelled);
}

}  // namespace kcenon::file_ripper::test
