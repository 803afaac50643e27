/**
 * @file test_failure_policies.cpp
 * @brief swallow / collect_warnings / fail_fast behaviour
 */

#include "test_fixtures.h"

#include <algorithm>
#include <string>

namespace kcenon::file_ripper::test {

namespace fs = std::filesystem;

class FailurePolicyTest : public EngineFixture {
protected:
    void SetUp() override {
        EngineFixture::SetUp();
        create_source_file("set/a.bin", 2000, 1);
        create_source_file("set/b.bin", 2000, 2);
        create_source_file("set/c.bin", 2000, 3);
        create_source_file("set/sub/d.bin", 2000, 4);
    }

    void build_with(failure_policy policy) {
        build_engine(transfer_engine::builder()
                         .with_concurrency(2)
                         .with_failure_policy(policy));
    }

    static auto count_kind(const transfer_report& report, warning_kind kind) -> std::size_t {
        return static_cast<std::size_t>(
            std::count_if(report.warnings.begin(), report.warnings.end(),
                          [kind](const transfer_warning& w) { return w.kind == kind; }));
    }
};

TEST_F(FailurePolicyTest, CollectWarningsRecordsFailedFile) {
    build_with(failure_policy::collect_warnings);
    auto sessions = faulty_sessions(1);
    faults_->fail_opens("set/b.bin", fault_injecting_transport::always);

    auto report = engine_->start_upload(sessions, source_dir_ / "set", ".");

    ASSERT_TRUE(report.has_value()) << report.error().message;
    EXPECT_EQ(report.value().total_files, 4u);
    EXPECT_EQ(report.value().files_done, 3u);
    EXPECT_EQ(report.value().files_failed(), 1u);

    ASSERT_EQ(report.value().warnings.size(), 1u);
    const auto& warning = report.value().warnings[0];
    EXPECT_EQ(warning.kind, warning_kind::file);
    EXPECT_EQ(fs::path(warning.path).filename(), "b.bin");
    EXPECT_EQ(warning.err.code, error_code::remote_io_error);

    // Every attempt was made before giving up
    EXPECT_EQ(faults_->open_attempts("set/b.bin"), 3);
    EXPECT_TRUE(files_equal(source_dir_ / "set" / "a.bin", remote_dir_ / "set" / "a.bin"));
}

TEST_F(FailurePolicyTest, TransientFailureRecovers) {
    build_with(failure_policy::collect_warnings);
    auto sessions = faulty_sessions(1);
    faults_->fail_opens("set/c.bin", 2);

    auto report = engine_->start_upload(sessions, source_dir_ / "set", ".");

    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report.value().files_done, 4u);
    EXPECT_TRUE(report.value().warnings.empty());
    EXPECT_TRUE(files_equal(source_dir_ / "set" / "c.bin", remote_dir_ / "set" / "c.bin"));
}

TEST_F(FailurePolicyTest, SwallowKeepsGoingSilently) {
    build_with(failure_policy::swallow);
    auto sessions = faulty_sessions(1);
    faults_->fail_opens("set/b.bin", fault_injecting_transport::always);
    faults_->fail_mkdir("set/sub");

    auto report = engine_->start_upload(sessions, source_dir_ / "set", ".");

    ASSERT_TRUE(report.has_value());
    EXPECT_TRUE(report.value().warnings.empty());
    EXPECT_EQ(report.value().directories_created, 1u);
    // b.bin is refused, d.bin has no parent directory
    EXPECT_EQ(report.value().files_done, 2u);
    EXPECT_EQ(report.value().files_failed(), 2u);
}

TEST_F(FailurePolicyTest, CollectWarningsRecordsDirectoryFailure) {
    build_with(failure_policy::collect_warnings);
    auto sessions = faulty_sessions(1);
    faults_->fail_mkdir("set/sub");

    auto report = engine_->start_upload(sessions, source_dir_ / "set", ".");

    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report.value().directories_planned, 2u);
    EXPECT_EQ(report.value().directories_created, 1u);
    ASSERT_EQ(count_kind(report.value(), warning_kind::directory), 1u);

    auto dir_warning = std::find_if(
        report.value().warnings.begin(), report.value().warnings.end(),
        [](const transfer_warning& w) { return w.kind == warning_kind::directory; });
    EXPECT_EQ(dir_warning->path, "set/sub");
    EXPECT_EQ(dir_warning->err.code, error_code::directory_create_failed);

    // The file below the missing directory fails on its own
    EXPECT_EQ(count_kind(report.value(), warning_kind::file), 1u);
    EXPECT_EQ(report.value().files_done, 3u);
}

TEST_F(FailurePolicyTest, ScanIssuesOnlyCollectedAsWarnings) {
    std::error_code ec;
    fs::create_symlink(source_dir_ / "nowhere", source_dir_ / "set" / "dangling", ec);
    if (ec) {
        GTEST_SKIP() << "symlinks unavailable: " << ec.message();
    }

    build_with(failure_policy::collect_warnings);
    auto collected = engine_->start_upload(local_sessions(1), source_dir_ / "set", "one");
    ASSERT_TRUE(collected.has_value());
    EXPECT_EQ(count_kind(collected.value(), warning_kind::scan), 1u);
    EXPECT_EQ(collected.value().files_done, 4u);

    build_with(failure_policy::fail_fast);
    auto strict = engine_->start_upload(local_sessions(1), source_dir_ / "set", "two");
    ASSERT_TRUE(strict.has_value());
    EXPECT_TRUE(strict.value().warnings.empty());
    EXPECT_EQ(strict.value().files_done, 4u);
}

TEST_F(FailurePolicyTest, FailFastReturnsFirstFileError) {
    build_with(failure_policy::fail_fast);
    auto sessions = faulty_sessions(1);
    faults_->fail_opens("set/a.bin", fault_injecting_transport::always, std::nullopt,
                        error_code::remote_permission_denied);

    auto report = engine_->start_upload(sessions, source_dir_ / "set", ".");

    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().code, error_code::remote_permission_denied);
    EXPECT_NE(report.error().message.find("a.bin"), std::string::npos);
    EXPECT_TRUE(engine_->is_cancelled());
}

TEST_F(FailurePolicyTest, FailFastStopsBeforeFilesOnDirectoryError) {
    build_with(failure_policy::fail_fast);
    auto sessions = faulty_sessions(1);
    faults_->fail_mkdir("set/sub");

    auto report = engine_->start_upload(sessions, source_dir_ / "set", ".");

    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().code, error_code::directory_create_failed);
    EXPECT_NE(report.error().message.find("set/sub"), std::string::npos);

    auto events = faults_->events();
    EXPECT_TRUE(std::none_of(events.begin(), events.end(), [](const std::string& e) {
        return e.rfind("create:", 0) == 0;
    }));
}

TEST_F(FailurePolicyTest, DownloadFailureUsesRemotePath) {
    create_remote_file("pull/x.bin", 800, 5);
    create_remote_file("pull/y.bin", 800, 6);
    build_with(failure_policy::collect_warnings);
    auto sessions = faulty_sessions(1);
    faults_->fail_opens("pull/y.bin", fault_injecting_transport::always, open_mode::read);

    auto report = engine_->start_download(sessions, "pull");

    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report.value().files_done, 1u);
    ASSERT_EQ(report.value().warnings.size(), 1u);
    EXPECT_EQ(report.value().warnings[0].path, "pull/y.bin");
}

}  // namespace kcenon::file_ripper::test
