/**
 * @file test_chunked_transfer.cpp
 * @brief Unit tests for single-stream, multipart and retry behaviour
 */

#include <gtest/gtest.h>

#include "integration/test_fixtures.h"

#include <kcenon/file_ripper/engine/chunked_transfer.h>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <string>

namespace kcenon::file_ripper::test {

class ChunkedTransferTest : public TempDirectoryFixture {
protected:
    void SetUp() override {
        TempDirectoryFixture::SetUp();
        monitor_ = std::make_shared<progress_monitor>();
        monitor_->reset(1, 0);
        session_ = std::make_shared<fault_injecting_transport>(
            std::make_shared<local_transport>(remote_dir_));
    }

    /// Multipart kicks in at 64KB with 4 ranges so tests stay small
    static auto small_multipart() -> transfer_options {
        transfer_options options;
        options.buffer_size = 8 * 1024;
        options.multipart.threshold = 64 * 1024;
        options.multipart.part_count = 4;
        options.multipart.buffer_size = 4 * 1024;
        return options;
    }

    auto make_transfer(transfer_options options = {}) -> std::unique_ptr<chunked_transfer> {
        return std::make_unique<chunked_transfer>(options, monitor_, cancelled_);
    }

    std::shared_ptr<progress_monitor> monitor_;
    std::shared_ptr<fault_injecting_transport> session_;
    std::atomic<bool> cancelled_{false};
};

TEST_F(ChunkedTransferTest, SmallUploadIsByteIdentical) {
    auto source = create_source_file("small.bin", 100 * 1000);
    auto transfer = make_transfer();

    auto result = transfer->upload(source, "small.bin", *session_);

    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_TRUE(files_equal(source, remote_dir_ / "small.bin"));
    EXPECT_EQ(monitor_->get_stats().bytes_done, 100u * 1000);
    EXPECT_EQ(transfer->counters().single_stream_attempts, 1u);
    EXPECT_EQ(transfer->counters().multipart_attempts, 0u);
}

TEST_F(ChunkedTransferTest, UploadCopiesPermissions) {
    auto source = create_source_file("script.sh", 64);
    std::filesystem::permissions(source, std::filesystem::perms(0750),
                                 std::filesystem::perm_options::replace);
    auto transfer = make_transfer();

    ASSERT_TRUE(transfer->upload(source, "script.sh", *session_).has_value());

    auto info = session_->stat("script.sh");
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info.value().mode, 0750u);
}

TEST_F(ChunkedTransferTest, EmptyFileUploads) {
    auto source = create_source_file("empty.bin", 0);
    auto transfer = make_transfer();

    ASSERT_TRUE(transfer->upload(source, "empty.bin", *session_).has_value());
    EXPECT_TRUE(std::filesystem::exists(remote_dir_ / "empty.bin"));
    EXPECT_EQ(std::filesystem::file_size(remote_dir_ / "empty.bin"), 0u);
}

TEST_F(ChunkedTransferTest, RetrySucceedsOnThirdAttempt) {
    auto source = create_source_file("flaky.bin", 10 * 1024);
    session_->fail_opens("flaky.bin", 2, open_mode::write_truncate);
    auto transfer = make_transfer();

    auto result = transfer->upload(source, "flaky.bin", *session_);

    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(session_->open_attempts("flaky.bin"), 3);
    EXPECT_EQ(transfer->counters().single_stream_attempts, 3u);
    EXPECT_TRUE(files_equal(source, remote_dir_ / "flaky.bin"));
}

TEST_F(ChunkedTransferTest, NoFourthAttempt) {
    auto source = create_source_file("broken.bin", 10 * 1024);
    session_->fail_opens("broken.bin", fault_injecting_transport::always);
    auto transfer = make_transfer();

    auto result = transfer->upload(source, "broken.bin", *session_);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::remote_io_error);
    EXPECT_NE(result.error().message.find("failed after 3 attempts"), std::string::npos);
    EXPECT_EQ(session_->open_attempts("broken.bin"), 3);
}

TEST_F(ChunkedTransferTest, AttemptBudgetIsConfigurable) {
    auto source = create_source_file("budget.bin", 1024);
    session_->fail_opens("budget.bin", fault_injecting_transport::always);
    transfer_options options;
    options.max_attempts = 5;
    auto transfer = make_transfer(options);

    EXPECT_FALSE(transfer->upload(source, "budget.bin", *session_).has_value());
    EXPECT_EQ(session_->open_attempts("budget.bin"), 5);
}

TEST_F(ChunkedTransferTest, DirectorySourceIsNotRetried) {
    auto transfer = make_transfer();

    auto result = transfer->upload(source_dir_, "dir", *session_);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::source_is_directory);
    EXPECT_EQ(session_->open_attempts("dir"), 0);
}

TEST_F(ChunkedTransferTest, MissingSourceFails) {
    auto transfer = make_transfer();

    auto result = transfer->upload(source_dir_ / "ghost.bin", "ghost.bin", *session_);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::file_not_found);
}

TEST_F(ChunkedTransferTest, MultipartUploadAboveThreshold) {
    auto source = create_source_file("large.bin", 300 * 1024 + 7);
    auto transfer = make_transfer(small_multipart());

    auto result = transfer->upload(source, "large.bin", *session_);

    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_TRUE(files_equal(source, remote_dir_ / "large.bin"));
    EXPECT_EQ(transfer->counters().multipart_attempts, 1u);
    EXPECT_EQ(transfer->counters().multipart_fallbacks, 0u);
    EXPECT_EQ(transfer->counters().single_stream_attempts, 0u);
    // One truncating create plus one handle per range
    EXPECT_EQ(session_->open_attempts("large.bin"), 5);
    EXPECT_EQ(monitor_->get_stats().bytes_done, 300u * 1024 + 7);
}

TEST_F(ChunkedTransferTest, RangesRunConcurrently) {
    // 4 ranges of 16 writes each; one range alone takes about 320ms
    auto source = create_source_file("parallel.bin", 256 * 1024);
    session_->set_write_delay(std::chrono::milliseconds(20));
    auto transfer = make_transfer(small_multipart());

    auto started = std::chrono::steady_clock::now();
    auto result = transfer->upload_multipart(source, "parallel.bin", *session_);
    auto elapsed = std::chrono::steady_clock::now() - started;

    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_TRUE(files_equal(source, remote_dir_ / "parallel.bin"));
    EXPECT_LT(elapsed, std::chrono::milliseconds(1000));
}

TEST_F(ChunkedTransferTest, BelowThresholdStaysSingleStream) {
    auto source = create_source_file("medium.bin", 64 * 1024 - 1);
    auto transfer = make_transfer(small_multipart());

    ASSERT_TRUE(transfer->upload(source, "medium.bin", *session_).has_value());
    EXPECT_EQ(transfer->counters().multipart_attempts, 0u);
    EXPECT_EQ(transfer->counters().single_stream_attempts, 1u);
}

TEST_F(ChunkedTransferTest, RangeFailureFallsBackToSingleStream) {
    auto source = create_source_file("fallback.bin", 256 * 1024);
    session_->fail_opens("fallback.bin", fault_injecting_transport::always,
                         open_mode::write_existing);
    auto transfer = make_transfer(small_multipart());

    auto result = transfer->upload(source, "fallback.bin", *session_);

    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_TRUE(files_equal(source, remote_dir_ / "fallback.bin"));
    EXPECT_EQ(transfer->counters().multipart_attempts, 1u);
    EXPECT_EQ(transfer->counters().multipart_fallbacks, 1u);
    EXPECT_EQ(transfer->counters().single_stream_attempts, 1u);
}

TEST_F(ChunkedTransferTest, DirectMultipartReportsFailure) {
    auto source = create_source_file("direct.bin", 256 * 1024);
    session_->fail_opens("direct.bin", 1, open_mode::write_existing);
    auto transfer = make_transfer(small_multipart());

    auto result = transfer->upload_multipart(source, "direct.bin", *session_);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::multipart_failed);
}

TEST_F(ChunkedTransferTest, VerificationCatchesCorruptRanges) {
    auto source = create_source_file("verified.bin", 256 * 1024);
    session_->corrupt_writes("verified.bin", open_mode::write_existing);
    auto options = small_multipart();
    options.verify_multipart = true;
    auto transfer = make_transfer(options);

    auto direct = transfer->upload_multipart(source, "verified.bin", *session_);
    ASSERT_FALSE(direct.has_value());
    EXPECT_EQ(direct.error().code, error_code::checksum_mismatch);

    // The full upload path recovers through the single stream
    auto recovered = transfer->upload(source, "verified.bin", *session_);
    ASSERT_TRUE(recovered.has_value()) << recovered.error().message;
    EXPECT_TRUE(files_equal(source, remote_dir_ / "verified.bin"));
    EXPECT_EQ(transfer->counters().multipart_fallbacks, 1u);
    EXPECT_GE(transfer->counters().verified_ranges, 2u);
}

TEST_F(ChunkedTransferTest, VerificationPassesCleanUpload) {
    auto source = create_source_file("clean.bin", 256 * 1024);
    auto options = small_multipart();
    options.verify_multipart = true;
    auto transfer = make_transfer(options);

    ASSERT_TRUE(transfer->upload(source, "clean.bin", *session_).has_value());
    EXPECT_EQ(transfer->counters().verified_ranges, 4u);
    EXPECT_EQ(transfer->counters().multipart_fallbacks, 0u);
}

TEST_F(ChunkedTransferTest, DownloadIsByteIdenticalAndKeepsMtime) {
    auto remote = create_remote_file("report.bin", 150 * 1000, 9);
    auto old_time = std::chrono::system_clock::now() - std::chrono::hours(48);
    ASSERT_TRUE(session_->chtimes("report.bin", old_time).has_value());
    auto transfer = make_transfer();

    auto local = download_dir_ / "nested" / "report.bin";
    auto result = transfer->download("report.bin", local, *session_);

    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_TRUE(files_equal(remote, local));
    EXPECT_EQ(monitor_->get_stats().bytes_done, 150u * 1000);

    auto local_info = std::make_shared<local_transport>(download_dir_)->stat("nested/report.bin");
    ASSERT_TRUE(local_info.has_value());
    auto drift = std::chrono::duration_cast<std::chrono::seconds>(local_info.value().mtime - old_time);
    EXPECT_LE(std::abs(drift.count()), 2);
}

TEST_F(ChunkedTransferTest, DownloadRetriesReads) {
    auto remote = create_remote_file("retry.bin", 4096);
    session_->fail_opens("retry.bin", 2, open_mode::read);
    auto transfer = make_transfer();

    auto local = download_dir_ / "retry.bin";
    ASSERT_TRUE(transfer->download("retry.bin", local, *session_).has_value());
    EXPECT_TRUE(files_equal(remote, local));
    EXPECT_EQ(session_->open_attempts("retry.bin"), 3);
}

TEST_F(ChunkedTransferTest, DownloadOfDirectoryFailsOnce) {
    std::filesystem::create_directories(remote_dir_ / "folder");
    auto transfer = make_transfer();

    auto result = transfer->download("folder", download_dir_ / "folder", *session_);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::remote_is_directory);
    EXPECT_EQ(transfer->counters().single_stream_attempts, 1u);
}

TEST_F(ChunkedTransferTest, ExecuteDispatchesOnDirection) {
    auto source = create_source_file("up.bin", 512);
    create_remote_file("down.bin", 256);
    auto transfer = make_transfer();

    ASSERT_TRUE(transfer->execute(transfer_job{source, "up.bin", transfer_direction::upload},
                                  *session_).has_value());
    ASSERT_TRUE(transfer->execute(transfer_job{download_dir_ / "down.bin", "down.bin",
                                               transfer_direction::download},
                                  *session_).has_value());

    EXPECT_TRUE(std::filesystem::exists(remote_dir_ / "up.bin"));
    EXPECT_TRUE(std::filesystem::exists(download_dir_ / "down.bin"));
}

TEST_F(ChunkedTransferTest, CancelledBeforeStartDoesNothing) {
    auto source = create_source_file("never.bin", 2048);
    cancelled_.store(true);
    auto transfer = make_transfer();

    auto result = transfer->upload(source, "never.bin", *session_);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::transfer_cancelled);
    EXPECT_EQ(session_->open_attempts("never.bin"), 0);
}

}  // namespace kcenon::file_ripper::test
