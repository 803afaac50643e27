/**
 * @file test_multipart_plan.cpp
 * @brief Unit tests for byte-range planning and transfer options
 */

#include <gtest/gtest.h>

#include <kcenon/file_ripper/core/multipart_plan.h>

namespace kcenon::file_ripper::test {

class SplitRangesTest : public ::testing::Test {};

TEST_F(SplitRangesTest, EvenSplit) {
    auto ranges = split_ranges(1600, 16);

    ASSERT_EQ(ranges.size(), 16u);
    for (std::size_t i = 0; i < ranges.size(); ++i) {
        EXPECT_EQ(ranges[i].offset, i * 100);
        EXPECT_EQ(ranges[i].length, 100u);
    }
}

TEST_F(SplitRangesTest, LastRangeTakesRemainder) {
    auto ranges = split_ranges(1003, 4);

    ASSERT_EQ(ranges.size(), 4u);
    EXPECT_EQ(ranges[0], (byte_range{0, 250}));
    EXPECT_EQ(ranges[1], (byte_range{250, 250}));
    EXPECT_EQ(ranges[2], (byte_range{500, 250}));
    EXPECT_EQ(ranges[3], (byte_range{750, 253}));
}

TEST_F(SplitRangesTest, RangesCoverWholeFileWithoutGaps) {
    constexpr uint64_t size = 10ULL * 1024 * 1024 + 17;
    auto ranges = split_ranges(size, 16);

    uint64_t expected_offset = 0;
    for (const auto& range : ranges) {
        EXPECT_EQ(range.offset, expected_offset);
        expected_offset = range.end();
    }
    EXPECT_EQ(expected_offset, size);
}

TEST_F(SplitRangesTest, SizeSmallerThanParts) {
    auto ranges = split_ranges(3, 8);

    ASSERT_EQ(ranges.size(), 8u);
    for (std::size_t i = 0; i + 1 < ranges.size(); ++i) {
        EXPECT_EQ(ranges[i].length, 0u);
    }
    EXPECT_EQ(ranges.back(), (byte_range{0, 3}));
}

TEST_F(SplitRangesTest, ZeroPartsIsEmptyPlan) {
    EXPECT_TRUE(split_ranges(4096, 0).empty());
}

TEST_F(SplitRangesTest, SinglePartIsWholeFile) {
    auto ranges = split_ranges(4096, 1);
    ASSERT_EQ(ranges.size(), 1u);
    EXPECT_EQ(ranges[0], (byte_range{0, 4096}));
}

class MultipartConfigTest : public ::testing::Test {};

TEST_F(MultipartConfigTest, Defaults) {
    multipart_config config;

    EXPECT_EQ(config.threshold, 10ULL * 1024 * 1024);
    EXPECT_EQ(config.part_count, 16u);
    EXPECT_EQ(config.buffer_size, 32u * 1024);
    EXPECT_TRUE(config.validate().has_value());
}

TEST_F(MultipartConfigTest, ThresholdBoundary) {
    multipart_config config;

    EXPECT_FALSE(config.qualifies(config.threshold - 1));
    EXPECT_TRUE(config.qualifies(config.threshold));
}

TEST_F(MultipartConfigTest, RejectsBadPartCount) {
    multipart_config config;
    config.part_count = 0;
    EXPECT_FALSE(config.validate().has_value());

    config.part_count = multipart_config::max_part_count + 1;
    auto result = config.validate();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::invalid_configuration);
}

class TransferOptionsTest : public ::testing::Test {};

TEST_F(TransferOptionsTest, Defaults) {
    transfer_options options;

    EXPECT_EQ(options.max_attempts, 3u);
    EXPECT_EQ(options.buffer_size, 64u * 1024);
    EXPECT_FALSE(options.verify_multipart);
    EXPECT_TRUE(options.validate().has_value());
}

TEST_F(TransferOptionsTest, RejectsZeroAttempts) {
    transfer_options options;
    options.max_attempts = 0;

    auto result = options.validate();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::invalid_configuration);
}

TEST_F(TransferOptionsTest, PropagatesMultipartErrors) {
    transfer_options options;
    options.multipart.buffer_size = 0;

    EXPECT_FALSE(options.validate().has_value());
}

}  // namespace kcenon::file_ripper::test
