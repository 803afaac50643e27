/**
 * @file test_checksum.cpp
 * @brief Unit tests for CRC32 utilities
 */

#include <gtest/gtest.h>

#include <kcenon/file_ripper/core/checksum.h>

#include <cstring>
#include <filesystem>
#include <fstream>
#include <random>
#include <span>
#include <string>
#include <vector>

namespace kcenon::file_ripper::test {

class ChecksumTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("file_ripper_test_checksum_" + std::to_string(std::random_device{}()));
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    static auto to_bytes(const std::string& text) -> std::vector<std::byte> {
        std::vector<std::byte> bytes(text.size());
        if (!text.empty()) {
            std::memcpy(bytes.data(), text.data(), text.size());
        }
        return bytes;
    }

    auto create_test_file(const std::string& name, const std::vector<std::byte>& content)
        -> std::filesystem::path {
        auto path = test_dir_ / name;
        std::ofstream file(path, std::ios::binary);
        file.write(reinterpret_cast<const char*>(content.data()),
                   static_cast<std::streamsize>(content.size()));
        return path;
    }

    std::filesystem::path test_dir_;
};

TEST_F(ChecksumTest, CRC32_EmptyData) {
    std::vector<std::byte> empty;
    EXPECT_EQ(checksum::crc32(empty), 0x00000000u);
}

TEST_F(ChecksumTest, CRC32_KnownValue) {
    // "123456789" -> 0xCBF43926
    auto data = to_bytes("123456789");
    EXPECT_EQ(checksum::crc32(data), 0xCBF43926u);
}

TEST_F(ChecksumTest, CRC32_SingleByteChangeDetected) {
    auto data = to_bytes("the quick brown fox");
    auto before = checksum::crc32(data);

    data[4] = std::byte{'Q'};
    EXPECT_NE(checksum::crc32(data), before);
}

TEST_F(ChecksumTest, CRC32_UpdateMatchesOneShot) {
    auto data = to_bytes("split this stream into two uneven halves");
    std::span<const std::byte> all(data);

    auto running = checksum::crc32_update(0, all.first(7));
    running = checksum::crc32_update(running, all.subspan(7));

    EXPECT_EQ(running, checksum::crc32(all));
}

TEST_F(ChecksumTest, CRC32_UpdateFromZeroEqualsOneShot) {
    auto data = to_bytes("123456789");
    EXPECT_EQ(checksum::crc32_update(0, data), checksum::crc32(data));
}

TEST_F(ChecksumTest, CRC32_FileMatchesMemory) {
    std::vector<std::byte> content(200 * 1024);
    std::mt19937 gen(7);
    for (auto& b : content) {
        b = static_cast<std::byte>(gen() & 0xFF);
    }
    auto path = create_test_file("blob.bin", content);

    auto file_crc = checksum::crc32_file(path);
    ASSERT_TRUE(file_crc.has_value());
    EXPECT_EQ(file_crc.value(), checksum::crc32(content));
}

TEST_F(ChecksumTest, CRC32_FileMissing) {
    auto file_crc = checksum::crc32_file(test_dir_ / "missing.bin");
    ASSERT_FALSE(file_crc.has_value());
    EXPECT_EQ(file_crc.error().code, error_code::file_not_found);
}

TEST_F(ChecksumTest, ToHexIsLowercaseUnpadded) {
    EXPECT_EQ(checksum::to_hex(0xCBF43926u), "cbf43926");
    EXPECT_EQ(checksum::to_hex(0x00000abcu), "abc");
}

}  // namespace kcenon::file_ripper::test
