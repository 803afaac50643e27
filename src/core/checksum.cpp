/**
 * @file checksum.cpp
 * @brief Implementation of CRC32 utilities
 */

#include <kcenon/file_ripper/core/checksum.h>

#include <array>
#include <fstream>
#include <sstream>
#include <vector>

namespace kcenon::file_ripper {

namespace {

// CRC32 polynomial (IEEE 802.3, reflected)
constexpr uint32_t CRC32_POLYNOMIAL = 0xEDB88320;

constexpr std::size_t FILE_BUFFER_SIZE = 64 * 1024;

constexpr auto generate_crc32_table() -> std::array<uint32_t, 256> {
    std::array<uint32_t, 256> table{};

    for (uint32_t i = 0; i < 256; ++i) {
        uint32_t crc = i;
        for (int j = 0; j < 8; ++j) {
            if (crc & 1) {
                crc = (crc >> 1) ^ CRC32_POLYNOMIAL;
            } else {
                crc >>= 1;
            }
        }
        table[i] = crc;
    }

    return table;
}

// Generated at compile time
constexpr auto CRC32_TABLE = generate_crc32_table();

}  // namespace

auto checksum::crc32(std::span<const std::byte> data) -> uint32_t {
    return crc32_update(0, data);
}

auto checksum::crc32_update(uint32_t crc, std::span<const std::byte> data) -> uint32_t {
    uint32_t value = crc ^ 0xFFFFFFFF;

    for (std::byte b : data) {
        auto index = static_cast<uint8_t>(value ^ static_cast<uint8_t>(b));
        value = CRC32_TABLE[index] ^ (value >> 8);
    }

    return value ^ 0xFFFFFFFF;
}

auto checksum::crc32_file(const std::filesystem::path& path) -> result<uint32_t> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return unexpected(
            error{error_code::file_not_found, "cannot open file: " + path.string()});
    }

    std::vector<std::byte> buffer(FILE_BUFFER_SIZE);
    uint32_t crc = 0;

    while (file) {
        file.read(reinterpret_cast<char*>(buffer.data()),
                  static_cast<std::streamsize>(buffer.size()));
        auto bytes_read = static_cast<std::size_t>(file.gcount());
        if (bytes_read == 0) {
            break;
        }
        crc = crc32_update(crc, std::span<const std::byte>(buffer.data(), bytes_read));
    }

    if (file.bad()) {
        return unexpected(
            error{error_code::file_read_error, "read failed: " + path.string()});
    }

    return crc;
}

auto checksum::to_hex(uint32_t crc) -> std::string {
    std::ostringstream oss;
    oss << std::hex << crc;
    return oss.str();
}

}  // namespace kcenon::file_ripper
