/**
 * @file checksum.h
 * @brief CRC32 utilities for transfer integrity checks
 */

#ifndef KCENON_FILE_RIPPER_CORE_CHECKSUM_H
#define KCENON_FILE_RIPPER_CORE_CHECKSUM_H

#include <kcenon/file_ripper/core/types.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>

namespace kcenon::file_ripper {

/**
 * @brief IEEE 802.3 CRC32 (the zlib/zip polynomial)
 *
 * CRC32 only detects corruption; the channel underneath is already
 * authenticated and encrypted.
 */
class checksum {
public:
    /**
     * @brief Calculate CRC32 checksum of data
     * @param data Input data span
     * @return CRC32 checksum value
     */
    [[nodiscard]] static auto crc32(std::span<const std::byte> data) -> uint32_t;

    /**
     * @brief Continue a running CRC32 with more data
     *
     * crc32_update(crc32(a), b) == crc32(a + b), and crc32_update(0, a) == crc32(a).
     *
     * @param crc Value returned by a previous call (0 to start)
     * @param data Next block of the stream
     * @return Updated CRC32
     */
    [[nodiscard]] static auto crc32_update(uint32_t crc, std::span<const std::byte> data)
        -> uint32_t;

    /**
     * @brief Calculate CRC32 of a whole file
     * @param path Path to the file
     * @return CRC32 value or error
     */
    [[nodiscard]] static auto crc32_file(const std::filesystem::path& path) -> result<uint32_t>;

    /**
     * @brief Format a CRC32 as lowercase hex without padding
     */
    [[nodiscard]] static auto to_hex(uint32_t crc) -> std::string;
};

}  // namespace kcenon::file_ripper

#endif  // KCENON_FILE_RIPPER_CORE_CHECKSUM_H
