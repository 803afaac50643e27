/**
 * @file multipart_plan.h
 * @brief Byte-range planning and tunables for chunked transfers
 */

#ifndef KCENON_FILE_RIPPER_CORE_MULTIPART_PLAN_H
#define KCENON_FILE_RIPPER_CORE_MULTIPART_PLAN_H

#include <kcenon/file_ripper/core/types.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace kcenon::file_ripper {

/**
 * @brief Contiguous slice of a file handled by one multipart sub-worker
 */
struct byte_range {
    uint64_t offset = 0;
    uint64_t length = 0;

    [[nodiscard]] auto end() const noexcept -> uint64_t { return offset + length; }

    auto operator==(const byte_range&) const -> bool = default;
};

/**
 * @brief Configuration for multipart parallel uploads
 */
struct multipart_config {
    /// Files at or above this size try the multipart path (10MB)
    static constexpr uint64_t default_threshold = 10ULL * 1024 * 1024;

    /// Number of parallel ranges
    static constexpr std::size_t default_part_count = 16;

    /// Per sub-worker copy buffer (32KB)
    static constexpr std::size_t default_buffer_size = 32 * 1024;

    static constexpr std::size_t max_part_count = 256;

    uint64_t threshold = default_threshold;
    std::size_t part_count = default_part_count;
    std::size_t buffer_size = default_buffer_size;

    [[nodiscard]] auto validate() const -> result<void> {
        if (threshold == 0) {
            return unexpected(error{error_code::invalid_configuration,
                                    "multipart threshold must be positive"});
        }
        if (part_count == 0 || part_count > max_part_count) {
            return unexpected(error{
                error_code::invalid_configuration,
                "multipart part count must be in [1, " + std::to_string(max_part_count) + "]"});
        }
        if (buffer_size == 0) {
            return unexpected(error{error_code::invalid_configuration,
                                    "multipart buffer size must be positive"});
        }
        return {};
    }

    /**
     * @brief Check whether a file of the given size qualifies for multipart
     */
    [[nodiscard]] auto qualifies(uint64_t file_size) const noexcept -> bool {
        return file_size >= threshold;
    }
};

/**
 * @brief Per-job transfer tunables
 */
struct transfer_options {
    /// Attempts per single-stream transfer (initial try included)
    static constexpr uint32_t default_max_attempts = 3;

    /// Single-stream copy buffer (64KB)
    static constexpr std::size_t default_buffer_size = 64 * 1024;

    uint32_t max_attempts = default_max_attempts;
    std::size_t buffer_size = default_buffer_size;
    multipart_config multipart;

    /// Re-read every assembled range and compare CRC32 with the source
    bool verify_multipart = false;

    [[nodiscard]] auto validate() const -> result<void> {
        if (max_attempts == 0 || max_attempts > 100) {
            return unexpected(error{error_code::invalid_configuration,
                                    "max attempts must be in [1, 100]"});
        }
        if (buffer_size == 0) {
            return unexpected(error{error_code::invalid_configuration,
                                    "buffer size must be positive"});
        }
        return multipart.validate();
    }
};

/**
 * @brief Split a file of the given size into equal byte ranges
 *
 * Every range has length size / parts, except the last one which also takes
 * the remainder. Ranges are disjoint, ordered and cover [0, size). Zero parts
 * yields an empty plan; a size smaller than the part count yields ranges of
 * length zero followed by one range holding everything.
 *
 * @param size Total file size in bytes
 * @param parts Number of ranges
 * @return Ordered list of ranges
 */
[[nodiscard]] auto split_ranges(uint64_t size, std::size_t parts) -> std::vector<byte_range>;

}  // namespace kcenon::file_ripper

#endif  // KCENON_FILE_RIPPER_CORE_MULTIPART_PLAN_H
