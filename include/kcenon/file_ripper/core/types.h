/**
 * @file types.h
 * @brief Core type definitions for file_ripper
 */

#ifndef KCENON_FILE_RIPPER_CORE_TYPES_H
#define KCENON_FILE_RIPPER_CORE_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace kcenon::file_ripper {

/**
 * @brief Error codes for transfer operations
 *
 * Error code ranges:
 * - -100 to -119: Setup errors (fatal to a whole operation)
 * - -120 to -139: Transfer errors
 * - -140 to -159: Local file I/O errors
 * - -160 to -179: Remote (transport) errors
 * - -180 to -199: Structure errors (scan, directory replication)
 * - -200 to -219: Internal errors
 */
enum class error_code {
    success = 0,

    // Setup errors (-100 to -119)
    invalid_source_path = -100,
    target_not_found = -101,
    no_active_sessions = -102,
    source_is_directory = -103,
    remote_is_directory = -104,
    invalid_configuration = -105,

    // Transfer errors (-120 to -139)
    transfer_cancelled = -120,
    transfer_failed = -121,
    multipart_failed = -122,
    checksum_mismatch = -123,
    short_transfer = -124,

    // Local file errors (-140 to -159)
    file_not_found = -140,
    file_open_error = -141,
    file_read_error = -142,
    file_write_error = -143,

    // Remote errors (-160 to -179)
    remote_not_found = -160,
    remote_io_error = -161,
    remote_permission_denied = -162,
    connection_lost = -163,
    not_supported = -164,

    // Structure errors (-180 to -199)
    directory_create_failed = -180,
    scan_error = -181,

    // Internal errors (-200 to -219)
    internal_error = -200,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::invalid_source_path:
            return "invalid source path";
        case error_code::target_not_found:
            return "target not found";
        case error_code::no_active_sessions:
            return "no active sessions";
        case error_code::source_is_directory:
            return "source is a directory";
        case error_code::remote_is_directory:
            return "remote path is a directory";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::transfer_cancelled:
            return "transfer cancelled";
        case error_code::transfer_failed:
            return "transfer failed";
        case error_code::multipart_failed:
            return "multipart upload failed";
        case error_code::checksum_mismatch:
            return "CRC32 verification failed";
        case error_code::short_transfer:
            return "transferred size does not match source size";
        case error_code::file_not_found:
            return "local file not found";
        case error_code::file_open_error:
            return "cannot open local file";
        case error_code::file_read_error:
            return "file read error";
        case error_code::file_write_error:
            return "file write error";
        case error_code::remote_not_found:
            return "remote path not found";
        case error_code::remote_io_error:
            return "remote I/O error";
        case error_code::remote_permission_denied:
            return "remote permission denied";
        case error_code::connection_lost:
            return "connection lost";
        case error_code::not_supported:
            return "operation not supported by transport";
        case error_code::directory_create_failed:
            return "directory creation failed";
        case error_code::scan_error:
            return "scan error";
        case error_code::internal_error:
            return "internal error";
        default:
            return "unknown error";
    }
}

/**
 * @brief Check if error code belongs to the setup range
 *
 * Setup errors abort a whole operation before anything is queued.
 */
[[nodiscard]] constexpr auto is_setup_error(error_code code) noexcept -> bool {
    auto value = static_cast<int>(code);
    return value <= -100 && value >= -119;
}

/**
 * @brief Error type with code and optional message
 */
struct error {
    error_code code;
    std::string message;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * A simple Result type similar to std::expected (C++23).
 * Contains either a value of type T or an error.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

/**
 * @brief Direction of a single file transfer
 */
enum class transfer_direction {
    upload,
    download
};

/**
 * @brief Convert transfer_direction to string
 */
[[nodiscard]] constexpr auto to_string(transfer_direction direction) -> const char* {
    switch (direction) {
        case transfer_direction::upload: return "upload";
        case transfer_direction::download: return "download";
        default: return "unknown";
    }
}

}  // namespace kcenon::file_ripper

#endif  // KCENON_FILE_RIPPER_CORE_TYPES_H
