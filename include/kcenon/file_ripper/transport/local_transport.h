/**
 * @file local_transport.h
 * @brief remote_transport backed by a directory on the local filesystem
 *
 * Used for loopback transfers (e.g. to a mounted share), by the examples and
 * by the test suite. Every path, relative or absolute, is resolved below the
 * root directory; paths that would escape it are rejected.
 */

#ifndef KCENON_FILE_RIPPER_TRANSPORT_LOCAL_TRANSPORT_H
#define KCENON_FILE_RIPPER_TRANSPORT_LOCAL_TRANSPORT_H

#include <filesystem>

#include "kcenon/file_ripper/transport/transport_interface.h"

namespace kcenon::file_ripper {

/**
 * @brief Loopback transport rooted at a local directory
 *
 * @code
 * std::vector<std::shared_ptr<remote_transport>> sessions;
 * for (int i = 0; i < 4; ++i) {
 *     sessions.push_back(std::make_shared<local_transport>("/mnt/backup"));
 * }
 * @endcode
 */
class local_transport : public remote_transport {
public:
    /**
     * @param root Directory that stands in for the remote filesystem root
     */
    explicit local_transport(std::filesystem::path root);

    [[nodiscard]] auto name() const -> std::string_view override { return "local"; }

    [[nodiscard]] auto open(const std::string& path, open_mode mode)
        -> result<std::unique_ptr<remote_file>> override;
    [[nodiscard]] auto stat(const std::string& path) -> result<remote_file_info> override;
    [[nodiscard]] auto lstat(const std::string& path) -> result<remote_file_info> override;
    [[nodiscard]] auto list(const std::string& path)
        -> result<std::vector<remote_file_info>> override;
    [[nodiscard]] auto mkdir_all(const std::string& path) -> result<void> override;
    [[nodiscard]] auto chmod(const std::string& path, uint32_t mode) -> result<void> override;
    [[nodiscard]] auto chtimes(const std::string& path,
                               std::chrono::system_clock::time_point mtime)
        -> result<void> override;

    [[nodiscard]] auto root() const -> const std::filesystem::path& { return root_; }

    /**
     * @brief Map a remote path onto the local filesystem
     * @return Local path, or remote_permission_denied if it escapes the root
     */
    [[nodiscard]] auto resolve(const std::string& path) const -> result<std::filesystem::path>;

private:
    std::filesystem::path root_;
};

}  // namespace kcenon::file_ripper

#endif  // KCENON_FILE_RIPPER_TRANSPORT_LOCAL_TRANSPORT_H
