/**
 * @file transport_interface.h
 * @brief Remote file-access abstraction consumed by the engine
 *
 * A remote_transport is one established, authenticated channel session. The
 * engine never sees the wire protocol; it only opens handles, stats, lists
 * and creates directories through this interface. Several independent
 * sessions may be handed to the engine for concurrent use.
 */

#ifndef KCENON_FILE_RIPPER_TRANSPORT_TRANSPORT_INTERFACE_H
#define KCENON_FILE_RIPPER_TRANSPORT_TRANSPORT_INTERFACE_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "kcenon/file_ripper/core/types.h"

namespace kcenon::file_ripper {

/**
 * @brief How a remote file is opened
 */
enum class open_mode {
    read,            ///< Read only, must exist
    write_truncate,  ///< Create or truncate, write only
    write_existing   ///< Write into an existing file without truncating
};

/**
 * @brief Convert open_mode to string
 */
[[nodiscard]] constexpr auto to_string(open_mode mode) -> const char* {
    switch (mode) {
        case open_mode::read: return "read";
        case open_mode::write_truncate: return "write_truncate";
        case open_mode::write_existing: return "write_existing";
        default: return "unknown";
    }
}

/**
 * @brief Metadata of a remote entry
 */
struct remote_file_info {
    std::string name;      ///< Base name
    uint64_t size = 0;
    bool is_dir = false;
    bool is_symlink = false;
    uint32_t mode = 0644;  ///< Permission bits
    std::chrono::system_clock::time_point mtime{};
};

/**
 * @brief Entry reported by remote_transport::walk()
 *
 * When err is set the entry could not be inspected; info is then only
 * partially filled and the walk goes on with the next entry.
 */
struct walk_entry {
    std::string path;
    remote_file_info info;
    std::optional<error> err;
};

/**
 * @brief Walk visitor; return false to stop the walk
 */
using walk_callback = std::function<bool(const walk_entry&)>;

/**
 * @brief Open remote file handle
 *
 * Handles are owned by exactly one worker or sub-worker and are not
 * required to be thread-safe.
 */
class remote_file {
public:
    virtual ~remote_file() = default;

    /**
     * @brief Read up to buffer.size() bytes
     * @return Bytes read, 0 at end of file
     */
    [[nodiscard]] virtual auto read(std::span<std::byte> buffer) -> result<std::size_t> = 0;

    /**
     * @brief Write the whole buffer
     * @return Bytes written
     */
    [[nodiscard]] virtual auto write(std::span<const std::byte> data) -> result<std::size_t> = 0;

    /**
     * @brief Move the read/write position to an absolute offset
     */
    [[nodiscard]] virtual auto seek(uint64_t offset) -> result<void> = 0;

    /**
     * @brief Flush and release the handle
     */
    virtual auto close() -> result<void> = 0;
};

/**
 * @brief One remote file-access session
 *
 * @code
 * auto session = std::make_shared<local_transport>("/srv/mirror");
 * auto file = session->open("dest/a.bin", open_mode::write_truncate);
 * if (file.has_value()) {
 *     (void)file.value()->write(data);
 *     (void)file.value()->close();
 * }
 * @endcode
 */
class remote_transport {
public:
    remote_transport() = default;
    virtual ~remote_transport() = default;

    // Non-copyable
    remote_transport(const remote_transport&) = delete;
    auto operator=(const remote_transport&) -> remote_transport& = delete;

    /**
     * @brief Identifier used in logs (e.g. "local", "sftp")
     */
    [[nodiscard]] virtual auto name() const -> std::string_view = 0;

    [[nodiscard]] virtual auto open(const std::string& path, open_mode mode)
        -> result<std::unique_ptr<remote_file>> = 0;

    /**
     * @brief Metadata, following symbolic links
     */
    [[nodiscard]] virtual auto stat(const std::string& path) -> result<remote_file_info> = 0;

    /**
     * @brief Metadata of the entry itself, not following symbolic links
     */
    [[nodiscard]] virtual auto lstat(const std::string& path) -> result<remote_file_info> = 0;

    /**
     * @brief Entries directly below a directory, in unspecified order
     */
    [[nodiscard]] virtual auto list(const std::string& path)
        -> result<std::vector<remote_file_info>> = 0;

    /**
     * @brief Create a directory and every missing parent
     */
    [[nodiscard]] virtual auto mkdir_all(const std::string& path) -> result<void> = 0;

    [[nodiscard]] virtual auto chmod(const std::string& path, uint32_t mode) -> result<void> = 0;

    [[nodiscard]] virtual auto chtimes(const std::string& path,
                                       std::chrono::system_clock::time_point mtime)
        -> result<void> = 0;

    /**
     * @brief Directory relative paths are resolved against
     */
    [[nodiscard]] virtual auto working_directory() const -> std::string { return "."; }

    /**
     * @brief Depth-first walk rooted at root, root included
     *
     * The default implementation lstats each entry and lists directories.
     * Entries that fail to lstat or list are reported with err set and the
     * walk continues with the next sibling. Symbolic links below root are
     * reported as such and not descended into; root itself is followed.
     *
     * @return Error only when root itself cannot be inspected
     */
    virtual auto walk(const std::string& root, const walk_callback& visit) -> result<void>;
};

}  // namespace kcenon::file_ripper

#endif  // KCENON_FILE_RIPPER_TRANSPORT_TRANSPORT_INTERFACE_H
