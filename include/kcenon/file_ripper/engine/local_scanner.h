/**
 * @file local_scanner.h
 * @brief Upload-side walk of the local source tree
 */

#ifndef KCENON_FILE_RIPPER_ENGINE_LOCAL_SCANNER_H
#define KCENON_FILE_RIPPER_ENGINE_LOCAL_SCANNER_H

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "kcenon/file_ripper/core/job_queue.h"
#include "kcenon/file_ripper/core/types.h"

namespace kcenon::file_ripper {

/**
 * @brief Entry the scanner had to skip
 */
struct scan_issue {
    std::string path;
    error err;
};

/**
 * @brief Directory plan and file jobs produced by a scan
 */
struct scan_result {
    std::filesystem::path source;        ///< Absolute source path
    std::vector<std::string> directories;  ///< Remote directories, scan order
    std::vector<transfer_job> files;       ///< Upload jobs, scan order
    uint64_t total_bytes = 0;
    std::vector<scan_issue> issues;
};

/**
 * @brief Walks a local file or directory and maps it below a remote root
 *
 * The source keeps its own name below the destination: scanning
 * "/home/me/photos" into "backup" yields "backup/photos/...". Symbolic links
 * are followed; a link back to a directory on the current path (a loop) is
 * reported as an issue and not entered. A directory reachable through two
 * sibling routes is walked under both. Unreadable entries are reported and
 * skipped. Directory children are visited in name order.
 *
 * When the source is a single file the destination root itself is the only
 * planned directory, so the upload has somewhere to land.
 */
class local_scanner {
public:
    /**
     * @param cancelled Optional flag checked between entries
     */
    explicit local_scanner(const std::atomic<bool>* cancelled = nullptr);

    /**
     * @brief Scan source into dest
     * @return Result, invalid_source_path if source is missing, or
     *         transfer_cancelled
     */
    [[nodiscard]] auto scan(const std::filesystem::path& source, const std::string& dest) const
        -> result<scan_result>;

private:
    const std::atomic<bool>* cancelled_;
};

}  // namespace kcenon::file_ripper

#endif  // KCENON_FILE_RIPPER_ENGINE_LOCAL_SCANNER_H
