/**
 * @file remote_search.h
 * @brief Bounded case-insensitive name search on a remote transport
 */

#ifndef KCENON_FILE_RIPPER_TRANSPORT_REMOTE_SEARCH_H
#define KCENON_FILE_RIPPER_TRANSPORT_REMOTE_SEARCH_H

#include <optional>
#include <string>
#include <string_view>

#include "kcenon/file_ripper/transport/transport_interface.h"

namespace kcenon::file_ripper {

/// Default search depth used when a download target is not found verbatim
inline constexpr int default_search_depth = 3;

/**
 * @brief Find an entry whose name matches case-insensitively
 *
 * Entries directly below root are at depth 0. At each directory every entry
 * is compared before any subdirectory is entered; subdirectories are then
 * searched depth first in name order. Directories that cannot be listed are
 * skipped.
 *
 * @param transport Session to search with
 * @param root Directory to start from
 * @param name Bare name to look for
 * @param max_depth Deepest level searched
 * @return Path of the first match (root joined with the matched names)
 */
[[nodiscard]] auto find_remote_path(remote_transport& transport,
                                    const std::string& root,
                                    std::string_view name,
                                    int max_depth = default_search_depth)
    -> std::optional<std::string>;

/**
 * @brief ASCII case-insensitive comparison
 */
[[nodiscard]] auto equals_ignore_case(std::string_view a, std::string_view b) noexcept -> bool;

}  // namespace kcenon::file_ripper

#endif  // KCENON_FILE_RIPPER_TRANSPORT_REMOTE_SEARCH_H
