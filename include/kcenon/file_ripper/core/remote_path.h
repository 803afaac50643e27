/**
 * @file remote_path.h
 * @brief Forward-slash path helpers for remote paths
 *
 * Remote paths are always '/'-separated regardless of the host platform.
 * Local paths are converted with to_slash() before being joined onto a
 * remote root.
 */

#ifndef KCENON_FILE_RIPPER_CORE_REMOTE_PATH_H
#define KCENON_FILE_RIPPER_CORE_REMOTE_PATH_H

#include <filesystem>
#include <string>
#include <string_view>

namespace kcenon::file_ripper::remote_path {

/**
 * @brief Lexically normalise a path
 *
 * Collapses repeated separators, removes "." elements and resolves ".."
 * against the preceding element. Never returns an empty string: the empty
 * path becomes ".". A trailing '/' is dropped except for the root itself.
 */
[[nodiscard]] auto clean(std::string_view path) -> std::string;

/**
 * @brief Join two path fragments with a single '/' and clean the result
 */
[[nodiscard]] auto join(std::string_view base, std::string_view child) -> std::string;

/**
 * @brief Last element of the path ("" stays "", "/" stays "/")
 */
[[nodiscard]] auto base_name(std::string_view path) -> std::string;

/**
 * @brief Everything before the last element, "." when there is none
 */
[[nodiscard]] auto parent(std::string_view path) -> std::string;

/**
 * @brief Path of target relative to base
 *
 * @return Relative path, "." when they are equal, or target unchanged when
 *         it is not below base
 */
[[nodiscard]] auto relative(std::string_view base, std::string_view target) -> std::string;

/**
 * @brief Generic ('/'-separated) form of a local relative path
 */
[[nodiscard]] auto to_slash(const std::filesystem::path& path) -> std::string;

/**
 * @brief Check whether the path has no directory component
 */
[[nodiscard]] auto is_bare_name(std::string_view path) noexcept -> bool;

}  // namespace kcenon::file_ripper::remote_path

#endif  // KCENON_FILE_RIPPER_CORE_REMOTE_PATH_H
