/**
 * @file engine_types.h
 * @brief Configuration, report and session-plan types of the transfer engine
 */

#ifndef KCENON_FILE_RIPPER_ENGINE_ENGINE_TYPES_H
#define KCENON_FILE_RIPPER_ENGINE_ENGINE_TYPES_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "kcenon/file_ripper/core/multipart_plan.h"
#include "kcenon/file_ripper/core/types.h"

namespace kcenon::file_ripper {

/**
 * @brief Worker-pool sizing preset
 */
enum class transfer_mode {
    boost,         ///< 64 workers
    conservative   ///< 4 workers
};

[[nodiscard]] constexpr auto to_string(transfer_mode mode) -> const char* {
    switch (mode) {
        case transfer_mode::boost: return "boost";
        case transfer_mode::conservative: return "conservative";
        default: return "unknown";
    }
}

/**
 * @brief Worker count a mode asks for, before capping
 */
[[nodiscard]] constexpr auto mode_concurrency(transfer_mode mode) noexcept -> std::size_t {
    return mode == transfer_mode::boost ? 64 : 4;
}

/**
 * @brief What happens to non-fatal failures during an operation
 *
 * Applies to directory-creation failures and to jobs whose retries are
 * exhausted. Scan errors never stop an operation; they are recorded only
 * under collect_warnings.
 */
enum class failure_policy {
    swallow,           ///< Debug log only
    collect_warnings,  ///< Warn log and transfer_report::warnings
    fail_fast          ///< First failure cancels the operation and is returned
};

[[nodiscard]] constexpr auto to_string(failure_policy policy) -> const char* {
    switch (policy) {
        case failure_policy::swallow: return "swallow";
        case failure_policy::collect_warnings: return "collect_warnings";
        case failure_policy::fail_fast: return "fail_fast";
        default: return "unknown";
    }
}

/**
 * @brief Kind of entry a warning refers to
 */
enum class warning_kind {
    scan,       ///< Entry skipped while walking the source
    directory,  ///< Directory could not be created
    file        ///< File job failed after all attempts
};

[[nodiscard]] constexpr auto to_string(warning_kind kind) -> const char* {
    switch (kind) {
        case warning_kind::scan: return "scan";
        case warning_kind::directory: return "directory";
        case warning_kind::file: return "file";
        default: return "unknown";
    }
}

/**
 * @brief Non-fatal failure recorded under failure_policy::collect_warnings
 */
struct transfer_warning {
    warning_kind kind = warning_kind::file;
    std::string path;
    error err;
};

/**
 * @brief Outcome of a successful operation
 */
struct transfer_report {
    transfer_direction direction = transfer_direction::upload;
    uint64_t total_files = 0;
    uint64_t files_done = 0;
    uint64_t total_bytes = 0;
    uint64_t bytes_done = 0;
    std::size_t directories_planned = 0;
    std::size_t directories_created = 0;
    std::size_t concurrency = 0;
    std::vector<transfer_warning> warnings;

    [[nodiscard]] auto files_failed() const noexcept -> uint64_t {
        return total_files >= files_done ? total_files - files_done : 0;
    }
};

/**
 * @brief Static worker-to-session assignment for one batch
 *
 * Worker i always uses session worker_to_session[i]. There is no
 * rebalancing while the batch runs.
 */
struct session_plan {
    std::vector<std::size_t> worker_to_session;
    std::size_t session_count = 0;

    /**
     * @brief Round-robin plan: worker i goes to session i mod sessions
     */
    [[nodiscard]] static auto round_robin(std::size_t workers, std::size_t sessions)
        -> session_plan;

    [[nodiscard]] auto worker_count() const noexcept -> std::size_t {
        return worker_to_session.size();
    }

    [[nodiscard]] auto session_for(std::size_t worker) const -> std::size_t {
        return worker_to_session.at(worker);
    }

    /**
     * @brief Largest number of workers bound to a single session
     */
    [[nodiscard]] auto max_workers_per_session() const -> std::size_t;
};

/**
 * @brief Engine configuration, assembled by transfer_engine::builder
 */
struct engine_config {
    static constexpr std::size_t default_max_workers_per_session = 32;
    static constexpr std::size_t default_directory_workers = 8;

    transfer_mode mode = transfer_mode::boost;

    /// Overrides the mode's worker count when set
    std::optional<std::size_t> concurrency;

    std::size_t max_workers_per_session = default_max_workers_per_session;
    std::size_t directory_workers = default_directory_workers;
    failure_policy on_failure = failure_policy::collect_warnings;

    /// Local root for downloads, created if missing
    std::filesystem::path download_root = "dump";

    transfer_options options;

    [[nodiscard]] auto validate() const -> result<void> {
        if (concurrency && *concurrency == 0) {
            return unexpected(error{error_code::invalid_configuration,
                                    "concurrency must be positive"});
        }
        if (max_workers_per_session == 0) {
            return unexpected(error{error_code::invalid_configuration,
                                    "max workers per session must be positive"});
        }
        if (directory_workers == 0) {
            return unexpected(error{error_code::invalid_configuration,
                                    "directory workers must be positive"});
        }
        if (download_root.empty()) {
            return unexpected(error{error_code::invalid_configuration,
                                    "download root must not be empty"});
        }
        return options.validate();
    }

    /**
     * @brief Worker count for a batch
     *
     * Starts from concurrency (or the mode), caps at
     * sessions * max_workers_per_session and at the job count, and never
     * goes below 1.
     */
    [[nodiscard]] auto effective_concurrency(std::size_t session_count,
                                             std::size_t job_count) const -> std::size_t;
};

}  // namespace kcenon::file_ripper

#endif  // KCENON_FILE_RIPPER_ENGINE_ENGINE_TYPES_H
