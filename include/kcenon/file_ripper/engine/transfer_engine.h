/**
 * @file transfer_engine.h
 * @brief Orchestrates whole upload and download operations
 */

#ifndef KCENON_FILE_RIPPER_ENGINE_TRANSFER_ENGINE_H
#define KCENON_FILE_RIPPER_ENGINE_TRANSFER_ENGINE_H

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "kcenon/file_ripper/core/multipart_plan.h"
#include "kcenon/file_ripper/core/progress_monitor.h"
#include "kcenon/file_ripper/core/types.h"
#include "kcenon/file_ripper/engine/engine_types.h"
#include "kcenon/file_ripper/transport/transport_interface.h"

namespace kcenon::file_ripper {

/// Sessions handed to one operation; worker i uses session i mod size()
using session_list = std::vector<std::shared_ptr<remote_transport>>;

/**
 * @brief Parallel bulk transfer engine
 *
 * Each operation scans its source, replicates the directory structure,
 * queues one job per file and drains the queue with a worker pool spread
 * over the given sessions. Operations on one engine run one at a time;
 * cancel() may be called from any thread.
 *
 * @code
 * auto monitor = std::make_shared<progress_monitor>();
 * auto engine_result = transfer_engine::builder()
 *     .with_mode(transfer_mode::conservative)
 *     .with_monitor(monitor)
 *     .build();
 *
 * if (engine_result.has_value()) {
 *     auto& engine = engine_result.value();
 *     auto report = engine.start_upload(sessions, "./photos", "backup");
 * }
 * @endcode
 */
class transfer_engine {
public:
    /**
     * @brief Builder for transfer_engine
     */
    class builder {
    public:
        builder();

        /**
         * @brief Set the worker-pool preset (default: boost)
         */
        auto with_mode(transfer_mode mode) -> builder&;

        /**
         * @brief Use an explicit worker count instead of the mode's
         */
        auto with_concurrency(std::size_t workers) -> builder&;

        /**
         * @brief Cap on workers bound to one session (default: 32)
         */
        auto with_max_workers_per_session(std::size_t workers) -> builder&;

        /**
         * @brief Size of the directory-creation pool (default: 8)
         */
        auto with_directory_workers(std::size_t workers) -> builder&;

        /**
         * @brief How non-fatal failures are handled (default: collect_warnings)
         */
        auto with_failure_policy(failure_policy policy) -> builder&;

        /**
         * @brief Local root for downloads (default: "dump")
         */
        auto with_download_root(std::filesystem::path root) -> builder&;

        auto with_transfer_options(const transfer_options& options) -> builder&;

        /**
         * @brief Share a monitor with observers; one is created otherwise
         */
        auto with_monitor(std::shared_ptr<progress_monitor> monitor) -> builder&;

        /**
         * @brief Build the engine instance
         * @return Result containing the engine or invalid_configuration
         */
        [[nodiscard]] auto build() -> result<transfer_engine>;

    private:
        engine_config config_;
        std::shared_ptr<progress_monitor> monitor_;
    };

    // Non-copyable, movable
    transfer_engine(const transfer_engine&) = delete;
    auto operator=(const transfer_engine&) -> transfer_engine& = delete;
    transfer_engine(transfer_engine&&) noexcept;
    auto operator=(transfer_engine&&) noexcept -> transfer_engine&;
    ~transfer_engine();

    /**
     * @brief Upload a local file or directory below a remote directory
     *
     * The source keeps its own name: uploading "photos" into "backup"
     * produces "backup/photos/...". Zero files is a successful no-op that
     * leaves the monitor untouched.
     *
     * @param sessions Established sessions; must not be empty
     * @param source_path Local file or directory
     * @param dest_path Remote directory
     */
    [[nodiscard]] auto start_upload(const session_list& sessions,
                                    const std::filesystem::path& source_path,
                                    const std::string& dest_path) -> result<transfer_report>;

    /**
     * @brief Download a remote file or directory into the download root
     *
     * A bare name that does not exist verbatim is looked up case-insensitively
     * up to three levels below the remote working directory.
     */
    [[nodiscard]] auto start_download(const session_list& sessions,
                                      const std::string& source_path) -> result<transfer_report>;

    /**
     * @brief Download into local_root instead of the configured root
     */
    [[nodiscard]] auto start_download(const session_list& sessions,
                                      const std::string& source_path,
                                      const std::filesystem::path& local_root)
        -> result<transfer_report>;

    /**
     * @brief Upload exactly one file to an exact remote path, without a scan
     */
    [[nodiscard]] auto upload_one(const session_list& sessions,
                                  const std::filesystem::path& local_path,
                                  const std::string& remote_path) -> result<transfer_report>;

    /**
     * @brief Download exactly one file to an exact local path, without a scan
     */
    [[nodiscard]] auto download_one(const session_list& sessions,
                                    const std::string& remote_path,
                                    const std::filesystem::path& local_path)
        -> result<transfer_report>;

    /**
     * @brief Direction-dispatching entry point
     *
     * For downloads dest is the local root; an empty dest uses the
     * configured download root.
     */
    [[nodiscard]] auto start_transfer(const session_list& sessions,
                                      transfer_direction direction,
                                      const std::string& source,
                                      const std::string& dest) -> result<transfer_report>;

    /**
     * @brief Change the preset for the next operation
     */
    void set_mode(transfer_mode mode);
    [[nodiscard]] auto mode() const -> transfer_mode;

    /**
     * @brief Stop the running operation at the next checkpoint
     *
     * Partially written files are left in place. The operation returns
     * transfer_cancelled. Only the operation currently running is affected:
     * every operation clears the flag once it starts, including calls that
     * were waiting for the running one to finish.
     */
    void cancel();

    [[nodiscard]] auto is_cancelled() const -> bool;

    /**
     * @brief Worker-to-session assignment of the last batch
     */
    [[nodiscard]] auto last_session_plan() const -> session_plan;

    [[nodiscard]] auto monitor() const -> std::shared_ptr<progress_monitor>;
    /**
     * @brief Copy of the current configuration
     */
    [[nodiscard]] auto config() const -> engine_config;

private:
    transfer_engine(engine_config config, std::shared_ptr<progress_monitor> monitor);

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::file_ripper

#endif  // KCENON_FILE_RIPPER_ENGINE_TRANSFER_ENGINE_H
