/**
 * @file chunked_transfer.h
 * @brief Per-job transfer algorithm: single stream or multipart, with retry
 */

#ifndef KCENON_FILE_RIPPER_ENGINE_CHUNKED_TRANSFER_H
#define KCENON_FILE_RIPPER_ENGINE_CHUNKED_TRANSFER_H

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

#include "kcenon/file_ripper/core/job_queue.h"
#include "kcenon/file_ripper/core/multipart_plan.h"
#include "kcenon/file_ripper/core/progress_monitor.h"
#include "kcenon/file_ripper/core/types.h"
#include "kcenon/file_ripper/transport/transport_interface.h"

namespace kcenon::file_ripper {

/**
 * @brief Counters describing which paths the algorithm took
 */
struct chunked_transfer_counters {
    uint64_t single_stream_attempts = 0;
    uint64_t multipart_attempts = 0;
    uint64_t multipart_fallbacks = 0;
    uint64_t verified_ranges = 0;
};

/**
 * @brief Moves one file between the local filesystem and a session
 *
 * Downloads always stream. Uploads at or above the multipart threshold first
 * try a parallel ranged upload; if any range fails the whole attempt is
 * abandoned and the file is re-sent with the single-stream algorithm, which
 * has its own full set of attempts. Every streamed byte is added to the
 * monitor, including bytes of failed attempts.
 *
 * One instance is shared by all workers of an operation. All methods are
 * thread-safe as long as each call uses a session the caller is bound to.
 *
 * @code
 * std::atomic<bool> cancelled{false};
 * chunked_transfer transfer(transfer_options{}, monitor, cancelled);
 * auto result = transfer.execute(job, *session);
 * @endcode
 */
class chunked_transfer {
public:
    chunked_transfer(transfer_options options,
                     std::shared_ptr<progress_monitor> monitor,
                     const std::atomic<bool>& cancelled);

    ~chunked_transfer();

    chunked_transfer(const chunked_transfer&) = delete;
    auto operator=(const chunked_transfer&) -> chunked_transfer& = delete;

    /**
     * @brief Run a queued job in its direction
     */
    [[nodiscard]] auto execute(const transfer_job& job, remote_transport& session)
        -> result<void>;

    /**
     * @brief Upload with multipart attempt and single-stream fallback
     */
    [[nodiscard]] auto upload(const std::filesystem::path& local_path,
                              const std::string& remote_path,
                              remote_transport& session) -> result<void>;

    /**
     * @brief Download with retry; the destination is overwritten each attempt
     */
    [[nodiscard]] auto download(const std::string& remote_path,
                                const std::filesystem::path& local_path,
                                remote_transport& session) -> result<void>;

    /**
     * @brief One multipart attempt, no retry and no fallback
     */
    [[nodiscard]] auto upload_multipart(const std::filesystem::path& local_path,
                                        const std::string& remote_path,
                                        remote_transport& session) -> result<void>;

    /**
     * @brief Single-stream upload with retry, no multipart
     */
    [[nodiscard]] auto upload_single_stream(const std::filesystem::path& local_path,
                                            const std::string& remote_path,
                                            remote_transport& session) -> result<void>;

    [[nodiscard]] auto options() const -> const transfer_options&;
    [[nodiscard]] auto counters() const -> chunked_transfer_counters;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::file_ripper

#endif  // KCENON_FILE_RIPPER_ENGINE_CHUNKED_TRANSFER_H
