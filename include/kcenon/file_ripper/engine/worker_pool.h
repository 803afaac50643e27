/**
 * @file worker_pool.h
 * @brief Fixed-size worker swarm draining a job queue
 */

#ifndef KCENON_FILE_RIPPER_ENGINE_WORKER_POOL_H
#define KCENON_FILE_RIPPER_ENGINE_WORKER_POOL_H

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <vector>

#include "kcenon/file_ripper/core/job_queue.h"
#include "kcenon/file_ripper/core/progress_monitor.h"
#include "kcenon/file_ripper/core/types.h"
#include "kcenon/file_ripper/engine/chunked_transfer.h"
#include "kcenon/file_ripper/engine/engine_types.h"
#include "kcenon/file_ripper/transport/transport_interface.h"

namespace kcenon::file_ripper {

/**
 * @brief Runs a batch of queued jobs on a fixed number of workers
 *
 * Worker i is bound to session plan.session_for(i) for the whole batch.
 * Each worker pops until the queue is empty or the cancellation flag is
 * set; a failed job is reported through the failure callback and the
 * worker moves on. run() blocks until every worker has exited.
 *
 * @code
 * worker_pool pool(8, queue, transfer, monitor, cancelled);
 * pool.set_failure_callback([](const transfer_job& job, const error& err) {
 *     // record or log
 * });
 * auto plan = pool.run(sessions);
 * @endcode
 */
class worker_pool {
public:
    /// Stage name the workers are accounted under
    static constexpr const char* stage_name = "transfer";

    using failure_callback = std::function<void(const transfer_job&, const error&)>;

    worker_pool(std::size_t concurrency,
                job_queue& queue,
                chunked_transfer& transfer,
                std::shared_ptr<progress_monitor> monitor,
                const std::atomic<bool>& cancelled);

    ~worker_pool();

    worker_pool(const worker_pool&) = delete;
    auto operator=(const worker_pool&) -> worker_pool& = delete;

    /**
     * @brief Called from the worker thread for every job that failed
     *
     * Not called for jobs interrupted by cancellation.
     */
    void set_failure_callback(failure_callback callback);

    /**
     * @brief Launch the workers and wait for all of them
     *
     * Sets the monitor running before launch and clears it after the last
     * worker exits.
     *
     * @return The session plan used, or no_active_sessions
     */
    [[nodiscard]] auto run(const std::vector<std::shared_ptr<remote_transport>>& sessions)
        -> result<session_plan>;

    [[nodiscard]] auto concurrency() const noexcept -> std::size_t;
    [[nodiscard]] auto exited_workers() const noexcept -> std::size_t;
    [[nodiscard]] auto jobs_succeeded() const noexcept -> std::size_t;
    [[nodiscard]] auto jobs_failed() const noexcept -> std::size_t;

private:
    void worker_loop(std::size_t worker_id, std::size_t session_index, remote_transport& session);

    std::size_t concurrency_;
    job_queue& queue_;
    chunked_transfer& transfer_;
    std::shared_ptr<progress_monitor> monitor_;
    const std::atomic<bool>& cancelled_;
    failure_callback on_failure_;

    std::atomic<std::size_t> exited_{0};
    std::atomic<std::size_t> succeeded_{0};
    std::atomic<std::size_t> failed_{0};
};

}  // namespace kcenon::file_ripper

#endif  // KCENON_FILE_RIPPER_ENGINE_WORKER_POOL_H
