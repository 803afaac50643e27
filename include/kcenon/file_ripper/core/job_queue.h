/**
 * @file job_queue.h
 * @brief Transfer job definition and the thread-safe FIFO feeding the workers
 */

#ifndef KCENON_FILE_RIPPER_CORE_JOB_QUEUE_H
#define KCENON_FILE_RIPPER_CORE_JOB_QUEUE_H

#include <kcenon/file_ripper/core/types.h>

#include <cstddef>
#include <deque>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

namespace kcenon::file_ripper {

/**
 * @brief One file's transfer unit
 */
struct transfer_job {
    std::filesystem::path local_path;
    std::string remote_path;
    transfer_direction direction = transfer_direction::upload;

    [[nodiscard]] auto operator==(const transfer_job& other) const -> bool = default;
};

/**
 * @brief Thread-safe FIFO of transfer jobs
 *
 * The queue is filled completely by the engine before any worker starts,
 * then drained. pop() never blocks: an empty queue means the worker is done.
 *
 * Invariant: popped_count() + count() == added_count().
 */
class job_queue {
public:
    job_queue() = default;

    job_queue(const job_queue&) = delete;
    auto operator=(const job_queue&) -> job_queue& = delete;

    /**
     * @brief Append a job at the tail
     */
    void add(transfer_job job);

    /**
     * @brief Remove and return the head job
     * @return The job, or std::nullopt when the queue is empty
     */
    [[nodiscard]] auto pop() -> std::optional<transfer_job>;

    /**
     * @brief Number of jobs still queued
     */
    [[nodiscard]] auto count() const -> std::size_t;

    [[nodiscard]] auto empty() const -> bool;

    [[nodiscard]] auto added_count() const -> std::size_t;
    [[nodiscard]] auto popped_count() const -> std::size_t;

private:
    mutable std::mutex mutex_;
    std::deque<transfer_job> jobs_;
    std::size_t added_ = 0;
    std::size_t popped_ = 0;
};

}  // namespace kcenon::file_ripper

#endif  // KCENON_FILE_RIPPER_CORE_JOB_QUEUE_H
