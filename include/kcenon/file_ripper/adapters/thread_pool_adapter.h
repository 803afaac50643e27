// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.h
 * @brief Thread pool adapter for the file_ripper worker swarms
 *
 * The transfer workers and the directory-creation workers are long-running
 * drain loops, one task per worker. This adapter runs them either on a
 * thread_system thread_pool or, when thread_system is not built in, on
 * std::async threads.
 *
 * Features:
 * - Per-stage task accounting ("transfer", "mkdir") for tests and logs
 * - Seamless integration with thread_system when available
 * - Fallback to std::async when thread_system is unavailable
 */

#pragma once

#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <string>

#include "../config/feature_flags.h"

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/thread_pool.h>
#endif

namespace kcenon::file_ripper::adapters {

/**
 * @brief Task counts of one pipeline stage
 */
struct stage_counts {
    std::size_t submitted = 0;
    std::size_t pending = 0;    ///< Submitted but not yet finished
    std::size_t completed = 0;  ///< Finished, normally or by exception
};

/**
 * @brief Interface for thread pool operations in file_ripper
 *
 * Exceptions thrown by a task are captured in its future; callers must
 * get() every future they hold so none is lost.
 */
class transfer_thread_pool_interface {
public:
    virtual ~transfer_thread_pool_interface() = default;

    /**
     * @brief Submit a task for execution
     * @param task The task to execute
     * @return Future for the task completion
     */
    virtual std::future<void> submit(std::function<void()> task) = 0;

    /**
     * @brief Submit a task accounted under a stage name
     * @param task The task to execute
     * @param stage_name Name of the stage (e.g. "transfer")
     * @return Future for the task completion
     */
    virtual std::future<void> submit_to_stage(
        std::function<void()> task,
        const std::string& stage_name) = 0;

    /**
     * @brief Number of tasks that may run at the same time
     */
    [[nodiscard]] virtual std::size_t worker_count() const = 0;

    [[nodiscard]] virtual bool is_running() const = 0;

    /**
     * @brief Snapshot of the accounting for one stage
     */
    [[nodiscard]] virtual stage_counts stage(const std::string& stage_name) const = 0;

    /**
     * @brief Stop accepting work and join the workers
     *
     * Already queued tasks are finished first.
     */
    virtual void shutdown() = 0;
};

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Adapter that wraps thread_system::thread_pool
 *
 * @note Thread-safe: All public methods are safe to call from multiple threads.
 */
class thread_system_transfer_adapter : public transfer_thread_pool_interface {
public:
    /**
     * @brief Construct with a started thread_pool
     * @param pool Shared pointer to thread_system's thread_pool
     * @param pool_name Name for identification in logs
     * @param worker_count Number of workers in the pool
     */
    thread_system_transfer_adapter(
        std::shared_ptr<kcenon::thread::thread_pool> pool,
        const std::string& pool_name,
        std::size_t worker_count);

    ~thread_system_transfer_adapter() override;

    // Non-copyable
    thread_system_transfer_adapter(const thread_system_transfer_adapter&) = delete;
    thread_system_transfer_adapter& operator=(const thread_system_transfer_adapter&) = delete;

    /**
     * @brief Create a pool with exactly worker_count workers and start it
     */
    [[nodiscard]] static std::shared_ptr<thread_system_transfer_adapter> create(
        std::size_t worker_count,
        const std::string& pool_name);

    std::future<void> submit(std::function<void()> task) override;
    std::future<void> submit_to_stage(
        std::function<void()> task,
        const std::string& stage_name) override;

    [[nodiscard]] std::size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] stage_counts stage(const std::string& stage_name) const override;
    void shutdown() override;

    [[nodiscard]] std::shared_ptr<kcenon::thread::thread_pool> underlying_pool() const;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

#endif  // KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Fallback implementation using std::async
 *
 * Every task gets its own thread, so worker_count() only reports the size
 * the pool was created for; callers bound concurrency by the number of
 * tasks they submit.
 */
class async_transfer_pool : public transfer_thread_pool_interface {
public:
    explicit async_transfer_pool(std::size_t worker_count = 0);
    ~async_transfer_pool() override;

    // Non-copyable
    async_transfer_pool(const async_transfer_pool&) = delete;
    async_transfer_pool& operator=(const async_transfer_pool&) = delete;

    std::future<void> submit(std::function<void()> task) override;
    std::future<void> submit_to_stage(
        std::function<void()> task,
        const std::string& stage_name) override;

    [[nodiscard]] std::size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] stage_counts stage(const std::string& stage_name) const override;
    void shutdown() override;

private:
    struct impl;
    std::shared_ptr<impl> pimpl_;
};

/**
 * @brief Factory for creating the appropriate thread pool adapter
 *
 * Selects thread_system_transfer_adapter when KCENON_WITH_THREAD_SYSTEM is
 * set and async_transfer_pool otherwise.
 */
class transfer_pool_factory {
public:
    /**
     * @brief Create the best available thread pool adapter
     * @param worker_count Number of worker threads (0 = hardware concurrency)
     * @param pool_name Name for identification
     * @return Shared pointer to the adapter
     */
    [[nodiscard]] static std::shared_ptr<transfer_thread_pool_interface> create(
        std::size_t worker_count,
        const std::string& pool_name = "file_ripper_pool");

    [[nodiscard]] static constexpr bool has_thread_system() noexcept {
#if KCENON_WITH_THREAD_SYSTEM
        return true;
#else
        return false;
#endif
    }
};

}  // namespace kcenon::file_ripper::adapters
