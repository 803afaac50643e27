// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.cpp
 * @brief Thread pool adapter implementation for file_ripper
 */

#include "kcenon/file_ripper/adapters/thread_pool_adapter.h"

#include <atomic>
#include <mutex>
#include <thread>
#include <unordered_map>

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/job.h>
#include <kcenon/thread/core/job_queue.h>
#include <kcenon/thread/core/thread_worker.h>
#endif

namespace kcenon::file_ripper::adapters {

namespace {

auto resolve_worker_count(std::size_t requested) -> std::size_t {
    if (requested > 0) {
        return requested;
    }
    auto hw = std::thread::hardware_concurrency();
    return hw > 0 ? hw : 4;
}

class stage_tracker {
public:
    void on_submit(const std::string& stage_name) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& counts = counts_[stage_name];
        ++counts.submitted;
        ++counts.pending;
    }

    void on_finish(const std::string& stage_name) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& counts = counts_[stage_name];
        if (counts.pending > 0) {
            --counts.pending;
        }
        ++counts.completed;
    }

    [[nodiscard]] stage_counts get(const std::string& stage_name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counts_.find(stage_name);
        return it != counts_.end() ? it->second : stage_counts{};
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, stage_counts> counts_;
};

// Runs task, settles promise, and never lets an exception escape
void run_settled(const std::function<void()>& task, std::promise<void>& promise) {
    try {
        task();
        promise.set_value();
    } catch (...) {
        promise.set_exception(std::current_exception());
    }
}

}  // namespace

// ============================================================================
// thread_system_transfer_adapter implementation
// ============================================================================

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Job that wraps a function for thread_system execution
 */
class function_job : public kcenon::thread::job {
public:
    explicit function_job(std::function<void()> func, const std::string& name)
        : job(name), func_(std::move(func)) {}

    [[nodiscard]] auto do_work() -> common::VoidResult override {
        if (func_) {
            func_();
        }
        return common::ok();
    }

private:
    std::function<void()> func_;
};

struct thread_system_transfer_adapter::impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::string pool_name;
    std::size_t worker_count{0};
    std::atomic<bool> running{true};
    stage_tracker tracker;
};

thread_system_transfer_adapter::thread_system_transfer_adapter(
    std::shared_ptr<kcenon::thread::thread_pool> pool,
    const std::string& pool_name,
    std::size_t worker_count)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->pool = std::move(pool);
    pimpl_->pool_name = pool_name;
    pimpl_->worker_count = worker_count;
}

thread_system_transfer_adapter::~thread_system_transfer_adapter() {
    shutdown();
}

std::shared_ptr<thread_system_transfer_adapter>
thread_system_transfer_adapter::create(std::size_t worker_count, const std::string& pool_name) {
    worker_count = resolve_worker_count(worker_count);

    auto pool = std::make_shared<kcenon::thread::thread_pool>(pool_name);

    for (std::size_t i = 0; i < worker_count; ++i) {
        auto worker = std::make_unique<kcenon::thread::thread_worker>();
        worker->set_job_queue(pool->get_job_queue());
        pool->enqueue(std::move(worker));
    }

    pool->start();

    return std::make_shared<thread_system_transfer_adapter>(std::move(pool), pool_name, worker_count);
}

std::future<void> thread_system_transfer_adapter::submit(std::function<void()> task) {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    auto wrapped_task = [task = std::move(task), promise]() {
        run_settled(task, *promise);
    };

    pimpl_->pool->enqueue(std::make_unique<function_job>(std::move(wrapped_task), "ripper_task"));
    return future;
}

std::future<void> thread_system_transfer_adapter::submit_to_stage(
    std::function<void()> task, const std::string& stage_name) {
    pimpl_->tracker.on_submit(stage_name);

    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    // The adapter outlives its tasks: shutdown() joins before impl is freed
    auto* tracker = &pimpl_->tracker;
    auto wrapped_task = [task = std::move(task), promise, tracker, stage = stage_name]() {
        run_settled(task, *promise);
        tracker->on_finish(stage);
    };

    pimpl_->pool->enqueue(
        std::make_unique<function_job>(std::move(wrapped_task), stage_name + "_task"));
    return future;
}

std::size_t thread_system_transfer_adapter::worker_count() const {
    return pimpl_->worker_count;
}

bool thread_system_transfer_adapter::is_running() const {
    return pimpl_->pool != nullptr && pimpl_->running.load();
}

stage_counts thread_system_transfer_adapter::stage(const std::string& stage_name) const {
    return pimpl_->tracker.get(stage_name);
}

void thread_system_transfer_adapter::shutdown() {
    if (pimpl_ && pimpl_->pool && pimpl_->running.exchange(false)) {
        pimpl_->pool->stop(false);
    }
}

std::shared_ptr<kcenon::thread::thread_pool>
thread_system_transfer_adapter::underlying_pool() const {
    return pimpl_->pool;
}

#endif  // KCENON_WITH_THREAD_SYSTEM

// ============================================================================
// async_transfer_pool implementation
// ============================================================================

struct async_transfer_pool::impl {
    std::size_t worker_count{0};
    std::atomic<bool> running{true};
    stage_tracker tracker;
};

async_transfer_pool::async_transfer_pool(std::size_t worker_count)
    : pimpl_(std::make_shared<impl>()) {
    pimpl_->worker_count = resolve_worker_count(worker_count);
}

async_transfer_pool::~async_transfer_pool() = default;

std::future<void> async_transfer_pool::submit(std::function<void()> task) {
    return std::async(std::launch::async, std::move(task));
}

std::future<void> async_transfer_pool::submit_to_stage(
    std::function<void()> task, const std::string& stage_name) {
    pimpl_->tracker.on_submit(stage_name);

    // Shared ownership: an async future may outlive the pool object
    auto state = pimpl_;
    return std::async(std::launch::async,
                      [state, task = std::move(task), stage = stage_name]() {
                          try {
                              task();
                          } catch (...) {
                              state->tracker.on_finish(stage);
                              throw;
                          }
                          state->tracker.on_finish(stage);
                      });
}

std::size_t async_transfer_pool::worker_count() const {
    return pimpl_->worker_count;
}

bool async_transfer_pool::is_running() const {
    return pimpl_->running.load();
}

stage_counts async_transfer_pool::stage(const std::string& stage_name) const {
    return pimpl_->tracker.get(stage_name);
}

void async_transfer_pool::shutdown() {
    // std::async futures join on their own; nothing is queued here
    pimpl_->running.store(false);
}

// ============================================================================
// transfer_pool_factory implementation
// ============================================================================

std::shared_ptr<transfer_thread_pool_interface> transfer_pool_factory::create(
    std::size_t worker_count, const std::string& pool_name) {
#if KCENON_WITH_THREAD_SYSTEM
    return thread_system_transfer_adapter::create(worker_count, pool_name);
#else
    (void)pool_name;
    return std::make_shared<async_transfer_pool>(worker_count);
#endif
}

}  // namespace kcenon::file_ripper::adapters
