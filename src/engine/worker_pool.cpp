/**
 * @file worker_pool.cpp
 * @brief Implementation of the worker swarm
 */

#include "kcenon/file_ripper/engine/worker_pool.h"

#include <kcenon/file_ripper/adapters/thread_pool_adapter.h>
#include <kcenon/file_ripper/core/logging.h>

#include <future>
#include <system_error>

namespace kcenon::file_ripper {

worker_pool::worker_pool(std::size_t concurrency,
                         job_queue& queue,
                         chunked_transfer& transfer,
                         std::shared_ptr<progress_monitor> monitor,
                         const std::atomic<bool>& cancelled)
    : concurrency_(concurrency > 0 ? concurrency : 1),
      queue_(queue),
      transfer_(transfer),
      monitor_(std::move(monitor)),
      cancelled_(cancelled) {}

worker_pool::~worker_pool() = default;

void worker_pool::set_failure_callback(failure_callback callback) {
    on_failure_ = std::move(callback);
}

auto worker_pool::run(const std::vector<std::shared_ptr<remote_transport>>& sessions)
    -> result<session_plan> {
    if (sessions.empty()) {
        return unexpected(error{error_code::no_active_sessions});
    }

    auto plan = session_plan::round_robin(concurrency_, sessions.size());

    FR_LOG_INFO(log_category::worker,
                "starting " + std::to_string(concurrency_) + " workers on " +
                std::to_string(sessions.size()) + " sessions (max " +
                std::to_string(plan.max_workers_per_session()) + " per session)");

    if (monitor_) {
        monitor_->set_running(true);
    }

    auto pool = adapters::transfer_pool_factory::create(concurrency_, "transfer_workers");
    std::vector<std::future<void>> workers;
    workers.reserve(concurrency_);

    for (std::size_t i = 0; i < concurrency_; ++i) {
        auto session_index = plan.session_for(i);
        auto* session = sessions[session_index].get();
        try {
            workers.push_back(pool->submit_to_stage(
                [this, i, session_index, session]() { worker_loop(i, session_index, *session); },
                stage_name));
        } catch (const std::system_error& e) {
            // Fewer workers than planned still drain the whole queue
            FR_LOG_ERROR(log_category::worker,
                         "cannot start worker " + std::to_string(i) + ": " + e.what());
            exited_.fetch_add(1);
        }
    }

    for (auto& worker : workers) {
        try {
            worker.get();
        } catch (const std::exception& e) {
            FR_LOG_ERROR(log_category::worker, std::string("worker terminated: ") + e.what());
        }
    }
    pool->shutdown();

    if (monitor_) {
        monitor_->set_running(false);
    }

    FR_LOG_INFO(log_category::worker,
                "workers finished: " + std::to_string(succeeded_.load()) + " succeeded, " +
                std::to_string(failed_.load()) + " failed");
    return plan;
}

void worker_pool::worker_loop(std::size_t worker_id, std::size_t session_index,
                              remote_transport& session) {
    while (!cancelled_.load(std::memory_order_relaxed)) {
        auto job = queue_.pop();
        if (!job) {
            break;
        }

        if (monitor_) {
            monitor_->set_current_file(job->remote_path);
        }

        result<void> outcome;
        try {
            outcome = transfer_.execute(*job, session);
        } catch (const std::exception& e) {
            outcome = unexpected(error{error_code::internal_error, e.what()});
        }

        if (outcome.has_value()) {
            succeeded_.fetch_add(1, std::memory_order_relaxed);
            if (monitor_) {
                monitor_->inc_file_done();
            }
            continue;
        }

        failed_.fetch_add(1, std::memory_order_relaxed);
        if (outcome.error().code == error_code::transfer_cancelled) {
            continue;
        }

        transfer_log_context ctx;
        ctx.path = job->remote_path;
        ctx.direction = to_string(job->direction);
        ctx.worker_id = worker_id;
        ctx.session_index = session_index;
        ctx.error_message = outcome.error().message;
        FR_LOG_DEBUG_CTX(log_category::worker, "job failed", ctx);

        if (on_failure_) {
            on_failure_(*job, outcome.error());
        }
    }

    exited_.fetch_add(1, std::memory_order_acq_rel);
}

auto worker_pool::concurrency() const noexcept -> std::size_t {
    return concurrency_;
}

auto worker_pool::exited_workers() const noexcept -> std::size_t {
    return exited_.load();
}

auto worker_pool::jobs_succeeded() const noexcept -> std::size_t {
    return succeeded_.load();
}

auto worker_pool::jobs_failed() const noexcept -> std::size_t {
    return failed_.load();
}

}  // namespace kcenon::file_ripper
