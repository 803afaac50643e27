/**
 * @file directory_plan.cpp
 * @brief Implementation of the directory phase
 */

#include "kcenon/file_ripper/engine/directory_plan.h"

#include <kcenon/file_ripper/adapters/thread_pool_adapter.h>
#include <kcenon/file_ripper/core/logging.h>

#include <algorithm>
#include <future>
#include <mutex>
#include <system_error>

namespace kcenon::file_ripper {

void sort_directory_plan(std::vector<std::string>& directories) {
    std::stable_sort(directories.begin(), directories.end(),
                     [](const std::string& a, const std::string& b) {
                         return a.size() < b.size();
                     });
}

auto create_directories(remote_transport& session,
                        const std::vector<std::string>& directories,
                        std::size_t workers,
                        const std::atomic<bool>& cancelled,
                        const directory_failure_callback& on_failure)
    -> directory_phase_result {
    directory_phase_result outcome;
    outcome.planned = directories.size();
    if (directories.empty()) {
        return outcome;
    }

    workers = std::clamp<std::size_t>(workers, 1, directories.size());

    std::atomic<std::size_t> next{0};
    std::atomic<std::size_t> created{0};
    std::mutex failures_mutex;

    auto drain = [&]() {
        while (!cancelled.load(std::memory_order_relaxed)) {
            auto index = next.fetch_add(1);
            if (index >= directories.size()) {
                break;
            }

            const auto& dir = directories[index];
            auto made = session.mkdir_all(dir);
            if (made.has_value()) {
                created.fetch_add(1, std::memory_order_relaxed);
                continue;
            }

            {
                std::lock_guard<std::mutex> lock(failures_mutex);
                outcome.failures.push_back(directory_failure{dir, made.error()});
            }
            if (on_failure) {
                on_failure(dir, made.error());
            }
        }
    };

    auto pool = adapters::transfer_pool_factory::create(workers, "directory_workers");
    std::vector<std::future<void>> tasks;
    tasks.reserve(workers);

    for (std::size_t i = 0; i < workers; ++i) {
        try {
            tasks.push_back(pool->submit_to_stage(drain, "mkdir"));
        } catch (const std::system_error& e) {
            FR_LOG_ERROR(log_category::engine,
                         std::string("cannot start directory worker: ") + e.what());
        }
    }

    if (tasks.empty()) {
        // No worker could start; drain on the calling thread
        drain();
    }

    for (auto& task : tasks) {
        try {
            task.get();
        } catch (const std::exception& e) {
            FR_LOG_ERROR(log_category::engine,
                         std::string("directory worker terminated: ") + e.what());
        }
    }
    pool->shutdown();

    outcome.created = created.load();
    outcome.cancelled = cancelled.load();

    FR_LOG_DEBUG(log_category::engine,
                 "directory phase: " + std::to_string(outcome.created) + "/" +
                 std::to_string(outcome.planned) + " created, " +
                 std::to_string(outcome.failures.size()) + " failed");
    return outcome;
}

}  // namespace kcenon::file_ripper
