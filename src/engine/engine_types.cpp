/**
 * @file engine_types.cpp
 * @brief Session planning and concurrency sizing
 */

#include "kcenon/file_ripper/engine/engine_types.h"

#include <algorithm>

namespace kcenon::file_ripper {

auto session_plan::round_robin(std::size_t workers, std::size_t sessions) -> session_plan {
    session_plan plan;
    plan.session_count = sessions;
    if (sessions == 0) {
        return plan;
    }

    plan.worker_to_session.reserve(workers);
    for (std::size_t i = 0; i < workers; ++i) {
        plan.worker_to_session.push_back(i % sessions);
    }
    return plan;
}

auto session_plan::max_workers_per_session() const -> std::size_t {
    if (session_count == 0) {
        return 0;
    }
    std::vector<std::size_t> load(session_count, 0);
    for (auto session : worker_to_session) {
        if (session < load.size()) {
            ++load[session];
        }
    }
    return *std::max_element(load.begin(), load.end());
}

auto engine_config::effective_concurrency(std::size_t session_count,
                                          std::size_t job_count) const -> std::size_t {
    std::size_t workers = concurrency.value_or(mode_concurrency(mode));

    if (session_count > 0) {
        workers = std::min(workers, session_count * max_workers_per_session);
    }
    if (job_count > 0) {
        workers = std::min(workers, job_count);
    }
    return std::max<std::size_t>(workers, 1);
}

}  // namespace kcenon::file_ripper
