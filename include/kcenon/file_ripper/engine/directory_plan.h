/**
 * @file directory_plan.h
 * @brief Ordering and parallel creation of the destination directory set
 */

#ifndef KCENON_FILE_RIPPER_ENGINE_DIRECTORY_PLAN_H
#define KCENON_FILE_RIPPER_ENGINE_DIRECTORY_PLAN_H

#include <atomic>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

#include "kcenon/file_ripper/core/types.h"
#include "kcenon/file_ripper/transport/transport_interface.h"

namespace kcenon::file_ripper {

/**
 * @brief Order directories by ascending path length
 *
 * Cheap parent-before-child approximation: a parent is always shorter than
 * its child. Equal-length entries keep their scan order.
 */
void sort_directory_plan(std::vector<std::string>& directories);

/**
 * @brief Directory that could not be created
 */
struct directory_failure {
    std::string path;
    error err;
};

/**
 * @brief Outcome of the directory phase
 */
struct directory_phase_result {
    std::size_t planned = 0;
    std::size_t created = 0;
    std::vector<directory_failure> failures;
    bool cancelled = false;
};

/**
 * @brief Called from a directory worker for each failed entry
 */
using directory_failure_callback = std::function<void(const std::string&, const error&)>;

/**
 * @brief Create every planned directory with a small pool of workers
 *
 * Workers drain the plan in order and all share one session. The call
 * returns only after every worker has finished, so it acts as the barrier
 * before any file transfer starts. Entries not yet started when the
 * cancellation flag is raised are skipped.
 *
 * @param session Session used by all directory workers
 * @param directories Plan, already sorted
 * @param workers Number of directory workers
 * @param cancelled Shared cancellation flag
 * @param on_failure Optional per-failure hook
 */
[[nodiscard]] auto create_directories(remote_transport& session,
                                      const std::vector<std::string>& directories,
                                      std::size_t workers,
                                      const std::atomic<bool>& cancelled,
                                      const directory_failure_callback& on_failure = {})
    -> directory_phase_result;

}  // namespace kcenon::file_ripper

#endif  // KCENON_FILE_RIPPER_ENGINE_DIRECTORY_PLAN_H
