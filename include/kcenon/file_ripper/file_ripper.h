/**
 * @file file_ripper.h
 * @brief Main header for the file_ripper library
 * @version 0.1.0
 *
 * This is the primary include file for the file_ripper library.
 *
 * @code
 * #include <kcenon/file_ripper/file_ripper.h>
 *
 * using namespace kcenon::file_ripper;
 *
 * session_list sessions;
 * for (int i = 0; i < 4; ++i) {
 *     sessions.push_back(std::make_shared<local_transport>("/mnt/mirror"));
 * }
 *
 * auto engine = transfer_engine::builder()
 *     .with_mode(transfer_mode::boost)
 *     .build();
 * auto report = engine.value().start_upload(sessions, "./photos", "backup");
 * @endcode
 */

#ifndef KCENON_FILE_RIPPER_FILE_RIPPER_H
#define KCENON_FILE_RIPPER_FILE_RIPPER_H

#include <string>

// Core
#include "kcenon/file_ripper/core/types.h"
#include "kcenon/file_ripper/core/checksum.h"
#include "kcenon/file_ripper/core/job_queue.h"
#include "kcenon/file_ripper/core/logging.h"
#include "kcenon/file_ripper/core/multipart_plan.h"
#include "kcenon/file_ripper/core/progress_monitor.h"
#include "kcenon/file_ripper/core/remote_path.h"

// Transport
#include "kcenon/file_ripper/transport/transport_interface.h"
#include "kcenon/file_ripper/transport/local_transport.h"
#include "kcenon/file_ripper/transport/remote_search.h"

// Engine
#include "kcenon/file_ripper/engine/engine_types.h"
#include "kcenon/file_ripper/engine/chunked_transfer.h"
#include "kcenon/file_ripper/engine/transfer_engine.h"

// Adapters
#include "kcenon/file_ripper/adapters/thread_pool_adapter.h"

namespace kcenon::file_ripper {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::file_ripper

#endif  // KCENON_FILE_RIPPER_FILE_RIPPER_H
