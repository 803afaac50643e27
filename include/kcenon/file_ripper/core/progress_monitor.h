/**
 * @file progress_monitor.h
 * @brief Live progress counters shared by every worker of an operation
 *
 * The monitor is constructed by the caller and injected into the engine and
 * into whatever exposes stats (a dashboard, a polled API). It is reset, not
 * recreated, at the start of each operation.
 */

#ifndef KCENON_FILE_RIPPER_CORE_PROGRESS_MONITOR_H
#define KCENON_FILE_RIPPER_CORE_PROGRESS_MONITOR_H

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace kcenon::file_ripper {

/**
 * @brief Immutable snapshot returned by progress_monitor::get_stats()
 */
struct transfer_stats {
    uint64_t total_files = 0;
    uint64_t files_done = 0;
    uint64_t total_bytes = 0;
    uint64_t bytes_done = 0;
    double progress_percent = 0.0;  ///< bytes_done / total_bytes, clamped to 100
    double speed_mbs = 0.0;         ///< MiB/s over the last debounce window
    std::string current_file;       ///< Remote path of the last job a worker started
    bool is_running = false;
    uint64_t epoch = 0;             ///< Number of resets so far

    /**
     * @brief Render as the JSON body served to polling clients
     */
    [[nodiscard]] auto to_json() const -> std::string;
};

/**
 * @brief Shared transfer progress counters
 *
 * Numeric counters are lock-free atomics so workers can bump them from the
 * hot I/O loop. The current-file string, the running flag and the speed
 * baseline sit behind one short mutex.
 *
 * @code
 * auto monitor = std::make_shared<progress_monitor>();
 * monitor->reset(file_count, total_bytes);
 *
 * // From any worker
 * monitor->add_bytes(n);
 * monitor->inc_file_done();
 *
 * // From an observer
 * auto stats = monitor->get_stats();
 * @endcode
 */
class progress_monitor {
public:
    /// Current-file value between reset() and the first job pop
    static constexpr std::string_view initializing_placeholder = "Initializing...";

    struct config {
        std::chrono::milliseconds speed_sample_interval{500};  ///< Debounce for speed
    };

    progress_monitor();
    explicit progress_monitor(config cfg);

    progress_monitor(const progress_monitor&) = delete;
    auto operator=(const progress_monitor&) -> progress_monitor& = delete;
    progress_monitor(progress_monitor&&) noexcept;
    auto operator=(progress_monitor&&) noexcept -> progress_monitor&;

    ~progress_monitor();

    /**
     * @brief Start a new epoch
     *
     * Zeroes the counters, sets the placeholder current file, marks the
     * monitor running and restarts the speed baseline.
     */
    void reset(uint64_t total_files, uint64_t total_bytes);

    void add_bytes(uint64_t bytes) noexcept;
    void inc_file_done() noexcept;

    void set_current_file(std::string name);
    void set_running(bool running);

    [[nodiscard]] auto is_running() const -> bool;
    [[nodiscard]] auto epoch() const noexcept -> uint64_t;

    /**
     * @brief Take a snapshot
     *
     * Speed is recomputed only when at least config::speed_sample_interval
     * has elapsed since the previous sample; otherwise the last value is
     * reported again.
     */
    [[nodiscard]] auto get_stats() const -> transfer_stats;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::file_ripper

#endif  // KCENON_FILE_RIPPER_CORE_PROGRESS_MONITOR_H
