/**
 * @file progress_monitor.cpp
 * @brief Implementation of the shared progress monitor
 */

#include "kcenon/file_ripper/core/progress_monitor.h"

#include <kcenon/file_ripper/core/logging.h>

#include <algorithm>
#include <atomic>
#include <iomanip>
#include <mutex>
#include <sstream>

namespace kcenon::file_ripper {

namespace {

constexpr double BYTES_PER_MIB = 1024.0 * 1024.0;

}  // namespace

auto transfer_stats::to_json() const -> std::string {
    std::ostringstream oss;
    oss << "{\"total_files\":" << total_files
        << ",\"files_done\":" << files_done
        << ",\"total_bytes\":" << total_bytes
        << ",\"bytes_done\":" << bytes_done
        << std::fixed << std::setprecision(2)
        << ",\"progress_percent\":" << progress_percent
        << ",\"speed_mb_s\":" << speed_mbs
        << ",\"current_file\":\"" << detail::escape_json(current_file) << "\""
        << ",\"is_running\":" << (is_running ? "true" : "false")
        << "}";
    return oss.str();
}

struct progress_monitor::impl {
    config cfg;

    std::atomic<uint64_t> total_files{0};
    std::atomic<uint64_t> files_done{0};
    std::atomic<uint64_t> total_bytes{0};
    std::atomic<uint64_t> bytes_done{0};
    std::atomic<uint64_t> epoch{0};

    // Guards the fields below, never the counters above
    mutable std::mutex mutex;
    std::string current_file;
    bool running{false};

    // Speed baseline, advanced by get_stats()
    mutable uint64_t last_bytes{0};
    mutable std::chrono::steady_clock::time_point last_check{std::chrono::steady_clock::now()};
    mutable double current_speed{0.0};

    impl() : cfg{} {}
    explicit impl(config c) : cfg(c) {}
};

progress_monitor::progress_monitor()
    : impl_(std::make_unique<impl>()) {}

progress_monitor::progress_monitor(config cfg)
    : impl_(std::make_unique<impl>(cfg)) {}

progress_monitor::progress_monitor(progress_monitor&&) noexcept = default;
auto progress_monitor::operator=(progress_monitor&&) noexcept -> progress_monitor& = default;
progress_monitor::~progress_monitor() = default;

void progress_monitor::reset(uint64_t total_files, uint64_t total_bytes) {
    std::lock_guard<std::mutex> lock(impl_->mutex);

    impl_->total_files.store(total_files);
    impl_->total_bytes.store(total_bytes);
    impl_->files_done.store(0);
    impl_->bytes_done.store(0);
    impl_->epoch.fetch_add(1);

    impl_->current_file = std::string(initializing_placeholder);
    impl_->running = true;
    impl_->last_bytes = 0;
    impl_->last_check = std::chrono::steady_clock::now();
    impl_->current_speed = 0.0;

    FR_LOG_DEBUG(log_category::monitor,
                 "monitor reset: " + std::to_string(total_files) + " files, " +
                 std::to_string(total_bytes) + " bytes");
}

void progress_monitor::add_bytes(uint64_t bytes) noexcept {
    impl_->bytes_done.fetch_add(bytes, std::memory_order_relaxed);
}

void progress_monitor::inc_file_done() noexcept {
    impl_->files_done.fetch_add(1, std::memory_order_relaxed);
}

void progress_monitor::set_current_file(std::string name) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->current_file = std::move(name);
}

void progress_monitor::set_running(bool running) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->running = running;
}

auto progress_monitor::is_running() const -> bool {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->running;
}

auto progress_monitor::epoch() const noexcept -> uint64_t {
    return impl_->epoch.load();
}

auto progress_monitor::get_stats() const -> transfer_stats {
    std::lock_guard<std::mutex> lock(impl_->mutex);

    auto now = std::chrono::steady_clock::now();
    uint64_t bytes_now = impl_->bytes_done.load();
    uint64_t total_bytes = impl_->total_bytes.load();

    auto elapsed = now - impl_->last_check;
    if (elapsed >= impl_->cfg.speed_sample_interval) {
        double seconds = std::chrono::duration<double>(elapsed).count();
        uint64_t diff = bytes_now >= impl_->last_bytes ? bytes_now - impl_->last_bytes : 0;
        impl_->current_speed = seconds > 0.0
            ? (static_cast<double>(diff) / BYTES_PER_MIB) / seconds
            : 0.0;

        impl_->last_bytes = bytes_now;
        impl_->last_check = now;
    }

    transfer_stats stats;
    stats.total_files = impl_->total_files.load();
    stats.files_done = impl_->files_done.load();
    stats.total_bytes = total_bytes;
    stats.bytes_done = bytes_now;
    if (total_bytes > 0) {
        stats.progress_percent = std::min(
            100.0, static_cast<double>(bytes_now) / static_cast<double>(total_bytes) * 100.0);
    }
    stats.speed_mbs = impl_->current_speed;
    stats.current_file = impl_->current_file;
    stats.is_running = impl_->running;
    stats.epoch = impl_->epoch.load();
    return stats;
}

}  // namespace kcenon::file_ripper
