/**
 * @file transfer_engine.cpp
 * @brief Implementation of the transfer engine
 */

#include "kcenon/file_ripper/engine/transfer_engine.h"

#include <kcenon/file_ripper/core/job_queue.h>
#include <kcenon/file_ripper/core/logging.h>
#include <kcenon/file_ripper/core/remote_path.h>
#include <kcenon/file_ripper/engine/chunked_transfer.h>
#include <kcenon/file_ripper/engine/directory_plan.h>
#include <kcenon/file_ripper/engine/local_scanner.h>
#include <kcenon/file_ripper/engine/worker_pool.h>
#include <kcenon/file_ripper/transport/remote_search.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <system_error>

namespace kcenon::file_ripper {

namespace fs = std::filesystem;

namespace {

/// Local directory name used when the download target is the remote root
constexpr const char* fallback_root_name = "root_dump";

auto check_sessions(const session_list& sessions) -> result<void> {
    if (sessions.empty()) {
        return unexpected(error{error_code::no_active_sessions});
    }
    for (const auto& session : sessions) {
        if (!session) {
            return unexpected(error{error_code::no_active_sessions, "null session in list"});
        }
    }
    return {};
}

/**
 * @brief Warnings and abort reason of one running operation
 */
class operation_state {
public:
    operation_state(failure_policy policy, std::atomic<bool>& cancelled)
        : policy_(policy), cancelled_(cancelled) {}

    void on_failure(warning_kind kind, const std::string& path, const error& err) {
        // Anything failing after a stop was requested is fallout, not a finding
        if (cancelled_.load() || err.code == error_code::transfer_cancelled) {
            return;
        }

        switch (policy_) {
            case failure_policy::swallow:
                FR_LOG_DEBUG(log_category::engine,
                             std::string(to_string(kind)) + " failure ignored: " + path +
                             ": " + err.message);
                break;

            case failure_policy::collect_warnings: {
                FR_LOG_WARN(log_category::engine,
                            std::string(to_string(kind)) + " failed: " + path + ": " + err.message);
                std::lock_guard<std::mutex> lock(mutex_);
                warnings_.push_back(transfer_warning{kind, path, err});
                break;
            }

            case failure_policy::fail_fast: {
                std::lock_guard<std::mutex> lock(mutex_);
                if (!abort_reason_) {
                    FR_LOG_ERROR(log_category::engine,
                                 std::string(to_string(kind)) + " failed, aborting: " + path +
                                 ": " + err.message);
                    abort_reason_ = error{err.code, path + ": " + err.message};
                    cancelled_.store(true);
                }
                break;
            }
        }
    }

    void on_scan_issue(const std::string& path, const error& err) {
        if (policy_ != failure_policy::collect_warnings) {
            return;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        warnings_.push_back(transfer_warning{warning_kind::scan, path, err});
    }

    /**
     * @brief Terminal result: abort reason, cancellation, or the report
     */
    auto finish(transfer_report report) -> result<transfer_report> {
        std::lock_guard<std::mutex> lock(mutex_);
        if (abort_reason_) {
            return unexpected(*abort_reason_);
        }
        if (cancelled_.load()) {
            return unexpected(error{error_code::transfer_cancelled});
        }
        report.warnings = std::move(warnings_);
        return report;
    }

private:
    failure_policy policy_;
    std::atomic<bool>& cancelled_;
    std::mutex mutex_;
    std::vector<transfer_warning> warnings_;
    std::optional<error> abort_reason_;
};

}  // namespace

// ============================================================================
// transfer_engine::impl
// ============================================================================

struct transfer_engine::impl {
    engine_config config;
    std::shared_ptr<progress_monitor> monitor;

    std::atomic<bool> cancelled{false};

    // Serialises operations; cancel() never takes it
    std::mutex operation_mutex;

    mutable std::mutex state_mutex;
    session_plan last_plan;

    impl(engine_config cfg, std::shared_ptr<progress_monitor> mon)
        : config(std::move(cfg)), monitor(std::move(mon)) {}

    auto snapshot_config() const -> engine_config {
        std::lock_guard<std::mutex> lock(state_mutex);
        return config;
    }

    /**
     * @brief Reset the monitor, drain the queue and fill the report
     */
    auto run_batch(const session_list& sessions, const engine_config& cfg, job_queue& queue,
                   uint64_t total_bytes, operation_state& state, transfer_report& report)
        -> result<void> {
        const auto job_count = queue.count();

        report.total_files = job_count;
        report.total_bytes = total_bytes;
        monitor->reset(job_count, total_bytes);

        if (job_count == 0) {
            monitor->set_running(false);
            return {};
        }

        const auto concurrency = cfg.effective_concurrency(sessions.size(), job_count);
        report.concurrency = concurrency;

        chunked_transfer transfer(cfg.options, monitor, cancelled);
        worker_pool pool(concurrency, queue, transfer, monitor, cancelled);
        pool.set_failure_callback([&state](const transfer_job& job, const error& err) {
            auto path = job.direction == transfer_direction::upload ? job.local_path.string()
                                                                     : job.remote_path;
            state.on_failure(warning_kind::file, path, err);
        });

        auto started = std::chrono::steady_clock::now();
        auto plan = pool.run(sessions);
        if (!plan.has_value()) {
            return unexpected(plan.error());
        }

        {
            std::lock_guard<std::mutex> lock(state_mutex);
            last_plan = plan.value();
        }

        auto stats = monitor->get_stats();
        report.files_done = pool.jobs_succeeded();
        report.bytes_done = stats.bytes_done;

        auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - started);
        transfer_log_context ctx;
        ctx.direction = to_string(report.direction);
        ctx.bytes = report.bytes_done;
        ctx.duration_ms = static_cast<uint64_t>(elapsed.count() * 1000.0);
        if (elapsed.count() > 0.0) {
            ctx.rate_mbs = static_cast<double>(report.bytes_done) / (1024.0 * 1024.0) / elapsed.count();
        }
        FR_LOG_INFO_CTX(log_category::engine,
                        "batch finished: " + std::to_string(report.files_done) + "/" +
                        std::to_string(report.total_files) + " files",
                        ctx);
        return {};
    }

    auto upload(const session_list& sessions, const fs::path& source, const std::string& dest)
        -> result<transfer_report> {
        auto cfg = snapshot_config();
        operation_state state(cfg.on_failure, cancelled);

        transfer_report report;
        report.direction = transfer_direction::upload;

        local_scanner scanner(&cancelled);
        auto scanned = scanner.scan(source, dest);
        if (!scanned.has_value()) {
            if (scanned.error().code == error_code::transfer_cancelled) {
                return state.finish(std::move(report));
            }
            return unexpected(scanned.error());
        }
        auto& scan = scanned.value();

        for (const auto& issue : scan.issues) {
            state.on_scan_issue(issue.path, issue.err);
        }

        sort_directory_plan(scan.directories);
        report.directories_planned = scan.directories.size();

        auto dirs = create_directories(
            *sessions.front(), scan.directories, cfg.directory_workers, cancelled,
            [&state](const std::string& dir, const error& err) {
                state.on_failure(warning_kind::directory, dir,
                                 error{error_code::directory_create_failed, err.message});
            });
        report.directories_created = dirs.created;

        if (cancelled.load()) {
            return state.finish(std::move(report));
        }

        if (scan.files.empty()) {
            FR_LOG_INFO(log_category::engine, "nothing to upload from " + scan.source.string());
            return state.finish(std::move(report));
        }

        job_queue queue;
        for (auto& job : scan.files) {
            queue.add(std::move(job));
        }

        auto batch = run_batch(sessions, cfg, queue, scan.total_bytes, state, report);
        if (!batch.has_value()) {
            return unexpected(batch.error());
        }
        return state.finish(std::move(report));
    }

    /**
     * @brief Stat the target, falling back to a bounded name search
     */
    auto resolve_remote_target(remote_transport& session, const std::string& requested)
        -> result<std::pair<std::string, remote_file_info>> {
        auto target = requested.empty() ? std::string(".") : remote_path::clean(requested);

        auto info = session.stat(target);
        if (info.has_value()) {
            return std::make_pair(target, std::move(info).value());
        }

        auto name = remote_path::base_name(target);
        if (!requested.empty() && target != "." && remote_path::is_bare_name(requested)) {
            auto found = find_remote_path(session, session.working_directory(), name,
                                          default_search_depth);
            if (found) {
                FR_LOG_INFO(log_category::engine, "resolved " + requested + " to " + *found);
                auto found_info = session.stat(*found);
                if (found_info.has_value()) {
                    return std::make_pair(*found, std::move(found_info).value());
                }
            }
        }

        return unexpected(error{error_code::target_not_found,
                                "target not found: " + requested + " (" + info.error().message + ")"});
    }

    auto download(const session_list& sessions, const std::string& source,
                  const fs::path& local_root) -> result<transfer_report> {
        auto cfg = snapshot_config();
        operation_state state(cfg.on_failure, cancelled);

        transfer_report report;
        report.direction = transfer_direction::download;

        std::error_code ec;
        fs::create_directories(local_root, ec);
        if (ec) {
            return unexpected(error{error_code::directory_create_failed,
                                    "cannot create " + local_root.string() + ": " + ec.message()});
        }

        auto& session = *sessions.front();
        auto resolved = resolve_remote_target(session, source);
        if (!resolved.has_value()) {
            return unexpected(resolved.error());
        }
        const auto target = resolved.value().first;

        auto root_name = (target == "." || target == "/") ? std::string(fallback_root_name)
                                                          : remote_path::base_name(target);
        const auto local_base = local_root / root_name;

        job_queue queue;
        uint64_t total_bytes = 0;

        auto walked = session.walk(target, [&](const walk_entry& entry) {
            if (cancelled.load()) {
                return false;
            }
            if (entry.err) {
                FR_LOG_WARN(log_category::scan,
                            "skipping " + entry.path + ": " + entry.err->message);
                state.on_scan_issue(entry.path, *entry.err);
                return true;
            }

            auto rel = remote_path::relative(target, entry.path);
            auto local = rel == "." ? local_base : local_base / fs::path(rel);

            auto info = entry.info;
            if (info.is_symlink) {
                auto followed = session.stat(entry.path);
                if (!followed.has_value()) {
                    FR_LOG_WARN(log_category::scan,
                                "skipping broken link " + entry.path + ": " +
                                followed.error().message);
                    state.on_scan_issue(entry.path, followed.error());
                    return true;
                }
                info = std::move(followed).value();
            }

            if (info.is_dir) {
                ++report.directories_planned;
                std::error_code mk;
                fs::create_directories(local, mk);
                if (mk) {
                    state.on_failure(warning_kind::directory, local.string(),
                                     error{error_code::directory_create_failed, mk.message()});
                } else {
                    ++report.directories_created;
                }
                return true;
            }

            queue.add(transfer_job{local, entry.path, transfer_direction::download});
            total_bytes += info.size;
            return true;
        });
        if (!walked.has_value()) {
            return unexpected(error{error_code::target_not_found,
                                    "cannot walk " + target + ": " + walked.error().message});
        }
        if (cancelled.load()) {
            return state.finish(std::move(report));
        }

        auto batch = run_batch(sessions, cfg, queue, total_bytes, state, report);
        if (!batch.has_value()) {
            return unexpected(batch.error());
        }
        return state.finish(std::move(report));
    }

    auto upload_single(const session_list& sessions, const fs::path& local_path,
                       const std::string& remote) -> result<transfer_report> {
        auto cfg = snapshot_config();
        operation_state state(cfg.on_failure, cancelled);

        std::error_code ec;
        auto status = fs::status(local_path, ec);
        if (ec || !fs::exists(status)) {
            return unexpected(error{error_code::invalid_source_path,
                                    "source does not exist: " + local_path.string()});
        }
        if (fs::is_directory(status)) {
            return unexpected(error{error_code::source_is_directory,
                                    "source is a directory: " + local_path.string()});
        }
        auto size = fs::file_size(local_path, ec);
        if (ec) {
            return unexpected(error{error_code::invalid_source_path,
                                    "cannot size " + local_path.string() + ": " + ec.message()});
        }

        transfer_report report;
        report.direction = transfer_direction::upload;

        job_queue queue;
        queue.add(transfer_job{local_path, remote, transfer_direction::upload});

        auto batch = run_batch(sessions, cfg, queue, size, state, report);
        if (!batch.has_value()) {
            return unexpected(batch.error());
        }
        return state.finish(std::move(report));
    }

    auto download_single(const session_list& sessions, const std::string& remote,
                         const fs::path& local_path) -> result<transfer_report> {
        auto cfg = snapshot_config();
        operation_state state(cfg.on_failure, cancelled);

        auto info = sessions.front()->stat(remote);
        if (!info.has_value()) {
            return unexpected(info.error());
        }
        if (info.value().is_dir) {
            return unexpected(error{error_code::remote_is_directory,
                                    "remote path is a directory: " + remote});
        }

        if (local_path.has_parent_path()) {
            std::error_code ec;
            fs::create_directories(local_path.parent_path(), ec);
            if (ec) {
                return unexpected(error{error_code::directory_create_failed,
                                        "cannot create " + local_path.parent_path().string() +
                                        ": " + ec.message()});
            }
        }

        transfer_report report;
        report.direction = transfer_direction::download;

        job_queue queue;
        queue.add(transfer_job{local_path, remote, transfer_direction::download});

        auto batch = run_batch(sessions, cfg, queue, info.value().size, state, report);
        if (!batch.has_value()) {
            return unexpected(batch.error());
        }
        return state.finish(std::move(report));
    }
};

// ============================================================================
// transfer_engine::builder
// ============================================================================

transfer_engine::builder::builder() = default;

auto transfer_engine::builder::with_mode(transfer_mode mode) -> builder& {
    config_.mode = mode;
    return *this;
}

auto transfer_engine::builder::with_concurrency(std::size_t workers) -> builder& {
    config_.concurrency = workers;
    return *this;
}

auto transfer_engine::builder::with_max_workers_per_session(std::size_t workers) -> builder& {
    config_.max_workers_per_session = workers;
    return *this;
}

auto transfer_engine::builder::with_directory_workers(std::size_t workers) -> builder& {
    config_.directory_workers = workers;
    return *this;
}

auto transfer_engine::builder::with_failure_policy(failure_policy policy) -> builder& {
    config_.on_failure = policy;
    return *this;
}

auto transfer_engine::builder::with_download_root(fs::path root) -> builder& {
    config_.download_root = std::move(root);
    return *this;
}

auto transfer_engine::builder::with_transfer_options(const transfer_options& options)
    -> builder& {
    config_.options = options;
    return *this;
}

auto transfer_engine::builder::with_monitor(std::shared_ptr<progress_monitor> monitor)
    -> builder& {
    monitor_ = std::move(monitor);
    return *this;
}

auto transfer_engine::builder::build() -> result<transfer_engine> {
    auto valid = config_.validate();
    if (!valid.has_value()) {
        return unexpected(valid.error());
    }

    auto monitor = monitor_ ? monitor_ : std::make_shared<progress_monitor>();
    return transfer_engine{std::move(config_), std::move(monitor)};
}

// ============================================================================
// transfer_engine
// ============================================================================

transfer_engine::transfer_engine(engine_config config, std::shared_ptr<progress_monitor> monitor)
    : impl_(std::make_unique<impl>(std::move(config), std::move(monitor))) {
    get_logger().initialize();
}

transfer_engine::transfer_engine(transfer_engine&&) noexcept = default;
auto transfer_engine::operator=(transfer_engine&&) noexcept -> transfer_engine& = default;
transfer_engine::~transfer_engine() = default;

auto transfer_engine::start_upload(const session_list& sessions,
                                   const fs::path& source_path,
                                   const std::string& dest_path) -> result<transfer_report> {
    auto ready = check_sessions(sessions);
    if (!ready.has_value()) {
        return unexpected(ready.error());
    }

    std::lock_guard<std::mutex> lock(impl_->operation_mutex);
    impl_->cancelled.store(false);

    FR_LOG_INFO(log_category::engine,
                "upload " + source_path.string() + " -> " + dest_path + " (" +
                to_string(mode()) + ", " + std::to_string(sessions.size()) + " sessions)");
    return impl_->upload(sessions, source_path, dest_path);
}

auto transfer_engine::start_download(const session_list& sessions,
                                     const std::string& source_path) -> result<transfer_report> {
    return start_download(sessions, source_path, config().download_root);
}

auto transfer_engine::start_download(const session_list& sessions,
                                     const std::string& source_path,
                                     const fs::path& local_root) -> result<transfer_report> {
    auto ready = check_sessions(sessions);
    if (!ready.has_value()) {
        return unexpected(ready.error());
    }

    std::lock_guard<std::mutex> lock(impl_->operation_mutex);
    impl_->cancelled.store(false);

    FR_LOG_INFO(log_category::engine,
                "download " + source_path + " -> " + local_root.string() + " (" +
                to_string(mode()) + ", " + std::to_string(sessions.size()) + " sessions)");
    return impl_->download(sessions, source_path, local_root);
}

auto transfer_engine::upload_one(const session_list& sessions,
                                 const fs::path& local_path,
                                 const std::string& remote_path) -> result<transfer_report> {
    auto ready = check_sessions(sessions);
    if (!ready.has_value()) {
        return unexpected(ready.error());
    }

    std::lock_guard<std::mutex> lock(impl_->operation_mutex);
    impl_->cancelled.store(false);
    return impl_->upload_single(sessions, local_path, remote_path);
}

auto transfer_engine::download_one(const session_list& sessions,
                                   const std::string& remote_path,
                                   const fs::path& local_path) -> result<transfer_report> {
    auto ready = check_sessions(sessions);
    if (!ready.has_value()) {
        return unexpected(ready.error());
    }

    std::lock_guard<std::mutex> lock(impl_->operation_mutex);
    impl_->cancelled.store(false);
    return impl_->download_single(sessions, remote_path, local_path);
}

auto transfer_engine::start_transfer(const session_list& sessions,
                                     transfer_direction direction,
                                     const std::string& source,
                                     const std::string& dest) -> result<transfer_report> {
    if (direction == transfer_direction::upload) {
        return start_upload(sessions, source, dest);
    }
    if (dest.empty()) {
        return start_download(sessions, source);
    }
    return start_download(sessions, source, dest);
}

void transfer_engine::set_mode(transfer_mode mode) {
    std::lock_guard<std::mutex> lock(impl_->state_mutex);
    impl_->config.mode = mode;
}

auto transfer_engine::mode() const -> transfer_mode {
    std::lock_guard<std::mutex> lock(impl_->state_mutex);
    return impl_->config.mode;
}

void transfer_engine::cancel() {
    FR_LOG_INFO(log_category::engine, "cancellation requested");
    impl_->cancelled.store(true);
}

auto transfer_engine::is_cancelled() const -> bool {
    return impl_->cancelled.load();
}

auto transfer_engine::last_session_plan() const -> session_plan {
    std::lock_guard<std::mutex> lock(impl_->state_mutex);
    return impl_->last_plan;
}

auto transfer_engine::monitor() const -> std::shared_ptr<progress_monitor> {
    return impl_->monitor;
}

auto transfer_engine::config() const -> engine_config {
    return impl_->snapshot_config();
}

}  // namespace kcenon::file_ripper
