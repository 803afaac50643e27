/**
 * @file chunked_transfer.cpp
 * @brief Implementation of the per-job transfer algorithm
 */

#include "kcenon/file_ripper/engine/chunked_transfer.h"

#include <kcenon/file_ripper/adapters/thread_pool_adapter.h>
#include <kcenon/file_ripper/core/checksum.h>
#include <kcenon/file_ripper/core/logging.h>

#include <algorithm>
#include <chrono>
#include <fstream>
#include <future>
#include <optional>
#include <system_error>
#include <vector>

namespace kcenon::file_ripper {

namespace fs = std::filesystem;

namespace {

struct local_metadata {
    uint64_t size = 0;
    uint32_t mode = 0644;
    std::chrono::system_clock::time_point mtime{};
};

auto to_system_time(fs::file_time_type ftime) -> std::chrono::system_clock::time_point {
    return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        ftime - fs::file_time_type::clock::now() + std::chrono::system_clock::now());
}

auto to_file_time(std::chrono::system_clock::time_point tp) -> fs::file_time_type {
    return std::chrono::time_point_cast<fs::file_time_type::duration>(
        tp - std::chrono::system_clock::now() + fs::file_time_type::clock::now());
}

auto stat_local_source(const fs::path& path) -> result<local_metadata> {
    std::error_code ec;
    auto status = fs::status(path, ec);
    if (ec || !fs::exists(status)) {
        return unexpected(error{error_code::file_not_found, "local file not found: " + path.string()});
    }
    if (fs::is_directory(status)) {
        return unexpected(error{error_code::source_is_directory,
                                "source is a directory: " + path.string()});
    }

    local_metadata meta;
    meta.size = fs::file_size(path, ec);
    if (ec) {
        return unexpected(error{error_code::file_read_error,
                                "cannot size " + path.string() + ": " + ec.message()});
    }
    meta.mode = static_cast<uint32_t>(status.permissions()) & 07777;
    auto ftime = fs::last_write_time(path, ec);
    if (!ec) {
        meta.mtime = to_system_time(ftime);
    }
    return meta;
}

auto cancelled_error() -> error {
    return error{error_code::transfer_cancelled};
}

// Errors a fresh attempt cannot fix
auto is_permanent(const error& err) -> bool {
    return err.code == error_code::transfer_cancelled ||
           err.code == error_code::source_is_directory ||
           err.code == error_code::remote_is_directory;
}

auto read_local(std::ifstream& in, std::span<std::byte> buffer) -> result<std::size_t> {
    in.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
    if (in.bad()) {
        return unexpected(error{error_code::file_read_error});
    }
    return static_cast<std::size_t>(in.gcount());
}

// Write the whole span, looping over short writes
auto write_all(remote_file& file, std::span<const std::byte> data) -> result<void> {
    while (!data.empty()) {
        auto written = file.write(data);
        if (!written.has_value()) {
            return unexpected(written.error());
        }
        if (written.value() == 0) {
            return unexpected(error{error_code::remote_io_error, "remote write made no progress"});
        }
        data = data.subspan(std::min(written.value(), data.size()));
    }
    return {};
}

auto with_context(const error& err, const std::string& what) -> error {
    return error{err.code, what + ": " + err.message};
}

}  // namespace

struct chunked_transfer::impl {
    transfer_options options;
    std::shared_ptr<progress_monitor> monitor;
    const std::atomic<bool>& cancelled;

    std::atomic<uint64_t> single_stream_attempts{0};
    std::atomic<uint64_t> multipart_attempts{0};
    std::atomic<uint64_t> multipart_fallbacks{0};
    std::atomic<uint64_t> verified_ranges{0};

    impl(transfer_options opts, std::shared_ptr<progress_monitor> mon, const std::atomic<bool>& flag)
        : options(std::move(opts)), monitor(std::move(mon)), cancelled(flag) {}

    [[nodiscard]] auto is_cancelled() const -> bool {
        return cancelled.load(std::memory_order_relaxed);
    }

    void count_bytes(uint64_t n) {
        if (monitor) {
            monitor->add_bytes(n);
        }
    }

    /**
     * @brief Run attempt() up to max_attempts times
     */
    template <typename Attempt>
    auto with_retry(const std::string& label, Attempt&& attempt) -> result<void> {
        error last_error{error_code::transfer_failed};

        for (uint32_t n = 1; n <= options.max_attempts; ++n) {
            if (is_cancelled()) {
                return unexpected(cancelled_error());
            }

            single_stream_attempts.fetch_add(1, std::memory_order_relaxed);
            auto outcome = attempt();
            if (outcome.has_value()) {
                return {};
            }

            last_error = outcome.error();
            if (is_permanent(last_error) || is_cancelled()) {
                return unexpected(is_cancelled() ? cancelled_error() : last_error);
            }

            transfer_log_context ctx;
            ctx.path = label;
            ctx.attempt = n;
            ctx.error_message = last_error.message;
            FR_LOG_DEBUG_CTX(log_category::transfer, "attempt failed", ctx);
        }

        return unexpected(error{last_error.code,
                                "failed after " + std::to_string(options.max_attempts) +
                                " attempts: " + last_error.message});
    }

    auto upload_once(const fs::path& local_path, const std::string& remote_path,
                     remote_transport& session) -> result<void> {
        std::ifstream in(local_path, std::ios::binary);
        if (!in.is_open()) {
            return unexpected(error{error_code::file_open_error,
                                    "cannot open " + local_path.string()});
        }

        auto remote = session.open(remote_path, open_mode::write_truncate);
        if (!remote.has_value()) {
            return unexpected(with_context(remote.error(), "open " + remote_path));
        }
        auto& file = *remote.value();

        std::vector<std::byte> buffer(options.buffer_size);
        uint32_t crc = 0;
        uint64_t moved = 0;

        while (true) {
            if (is_cancelled()) {
                (void)file.close();
                return unexpected(cancelled_error());
            }

            auto got = read_local(in, buffer);
            if (!got.has_value()) {
                (void)file.close();
                return unexpected(with_context(got.error(), "read " + local_path.string()));
            }
            if (got.value() == 0) {
                break;
            }

            std::span<const std::byte> chunk(buffer.data(), got.value());
            auto written = write_all(file, chunk);
            if (!written.has_value()) {
                (void)file.close();
                return unexpected(with_context(written.error(), "write " + remote_path));
            }

            crc = checksum::crc32_update(crc, chunk);
            moved += chunk.size();
            count_bytes(chunk.size());
        }

        auto closed = file.close();
        if (!closed.has_value()) {
            return unexpected(with_context(closed.error(), "close " + remote_path));
        }

        transfer_log_context ctx;
        ctx.path = remote_path;
        ctx.direction = to_string(transfer_direction::upload);
        ctx.bytes = moved;
        FR_LOG_DEBUG_CTX(log_category::transfer, "uploaded, crc32 " + checksum::to_hex(crc), ctx);
        return {};
    }

    auto download_once(const std::string& remote_path, const fs::path& local_path,
                       remote_transport& session) -> result<local_metadata> {
        auto info = session.stat(remote_path);
        if (!info.has_value()) {
            return unexpected(with_context(info.error(), "stat " + remote_path));
        }
        if (info.value().is_dir) {
            return unexpected(error{error_code::remote_is_directory,
                                    "remote path is a directory: " + remote_path});
        }

        auto remote = session.open(remote_path, open_mode::read);
        if (!remote.has_value()) {
            return unexpected(with_context(remote.error(), "open " + remote_path));
        }
        auto& file = *remote.value();

        std::error_code ec;
        if (local_path.has_parent_path()) {
            fs::create_directories(local_path.parent_path(), ec);
        }

        std::ofstream out(local_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            (void)file.close();
            return unexpected(error{error_code::file_open_error,
                                    "cannot create " + local_path.string()});
        }

        std::vector<std::byte> buffer(options.buffer_size);
        uint32_t crc = 0;
        uint64_t moved = 0;

        while (true) {
            if (is_cancelled()) {
                (void)file.close();
                return unexpected(cancelled_error());
            }

            auto got = file.read(buffer);
            if (!got.has_value()) {
                (void)file.close();
                return unexpected(with_context(got.error(), "read " + remote_path));
            }
            if (got.value() == 0) {
                break;
            }

            out.write(reinterpret_cast<const char*>(buffer.data()),
                      static_cast<std::streamsize>(got.value()));
            if (!out) {
                (void)file.close();
                return unexpected(error{error_code::file_write_error,
                                        "write " + local_path.string()});
            }

            crc = checksum::crc32_update(crc, std::span<const std::byte>(buffer.data(), got.value()));
            moved += got.value();
            count_bytes(got.value());
        }

        (void)file.close();
        out.close();
        if (out.fail()) {
            return unexpected(error{error_code::file_write_error, "close " + local_path.string()});
        }

        if (moved != info.value().size) {
            return unexpected(error{error_code::short_transfer,
                                    remote_path + ": got " + std::to_string(moved) + " of " +
                                    std::to_string(info.value().size) + " bytes"});
        }

        transfer_log_context ctx;
        ctx.path = remote_path;
        ctx.direction = to_string(transfer_direction::download);
        ctx.bytes = moved;
        FR_LOG_DEBUG_CTX(log_category::transfer, "downloaded, crc32 " + checksum::to_hex(crc), ctx);

        local_metadata meta;
        meta.size = moved;
        meta.mode = info.value().mode;
        meta.mtime = info.value().mtime;
        return meta;
    }

    auto upload_range(const fs::path& local_path, const std::string& remote_path,
                      remote_transport& session, const byte_range& range, std::size_t index,
                      const std::atomic<bool>& abandoned) -> result<void> {
        std::ifstream in(local_path, std::ios::binary);
        if (!in.is_open()) {
            return unexpected(error{error_code::file_open_error,
                                    "cannot open " + local_path.string()});
        }
        in.seekg(static_cast<std::streamoff>(range.offset));
        if (!in) {
            return unexpected(error{error_code::file_read_error,
                                    "seek " + local_path.string()});
        }

        auto remote = session.open(remote_path, open_mode::write_existing);
        if (!remote.has_value()) {
            return unexpected(with_context(remote.error(), "open " + remote_path));
        }
        auto& file = *remote.value();

        auto positioned = file.seek(range.offset);
        if (!positioned.has_value()) {
            (void)file.close();
            return unexpected(positioned.error());
        }

        std::vector<std::byte> buffer(options.multipart.buffer_size);
        uint64_t remaining = range.length;

        while (remaining > 0) {
            if (is_cancelled()) {
                (void)file.close();
                return unexpected(cancelled_error());
            }
            if (abandoned.load(std::memory_order_relaxed)) {
                (void)file.close();
                return unexpected(error{error_code::multipart_failed, "sibling range failed"});
            }

            auto want = static_cast<std::size_t>(std::min<uint64_t>(remaining, buffer.size()));
            auto got = read_local(in, std::span<std::byte>(buffer.data(), want));
            if (!got.has_value()) {
                (void)file.close();
                return unexpected(got.error());
            }
            if (got.value() == 0) {
                (void)file.close();
                return unexpected(error{error_code::short_transfer,
                                        "source ended inside range " + std::to_string(index)});
            }

            auto written = write_all(file, std::span<const std::byte>(buffer.data(), got.value()));
            if (!written.has_value()) {
                (void)file.close();
                return unexpected(written.error());
            }

            remaining -= got.value();
            count_bytes(got.value());
        }

        return file.close();
    }

    // CRC32 of [range.offset, range.end()) read through a remote handle
    auto remote_range_crc(remote_transport& session, const std::string& remote_path,
                          const byte_range& range) -> result<uint32_t> {
        auto remote = session.open(remote_path, open_mode::read);
        if (!remote.has_value()) {
            return unexpected(remote.error());
        }
        auto& file = *remote.value();
        auto positioned = file.seek(range.offset);
        if (!positioned.has_value()) {
            (void)file.close();
            return unexpected(positioned.error());
        }

        std::vector<std::byte> buffer(options.multipart.buffer_size);
        uint64_t remaining = range.length;
        uint32_t crc = 0;
        while (remaining > 0) {
            auto want = static_cast<std::size_t>(std::min<uint64_t>(remaining, buffer.size()));
            auto got = file.read(std::span<std::byte>(buffer.data(), want));
            if (!got.has_value()) {
                (void)file.close();
                return unexpected(got.error());
            }
            if (got.value() == 0) {
                break;
            }
            crc = checksum::crc32_update(crc, std::span<const std::byte>(buffer.data(), got.value()));
            remaining -= got.value();
        }
        (void)file.close();
        if (remaining != 0) {
            return unexpected(error{error_code::short_transfer, "remote range truncated"});
        }
        return crc;
    }

    auto local_range_crc(const fs::path& local_path, const byte_range& range) -> result<uint32_t> {
        std::ifstream in(local_path, std::ios::binary);
        if (!in.is_open()) {
            return unexpected(error{error_code::file_open_error,
                                    "cannot open " + local_path.string()});
        }
        in.seekg(static_cast<std::streamoff>(range.offset));

        std::vector<std::byte> buffer(options.multipart.buffer_size);
        uint64_t remaining = range.length;
        uint32_t crc = 0;
        while (remaining > 0) {
            auto want = static_cast<std::size_t>(std::min<uint64_t>(remaining, buffer.size()));
            auto got = read_local(in, std::span<std::byte>(buffer.data(), want));
            if (!got.has_value()) {
                return unexpected(got.error());
            }
            if (got.value() == 0) {
                break;
            }
            crc = checksum::crc32_update(crc, std::span<const std::byte>(buffer.data(), got.value()));
            remaining -= got.value();
        }
        return crc;
    }

    auto verify_ranges(const fs::path& local_path, const std::string& remote_path,
                       remote_transport& session, const std::vector<byte_range>& ranges)
        -> result<void> {
        for (std::size_t i = 0; i < ranges.size(); ++i) {
            if (is_cancelled()) {
                return unexpected(cancelled_error());
            }

            auto expected = local_range_crc(local_path, ranges[i]);
            if (!expected.has_value()) {
                return unexpected(expected.error());
            }
            auto actual = remote_range_crc(session, remote_path, ranges[i]);
            if (!actual.has_value()) {
                return unexpected(actual.error());
            }
            verified_ranges.fetch_add(1, std::memory_order_relaxed);

            if (expected.value() != actual.value()) {
                transfer_log_context ctx;
                ctx.path = remote_path;
                ctx.range_index = i;
                FR_LOG_WARN_CTX(log_category::multipart,
                                "range crc32 mismatch: " + checksum::to_hex(expected.value()) +
                                " != " + checksum::to_hex(actual.value()),
                                ctx);
                return unexpected(error{error_code::checksum_mismatch,
                                        remote_path + ": range " + std::to_string(i)});
            }
        }
        return {};
    }

    // Best effort: failures are logged and ignored
    void sync_remote_metadata(remote_transport& session, const std::string& remote_path,
                              const local_metadata& meta) {
        auto mode = session.chmod(remote_path, meta.mode);
        if (!mode.has_value()) {
            FR_LOG_DEBUG(log_category::transfer,
                         "chmod " + remote_path + " skipped: " + mode.error().message);
        }
        auto times = session.chtimes(remote_path, meta.mtime);
        if (!times.has_value()) {
            FR_LOG_DEBUG(log_category::transfer,
                         "chtimes " + remote_path + " skipped: " + times.error().message);
        }
    }

    void sync_local_mtime(const fs::path& local_path, std::chrono::system_clock::time_point mtime) {
        std::error_code ec;
        fs::last_write_time(local_path, to_file_time(mtime), ec);
        if (ec) {
            FR_LOG_DEBUG(log_category::transfer,
                         "mtime " + local_path.string() + " skipped: " + ec.message());
        }
    }
};

chunked_transfer::chunked_transfer(transfer_options options,
                                   std::shared_ptr<progress_monitor> monitor,
                                   const std::atomic<bool>& cancelled)
    : impl_(std::make_unique<impl>(std::move(options), std::move(monitor), cancelled)) {}

chunked_transfer::~chunked_transfer() = default;

auto chunked_transfer::execute(const transfer_job& job, remote_transport& session)
    -> result<void> {
    if (job.direction == transfer_direction::download) {
        return download(job.remote_path, job.local_path, session);
    }
    return upload(job.local_path, job.remote_path, session);
}

auto chunked_transfer::upload(const fs::path& local_path,
                              const std::string& remote_path,
                              remote_transport& session) -> result<void> {
    auto meta = stat_local_source(local_path);
    if (!meta.has_value()) {
        return unexpected(meta.error());
    }

    if (impl_->options.multipart.qualifies(meta.value().size)) {
        auto multipart = upload_multipart(local_path, remote_path, session);
        if (multipart.has_value()) {
            return {};
        }
        if (multipart.error().code == error_code::transfer_cancelled || impl_->is_cancelled()) {
            return unexpected(cancelled_error());
        }

        impl_->multipart_fallbacks.fetch_add(1, std::memory_order_relaxed);
        transfer_log_context ctx;
        ctx.path = remote_path;
        ctx.error_message = multipart.error().message;
        FR_LOG_DEBUG_CTX(log_category::multipart, "falling back to single stream", ctx);
    }

    return upload_single_stream(local_path, remote_path, session);
}

auto chunked_transfer::upload_single_stream(const fs::path& local_path,
                                            const std::string& remote_path,
                                            remote_transport& session) -> result<void> {
    auto meta = stat_local_source(local_path);
    if (!meta.has_value()) {
        return unexpected(meta.error());
    }

    auto outcome = impl_->with_retry(remote_path, [&]() {
        return impl_->upload_once(local_path, remote_path, session);
    });
    if (!outcome.has_value()) {
        return outcome;
    }

    impl_->sync_remote_metadata(session, remote_path, meta.value());
    return {};
}

auto chunked_transfer::upload_multipart(const fs::path& local_path,
                                        const std::string& remote_path,
                                        remote_transport& session) -> result<void> {
    auto meta = stat_local_source(local_path);
    if (!meta.has_value()) {
        return unexpected(meta.error());
    }
    if (impl_->is_cancelled()) {
        return unexpected(cancelled_error());
    }

    impl_->multipart_attempts.fetch_add(1, std::memory_order_relaxed);
    auto ranges = split_ranges(meta.value().size, impl_->options.multipart.part_count);

    {
        auto created = session.open(remote_path, open_mode::write_truncate);
        if (!created.has_value()) {
            return unexpected(error{error_code::multipart_failed,
                                    "create " + remote_path + ": " + created.error().message});
        }
        auto closed = created.value()->close();
        if (!closed.has_value()) {
            return unexpected(error{error_code::multipart_failed,
                                    "create " + remote_path + ": " + closed.error().message});
        }
    }

    std::atomic<bool> abandoned{false};
    std::vector<result<void>> outcomes(ranges.size());
    std::vector<std::future<void>> parts;
    parts.reserve(ranges.size());

    std::optional<error> first_failure;
    auto pool = adapters::transfer_pool_factory::create(ranges.size(), "multipart");
    for (std::size_t i = 0; i < ranges.size(); ++i) {
        try {
            parts.push_back(pool->submit_to_stage(
                [&, i]() {
                    outcomes[i] = impl_->upload_range(local_path, remote_path, session,
                                                      ranges[i], i, abandoned);
                    if (!outcomes[i].has_value()) {
                        abandoned.store(true, std::memory_order_relaxed);
                    }
                },
                "range"));
        } catch (const std::system_error& e) {
            abandoned.store(true, std::memory_order_relaxed);
            first_failure = error{error_code::multipart_failed,
                                  std::string("cannot start range worker: ") + e.what()};
            break;
        }
    }

    for (std::size_t i = 0; i < parts.size(); ++i) {
        try {
            parts[i].get();
        } catch (const std::exception& e) {
            outcomes[i] = unexpected(error{error_code::internal_error, e.what()});
        }

        if (!outcomes[i].has_value() && !first_failure) {
            transfer_log_context ctx;
            ctx.path = remote_path;
            ctx.range_index = i;
            ctx.error_message = outcomes[i].error().message;
            FR_LOG_DEBUG_CTX(log_category::multipart, "range failed", ctx);
            first_failure = outcomes[i].error();
        }
    }
    pool->shutdown();

    if (impl_->is_cancelled()) {
        return unexpected(cancelled_error());
    }
    if (first_failure) {
        return unexpected(error{error_code::multipart_failed,
                                remote_path + ": " + first_failure->message});
    }

    if (impl_->options.verify_multipart) {
        auto verified = impl_->verify_ranges(local_path, remote_path, session, ranges);
        if (!verified.has_value()) {
            return verified;
        }
    }

    transfer_log_context ctx;
    ctx.path = remote_path;
    ctx.direction = to_string(transfer_direction::upload);
    ctx.bytes = meta.value().size;
    FR_LOG_DEBUG_CTX(log_category::multipart,
                     "multipart upload complete (" + std::to_string(ranges.size()) + " ranges)",
                     ctx);

    impl_->sync_remote_metadata(session, remote_path, meta.value());
    return {};
}

auto chunked_transfer::download(const std::string& remote_path,
                                const fs::path& local_path,
                                remote_transport& session) -> result<void> {
    std::optional<local_metadata> fetched;

    auto outcome = impl_->with_retry(remote_path, [&]() -> result<void> {
        auto once = impl_->download_once(remote_path, local_path, session);
        if (!once.has_value()) {
            return unexpected(once.error());
        }
        fetched = once.value();
        return {};
    });
    if (!outcome.has_value()) {
        return outcome;
    }

    if (fetched) {
        impl_->sync_local_mtime(local_path, fetched->mtime);
    }
    return {};
}

auto chunked_transfer::options() const -> const transfer_options& {
    return impl_->options;
}

auto chunked_transfer::counters() const -> chunked_transfer_counters {
    chunked_transfer_counters snapshot;
    snapshot.single_stream_attempts = impl_->single_stream_attempts.load();
    snapshot.multipart_attempts = impl_->multipart_attempts.load();
    snapshot.multipart_fallbacks = impl_->multipart_fallbacks.load();
    snapshot.verified_ranges = impl_->verified_ranges.load();
    return snapshot;
}

}  // namespace kcenon::file_ripper
