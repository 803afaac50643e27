/**
 * @file local_transport.cpp
 * @brief Implementation of the loopback transport
 */

#include "kcenon/file_ripper/transport/local_transport.h"

#include <kcenon/file_ripper/core/logging.h>
#include <kcenon/file_ripper/core/remote_path.h>

#include <fstream>
#include <system_error>

namespace kcenon::file_ripper {

namespace fs = std::filesystem;

namespace {

auto map_error(const std::error_code& ec, const std::string& what) -> error {
    if (ec == std::errc::no_such_file_or_directory) {
        return error{error_code::remote_not_found, what + ": " + ec.message()};
    }
    if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted) {
        return error{error_code::remote_permission_denied, what + ": " + ec.message()};
    }
    return error{error_code::remote_io_error, what + ": " + ec.message()};
}

auto to_system_time(fs::file_time_type ftime) -> std::chrono::system_clock::time_point {
    return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        ftime - fs::file_time_type::clock::now() + std::chrono::system_clock::now());
}

auto to_file_time(std::chrono::system_clock::time_point tp) -> fs::file_time_type {
    return std::chrono::time_point_cast<fs::file_time_type::duration>(
        tp - std::chrono::system_clock::now() + fs::file_time_type::clock::now());
}

auto describe(const fs::path& local, const fs::file_status& status, bool follow)
    -> result<remote_file_info> {
    remote_file_info info;
    info.name = local.filename().string();
    info.is_symlink = fs::is_symlink(status);
    info.is_dir = fs::is_directory(status);
    info.mode = static_cast<uint32_t>(status.permissions()) & 07777;

    std::error_code ec;
    if (fs::is_regular_file(status)) {
        auto size = fs::file_size(local, ec);
        if (ec) {
            return unexpected(map_error(ec, "file_size " + local.string()));
        }
        info.size = size;
    }

    // symlink_status gives no timestamp of its own; follow only when asked
    if (follow || !info.is_symlink) {
        auto ftime = fs::last_write_time(local, ec);
        if (!ec) {
            info.mtime = to_system_time(ftime);
        }
    }
    return info;
}

class local_file : public remote_file {
public:
    local_file(std::fstream stream, std::string path)
        : stream_(std::move(stream)), path_(std::move(path)) {}

    ~local_file() override {
        if (stream_.is_open()) {
            stream_.close();
        }
    }

    auto read(std::span<std::byte> buffer) -> result<std::size_t> override {
        if (buffer.empty()) {
            return std::size_t{0};
        }
        stream_.read(reinterpret_cast<char*>(buffer.data()),
                     static_cast<std::streamsize>(buffer.size()));
        auto got = static_cast<std::size_t>(stream_.gcount());
        if (stream_.bad()) {
            return unexpected(error{error_code::remote_io_error, "read failed: " + path_});
        }
        if (stream_.eof()) {
            stream_.clear();
        }
        return got;
    }

    auto write(std::span<const std::byte> data) -> result<std::size_t> override {
        stream_.write(reinterpret_cast<const char*>(data.data()),
                      static_cast<std::streamsize>(data.size()));
        if (!stream_) {
            return unexpected(error{error_code::remote_io_error, "write failed: " + path_});
        }
        return data.size();
    }

    auto seek(uint64_t offset) -> result<void> override {
        stream_.clear();
        stream_.seekg(static_cast<std::streamoff>(offset));
        stream_.seekp(static_cast<std::streamoff>(offset));
        if (!stream_) {
            return unexpected(error{error_code::remote_io_error,
                                    "seek to " + std::to_string(offset) + " failed: " + path_});
        }
        return {};
    }

    auto close() -> result<void> override {
        if (!stream_.is_open()) {
            return {};
        }
        stream_.flush();
        const bool ok = static_cast<bool>(stream_);
        stream_.close();
        if (!ok || stream_.fail()) {
            return unexpected(error{error_code::remote_io_error, "close failed: " + path_});
        }
        return {};
    }

private:
    std::fstream stream_;
    std::string path_;
};

}  // namespace

local_transport::local_transport(fs::path root) : root_(std::move(root)) {}

auto local_transport::resolve(const std::string& path) const -> result<fs::path> {
    auto cleaned = remote_path::clean(path);
    if (!cleaned.empty() && cleaned.front() == '/') {
        cleaned = remote_path::clean(cleaned.substr(1));
    }
    if (cleaned == "..") {
        return unexpected(error{error_code::remote_permission_denied, "path escapes root: " + path});
    }
    if (cleaned.rfind("../", 0) == 0) {
        return unexpected(error{error_code::remote_permission_denied, "path escapes root: " + path});
    }
    if (cleaned == ".") {
        return root_;
    }
    return root_ / fs::path(cleaned);
}

auto local_transport::open(const std::string& path, open_mode mode)
    -> result<std::unique_ptr<remote_file>> {
    auto local = resolve(path);
    if (!local.has_value()) {
        return unexpected(local.error());
    }

    std::error_code ec;
    if (fs::is_directory(local.value(), ec)) {
        return unexpected(error{error_code::remote_is_directory, "cannot open directory: " + path});
    }

    std::ios::openmode flags = std::ios::binary;
    switch (mode) {
        case open_mode::read:
            flags |= std::ios::in;
            break;
        case open_mode::write_truncate:
            flags |= std::ios::out | std::ios::trunc;
            break;
        case open_mode::write_existing:
            flags |= std::ios::in | std::ios::out;
            break;
    }

    if (mode != open_mode::write_truncate && !fs::exists(local.value(), ec)) {
        return unexpected(error{error_code::remote_not_found, "no such file: " + path});
    }

    std::fstream stream(local.value(), flags);
    if (!stream.is_open()) {
        return unexpected(error{error_code::remote_io_error,
                                std::string("cannot open (") + to_string(mode) + "): " + path});
    }

    return std::unique_ptr<remote_file>(std::make_unique<local_file>(std::move(stream), path));
}

auto local_transport::stat(const std::string& path) -> result<remote_file_info> {
    auto local = resolve(path);
    if (!local.has_value()) {
        return unexpected(local.error());
    }

    std::error_code ec;
    auto status = fs::status(local.value(), ec);
    if (ec || !fs::exists(status)) {
        if (!ec) {
            ec = std::make_error_code(std::errc::no_such_file_or_directory);
        }
        return unexpected(map_error(ec, "stat " + path));
    }

    auto info = describe(local.value(), status, true);
    if (info.has_value() && path == ".") {
        info.value().name = ".";
    }
    return info;
}

auto local_transport::lstat(const std::string& path) -> result<remote_file_info> {
    auto local = resolve(path);
    if (!local.has_value()) {
        return unexpected(local.error());
    }

    std::error_code ec;
    auto status = fs::symlink_status(local.value(), ec);
    if (ec || !fs::exists(status)) {
        if (!ec) {
            ec = std::make_error_code(std::errc::no_such_file_or_directory);
        }
        return unexpected(map_error(ec, "lstat " + path));
    }

    return describe(local.value(), status, false);
}

auto local_transport::list(const std::string& path) -> result<std::vector<remote_file_info>> {
    auto local = resolve(path);
    if (!local.has_value()) {
        return unexpected(local.error());
    }

    std::error_code ec;
    fs::directory_iterator it(local.value(), ec);
    if (ec) {
        return unexpected(map_error(ec, "list " + path));
    }

    std::vector<remote_file_info> entries;
    for (const auto& entry : it) {
        auto status = entry.symlink_status(ec);
        if (ec) {
            FR_LOG_DEBUG(log_category::transport,
                         "list: skipping " + entry.path().string() + ": " + ec.message());
            ec.clear();
            continue;
        }
        auto info = describe(entry.path(), status, false);
        if (info.has_value()) {
            entries.push_back(std::move(info).value());
        } else {
            // Keep the name so walk() can report the entry itself
            remote_file_info partial;
            partial.name = entry.path().filename().string();
            entries.push_back(std::move(partial));
        }
    }
    return entries;
}

auto local_transport::mkdir_all(const std::string& path) -> result<void> {
    auto local = resolve(path);
    if (!local.has_value()) {
        return unexpected(local.error());
    }

    std::error_code ec;
    fs::create_directories(local.value(), ec);
    if (ec) {
        return unexpected(map_error(ec, "mkdir " + path));
    }
    if (!fs::is_directory(local.value(), ec)) {
        return unexpected(error{error_code::remote_io_error, "not a directory: " + path});
    }
    return {};
}

auto local_transport::chmod(const std::string& path, uint32_t mode) -> result<void> {
    auto local = resolve(path);
    if (!local.has_value()) {
        return unexpected(local.error());
    }

    std::error_code ec;
    fs::permissions(local.value(), static_cast<fs::perms>(mode & 07777),
                    fs::perm_options::replace, ec);
    if (ec) {
        return unexpected(map_error(ec, "chmod " + path));
    }
    return {};
}

auto local_transport::chtimes(const std::string& path,
                              std::chrono::system_clock::time_point mtime) -> result<void> {
    auto local = resolve(path);
    if (!local.has_value()) {
        return unexpected(local.error());
    }

    std::error_code ec;
    fs::last_write_time(local.value(), to_file_time(mtime), ec);
    if (ec) {
        return unexpected(map_error(ec, "chtimes " + path));
    }
    return {};
}

}  // namespace kcenon::file_ripper
