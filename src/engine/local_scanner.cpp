/**
 * @file local_scanner.cpp
 * @brief Implementation of the local source walk
 */

#include "kcenon/file_ripper/engine/local_scanner.h"

#include <kcenon/file_ripper/core/logging.h>
#include <kcenon/file_ripper/core/remote_path.h>

#include <algorithm>
#include <set>
#include <system_error>

namespace kcenon::file_ripper {

namespace fs = std::filesystem;

namespace {

class scan_walker {
public:
    scan_walker(fs::path base, std::string dest, scan_result& out,
                const std::atomic<bool>* cancelled)
        : base_(std::move(base)), dest_(std::move(dest)), out_(out), cancelled_(cancelled) {}

    auto visit(const fs::path& path) -> result<void> {
        if (cancelled_ && cancelled_->load(std::memory_order_relaxed)) {
            return unexpected(error{error_code::transfer_cancelled});
        }

        std::error_code ec;
        auto status = fs::status(path, ec);
        if (ec) {
            report(path, error{error_code::scan_error, "stat: " + ec.message()});
            return {};
        }

        auto remote = remote_path::join(dest_, remote_path::to_slash(path.lexically_relative(base_)));

        if (fs::is_directory(status)) {
            return visit_directory(path, remote);
        }

        if (!fs::is_regular_file(status)) {
            report(path, error{error_code::scan_error, "not a regular file"});
            return {};
        }

        auto size = fs::file_size(path, ec);
        if (ec) {
            report(path, error{error_code::scan_error, "size: " + ec.message()});
            return {};
        }

        out_.files.push_back(transfer_job{path, remote, transfer_direction::upload});
        out_.total_bytes += size;
        return {};
    }

private:
    auto visit_directory(const fs::path& path, const std::string& remote) -> result<void> {
        std::error_code ec;
        auto canonical = fs::canonical(path, ec);
        if (ec) {
            report(path, error{error_code::scan_error, "resolve: " + ec.message()});
            return {};
        }
        // Only a directory already on the current path closes a cycle
        if (!ancestors_.insert(canonical).second) {
            report(path, error{error_code::scan_error,
                               "directory loop via " + canonical.string()});
            return {};
        }

        auto walked = visit_children(path, remote);
        ancestors_.erase(canonical);
        return walked;
    }

    auto visit_children(const fs::path& path, const std::string& remote) -> result<void> {
        out_.directories.push_back(remote);

        std::error_code ec;
        std::vector<fs::path> children;
        fs::directory_iterator it(path, ec);
        if (ec) {
            report(path, error{error_code::scan_error, "list: " + ec.message()});
            return {};
        }
        for (auto end = fs::directory_iterator(); it != end; it.increment(ec)) {
            if (ec) {
                report(path, error{error_code::scan_error, "list: " + ec.message()});
                break;
            }
            children.push_back(it->path());
        }
        std::sort(children.begin(), children.end());

        for (const auto& child : children) {
            auto visited = visit(child);
            if (!visited.has_value()) {
                return visited;
            }
        }
        return {};
    }

    void report(const fs::path& path, error err) {
        FR_LOG_WARN(log_category::scan, "skipping " + path.string() + ": " + err.message);
        out_.issues.push_back(scan_issue{path.string(), std::move(err)});
    }

    fs::path base_;
    std::string dest_;
    scan_result& out_;
    const std::atomic<bool>* cancelled_;
    std::set<fs::path> ancestors_;
};

}  // namespace

local_scanner::local_scanner(const std::atomic<bool>* cancelled) : cancelled_(cancelled) {}

auto local_scanner::scan(const fs::path& source, const std::string& dest) const
    -> result<scan_result> {
    std::error_code ec;
    auto absolute = fs::absolute(source, ec);
    if (ec || source.empty()) {
        return unexpected(error{error_code::invalid_source_path,
                                "cannot resolve source: " + source.string()});
    }
    absolute = absolute.lexically_normal();
    if (!absolute.has_filename() && absolute.has_parent_path()) {
        absolute = absolute.parent_path();
    }

    auto status = fs::status(absolute, ec);
    if (ec || !fs::exists(status)) {
        return unexpected(error{error_code::invalid_source_path,
                                "source does not exist: " + absolute.string()});
    }

    scan_result out;
    out.source = absolute;

    scan_walker walker(absolute.parent_path(), dest, out, cancelled_);
    auto walked = walker.visit(absolute);
    if (!walked.has_value()) {
        return unexpected(walked.error());
    }

    if (!fs::is_directory(status)) {
        auto root = remote_path::clean(dest);
        if (root != "." && root != "/") {
            out.directories.push_back(root);
        }
    }

    FR_LOG_INFO(log_category::scan,
                "scanned " + absolute.string() + ": " + std::to_string(out.directories.size()) +
                " directories, " + std::to_string(out.files.size()) + " files, " +
                std::to_string(out.total_bytes) + " bytes");
    return out;
}

}  // namespace kcenon::file_ripper
