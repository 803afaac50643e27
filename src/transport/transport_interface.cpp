/**
 * @file transport_interface.cpp
 * @brief Default walk built on lstat and list
 */

#include "kcenon/file_ripper/transport/transport_interface.h"

#include <kcenon/file_ripper/core/logging.h>
#include <kcenon/file_ripper/core/remote_path.h>

#include <algorithm>

namespace kcenon::file_ripper {

namespace {

// Returns false once the visitor asked to stop
auto walk_directory(remote_transport& transport, const std::string& dir,
                    const walk_callback& visit) -> bool {
    auto children = transport.list(dir);
    if (!children.has_value()) {
        FR_LOG_DEBUG(log_category::transport,
                     "walk: cannot list " + dir + ": " + children.error().message);
        walk_entry failed;
        failed.path = dir;
        failed.info.name = remote_path::base_name(dir);
        failed.info.is_dir = true;
        failed.err = children.error();
        return visit(failed);
    }

    auto entries = std::move(children).value();
    std::sort(entries.begin(), entries.end(),
              [](const remote_file_info& a, const remote_file_info& b) { return a.name < b.name; });

    for (const auto& child : entries) {
        if (child.name == "." || child.name == "..") {
            continue;
        }

        walk_entry entry;
        entry.path = remote_path::join(dir, child.name);

        auto info = transport.lstat(entry.path);
        if (!info.has_value()) {
            entry.info = child;
            entry.err = info.error();
            if (!visit(entry)) {
                return false;
            }
            continue;
        }

        entry.info = std::move(info).value();
        if (!visit(entry)) {
            return false;
        }

        if (entry.info.is_dir && !entry.info.is_symlink) {
            if (!walk_directory(transport, entry.path, visit)) {
                return false;
            }
        }
    }
    return true;
}

}  // namespace

auto remote_transport::walk(const std::string& root, const walk_callback& visit) -> result<void> {
    auto root_info = stat(root);
    if (!root_info.has_value()) {
        return unexpected(root_info.error());
    }

    walk_entry entry;
    entry.path = root;
    entry.info = std::move(root_info).value();
    if (!visit(entry)) {
        return {};
    }

    if (entry.info.is_dir && !entry.info.is_symlink) {
        walk_directory(*this, root, visit);
    }
    return {};
}

}  // namespace kcenon::file_ripper
