/**
 * @file remote_search.cpp
 * @brief Implementation of the bounded remote name search
 */

#include "kcenon/file_ripper/transport/remote_search.h"

#include <kcenon/file_ripper/core/logging.h>
#include <kcenon/file_ripper/core/remote_path.h>

#include <algorithm>
#include <cctype>

namespace kcenon::file_ripper {

auto equals_ignore_case(std::string_view a, std::string_view b) noexcept -> bool {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        auto ca = std::tolower(static_cast<unsigned char>(a[i]));
        auto cb = std::tolower(static_cast<unsigned char>(b[i]));
        if (ca != cb) {
            return false;
        }
    }
    return true;
}

auto find_remote_path(remote_transport& transport,
                      const std::string& root,
                      std::string_view name,
                      int max_depth) -> std::optional<std::string> {
    if (max_depth < 0 || name.empty()) {
        return std::nullopt;
    }

    auto listing = transport.list(root);
    if (!listing.has_value()) {
        FR_LOG_DEBUG(log_category::transport,
                     "search: cannot list " + root + ": " + listing.error().message);
        return std::nullopt;
    }

    auto entries = std::move(listing).value();
    std::sort(entries.begin(), entries.end(),
              [](const remote_file_info& a, const remote_file_info& b) { return a.name < b.name; });

    for (const auto& entry : entries) {
        if (equals_ignore_case(entry.name, name)) {
            return remote_path::join(root, entry.name);
        }
    }

    for (const auto& entry : entries) {
        if (!entry.is_dir || entry.name == "." || entry.name == "..") {
            continue;
        }
        auto found = find_remote_path(transport, remote_path::join(root, entry.name),
                                      name, max_depth - 1);
        if (found) {
            return found;
        }
    }

    return std::nullopt;
}

}  // namespace kcenon::file_ripper
