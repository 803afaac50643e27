/**
 * @file remote_path.cpp
 * @brief Implementation of remote path helpers
 */

#include "kcenon/file_ripper/core/remote_path.h"

#include <vector>

namespace kcenon::file_ripper::remote_path {

namespace {

auto split(std::string_view path) -> std::vector<std::string_view> {
    std::vector<std::string_view> parts;
    std::size_t pos = 0;
    while (pos <= path.size()) {
        auto next = path.find('/', pos);
        if (next == std::string_view::npos) {
            next = path.size();
        }
        if (next > pos) {
            parts.push_back(path.substr(pos, next - pos));
        }
        pos = next + 1;
    }
    return parts;
}

}  // namespace

auto clean(std::string_view path) -> std::string {
    if (path.empty()) {
        return ".";
    }

    const bool rooted = path.front() == '/';
    std::vector<std::string_view> out;

    for (auto part : split(path)) {
        if (part == ".") {
            continue;
        }
        if (part == "..") {
            if (!out.empty() && out.back() != "..") {
                out.pop_back();
            } else if (!rooted) {
                out.push_back(part);
            }
            continue;
        }
        out.push_back(part);
    }

    std::string result = rooted ? "/" : "";
    for (std::size_t i = 0; i < out.size(); ++i) {
        if (i > 0) {
            result += '/';
        }
        result.append(out[i]);
    }

    if (result.empty()) {
        return ".";
    }
    return result;
}

auto join(std::string_view base, std::string_view child) -> std::string {
    if (base.empty()) {
        return clean(child);
    }
    if (child.empty()) {
        return clean(base);
    }
    std::string combined(base);
    combined += '/';
    combined.append(child);
    return clean(combined);
}

auto base_name(std::string_view path) -> std::string {
    if (path.empty()) {
        return "";
    }
    while (path.size() > 1 && path.back() == '/') {
        path.remove_suffix(1);
    }
    if (path == "/") {
        return "/";
    }
    auto pos = path.rfind('/');
    if (pos == std::string_view::npos) {
        return std::string(path);
    }
    return std::string(path.substr(pos + 1));
}

auto parent(std::string_view path) -> std::string {
    auto cleaned = clean(path);
    if (cleaned == "/") {
        return "/";
    }
    auto pos = cleaned.rfind('/');
    if (pos == std::string::npos) {
        return ".";
    }
    if (pos == 0) {
        return "/";
    }
    return cleaned.substr(0, pos);
}

auto relative(std::string_view base, std::string_view target) -> std::string {
    auto b = clean(base);
    auto t = clean(target);

    if (b == t) {
        return ".";
    }
    if (b == ".") {
        return t;
    }
    if (b == "/") {
        return t.front() == '/' ? t.substr(1) : t;
    }
    if (t.size() > b.size() && t.compare(0, b.size(), b) == 0 && t[b.size()] == '/') {
        return t.substr(b.size() + 1);
    }
    return t;
}

auto to_slash(const std::filesystem::path& path) -> std::string {
    return path.generic_string();
}

auto is_bare_name(std::string_view path) noexcept -> bool {
    return path.find('/') == std::string_view::npos;
}

}  // namespace kcenon::file_ripper::remote_path
