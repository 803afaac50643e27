/**
 * @file loopback_download.cpp
 * @brief Multi-session download over the loopback transport
 *
 * This example demonstrates:
 * - Resolving a bare target name with the case-insensitive search
 * - Downloading into a chosen local root
 * - Cancelling a running operation from another thread
 * - Serving the monitor snapshot as JSON
 */

#include <kcenon/file_ripper/file_ripper.h>

#include <chrono>
#include <future>
#include <iostream>
#include <string>
#include <thread>

using namespace kcenon::file_ripper;

namespace {

void print_usage(const char* program) {
    std::cout << "Loopback Download - file_ripper" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] <remote_root> <target>" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -o, --output <dir>      Local download root (default: dump)" << std::endl;
    std::cout << "  -s, --sessions <n>      Number of sessions (default: 2)" << std::endl;
    std::cout << "  -t, --timeout <sec>     Cancel after this many seconds" << std::endl;
    std::cout << "  --fail-fast             Stop at the first failed file" << std::endl;
    std::cout << "  --help                  Show this help message" << std::endl;
    std::cout << std::endl;
    std::cout << "Examples:" << std::endl;
    std::cout << "  " << program << " /mnt/share reports" << std::endl;
    std::cout << "  " << program << " -o ./restore -t 30 /mnt/share ." << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    std::filesystem::path output = "dump";
    std::size_t session_count = 2;
    int timeout_seconds = 0;
    failure_policy policy = failure_policy::collect_warnings;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-o" || arg == "--output") {
            if (++i >= argc) {
                std::cerr << "Error: --output requires an argument" << std::endl;
                return 1;
            }
            output = argv[i];
        } else if (arg == "-s" || arg == "--sessions") {
            if (++i >= argc) {
                std::cerr << "Error: --sessions requires an argument" << std::endl;
                return 1;
            }
            session_count = static_cast<std::size_t>(std::stoul(argv[i]));
        } else if (arg == "-t" || arg == "--timeout") {
            if (++i >= argc) {
                std::cerr << "Error: --timeout requires an argument" << std::endl;
                return 1;
            }
            timeout_seconds = std::stoi(argv[i]);
        } else if (arg == "--fail-fast") {
            policy = failure_policy::fail_fast;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() < 2) {
        print_usage(argv[0]);
        return 1;
    }

    session_list sessions;
    for (std::size_t i = 0; i < session_count; ++i) {
        sessions.push_back(std::make_shared<local_transport>(positional[0]));
    }

    auto engine_result = transfer_engine::builder()
        .with_mode(transfer_mode::conservative)
        .with_failure_policy(policy)
        .with_download_root(output)
        .build();

    if (!engine_result.has_value()) {
        std::cerr << "Error: " << engine_result.error().message << std::endl;
        return 1;
    }
    auto& engine = engine_result.value();
    auto monitor = engine.monitor();

    auto pending = std::async(std::launch::async, [&]() {
        return engine.start_download(sessions, positional[1]);
    });

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeout_seconds);
    while (pending.wait_for(std::chrono::milliseconds(500)) != std::future_status::ready) {
        std::cout << monitor->get_stats().to_json() << std::endl;
        if (timeout_seconds > 0 && std::chrono::steady_clock::now() >= deadline) {
            std::cout << "Timeout reached, cancelling" << std::endl;
            engine.cancel();
        }
    }

    auto report = pending.get();
    std::cout << monitor->get_stats().to_json() << std::endl;

    if (!report.has_value()) {
        std::cerr << "Download failed (" << static_cast<int>(report.error().code) << "): "
                  << report.error().message << std::endl;
        return 1;
    }

    std::cout << "Downloaded " << report.value().files_done << " of "
              << report.value().total_files << " files into " << output << std::endl;
    for (const auto& warning : report.value().warnings) {
        std::cout << "  warning [" << to_string(warning.kind) << "] " << warning.path << ": "
                  << warning.err.message << std::endl;
    }
    return 0;
}
