/**
 * @file loopback_upload.cpp
 * @brief Multi-session directory upload over the loopback transport
 *
 * This example demonstrates:
 * - Opening several sessions against one destination root
 * - Building an engine with a mode and a shared progress monitor
 * - Polling the monitor for a redrawn progress line
 * - Reading the warnings collected in the transfer report
 */

#include <kcenon/file_ripper/file_ripper.h>

#include <chrono>
#include <future>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>

using namespace kcenon::file_ripper;

namespace {

auto format_progress(const transfer_stats& stats) -> std::string {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1)
        << "\r[" << std::setw(5) << stats.progress_percent << "%] "
        << stats.files_done << "/" << stats.total_files << " files, "
        << std::setprecision(2) << stats.speed_mbs << " MB/s  "
        << stats.current_file << "        ";
    return oss.str();
}

void print_usage(const char* program) {
    std::cout << "Loopback Upload - file_ripper" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] <source> <remote_root> [remote_dest]" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -s, --sessions <n>      Number of sessions (default: 4)" << std::endl;
    std::cout << "  -c, --conservative      Use 4 workers instead of 64" << std::endl;
    std::cout << "  --json                  Log records as JSON" << std::endl;
    std::cout << "  --help                  Show this help message" << std::endl;
    std::cout << std::endl;
    std::cout << "Examples:" << std::endl;
    std::cout << "  " << program << " ./photos /mnt/backup" << std::endl;
    std::cout << "  " << program << " -s 8 ./dataset /mnt/share incoming" << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    std::size_t session_count = 4;
    transfer_mode mode = transfer_mode::boost;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-s" || arg == "--sessions") {
            if (++i >= argc) {
                std::cerr << "Error: --sessions requires an argument" << std::endl;
                return 1;
            }
            session_count = static_cast<std::size_t>(std::stoul(argv[i]));
        } else if (arg == "-c" || arg == "--conservative") {
            mode = transfer_mode::conservative;
        } else if (arg == "--json") {
            get_logger().set_output_format(log_output_format::json);
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() < 2) {
        print_usage(argv[0]);
        return 1;
    }

    const std::string source = positional[0];
    const std::filesystem::path remote_root = positional[1];
    const std::string dest = positional.size() > 2 ? positional[2] : ".";

    std::error_code ec;
    std::filesystem::create_directories(remote_root, ec);

    session_list sessions;
    for (std::size_t i = 0; i < session_count; ++i) {
        sessions.push_back(std::make_shared<local_transport>(remote_root));
    }

    auto monitor = std::make_shared<progress_monitor>();
    auto engine_result = transfer_engine::builder()
        .with_mode(mode)
        .with_monitor(monitor)
        .build();

    if (!engine_result.has_value()) {
        std::cerr << "Error: " << engine_result.error().message << std::endl;
        return 1;
    }
    auto& engine = engine_result.value();

    std::cout << "file_ripper " << version::to_string() << ": uploading " << source
              << " with " << session_count << " sessions (" << to_string(mode) << ")" << std::endl;

    auto started = std::chrono::steady_clock::now();
    auto pending = std::async(std::launch::async, [&]() {
        return engine.start_upload(sessions, source, dest);
    });

    while (pending.wait_for(std::chrono::milliseconds(200)) != std::future_status::ready) {
        std::cout << format_progress(monitor->get_stats()) << std::flush;
    }
    auto report = pending.get();
    std::cout << format_progress(monitor->get_stats()) << std::endl;

    if (!report.has_value()) {
        std::cerr << "Upload failed: " << report.error().message << std::endl;
        return 1;
    }

    auto seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
    const auto& r = report.value();
    std::cout << "Done: " << r.files_done << "/" << r.total_files << " files, "
              << r.bytes_done << " bytes in " << std::fixed << std::setprecision(2) << seconds
              << " s using " << r.concurrency << " workers" << std::endl;

    for (const auto& warning : r.warnings) {
        std::cout << "  warning [" << to_string(warning.kind) << "] " << warning.path << ": "
                  << warning.err.message << std::endl;
    }

    return r.warnings.empty() ? 0 : 2;
}
