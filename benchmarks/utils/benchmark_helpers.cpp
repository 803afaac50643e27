/**
 * @file benchmark_helpers.cpp
 * @brief Implementation of benchmark helper utilities
 */

#include "utils/benchmark_helpers.h"

#include <fstream>
#include <random>
#include <system_error>

namespace kcenon::file_ripper::benchmark {

auto generate_random_data(std::size_t size, uint32_t seed) -> std::vector<std::byte> {
    std::vector<std::byte> data(size);

    std::mt19937 gen(seed == 0 ? std::random_device{}() : seed);
    std::uniform_int_distribution<uint16_t> dis(0, 255);

    for (auto& byte : data) {
        byte = static_cast<std::byte>(dis(gen));
    }

    return data;
}

scratch_tree::scratch_tree(const std::string& name)
    : base_dir_(std::filesystem::temp_directory_path() / ("file_ripper_bench_" + name)) {
    std::error_code ec;
    std::filesystem::remove_all(base_dir_, ec);
    std::filesystem::create_directories(source_dir(), ec);
    std::filesystem::create_directories(remote_dir(), ec);
}

scratch_tree::~scratch_tree() {
    std::error_code ec;
    std::filesystem::remove_all(base_dir_, ec);
}

auto scratch_tree::create_random_file(const std::string& relative, std::size_t size, uint32_t seed)
    -> std::filesystem::path {
    auto path = source_dir() / relative;
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);

    auto data = generate_random_data(size, seed);
    std::ofstream file(path, std::ios::binary);
    file.write(reinterpret_cast<const char*>(data.data()),
               static_cast<std::streamsize>(data.size()));
    return path;
}

void scratch_tree::populate(std::size_t count, std::size_t size) {
    for (std::size_t i = 0; i < count; ++i) {
        auto dir = "dir_" + std::to_string(i % 8);
        create_random_file(dir + "/file_" + std::to_string(i) + ".bin", size,
                           static_cast<uint32_t>(i + 1));
    }
}

void scratch_tree::reset_remote() {
    std::error_code ec;
    std::filesystem::remove_all(remote_dir(), ec);
    std::filesystem::create_directories(remote_dir(), ec);
}

}  // namespace kcenon::file_ripper::benchmark
