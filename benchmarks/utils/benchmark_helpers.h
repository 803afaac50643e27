/**
 * @file benchmark_helpers.h
 * @brief Helper utilities for benchmarks
 */

#ifndef KCENON_FILE_RIPPER_BENCHMARKS_BENCHMARK_HELPERS_H
#define KCENON_FILE_RIPPER_BENCHMARKS_BENCHMARK_HELPERS_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace kcenon::file_ripper::benchmark {

/**
 * @brief Generate random binary data
 * @param size Size in bytes
 * @param seed Random seed (0 for random)
 */
auto generate_random_data(std::size_t size, uint32_t seed = 0) -> std::vector<std::byte>;

/**
 * @brief Scratch directory holding a source tree and a loopback remote root
 *
 * Everything below base_dir() is removed on destruction.
 */
class scratch_tree {
public:
    explicit scratch_tree(const std::string& name);
    ~scratch_tree();

    // Non-copyable
    scratch_tree(const scratch_tree&) = delete;
    auto operator=(const scratch_tree&) -> scratch_tree& = delete;

    /**
     * @brief Write a file of random bytes below the source directory
     */
    auto create_random_file(const std::string& relative, std::size_t size, uint32_t seed = 0)
        -> std::filesystem::path;

    /**
     * @brief Fill the source directory with count files of size bytes each
     */
    void populate(std::size_t count, std::size_t size);

    /**
     * @brief Empty the remote root between iterations
     */
    void reset_remote();

    [[nodiscard]] auto base_dir() const -> const std::filesystem::path& { return base_dir_; }
    [[nodiscard]] auto source_dir() const -> std::filesystem::path { return base_dir_ / "source"; }
    [[nodiscard]] auto remote_dir() const -> std::filesystem::path { return base_dir_ / "remote"; }

private:
    std::filesystem::path base_dir_;
};

/**
 * @brief Size constants for benchmarks
 */
namespace sizes {
constexpr std::size_t KB = 1024;
constexpr std::size_t MB = 1024 * KB;

constexpr std::size_t small_file = 64 * KB;
constexpr std::size_t medium_file = 1 * MB;
constexpr std::size_t multipart_file = 32 * MB;  // above the 10 MB threshold
}  // namespace sizes

}  // namespace kcenon::file_ripper::benchmark

#endif  // KCENON_FILE_RIPPER_BENCHMARKS_BENCHMARK_HELPERS_H
