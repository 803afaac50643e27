/**
 * @file bench_loopback_upload.cpp
 * @brief End-to-end upload throughput over the loopback transport
 */

#include <benchmark/benchmark.h>

#include <kcenon/file_ripper/core/logging.h>
#include <kcenon/file_ripper/engine/transfer_engine.h>
#include <kcenon/file_ripper/transport/local_transport.h>

#include "utils/benchmark_helpers.h"

namespace kcenon::file_ripper::benchmark {

namespace {

auto make_sessions(const std::filesystem::path& root, std::size_t count) -> session_list {
    session_list sessions;
    for (std::size_t i = 0; i < count; ++i) {
        sessions.push_back(std::make_shared<local_transport>(root));
    }
    return sessions;
}

}  // namespace

/**
 * @brief Many small files; args are file count and worker count
 */
static void BM_Upload_ManySmallFiles(::benchmark::State& state) {
    const auto files = static_cast<std::size_t>(state.range(0));
    const auto workers = static_cast<std::size_t>(state.range(1));

    get_logger().set_level(log_level::error);

    scratch_tree tree("small_" + std::to_string(files) + "_" + std::to_string(workers));
    tree.populate(files, sizes::small_file);
    auto sessions = make_sessions(tree.remote_dir(), 4);

    auto engine = transfer_engine::builder().with_concurrency(workers).build();
    if (!engine) {
        state.SkipWithError("failed to build engine");
        return;
    }

    for (auto _ : state) {
        state.PauseTiming();
        tree.reset_remote();
        state.ResumeTiming();

        auto report = engine.value().start_upload(sessions, tree.source_dir(), "dest");
        if (!report) {
            state.SkipWithError(report.error().message.c_str());
            return;
        }
    }

    state.SetBytesProcessed(static_cast<int64_t>(files * sizes::small_file) *
                            static_cast<int64_t>(state.iterations()));
    state.SetItemsProcessed(static_cast<int64_t>(files) * static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_Upload_ManySmallFiles)
    ->Args({256, 4})
    ->Args({256, 64})
    ->Unit(::benchmark::kMillisecond)
    ->UseRealTime();

/**
 * @brief One large file, multipart against single stream
 */
static void BM_Upload_LargeFile(::benchmark::State& state) {
    const bool multipart = state.range(0) != 0;

    get_logger().set_level(log_level::error);

    scratch_tree tree(multipart ? "large_multipart" : "large_single");
    tree.create_random_file("large.bin", sizes::multipart_file, 99);
    auto sessions = make_sessions(tree.remote_dir(), 1);

    transfer_options options;
    if (!multipart) {
        options.multipart.threshold = uint64_t{1} << 40;
    }

    auto engine = transfer_engine::builder().with_transfer_options(options).build();
    if (!engine) {
        state.SkipWithError("failed to build engine");
        return;
    }

    for (auto _ : state) {
        state.PauseTiming();
        tree.reset_remote();
        state.ResumeTiming();

        auto report = engine.value().upload_one(sessions, tree.source_dir() / "large.bin", "large.bin");
        if (!report) {
            state.SkipWithError(report.error().message.c_str());
            return;
        }
    }

    state.SetBytesProcessed(static_cast<int64_t>(sizes::multipart_file) *
                            static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_Upload_LargeFile)
    ->Arg(0)
    ->Arg(1)
    ->Unit(::benchmark::kMillisecond)
    ->UseRealTime();

}  // namespace kcenon::file_ripper::benchmark

BENCHMARK_MAIN();
