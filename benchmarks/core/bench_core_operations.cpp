/**
 * @file bench_core_operations.cpp
 * @brief Benchmarks for CRC32, range planning and the job queue
 */

#include <benchmark/benchmark.h>

#include <kcenon/file_ripper/core/checksum.h>
#include <kcenon/file_ripper/core/job_queue.h>
#include <kcenon/file_ripper/core/multipart_plan.h>
#include <kcenon/file_ripper/core/progress_monitor.h>

#include "utils/benchmark_helpers.h"

#include <thread>
#include <vector>

namespace kcenon::file_ripper::benchmark {

static void BM_Crc32(::benchmark::State& state) {
    const auto size = static_cast<std::size_t>(state.range(0));
    auto data = generate_random_data(size, 42);

    for (auto _ : state) {
        auto crc = checksum::crc32(data);
        ::benchmark::DoNotOptimize(crc);
    }

    state.SetBytesProcessed(static_cast<int64_t>(size) * static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_Crc32)
    ->Arg(4 * sizes::KB)
    ->Arg(64 * sizes::KB)
    ->Arg(sizes::MB)
    ->Unit(::benchmark::kMicrosecond);

static void BM_Crc32_Incremental(::benchmark::State& state) {
    const auto buffer = static_cast<std::size_t>(state.range(0));
    auto data = generate_random_data(sizes::MB, 7);

    for (auto _ : state) {
        uint32_t crc = 0;
        for (std::size_t offset = 0; offset < data.size(); offset += buffer) {
            auto len = std::min(buffer, data.size() - offset);
            crc = checksum::crc32_update(crc, std::span<const std::byte>(data.data() + offset, len));
        }
        ::benchmark::DoNotOptimize(crc);
    }

    state.SetBytesProcessed(static_cast<int64_t>(sizes::MB) *
                            static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_Crc32_Incremental)->Arg(32 * sizes::KB)->Arg(64 * sizes::KB);

static void BM_SplitRanges(::benchmark::State& state) {
    const auto parts = static_cast<std::size_t>(state.range(0));
    for (auto _ : state) {
        auto ranges = split_ranges(uint64_t{20} * sizes::MB + 7, parts);
        ::benchmark::DoNotOptimize(ranges.data());
    }
}
BENCHMARK(BM_SplitRanges)->Arg(16)->Arg(256);

static void BM_JobQueue_AddPop(::benchmark::State& state) {
    const auto jobs = static_cast<std::size_t>(state.range(0));

    for (auto _ : state) {
        job_queue queue;
        for (std::size_t i = 0; i < jobs; ++i) {
            queue.add(transfer_job{"local/file.bin", "remote/file.bin", transfer_direction::upload});
        }
        while (auto job = queue.pop()) {
            ::benchmark::DoNotOptimize(job);
        }
    }

    state.SetItemsProcessed(static_cast<int64_t>(jobs) * static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_JobQueue_AddPop)->Arg(1000)->Arg(100000);

static void BM_JobQueue_ContendedDrain(::benchmark::State& state) {
    const auto workers = static_cast<std::size_t>(state.range(0));
    constexpr std::size_t jobs = 20000;

    for (auto _ : state) {
        state.PauseTiming();
        job_queue queue;
        for (std::size_t i = 0; i < jobs; ++i) {
            queue.add(transfer_job{"l", "r", transfer_direction::download});
        }
        state.ResumeTiming();

        std::vector<std::thread> threads;
        for (std::size_t w = 0; w < workers; ++w) {
            threads.emplace_back([&queue]() {
                while (queue.pop()) {
                }
            });
        }
        for (auto& t : threads) {
            t.join();
        }
    }

    state.SetItemsProcessed(static_cast<int64_t>(jobs) * static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_JobQueue_ContendedDrain)->Arg(4)->Arg(64)->UseRealTime();

static void BM_Monitor_AddBytes(::benchmark::State& state) {
    static progress_monitor monitor;
    if (state.thread_index() == 0) {
        monitor.reset(1, 1);
    }
    for (auto _ : state) {
        monitor.add_bytes(32 * sizes::KB);
    }
}
BENCHMARK(BM_Monitor_AddBytes)->Threads(1)->Threads(8);

}  // namespace kcenon::file_ripper::benchmark

BENCHMARK_MAIN();
