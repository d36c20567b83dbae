/**
 * @file bench_download_throughput.cpp
 * @brief Benchmarks for streaming generated objects to disk
 */

#include <benchmark/benchmark.h>

#include <latch/ldata/progress/transfer_state_manager.h>
#include <latch/ldata/transfer/job_planner.h>
#include <latch/ldata/transfer/transfer_coordinator.h>

#include "utils/benchmark_helpers.h"

namespace latch::ldata::benchmark {

/**
 * @brief Single object through one worker at various chunk sizes
 */
static void BM_TransferOne(::benchmark::State& state) {
    const auto chunk_size = static_cast<std::size_t>(state.range(0));
    const auto object_size = sizes::medium_file;

    temp_directory dir("ldata_bench_one");
    transfer_worker worker(std::make_shared<generated_object_opener>(), chunk_size);
    progress_bars progress(progress_bars::options{1});
    std::atomic<bool> cancel{false};
    transfer_job job("mem://" + std::to_string(object_size) + "/0", dir.path() / "object.bin");

    for (auto _ : state) {
        auto bytes = worker.transfer_one(job, progress, cancel);
        if (!bytes) {
            state.SkipWithError(bytes.error().message.c_str());
            return;
        }
    }

    state.SetBytesProcessed(static_cast<int64_t>(object_size) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Many small objects fanned out over a varying worker count
 */
static void BM_CoordinatorRun(::benchmark::State& state) {
    const auto workers = static_cast<std::size_t>(state.range(0));
    constexpr std::size_t file_count = 64;

    temp_directory dir("ldata_bench_run");
    auto nodes = make_listing(file_count, 8, 1, sizes::small_file);
    for (std::size_t b = 0; b < 8; ++b) {
        std::filesystem::create_directories(dir.path() / ("d0_" + std::to_string(b)));
    }
    auto jobs = job_planner::build_jobs(dir.path(), nodes);

    transfer_config config;
    config.max_workers = workers;
    config.chunk_size = sizes::min_chunk;
    transfer_coordinator coordinator(std::make_shared<generated_object_opener>(), config);

    for (auto _ : state) {
        auto scope = transfer_state_manager::create(progress_bars::options{workers, true});
        if (!scope) {
            state.SkipWithError(scope.error().message.c_str());
            return;
        }
        auto summary = coordinator.run(jobs, jobs.size(), scope.value()->progress());
        if (!summary) {
            state.SkipWithError(summary.error().message.c_str());
            return;
        }
    }

    state.SetBytesProcessed(static_cast<int64_t>(file_count * sizes::small_file) *
                            static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_TransferOne)
    ->Arg(sizes::min_chunk)
    ->Arg(1 * sizes::MB)
    ->Arg(sizes::default_chunk)
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_CoordinatorRun)
    ->Arg(1)
    ->Arg(4)
    ->Arg(16)
    ->Unit(::benchmark::kMillisecond)
    ->UseRealTime();

}  // namespace latch::ldata::benchmark
