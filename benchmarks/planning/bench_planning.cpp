/**
 * @file bench_planning.cpp
 * @brief Benchmarks for job construction and conflict resolution
 */

#include <benchmark/benchmark.h>

#include <latch/ldata/transfer/job_planner.h>

#include "utils/benchmark_helpers.h"

#include <fstream>

namespace latch::ldata::benchmark {

/**
 * @brief Benchmark for building jobs from a listing
 */
static void BM_BuildJobs(::benchmark::State& state) {
    const auto count = static_cast<std::size_t>(state.range(0));
    auto nodes = make_listing(count, 32, 3, 1);

    for (auto _ : state) {
        auto jobs = job_planner::build_jobs("/data/download", nodes);
        ::benchmark::DoNotOptimize(jobs);
    }

    state.SetItemsProcessed(static_cast<int64_t>(count) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Benchmark for creating destination trees without collisions
 */
static void BM_ResolveConflicts_Clean(::benchmark::State& state) {
    const auto count = static_cast<std::size_t>(state.range(0));
    const auto fanout = static_cast<std::size_t>(state.range(1));
    auto nodes = make_listing(count, fanout, 3, 1);

    temp_directory root("ldata_bench_plan");
    job_planner planner(nullptr, nullptr);

    for (auto _ : state) {
        state.PauseTiming();
        root.clear();
        auto jobs = job_planner::build_jobs(root.path(), nodes);
        std::vector<std::filesystem::path> skipped;
        state.ResumeTiming();

        auto confirmed = planner.resolve_conflicts(std::move(jobs),
                                                   overwrite_policy::always_skip, skipped);
        if (!confirmed) {
            state.SkipWithError(confirmed.error().message.c_str());
            return;
        }
        ::benchmark::DoNotOptimize(confirmed.value());
    }

    state.SetItemsProcessed(static_cast<int64_t>(count) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Benchmark for pruning jobs under rejected paths
 *
 * Every top-level directory is blocked by a plain file, so all but the
 * first job of each bucket are dropped by the ancestor check.
 */
static void BM_ResolveConflicts_Pruned(::benchmark::State& state) {
    const auto count = static_cast<std::size_t>(state.range(0));
    constexpr std::size_t fanout = 16;
    auto nodes = make_listing(count, fanout, 3, 1);

    temp_directory root("ldata_bench_prune");
    job_planner planner(nullptr, nullptr);

    for (auto _ : state) {
        state.PauseTiming();
        root.clear();
        for (std::size_t b = 0; b < fanout; ++b) {
            std::ofstream(root.path() / ("d0_" + std::to_string(b))) << "x";
        }
        auto jobs = job_planner::build_jobs(root.path(), nodes);
        std::vector<std::filesystem::path> skipped;
        state.ResumeTiming();

        auto confirmed = planner.resolve_conflicts(std::move(jobs),
                                                   overwrite_policy::always_skip, skipped);
        if (!confirmed || skipped.size() != fanout) {
            state.SkipWithError("Unexpected pruning result");
            return;
        }
        ::benchmark::DoNotOptimize(confirmed.value());
    }

    state.SetItemsProcessed(static_cast<int64_t>(count) *
                            static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_BuildJobs)->Arg(100)->Arg(1000)->Arg(10000);

BENCHMARK(BM_ResolveConflicts_Clean)
    ->Args({100, 4})
    ->Args({1000, 32})
    ->Args({1000, 256})
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_ResolveConflicts_Pruned)
    ->Arg(1000)
    ->Arg(10000)
    ->Unit(::benchmark::kMillisecond);

}  // namespace latch::ldata::benchmark
