/**
 * @file transfer_coordinator.cpp
 * @brief Runs planned jobs on a bounded worker group
 */

#include "latch/ldata/transfer/transfer_coordinator.h"

#include "latch/ldata/core/logging.h"
#include "latch/ldata/progress/transfer_state_manager.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <future>
#include <mutex>
#include <optional>

namespace latch::ldata {

namespace {

constexpr const char* download_stage = "download";

/**
 * @brief State shared by the worker tasks of one run()
 */
struct run_state {
    std::atomic<std::size_t> cursor{0};
    std::atomic<bool> cancel{false};
    std::atomic<uint64_t> total_bytes{0};
    std::atomic<std::size_t> succeeded{0};

    std::mutex error_mutex;
    std::optional<error> first_error;

    void fail(error err) {
        {
            std::lock_guard<std::mutex> lock(error_mutex);
            if (!first_error) {
                first_error = std::move(err);
            }
        }
        cancel.store(true);
    }
};

auto elapsed_since(std::chrono::steady_clock::time_point start) -> double {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

}  // namespace

transfer_coordinator::transfer_coordinator(std::shared_ptr<object_opener> opener,
                                           transfer_config config)
    : config_(config), worker_(std::move(opener), config.chunk_size) {}

void transfer_coordinator::set_pool(std::shared_ptr<adapters::worker_pool_interface> pool) {
    pool_ = std::move(pool);
}

auto transfer_coordinator::pool_width(std::size_t job_count) const -> std::size_t {
    return std::min(config_.effective_max_workers(), job_count);
}

auto transfer_coordinator::run(const std::vector<transfer_job>& jobs,
                               std::size_t file_count,
                               progress_bars& progress) -> result<transfer_summary> {
    if (!transfer_state_manager::is_active()) {
        return unexpected{error{error_code::not_initialized,
            "transfers must run inside a transfer state scope"}};
    }
    if (auto valid = config_.validate(); !valid) {
        return unexpected{valid.error()};
    }

    progress.set_total(file_count, "Copying Files");

    auto start = std::chrono::steady_clock::now();
    if (jobs.empty()) {
        return transfer_summary(0, 0, elapsed_since(start));
    }

    auto width = pool_width(jobs.size());
    auto pool = pool_ ? pool_ : adapters::worker_pool_factory::create(width);

    transfer_log_context ctx;
    ctx.file_count = jobs.size();
    ctx.worker_count = width;
    LDATA_LOG_INFO_CTX(log_category::coordinator, "Starting download", ctx);

    run_state state;
    auto task = [this, &jobs, &progress, &state]() {
        try {
            while (!state.cancel.load()) {
                auto index = state.cursor.fetch_add(1);
                if (index >= jobs.size()) {
                    return;
                }

                auto bytes = worker_.transfer_one(jobs[index], progress, state.cancel);
                if (!bytes) {
                    if (bytes.error().code != error_code::transfer_cancelled) {
                        LDATA_LOG_ERROR(log_category::coordinator, bytes.error().message);
                    }
                    state.fail(bytes.error());
                    return;
                }

                state.total_bytes.fetch_add(bytes.value());
                state.succeeded.fetch_add(1);
            }
        } catch (const std::exception& e) {
            // Raise cancel now rather than when this future is joined.
            LDATA_LOG_ERROR(log_category::coordinator,
                std::string("Download task failed: ") + e.what());
            state.fail(error{error_code::internal_error,
                std::string("download task failed: ") + e.what()});
        }
    };

    std::vector<std::future<void>> futures;
    futures.reserve(width);
    for (std::size_t i = 0; i < width; ++i) {
        futures.push_back(pool->submit_to_stage(task, download_stage));
    }

    for (auto& f : futures) {
        try {
            f.get();
        } catch (const std::exception& e) {
            state.fail(error{error_code::internal_error,
                std::string("download task failed: ") + e.what()});
        }
    }

    if (state.first_error) {
        return unexpected{*state.first_error};
    }

    transfer_summary summary(state.succeeded.load(), state.total_bytes.load(),
                             elapsed_since(start));

    ctx.bytes_transferred = summary.total_bytes();
    ctx.duration_ms = static_cast<uint64_t>(summary.elapsed_seconds() * 1000.0);
    ctx.rate_mbps = summary.average_rate() / (1024.0 * 1024.0);
    LDATA_LOG_INFO_CTX(log_category::coordinator, "Download finished", ctx);
    return summary;
}

auto transfer_coordinator::run_single(const transfer_job& job,
                                      progress_bars& progress) -> result<transfer_summary> {
    if (!transfer_state_manager::is_active()) {
        return unexpected{error{error_code::not_initialized,
            "transfers must run inside a transfer state scope"}};
    }
    if (auto valid = config_.validate(); !valid) {
        return unexpected{valid.error()};
    }

    std::atomic<bool> never_cancelled{false};
    auto start = std::chrono::steady_clock::now();

    auto bytes = worker_.transfer_one(job, progress, never_cancelled);
    if (!bytes) {
        LDATA_LOG_ERROR(log_category::coordinator, bytes.error().message);
        return unexpected{bytes.error()};
    }
    return transfer_summary(1, bytes.value(), elapsed_since(start));
}

}  // namespace latch::ldata
