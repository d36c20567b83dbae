/**
 * @file transfer_coordinator.h
 * @brief Runs planned jobs on a bounded worker group
 */

#ifndef LATCH_LDATA_TRANSFER_TRANSFER_COORDINATOR_H
#define LATCH_LDATA_TRANSFER_TRANSFER_COORDINATOR_H

#include "latch/ldata/adapters/worker_pool_adapter.h"
#include "latch/ldata/config/transfer_config.h"
#include "latch/ldata/core/transfer_types.h"
#include "latch/ldata/core/types.h"
#include "latch/ldata/progress/progress_bars.h"
#include "latch/ldata/transfer/transfer_worker.h"

#include <cstddef>
#include <memory>
#include <vector>

namespace latch::ldata {

/**
 * @brief Fans jobs out to workers and folds their byte counts
 *
 * Jobs are dispatched in list order to min(max_workers, jobs) long-lived
 * tasks that pull the next index from a shared cursor. The first failure
 * stops dispatch, interrupts the other in-flight jobs at their next chunk
 * boundary, waits for every task to return and is then reported. Files
 * already written stay on disk.
 *
 * Must be called inside an active transfer_state_manager scope.
 */
class transfer_coordinator {
public:
    transfer_coordinator(std::shared_ptr<object_opener> opener, transfer_config config);

    /**
     * @brief Run on a caller-supplied pool instead of a fresh one per call
     */
    void set_pool(std::shared_ptr<adapters::worker_pool_interface> pool);

    /**
     * @brief Download every job
     * @param file_count Value shown as the aggregate bar's total
     */
    [[nodiscard]] auto run(const std::vector<transfer_job>& jobs,
                           std::size_t file_count,
                           progress_bars& progress) -> result<transfer_summary>;

    /**
     * @brief Download one job on the calling thread
     */
    [[nodiscard]] auto run_single(const transfer_job& job,
                                  progress_bars& progress) -> result<transfer_summary>;

    /**
     * @brief Worker tasks run() would start for @p job_count jobs
     */
    [[nodiscard]] auto pool_width(std::size_t job_count) const -> std::size_t;

    [[nodiscard]] auto config() const noexcept -> const transfer_config& { return config_; }

private:
    transfer_config config_;
    transfer_worker worker_;
    std::shared_ptr<adapters::worker_pool_interface> pool_;
};

}  // namespace latch::ldata

#endif  // LATCH_LDATA_TRANSFER_TRANSFER_COORDINATOR_H
