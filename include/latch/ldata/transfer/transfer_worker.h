/**
 * @file transfer_worker.h
 * @brief Streams one remote object into one local file
 */

#ifndef LATCH_LDATA_TRANSFER_TRANSFER_WORKER_H
#define LATCH_LDATA_TRANSFER_TRANSFER_WORKER_H

#include "latch/ldata/core/transfer_types.h"
#include "latch/ldata/core/types.h"
#include "latch/ldata/io/object_stream.h"
#include "latch/ldata/progress/progress_bars.h"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>

namespace latch::ldata {

/**
 * @brief Executes a single transfer_job
 *
 * Stateless between jobs; one instance may serve every job of a transfer
 * from several threads at once, provided the opener is thread-safe.
 */
class transfer_worker {
public:
    /**
     * @param opener Source of object readers
     * @param chunk_size Bytes read and written per step (must be non-zero)
     */
    transfer_worker(std::shared_ptr<object_opener> opener, std::size_t chunk_size);

    /**
     * @brief Stream @p job to disk
     *
     * Holds one progress slot while streaming and bumps the files-completed
     * counter exactly once, whether the job succeeds or not. Stops with
     * error_code::transfer_cancelled at the next chunk boundary once
     * @p cancel_flag is set.
     *
     * @return The advertised content length
     */
    [[nodiscard]] auto transfer_one(const transfer_job& job,
                                    progress_bars& progress,
                                    const std::atomic<bool>& cancel_flag)
        -> result<uint64_t>;

    [[nodiscard]] auto chunk_size() const noexcept -> std::size_t { return chunk_size_; }

private:
    std::shared_ptr<object_opener> opener_;
    std::size_t chunk_size_;
};

}  // namespace latch::ldata

#endif  // LATCH_LDATA_TRANSFER_TRANSFER_WORKER_H
