/**
 * @file transfer_state_manager.h
 * @brief Scoped owner of the progress resource of one transfer invocation
 */

#ifndef LATCH_LDATA_PROGRESS_TRANSFER_STATE_MANAGER_H
#define LATCH_LDATA_PROGRESS_TRANSFER_STATE_MANAGER_H

#include <atomic>
#include <memory>

#include "latch/ldata/core/transfer_types.h"
#include "latch/ldata/core/types.h"
#include "latch/ldata/progress/progress_bars.h"

namespace latch::ldata {

/**
 * @brief Creates the progress bars on entry and closes them on exit
 *
 * At most one instance may be alive per process; create() refuses a second
 * one with error_code::already_initialized. The bars are closed when the
 * manager is destroyed, whether the transfer succeeded or not.
 *
 * @code
 * auto state = transfer_state_manager::create({.num_bars = 4});
 * if (!state) return unexpected{state.error()};
 * auto summary = coordinator.run(jobs, count, state.value()->progress());
 * @endcode
 */
class transfer_state_manager {
public:
    [[nodiscard]] static auto create(progress_bars::options opts)
        -> result<std::unique_ptr<transfer_state_manager>>;

    ~transfer_state_manager();

    transfer_state_manager(const transfer_state_manager&) = delete;
    auto operator=(const transfer_state_manager&) -> transfer_state_manager& = delete;
    transfer_state_manager(transfer_state_manager&&) = delete;
    auto operator=(transfer_state_manager&&) -> transfer_state_manager& = delete;

    [[nodiscard]] auto progress() noexcept -> progress_bars& { return *progress_; }

    [[nodiscard]] auto phase() const noexcept -> transfer_phase { return phase_.load(); }
    void set_phase(transfer_phase phase) noexcept;

    /**
     * @brief Whether a manager is currently alive in this process
     */
    [[nodiscard]] static auto is_active() noexcept -> bool;

private:
    explicit transfer_state_manager(progress_bars::options opts);

    std::unique_ptr<progress_bars> progress_;
    std::atomic<transfer_phase> phase_{transfer_phase::planning};

    static std::atomic<bool> active_;
};

}  // namespace latch::ldata

#endif  // LATCH_LDATA_PROGRESS_TRANSFER_STATE_MANAGER_H
