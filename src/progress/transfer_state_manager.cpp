/**
 * @file transfer_state_manager.cpp
 * @brief Scoped owner of the progress resource of one transfer invocation
 */

#include "latch/ldata/progress/transfer_state_manager.h"

#include <latch/ldata/core/logging.h>

#include <exception>
#include <string>

namespace latch::ldata {

std::atomic<bool> transfer_state_manager::active_{false};

auto transfer_state_manager::create(progress_bars::options opts)
    -> result<std::unique_ptr<transfer_state_manager>> {
    bool expected = false;
    if (!active_.compare_exchange_strong(expected, true)) {
        LDATA_LOG_ERROR(log_category::progress,
            "Refusing to start a transfer while another one is active");
        return unexpected{error{error_code::already_initialized,
                                "a transfer is already in progress"}};
    }

    try {
        return std::unique_ptr<transfer_state_manager>(
            new transfer_state_manager(opts));
    } catch (const std::exception& e) {
        active_.store(false);
        LDATA_LOG_ERROR(log_category::progress,
            std::string("Unable to set up transfer progress: ") + e.what());
        return unexpected{error{error_code::internal_error,
            std::string("unable to set up transfer progress: ") + e.what()}};
    }
}

transfer_state_manager::transfer_state_manager(progress_bars::options opts)
    : progress_(std::make_unique<progress_bars>(opts)) {}

transfer_state_manager::~transfer_state_manager() {
    progress_->close();
    LDATA_LOG_DEBUG(log_category::progress,
        std::string("Transfer state released in phase ") +
        std::string(to_string(phase_.load())));
    active_.store(false);
}

void transfer_state_manager::set_phase(transfer_phase phase) noexcept {
    phase_.store(phase);
}

auto transfer_state_manager::is_active() noexcept -> bool {
    return active_.load();
}

}  // namespace latch::ldata
