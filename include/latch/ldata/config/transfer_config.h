/**
 * @file transfer_config.h
 * @brief Tunables of the transfer engine
 */

#ifndef LATCH_LDATA_CONFIG_TRANSFER_CONFIG_H
#define LATCH_LDATA_CONFIG_TRANSFER_CONFIG_H

#include <chrono>
#include <cstddef>

#include "latch/ldata/core/types.h"

namespace latch::ldata {

/**
 * @brief Upper bound on the automatically chosen worker count
 */
inline constexpr std::size_t max_auto_workers = 16;

/**
 * @brief Upper bound on an explicitly configured worker count
 */
inline constexpr std::size_t max_configured_workers = 256;

/**
 * @brief Default streaming chunk size (5 MiB)
 */
inline constexpr std::size_t default_chunk_size = 5 * 1024 * 1024;

/**
 * @brief Worker count used when none is configured
 *
 * Four workers per usable core (transfers block on I/O), capped at
 * max_auto_workers.
 */
[[nodiscard]] auto default_max_workers() -> std::size_t;

/**
 * @brief Transfer engine configuration
 */
struct transfer_config {
    std::size_t max_workers = 0;                       ///< 0 = default_max_workers()
    std::size_t chunk_size = default_chunk_size;        ///< Bytes per streamed chunk
    std::chrono::milliseconds progress_refresh{100};    ///< Bar redraw interval
    std::chrono::milliseconds http_timeout{30000};      ///< Signed URL issuance timeout
    std::chrono::milliseconds connect_timeout{30000};   ///< Object stream connect timeout

    /**
     * @brief Resolved worker limit (never zero)
     */
    [[nodiscard]] auto effective_max_workers() const -> std::size_t;

    /**
     * @brief Check the configuration for values the engine cannot run with
     */
    [[nodiscard]] auto validate() const -> result<void>;

    /**
     * @brief Build a configuration from the process environment
     *
     * Reads LDATA_MAX_WORKERS and LDATA_CHUNK_SIZE; unset or unparsable
     * values keep their defaults.
     */
    [[nodiscard]] static auto from_environment() -> transfer_config;
};

}  // namespace latch::ldata

#endif  // LATCH_LDATA_CONFIG_TRANSFER_CONFIG_H
