/**
 * @file format_utils.h
 * @brief Human-readable formatting of sizes and durations
 */

#ifndef LATCH_LDATA_CORE_FORMAT_UTILS_H
#define LATCH_LDATA_CORE_FORMAT_UTILS_H

#include <cstdint>
#include <string>

namespace latch::ldata {

/**
 * @brief Format a byte count with a decimal SI suffix
 *
 * Examples: 999 -> "999 B", 1500 -> "1.50 KB", 2'000'000 -> "2.00 MB".
 */
[[nodiscard]] auto with_si_suffix(uint64_t bytes) -> std::string;

/**
 * @brief Format a duration in seconds
 *
 * Durations under a minute keep two decimals ("2.50s"); longer ones are
 * split into whole units ("1h 2m 3s", "4m 0s").
 */
[[nodiscard]] auto human_readable_time(double seconds) -> std::string;

}  // namespace latch::ldata

#endif  // LATCH_LDATA_CORE_FORMAT_UTILS_H
