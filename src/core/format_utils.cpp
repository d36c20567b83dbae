/**
 * @file format_utils.cpp
 * @brief Implementation of size and duration formatting
 */

#include "latch/ldata/core/format_utils.h"

#include <array>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace latch::ldata {

auto with_si_suffix(uint64_t bytes) -> std::string {
    static constexpr std::array<const char*, 7> suffixes{
        "B", "KB", "MB", "GB", "TB", "PB", "EB"};

    if (bytes < 1000) {
        return std::to_string(bytes) + " B";
    }

    auto value = static_cast<double>(bytes);
    std::size_t index = 0;
    while (value >= 1000.0 && index + 1 < suffixes.size()) {
        value /= 1000.0;
        ++index;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value << " " << suffixes[index];
    return oss.str();
}

auto human_readable_time(double seconds) -> std::string {
    if (seconds < 0.0) {
        seconds = 0.0;
    }

    std::ostringstream oss;
    if (seconds < 60.0) {
        oss << std::fixed << std::setprecision(2) << seconds << "s";
        return oss.str();
    }

    auto total = static_cast<uint64_t>(std::floor(seconds));
    uint64_t hours = total / 3600;
    uint64_t minutes = (total % 3600) / 60;
    uint64_t secs = total % 60;

    if (hours > 0) {
        oss << hours << "h ";
    }
    oss << minutes << "m " << secs << "s";
    return oss.str();
}

}  // namespace latch::ldata
