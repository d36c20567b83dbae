/**
 * @file transfer_config.cpp
 * @brief Transfer configuration defaults and environment loading
 */

#include "latch/ldata/config/transfer_config.h"

#include <latch/ldata/core/logging.h>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

#include <sched.h>

namespace latch::ldata {

namespace {

auto usable_cores() -> std::size_t {
    cpu_set_t set;
    CPU_ZERO(&set);
    if (sched_getaffinity(0, sizeof(set), &set) == 0) {
        auto count = CPU_COUNT(&set);
        if (count > 0) {
            return static_cast<std::size_t>(count);
        }
    }

    auto count = std::thread::hardware_concurrency();
    return count > 0 ? count : 1;
}

auto read_size_env(const char* name) -> std::optional<std::size_t> {
    const char* raw = std::getenv(name);
    if (raw == nullptr || *raw == '\0') {
        return std::nullopt;
    }

    // strtoull accepts a sign and wraps negative input
    std::string_view text(raw);
    auto first = text.find_first_not_of(" \t");
    if (first != std::string_view::npos && (text[first] == '-' || text[first] == '+')) {
        LDATA_LOG_WARN(log_category::downloader,
            std::string("Ignoring signed ") + name + "=" + raw);
        return std::nullopt;
    }

    char* end = nullptr;
    errno = 0;
    auto value = std::strtoull(raw, &end, 10);
    if (errno == ERANGE) {
        LDATA_LOG_WARN(log_category::downloader,
            std::string("Ignoring out-of-range ") + name + "=" + raw);
        return std::nullopt;
    }
    if (end == raw || *end != '\0') {
        LDATA_LOG_WARN(log_category::downloader,
            std::string("Ignoring unparsable ") + name + "=" + raw);
        return std::nullopt;
    }
    return static_cast<std::size_t>(value);
}

}  // namespace

auto default_max_workers() -> std::size_t {
    return std::min(usable_cores() * 4, max_auto_workers);
}

auto transfer_config::effective_max_workers() const -> std::size_t {
    return max_workers > 0 ? max_workers : default_max_workers();
}

auto transfer_config::validate() const -> result<void> {
    if (chunk_size == 0) {
        return unexpected{error{error_code::invalid_chunk_size,
            "Chunk size must be greater than zero"}};
    }
    if (max_workers > max_configured_workers) {
        return unexpected{error{error_code::invalid_configuration,
            "Worker count " + std::to_string(max_workers) + " exceeds the limit of " +
            std::to_string(max_configured_workers)}};
    }
    if (progress_refresh.count() <= 0) {
        return unexpected{error{error_code::invalid_configuration,
            "Progress refresh interval must be positive"}};
    }
    return {};
}

auto transfer_config::from_environment() -> transfer_config {
    transfer_config config;

    if (auto workers = read_size_env("LDATA_MAX_WORKERS")) {
        if (*workers > max_configured_workers) {
            LDATA_LOG_WARN(log_category::downloader,
                "LDATA_MAX_WORKERS=" + std::to_string(*workers) + " clamped to " +
                std::to_string(max_configured_workers));
        }
        config.max_workers = std::min(*workers, max_configured_workers);
    }
    if (auto chunk = read_size_env("LDATA_CHUNK_SIZE"); chunk && *chunk > 0) {
        config.chunk_size = *chunk;
    }

    return config;
}

}  // namespace latch::ldata
