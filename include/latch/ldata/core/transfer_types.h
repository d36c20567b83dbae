/**
 * @file transfer_types.h
 * @brief Transfer-related data structures for ldata_transfer
 *
 * This file defines the values that flow between the planner, the workers
 * and the coordinator: jobs, conflict policy, progress verbosity and the
 * final summary.
 */

#ifndef LATCH_LDATA_CORE_TRANSFER_TYPES_H
#define LATCH_LDATA_CORE_TRANSFER_TYPES_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>

namespace latch::ldata {

/**
 * @brief One unit of work: stream one remote object into one local file
 *
 * The destination always names the leaf file to be written, never a
 * directory. Jobs are built once by the planner and never modified.
 */
class transfer_job {
public:
    transfer_job(std::string source_locator, std::filesystem::path destination)
        : source_locator_(std::move(source_locator))
        , destination_(std::move(destination)) {}

    [[nodiscard]] auto source_locator() const noexcept -> const std::string& {
        return source_locator_;
    }

    [[nodiscard]] auto destination() const noexcept -> const std::filesystem::path& {
        return destination_;
    }

    [[nodiscard]] auto operator==(const transfer_job& other) const -> bool = default;

private:
    std::string source_locator_;
    std::filesystem::path destination_;
};

/**
 * @brief Leaf object under a directory-like source
 */
struct planned_node {
    std::string relative_path;
    std::string source_locator;

    planned_node() = default;
    planned_node(std::string rel, std::string locator)
        : relative_path(std::move(rel)), source_locator(std::move(locator)) {}

    [[nodiscard]] auto operator==(const planned_node& other) const -> bool = default;
};

/**
 * @brief What to do when a planned destination collides with a local file
 */
enum class overwrite_policy {
    always_skip,      ///< Never replace, record a skip
    force_overwrite,  ///< Delete the blocking file and continue
    interactive,      ///< Ask through the confirm callback (default: no)
};

[[nodiscard]] constexpr auto to_string(overwrite_policy policy) noexcept
    -> std::string_view {
    switch (policy) {
        case overwrite_policy::always_skip:
            return "always_skip";
        case overwrite_policy::force_overwrite:
            return "force_overwrite";
        case overwrite_policy::interactive:
            return "interactive";
        default:
            return "unknown";
    }
}

/**
 * @brief Progress verbosity of a transfer
 */
enum class progress_mode {
    none,   ///< No bars, no console output
    total,  ///< Aggregate bar only
    tasks,  ///< One bar per in-flight file plus the aggregate bar
};

[[nodiscard]] constexpr auto to_string(progress_mode mode) noexcept
    -> std::string_view {
    switch (mode) {
        case progress_mode::none:
            return "none";
        case progress_mode::total:
            return "total";
        case progress_mode::tasks:
            return "tasks";
        default:
            return "unknown";
    }
}

/**
 * @brief Phase of one transfer invocation
 */
enum class transfer_phase {
    planning,
    executing,
    completed,
    failed,
};

[[nodiscard]] constexpr auto to_string(transfer_phase phase) noexcept
    -> std::string_view {
    switch (phase) {
        case transfer_phase::planning:
            return "planning";
        case transfer_phase::executing:
            return "executing";
        case transfer_phase::completed:
            return "completed";
        case transfer_phase::failed:
            return "failed";
        default:
            return "unknown";
    }
}

/**
 * @brief Outcome of a completed transfer invocation
 */
class transfer_summary {
public:
    transfer_summary(std::size_t file_count, uint64_t total_bytes, double elapsed_seconds)
        : file_count_(file_count)
        , total_bytes_(total_bytes)
        , elapsed_seconds_(elapsed_seconds) {}

    [[nodiscard]] auto file_count() const noexcept -> std::size_t { return file_count_; }
    [[nodiscard]] auto total_bytes() const noexcept -> uint64_t { return total_bytes_; }
    [[nodiscard]] auto elapsed_seconds() const noexcept -> double { return elapsed_seconds_; }

    /**
     * @brief Average throughput in bytes per second
     */
    [[nodiscard]] auto average_rate() const noexcept -> double {
        if (elapsed_seconds_ <= 0.0) return 0.0;
        return static_cast<double>(total_bytes_) / elapsed_seconds_;
    }

private:
    std::size_t file_count_;
    uint64_t total_bytes_;
    double elapsed_seconds_;
};

}  // namespace latch::ldata

#endif  // LATCH_LDATA_CORE_TRANSFER_TYPES_H
