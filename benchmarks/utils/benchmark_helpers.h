/**
 * @file benchmark_helpers.h
 * @brief Helper utilities for benchmarks
 */

#ifndef LATCH_LDATA_BENCHMARKS_BENCHMARK_HELPERS_H
#define LATCH_LDATA_BENCHMARKS_BENCHMARK_HELPERS_H

#include <latch/ldata/core/transfer_types.h>
#include <latch/ldata/io/object_stream.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace latch::ldata::benchmark {

/**
 * @brief Scratch directory removed on destruction
 */
class temp_directory {
public:
    explicit temp_directory(const std::string& prefix = "ldata_benchmarks");
    ~temp_directory();

    temp_directory(const temp_directory&) = delete;
    auto operator=(const temp_directory&) -> temp_directory& = delete;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

    /**
     * @brief Empty the directory, keeping it in place
     */
    void clear();

private:
    std::filesystem::path path_;
};

/**
 * @brief Synthetic listing of @p count leaves spread over @p fanout directories
 *
 * Relative paths nest @p depth levels deep; locators encode the object size
 * as "mem://<size>/<index>".
 */
auto make_listing(std::size_t count, std::size_t fanout, std::size_t depth,
                  std::size_t object_size) -> std::vector<planned_node>;

/**
 * @brief object_opener serving generated bytes for "mem://<size>/..." locators
 */
class generated_object_opener : public object_opener {
public:
    auto open(const std::string& locator)
        -> result<std::unique_ptr<object_reader>> override;
};

/**
 * @brief Size constants for benchmarks
 */
namespace sizes {
constexpr std::size_t KB = 1024;
constexpr std::size_t MB = 1024 * KB;

constexpr std::size_t small_file = 64 * KB;
constexpr std::size_t medium_file = 4 * MB;

constexpr std::size_t min_chunk = 64 * KB;
constexpr std::size_t default_chunk = 5 * MB;
}  // namespace sizes

}  // namespace latch::ldata::benchmark

#endif  // LATCH_LDATA_BENCHMARKS_BENCHMARK_HELPERS_H
