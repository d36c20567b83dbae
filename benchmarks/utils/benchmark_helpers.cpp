/**
 * @file benchmark_helpers.cpp
 * @brief Implementation of benchmark helper utilities
 */

#include "utils/benchmark_helpers.h"

#include <algorithm>
#include <cstring>
#include <random>
#include <string_view>

namespace latch::ldata::benchmark {

namespace {

class generated_reader : public object_reader {
public:
    explicit generated_reader(uint64_t size) : size_(size) {}

    auto content_length() const -> std::optional<uint64_t> override { return size_; }

    auto read(std::span<std::byte> buffer) -> result<std::size_t> override {
        auto n = static_cast<std::size_t>(
            std::min<uint64_t>(buffer.size(), size_ - offset_));
        std::memset(buffer.data(), static_cast<int>(offset_ & 0xFF), n);
        offset_ += n;
        return n;
    }

private:
    uint64_t size_;
    uint64_t offset_ = 0;
};

}  // namespace

// temp_directory implementation

temp_directory::temp_directory(const std::string& prefix) {
    path_ = std::filesystem::temp_directory_path() /
            (prefix + "_" + std::to_string(std::random_device{}()));
    std::error_code ec;
    std::filesystem::create_directories(path_, ec);
}

temp_directory::~temp_directory() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
}

void temp_directory::clear() {
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(path_, ec)) {
        std::filesystem::remove_all(entry.path(), ec);
    }
}

// Listing generation

auto make_listing(std::size_t count, std::size_t fanout, std::size_t depth,
                  std::size_t object_size) -> std::vector<planned_node> {
    std::vector<planned_node> nodes;
    nodes.reserve(count);
    fanout = std::max<std::size_t>(fanout, 1);

    for (std::size_t i = 0; i < count; ++i) {
        std::string rel;
        auto bucket = i % fanout;
        for (std::size_t level = 0; level < depth; ++level) {
            rel += "d" + std::to_string(level) + "_" + std::to_string(bucket) + "/";
        }
        rel += "object_" + std::to_string(i) + ".bin";
        nodes.emplace_back(std::move(rel),
                           "mem://" + std::to_string(object_size) + "/" + std::to_string(i));
    }
    return nodes;
}

// generated_object_opener implementation

auto generated_object_opener::open(const std::string& locator)
    -> result<std::unique_ptr<object_reader>> {
    constexpr std::string_view scheme = "mem://";
    if (locator.compare(0, scheme.size(), scheme) != 0) {
        return unexpected{error{error_code::connection_failed, "unknown locator " + locator}};
    }

    auto end = locator.find('/', scheme.size());
    uint64_t size = 0;
    try {
        size = std::stoull(locator.substr(scheme.size(), end - scheme.size()));
    } catch (const std::exception&) {
        return unexpected{error{error_code::connection_failed, "bad locator " + locator}};
    }

    return std::unique_ptr<object_reader>(std::make_unique<generated_reader>(size));
}

}  // namespace latch::ldata::benchmark
