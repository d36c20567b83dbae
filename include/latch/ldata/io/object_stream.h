/**
 * @file object_stream.h
 * @brief Streaming access to remote objects behind a signed locator
 */

#ifndef LATCH_LDATA_IO_OBJECT_STREAM_H
#define LATCH_LDATA_IO_OBJECT_STREAM_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>

#include "latch/ldata/core/types.h"

namespace latch::ldata {

/**
 * @brief Pull-style reader over one remote object
 *
 * Instances are used by a single worker thread.
 */
class object_reader {
public:
    virtual ~object_reader() = default;

    /**
     * @brief Length advertised by the source before the body, if any
     */
    [[nodiscard]] virtual auto content_length() const -> std::optional<uint64_t> = 0;

    /**
     * @brief Read up to buffer.size() bytes
     * @return Number of bytes read; 0 signals end of stream
     */
    [[nodiscard]] virtual auto read(std::span<std::byte> buffer) -> result<std::size_t> = 0;
};

/**
 * @brief Opens readers for source locators
 *
 * Must be safe to call from several workers at once.
 */
class object_opener {
public:
    virtual ~object_opener() = default;

    [[nodiscard]] virtual auto open(const std::string& locator)
        -> result<std::unique_ptr<object_reader>> = 0;
};

}  // namespace latch::ldata

#endif  // LATCH_LDATA_IO_OBJECT_STREAM_H
