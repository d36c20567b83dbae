/**
 * @file curl_object_stream.h
 * @brief Streaming object reads over HTTP(S) with libcurl
 */

#ifndef LATCH_LDATA_IO_CURL_OBJECT_STREAM_H
#define LATCH_LDATA_IO_CURL_OBJECT_STREAM_H

#include "latch/ldata/io/object_stream.h"

#include <chrono>
#include <memory>
#include <string>

namespace latch::ldata {

/**
 * @brief Opens signed URLs as pull-style readers
 *
 * open() returns once the final response headers have arrived, so
 * content_length() is known before the first read(). Each read() drives the
 * transfer only until some body bytes are buffered, keeping memory bounded
 * by the caller's pace.
 *
 * Without libcurl (LDATA_HAS_CURL == 0) open() fails with
 * error_code::not_available.
 */
class curl_object_opener : public object_opener {
public:
    explicit curl_object_opener(
        std::chrono::milliseconds connect_timeout = std::chrono::milliseconds(30000));
    ~curl_object_opener() override;

    [[nodiscard]] auto open(const std::string& locator)
        -> result<std::unique_ptr<object_reader>> override;

    [[nodiscard]] static auto is_available() noexcept -> bool;

private:
    std::chrono::milliseconds connect_timeout_;
};

}  // namespace latch::ldata

#endif  // LATCH_LDATA_IO_CURL_OBJECT_STREAM_H
