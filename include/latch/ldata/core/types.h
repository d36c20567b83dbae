/**
 * @file types.h
 * @brief Core type definitions for ldata_transfer
 */

#ifndef LATCH_LDATA_CORE_TYPES_H
#define LATCH_LDATA_CORE_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace latch::ldata {

/**
 * @brief Error codes for transfer operations
 */
enum class error_code {
    success = 0,

    // Local destination errors (-100 to -119)
    invalid_destination = -100,
    destination_not_directory = -101,
    file_access_denied = -102,
    file_read_error = -105,
    file_write_error = -106,

    // Stream errors (-120 to -139)
    missing_content_length = -120,
    content_length_mismatch = -121,
    transfer_cancelled = -122,

    // Configuration errors (-140 to -159)
    invalid_chunk_size = -140,
    invalid_configuration = -141,

    // Network errors (-160 to -179)
    connection_failed = -160,
    connection_timeout = -161,
    connection_lost = -163,

    // Remote API errors (-180 to -199)
    remote_api_error = -180,
    node_not_found = -181,
    authentication_failed = -182,
    malformed_response = -183,

    // Internal errors (-200 to -219)
    internal_error = -200,
    not_initialized = -201,
    already_initialized = -202,
    not_available = -203,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::invalid_destination:
            return "invalid destination";
        case error_code::destination_not_directory:
            return "destination is not a directory";
        case error_code::file_access_denied:
            return "file access denied";
        case error_code::file_read_error:
            return "file read error";
        case error_code::file_write_error:
            return "file write error";
        case error_code::missing_content_length:
            return "missing content length";
        case error_code::content_length_mismatch:
            return "content length mismatch";
        case error_code::transfer_cancelled:
            return "transfer cancelled";
        case error_code::invalid_chunk_size:
            return "invalid chunk size";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::connection_failed:
            return "connection failed";
        case error_code::connection_timeout:
            return "connection timeout";
        case error_code::connection_lost:
            return "connection lost";
        case error_code::remote_api_error:
            return "remote api error";
        case error_code::node_not_found:
            return "node not found";
        case error_code::authentication_failed:
            return "authentication failed";
        case error_code::malformed_response:
            return "malformed response";
        case error_code::internal_error:
            return "internal error";
        case error_code::not_initialized:
            return "not initialized";
        case error_code::already_initialized:
            return "already initialized";
        case error_code::not_available:
            return "not available";
        default:
            return "unknown error";
    }
}

/**
 * @brief Error type with code and optional message
 */
struct error {
    error_code code;
    std::string message;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * A simple Result type similar to std::expected (C++23).
 * Contains either a value of type T or an error.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

}  // namespace latch::ldata

#endif  // LATCH_LDATA_CORE_TYPES_H
