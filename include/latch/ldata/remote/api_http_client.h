/**
 * @file api_http_client.h
 * @brief HTTP client adapter for the data API
 *
 * Wraps the network_system HTTP client for the JSON request/response calls
 * made against the API (signed URL issuance). Object bodies are not read
 * through this client; see io/curl_object_stream.h.
 */

#ifndef LATCH_LDATA_REMOTE_API_HTTP_CLIENT_H
#define LATCH_LDATA_REMOTE_API_HTTP_CLIENT_H

#include "latch/ldata/core/types.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace kcenon::network::core {
class http_client;
}

namespace latch::ldata {

/**
 * @brief HTTP response as seen by the remote layer
 */
struct http_response {
    int status_code = 0;
    std::map<std::string, std::string> headers;
    std::string body;

    /**
     * @brief Header value by name (case-insensitive)
     */
    [[nodiscard]] auto get_header(const std::string& key) const
        -> std::optional<std::string> {
        auto lower = [](std::string s) {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c) { return std::tolower(c); });
            return s;
        };
        auto wanted = lower(key);
        for (const auto& [name, value] : headers) {
            if (lower(name) == wanted) {
                return value;
            }
        }
        return std::nullopt;
    }
};

/**
 * @brief Minimal HTTP surface needed by the API callers
 */
class api_http_interface {
public:
    virtual ~api_http_interface() = default;

    /**
     * @brief POST @p body to @p url
     *
     * Transport failures are errors; any HTTP status, including non-2xx,
     * is a successful result for the caller to interpret.
     */
    [[nodiscard]] virtual auto post(
        const std::string& url,
        const std::string& body,
        const std::map<std::string, std::string>& headers)
        -> result<http_response> = 0;
};

/**
 * @brief api_http_interface over network_system's http_client
 *
 * Without network_system every request fails with
 * error_code::not_available.
 *
 * @note This client is thread-safe for concurrent operations.
 */
class api_http_client : public api_http_interface {
public:
    explicit api_http_client(
        std::chrono::milliseconds timeout = std::chrono::milliseconds(30000));

    ~api_http_client() override;

    api_http_client(const api_http_client&) = delete;
    auto operator=(const api_http_client&) -> api_http_client& = delete;
    api_http_client(api_http_client&&) noexcept;
    auto operator=(api_http_client&&) noexcept -> api_http_client&;

    [[nodiscard]] auto post(
        const std::string& url,
        const std::string& body,
        const std::map<std::string, std::string>& headers)
        -> result<http_response> override;

    /**
     * @brief Whether the build carries an HTTP implementation
     */
    [[nodiscard]] auto is_available() const noexcept -> bool;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

[[nodiscard]] auto make_api_http_client(
    std::chrono::milliseconds timeout = std::chrono::milliseconds(30000))
    -> std::shared_ptr<api_http_client>;

}  // namespace latch::ldata

#endif  // LATCH_LDATA_REMOTE_API_HTTP_CLIENT_H
