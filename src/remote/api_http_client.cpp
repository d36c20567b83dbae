/**
 * @file api_http_client.cpp
 * @brief HTTP client adapter for the data API
 */

#include "latch/ldata/remote/api_http_client.h"

#include "latch/ldata/config/feature_flags.h"
#include "latch/ldata/core/logging.h"

#if KCENON_WITH_NETWORK_SYSTEM
#include <kcenon/network/core/http_client.h>
#endif

namespace latch::ldata {

struct api_http_client::impl {
#if KCENON_WITH_NETWORK_SYSTEM
    std::shared_ptr<kcenon::network::core::http_client> client;
#endif
    bool available = false;

    explicit impl(std::chrono::milliseconds timeout) {
#if KCENON_WITH_NETWORK_SYSTEM
        client = std::make_shared<kcenon::network::core::http_client>(timeout);
        available = true;
#else
        (void)timeout;
        available = false;
#endif
    }

#if KCENON_WITH_NETWORK_SYSTEM
    static auto convert_response(
        const kcenon::network::internal::http_response& resp) -> http_response {
        http_response result;
        result.status_code = resp.status_code;
        result.headers = resp.headers;
        result.body = std::string(resp.body.begin(), resp.body.end());
        return result;
    }
#endif
};

api_http_client::api_http_client(std::chrono::milliseconds timeout)
    : impl_(std::make_unique<impl>(timeout)) {}

api_http_client::~api_http_client() = default;

api_http_client::api_http_client(api_http_client&&) noexcept = default;
auto api_http_client::operator=(api_http_client&&) noexcept
    -> api_http_client& = default;

auto api_http_client::post(
    const std::string& url,
    const std::string& body,
    const std::map<std::string, std::string>& headers)
    -> result<http_response> {
#if KCENON_WITH_NETWORK_SYSTEM
    if (!impl_->client) {
        return unexpected{error{error_code::not_initialized,
            "HTTP client not initialized"}};
    }

    LDATA_LOG_DEBUG(log_category::remote, "POST " + url);

    auto response = impl_->client->post(url, body, headers);
    if (response.is_err()) {
        LDATA_LOG_ERROR(log_category::remote, "POST " + url + " failed");
        return unexpected{error{error_code::connection_failed,
            "HTTP POST request to " + url + " failed"}};
    }
    return impl_->convert_response(response.value());
#else
    (void)url;
    (void)body;
    (void)headers;
    return unexpected{error{error_code::not_available,
        "HTTP client not available (KCENON_WITH_NETWORK_SYSTEM not defined)"}};
#endif
}

auto api_http_client::is_available() const noexcept -> bool {
    return impl_->available;
}

auto make_api_http_client(std::chrono::milliseconds timeout)
    -> std::shared_ptr<api_http_client> {
    return std::make_shared<api_http_client>(timeout);
}

}  // namespace latch::ldata
