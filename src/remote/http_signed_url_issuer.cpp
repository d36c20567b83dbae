/**
 * @file http_signed_url_issuer.cpp
 * @brief signed_url_issuer backed by the data API
 */

#include "latch/ldata/remote/http_signed_url_issuer.h"

#include "latch/ldata/core/logging.h"
#include "latch/ldata/remote/json_utils.h"
#include "latch/ldata/remote/remote_path.h"

namespace latch::ldata {

http_signed_url_issuer::http_signed_url_issuer(std::shared_ptr<api_http_interface> http,
                                               api_endpoints endpoints,
                                               std::string auth_header)
    : http_(std::move(http))
    , endpoints_(std::move(endpoints))
    , auth_header_(std::move(auth_header)) {}

auto http_signed_url_issuer::request(const std::string& endpoint, const std::string& path)
    -> result<std::string> {
    if (!http_) {
        return unexpected{error{error_code::not_initialized, "HTTP client not set"}};
    }

    auto normalized = normalize_remote_path(path);
    std::map<std::string, std::string> headers{
        {"Authorization", auth_header_},
        {"Content-Type", "application/json"},
    };
    std::string body = "{\"path\": " + json_utils::quote(normalized) + "}";

    auto response = http_->post(endpoint, body, headers);
    if (!response) {
        return unexpected{response.error()};
    }

    const auto& resp = response.value();
    if (resp.status_code != 200) {
        auto backend_error = json_utils::extract_json_value(resp.body, "error");
        std::string message = "failed to fetch presigned url(s) for path " + path +
                              " with code " + std::to_string(resp.status_code) + ": " +
                              backend_error.value_or(resp.body);
        LDATA_LOG_ERROR(log_category::remote, message);
        return unexpected{error{error_code::remote_api_error, std::move(message)}};
    }

    auto data = json_utils::extract_json_object(resp.body, "data");
    if (!data) {
        return unexpected{error{error_code::malformed_response,
            "response for path " + path + " has no data object"}};
    }
    return std::move(*data);
}

auto http_signed_url_issuer::issue_signed_url(const std::string& path)
    -> result<std::string> {
    auto data = request(endpoints_.get_signed_url(), path);
    if (!data) {
        return unexpected{data.error()};
    }

    auto url = json_utils::extract_json_value(data.value(), "url");
    if (!url || url->empty()) {
        return unexpected{error{error_code::malformed_response,
            "response for path " + path + " has no url"}};
    }

    LDATA_LOG_DEBUG(log_category::remote, "Issued signed url for " + path + ": " + *url);
    return std::move(*url);
}

auto http_signed_url_issuer::issue_signed_urls_recursive(const std::string& path)
    -> result<std::vector<planned_node>> {
    auto data = request(endpoints_.get_signed_urls_recursive(), path);
    if (!data) {
        return unexpected{data.error()};
    }

    auto urls_object = json_utils::extract_json_object(data.value(), "urls");
    if (!urls_object) {
        return unexpected{error{error_code::malformed_response,
            "response for path " + path + " has no urls object"}};
    }

    auto members = json_utils::parse_string_map(*urls_object);
    if (!members) {
        return unexpected{error{error_code::malformed_response,
            "response for path " + path + " has a malformed urls object"}};
    }

    std::vector<planned_node> nodes;
    nodes.reserve(members->size());
    for (auto& [rel, url] : *members) {
        nodes.emplace_back(std::move(rel), std::move(url));
    }

    LDATA_LOG_DEBUG(log_category::remote,
        "Issued " + std::to_string(nodes.size()) + " signed url(s) under " + path);
    return nodes;
}

}  // namespace latch::ldata
