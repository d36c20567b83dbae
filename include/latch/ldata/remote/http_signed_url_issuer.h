/**
 * @file http_signed_url_issuer.h
 * @brief signed_url_issuer backed by the data API
 */

#ifndef LATCH_LDATA_REMOTE_HTTP_SIGNED_URL_ISSUER_H
#define LATCH_LDATA_REMOTE_HTTP_SIGNED_URL_ISSUER_H

#include "latch/ldata/remote/api_http_client.h"
#include "latch/ldata/remote/endpoints.h"
#include "latch/ldata/remote/remote_interfaces.h"

#include <memory>
#include <string>
#include <vector>

namespace latch::ldata {

/**
 * @brief Issues signed URLs through POST {"path": ...} requests
 *
 * A non-200 reply becomes error_code::remote_api_error carrying the
 * backend's "error" message verbatim.
 */
class http_signed_url_issuer : public signed_url_issuer {
public:
    http_signed_url_issuer(std::shared_ptr<api_http_interface> http,
                           api_endpoints endpoints,
                           std::string auth_header);

    [[nodiscard]] auto issue_signed_url(const std::string& path)
        -> result<std::string> override;

    [[nodiscard]] auto issue_signed_urls_recursive(const std::string& path)
        -> result<std::vector<planned_node>> override;

private:
    [[nodiscard]] auto request(const std::string& endpoint, const std::string& path)
        -> result<std::string>;

    std::shared_ptr<api_http_interface> http_;
    api_endpoints endpoints_;
    std::string auth_header_;
};

}  // namespace latch::ldata

#endif  // LATCH_LDATA_REMOTE_HTTP_SIGNED_URL_ISSUER_H
