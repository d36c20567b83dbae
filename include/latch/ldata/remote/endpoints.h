/**
 * @file endpoints.h
 * @brief API routes used by the transfer engine
 */

#ifndef LATCH_LDATA_REMOTE_ENDPOINTS_H
#define LATCH_LDATA_REMOTE_ENDPOINTS_H

#include <string>

namespace latch::ldata {

inline constexpr const char* default_api_base_url = "https://nucleus.latch.bio";

struct api_endpoints {
    std::string base_url = default_api_base_url;

    [[nodiscard]] auto get_signed_url() const -> std::string {
        return base_url + "/ldata/get-signed-url";
    }

    [[nodiscard]] auto get_signed_urls_recursive() const -> std::string {
        return base_url + "/ldata/get-signed-urls-recursive";
    }

    /**
     * @brief Endpoints rooted at LATCH_API_URL when set
     */
    [[nodiscard]] static auto from_environment() -> api_endpoints;
};

}  // namespace latch::ldata

#endif  // LATCH_LDATA_REMOTE_ENDPOINTS_H
