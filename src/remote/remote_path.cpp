/**
 * @file remote_path.cpp
 * @brief Remote path normalization and API routes
 */

#include "latch/ldata/remote/remote_path.h"
#include "latch/ldata/remote/endpoints.h"

#include <cstdlib>

namespace latch::ldata {

auto normalize_remote_path(std::string_view path) -> std::string {
    std::string authority;
    std::string_view rest = path;

    if (rest.substr(0, remote_scheme.size()) == remote_scheme) {
        rest.remove_prefix(remote_scheme.size());
        auto slash = rest.find('/');
        authority = std::string(rest.substr(0, slash));
        rest = slash == std::string_view::npos ? std::string_view{} : rest.substr(slash);
    }

    std::string normalized(remote_scheme);
    normalized += authority;
    normalized += '/';

    for (char c : rest) {
        if (c == '/' && normalized.back() == '/') {
            continue;
        }
        normalized += c;
    }
    return normalized;
}

auto remote_basename(std::string_view path) -> std::string {
    while (!path.empty() && path.back() == '/') {
        path.remove_suffix(1);
    }
    auto slash = path.find_last_of('/');
    if (slash == std::string_view::npos) {
        return std::string(path);
    }
    return std::string(path.substr(slash + 1));
}

auto api_endpoints::from_environment() -> api_endpoints {
    api_endpoints endpoints;
    if (const char* url = std::getenv("LATCH_API_URL"); url && *url) {
        endpoints.base_url = url;
        while (!endpoints.base_url.empty() && endpoints.base_url.back() == '/') {
            endpoints.base_url.pop_back();
        }
    }
    return endpoints;
}

}  // namespace latch::ldata
