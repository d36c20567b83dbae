/**
 * @file credentials.cpp
 * @brief Authorization header resolution for API calls
 */

#include "latch/ldata/remote/credentials.h"

#include "latch/ldata/core/logging.h"

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace latch::ldata {

namespace {

auto trim(const std::string& s) -> std::string {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

}  // namespace

auto credential_sources::from_environment() -> credential_sources {
    credential_sources sources;

    if (const char* id = std::getenv("FLYTE_INTERNAL_EXECUTION_ID"); id && *id) {
        sources.execution_id = id;
    }

    const char* home = std::getenv("HOME");
    if (home && *home) {
        sources.token_file = std::filesystem::path(home) / ".latch" / "token";
    }
    return sources;
}

auto resolve_auth_header(const credential_sources& sources) -> result<std::string> {
    if (sources.execution_id && !sources.execution_id->empty()) {
        LDATA_LOG_DEBUG(log_category::remote, "Using execution token for authorization");
        return "Latch-Execution-Token " + *sources.execution_id;
    }

    if (sources.token_file.empty()) {
        return unexpected{error{error_code::authentication_failed,
            "no execution token and no SDK token file location"}};
    }

    std::ifstream in(sources.token_file);
    if (!in) {
        return unexpected{error{error_code::authentication_failed,
            "unable to read SDK token from " + sources.token_file.string()}};
    }

    std::ostringstream contents;
    contents << in.rdbuf();
    auto token = trim(contents.str());
    if (token.empty()) {
        return unexpected{error{error_code::authentication_failed,
            "SDK token file " + sources.token_file.string() + " is empty"}};
    }

    return "Latch-SDK-Token " + token;
}

}  // namespace latch::ldata
