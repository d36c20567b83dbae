/**
 * @file credentials.h
 * @brief Authorization header resolution for API calls
 */

#ifndef LATCH_LDATA_REMOTE_CREDENTIALS_H
#define LATCH_LDATA_REMOTE_CREDENTIALS_H

#include "latch/ldata/core/types.h"

#include <filesystem>
#include <optional>
#include <string>

namespace latch::ldata {

/**
 * @brief Where an authorization header can come from
 *
 * An execution id (set inside workflow executions) takes precedence over
 * the SDK token file.
 */
struct credential_sources {
    std::optional<std::string> execution_id;
    std::filesystem::path token_file;

    /**
     * @brief FLYTE_INTERNAL_EXECUTION_ID and $HOME/.latch/token
     */
    [[nodiscard]] static auto from_environment() -> credential_sources;
};

/**
 * @brief Build the Authorization header value
 *
 * "Latch-Execution-Token <id>" or "Latch-SDK-Token <token>";
 * error_code::authentication_failed when neither source is usable.
 */
[[nodiscard]] auto resolve_auth_header(const credential_sources& sources)
    -> result<std::string>;

}  // namespace latch::ldata

#endif  // LATCH_LDATA_REMOTE_CREDENTIALS_H
