/**
 * @file ldata.h
 * @brief Main header for the ldata_transfer library
 * @version 0.1.0
 *
 * @code
 * #include <latch/ldata/ldata.h>
 *
 * using namespace latch::ldata;
 *
 * auto auth = resolve_auth_header(credential_sources::from_environment());
 * auto issuer = std::make_shared<http_signed_url_issuer>(
 *     make_api_http_client(), api_endpoints::from_environment(), auth.value());
 *
 * auto dl = downloader::builder()
 *     .with_node_resolver(resolver)
 *     .with_signed_url_issuer(issuer)
 *     .with_object_opener(std::make_shared<curl_object_opener>())
 *     .build();
 * @endcode
 */

#ifndef LATCH_LDATA_LDATA_H
#define LATCH_LDATA_LDATA_H

#include <cstdint>
#include <string>

// Core types
#include "latch/ldata/core/types.h"
#include "latch/ldata/core/transfer_types.h"
#include "latch/ldata/core/format_utils.h"
#include "latch/ldata/config/transfer_config.h"

// Remote collaborators
#include "latch/ldata/remote/remote_interfaces.h"
#include "latch/ldata/remote/credentials.h"
#include "latch/ldata/remote/endpoints.h"
#include "latch/ldata/remote/remote_path.h"
#include "latch/ldata/remote/http_signed_url_issuer.h"

// Object streams
#include "latch/ldata/io/object_stream.h"
#include "latch/ldata/io/curl_object_stream.h"

// Transfer engine
#include "latch/ldata/progress/progress_bars.h"
#include "latch/ldata/progress/transfer_state_manager.h"
#include "latch/ldata/transfer/job_planner.h"
#include "latch/ldata/transfer/transfer_coordinator.h"
#include "latch/ldata/transfer/downloader.h"

namespace latch::ldata {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace latch::ldata

#endif  // LATCH_LDATA_LDATA_H
