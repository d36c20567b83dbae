/**
 * @file remote_interfaces.h
 * @brief Collaborator interfaces for remote metadata and signed URLs
 *
 * The transfer engine never talks to the platform directly. Metadata lookups
 * and signed URL issuance go through these interfaces so that callers can
 * plug in the HTTP implementations, a cache, or test doubles.
 */

#ifndef LATCH_LDATA_REMOTE_REMOTE_INTERFACES_H
#define LATCH_LDATA_REMOTE_REMOTE_INTERFACES_H

#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "latch/ldata/core/transfer_types.h"
#include "latch/ldata/core/types.h"

namespace latch::ldata {

/**
 * @brief Kind of remote node
 */
enum class node_type {
    obj,
    dir,
    mount,
    account_root,
    link,
};

[[nodiscard]] constexpr auto to_string(node_type type) noexcept -> std::string_view {
    switch (type) {
        case node_type::obj:
            return "obj";
        case node_type::dir:
            return "dir";
        case node_type::mount:
            return "mount";
        case node_type::account_root:
            return "account_root";
        case node_type::link:
            return "link";
        default:
            return "unknown";
    }
}

/**
 * @brief Whether a node of this type is a container of other nodes
 */
[[nodiscard]] constexpr auto can_have_children(node_type type) noexcept -> bool {
    return type == node_type::dir ||
           type == node_type::mount ||
           type == node_type::account_root;
}

/**
 * @brief Metadata of one remote node
 */
struct node_data {
    std::string id;
    std::string name;
    node_type type = node_type::obj;
    bool is_parent = false;  ///< Path names a parent of the node rather than the node
};

/**
 * @brief Resolves remote paths to node metadata
 */
class node_resolver {
public:
    virtual ~node_resolver() = default;

    /**
     * @brief Resolve several paths in a single round trip
     * @param paths Remote paths as given by the caller
     * @return Map keyed by the input path, or an error
     */
    [[nodiscard]] virtual auto resolve(const std::vector<std::string>& paths)
        -> result<std::map<std::string, node_data>> = 0;
};

/**
 * @brief Issues time-limited signed URLs for remote objects
 */
class signed_url_issuer {
public:
    virtual ~signed_url_issuer() = default;

    /**
     * @brief Signed URL for a single object
     */
    [[nodiscard]] virtual auto issue_signed_url(const std::string& path)
        -> result<std::string> = 0;

    /**
     * @brief Signed URLs for every leaf under a container, in one call
     * @return Relative path / URL pairs in the order the backend listed them
     */
    [[nodiscard]] virtual auto issue_signed_urls_recursive(const std::string& path)
        -> result<std::vector<planned_node>> = 0;
};

}  // namespace latch::ldata

#endif  // LATCH_LDATA_REMOTE_REMOTE_INTERFACES_H
