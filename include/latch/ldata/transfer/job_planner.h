/**
 * @file job_planner.h
 * @brief Turns a remote source into an ordered list of download jobs
 *
 * Planning resolves the source node, obtains signed URLs, decides the local
 * destination of every object and settles collisions with existing local
 * files before a single byte is transferred.
 */

#ifndef LATCH_LDATA_TRANSFER_JOB_PLANNER_H
#define LATCH_LDATA_TRANSFER_JOB_PLANNER_H

#include "latch/ldata/core/transfer_types.h"
#include "latch/ldata/core/types.h"
#include "latch/ldata/remote/remote_interfaces.h"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace latch::ldata {

/**
 * @brief Asked whether a blocking file may be replaced by a directory
 * @return true to delete the file and continue
 */
using confirm_callback = std::function<bool(const std::filesystem::path& blocking_path)>;

/**
 * @brief Output of planning
 */
struct transfer_plan {
    std::vector<transfer_job> jobs;                  ///< Confirmed jobs, in listing order
    std::size_t file_count = 0;                      ///< Always jobs.size()
    std::vector<std::filesystem::path> skipped;      ///< Blocking paths left in place
    std::filesystem::path destination;               ///< Resolved local root or file
    node_data node;                                  ///< Source node
    bool is_container = false;                       ///< Source was dir/mount/account root
};

/**
 * @brief Plans downloads
 *
 * @code
 * job_planner planner(resolver, issuer);
 * planner.set_confirm_callback([](const auto& p) { return ask_user(p); });
 * auto plan = planner.plan("latch:///reads/", "/data", overwrite_policy::interactive);
 * @endcode
 *
 * Planning is single-threaded; a planner may be reused for several plans but
 * not concurrently.
 */
class job_planner {
public:
    job_planner(std::shared_ptr<node_resolver> resolver,
                std::shared_ptr<signed_url_issuer> issuer);

    /**
     * @brief Prompt used by overwrite_policy::interactive
     *
     * Without a callback every interactive prompt is declined.
     */
    void set_confirm_callback(confirm_callback callback);

    /**
     * @brief Plan the download of @p source into @p destination_root
     */
    [[nodiscard]] auto plan(const std::string& source,
                            const std::filesystem::path& destination_root,
                            overwrite_policy policy) -> result<transfer_plan>;

    /**
     * @brief One unconfirmed job per node, destination root / relative path
     */
    [[nodiscard]] static auto build_jobs(const std::filesystem::path& root,
                                         const std::vector<planned_node>& nodes)
        -> std::vector<transfer_job>;

    /**
     * @brief Check that every relative path stays under the destination root
     *
     * Empty paths, absolute paths and paths with ".." components are
     * rejected with error_code::malformed_response.
     */
    [[nodiscard]] static auto validate_listing(const std::vector<planned_node>& nodes)
        -> result<void>;

    /**
     * @brief Create every job's parent tree, applying @p policy to collisions
     *
     * Runs in job order. Jobs under a rejected path are dropped without
     * asking again; each rejected path is appended to @p skipped once.
     */
    [[nodiscard]] auto resolve_conflicts(std::vector<transfer_job> unconfirmed,
                                         overwrite_policy policy,
                                         std::vector<std::filesystem::path>& skipped)
        -> result<std::vector<transfer_job>>;

private:
    [[nodiscard]] auto plan_container(const std::string& source,
                                      const std::string& normalized,
                                      std::filesystem::path destination,
                                      overwrite_policy policy,
                                      transfer_plan plan) -> result<transfer_plan>;

    [[nodiscard]] auto plan_object(const std::string& source,
                                   std::filesystem::path destination,
                                   transfer_plan plan) -> result<transfer_plan>;

    [[nodiscard]] auto confirm_overwrite(const std::filesystem::path& blocking,
                                         overwrite_policy policy) -> bool;

    std::shared_ptr<node_resolver> resolver_;
    std::shared_ptr<signed_url_issuer> issuer_;
    confirm_callback confirm_;
};

}  // namespace latch::ldata

#endif  // LATCH_LDATA_TRANSFER_JOB_PLANNER_H
