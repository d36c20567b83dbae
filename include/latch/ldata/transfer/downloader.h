/**
 * @file downloader.h
 * @brief Top-level download operation
 *
 * @code
 * auto dl = downloader::builder()
 *     .with_node_resolver(resolver)
 *     .with_signed_url_issuer(issuer)
 *     .with_object_opener(std::make_shared<curl_object_opener>())
 *     .with_config(transfer_config::from_environment())
 *     .build();
 * if (!dl) return;
 *
 * download_options opts;
 * opts.progress = progress_mode::tasks;
 * auto report = dl.value().download("latch:///reads/", "/data", opts);
 * @endcode
 */

#ifndef LATCH_LDATA_TRANSFER_DOWNLOADER_H
#define LATCH_LDATA_TRANSFER_DOWNLOADER_H

#include "latch/ldata/config/transfer_config.h"
#include "latch/ldata/core/transfer_types.h"
#include "latch/ldata/core/types.h"
#include "latch/ldata/io/object_stream.h"
#include "latch/ldata/remote/remote_interfaces.h"
#include "latch/ldata/transfer/job_planner.h"

#include <filesystem>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace latch::ldata {

/**
 * @brief Per-call options of download()
 */
struct download_options {
    overwrite_policy policy = overwrite_policy::interactive;
    progress_mode progress = progress_mode::tasks;
    bool verbose = false;
};

/**
 * @brief Result of a successful download()
 */
struct download_report {
    transfer_summary summary;
    std::vector<std::filesystem::path> skipped;
};

/**
 * @brief Downloads remote objects and directory trees to local disk
 *
 * Only one download may run at a time per process; a concurrent call fails
 * with error_code::already_initialized.
 */
class downloader {
public:
    class builder {
    public:
        builder();

        auto with_node_resolver(std::shared_ptr<node_resolver> resolver) -> builder&;
        auto with_signed_url_issuer(std::shared_ptr<signed_url_issuer> issuer) -> builder&;
        auto with_object_opener(std::shared_ptr<object_opener> opener) -> builder&;
        auto with_config(const transfer_config& config) -> builder&;

        /**
         * @brief Prompt for overwrite_policy::interactive (default: decline)
         */
        auto with_confirm_callback(confirm_callback callback) -> builder&;

        /**
         * @brief Console for messages and progress bars (default: std::cout)
         */
        auto with_output(std::ostream& out) -> builder&;

        /**
         * @brief Validate and build
         * @return downloader, or error if a collaborator is missing or the
         *         configuration is invalid
         */
        [[nodiscard]] auto build() -> result<downloader>;

    private:
        std::shared_ptr<node_resolver> resolver_;
        std::shared_ptr<signed_url_issuer> issuer_;
        std::shared_ptr<object_opener> opener_;
        transfer_config config_;
        confirm_callback confirm_;
        std::ostream* output_;
    };

    ~downloader();

    downloader(const downloader&) = delete;
    auto operator=(const downloader&) -> downloader& = delete;
    downloader(downloader&&) noexcept;
    auto operator=(downloader&&) noexcept -> downloader&;

    /**
     * @brief Download @p source to @p destination
     *
     * Fails when the destination's parent does not exist, on planning
     * errors, and on the first transfer fault. Collisions settled by the
     * overwrite policy are reported in download_report::skipped.
     */
    [[nodiscard]] auto download(const std::string& source,
                                const std::filesystem::path& destination,
                                const download_options& options = {}) -> result<download_report>;

    [[nodiscard]] auto config() const -> const transfer_config&;

private:
    struct impl;
    explicit downloader(std::unique_ptr<impl> impl);
    std::unique_ptr<impl> impl_;
};

}  // namespace latch::ldata

#endif  // LATCH_LDATA_TRANSFER_DOWNLOADER_H
