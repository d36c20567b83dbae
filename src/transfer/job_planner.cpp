/**
 * @file job_planner.cpp
 * @brief Turns a remote source into an ordered list of download jobs
 */

#include "latch/ldata/transfer/job_planner.h"

#include "latch/ldata/core/logging.h"
#include "latch/ldata/remote/remote_path.h"

#include <optional>
#include <set>
#include <system_error>

namespace latch::ldata {

namespace fs = std::filesystem;

namespace {

auto existing_parent(const fs::path& p) -> fs::path {
    auto parent = p.parent_path();
    return parent.empty() ? fs::path(".") : parent;
}

/**
 * @brief Nearest path at or above @p p that exists but is not a directory
 */
auto find_blocking_file(const fs::path& p) -> std::optional<fs::path> {
    std::error_code ec;
    for (auto current = p; !current.empty(); current = current.parent_path()) {
        auto st = fs::status(current, ec);
        if (!ec && fs::exists(st) && !fs::is_directory(st)) {
            return current;
        }
        if (current == current.parent_path()) {
            break;
        }
    }
    return std::nullopt;
}

auto has_rejected_ancestor(const fs::path& destination, const std::set<fs::path>& rejected)
    -> bool {
    if (rejected.empty()) {
        return false;
    }
    for (auto current = destination.parent_path(); !current.empty();
         current = current.parent_path()) {
        if (rejected.count(current) > 0) {
            return true;
        }
        if (current == current.parent_path()) {
            break;
        }
    }
    return false;
}

}  // namespace

job_planner::job_planner(std::shared_ptr<node_resolver> resolver,
                         std::shared_ptr<signed_url_issuer> issuer)
    : resolver_(std::move(resolver)), issuer_(std::move(issuer)) {}

void job_planner::set_confirm_callback(confirm_callback callback) {
    confirm_ = std::move(callback);
}

auto job_planner::plan(const std::string& source,
                       const fs::path& destination_root,
                       overwrite_policy policy) -> result<transfer_plan> {
    if (!resolver_ || !issuer_) {
        return unexpected{error{error_code::not_initialized,
            "planner requires a node resolver and a signed url issuer"}};
    }

    auto resolved = resolver_->resolve({source});
    if (!resolved) {
        return unexpected{resolved.error()};
    }

    auto it = resolved.value().find(source);
    if (it == resolved.value().end()) {
        return unexpected{error{error_code::node_not_found,
            "no such remote path " + source}};
    }

    transfer_plan plan;
    plan.node = it->second;
    plan.is_container = can_have_children(plan.node.type);

    LDATA_LOG_DEBUG(log_category::planner,
        "Planning " + source + " (" + std::string(to_string(plan.node.type)) + ") into " +
        destination_root.string() + " with policy " + std::string(to_string(policy)));

    if (plan.is_container) {
        return plan_container(source, normalize_remote_path(source), destination_root,
                              policy, std::move(plan));
    }
    return plan_object(source, destination_root, std::move(plan));
}

auto job_planner::plan_container(const std::string& source,
                                 const std::string& normalized,
                                 fs::path destination,
                                 overwrite_policy policy,
                                 transfer_plan plan) -> result<transfer_plan> {
    auto nodes = issuer_->issue_signed_urls_recursive(source);
    if (!nodes) {
        return unexpected{nodes.error()};
    }

    if (auto listing = validate_listing(nodes.value()); !listing) {
        return unexpected{listing.error()};
    }

    std::error_code ec;
    if (fs::exists(destination, ec) && normalized.back() != '/') {
        destination /= plan.node.name;
    }

    if (!fs::exists(existing_parent(destination), ec)) {
        return unexpected{error{error_code::invalid_destination,
            "No such download destination " + destination.string()}};
    }
    if (fs::exists(destination, ec) && !fs::is_directory(destination, ec)) {
        return unexpected{error{error_code::destination_not_directory,
            "Download destination " + destination.string() + " is not a directory"}};
    }

    fs::create_directory(destination, ec);
    if (ec) {
        return unexpected{error{error_code::invalid_destination,
            "No such download destination " + destination.string() + ": " + ec.message()}};
    }

    auto confirmed = resolve_conflicts(build_jobs(destination, nodes.value()), policy,
                                       plan.skipped);
    if (!confirmed) {
        return unexpected{confirmed.error()};
    }

    plan.jobs = std::move(confirmed.value());
    plan.file_count = plan.jobs.size();
    plan.destination = std::move(destination);

    LDATA_LOG_INFO(log_category::planner,
        "Planned " + std::to_string(plan.file_count) + " of " +
        std::to_string(nodes.value().size()) + " object(s), " +
        std::to_string(plan.skipped.size()) + " skipped path(s)");
    return plan;
}

auto job_planner::plan_object(const std::string& source,
                              fs::path destination,
                              transfer_plan plan) -> result<transfer_plan> {
    auto url = issuer_->issue_signed_url(source);
    if (!url) {
        return unexpected{url.error()};
    }

    std::error_code ec;
    if (fs::is_directory(destination, ec)) {
        destination /= plan.node.name;
    }

    plan.jobs.emplace_back(std::move(url.value()), destination);
    plan.file_count = 1;
    plan.destination = std::move(destination);
    return plan;
}

auto job_planner::build_jobs(const fs::path& root, const std::vector<planned_node>& nodes)
    -> std::vector<transfer_job> {
    std::vector<transfer_job> jobs;
    jobs.reserve(nodes.size());
    for (const auto& node : nodes) {
        jobs.emplace_back(node.source_locator, root / node.relative_path);
    }
    return jobs;
}

auto job_planner::validate_listing(const std::vector<planned_node>& nodes) -> result<void> {
    for (const auto& node : nodes) {
        fs::path rel(node.relative_path);
        bool escapes = rel.empty() || rel.has_root_path();
        for (const auto& part : rel) {
            if (part == "..") {
                escapes = true;
                break;
            }
        }
        if (escapes) {
            LDATA_LOG_ERROR(log_category::planner,
                "Listing entry escapes the destination: " + node.relative_path);
            return unexpected{error{error_code::malformed_response,
                "listing entry '" + node.relative_path + "' is not a relative path "
                "under the download destination"}};
        }
    }
    return {};
}

auto job_planner::resolve_conflicts(std::vector<transfer_job> unconfirmed,
                                    overwrite_policy policy,
                                    std::vector<fs::path>& skipped)
    -> result<std::vector<transfer_job>> {
    std::vector<transfer_job> confirmed;
    confirmed.reserve(unconfirmed.size());
    std::set<fs::path> rejected;

    for (auto& job : unconfirmed) {
        if (has_rejected_ancestor(job.destination(), rejected)) {
            continue;
        }

        auto parent = job.destination().parent_path();
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (!ec) {
            confirmed.push_back(std::move(job));
            continue;
        }

        auto blocking = find_blocking_file(parent);
        if (!blocking) {
            return unexpected{error{error_code::invalid_destination,
                "unable to create " + parent.string() + ": " + ec.message()}};
        }

        if (!confirm_overwrite(*blocking, policy)) {
            LDATA_LOG_INFO(log_category::planner,
                "Skipping " + blocking->string() + ", file already exists");
            rejected.insert(*blocking);
            skipped.push_back(*blocking);
            continue;
        }

        fs::remove(*blocking, ec);
        if (ec) {
            return unexpected{error{error_code::file_access_denied,
                "unable to remove " + blocking->string() + ": " + ec.message()}};
        }
        fs::create_directories(parent, ec);
        if (ec) {
            return unexpected{error{error_code::invalid_destination,
                "unable to create " + parent.string() + ": " + ec.message()}};
        }
        LDATA_LOG_DEBUG(log_category::planner, "Replaced " + blocking->string());
        confirmed.push_back(std::move(job));
    }

    return confirmed;
}

auto job_planner::confirm_overwrite(const fs::path& blocking, overwrite_policy policy) -> bool {
    switch (policy) {
        case overwrite_policy::force_overwrite:
            return true;
        case overwrite_policy::interactive:
            return confirm_ ? confirm_(blocking) : false;
        case overwrite_policy::always_skip:
        default:
            return false;
    }
}

}  // namespace latch::ldata
