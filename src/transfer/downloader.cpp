/**
 * @file downloader.cpp
 * @brief Top-level download operation
 */

#include "latch/ldata/transfer/downloader.h"

#include "latch/ldata/core/format_utils.h"
#include "latch/ldata/core/logging.h"
#include "latch/ldata/progress/transfer_state_manager.h"
#include "latch/ldata/transfer/transfer_coordinator.h"

#include <algorithm>
#include <iostream>

namespace latch::ldata {

namespace fs = std::filesystem;

struct downloader::impl {
    transfer_config config;
    job_planner planner;
    transfer_coordinator coordinator;
    std::ostream* output;

    impl(std::shared_ptr<node_resolver> resolver,
         std::shared_ptr<signed_url_issuer> issuer,
         std::shared_ptr<object_opener> opener,
         const transfer_config& cfg,
         std::ostream* out)
        : config(cfg)
        , planner(std::move(resolver), std::move(issuer))
        , coordinator(std::move(opener), cfg)
        , output(out) {}

    auto progress_options(const transfer_plan& plan, const download_options& options) const
        -> progress_bars::options {
        progress_bars::options opts;
        opts.verbose = options.verbose;
        opts.refresh = config.progress_refresh;

        if (options.progress == progress_mode::none) {
            return opts;
        }
        opts.output = output;

        if (!plan.is_container) {
            opts.num_bars = 1;
            return opts;
        }

        opts.show_total_progress = true;
        if (options.progress == progress_mode::tasks) {
            opts.num_bars = std::min(config.effective_max_workers(), plan.file_count);
        }
        return opts;
    }
};

// ============================================================================
// builder
// ============================================================================

downloader::builder::builder() : output_(&std::cout) {}

auto downloader::builder::with_node_resolver(std::shared_ptr<node_resolver> resolver)
    -> builder& {
    resolver_ = std::move(resolver);
    return *this;
}

auto downloader::builder::with_signed_url_issuer(std::shared_ptr<signed_url_issuer> issuer)
    -> builder& {
    issuer_ = std::move(issuer);
    return *this;
}

auto downloader::builder::with_object_opener(std::shared_ptr<object_opener> opener)
    -> builder& {
    opener_ = std::move(opener);
    return *this;
}

auto downloader::builder::with_config(const transfer_config& config) -> builder& {
    config_ = config;
    return *this;
}

auto downloader::builder::with_confirm_callback(confirm_callback callback) -> builder& {
    confirm_ = std::move(callback);
    return *this;
}

auto downloader::builder::with_output(std::ostream& out) -> builder& {
    output_ = &out;
    return *this;
}

auto downloader::builder::build() -> result<downloader> {
    if (!resolver_ || !issuer_ || !opener_) {
        return unexpected{error{error_code::invalid_configuration,
            "node resolver, signed url issuer and object opener are required"}};
    }
    if (auto valid = config_.validate(); !valid) {
        return unexpected{valid.error()};
    }

    auto state = std::make_unique<impl>(resolver_, issuer_, opener_, config_, output_);
    state->planner.set_confirm_callback(confirm_);
    return downloader(std::move(state));
}

// ============================================================================
// downloader
// ============================================================================

downloader::downloader(std::unique_ptr<impl> impl) : impl_(std::move(impl)) {}

downloader::~downloader() = default;

downloader::downloader(downloader&&) noexcept = default;
auto downloader::operator=(downloader&&) noexcept -> downloader& = default;

auto downloader::config() const -> const transfer_config& {
    return impl_->config;
}

auto downloader::download(const std::string& source,
                          const fs::path& destination,
                          const download_options& options) -> result<download_report> {
    auto parent = destination.parent_path();
    std::error_code ec;
    if (!fs::exists(parent.empty() ? fs::path(".") : parent, ec)) {
        return unexpected{error{error_code::invalid_destination,
            "Invalid copy destination " + destination.string() + ". Parent directory " +
            parent.string() + " does not exist."}};
    }

    auto plan = impl_->planner.plan(source, destination, options.policy);
    if (!plan) {
        return unexpected{plan.error()};
    }

    const bool show_output = options.progress != progress_mode::none && impl_->output;
    auto& out = *impl_->output;

    if (show_output) {
        out << "Downloading " << plan.value().node.name << "\n";
        for (const auto& skipped : plan.value().skipped) {
            out << "Skipping " << skipped.string() << ", file already exists\n";
        }
        out.flush();
    }

    auto state = transfer_state_manager::create(
        impl_->progress_options(plan.value(), options));
    if (!state) {
        return unexpected{state.error()};
    }

    auto& manager = *state.value();
    manager.set_phase(transfer_phase::executing);

    auto summary = plan.value().is_container
        ? impl_->coordinator.run(plan.value().jobs, plan.value().file_count, manager.progress())
        : impl_->coordinator.run_single(plan.value().jobs.front(), manager.progress());

    manager.set_phase(summary ? transfer_phase::completed : transfer_phase::failed);
    state.value().reset();

    if (!summary) {
        return unexpected{summary.error()};
    }

    if (show_output) {
        out << "Download Complete\n"
            << "Time Elapsed: " << human_readable_time(summary.value().elapsed_seconds()) << "\n"
            << "Files Downloaded: " << summary.value().file_count() << " ("
            << with_si_suffix(summary.value().total_bytes()) << ")\n";
        out.flush();
    }

    return download_report{summary.value(), std::move(plan.value().skipped)};
}

}  // namespace latch::ldata
