/**
 * @file progress_bars.cpp
 * @brief Multiplexed progress state shared by all transfer workers
 */

#include "latch/ldata/progress/progress_bars.h"

#include <latch/ldata/core/logging.h>

#include <algorithm>

namespace latch::ldata {

// slot_guard

slot_guard::~slot_guard() {
    release();
}

slot_guard::slot_guard(slot_guard&& other) noexcept
    : owner_(other.owner_), index_(other.index_) {
    other.owner_ = nullptr;
    other.index_.reset();
}

auto slot_guard::operator=(slot_guard&& other) noexcept -> slot_guard& {
    if (this != &other) {
        release();
        owner_ = other.owner_;
        index_ = other.index_;
        other.owner_ = nullptr;
        other.index_.reset();
    }
    return *this;
}

void slot_guard::set(uint64_t total, std::string label) {
    if (owner_ && index_) {
        owner_->set(*index_, total, std::move(label));
    }
}

void slot_guard::update(uint64_t delta) {
    if (owner_ && index_) {
        owner_->update(*index_, delta);
    }
}

void slot_guard::release() noexcept {
    if (owner_ && index_) {
        owner_->release_slot(*index_);
    }
    owner_ = nullptr;
    index_.reset();
}

// progress_bars

progress_bars::progress_bars(options opts)
    : num_bars_(opts.num_bars)
    , show_total_progress_(opts.show_total_progress)
    , verbose_(opts.verbose)
    , refresh_(opts.refresh.count() > 0 ? opts.refresh : std::chrono::milliseconds{100})
    , slots_(std::make_unique<slot[]>(opts.num_bars)) {
    if (opts.output) {
        renderer_ = std::make_unique<progress_renderer>(*opts.output);
        if (num_bars_ > 0 || show_total_progress_) {
            render_thread_ = std::thread([this] { render_loop(); });
        }
    }

    LDATA_LOG_DEBUG(log_category::progress,
        "Progress initialized with " + std::to_string(num_bars_) + " bar(s)" +
        (show_total_progress_ ? " and a total bar" : ""));
}

progress_bars::~progress_bars() {
    close();
}

auto progress_bars::acquire_slot() -> slot_guard {
    if (num_bars_ == 0) {
        return slot_guard{};
    }

    std::unique_lock<std::mutex> lock(slot_mutex_);
    slot_freed_.wait(lock, [this] { return acquired_ < num_bars_; });

    std::size_t index = 0;
    while (slots_[index].in_use) {
        ++index;
    }

    auto& s = slots_[index];
    s.in_use = true;
    s.label.clear();
    s.total.store(0);
    s.consumed.store(0);

    ++acquired_;
    peak_acquired_ = std::max(peak_acquired_, acquired_);

    return slot_guard{this, index};
}

void progress_bars::release_slot(std::size_t index) noexcept {
    {
        std::lock_guard<std::mutex> lock(slot_mutex_);
        if (index >= num_bars_ || !slots_[index].in_use) {
            return;
        }
        slots_[index].in_use = false;
        --acquired_;
    }
    slot_freed_.notify_one();
}

void progress_bars::set(std::size_t index, uint64_t total, std::string label) {
    if (index >= num_bars_) return;

    std::lock_guard<std::mutex> lock(slot_mutex_);
    auto& s = slots_[index];
    s.label = std::move(label);
    s.total.store(total);
    s.consumed.store(0);
}

void progress_bars::update(std::size_t index, uint64_t delta) {
    if (index >= num_bars_) return;
    slots_[index].consumed.fetch_add(delta);
}

void progress_bars::set_total(uint64_t total, std::string label) {
    std::lock_guard<std::mutex> lock(slot_mutex_);
    total_files_.store(total);
    total_label_ = std::move(label);
}

void progress_bars::update_total_progress(uint64_t count) {
    completed_files_.fetch_add(count);
}

void progress_bars::write(std::string_view message) {
    if (!verbose_ || !renderer_ || closed_.load()) {
        return;
    }

    auto lines = collect_lines();
    std::lock_guard<std::mutex> lock(render_mutex_);
    renderer_->print_above(message, lines);
}

void progress_bars::close() {
    if (closed_.exchange(true)) {
        return;
    }

    render_wakeup_.notify_all();
    if (render_thread_.joinable()) {
        render_thread_.join();
    }

    if (renderer_ && (num_bars_ > 0 || show_total_progress_)) {
        auto lines = collect_lines();
        std::lock_guard<std::mutex> lock(render_mutex_);
        renderer_->draw(lines);
        renderer_->finish();
    }

    LDATA_LOG_DEBUG(log_category::progress,
        "Progress closed: " + std::to_string(completed_files_.load()) + " file(s) completed");
}

auto progress_bars::acquired_slots() const -> std::size_t {
    std::lock_guard<std::mutex> lock(slot_mutex_);
    return acquired_;
}

auto progress_bars::peak_acquired_slots() const -> std::size_t {
    std::lock_guard<std::mutex> lock(slot_mutex_);
    return peak_acquired_;
}

auto progress_bars::completed_files() const noexcept -> uint64_t {
    return completed_files_.load();
}

auto progress_bars::total_files() const noexcept -> uint64_t {
    return total_files_.load();
}

auto progress_bars::snapshot(std::size_t index) const -> slot_snapshot {
    slot_snapshot snap;
    if (index >= num_bars_) return snap;

    std::lock_guard<std::mutex> lock(slot_mutex_);
    const auto& s = slots_[index];
    snap.in_use = s.in_use;
    snap.label = s.label;
    snap.total = s.total.load();
    snap.consumed = s.consumed.load();
    return snap;
}

void progress_bars::render_loop() {
    std::unique_lock<std::mutex> lock(render_mutex_);
    while (!closed_.load()) {
        lock.unlock();
        auto lines = collect_lines();
        lock.lock();
        if (closed_.load()) break;

        renderer_->draw(lines);
        render_wakeup_.wait_for(lock, refresh_, [this] { return closed_.load(); });
    }
}

auto progress_bars::collect_lines() const -> std::vector<bar_line> {
    std::vector<bar_line> lines;
    std::lock_guard<std::mutex> lock(slot_mutex_);

    if (show_total_progress_) {
        lines.push_back(bar_line{total_label_, completed_files_.load(),
                                 total_files_.load(), bar_unit::count});
    }

    for (std::size_t i = 0; i < num_bars_; ++i) {
        const auto& s = slots_[i];
        if (!s.in_use) {
            lines.push_back(bar_line{});
            continue;
        }
        lines.push_back(bar_line{s.label, s.consumed.load(), s.total.load(), bar_unit::bytes});
    }

    return lines;
}

}  // namespace latch::ldata
