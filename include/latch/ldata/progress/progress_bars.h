/**
 * @file progress_bars.h
 * @brief Multiplexed progress state shared by all transfer workers
 *
 * A fixed pool of per-file slots plus one optional aggregate counter. Slots
 * are handed out by acquire_slot(), which blocks while all of them are taken;
 * the returned slot_guard gives the slot back when it goes out of scope, on
 * every exit path.
 */

#ifndef LATCH_LDATA_PROGRESS_PROGRESS_BARS_H
#define LATCH_LDATA_PROGRESS_PROGRESS_BARS_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "latch/ldata/progress/progress_renderer.h"

namespace latch::ldata {

class progress_bars;

/**
 * @brief Scoped ownership of one progress slot
 *
 * A guard without an index is valid: it is what acquire_slot() returns when
 * the pool has no slots, and all its updates are no-ops.
 */
class slot_guard {
public:
    slot_guard() = default;
    ~slot_guard();

    slot_guard(const slot_guard&) = delete;
    auto operator=(const slot_guard&) -> slot_guard& = delete;
    slot_guard(slot_guard&& other) noexcept;
    auto operator=(slot_guard&& other) noexcept -> slot_guard&;

    [[nodiscard]] auto index() const noexcept -> std::optional<std::size_t> { return index_; }

    /**
     * @brief Reset the slot's label and total, zeroing its counter
     */
    void set(uint64_t total, std::string label);

    /**
     * @brief Add consumed bytes to the slot
     */
    void update(uint64_t delta);

    /**
     * @brief Give the slot back early; the destructor then does nothing
     */
    void release() noexcept;

private:
    friend class progress_bars;
    slot_guard(progress_bars* owner, std::size_t index) : owner_(owner), index_(index) {}

    progress_bars* owner_ = nullptr;
    std::optional<std::size_t> index_;
};

/**
 * @brief State of one slot at a point in time
 */
struct slot_snapshot {
    bool in_use = false;
    std::string label;
    uint64_t total = 0;
    uint64_t consumed = 0;
};

/**
 * @brief Bounded pool of progress slots with an aggregate counter
 *
 * Thread-safe. Rendering is optional: with no output stream the state is
 * still tracked (and observable through snapshots) but nothing is drawn.
 */
class progress_bars {
public:
    struct options {
        std::size_t num_bars = 0;                       ///< Per-file slot count
        bool show_total_progress = false;               ///< Draw the aggregate bar
        bool verbose = false;                           ///< Emit write() messages
        std::chrono::milliseconds refresh{100};         ///< Redraw interval
        std::ostream* output = nullptr;                 ///< nullptr = do not render
    };

    explicit progress_bars(options opts);
    ~progress_bars();

    progress_bars(const progress_bars&) = delete;
    auto operator=(const progress_bars&) -> progress_bars& = delete;

    /**
     * @brief Take a free slot, blocking until one is available
     *
     * Returns an index-less guard immediately when the pool has no slots.
     */
    [[nodiscard]] auto acquire_slot() -> slot_guard;

    void set(std::size_t index, uint64_t total, std::string label);
    void update(std::size_t index, uint64_t delta);

    /**
     * @brief Configure the aggregate counter ("N/total" files)
     */
    void set_total(uint64_t total, std::string label);

    /**
     * @brief Advance the aggregate counter
     */
    void update_total_progress(uint64_t count);

    /**
     * @brief Print a message above the bars when verbose
     */
    void write(std::string_view message);

    /**
     * @brief Stop rendering and release the display; idempotent
     */
    void close();

    [[nodiscard]] auto num_bars() const noexcept -> std::size_t { return num_bars_; }
    [[nodiscard]] auto is_closed() const noexcept -> bool { return closed_.load(); }
    [[nodiscard]] auto acquired_slots() const -> std::size_t;
    [[nodiscard]] auto peak_acquired_slots() const -> std::size_t;
    [[nodiscard]] auto completed_files() const noexcept -> uint64_t;
    [[nodiscard]] auto total_files() const noexcept -> uint64_t;
    [[nodiscard]] auto snapshot(std::size_t index) const -> slot_snapshot;

private:
    friend class slot_guard;

    struct slot {
        std::atomic<uint64_t> total{0};
        std::atomic<uint64_t> consumed{0};
        std::string label;
        bool in_use = false;
    };

    void release_slot(std::size_t index) noexcept;
    void render_loop();
    [[nodiscard]] auto collect_lines() const -> std::vector<bar_line>;

    const std::size_t num_bars_;
    const bool show_total_progress_;
    const bool verbose_;
    const std::chrono::milliseconds refresh_;

    std::unique_ptr<slot[]> slots_;

    mutable std::mutex slot_mutex_;
    std::condition_variable slot_freed_;
    std::size_t acquired_ = 0;
    std::size_t peak_acquired_ = 0;

    std::atomic<uint64_t> completed_files_{0};
    std::atomic<uint64_t> total_files_{0};
    std::string total_label_;

    std::unique_ptr<progress_renderer> renderer_;
    std::mutex render_mutex_;
    std::condition_variable render_wakeup_;
    std::thread render_thread_;
    std::atomic<bool> closed_{false};
};

}  // namespace latch::ldata

#endif  // LATCH_LDATA_PROGRESS_PROGRESS_BARS_H
