/**
 * @file test_progress_bars.cpp
 * @brief Unit tests for progress slots, guards and rendering
 */

#include <gtest/gtest.h>

#include <latch/ldata/progress/progress_bars.h>
#include <latch/ldata/progress/progress_renderer.h>

#include <atomic>
#include <chrono>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <vector>

namespace latch::ldata::test {

namespace {

auto make_options(std::size_t bars) -> progress_bars::options {
    progress_bars::options opts;
    opts.num_bars = bars;
    opts.refresh = std::chrono::milliseconds(5);
    return opts;
}

}  // namespace

// =============================================================================
// Slot acquisition
// =============================================================================

TEST(ProgressBarsTest, AcquiresLowestFreeSlot) {
    progress_bars bars(make_options(3));

    auto a = bars.acquire_slot();
    auto b = bars.acquire_slot();
    ASSERT_TRUE(a.index().has_value());
    ASSERT_TRUE(b.index().has_value());
    EXPECT_EQ(*a.index(), 0u);
    EXPECT_EQ(*b.index(), 1u);

    a.release();
    auto c = bars.acquire_slot();
    EXPECT_EQ(*c.index(), 0u);
    EXPECT_EQ(bars.acquired_slots(), 2u);
}

TEST(ProgressBarsTest, ZeroBarsGivesDetachedGuard) {
    progress_bars bars(make_options(0));

    auto guard = bars.acquire_slot();
    EXPECT_FALSE(guard.index().has_value());

    guard.set(100, "file.txt");
    guard.update(50);
    EXPECT_EQ(bars.acquired_slots(), 0u);
}

TEST(ProgressBarsTest, GuardReleasesOnScopeExit) {
    progress_bars bars(make_options(1));
    {
        auto guard = bars.acquire_slot();
        EXPECT_EQ(bars.acquired_slots(), 1u);
    }
    EXPECT_EQ(bars.acquired_slots(), 0u);
}

TEST(ProgressBarsTest, GuardReleasesWhenExceptionUnwinds) {
    progress_bars bars(make_options(1));

    try {
        auto guard = bars.acquire_slot();
        throw std::runtime_error("write failed");
    } catch (const std::runtime_error&) {
    }

    EXPECT_EQ(bars.acquired_slots(), 0u);
}

TEST(ProgressBarsTest, MovedGuardReleasesOnce) {
    progress_bars bars(make_options(2));

    auto first = bars.acquire_slot();
    slot_guard second = std::move(first);
    EXPECT_FALSE(first.index().has_value());
    EXPECT_EQ(bars.acquired_slots(), 1u);

    second.release();
    second.release();
    EXPECT_EQ(bars.acquired_slots(), 0u);
}

TEST(ProgressBarsTest, SetAndUpdateTrackSlot) {
    progress_bars bars(make_options(1));

    auto guard = bars.acquire_slot();
    guard.set(100, "reads.fastq");
    guard.update(30);
    guard.update(20);

    auto snap = bars.snapshot(0);
    EXPECT_TRUE(snap.in_use);
    EXPECT_EQ(snap.label, "reads.fastq");
    EXPECT_EQ(snap.total, 100u);
    EXPECT_EQ(snap.consumed, 50u);
}

TEST(ProgressBarsTest, AcquireBlocksUntilRelease) {
    progress_bars bars(make_options(1));
    auto held = bars.acquire_slot();

    std::atomic<bool> acquired{false};
    std::thread waiter([&] {
        auto guard = bars.acquire_slot();
        acquired = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(acquired.load());

    held.release();
    waiter.join();
    EXPECT_TRUE(acquired.load());
}

TEST(ProgressBarsTest, SlotCountNeverExceedsBarsUnderContention) {
    constexpr std::size_t num_bars = 3;
    constexpr int num_threads = 12;
    progress_bars bars(make_options(num_bars));

    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&bars] {
            for (int i = 0; i < 20; ++i) {
                auto guard = bars.acquire_slot();
                guard.set(10, "f");
                guard.update(10);
                std::this_thread::sleep_for(std::chrono::microseconds(200));
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_LE(bars.peak_acquired_slots(), num_bars);
    EXPECT_EQ(bars.acquired_slots(), 0u);
}

// =============================================================================
// Aggregate counter and output
// =============================================================================

TEST(ProgressBarsTest, TotalProgressCounts) {
    progress_bars bars(make_options(0));
    bars.set_total(5, "Copying Files");
    bars.update_total_progress(1);
    bars.update_total_progress(2);

    EXPECT_EQ(bars.total_files(), 5u);
    EXPECT_EQ(bars.completed_files(), 3u);
}

TEST(ProgressBarsTest, WriteOnlyWhenVerbose) {
    std::ostringstream quiet_out;
    {
        auto opts = make_options(0);
        opts.output = &quiet_out;
        progress_bars bars(opts);
        bars.write("Downloaded a.txt");
        bars.close();
    }
    EXPECT_EQ(quiet_out.str().find("Downloaded"), std::string::npos);

    std::ostringstream verbose_out;
    {
        auto opts = make_options(0);
        opts.output = &verbose_out;
        opts.verbose = true;
        progress_bars bars(opts);
        bars.write("Downloaded a.txt");
        bars.close();
    }
    EXPECT_NE(verbose_out.str().find("Downloaded a.txt"), std::string::npos);
}

TEST(ProgressBarsTest, CloseIsIdempotentAndDrawsFinalState) {
    std::ostringstream out;
    auto opts = make_options(1);
    opts.show_total_progress = true;
    opts.output = &out;

    progress_bars bars(opts);
    bars.set_total(2, "Copying Files");
    bars.update_total_progress(2);
    bars.close();
    bars.close();

    EXPECT_TRUE(bars.is_closed());
    EXPECT_NE(out.str().find("Copying Files"), std::string::npos);
    EXPECT_NE(out.str().find("2/2"), std::string::npos);
}

// =============================================================================
// Rendering
// =============================================================================

TEST(ProgressRendererTest, FormatsByteBar) {
    bar_line line{"a.txt", 500, 1000, bar_unit::bytes};
    auto text = format_bar_line(line, 10);
    EXPECT_EQ(text, "a.txt:  50%|#####     | 500 B/1.00 KB");
}

TEST(ProgressRendererTest, FormatsCountBar) {
    bar_line line{"Copying Files", 3, 3, bar_unit::count};
    auto text = format_bar_line(line, 4);
    EXPECT_EQ(text, "Copying Files: 100%|####| 3/3");
}

TEST(ProgressRendererTest, ZeroTotalIsEmptyBar) {
    bar_line line{"empty", 0, 0, bar_unit::count};
    auto text = format_bar_line(line, 4);
    EXPECT_EQ(text, "empty:   0%|    | 0/0");
}

}  // namespace latch::ldata::test
