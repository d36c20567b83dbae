/**
 * @file test_concurrency.cpp
 * @brief Concurrency tests for parallel downloads
 *
 * This file contains tests for:
 * - Byte totals independent of worker count and listing order
 * - Progress slot bound under contention
 * - Refusal of a second download while one is running
 */

#include "test_fixtures.h"

#include <algorithm>
#include <future>
#include <random>

namespace latch::ldata::test {

namespace fs = std::filesystem;

// =============================================================================
// Fixtures
// =============================================================================

class ParallelDownloadTest : public DownloadFixture {
protected:
    auto make_tree(std::size_t count) -> std::vector<std::pair<std::string, std::string>> {
        std::vector<std::pair<std::string, std::string>> files;
        for (std::size_t i = 0; i < count; ++i) {
            auto rel = "dir" + std::to_string(i % 5) + "/file" + std::to_string(i) + ".bin";
            files.emplace_back(rel, make_content(37 * i + 11, static_cast<unsigned>(i)));
        }
        return files;
    }

    static auto total_size(const std::vector<std::pair<std::string, std::string>>& files)
        -> uint64_t {
        uint64_t total = 0;
        for (const auto& [rel, content] : files) total += content.size();
        return total;
    }
};

class WorkerCountTest : public ParallelDownloadTest,
                        public ::testing::WithParamInterface<std::size_t> {};

// =============================================================================
// Byte conservation
// =============================================================================

TEST_P(WorkerCountTest, TotalBytesMatchSources) {
    config_.max_workers = GetParam();
    auto files = make_tree(24);
    add_directory("latch:///tree/", "tree", files);

    auto dl = make_downloader();
    auto report = dl.download("latch:///tree/", download_dir_);
    ASSERT_TRUE(report.has_value()) << report.error().message;

    EXPECT_EQ(report.value().summary.file_count(), files.size());
    EXPECT_EQ(report.value().summary.total_bytes(), total_size(files));
    for (const auto& [rel, content] : files) {
        EXPECT_EQ(read_file(download_dir_ / rel), content) << rel;
    }
}

INSTANTIATE_TEST_SUITE_P(Widths, WorkerCountTest, ::testing::Values(1, 2, 3, 8, 32));

TEST_F(ParallelDownloadTest, ListingOrderDoesNotChangeTotals) {
    auto files = make_tree(16);
    auto shuffled = files;
    std::shuffle(shuffled.begin(), shuffled.end(), std::mt19937(7));

    add_directory("latch:///ordered/", "ordered", files);
    add_directory("latch:///shuffled/", "shuffled", shuffled);

    auto dl = make_downloader();
    fs::create_directories(download_dir_ / "a");
    fs::create_directories(download_dir_ / "b");

    auto first = dl.download("latch:///ordered/", download_dir_ / "a");
    ASSERT_TRUE(first.has_value()) << first.error().message;
    auto second = dl.download("latch:///shuffled/", download_dir_ / "b");
    ASSERT_TRUE(second.has_value()) << second.error().message;

    EXPECT_EQ(first.value().summary.total_bytes(), second.value().summary.total_bytes());
    EXPECT_EQ(first.value().summary.file_count(), second.value().summary.file_count());
}

// =============================================================================
// Slot bound
// =============================================================================

TEST_F(ParallelDownloadTest, SlotsNeverExceedBarCount) {
    progress_bars::options opts;
    opts.num_bars = 3;
    opts.show_total_progress = true;
    auto scope = transfer_state_manager::create(opts);
    ASSERT_TRUE(scope.has_value());

    config_.max_workers = 8;
    std::vector<transfer_job> jobs;
    for (int i = 0; i < 20; ++i) {
        stored_object obj;
        obj.content = make_content(64, static_cast<unsigned>(i));
        obj.read_delay = std::chrono::milliseconds(1);
        auto locator = "slow" + std::to_string(i);
        store_->put(locator, obj);
        jobs.emplace_back(locator, download_dir_ / ("s" + std::to_string(i)));
    }

    transfer_coordinator coordinator(store_, config_);
    auto& progress = scope.value()->progress();
    auto summary = coordinator.run(jobs, jobs.size(), progress);
    ASSERT_TRUE(summary.has_value()) << summary.error().message;

    EXPECT_EQ(summary.value().total_bytes(), 20u * 64u);
    EXPECT_LE(progress.peak_acquired_slots(), 3u);
    EXPECT_GE(progress.peak_acquired_slots(), 1u);
    EXPECT_EQ(progress.acquired_slots(), 0u);
    EXPECT_EQ(progress.completed_files(), 20u);
}

TEST_F(ParallelDownloadTest, ConcurrentReadersBoundedByWorkers) {
    config_.max_workers = 3;
    std::vector<std::pair<std::string, std::string>> files;
    for (int i = 0; i < 12; ++i) {
        files.emplace_back("f" + std::to_string(i), make_content(48, static_cast<unsigned>(i)));
    }
    add_directory("latch:///bounded/", "bounded", files);

    auto dl = make_downloader();
    auto report = dl.download("latch:///bounded/", download_dir_);
    ASSERT_TRUE(report.has_value()) << report.error().message;
    EXPECT_LE(store_->peak_alive(), 3u);
}

// =============================================================================
// Single active download
// =============================================================================

TEST_F(ParallelDownloadTest, SecondDownloadRefusedWhileRunning) {
    stored_object slow;
    slow.content = make_content(512);
    slow.read_delay = std::chrono::milliseconds(2);
    add_object("latch:///slow.bin", "slow.bin", slow);

    stored_object quick;
    quick.content = "quick";
    add_object("latch:///quick.bin", "quick.bin", quick);

    auto first_dl = make_downloader();
    auto second_dl = make_downloader();

    auto running = std::async(std::launch::async, [&] {
        download_options options;
        options.progress = progress_mode::none;
        return first_dl.download("latch:///slow.bin", download_dir_, options);
    });

    while (!transfer_state_manager::is_active() &&
           running.wait_for(std::chrono::milliseconds(1)) != std::future_status::ready) {
    }

    download_options options;
    options.progress = progress_mode::none;
    auto refused = second_dl.download("latch:///quick.bin", download_dir_, options);
    auto first = running.get();

    ASSERT_TRUE(first.has_value()) << first.error().message;
    ASSERT_FALSE(refused.has_value());
    EXPECT_EQ(refused.error().code, error_code::already_initialized);
    EXPECT_FALSE(fs::exists(download_dir_ / "quick.bin"));
}

}  // namespace latch::ldata::test
