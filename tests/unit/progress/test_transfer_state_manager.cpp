/**
 * @file test_transfer_state_manager.cpp
 * @brief Unit tests for the scoped transfer state
 */

#include <gtest/gtest.h>

#include <latch/ldata/progress/transfer_state_manager.h>

#include <limits>

namespace latch::ldata::test {

TEST(TransferStateManagerTest, SecondActiveInstanceRefused) {
    auto first = transfer_state_manager::create({});
    ASSERT_TRUE(first.has_value());
    EXPECT_TRUE(transfer_state_manager::is_active());

    auto second = transfer_state_manager::create({});
    ASSERT_FALSE(second.has_value());
    EXPECT_EQ(second.error().code, error_code::already_initialized);
}

TEST(TransferStateManagerTest, ReleasedOnDestruction) {
    {
        auto state = transfer_state_manager::create({});
        ASSERT_TRUE(state.has_value());
    }
    EXPECT_FALSE(transfer_state_manager::is_active());

    auto again = transfer_state_manager::create({});
    EXPECT_TRUE(again.has_value());
}

TEST(TransferStateManagerTest, PhaseTransitions) {
    auto state = transfer_state_manager::create({});
    ASSERT_TRUE(state.has_value());

    auto& manager = *state.value();
    EXPECT_EQ(manager.phase(), transfer_phase::planning);
    manager.set_phase(transfer_phase::executing);
    EXPECT_EQ(manager.phase(), transfer_phase::executing);
    manager.set_phase(transfer_phase::completed);
    EXPECT_EQ(manager.phase(), transfer_phase::completed);
}

TEST(TransferStateManagerTest, ProgressUsesRequestedSlots) {
    progress_bars::options opts;
    opts.num_bars = 4;
    opts.show_total_progress = true;

    auto state = transfer_state_manager::create(opts);
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state.value()->progress().num_bars(), 4u);
}

TEST(TransferStateManagerTest, FailedSetupReleasesScope) {
    progress_bars::options opts;
    opts.num_bars = std::numeric_limits<std::size_t>::max() / 2;

    auto state = transfer_state_manager::create(opts);
    ASSERT_FALSE(state.has_value());
    EXPECT_EQ(state.error().code, error_code::internal_error);
    EXPECT_FALSE(transfer_state_manager::is_active());

    auto retry = transfer_state_manager::create({});
    EXPECT_TRUE(retry.has_value());
}

}  // namespace latch::ldata::test
