/**
 * @file test_transfer_config.cpp
 * @brief Unit tests for transfer configuration
 */

#include <gtest/gtest.h>

#include <latch/ldata/config/transfer_config.h>

#include <cstdlib>

namespace latch::ldata::test {

class TransferConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        unsetenv("LDATA_MAX_WORKERS");
        unsetenv("LDATA_CHUNK_SIZE");
    }

    void TearDown() override {
        unsetenv("LDATA_MAX_WORKERS");
        unsetenv("LDATA_CHUNK_SIZE");
    }
};

TEST_F(TransferConfigTest, Defaults) {
    transfer_config config;
    EXPECT_EQ(config.chunk_size, 5u * 1024 * 1024);
    EXPECT_EQ(config.max_workers, 0u);
    EXPECT_TRUE(config.validate().has_value());
}

TEST_F(TransferConfigTest, DefaultMaxWorkersIsCapped) {
    auto workers = default_max_workers();
    EXPECT_GE(workers, 1u);
    EXPECT_LE(workers, max_auto_workers);
}

TEST_F(TransferConfigTest, EffectiveMaxWorkers) {
    transfer_config config;
    EXPECT_EQ(config.effective_max_workers(), default_max_workers());

    config.max_workers = 3;
    EXPECT_EQ(config.effective_max_workers(), 3u);
}

TEST_F(TransferConfigTest, ZeroChunkSizeRejected) {
    transfer_config config;
    config.chunk_size = 0;

    auto valid = config.validate();
    ASSERT_FALSE(valid.has_value());
    EXPECT_EQ(valid.error().code, error_code::invalid_chunk_size);
}

TEST_F(TransferConfigTest, NonPositiveRefreshRejected) {
    transfer_config config;
    config.progress_refresh = std::chrono::milliseconds(0);

    auto valid = config.validate();
    ASSERT_FALSE(valid.has_value());
    EXPECT_EQ(valid.error().code, error_code::invalid_configuration);
}

TEST_F(TransferConfigTest, FromEnvironment) {
    setenv("LDATA_MAX_WORKERS", "7", 1);
    setenv("LDATA_CHUNK_SIZE", "1024", 1);

    auto config = transfer_config::from_environment();
    EXPECT_EQ(config.max_workers, 7u);
    EXPECT_EQ(config.chunk_size, 1024u);
}

TEST_F(TransferConfigTest, FromEnvironmentIgnoresGarbage) {
    setenv("LDATA_MAX_WORKERS", "many", 1);
    setenv("LDATA_CHUNK_SIZE", "0", 1);

    auto config = transfer_config::from_environment();
    EXPECT_EQ(config.max_workers, 0u);
    EXPECT_EQ(config.chunk_size, default_chunk_size);
}

TEST_F(TransferConfigTest, NegativeWorkerCountIgnored) {
    setenv("LDATA_MAX_WORKERS", "-1", 1);

    auto config = transfer_config::from_environment();
    EXPECT_EQ(config.max_workers, 0u);
    EXPECT_LE(config.effective_max_workers(), max_auto_workers);
    EXPECT_TRUE(config.validate().has_value());
}

TEST_F(TransferConfigTest, OverflowingWorkerCountIgnored) {
    setenv("LDATA_MAX_WORKERS", "99999999999999999999999", 1);
    setenv("LDATA_CHUNK_SIZE", "-4096", 1);

    auto config = transfer_config::from_environment();
    EXPECT_EQ(config.max_workers, 0u);
    EXPECT_EQ(config.chunk_size, default_chunk_size);
}

TEST_F(TransferConfigTest, LargeWorkerCountClamped) {
    setenv("LDATA_MAX_WORKERS", "10000", 1);

    auto config = transfer_config::from_environment();
    EXPECT_EQ(config.max_workers, max_configured_workers);
    EXPECT_TRUE(config.validate().has_value());
}

TEST_F(TransferConfigTest, ExcessiveWorkerCountRejected) {
    transfer_config config;
    config.max_workers = max_configured_workers + 1;

    auto valid = config.validate();
    ASSERT_FALSE(valid.has_value());
    EXPECT_EQ(valid.error().code, error_code::invalid_configuration);
}

}  // namespace latch::ldata::test
