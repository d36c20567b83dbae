/**
 * @file test_credentials.cpp
 * @brief Unit tests for authorization header resolution
 */

#include <gtest/gtest.h>

#include <latch/ldata/remote/credentials.h>

#include <filesystem>
#include <fstream>
#include <random>

namespace latch::ldata::test {

class CredentialsTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               ("ldata_cred_" + std::to_string(std::random_device{}()));
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    auto write_token(const std::string& content) -> std::filesystem::path {
        auto path = dir_ / "token";
        std::ofstream(path) << content;
        return path;
    }

    std::filesystem::path dir_;
};

TEST_F(CredentialsTest, ExecutionTokenWins) {
    credential_sources sources;
    sources.execution_id = "exec-123";
    sources.token_file = write_token("sdk-token");

    auto header = resolve_auth_header(sources);
    ASSERT_TRUE(header.has_value());
    EXPECT_EQ(header.value(), "Latch-Execution-Token exec-123");
}

TEST_F(CredentialsTest, SdkTokenFromFile) {
    credential_sources sources;
    sources.token_file = write_token("  sdk-token\n");

    auto header = resolve_auth_header(sources);
    ASSERT_TRUE(header.has_value());
    EXPECT_EQ(header.value(), "Latch-SDK-Token sdk-token");
}

TEST_F(CredentialsTest, MissingTokenFile) {
    credential_sources sources;
    sources.token_file = dir_ / "absent";

    auto header = resolve_auth_header(sources);
    ASSERT_FALSE(header.has_value());
    EXPECT_EQ(header.error().code, error_code::authentication_failed);
}

TEST_F(CredentialsTest, EmptyTokenFile) {
    credential_sources sources;
    sources.token_file = write_token("\n");

    auto header = resolve_auth_header(sources);
    ASSERT_FALSE(header.has_value());
    EXPECT_EQ(header.error().code, error_code::authentication_failed);
}

TEST_F(CredentialsTest, FromEnvironmentReadsHome) {
    setenv("HOME", dir_.c_str(), 1);
    unsetenv("FLYTE_INTERNAL_EXECUTION_ID");

    auto sources = credential_sources::from_environment();
    EXPECT_FALSE(sources.execution_id.has_value());
    EXPECT_EQ(sources.token_file, dir_ / ".latch" / "token");
}

}  // namespace latch::ldata::test
