/**
 * @file test_remote_path.cpp
 * @brief Unit tests for remote path normalization and endpoints
 */

#include <gtest/gtest.h>

#include <latch/ldata/remote/endpoints.h>
#include <latch/ldata/remote/remote_path.h>

#include <cstdlib>

namespace latch::ldata::test {

TEST(NormalizeRemotePathTest, AddsSchemeToAbsolutePath) {
    EXPECT_EQ(normalize_remote_path("/welcome/data.csv"), "latch:///welcome/data.csv");
}

TEST(NormalizeRemotePathTest, AddsSchemeToRelativePath) {
    EXPECT_EQ(normalize_remote_path("welcome/data.csv"), "latch:///welcome/data.csv");
}

TEST(NormalizeRemotePathTest, KeepsAuthority) {
    EXPECT_EQ(normalize_remote_path("latch://1234.account/reads"), "latch://1234.account/reads");
}

TEST(NormalizeRemotePathTest, KeepsTrailingSlash) {
    EXPECT_EQ(normalize_remote_path("latch:///reads/"), "latch:///reads/");
    EXPECT_EQ(normalize_remote_path("/reads/"), "latch:///reads/");
}

TEST(NormalizeRemotePathTest, CollapsesRepeatedSeparators) {
    EXPECT_EQ(normalize_remote_path("latch:///a//b///c"), "latch:///a/b/c");
}

TEST(NormalizeRemotePathTest, Idempotent) {
    auto once = normalize_remote_path("/x/y/");
    EXPECT_EQ(normalize_remote_path(once), once);
}

TEST(RemoteBasenameTest, LastComponent) {
    EXPECT_EQ(remote_basename("latch:///a/b.txt"), "b.txt");
    EXPECT_EQ(remote_basename("latch:///a/dir/"), "dir");
    EXPECT_EQ(remote_basename("plain"), "plain");
}

TEST(ApiEndpointsTest, DefaultRoutes) {
    api_endpoints endpoints;
    EXPECT_EQ(endpoints.get_signed_url(), "https://nucleus.latch.bio/ldata/get-signed-url");
    EXPECT_EQ(endpoints.get_signed_urls_recursive(),
              "https://nucleus.latch.bio/ldata/get-signed-urls-recursive");
}

TEST(ApiEndpointsTest, EnvironmentOverride) {
    setenv("LATCH_API_URL", "http://localhost:8080/", 1);
    auto endpoints = api_endpoints::from_environment();
    unsetenv("LATCH_API_URL");

    EXPECT_EQ(endpoints.base_url, "http://localhost:8080");
    EXPECT_EQ(endpoints.get_signed_url(), "http://localhost:8080/ldata/get-signed-url");
}

}  // namespace latch::ldata::test
