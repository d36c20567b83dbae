/**
 * @file test_http_signed_url_issuer.cpp
 * @brief Unit tests for signed URL issuance over the API client
 */

#include <gtest/gtest.h>

#include <latch/ldata/remote/http_signed_url_issuer.h>

#include <deque>

namespace latch::ldata::test {

/**
 * @brief api_http_interface replaying canned responses
 */
class scripted_http : public api_http_interface {
public:
    struct request {
        std::string url;
        std::string body;
        std::map<std::string, std::string> headers;
    };

    void reply(int status, std::string body) {
        http_response response;
        response.status_code = status;
        response.body = std::move(body);
        replies_.push_back(std::move(response));
    }

    void fail_with(error err) { failure_ = std::move(err); }

    auto post(const std::string& url, const std::string& body,
              const std::map<std::string, std::string>& headers)
        -> result<http_response> override {
        requests.push_back(request{url, body, headers});
        if (failure_) return unexpected{*failure_};
        if (replies_.empty()) {
            return unexpected{error{error_code::internal_error, "no scripted reply"}};
        }
        auto response = std::move(replies_.front());
        replies_.pop_front();
        return response;
    }

    std::vector<request> requests;

private:
    std::deque<http_response> replies_;
    std::optional<error> failure_;
};

class HttpSignedUrlIssuerTest : public ::testing::Test {
protected:
    void SetUp() override {
        http_ = std::make_shared<scripted_http>();
        issuer_ = std::make_unique<http_signed_url_issuer>(
            http_, api_endpoints{"https://api.test"}, "Latch-SDK-Token abc");
    }

    std::shared_ptr<scripted_http> http_;
    std::unique_ptr<http_signed_url_issuer> issuer_;
};

TEST_F(HttpSignedUrlIssuerTest, SingleObjectRequest) {
    http_->reply(200, R"({"data": {"url": "https://bucket/obj?sig=1"}})");

    auto url = issuer_->issue_signed_url("/welcome/a.txt");
    ASSERT_TRUE(url.has_value()) << url.error().message;
    EXPECT_EQ(url.value(), "https://bucket/obj?sig=1");

    ASSERT_EQ(http_->requests.size(), 1u);
    const auto& req = http_->requests[0];
    EXPECT_EQ(req.url, "https://api.test/ldata/get-signed-url");
    EXPECT_EQ(req.body, R"({"path": "latch:///welcome/a.txt"})");
    EXPECT_EQ(req.headers.at("Authorization"), "Latch-SDK-Token abc");
    EXPECT_EQ(req.headers.at("Content-Type"), "application/json");
}

TEST_F(HttpSignedUrlIssuerTest, RecursiveKeepsListingOrder) {
    http_->reply(200, R"({"data": {"urls": {"b/2.txt": "u2", "a.txt": "u1", "b/1.txt": "u3"}}})");

    auto nodes = issuer_->issue_signed_urls_recursive("latch:///reads/");
    ASSERT_TRUE(nodes.has_value()) << nodes.error().message;
    ASSERT_EQ(nodes.value().size(), 3u);
    EXPECT_EQ(nodes.value()[0], planned_node("b/2.txt", "u2"));
    EXPECT_EQ(nodes.value()[1], planned_node("a.txt", "u1"));
    EXPECT_EQ(nodes.value()[2], planned_node("b/1.txt", "u3"));

    EXPECT_EQ(http_->requests[0].url, "https://api.test/ldata/get-signed-urls-recursive");
    EXPECT_EQ(http_->requests[0].body, R"({"path": "latch:///reads/"})");
}

TEST_F(HttpSignedUrlIssuerTest, EmptyContainer) {
    http_->reply(200, R"({"data": {"urls": {}}})");

    auto nodes = issuer_->issue_signed_urls_recursive("/empty");
    ASSERT_TRUE(nodes.has_value());
    EXPECT_TRUE(nodes.value().empty());
}

TEST_F(HttpSignedUrlIssuerTest, NonOkCarriesBackendMessage) {
    http_->reply(403, R"({"error": "permission denied"})");

    auto url = issuer_->issue_signed_url("/private/a.txt");
    ASSERT_FALSE(url.has_value());
    EXPECT_EQ(url.error().code, error_code::remote_api_error);
    EXPECT_EQ(url.error().message,
              "failed to fetch presigned url(s) for path /private/a.txt with code 403: "
              "permission denied");
}

TEST_F(HttpSignedUrlIssuerTest, NonOkWithoutErrorField) {
    http_->reply(500, "upstream exploded");

    auto nodes = issuer_->issue_signed_urls_recursive("/x");
    ASSERT_FALSE(nodes.has_value());
    EXPECT_EQ(nodes.error().code, error_code::remote_api_error);
    EXPECT_NE(nodes.error().message.find("with code 500: upstream exploded"), std::string::npos);
}

TEST_F(HttpSignedUrlIssuerTest, MissingFieldsAreMalformed) {
    http_->reply(200, R"({"result": {}})");
    http_->reply(200, R"({"data": {}})");
    http_->reply(200, R"({"data": {"urls": {"a": 1}}})");

    auto no_data = issuer_->issue_signed_url("/a");
    ASSERT_FALSE(no_data.has_value());
    EXPECT_EQ(no_data.error().code, error_code::malformed_response);

    auto no_url = issuer_->issue_signed_url("/a");
    ASSERT_FALSE(no_url.has_value());
    EXPECT_EQ(no_url.error().code, error_code::malformed_response);

    auto bad_urls = issuer_->issue_signed_urls_recursive("/a");
    ASSERT_FALSE(bad_urls.has_value());
    EXPECT_EQ(bad_urls.error().code, error_code::malformed_response);
}

TEST_F(HttpSignedUrlIssuerTest, TransportErrorPropagates) {
    http_->fail_with(error{error_code::connection_failed, "refused"});

    auto url = issuer_->issue_signed_url("/a");
    ASSERT_FALSE(url.has_value());
    EXPECT_EQ(url.error().code, error_code::connection_failed);
}

TEST(HttpResponseTest, HeaderLookupIgnoresCase) {
    http_response response;
    response.headers["Content-Length"] = "12";
    EXPECT_EQ(response.get_header("content-length").value(), "12");
    EXPECT_FALSE(response.get_header("etag").has_value());
}

}  // namespace latch::ldata::test
