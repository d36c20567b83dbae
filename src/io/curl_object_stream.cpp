/**
 * @file curl_object_stream.cpp
 * @brief Streaming object reads over HTTP(S) with libcurl
 */

#include "latch/ldata/io/curl_object_stream.h"

#include "latch/ldata/config/feature_flags.h"
#include "latch/ldata/core/logging.h"

#if LDATA_HAS_CURL
#include <curl/curl.h>

#include <algorithm>
#include <cstring>
#include <deque>
#include <limits>
#include <mutex>
#endif

namespace latch::ldata {

#if LDATA_HAS_CURL

namespace {

struct easy_deleter {
    void operator()(CURL* handle) const noexcept { curl_easy_cleanup(handle); }
};

struct multi_deleter {
    void operator()(CURLM* handle) const noexcept { curl_multi_cleanup(handle); }
};

using unique_easy = std::unique_ptr<CURL, easy_deleter>;
using unique_multi = std::unique_ptr<CURLM, multi_deleter>;

constexpr int poll_timeout_ms = 1000;

void ensure_global_init() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

/**
 * @brief One in-flight GET driven through a private multi handle
 */
class curl_object_reader : public object_reader {
public:
    curl_object_reader(std::string url, std::chrono::milliseconds connect_timeout)
        : url_(std::move(url)), connect_timeout_(connect_timeout) {}

    ~curl_object_reader() override {
        if (multi_ && easy_) {
            curl_multi_remove_handle(multi_.get(), easy_.get());
        }
    }

    curl_object_reader(const curl_object_reader&) = delete;
    auto operator=(const curl_object_reader&) -> curl_object_reader& = delete;

    auto start() -> result<void> {
        easy_.reset(curl_easy_init());
        multi_.reset(curl_multi_init());
        if (!easy_ || !multi_) {
            return unexpected{error{error_code::internal_error,
                "failed to initialize libcurl handles"}};
        }

        CURL* curl = easy_.get();
        curl_easy_setopt(curl, CURLOPT_URL, url_.c_str());
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
            static_cast<long>(std::min<long long>(connect_timeout_.count(),
                                                  std::numeric_limits<long>::max())));
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, &curl_object_reader::on_header);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, this);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &curl_object_reader::on_body);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, this);
        curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer_);

        if (curl_multi_add_handle(multi_.get(), curl) != CURLM_OK) {
            return unexpected{error{error_code::internal_error,
                "failed to register libcurl transfer"}};
        }

        while (!headers_done_ && !finished_) {
            if (auto pumped = pump(); !pumped) {
                return pumped;
            }
        }

        if (finished_ && transfer_result_ != CURLE_OK) {
            return unexpected{error{error_code::connection_failed, describe_failure()}};
        }

        long status = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
        if (status < 200 || status >= 300) {
            return unexpected{error{error_code::connection_failed,
                "object request failed with HTTP status " + std::to_string(status)}};
        }

        curl_off_t length = -1;
        if (curl_easy_getinfo(curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length) == CURLE_OK &&
            length >= 0) {
            content_length_ = static_cast<uint64_t>(length);
        }
        return {};
    }

    [[nodiscard]] auto content_length() const -> std::optional<uint64_t> override {
        return content_length_;
    }

    [[nodiscard]] auto read(std::span<std::byte> buffer) -> result<std::size_t> override {
        while (buffered_.empty() && !finished_) {
            if (auto pumped = pump(); !pumped) {
                return unexpected{pumped.error()};
            }
        }

        if (buffered_.empty()) {
            if (transfer_result_ != CURLE_OK) {
                return unexpected{error{error_code::connection_lost, describe_failure()}};
            }
            return std::size_t{0};
        }

        auto n = std::min(buffer.size(), buffered_.size());
        std::copy_n(buffered_.begin(), n, reinterpret_cast<char*>(buffer.data()));
        buffered_.erase(buffered_.begin(), buffered_.begin() + static_cast<std::ptrdiff_t>(n));
        return n;
    }

private:
    static auto on_header(char* data, size_t size, size_t nmemb, void* userdata) -> size_t {
        auto* self = static_cast<curl_object_reader*>(userdata);
        auto bytes = size * nmemb;

        // blank line ends a header block; redirects produce more than one
        if (bytes <= 2 && (bytes == 0 || data[0] == '\r' || data[0] == '\n')) {
            long status = 0;
            curl_easy_getinfo(self->easy_.get(), CURLINFO_RESPONSE_CODE, &status);
            if (status < 300 || status >= 400) {
                self->headers_done_ = true;
            }
        }
        return bytes;
    }

    static auto on_body(char* data, size_t size, size_t nmemb, void* userdata) -> size_t {
        auto* self = static_cast<curl_object_reader*>(userdata);
        auto bytes = size * nmemb;
        self->buffered_.insert(self->buffered_.end(), data, data + bytes);
        return bytes;
    }

    auto pump() -> result<void> {
        int running = 0;
        auto rc = curl_multi_perform(multi_.get(), &running);
        if (rc != CURLM_OK) {
            return unexpected{error{error_code::connection_lost,
                std::string("libcurl multi error: ") + curl_multi_strerror(rc)}};
        }

        int pending = 0;
        while (CURLMsg* msg = curl_multi_info_read(multi_.get(), &pending)) {
            if (msg->msg == CURLMSG_DONE) {
                finished_ = true;
                transfer_result_ = msg->data.result;
            }
        }

        if (!finished_ && running > 0 && buffered_.empty()) {
            rc = curl_multi_poll(multi_.get(), nullptr, 0, poll_timeout_ms, nullptr);
            if (rc != CURLM_OK) {
                return unexpected{error{error_code::connection_lost,
                    std::string("libcurl poll error: ") + curl_multi_strerror(rc)}};
            }
        }
        return {};
    }

    [[nodiscard]] auto describe_failure() const -> std::string {
        std::string message = curl_easy_strerror(transfer_result_);
        if (error_buffer_[0] != '\0') {
            message += ": ";
            message += error_buffer_;
        }
        return message;
    }

    std::string url_;
    std::chrono::milliseconds connect_timeout_;

    unique_easy easy_;
    unique_multi multi_;
    char error_buffer_[CURL_ERROR_SIZE] = {};

    std::deque<char> buffered_;
    std::optional<uint64_t> content_length_;
    bool headers_done_ = false;
    bool finished_ = false;
    CURLcode transfer_result_ = CURLE_OK;
};

}  // namespace

#endif  // LDATA_HAS_CURL

curl_object_opener::curl_object_opener(std::chrono::milliseconds connect_timeout)
    : connect_timeout_(connect_timeout) {
#if LDATA_HAS_CURL
    ensure_global_init();
#endif
}

curl_object_opener::~curl_object_opener() = default;

auto curl_object_opener::open(const std::string& locator)
    -> result<std::unique_ptr<object_reader>> {
#if LDATA_HAS_CURL
    auto reader = std::make_unique<curl_object_reader>(locator, connect_timeout_);
    if (auto started = reader->start(); !started) {
        LDATA_LOG_ERROR(log_category::remote,
            "Failed to open " + locator + ": " + started.error().message);
        return unexpected{started.error()};
    }
    return std::unique_ptr<object_reader>(std::move(reader));
#else
    (void)locator;
    return unexpected{error{error_code::not_available,
        "object streaming not available (LDATA_ENABLE_CURL not defined)"}};
#endif
}

auto curl_object_opener::is_available() noexcept -> bool {
    return LDATA_HAS_CURL != 0;
}

}  // namespace latch::ldata
