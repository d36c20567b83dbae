/**
 * @file transfer_worker.cpp
 * @brief Streams one remote object into one local file
 */

#include "latch/ldata/transfer/transfer_worker.h"

#include "latch/ldata/core/format_utils.h"
#include "latch/ldata/core/logging.h"

#include <chrono>
#include <fstream>
#include <vector>

namespace latch::ldata {

namespace {

/**
 * @brief Advances the files-completed counter when the job ends
 */
class completion_counter {
public:
    explicit completion_counter(progress_bars& progress) : progress_(progress) {}
    ~completion_counter() { progress_.update_total_progress(1); }

    completion_counter(const completion_counter&) = delete;
    auto operator=(const completion_counter&) -> completion_counter& = delete;

private:
    progress_bars& progress_;
};

auto cancelled(const transfer_job& job) -> unexpected {
    return unexpected{error{error_code::transfer_cancelled,
        "download of " + job.destination().string() + " cancelled"}};
}

}  // namespace

transfer_worker::transfer_worker(std::shared_ptr<object_opener> opener, std::size_t chunk_size)
    : opener_(std::move(opener)), chunk_size_(chunk_size) {}

auto transfer_worker::transfer_one(const transfer_job& job,
                                   progress_bars& progress,
                                   const std::atomic<bool>& cancel_flag)
    -> result<uint64_t> {
    const auto& dest = job.destination();

    if (chunk_size_ == 0) {
        return unexpected{error{error_code::invalid_chunk_size,
            "chunk size must be non-zero"}};
    }
    if (!opener_) {
        return unexpected{error{error_code::not_initialized, "object opener not set"}};
    }
    if (cancel_flag.load()) {
        return cancelled(job);
    }

    completion_counter counter(progress);

    std::ofstream file(dest, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        return unexpected{error{error_code::file_access_denied,
            "unable to open " + dest.string() + " for writing"}};
    }

    auto reader = opener_->open(job.source_locator());
    if (!reader) {
        return unexpected{error{reader.error().code,
            "unable to fetch " + dest.string() + ": " + reader.error().message}};
    }

    auto total_bytes = reader.value()->content_length();
    if (!total_bytes) {
        return unexpected{error{error_code::missing_content_length,
            "no content length advertised for " + dest.string()}};
    }

    auto slot = progress.acquire_slot();
    slot.set(*total_bytes, dest.filename().string());

    transfer_log_context ctx;
    ctx.destination = dest.string();
    ctx.file_size = *total_bytes;
    if (slot.index()) ctx.slot_index = *slot.index();
    LDATA_LOG_DEBUG_CTX(log_category::worker, "Streaming object", ctx);

    auto start = std::chrono::steady_clock::now();
    std::vector<std::byte> buffer(chunk_size_);
    uint64_t written = 0;
    bool eof = false;

    while (!eof) {
        if (cancel_flag.load()) {
            return cancelled(job);
        }

        std::size_t filled = 0;
        while (filled < buffer.size()) {
            auto n = reader.value()->read(std::span<std::byte>(buffer).subspan(filled));
            if (!n) {
                return unexpected{error{n.error().code,
                    "failed reading " + dest.string() + ": " + n.error().message}};
            }
            if (n.value() == 0) {
                eof = true;
                break;
            }
            filled += n.value();
        }

        if (filled == 0) {
            break;
        }

        file.write(reinterpret_cast<const char*>(buffer.data()),
                   static_cast<std::streamsize>(filled));
        if (!file) {
            return unexpected{error{error_code::file_write_error,
                "failed writing " + dest.string()}};
        }

        written += filled;
        slot.update(filled);

        if (written > *total_bytes) {
            return unexpected{error{error_code::content_length_mismatch,
                "received more than the advertised " + std::to_string(*total_bytes) +
                " bytes for " + dest.string()}};
        }
    }

    if (written != *total_bytes) {
        return unexpected{error{error_code::content_length_mismatch,
            "stream for " + dest.string() + " ended after " + std::to_string(written) +
            " of " + std::to_string(*total_bytes) + " bytes"}};
    }

    file.close();
    if (!file) {
        return unexpected{error{error_code::file_write_error,
            "failed closing " + dest.string()}};
    }

    auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    progress.write("Downloaded " + dest.filename().string() + " (" +
                   with_si_suffix(*total_bytes) + ") in " + human_readable_time(elapsed));

    ctx.bytes_transferred = written;
    ctx.duration_ms = static_cast<uint64_t>(elapsed * 1000.0);
    LDATA_LOG_DEBUG_CTX(log_category::worker, "Object stored", ctx);

    return *total_bytes;
}

}  // namespace latch::ldata
