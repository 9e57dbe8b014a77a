/**
 * @file job_types.cpp
 * @brief Implementation of job_id generation
 */

#include "media_upload/core/job_types.h"

#include <atomic>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace media_upload {

namespace {

std::atomic<uint64_t> job_sequence{0};

}  // namespace

auto job_id::generate() -> job_id {
    auto now = std::chrono::system_clock::now();
    auto time_t_val = std::chrono::system_clock::to_time_t(now);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
        now.time_since_epoch()) % 1000000;

    std::tm tm_buf{};
#if defined(_WIN32)
    localtime_s(&tm_buf, &time_t_val);
#else
    localtime_r(&time_t_val, &tm_buf);
#endif

    // The counter keeps ids unique when two jobs share a microsecond.
    std::ostringstream oss;
    oss << "upload_" << std::put_time(&tm_buf, "%Y%m%d_%H%M%S")
        << '_' << std::setfill('0') << std::setw(6) << micros.count()
        << '_' << job_sequence.fetch_add(1, std::memory_order_relaxed) + 1;
    return job_id{oss.str()};
}

auto make_video_url(const std::string& video_id) -> std::string {
    return "https://www.youtube.com/watch?v=" + video_id;
}

}  // namespace media_upload
