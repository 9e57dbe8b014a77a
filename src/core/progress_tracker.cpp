/**
 * @file progress_tracker.cpp
 * @brief Implementation of progress_tracker and the progress formatters
 */

#include "media_upload/core/progress_tracker.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace media_upload {

progress_tracker::progress_tracker(uint64_t total_bytes,
                                   std::chrono::milliseconds emit_interval,
                                   int floor_percent,
                                   clock::time_point start)
    : total_bytes_(total_bytes),
      emit_interval_(emit_interval),
      start_(start),
      last_emit_(start),
      last_percent_(std::clamp(floor_percent, 0, transfer_percent_cap)) {}

auto progress_tracker::transfer_percent(uint64_t bytes_sent, uint64_t total_bytes) -> int {
    if (total_bytes == 0) {
        return transfer_percent_cap;
    }
    if (bytes_sent >= total_bytes) {
        return transfer_percent_cap;
    }
    auto raw = static_cast<int>(bytes_sent * 100 / total_bytes);
    return std::min(raw, transfer_percent_cap);
}

auto progress_tracker::compute_rate(uint64_t bytes_sent, clock::time_point now) const
    -> transfer_rate {
    transfer_rate rate;
    rate.uploaded_mb = static_cast<double>(bytes_sent) / bytes_per_mb;
    rate.total_mb = static_cast<double>(total_bytes_) / bytes_per_mb;

    auto elapsed = std::chrono::duration<double>(now - start_).count();
    rate.speed_mbps = elapsed > 0.0 ? rate.uploaded_mb / elapsed : 0.0;

    auto remaining_mb = std::max(0.0, rate.total_mb - rate.uploaded_mb);
    rate.eta_seconds = rate.speed_mbps > 0.0 ? remaining_mb / rate.speed_mbps : 0.0;
    return rate;
}

auto progress_tracker::update(uint64_t bytes_sent, clock::time_point now)
    -> std::optional<progress_snapshot> {
    bytes_sent_ = std::max(bytes_sent_, bytes_sent);

    auto percent = std::max(last_percent_, transfer_percent(bytes_sent_, total_bytes_));
    if (percent == last_percent_ && now - last_emit_ <= emit_interval_) {
        return std::nullopt;
    }

    auto rate = compute_rate(bytes_sent_, now);

    progress_snapshot snapshot;
    snapshot.percent = percent;
    snapshot.state = job_state::uploading;
    snapshot.message = format_progress_message(rate);
    snapshot.speed_mbps = rate.speed_mbps;
    snapshot.eta_seconds = rate.eta_seconds;
    snapshot.bytes_sent = bytes_sent_;
    snapshot.total_bytes = total_bytes_;

    last_percent_ = percent;
    last_emit_ = now;
    return snapshot;
}

auto format_speed(double speed_mbps) -> std::string {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1);
    if (speed_mbps < 1.0) {
        oss << speed_mbps * 1000.0 << " KB/s";
    } else {
        oss << speed_mbps << " MB/s";
    }
    return oss.str();
}

auto format_eta(double seconds) -> std::string {
    auto total = seconds > 0.0 ? static_cast<int64_t>(seconds) : int64_t{0};

    std::ostringstream oss;
    if (total < 60) {
        oss << total << "s";
    } else if (total < 3600) {
        oss << total / 60 << "m " << total % 60 << "s";
    } else {
        oss << total / 3600 << "h " << (total % 3600) / 60 << "m";
    }
    return oss.str();
}

auto format_progress_message(const transfer_rate& rate) -> std::string {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1)
        << rate.uploaded_mb << "MB / " << rate.total_mb << "MB • "
        << format_speed(rate.speed_mbps) << " • "
        << format_eta(rate.eta_seconds) << " remaining";
    return oss.str();
}

}  // namespace media_upload
