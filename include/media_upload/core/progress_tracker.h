/**
 * @file progress_tracker.h
 * @brief Speed, ETA and event throttling for a running upload
 */

#ifndef MEDIA_UPLOAD_CORE_PROGRESS_TRACKER_H
#define MEDIA_UPLOAD_CORE_PROGRESS_TRACKER_H

#include "job_types.h"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace media_upload {

/// Highest percent reported while bytes are still moving
inline constexpr int transfer_percent_cap = 90;

/// Bytes per megabyte used for speed and size figures
inline constexpr double bytes_per_mb = 1e6;

/**
 * @brief Throughput figures derived from one progress sample
 */
struct transfer_rate {
    double uploaded_mb = 0.0;
    double total_mb = 0.0;
    double speed_mbps = 0.0;
    double eta_seconds = 0.0;
};

/**
 * @brief Tracks one job's transfer and decides when to publish progress
 *
 * A snapshot is produced when the integer percent changes, or when more
 * than the emit interval has passed since the previous one. Percent never
 * drops below the last published value.
 */
class progress_tracker {
public:
    using clock = std::chrono::steady_clock;

    /**
     * @param total_bytes Size of the file being sent
     * @param emit_interval Maximum silence between snapshots
     * @param floor_percent Percent already published before the transfer
     * @param start When the transfer started
     */
    progress_tracker(uint64_t total_bytes,
                     std::chrono::milliseconds emit_interval,
                     int floor_percent = 0,
                     clock::time_point start = clock::now());

    /**
     * @brief Record a new cumulative byte count
     * @return Snapshot to publish, or nullopt when throttled
     */
    [[nodiscard]] auto update(uint64_t bytes_sent, clock::time_point now = clock::now())
        -> std::optional<progress_snapshot>;

    [[nodiscard]] auto compute_rate(uint64_t bytes_sent, clock::time_point now) const
        -> transfer_rate;

    [[nodiscard]] auto last_percent() const -> int { return last_percent_; }
    [[nodiscard]] auto bytes_sent() const -> uint64_t { return bytes_sent_; }
    [[nodiscard]] auto total_bytes() const -> uint64_t { return total_bytes_; }

    /**
     * @brief Transfer percent, floored and capped at transfer_percent_cap
     */
    [[nodiscard]] static auto transfer_percent(uint64_t bytes_sent, uint64_t total_bytes) -> int;

private:
    uint64_t total_bytes_;
    std::chrono::milliseconds emit_interval_;
    clock::time_point start_;
    clock::time_point last_emit_;
    int last_percent_;
    uint64_t bytes_sent_ = 0;
};

/**
 * @brief "512.0 KB/s" below 1 MB/s, "3.4 MB/s" otherwise
 */
[[nodiscard]] auto format_speed(double speed_mbps) -> std::string;

/**
 * @brief "42s", "3m 5s" or "1h 12m"
 */
[[nodiscard]] auto format_eta(double seconds) -> std::string;

/**
 * @brief "12.0MB / 50.0MB • 3.4 MB/s • 11s remaining"
 */
[[nodiscard]] auto format_progress_message(const transfer_rate& rate) -> std::string;

}  // namespace media_upload

#endif  // MEDIA_UPLOAD_CORE_PROGRESS_TRACKER_H
