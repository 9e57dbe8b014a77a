/**
 * @file job_types.h
 * @brief Upload job, lifecycle state and progress types
 */

#ifndef MEDIA_UPLOAD_CORE_JOB_TYPES_H
#define MEDIA_UPLOAD_CORE_JOB_TYPES_H

#include "types.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace media_upload {

/**
 * @brief Process-unique identifier of an upload job
 *
 * Format: upload_YYYYmmdd_HHMMSS_ffffff_<seq>
 */
struct job_id {
    std::string value;

    job_id() = default;
    explicit job_id(std::string v) : value(std::move(v)) {}

    /**
     * @brief Generate a new id from the current time and a process counter
     */
    [[nodiscard]] static auto generate() -> job_id;

    [[nodiscard]] auto empty() const noexcept -> bool { return value.empty(); }
    [[nodiscard]] auto str() const -> const std::string& { return value; }

    [[nodiscard]] auto operator==(const job_id& other) const -> bool = default;
    [[nodiscard]] auto operator<(const job_id& other) const -> bool {
        return value < other.value;
    }
};

/**
 * @brief Lifecycle state of an upload job
 *
 * Jobs only ever move forward through this list. completed, failed and
 * cancelled are terminal.
 */
enum class job_state {
    queued,
    authenticating,
    uploading,
    processing,
    finalizing,
    completed,
    failed,
    cancelled
};

[[nodiscard]] constexpr auto to_string(job_state state) -> const char* {
    switch (state) {
        case job_state::queued: return "queued";
        case job_state::authenticating: return "authenticating";
        case job_state::uploading: return "uploading";
        case job_state::processing: return "processing";
        case job_state::finalizing: return "finalizing";
        case job_state::completed: return "completed";
        case job_state::failed: return "failed";
        case job_state::cancelled: return "cancelled";
        default: return "unknown";
    }
}

[[nodiscard]] constexpr auto is_terminal(job_state state) -> bool {
    return state == job_state::completed ||
           state == job_state::failed ||
           state == job_state::cancelled;
}

/**
 * @brief Check whether a job may move from one state to another
 *
 * Staying in the same non-terminal state is allowed so that repeated
 * progress updates within a phase pass the check.
 */
[[nodiscard]] constexpr auto can_transition(job_state from, job_state to) -> bool {
    if (is_terminal(from)) {
        return false;
    }
    if (is_terminal(to)) {
        return true;
    }
    return static_cast<int>(to) >= static_cast<int>(from);
}

/**
 * @brief One file to upload, as handed in by a caller
 */
struct upload_request {
    std::filesystem::path resource;
    std::string title;
    std::string description;
    std::optional<std::string> schedule;  ///< RFC3339 UTC, e.g. 2030-01-01T00:00:00Z
};

/**
 * @brief Immutable unit of work owned by the manager registry
 */
struct upload_job {
    job_id id;
    std::filesystem::path resource;
    std::string title;
    std::string description;
    std::optional<std::string> schedule;
    std::chrono::system_clock::time_point created_at;
};

/**
 * @brief Point-in-time progress of one job
 */
struct progress_snapshot {
    int percent = 0;
    job_state state = job_state::queued;
    std::string message;
    std::optional<double> speed_mbps;
    std::optional<double> eta_seconds;
    uint64_t bytes_sent = 0;
    uint64_t total_bytes = 0;
};

/**
 * @brief Terminal record of a job
 */
struct job_result {
    job_id id;
    job_state state = job_state::failed;
    bool success = false;
    std::optional<std::string> video_id;
    std::string video_url;
    std::string message;
    error_code code = error_code::success;
    std::string title;
    std::filesystem::path resource;
    std::optional<std::filesystem::path> organized_path;  ///< Where the file was moved after upload
    std::chrono::system_clock::time_point finished_at;
};

/**
 * @brief Snapshot of a job as seen through upload_manager::status()
 */
struct job_info {
    upload_job job;
    job_state state = job_state::queued;
    progress_snapshot last_progress;
    std::optional<std::string> video_id;
    std::optional<std::string> error_message;
};

/**
 * @brief Aggregate counters of the active batch
 */
struct batch_progress {
    std::size_t total = 0;
    std::size_t completed = 0;
    std::size_t failed = 0;

    [[nodiscard]] auto settled() const -> std::size_t { return completed + failed; }
    [[nodiscard]] auto pending() const -> std::size_t { return total - settled(); }
    [[nodiscard]] auto is_complete() const -> bool { return total > 0 && settled() == total; }
};

/**
 * @brief Public watch URL of an uploaded video
 */
[[nodiscard]] auto make_video_url(const std::string& video_id) -> std::string;

}  // namespace media_upload

template <>
struct std::hash<media_upload::job_id> {
    auto operator()(const media_upload::job_id& id) const noexcept -> std::size_t {
        return std::hash<std::string>{}(id.value);
    }
};

#endif  // MEDIA_UPLOAD_CORE_JOB_TYPES_H
