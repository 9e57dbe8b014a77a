/**
 * @file result_sink.h
 * @brief Receivers of terminal job records
 */

#ifndef MEDIA_UPLOAD_MANAGER_RESULT_SINK_H
#define MEDIA_UPLOAD_MANAGER_RESULT_SINK_H

#include "media_upload/core/job_types.h"
#include "media_upload/core/types.h"

#include <cstddef>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace media_upload {

/**
 * @brief Receives one record per terminal job
 *
 * Called from worker threads; implementations must be thread-safe.
 */
class result_sink {
public:
    virtual ~result_sink() = default;

    virtual auto record(const job_result& result) -> media_upload::result<void> = 0;
};

/**
 * @brief One entry of the upload history
 */
struct history_record {
    std::string original_file;
    std::string title;
    std::string video_url;
    std::string video_id;
    std::string date;      ///< RFC3339 UTC
    std::string status;    ///< completed, failed or cancelled
    std::string message;
};

/**
 * @brief Aggregate figures over the history
 */
struct history_stats {
    std::size_t total_uploads = 0;
    std::size_t completed = 0;
    std::size_t failed = 0;
    std::optional<std::string> last_upload;
};

/**
 * @brief result_sink persisting an upload history as a JSON document
 *
 * Layout: {"uploads": [ {...}, ... ], "last_updated": "..."}. Every
 * record rewrites the document atomically.
 */
class upload_history : public result_sink {
public:
    explicit upload_history(std::filesystem::path path);

    auto record(const job_result& result) -> media_upload::result<void> override;

    /**
     * @brief Most recent records first
     */
    [[nodiscard]] auto recent(std::size_t limit = 10) const -> std::vector<history_record>;

    [[nodiscard]] auto stats() const -> history_stats;

    [[nodiscard]] auto clear() -> media_upload::result<void>;

    [[nodiscard]] auto size() const -> std::size_t;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

private:
    void load();
    [[nodiscard]] auto save_locked() -> media_upload::result<void>;

    std::filesystem::path path_;
    mutable std::mutex mutex_;
    std::vector<history_record> records_;
    std::string last_updated_;
};

}  // namespace media_upload

#endif  // MEDIA_UPLOAD_MANAGER_RESULT_SINK_H
