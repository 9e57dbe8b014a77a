/**
 * @file upload_history.cpp
 * @brief JSON file backed upload history
 */

#include "media_upload/manager/result_sink.h"

#include "media_upload/core/atomic_file.h"
#include "media_upload/core/logging.h"
#include "media_upload/core/validation.h"
#include "media_upload/transfer/http_utils.h"

#include <algorithm>
#include <sstream>
#include <system_error>

namespace media_upload {

namespace {

auto serialize_record(const history_record& rec) -> std::string {
    using http_utils::escape_json_string;

    std::ostringstream oss;
    oss << "    {\n";
    oss << "      \"original_file\": \"" << escape_json_string(rec.original_file) << "\",\n";
    oss << "      \"title\": \"" << escape_json_string(rec.title) << "\",\n";
    oss << "      \"video_url\": \"" << escape_json_string(rec.video_url) << "\",\n";
    oss << "      \"video_id\": \"" << escape_json_string(rec.video_id) << "\",\n";
    oss << "      \"date\": \"" << escape_json_string(rec.date) << "\",\n";
    oss << "      \"status\": \"" << escape_json_string(rec.status) << "\",\n";
    oss << "      \"message\": \"" << escape_json_string(rec.message) << "\"\n";
    oss << "    }";
    return oss.str();
}

auto field(const std::string& json, const std::string& key) -> std::string {
    auto value = http_utils::extract_json_value(json, key);
    return value ? http_utils::unescape_json_string(*value) : std::string{};
}

auto deserialize_record(const std::string& json) -> history_record {
    history_record rec;
    rec.original_file = field(json, "original_file");
    rec.title = field(json, "title");
    rec.video_url = field(json, "video_url");
    rec.video_id = field(json, "video_id");
    rec.date = field(json, "date");
    rec.status = field(json, "status");
    rec.message = field(json, "message");
    return rec;
}

}  // namespace

upload_history::upload_history(std::filesystem::path path)
    : path_(std::move(path)) {
    load();
}

void upload_history::load() {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        return;
    }

    auto content = read_file(path_);
    if (!content) {
        MU_LOG_WARN(log_category::history,
            "Could not read upload history: " + content.error().message);
        return;
    }

    auto uploads = http_utils::extract_json_array(content.value(), "uploads");
    if (!uploads) {
        MU_LOG_WARN(log_category::history, "Upload history has no uploads array; starting fresh");
        return;
    }

    for (const auto& object : http_utils::split_json_objects(*uploads)) {
        records_.push_back(deserialize_record(object));
    }
    last_updated_ = field(content.value(), "last_updated");

    MU_LOG_DEBUG(log_category::history,
        "Loaded " + std::to_string(records_.size()) + " history records");
}

auto upload_history::save_locked() -> media_upload::result<void> {
    if (path_.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) {
            return unexpected(error(error_code::internal_error,
                "failed to create " + path_.parent_path().string() + ": " + ec.message()));
        }
    }

    last_updated_ = format_rfc3339_utc(std::chrono::system_clock::now());

    std::ostringstream oss;
    oss << "{\n  \"uploads\": [";
    for (std::size_t i = 0; i < records_.size(); ++i) {
        oss << (i == 0 ? "\n" : ",\n") << serialize_record(records_[i]);
    }
    oss << (records_.empty() ? "],\n" : "\n  ],\n");
    oss << "  \"last_updated\": \"" << last_updated_ << "\"\n}\n";

    return write_file_atomically(path_, oss.str());
}

auto upload_history::record(const job_result& result) -> media_upload::result<void> {
    history_record rec;
    rec.original_file = result.resource.string();
    rec.title = result.title;
    rec.video_id = result.video_id.value_or("");
    rec.video_url = result.video_url;
    rec.date = format_rfc3339_utc(result.finished_at);
    rec.status = to_string(result.state);
    rec.message = result.message;

    std::lock_guard lock(mutex_);
    records_.push_back(std::move(rec));

    auto saved = save_locked();
    if (!saved) {
        MU_LOG_ERROR(log_category::history,
            "Failed to save upload history: " + saved.error().message);
    }
    return saved;
}

auto upload_history::recent(std::size_t limit) const -> std::vector<history_record> {
    std::lock_guard lock(mutex_);

    auto count = std::min(limit, records_.size());
    return std::vector<history_record>(records_.rbegin(), records_.rbegin() + static_cast<std::ptrdiff_t>(count));
}

auto upload_history::stats() const -> history_stats {
    std::lock_guard lock(mutex_);

    history_stats stats;
    stats.total_uploads = records_.size();
    for (const auto& rec : records_) {
        if (rec.status == to_string(job_state::completed)) {
            ++stats.completed;
        } else {
            ++stats.failed;
        }
    }
    if (!records_.empty()) {
        stats.last_upload = records_.back().date;
    }
    return stats;
}

auto upload_history::clear() -> media_upload::result<void> {
    std::lock_guard lock(mutex_);
    records_.clear();
    return save_locked();
}

auto upload_history::size() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return records_.size();
}

}  // namespace media_upload
