/**
 * @file resumable_upload_client.cpp
 * @brief Implementation of the resumable upload client
 */

#include "media_upload/transfer/resumable_upload_client.h"

#include "media_upload/core/logging.h"
#include "media_upload/core/validation.h"
#include "media_upload/transfer/http_utils.h"

#include <algorithm>
#include <fstream>
#include <sstream>

namespace media_upload {

// ============================================================================
// Error classification
// ============================================================================

auto classify_http_status(int status_code, const std::string& detail) -> error {
    switch (status_code) {
        case 403:
            return error{error_code::transfer_access_denied,
                "access denied / quota: check API quota and permissions"};
        case 400:
            return error{error_code::transfer_invalid_request,
                "invalid request: check file format and metadata"};
        case 413:
            return error{error_code::transfer_payload_too_large,
                "file too large for upload"};
        default:
            return error{error_code::transfer_failed,
                "transfer error: HTTP " + std::to_string(status_code) +
                (detail.empty() ? std::string{} : ": " + detail)};
    }
}

namespace {

constexpr int resume_incomplete = 308;

auto error_detail(const http_response& response) -> std::string {
    auto body = response.get_body_string();
    if (auto message = http_utils::extract_json_value(body, "message")) {
        return http_utils::unescape_json_string(*message);
    }
    return body.substr(0, 200);
}

// ============================================================================
// resumable_session
// ============================================================================

class resumable_session : public upload_session {
public:
    resumable_session(std::shared_ptr<http_client_interface> http,
                      std::string session_uri,
                      std::string access_token,
                      upload_source source,
                      std::size_t chunk_size,
                      std::ifstream file)
        : http_(std::move(http)),
          session_uri_(std::move(session_uri)),
          access_token_(std::move(access_token)),
          source_(std::move(source)),
          chunk_size_(chunk_size),
          file_(std::move(file)) {}

    auto next_chunk() -> result<chunk_status> override {
        if (finished_) {
            return unexpected{error{error_code::transfer_protocol_error,
                "upload session already finished"}};
        }

        auto remaining = source_.size - offset_;
        auto length = static_cast<std::size_t>(
            std::min<uint64_t>(remaining, chunk_size_));

        std::vector<uint8_t> buffer(length);
        if (length > 0) {
            file_.clear();
            file_.seekg(static_cast<std::streamoff>(offset_));
            file_.read(reinterpret_cast<char*>(buffer.data()),
                       static_cast<std::streamsize>(length));
            if (file_.gcount() != static_cast<std::streamsize>(length)) {
                return unexpected{error{error_code::file_read_error,
                    "failed to read " + source_.path.filename().string() +
                    " at offset " + std::to_string(offset_)}};
            }
        }

        http_headers headers;
        headers["Authorization"] = "Bearer " + access_token_;
        headers["Content-Type"] = source_.mime_type;
        headers["Content-Length"] = std::to_string(length);
        if (length > 0) {
            headers["Content-Range"] = "bytes " + std::to_string(offset_) + "-" +
                std::to_string(offset_ + length - 1) + "/" + std::to_string(source_.size);
        } else {
            headers["Content-Range"] = "bytes */" + std::to_string(source_.size);
        }

        auto response = http_->put(session_uri_, buffer, headers);
        if (!response.has_value()) {
            return unexpected{error{error_code::transfer_failed,
                "transfer error: " + response.error().message}};
        }

        const auto& resp = response.value();
        if (resp.status_code == resume_incomplete) {
            auto range = resp.get_header("Range");
            offset_ = range ? http_utils::parse_range_header(*range).value_or(0) : 0;
            return chunk_status{offset_, source_.size, std::nullopt};
        }

        if (resp.status_code == 200 || resp.status_code == 201) {
            auto id = http_utils::extract_json_value(resp.get_body_string(), "id");
            if (!id || id->empty()) {
                return unexpected{error{error_code::transfer_protocol_error,
                    "upload finished without a video id"}};
            }
            offset_ = source_.size;
            finished_ = true;
            return chunk_status{offset_, source_.size, *id};
        }

        upload_log_context ctx;
        ctx.filename = source_.path.filename().string();
        ctx.bytes_sent = offset_;
        ctx.http_status = resp.status_code;
        MU_LOG_WARN_CTX(log_category::transfer, "Chunk upload rejected", ctx);

        finished_ = true;
        return unexpected{classify_http_status(resp.status_code, error_detail(resp))};
    }

    auto abort() -> result<void> override {
        if (finished_) {
            return {};
        }
        finished_ = true;

        http_headers headers;
        headers["Authorization"] = "Bearer " + access_token_;
        auto response = http_->del(session_uri_, headers);
        if (!response.has_value()) {
            return unexpected{response.error()};
        }
        return {};
    }

    auto bytes_sent() const -> uint64_t override { return offset_; }

private:
    std::shared_ptr<http_client_interface> http_;
    std::string session_uri_;
    std::string access_token_;
    upload_source source_;
    std::size_t chunk_size_;
    std::ifstream file_;
    uint64_t offset_ = 0;
    bool finished_ = false;
};

}  // namespace

// ============================================================================
// resumable_upload_client
// ============================================================================

resumable_upload_client::resumable_upload_client(
    std::shared_ptr<http_client_interface> http,
    transfer_config config)
    : http_(std::move(http)), config_(std::move(config)) {}

auto resumable_upload_client::build_initiate_url(const std::string& api_base_url)
    -> std::string {
    return api_base_url + "/upload/youtube/v3/videos?uploadType=resumable&part=snippet,status";
}

auto resumable_upload_client::build_metadata_json(const upload_metadata& metadata)
    -> std::string {
    using http_utils::escape_json_string;

    std::ostringstream oss;
    oss << "{\"snippet\":{"
        << "\"title\":\"" << escape_json_string(metadata.title) << "\","
        << "\"description\":\"" << escape_json_string(metadata.description) << "\","
        << "\"categoryId\":\"" << escape_json_string(metadata.category_id) << "\""
        << "},\"status\":{"
        << "\"privacyStatus\":\"" << escape_json_string(metadata.visibility) << "\"";
    if (metadata.publish_at) {
        oss << ",\"publishAt\":\"" << escape_json_string(*metadata.publish_at) << "\"";
    }
    oss << ",\"selfDeclaredMadeForKids\":false}}";
    return oss.str();
}

auto resumable_upload_client::begin(
    const upload_source& source,
    const upload_metadata& metadata,
    const std::string& access_token)
    -> result<std::unique_ptr<upload_session>> {
    if (metadata.publish_at) {
        auto valid = validate_schedule_format(*metadata.publish_at);
        if (!valid) {
            return unexpected{valid.error()};
        }
    }

    if (!http_) {
        return unexpected{error{error_code::invalid_configuration,
            "no HTTP client configured"}};
    }
    if (config_.chunk_size == 0) {
        return unexpected{error{error_code::invalid_configuration,
            "chunk size must be positive"}};
    }

    std::ifstream file(source.path, std::ios::binary);
    if (!file) {
        return unexpected{error{error_code::file_read_error,
            "cannot open " + source.path.string()}};
    }

    http_headers headers;
    headers["Authorization"] = "Bearer " + access_token;
    headers["Content-Type"] = "application/json; charset=UTF-8";
    headers["X-Upload-Content-Length"] = std::to_string(source.size);
    headers["X-Upload-Content-Type"] = source.mime_type;

    auto response = http_->post(build_initiate_url(config_.api_base_url),
                                build_metadata_json(metadata), headers);
    if (!response.has_value()) {
        return unexpected{error{error_code::transfer_failed,
            "transfer error: " + response.error().message}};
    }

    const auto& resp = response.value();
    if (!resp.is_success()) {
        upload_log_context ctx;
        ctx.filename = source.path.filename().string();
        ctx.http_status = resp.status_code;
        MU_LOG_WARN_CTX(log_category::transfer, "Upload initiation rejected", ctx);
        return unexpected{classify_http_status(resp.status_code, error_detail(resp))};
    }

    auto location = resp.get_header("Location");
    if (!location || location->empty()) {
        return unexpected{error{error_code::transfer_protocol_error,
            "upload initiation returned no session URI"}};
    }

    MU_LOG_DEBUG(log_category::transfer,
        "Resumable session opened for " + source.path.filename().string());

    return std::unique_ptr<upload_session>(std::make_unique<resumable_session>(
        http_, *location, access_token, source, config_.chunk_size, std::move(file)));
}

}  // namespace media_upload
