/**
 * @file transfer_client.h
 * @brief Chunked resumable transfer abstraction
 *
 * A transfer_client opens one upload_session per file. The worker then
 * pulls chunks through the session until it reports completion, an error,
 * or the worker decides to stop.
 */

#ifndef MEDIA_UPLOAD_TRANSFER_TRANSFER_CLIENT_H
#define MEDIA_UPLOAD_TRANSFER_TRANSFER_CLIENT_H

#include "media_upload/core/types.h"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace media_upload {

/**
 * @brief Local file handed to the transfer client
 */
struct upload_source {
    std::filesystem::path path;
    uint64_t size = 0;
    std::string mime_type = "video/*";
};

/**
 * @brief Metadata body of the upload request
 */
struct upload_metadata {
    std::string title;
    std::string description;
    std::string visibility = "private";
    std::optional<std::string> publish_at;  ///< RFC3339 UTC with trailing Z
    std::string category_id = "22";
};

/**
 * @brief Result of sending one chunk
 */
struct chunk_status {
    uint64_t bytes_sent = 0;    ///< Cumulative bytes acknowledged
    uint64_t total_bytes = 0;
    std::optional<std::string> remote_id;  ///< Set once the upload is complete

    [[nodiscard]] auto is_complete() const -> bool { return remote_id.has_value(); }
};

/**
 * @brief Classify a failed HTTP response into a typed transfer error
 *
 * 403 -> transfer_access_denied, 400 -> transfer_invalid_request,
 * 413 -> transfer_payload_too_large, anything else -> transfer_failed with
 * @p detail preserved in the message.
 */
[[nodiscard]] auto classify_http_status(int status_code, const std::string& detail) -> error;

/**
 * @brief One in-progress resumable upload
 */
class upload_session {
public:
    virtual ~upload_session() = default;

    /**
     * @brief Send the next chunk
     * @return Cumulative status, with remote_id set when the upload is done
     */
    [[nodiscard]] virtual auto next_chunk() -> result<chunk_status> = 0;

    /**
     * @brief Discard the remote session (best effort)
     */
    virtual auto abort() -> result<void> = 0;

    [[nodiscard]] virtual auto bytes_sent() const -> uint64_t = 0;
};

/**
 * @brief Factory of upload sessions
 *
 * Implementations must reject a malformed publish_at before sending
 * anything and must not retry failed requests.
 */
class transfer_client {
public:
    virtual ~transfer_client() = default;

    /**
     * @brief Initiate a resumable upload
     * @param source File to send
     * @param metadata Video metadata
     * @param access_token Bearer token for the request
     */
    [[nodiscard]] virtual auto begin(
        const upload_source& source,
        const upload_metadata& metadata,
        const std::string& access_token)
        -> result<std::unique_ptr<upload_session>> = 0;
};

}  // namespace media_upload

#endif  // MEDIA_UPLOAD_TRANSFER_TRANSFER_CLIENT_H
