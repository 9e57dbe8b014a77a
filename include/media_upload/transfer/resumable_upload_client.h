/**
 * @file resumable_upload_client.h
 * @brief YouTube Data API v3 resumable upload client
 */

#ifndef MEDIA_UPLOAD_TRANSFER_RESUMABLE_UPLOAD_CLIENT_H
#define MEDIA_UPLOAD_TRANSFER_RESUMABLE_UPLOAD_CLIENT_H

#include "http_client.h"
#include "transfer_client.h"
#include "media_upload/core/upload_config.h"

#include <memory>
#include <string>

namespace media_upload {

/**
 * @brief transfer_client speaking the resumable upload protocol
 *
 * Protocol:
 * 1. POST {api_base_url}/upload/youtube/v3/videos?uploadType=resumable&part=snippet,status
 *    with the JSON metadata; the session URI comes back in Location.
 * 2. PUT each chunk to the session URI with Content-Range. 308 means more
 *    is expected (Range tells how much was stored); 200/201 carries the
 *    created video resource.
 *
 * Usage:
 * @code
 * auto client = std::make_shared<resumable_upload_client>(
 *     make_network_http_client(), transfer_config{});
 * auto session = client->begin(source, metadata, token);
 * @endcode
 */
class resumable_upload_client : public transfer_client {
public:
    resumable_upload_client(std::shared_ptr<http_client_interface> http,
                            transfer_config config = {});

    [[nodiscard]] auto begin(
        const upload_source& source,
        const upload_metadata& metadata,
        const std::string& access_token)
        -> result<std::unique_ptr<upload_session>> override;

    [[nodiscard]] auto config() const -> const transfer_config& { return config_; }

    /**
     * @brief JSON request body for the given metadata
     */
    [[nodiscard]] static auto build_metadata_json(const upload_metadata& metadata) -> std::string;

    /**
     * @brief Upload initiation URL for an API base
     */
    [[nodiscard]] static auto build_initiate_url(const std::string& api_base_url) -> std::string;

private:
    std::shared_ptr<http_client_interface> http_;
    transfer_config config_;
};

}  // namespace media_upload

#endif  // MEDIA_UPLOAD_TRANSFER_RESUMABLE_UPLOAD_CLIENT_H
