/**
 * @file token_refresher.h
 * @brief Exchange of a refresh token for a new access token
 */

#ifndef MEDIA_UPLOAD_AUTH_TOKEN_REFRESHER_H
#define MEDIA_UPLOAD_AUTH_TOKEN_REFRESHER_H

#include "credential_store.h"
#include "media_upload/core/upload_config.h"
#include "media_upload/transfer/http_client.h"

#include <memory>

namespace media_upload {

/**
 * @brief Performs one refresh-token exchange
 *
 * Implementations do not retry; the session decides what a failure means.
 */
class token_refresher {
public:
    virtual ~token_refresher() = default;

    /**
     * @brief Exchange @p current's refresh token
     * @return The new credential (refresh token carried over unless rotated)
     */
    [[nodiscard]] virtual auto refresh(const credential& current) -> result<credential> = 0;
};

/**
 * @brief OAuth 2.0 refresh_token grant against the credential's token_uri
 */
class oauth_token_refresher : public token_refresher {
public:
    explicit oauth_token_refresher(std::shared_ptr<http_client_interface> http,
                                   clock_function clock = {});

    [[nodiscard]] auto refresh(const credential& current) -> result<credential> override;

private:
    std::shared_ptr<http_client_interface> http_;
    clock_function clock_;
};

}  // namespace media_upload

#endif  // MEDIA_UPLOAD_AUTH_TOKEN_REFRESHER_H
