/**
 * @file media_upload.h
 * @brief Main header for the media_upload library
 * @version 0.1.0
 *
 * Include this header to access the whole upload pipeline.
 *
 * @code
 * #include <media_upload/media_upload.h>
 *
 * using namespace media_upload;
 *
 * auto http = make_network_http_client();
 * auto session = std::make_shared<auth_session>(
 *     std::make_shared<file_credential_store>(default_credentials_directory()),
 *     std::make_shared<oauth_token_refresher>(http));
 *
 * auto manager = upload_manager::builder()
 *     .with_auth_session(session)
 *     .with_transfer_client(std::make_shared<resumable_upload_client>(http))
 *     .build();
 * @endcode
 */

#ifndef MEDIA_UPLOAD_MEDIA_UPLOAD_H
#define MEDIA_UPLOAD_MEDIA_UPLOAD_H

#include <string>

// Core types
#include "media_upload/core/types.h"
#include "media_upload/core/error_codes.h"
#include "media_upload/core/job_types.h"
#include "media_upload/core/upload_config.h"
#include "media_upload/core/validation.h"
#include "media_upload/core/progress_tracker.h"

// Authentication
#include "media_upload/auth/credential_store.h"
#include "media_upload/auth/token_refresher.h"
#include "media_upload/auth/auth_session.h"

// Transfer
#include "media_upload/transfer/http_client.h"
#include "media_upload/transfer/transfer_client.h"
#include "media_upload/transfer/resumable_upload_client.h"

// Orchestration
#include "media_upload/manager/file_organizer.h"
#include "media_upload/manager/result_sink.h"
#include "media_upload/manager/upload_worker.h"
#include "media_upload/manager/upload_manager.h"

namespace media_upload {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace media_upload

#endif  // MEDIA_UPLOAD_MEDIA_UPLOAD_H
