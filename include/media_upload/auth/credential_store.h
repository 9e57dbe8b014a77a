/**
 * @file credential_store.h
 * @brief Bearer credential and its persistent store
 */

#ifndef MEDIA_UPLOAD_AUTH_CREDENTIAL_STORE_H
#define MEDIA_UPLOAD_AUTH_CREDENTIAL_STORE_H

#include "media_upload/core/types.h"

#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace media_upload {

/**
 * @brief OAuth bearer credential with its refresh metadata
 */
struct credential {
    std::string access_token;
    std::string refresh_token;
    std::optional<std::chrono::system_clock::time_point> expires_at;
    std::string token_uri = "https://oauth2.googleapis.com/token";
    std::string client_id;
    std::string client_secret;
    std::vector<std::string> scopes;

    [[nodiscard]] auto has_refresh_token() const -> bool { return !refresh_token.empty(); }

    /**
     * @brief Whether the access token is unusable at @p now
     *
     * A credential without an expiry never expires.
     */
    [[nodiscard]] auto is_expired(std::chrono::system_clock::time_point now,
                                  std::chrono::seconds margin = std::chrono::seconds{0}) const -> bool {
        if (access_token.empty()) {
            return true;
        }
        return expires_at.has_value() && *expires_at - margin <= now;
    }
};

/**
 * @brief Persistent storage for one credential blob
 */
class credential_store {
public:
    virtual ~credential_store() = default;

    /**
     * @brief Load the stored credential
     * @return nullopt when nothing is stored; credential_corrupted when the
     *         blob fails its integrity check
     */
    [[nodiscard]] virtual auto load() -> result<std::optional<credential>> = 0;

    /**
     * @brief Replace the stored credential atomically
     */
    [[nodiscard]] virtual auto save(const credential& cred) -> result<void> = 0;

    /**
     * @brief Delete the stored credential (no-op when absent)
     */
    [[nodiscard]] virtual auto remove() -> result<void> = 0;
};

/**
 * @brief Credential store backed by a JSON file in a private directory
 *
 * The directory is created with owner-only permissions (0700) and the
 * blob with 0600. Writes go to a temporary file that is renamed over the
 * previous blob. The blob carries a SHA-256 digest of its payload.
 */
class file_credential_store : public credential_store {
public:
    explicit file_credential_store(std::filesystem::path directory);

    [[nodiscard]] auto load() -> result<std::optional<credential>> override;
    [[nodiscard]] auto save(const credential& cred) -> result<void> override;
    [[nodiscard]] auto remove() -> result<void> override;

    [[nodiscard]] auto directory() const -> const std::filesystem::path& { return directory_; }
    [[nodiscard]] auto blob_path() const -> std::filesystem::path;

    /**
     * @brief Serialize a credential to the on-disk JSON form
     */
    [[nodiscard]] static auto serialize(const credential& cred) -> std::string;

    /**
     * @brief Parse the on-disk JSON form, verifying its digest
     */
    [[nodiscard]] static auto deserialize(const std::string& json) -> result<credential>;

private:
    [[nodiscard]] auto ensure_directory() -> result<void>;

    std::filesystem::path directory_;
    std::mutex mutex_;
};

}  // namespace media_upload

#endif  // MEDIA_UPLOAD_AUTH_CREDENTIAL_STORE_H
