/**
 * @file auth_session.h
 * @brief Bearer credential lifecycle shared by all upload workers
 */

#ifndef MEDIA_UPLOAD_AUTH_AUTH_SESSION_H
#define MEDIA_UPLOAD_AUTH_AUTH_SESSION_H

#include "credential_store.h"
#include "token_refresher.h"
#include "media_upload/core/upload_config.h"

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>

namespace media_upload {

/**
 * @brief Owns the current credential and refreshes it on demand
 *
 * Every worker calls is_valid() before it starts sending. Refreshes are
 * serialized by the session mutex, and at most one refresh attempt is made
 * per cooldown window no matter how many workers notice the expiry.
 *
 * While the cooldown is active an expired credential is still reported
 * as valid. The remote API then decides whether the token is accepted.
 *
 * Thread-safe.
 */
class auth_session {
public:
    /**
     * @param store Persistent store; the stored credential is loaded here
     * @param refresher Refresh-token exchange
     * @param config Cooldown, expiry margin and clock
     */
    auth_session(std::shared_ptr<credential_store> store,
                 std::shared_ptr<token_refresher> refresher,
                 auth_config config = {});

    auth_session(const auth_session&) = delete;
    auto operator=(const auth_session&) -> auth_session& = delete;

    /**
     * @brief Whether a usable credential is available, refreshing if needed
     */
    [[nodiscard]] auto is_valid() -> bool;

    /**
     * @brief Exchange the refresh token now
     *
     * Records a refresh attempt. On failure the session is logged out.
     */
    [[nodiscard]] auto refresh() -> result<void>;

    /**
     * @brief Current credential when is_valid() holds
     */
    [[nodiscard]] auto get_credential() -> std::optional<credential>;

    /**
     * @brief Adopt a freshly obtained credential and persist it
     */
    [[nodiscard]] auto establish(credential cred) -> result<void>;

    /**
     * @brief Drop the credential from memory and from the store
     */
    void logout();

    /**
     * @brief Whether a credential is held that is either unexpired or refreshable
     *
     * Never triggers a refresh.
     */
    [[nodiscard]] auto is_authenticated() const -> bool;

    [[nodiscard]] auto refresh_attempts() const -> std::size_t;

    [[nodiscard]] auto config() const -> const auth_config& { return config_; }

private:
    [[nodiscard]] auto now() const -> std::chrono::system_clock::time_point;
    [[nodiscard]] auto in_cooldown_locked(std::chrono::system_clock::time_point at) const -> bool;
    [[nodiscard]] auto refresh_locked() -> result<void>;
    void logout_locked();

    std::shared_ptr<credential_store> store_;
    std::shared_ptr<token_refresher> refresher_;
    auth_config config_;

    mutable std::mutex mutex_;
    std::optional<credential> credential_;
    std::optional<std::chrono::system_clock::time_point> last_refresh_attempt_;
    std::size_t refresh_attempts_ = 0;
};

}  // namespace media_upload

#endif  // MEDIA_UPLOAD_AUTH_AUTH_SESSION_H
