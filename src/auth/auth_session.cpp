/**
 * @file auth_session.cpp
 * @brief Implementation of auth_session
 */

#include "media_upload/auth/auth_session.h"

#include "media_upload/core/logging.h"

namespace media_upload {

auth_session::auth_session(std::shared_ptr<credential_store> store,
                           std::shared_ptr<token_refresher> refresher,
                           auth_config config)
    : store_(std::move(store)),
      refresher_(std::move(refresher)),
      config_(std::move(config)) {
    if (!store_) {
        return;
    }

    auto loaded = store_->load();
    if (!loaded) {
        MU_LOG_WARN(log_category::auth,
            "Discarding stored credential: " + loaded.error().message);
        if (loaded.error().code == error_code::credential_corrupted) {
            auto removed = store_->remove();
            if (!removed) {
                MU_LOG_ERROR(log_category::auth,
                    "Failed to delete corrupted credential: " + removed.error().message);
            }
        }
        return;
    }

    credential_ = std::move(loaded.value());
    if (credential_) {
        MU_LOG_INFO(log_category::auth, "Restored stored credential");
    }
}

auto auth_session::now() const -> std::chrono::system_clock::time_point {
    return config_.clock ? config_.clock() : std::chrono::system_clock::now();
}

auto auth_session::in_cooldown_locked(std::chrono::system_clock::time_point at) const -> bool {
    return last_refresh_attempt_.has_value() &&
           at - *last_refresh_attempt_ < config_.refresh_cooldown;
}

auto auth_session::is_valid() -> bool {
    std::lock_guard lock(mutex_);

    if (!credential_) {
        return false;
    }

    auto current = now();
    if (!credential_->is_expired(current, config_.expiry_margin)) {
        return true;
    }

    if (!credential_->has_refresh_token()) {
        MU_LOG_WARN(log_category::auth, "Credential expired with no refresh token; logging out");
        logout_locked();
        return false;
    }

    if (in_cooldown_locked(current)) {
        MU_LOG_DEBUG(log_category::auth, "Refresh skipped during cooldown");
        return true;
    }

    return refresh_locked().has_value();
}

auto auth_session::refresh() -> result<void> {
    std::lock_guard lock(mutex_);

    if (!credential_) {
        return unexpected{error{error_code::auth_required, "Not authenticated"}};
    }
    if (!credential_->has_refresh_token()) {
        logout_locked();
        return unexpected{error{error_code::auth_no_refresh_token}};
    }
    return refresh_locked();
}

auto auth_session::refresh_locked() -> result<void> {
    last_refresh_attempt_ = now();
    ++refresh_attempts_;

    if (!refresher_) {
        logout_locked();
        return unexpected{error{error_code::auth_refresh_failed, "no token refresher configured"}};
    }

    MU_LOG_INFO(log_category::auth, "Refreshing access token");
    auto refreshed = refresher_->refresh(*credential_);
    if (!refreshed) {
        MU_LOG_ERROR(log_category::auth,
            "Token refresh failed, session invalidated: " + refreshed.error().message);
        logout_locked();
        return unexpected{error{error_code::auth_refresh_failed, refreshed.error().message}};
    }

    credential_ = std::move(refreshed.value());
    if (store_) {
        auto saved = store_->save(*credential_);
        if (!saved) {
            MU_LOG_WARN(log_category::auth,
                "Refreshed credential not persisted: " + saved.error().message);
        }
    }
    return {};
}

auto auth_session::get_credential() -> std::optional<credential> {
    if (!is_valid()) {
        return std::nullopt;
    }
    std::lock_guard lock(mutex_);
    return credential_;
}

auto auth_session::establish(credential cred) -> result<void> {
    std::lock_guard lock(mutex_);

    if (cred.access_token.empty()) {
        return unexpected{error{error_code::auth_required, "credential has no access token"}};
    }

    credential_ = std::move(cred);
    last_refresh_attempt_.reset();
    MU_LOG_INFO(log_category::auth, "Credential established");

    if (store_) {
        return store_->save(*credential_);
    }
    return {};
}

void auth_session::logout() {
    std::lock_guard lock(mutex_);
    logout_locked();
}

void auth_session::logout_locked() {
    credential_.reset();
    if (store_) {
        auto removed = store_->remove();
        if (!removed) {
            MU_LOG_ERROR(log_category::auth,
                "Failed to delete stored credential: " + removed.error().message);
        }
    }
}

auto auth_session::is_authenticated() const -> bool {
    std::lock_guard lock(mutex_);
    if (!credential_) {
        return false;
    }
    return !credential_->is_expired(now(), config_.expiry_margin) ||
           credential_->has_refresh_token();
}

auto auth_session::refresh_attempts() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return refresh_attempts_;
}

}  // namespace media_upload
