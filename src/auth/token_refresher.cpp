/**
 * @file token_refresher.cpp
 * @brief Implementation of the OAuth refresh-token exchange
 */

#include "media_upload/auth/token_refresher.h"

#include "media_upload/core/logging.h"
#include "media_upload/transfer/http_utils.h"

#include <map>

namespace media_upload {

oauth_token_refresher::oauth_token_refresher(
    std::shared_ptr<http_client_interface> http,
    clock_function clock)
    : http_(std::move(http)), clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] { return std::chrono::system_clock::now(); };
    }
}

auto oauth_token_refresher::refresh(const credential& current) -> result<credential> {
    if (!current.has_refresh_token()) {
        return unexpected{error{error_code::auth_no_refresh_token}};
    }
    if (!http_) {
        return unexpected{error{error_code::invalid_configuration,
            "no HTTP client configured for token refresh"}};
    }

    std::map<std::string, std::string> form{
        {"grant_type", "refresh_token"},
        {"refresh_token", current.refresh_token},
        {"client_id", current.client_id},
        {"client_secret", current.client_secret},
    };

    http_headers headers;
    headers["Content-Type"] = "application/x-www-form-urlencoded";

    auto requested_at = clock_();
    auto response = http_->post(current.token_uri, http_utils::form_encode(form), headers);
    if (!response.has_value()) {
        return unexpected{error{error_code::auth_refresh_failed,
            "token endpoint unreachable: " + response.error().message}};
    }

    const auto& resp = response.value();
    auto body = resp.get_body_string();
    if (resp.status_code != 200) {
        auto reason = http_utils::extract_json_value(body, "error").value_or(
            "HTTP " + std::to_string(resp.status_code));
        return unexpected{error{error_code::auth_refresh_failed,
            "token refresh rejected: " + reason}};
    }

    auto access_token = http_utils::extract_json_value(body, "access_token");
    if (!access_token || access_token->empty()) {
        return unexpected{error{error_code::auth_refresh_failed,
            "token response has no access_token"}};
    }

    credential refreshed = current;
    refreshed.access_token = http_utils::unescape_json_string(*access_token);
    refreshed.expires_at.reset();

    if (auto expires_in = http_utils::extract_json_value(body, "expires_in")) {
        try {
            refreshed.expires_at = requested_at + std::chrono::seconds(std::stoll(*expires_in));
        } catch (const std::exception&) {
            MU_LOG_WARN(log_category::auth, "Ignoring malformed expires_in: " + *expires_in);
        }
    }

    if (auto rotated = http_utils::extract_json_value(body, "refresh_token")) {
        if (!rotated->empty()) {
            refreshed.refresh_token = http_utils::unescape_json_string(*rotated);
        }
    }

    return refreshed;
}

}  // namespace media_upload
