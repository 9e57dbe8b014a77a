/**
 * @file http_client.cpp
 * @brief network_system backed HTTP client
 */

#include "media_upload/transfer/http_client.h"

#include "media_upload/config/feature_flags.h"
#include "media_upload/transfer/http_utils.h"

#if KCENON_WITH_NETWORK_SYSTEM
#include <kcenon/network/core/http_client.h>
#endif

namespace media_upload {

// ============================================================================
// Implementation
// ============================================================================

struct network_http_client::impl {
#if KCENON_WITH_NETWORK_SYSTEM
    std::shared_ptr<kcenon::network::core::http_client> client;
#endif
    bool available = false;

    explicit impl(std::chrono::milliseconds timeout) {
#if KCENON_WITH_NETWORK_SYSTEM
        client = std::make_shared<kcenon::network::core::http_client>(timeout);
        available = true;
#else
        (void)timeout;
        available = false;
#endif
    }

#if KCENON_WITH_NETWORK_SYSTEM
    static auto convert_response(
        const kcenon::network::internal::http_response& resp) -> http_response {
        http_response result;
        result.status_code = resp.status_code;
        result.headers = resp.headers;
        result.body = std::vector<uint8_t>(resp.body.begin(), resp.body.end());
        return result;
    }
#endif
};

namespace {

auto not_available() -> unexpected {
    return unexpected{error{error_code::transfer_failed,
        "HTTP client not available (built without network_system)"}};
}

}  // namespace

// ============================================================================
// Constructor / Destructor
// ============================================================================

network_http_client::network_http_client(std::chrono::milliseconds timeout)
    : impl_(std::make_unique<impl>(timeout)) {}

network_http_client::~network_http_client() = default;

network_http_client::network_http_client(network_http_client&&) noexcept = default;
auto network_http_client::operator=(network_http_client&&) noexcept
    -> network_http_client& = default;

// ============================================================================
// HTTP Operations
// ============================================================================

auto network_http_client::post(
    const std::string& url,
    const std::string& body,
    const http_headers& headers)
    -> result<http_response> {
#if KCENON_WITH_NETWORK_SYSTEM
    if (!impl_->client) {
        return unexpected{error{error_code::internal_error,
            "HTTP client not initialized"}};
    }

    auto response = impl_->client->post(url, body, headers);
    if (response.is_err()) {
        return unexpected{error{error_code::transfer_failed,
            http_utils::request_failure_message("POST", url, response.error().message)}};
    }
    return impl_->convert_response(response.value());
#else
    (void)url;
    (void)body;
    (void)headers;
    return not_available();
#endif
}

auto network_http_client::put(
    const std::string& url,
    const std::vector<uint8_t>& body,
    const http_headers& headers)
    -> result<http_response> {
#if KCENON_WITH_NETWORK_SYSTEM
    if (!impl_->client) {
        return unexpected{error{error_code::internal_error,
            "HTTP client not initialized"}};
    }

    std::string body_str(body.begin(), body.end());
    auto response = impl_->client->put(url, body_str, headers);
    if (response.is_err()) {
        return unexpected{error{error_code::transfer_failed,
            http_utils::request_failure_message("PUT", url, response.error().message)}};
    }
    return impl_->convert_response(response.value());
#else
    (void)url;
    (void)body;
    (void)headers;
    return not_available();
#endif
}

auto network_http_client::del(
    const std::string& url,
    const http_headers& headers)
    -> result<http_response> {
#if KCENON_WITH_NETWORK_SYSTEM
    if (!impl_->client) {
        return unexpected{error{error_code::internal_error,
            "HTTP client not initialized"}};
    }

    auto response = impl_->client->del(url, headers);
    if (response.is_err()) {
        return unexpected{error{error_code::transfer_failed,
            http_utils::request_failure_message("DELETE", url, response.error().message)}};
    }
    return impl_->convert_response(response.value());
#else
    (void)url;
    (void)headers;
    return not_available();
#endif
}

auto network_http_client::is_available() const noexcept -> bool {
    return impl_->available;
}

// ============================================================================
// Factory Function
// ============================================================================

auto make_network_http_client(std::chrono::milliseconds timeout)
    -> std::shared_ptr<network_http_client> {
    return std::make_shared<network_http_client>(timeout);
}

}  // namespace media_upload
