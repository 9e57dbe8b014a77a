/**
 * @file http_client.h
 * @brief HTTP seam used by the upload and token clients
 *
 * http_client_interface is what the transfer and auth layers talk to;
 * tests replace it with a scripted mock. network_http_client is the
 * production implementation backed by network_system.
 */

#ifndef MEDIA_UPLOAD_TRANSFER_HTTP_CLIENT_H
#define MEDIA_UPLOAD_TRANSFER_HTTP_CLIENT_H

#include "media_upload/core/types.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// Forward declaration for network_system HTTP client
namespace kcenon::network::core {
class http_client;
}

namespace media_upload {

/**
 * @brief HTTP response as seen by the upload layers
 */
struct http_response {
    /// HTTP status code
    int status_code = 0;

    /// Response headers
    std::map<std::string, std::string> headers;

    /// Response body
    std::vector<uint8_t> body;

    [[nodiscard]] auto get_body_string() const -> std::string {
        return std::string(body.begin(), body.end());
    }

    /**
     * @brief Get header value by key (case-insensitive)
     */
    [[nodiscard]] auto get_header(const std::string& key) const
        -> std::optional<std::string> {
        auto it = headers.find(key);
        if (it != headers.end()) {
            return it->second;
        }

        auto lower = [](std::string value) {
            std::transform(value.begin(), value.end(), value.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return value;
        };

        auto lower_key = lower(key);
        for (const auto& [k, v] : headers) {
            if (lower(k) == lower_key) {
                return v;
            }
        }
        return std::nullopt;
    }

    [[nodiscard]] auto is_success() const -> bool {
        return status_code >= 200 && status_code < 300;
    }
};

using http_headers = std::map<std::string, std::string>;

/**
 * @brief Abstract HTTP client
 *
 * A returned error means the request never produced an HTTP response
 * (DNS, connect, TLS, timeout). Any response, including 4xx and 5xx, is
 * returned as a value.
 */
class http_client_interface {
public:
    virtual ~http_client_interface() = default;

    virtual auto post(
        const std::string& url,
        const std::string& body,
        const http_headers& headers)
        -> result<http_response> = 0;

    virtual auto put(
        const std::string& url,
        const std::vector<uint8_t>& body,
        const http_headers& headers)
        -> result<http_response> = 0;

    virtual auto del(
        const std::string& url,
        const http_headers& headers)
        -> result<http_response> = 0;
};

/**
 * @brief HTTP client backed by network_system
 *
 * When the library is built without network_system every call returns
 * an error; is_available() reports which case applies.
 */
class network_http_client : public http_client_interface {
public:
    /**
     * @brief Construct HTTP client with timeout
     * @param timeout Request timeout duration
     */
    explicit network_http_client(
        std::chrono::milliseconds timeout = std::chrono::milliseconds(300000));

    ~network_http_client() override;

    network_http_client(const network_http_client&) = delete;
    auto operator=(const network_http_client&) -> network_http_client& = delete;
    network_http_client(network_http_client&&) noexcept;
    auto operator=(network_http_client&&) noexcept -> network_http_client&;

    [[nodiscard]] auto post(
        const std::string& url,
        const std::string& body,
        const http_headers& headers)
        -> result<http_response> override;

    [[nodiscard]] auto put(
        const std::string& url,
        const std::vector<uint8_t>& body,
        const http_headers& headers)
        -> result<http_response> override;

    [[nodiscard]] auto del(
        const std::string& url,
        const http_headers& headers)
        -> result<http_response> override;

    /**
     * @brief Whether a real transport is compiled in
     */
    [[nodiscard]] auto is_available() const noexcept -> bool;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

[[nodiscard]] auto make_network_http_client(
    std::chrono::milliseconds timeout = std::chrono::milliseconds(300000))
    -> std::shared_ptr<network_http_client>;

}  // namespace media_upload

#endif  // MEDIA_UPLOAD_TRANSFER_HTTP_CLIENT_H
