/**
 * @file http_utils.h
 * @brief Encoding, JSON and hashing helpers shared by the HTTP clients
 */

#ifndef MEDIA_UPLOAD_TRANSFER_HTTP_UTILS_H
#define MEDIA_UPLOAD_TRANSFER_HTTP_UTILS_H

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace media_upload::http_utils {

// ============================================================================
// Encoding Utilities
// ============================================================================

[[nodiscard]] auto bytes_to_hex(const std::vector<uint8_t>& bytes) -> std::string;

/**
 * @brief Percent-encode a value (RFC 3986 unreserved characters pass through)
 */
[[nodiscard]] auto url_encode(const std::string& value) -> std::string;

/**
 * @brief Build an application/x-www-form-urlencoded body
 */
[[nodiscard]] auto form_encode(const std::map<std::string, std::string>& fields) -> std::string;

// ============================================================================
// JSON Utilities
// ============================================================================

[[nodiscard]] auto escape_json_string(const std::string& s) -> std::string;

[[nodiscard]] auto unescape_json_string(const std::string& s) -> std::string;

/**
 * @brief Extract the first value stored under @p key
 *
 * String values are returned without quotes and still escaped; numbers
 * and literals are returned as written.
 */
[[nodiscard]] auto extract_json_value(const std::string& json,
                                      const std::string& key) -> std::optional<std::string>;

/**
 * @brief Extract the raw text of the array stored under @p key, brackets included
 */
[[nodiscard]] auto extract_json_array(const std::string& json,
                                      const std::string& key) -> std::optional<std::string>;

/**
 * @brief Split a JSON array of objects into the raw text of each object
 */
[[nodiscard]] auto split_json_objects(const std::string& array) -> std::vector<std::string>;

// ============================================================================
// Upload Protocol Utilities
// ============================================================================

/**
 * @brief MIME type of a video file from its extension, "video/*" when unknown
 */
[[nodiscard]] auto detect_video_content_type(const std::filesystem::path& path) -> std::string;

/**
 * @brief Bytes acknowledged by a "Range: bytes=0-N" header (N + 1)
 */
[[nodiscard]] auto parse_range_header(std::string_view value) -> std::optional<uint64_t>;

/**
 * @brief "HTTP <method> request failed: <url>: <cause>"
 *
 * An empty @p cause is left out.
 */
[[nodiscard]] auto request_failure_message(std::string_view method,
                                           std::string_view url,
                                           std::string_view cause) -> std::string;

// ============================================================================
// Cryptographic Utilities
// ============================================================================

[[nodiscard]] auto sha256(const std::string& data) -> std::vector<uint8_t>;

[[nodiscard]] auto sha256_hex(const std::string& data) -> std::string;

}  // namespace media_upload::http_utils

#endif  // MEDIA_UPLOAD_TRANSFER_HTTP_UTILS_H
