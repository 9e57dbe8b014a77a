/**
 * @file http_utils.cpp
 * @brief Implementation of the HTTP helper functions
 */

#include "media_upload/transfer/http_utils.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <iomanip>
#include <sstream>
#include <unordered_map>

#include <openssl/evp.h>
#include <openssl/sha.h>

namespace media_upload::http_utils {

// ============================================================================
// Encoding Utilities
// ============================================================================

auto bytes_to_hex(const std::vector<uint8_t>& bytes) -> std::string {
    std::ostringstream oss;
    for (auto byte : bytes) {
        oss << std::hex << std::setfill('0') << std::setw(2)
            << static_cast<int>(byte);
    }
    return oss.str();
}

auto url_encode(const std::string& value) -> std::string {
    std::ostringstream escaped;
    escaped.fill('0');
    escaped << std::hex;

    for (char c : value) {
        if (std::isalnum(static_cast<unsigned char>(c)) ||
            c == '-' || c == '_' || c == '.' || c == '~') {
            escaped << c;
        } else {
            escaped << '%' << std::setw(2) << std::uppercase
                    << static_cast<int>(static_cast<unsigned char>(c));
        }
    }

    return escaped.str();
}

auto form_encode(const std::map<std::string, std::string>& fields) -> std::string {
    std::string body;
    for (const auto& [name, value] : fields) {
        if (!body.empty()) {
            body += '&';
        }
        body += url_encode(name) + "=" + url_encode(value);
    }
    return body;
}

// ============================================================================
// JSON Utilities
// ============================================================================

auto escape_json_string(const std::string& s) -> std::string {
    std::ostringstream o;
    for (auto c : s) {
        switch (c) {
            case '"': o << "\\\""; break;
            case '\\': o << "\\\\"; break;
            case '\b': o << "\\b"; break;
            case '\f': o << "\\f"; break;
            case '\n': o << "\\n"; break;
            case '\r': o << "\\r"; break;
            case '\t': o << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    o << "\\u" << std::hex << std::setw(4)
                      << std::setfill('0') << static_cast<int>(c) << std::dec;
                } else {
                    o << c;
                }
        }
    }
    return o.str();
}

auto unescape_json_string(const std::string& s) -> std::string {
    std::string result;
    result.reserve(s.size());

    for (std::size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '\\' && i + 1 < s.size()) {
            switch (s[i + 1]) {
                case '"': result += '"'; ++i; break;
                case '\\': result += '\\'; ++i; break;
                case '/': result += '/'; ++i; break;
                case 'b': result += '\b'; ++i; break;
                case 'f': result += '\f'; ++i; break;
                case 'n': result += '\n'; ++i; break;
                case 'r': result += '\r'; ++i; break;
                case 't': result += '\t'; ++i; break;
                case 'u':
                    if (i + 5 < s.size()) {
                        unsigned int code = 0;
                        auto begin = s.data() + i + 2;
                        auto [ptr, ec] = std::from_chars(begin, begin + 4, code, 16);
                        if (ec == std::errc{} && ptr == begin + 4 && code < 0x80) {
                            result += static_cast<char>(code);
                        } else {
                            result += '?';
                        }
                        i += 5;
                    } else {
                        result += s[i];
                    }
                    break;
                default: result += s[i]; break;
            }
        } else {
            result += s[i];
        }
    }
    return result;
}

namespace {

auto find_string_end(const std::string& json, std::size_t open_quote) -> std::size_t {
    auto pos = open_quote + 1;
    while (pos < json.size()) {
        if (json[pos] == '\\') {
            pos += 2;
            continue;
        }
        if (json[pos] == '"') {
            return pos;
        }
        ++pos;
    }
    return std::string::npos;
}

auto find_value_start(const std::string& json, const std::string& key) -> std::size_t {
    std::string search = "\"" + key + "\"";
    auto pos = json.find(search);
    if (pos == std::string::npos) {
        return std::string::npos;
    }

    pos = json.find(':', pos + search.length());
    if (pos == std::string::npos) {
        return std::string::npos;
    }

    return json.find_first_not_of(" \t\n\r", pos + 1);
}

}  // namespace

auto extract_json_value(const std::string& json,
                        const std::string& key) -> std::optional<std::string> {
    auto pos = find_value_start(json, key);
    if (pos == std::string::npos) {
        return std::nullopt;
    }

    if (json[pos] == '"') {
        auto end_pos = find_string_end(json, pos);
        if (end_pos == std::string::npos) {
            return std::nullopt;
        }
        return json.substr(pos + 1, end_pos - pos - 1);
    }

    auto end_pos = json.find_first_of(",}]\n", pos);
    if (end_pos == std::string::npos) {
        end_pos = json.size();
    }
    auto value = json.substr(pos, end_pos - pos);
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
        value.pop_back();
    }
    return value;
}

auto extract_json_array(const std::string& json,
                        const std::string& key) -> std::optional<std::string> {
    auto pos = find_value_start(json, key);
    if (pos == std::string::npos || json[pos] != '[') {
        return std::nullopt;
    }

    int depth = 0;
    for (auto i = pos; i < json.size(); ++i) {
        char c = json[i];
        if (c == '"') {
            i = find_string_end(json, i);
            if (i == std::string::npos) {
                return std::nullopt;
            }
            continue;
        }
        if (c == '[' || c == '{') {
            ++depth;
        } else if (c == ']' || c == '}') {
            --depth;
            if (depth == 0) {
                return json.substr(pos, i - pos + 1);
            }
        }
    }
    return std::nullopt;
}

auto split_json_objects(const std::string& array) -> std::vector<std::string> {
    std::vector<std::string> objects;
    int depth = 0;
    std::size_t start = std::string::npos;

    for (std::size_t i = 0; i < array.size(); ++i) {
        char c = array[i];
        if (c == '"') {
            i = find_string_end(array, i);
            if (i == std::string::npos) {
                break;
            }
            continue;
        }
        if (c == '{') {
            if (depth == 0) {
                start = i;
            }
            ++depth;
        } else if (c == '}') {
            --depth;
            if (depth == 0 && start != std::string::npos) {
                objects.push_back(array.substr(start, i - start + 1));
                start = std::string::npos;
            }
        }
    }
    return objects;
}

// ============================================================================
// Upload Protocol Utilities
// ============================================================================

auto detect_video_content_type(const std::filesystem::path& path) -> std::string {
    static const std::unordered_map<std::string, std::string> mime_types = {
        {".mp4", "video/mp4"},
        {".m4v", "video/mp4"},
        {".mov", "video/quicktime"},
        {".avi", "video/x-msvideo"},
        {".wmv", "video/x-ms-wmv"},
        {".flv", "video/x-flv"},
        {".webm", "video/webm"},
        {".mkv", "video/x-matroska"},
    };

    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto it = mime_types.find(ext);
    if (it != mime_types.end()) {
        return it->second;
    }
    return "video/*";
}

auto parse_range_header(std::string_view value) -> std::optional<uint64_t> {
    auto dash = value.rfind('-');
    if (dash == std::string_view::npos || dash + 1 >= value.size()) {
        return std::nullopt;
    }

    auto digits = value.substr(dash + 1);
    uint64_t last_byte = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), last_byte);
    if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
        return std::nullopt;
    }
    return last_byte + 1;
}

auto request_failure_message(std::string_view method,
                             std::string_view url,
                             std::string_view cause) -> std::string {
    std::string message = "HTTP ";
    message.append(method);
    message += " request failed: ";
    message.append(url);
    if (!cause.empty()) {
        message += ": ";
        message.append(cause);
    }
    return message;
}

// ============================================================================
// Cryptographic Utilities
// ============================================================================

auto sha256(const std::string& data) -> std::vector<uint8_t> {
    std::vector<uint8_t> hash(SHA256_DIGEST_LENGTH);
    unsigned int length = 0;

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (ctx == nullptr) {
        return {};
    }
    bool ok = EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) == 1 &&
              EVP_DigestUpdate(ctx, data.data(), data.size()) == 1 &&
              EVP_DigestFinal_ex(ctx, hash.data(), &length) == 1;
    EVP_MD_CTX_free(ctx);

    if (!ok) {
        return {};
    }
    hash.resize(length);
    return hash;
}

auto sha256_hex(const std::string& data) -> std::string {
    return bytes_to_hex(sha256(data));
}

}  // namespace media_upload::http_utils
