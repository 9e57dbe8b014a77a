/**
 * @file credential_store.cpp
 * @brief Implementation of file_credential_store
 */

#include "media_upload/auth/credential_store.h"

#include "media_upload/core/atomic_file.h"
#include "media_upload/core/logging.h"
#include "media_upload/transfer/http_utils.h"

#include <sstream>
#include <system_error>

namespace media_upload {

namespace {

constexpr const char* blob_name = "credentials.json";
constexpr int blob_version = 1;

auto time_point_to_int64(std::chrono::system_clock::time_point tp) -> int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count();
}

auto int64_to_time_point(int64_t ms) -> std::chrono::system_clock::time_point {
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
}

auto join_scopes(const std::vector<std::string>& scopes) -> std::string {
    std::string joined;
    for (const auto& scope : scopes) {
        if (!joined.empty()) {
            joined += ' ';
        }
        joined += scope;
    }
    return joined;
}

auto split_scopes(const std::string& joined) -> std::vector<std::string> {
    std::vector<std::string> scopes;
    std::istringstream iss(joined);
    std::string scope;
    while (iss >> scope) {
        scopes.push_back(scope);
    }
    return scopes;
}

/**
 * @brief Canonical payload text; the digest is computed over exactly this
 */
auto serialize_payload(const credential& cred) -> std::string {
    using http_utils::escape_json_string;

    std::ostringstream oss;
    oss << "{";
    oss << "\"access_token\": \"" << escape_json_string(cred.access_token) << "\", ";
    oss << "\"refresh_token\": \"" << escape_json_string(cred.refresh_token) << "\", ";
    oss << "\"expires_at\": "
        << (cred.expires_at ? time_point_to_int64(*cred.expires_at) : int64_t{-1}) << ", ";
    oss << "\"token_uri\": \"" << escape_json_string(cred.token_uri) << "\", ";
    oss << "\"client_id\": \"" << escape_json_string(cred.client_id) << "\", ";
    oss << "\"client_secret\": \"" << escape_json_string(cred.client_secret) << "\", ";
    oss << "\"scopes\": \"" << escape_json_string(join_scopes(cred.scopes)) << "\"";
    oss << "}";
    return oss.str();
}

auto string_field(const std::string& json, const std::string& key) -> std::string {
    auto value = http_utils::extract_json_value(json, key);
    return value ? http_utils::unescape_json_string(*value) : std::string{};
}

}  // namespace

// ============================================================================
// Serialization
// ============================================================================

auto file_credential_store::serialize(const credential& cred) -> std::string {
    auto payload = serialize_payload(cred);

    std::ostringstream oss;
    oss << "{\n";
    oss << "  \"version\": " << blob_version << ",\n";
    oss << "  \"credential\": " << payload << ",\n";
    oss << "  \"sha256\": \"" << http_utils::sha256_hex(payload) << "\"\n";
    oss << "}\n";
    return oss.str();
}

auto file_credential_store::deserialize(const std::string& json) -> result<credential> {
    auto digest = http_utils::extract_json_value(json, "sha256");
    if (!digest || digest->empty()) {
        return unexpected(error(error_code::credential_corrupted,
            "credential blob has no digest"));
    }

    credential cred;
    cred.access_token = string_field(json, "access_token");
    cred.refresh_token = string_field(json, "refresh_token");
    cred.token_uri = string_field(json, "token_uri");
    cred.client_id = string_field(json, "client_id");
    cred.client_secret = string_field(json, "client_secret");
    cred.scopes = split_scopes(string_field(json, "scopes"));

    auto expires = http_utils::extract_json_value(json, "expires_at");
    if (!expires) {
        return unexpected(error(error_code::credential_corrupted,
            "credential blob has no expiry field"));
    }
    try {
        auto expires_ms = std::stoll(*expires);
        if (expires_ms >= 0) {
            cred.expires_at = int64_to_time_point(expires_ms);
        }
    } catch (const std::exception&) {
        return unexpected(error(error_code::credential_corrupted,
            "credential blob has an invalid expiry"));
    }

    if (http_utils::sha256_hex(serialize_payload(cred)) != *digest) {
        return unexpected(error(error_code::credential_corrupted,
            "credential blob failed its integrity check"));
    }
    if (cred.access_token.empty() && cred.refresh_token.empty()) {
        return unexpected(error(error_code::credential_corrupted,
            "credential blob holds no token"));
    }

    return cred;
}

// ============================================================================
// file_credential_store
// ============================================================================

file_credential_store::file_credential_store(std::filesystem::path directory)
    : directory_(std::move(directory)) {}

auto file_credential_store::blob_path() const -> std::filesystem::path {
    return directory_ / blob_name;
}

auto file_credential_store::ensure_directory() -> result<void> {
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        return unexpected(error(error_code::credential_store_error,
            "failed to create " + directory_.string() + ": " + ec.message()));
    }

    std::filesystem::permissions(directory_, std::filesystem::perms::owner_all,
                                 std::filesystem::perm_options::replace, ec);
    if (ec) {
        return unexpected(error(error_code::credential_store_error,
            "failed to restrict " + directory_.string() + ": " + ec.message()));
    }
    return {};
}

auto file_credential_store::load() -> result<std::optional<credential>> {
    std::lock_guard lock(mutex_);

    auto path = blob_path();
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        MU_LOG_DEBUG(log_category::auth, "No stored credential at " + path.string());
        return std::optional<credential>{};
    }

    auto content = read_file(path);
    if (!content) {
        return unexpected(error(error_code::credential_store_error,
            content.error().message));
    }

    auto parsed = deserialize(content.value());
    if (!parsed) {
        MU_LOG_WARN(log_category::auth,
            "Stored credential rejected: " + parsed.error().message);
        return unexpected(parsed.error());
    }

    MU_LOG_DEBUG(log_category::auth, "Loaded stored credential");
    return std::optional<credential>{std::move(parsed.value())};
}

auto file_credential_store::save(const credential& cred) -> result<void> {
    std::lock_guard lock(mutex_);

    auto dir = ensure_directory();
    if (!dir) {
        return dir;
    }

    auto written = write_file_atomically(
        blob_path(), serialize(cred),
        std::filesystem::perms::owner_read | std::filesystem::perms::owner_write);
    if (!written) {
        MU_LOG_ERROR(log_category::auth,
            "Failed to persist credential: " + written.error().message);
        return unexpected(error(error_code::credential_store_error,
            written.error().message));
    }

    MU_LOG_DEBUG(log_category::auth, "Credential persisted");
    return {};
}

auto file_credential_store::remove() -> result<void> {
    std::lock_guard lock(mutex_);

    std::error_code ec;
    std::filesystem::remove(blob_path(), ec);
    if (ec) {
        return unexpected(error(error_code::credential_store_error,
            "failed to remove credential: " + ec.message()));
    }
    return {};
}

}  // namespace media_upload
