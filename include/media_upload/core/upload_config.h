/**
 * @file upload_config.h
 * @brief Tunables for the upload pipeline
 */

#ifndef MEDIA_UPLOAD_CORE_UPLOAD_CONFIG_H
#define MEDIA_UPLOAD_CORE_UPLOAD_CONFIG_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <set>
#include <string>

namespace media_upload {

/// Chunk size of the resumable upload (1 MiB)
inline constexpr std::size_t default_chunk_size = 1024 * 1024;

/// Largest file the video API accepts (128 GiB)
inline constexpr uint64_t default_max_file_size = 128ULL * 1024 * 1024 * 1024;

inline constexpr std::size_t max_title_length = 100;
inline constexpr std::size_t max_description_length = 5000;

/**
 * @brief Clock used wherever expiry or cooldowns are evaluated
 */
using clock_function = std::function<std::chrono::system_clock::time_point()>;

/**
 * @brief Limits applied to every upload request before a worker starts
 */
struct validation_config {
    std::size_t max_title_length = media_upload::max_title_length;
    std::size_t max_description_length = media_upload::max_description_length;
    uint64_t max_file_size = default_max_file_size;
    std::set<std::string> supported_extensions = {
        ".mp4", ".avi", ".mov", ".wmv", ".flv", ".webm", ".mkv"};
};

/**
 * @brief Settings for the authenticated session
 */
struct auth_config {
    /// Minimum spacing between two refresh attempts
    std::chrono::seconds refresh_cooldown{30};

    /// Treat tokens as expired this much before their real expiry
    std::chrono::seconds expiry_margin{0};

    /// Time source; system_clock::now when empty
    clock_function clock;
};

/**
 * @brief Settings for the resumable upload client
 */
struct transfer_config {
    std::string api_base_url = "https://www.googleapis.com";
    std::size_t chunk_size = default_chunk_size;
    std::chrono::milliseconds http_timeout{300000};
};

/**
 * @brief Settings for the upload manager and its workers
 */
struct manager_config {
    /// Upper bound on concurrently transferring jobs (0 = unlimited)
    std::size_t max_concurrent_uploads = 0;

    /// Bounded wait per worker during shutdown
    std::chrono::milliseconds shutdown_timeout{5000};

    /// Minimum spacing between progress events with an unchanged percent
    std::chrono::milliseconds progress_interval{2000};

    /// Pause after the "processing" checkpoint
    std::chrono::milliseconds processing_delay{1000};

    /// Pause after the "finalizing" checkpoint
    std::chrono::milliseconds finalizing_delay{500};

    /// privacyStatus of every uploaded video
    std::string visibility = "private";
    std::string category_id = "22";

    validation_config validation;
};

/**
 * @brief Per-user data directory (~/.media_uploader)
 */
[[nodiscard]] inline auto default_data_directory() -> std::filesystem::path {
    const char* home = std::getenv("HOME");
    if (home == nullptr || *home == '\0') {
        return std::filesystem::temp_directory_path() / ".media_uploader";
    }
    return std::filesystem::path(home) / ".media_uploader";
}

[[nodiscard]] inline auto default_credentials_directory() -> std::filesystem::path {
    return default_data_directory() / "private";
}

[[nodiscard]] inline auto default_history_file() -> std::filesystem::path {
    return default_data_directory() / "upload_history.json";
}

[[nodiscard]] inline auto default_uploaded_directory() -> std::filesystem::path {
    return default_data_directory() / "uploaded";
}

}  // namespace media_upload

#endif  // MEDIA_UPLOAD_CORE_UPLOAD_CONFIG_H
