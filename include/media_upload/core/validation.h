/**
 * @file validation.h
 * @brief Request and schedule-time validation
 *
 * Everything here runs before a job is registered, so a rejected request
 * never reaches the network.
 */

#ifndef MEDIA_UPLOAD_CORE_VALIDATION_H
#define MEDIA_UPLOAD_CORE_VALIDATION_H

#include "types.h"
#include "upload_config.h"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace media_upload {

/**
 * @brief Strip leading and trailing whitespace
 */
[[nodiscard]] auto trim(std::string_view text) -> std::string;

/**
 * @brief Number of code points in UTF-8 text
 *
 * Title and description limits are expressed in characters, not bytes.
 * Continuation bytes (10xxxxxx) are not counted.
 */
[[nodiscard]] auto utf8_length(std::string_view text) -> std::size_t;

/**
 * @brief Validate one upload request
 *
 * Checks, in order: authentication, that the resource exists and is a
 * regular file with a supported extension and size, then the trimmed
 * title and description lengths.
 *
 * @param resource Local file to upload
 * @param title Video title
 * @param description Video description
 * @param authenticated Whether a usable credential is present
 * @param config Limits to apply
 * @return Success, or a validation error carrying a user-facing message
 */
[[nodiscard]] auto validate_request(
    const std::filesystem::path& resource,
    std::string_view title,
    std::string_view description,
    bool authenticated,
    const validation_config& config = {}) -> result<void>;

/**
 * @brief Parse an RFC3339 UTC timestamp (YYYY-MM-DDTHH:MM:SS[.fff]Z)
 *
 * Offsets other than Z are not accepted.
 */
[[nodiscard]] auto parse_rfc3339_utc(std::string_view text)
    -> std::optional<std::chrono::system_clock::time_point>;

/**
 * @brief Check only the shape of a schedule timestamp
 */
[[nodiscard]] auto validate_schedule_format(std::string_view text) -> result<void>;

/**
 * @brief Check the shape of a schedule timestamp and that it lies after @p now
 */
[[nodiscard]] auto validate_schedule_time(
    std::string_view text,
    std::chrono::system_clock::time_point now) -> result<void>;

/**
 * @brief Format a time point as RFC3339 UTC with a trailing Z
 */
[[nodiscard]] auto format_rfc3339_utc(std::chrono::system_clock::time_point tp) -> std::string;

}  // namespace media_upload

#endif  // MEDIA_UPLOAD_CORE_VALIDATION_H
