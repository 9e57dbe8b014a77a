/**
 * @file error_codes.h
 * @brief Error taxonomy helpers for media_upload
 *
 * Groups the numeric ranges of error_code into the four failure kinds the
 * upload pipeline reports: validation, authentication, transfer and
 * cancellation.
 */

#ifndef MEDIA_UPLOAD_CORE_ERROR_CODES_H
#define MEDIA_UPLOAD_CORE_ERROR_CODES_H

#include "types.h"

#include <cstdint>
#include <string_view>

namespace media_upload {

/**
 * @brief Failure kind of an error code
 */
enum class error_category {
    none,
    validation,
    authentication,
    transfer,
    cancellation,
    job,
    internal,
};

[[nodiscard]] constexpr auto to_string(error_category category) noexcept
    -> std::string_view {
    switch (category) {
        case error_category::none:
            return "none";
        case error_category::validation:
            return "validation";
        case error_category::authentication:
            return "authentication";
        case error_category::transfer:
            return "transfer";
        case error_category::cancellation:
            return "cancellation";
        case error_category::job:
            return "job";
        case error_category::internal:
            return "internal";
        default:
            return "unknown";
    }
}

/**
 * @brief Check if error code is in validation error range
 */
[[nodiscard]] constexpr auto is_validation_error(int32_t code) noexcept -> bool {
    return code <= -100 && code >= -119;
}

/**
 * @brief Check if error code is in authentication error range
 */
[[nodiscard]] constexpr auto is_auth_error(int32_t code) noexcept -> bool {
    return code <= -200 && code >= -219;
}

/**
 * @brief Check if error code is in transfer error range
 */
[[nodiscard]] constexpr auto is_transfer_error(int32_t code) noexcept -> bool {
    return code <= -300 && code >= -319;
}

[[nodiscard]] constexpr auto is_cancellation(int32_t code) noexcept -> bool {
    return code <= -400 && code >= -409;
}

[[nodiscard]] constexpr auto is_job_error(int32_t code) noexcept -> bool {
    return code <= -500 && code >= -519;
}

[[nodiscard]] constexpr auto is_internal_error(int32_t code) noexcept -> bool {
    return code <= -900 && code >= -919;
}

/**
 * @brief Map an error code onto its failure kind
 */
[[nodiscard]] constexpr auto category_of(error_code code) noexcept -> error_category {
    const auto value = static_cast<int32_t>(code);
    if (code == error_code::success) return error_category::none;
    if (is_validation_error(value)) return error_category::validation;
    if (is_auth_error(value)) return error_category::authentication;
    if (is_transfer_error(value)) return error_category::transfer;
    if (is_cancellation(value)) return error_category::cancellation;
    if (is_job_error(value)) return error_category::job;
    return error_category::internal;
}

/**
 * @brief Whether resubmitting the same request could succeed
 *
 * Nothing in the pipeline retries on its own; this only helps callers
 * decide whether to submit a fresh job.
 */
[[nodiscard]] constexpr auto is_resubmittable(error_code code) noexcept -> bool {
    switch (code) {
        case error_code::transfer_failed:
        case error_code::transfer_protocol_error:
        case error_code::upload_cancelled:
            return true;
        default:
            return false;
    }
}

}  // namespace media_upload

#endif  // MEDIA_UPLOAD_CORE_ERROR_CODES_H
