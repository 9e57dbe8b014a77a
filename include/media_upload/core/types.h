/**
 * @file types.h
 * @brief Core type definitions for media_upload
 */

#ifndef MEDIA_UPLOAD_CORE_TYPES_H
#define MEDIA_UPLOAD_CORE_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace media_upload {

/**
 * @brief Error codes for upload operations
 *
 * Ranges:
 * - -100 to -119: Validation errors (rejected before any network activity)
 * - -200 to -219: Authentication errors
 * - -300 to -319: Transfer errors (classified at the transfer client)
 * - -400 to -409: Cancellation
 * - -500 to -519: Job / manager errors
 * - -900 to -919: Internal errors
 */
enum class error_code : int32_t {
    success = 0,

    // Validation errors (-100 to -119)
    not_authenticated = -100,
    file_not_found = -101,
    not_a_file = -102,
    unsupported_format = -103,
    file_too_large = -104,
    title_required = -105,
    title_too_long = -106,
    description_required = -107,
    description_too_long = -108,
    invalid_schedule_time = -109,
    schedule_in_past = -110,
    empty_batch = -111,

    // Authentication errors (-200 to -219)
    auth_required = -200,
    auth_refresh_failed = -201,
    auth_no_refresh_token = -202,
    credential_store_error = -203,
    credential_corrupted = -204,

    // Transfer errors (-300 to -319)
    transfer_access_denied = -300,
    transfer_invalid_request = -301,
    transfer_payload_too_large = -302,
    transfer_failed = -303,
    transfer_protocol_error = -304,
    file_read_error = -305,

    // Cancellation (-400 to -409)
    upload_cancelled = -400,

    // Job / manager errors (-500 to -519)
    job_not_found = -500,
    manager_shut_down = -501,
    file_organize_failed = -502,

    // Internal errors (-900 to -919)
    invalid_configuration = -900,
    internal_error = -901,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::not_authenticated:
            return "not authenticated";
        case error_code::file_not_found:
            return "file not found";
        case error_code::not_a_file:
            return "path is not a file";
        case error_code::unsupported_format:
            return "unsupported file format";
        case error_code::file_too_large:
            return "file too large";
        case error_code::title_required:
            return "title required";
        case error_code::title_too_long:
            return "title too long";
        case error_code::description_required:
            return "description required";
        case error_code::description_too_long:
            return "description too long";
        case error_code::invalid_schedule_time:
            return "invalid schedule time";
        case error_code::schedule_in_past:
            return "schedule time is in the past";
        case error_code::empty_batch:
            return "empty batch";
        case error_code::auth_required:
            return "authentication required";
        case error_code::auth_refresh_failed:
            return "token refresh failed";
        case error_code::auth_no_refresh_token:
            return "no refresh token";
        case error_code::credential_store_error:
            return "credential store error";
        case error_code::credential_corrupted:
            return "credential blob corrupted";
        case error_code::transfer_access_denied:
            return "access denied / quota";
        case error_code::transfer_invalid_request:
            return "invalid request";
        case error_code::transfer_payload_too_large:
            return "file too large";
        case error_code::transfer_failed:
            return "transfer error";
        case error_code::transfer_protocol_error:
            return "unexpected upload protocol response";
        case error_code::file_read_error:
            return "file read error";
        case error_code::upload_cancelled:
            return "cancelled";
        case error_code::job_not_found:
            return "job not found";
        case error_code::manager_shut_down:
            return "upload manager shut down";
        case error_code::file_organize_failed:
            return "failed to move uploaded file";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::internal_error:
            return "internal error";
        default:
            return "unknown error";
    }
}

/**
 * @brief Error type with code and optional message
 */
struct error {
    error_code code;
    std::string message;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * A simple Result type similar to std::expected (C++23).
 * Contains either a value of type T or an error.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

}  // namespace media_upload

#endif  // MEDIA_UPLOAD_CORE_TYPES_H
