/**
 * @file validation.cpp
 * @brief Implementation of request and schedule-time validation
 */

#include "media_upload/core/validation.h"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace media_upload {

namespace {

auto parse_digits(std::string_view text, std::size_t pos, std::size_t count,
                  int& out) -> bool {
    if (pos + count > text.size()) {
        return false;
    }
    int value = 0;
    for (std::size_t i = pos; i < pos + count; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            return false;
        }
        value = value * 10 + (text[i] - '0');
    }
    out = value;
    return true;
}

auto lowercase(std::string value) -> std::string {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

}  // namespace

auto trim(std::string_view text) -> std::string {
    auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };

    std::size_t begin = 0;
    while (begin < text.size() && is_space(text[begin])) {
        ++begin;
    }
    std::size_t end = text.size();
    while (end > begin && is_space(text[end - 1])) {
        --end;
    }
    return std::string(text.substr(begin, end - begin));
}

auto utf8_length(std::string_view text) -> std::size_t {
    return static_cast<std::size_t>(std::count_if(text.begin(), text.end(), [](char c) {
        return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
    }));
}

auto validate_request(
    const std::filesystem::path& resource,
    std::string_view title,
    std::string_view description,
    bool authenticated,
    const validation_config& config) -> result<void> {
    if (!authenticated) {
        return unexpected{error{error_code::not_authenticated, "Not authenticated"}};
    }

    std::error_code ec;
    if (resource.empty() || !std::filesystem::exists(resource, ec)) {
        return unexpected{error{error_code::file_not_found, "File does not exist"}};
    }
    if (!std::filesystem::is_regular_file(resource, ec)) {
        return unexpected{error{error_code::not_a_file, "Path is not a file"}};
    }

    auto extension = lowercase(resource.extension().string());
    if (!config.supported_extensions.empty() &&
        config.supported_extensions.count(extension) == 0) {
        return unexpected{error{error_code::unsupported_format,
            "Unsupported file format: " + (extension.empty() ? std::string("(none)") : extension)}};
    }

    auto size = std::filesystem::file_size(resource, ec);
    if (ec) {
        return unexpected{error{error_code::file_not_found,
            "Cannot read file size: " + ec.message()}};
    }
    if (size > config.max_file_size) {
        return unexpected{error{error_code::file_too_large,
            "File too large (max " + std::to_string(config.max_file_size / (1024 * 1024 * 1024)) + "GB)"}};
    }

    auto clean_title = trim(title);
    if (clean_title.empty()) {
        return unexpected{error{error_code::title_required, "Title is required"}};
    }
    if (utf8_length(clean_title) > config.max_title_length) {
        return unexpected{error{error_code::title_too_long,
            "Title too long (max " + std::to_string(config.max_title_length) + " characters)"}};
    }

    auto clean_description = trim(description);
    if (clean_description.empty()) {
        return unexpected{error{error_code::description_required, "Description is required"}};
    }
    if (utf8_length(clean_description) > config.max_description_length) {
        return unexpected{error{error_code::description_too_long,
            "Description too long (max " + std::to_string(config.max_description_length) + " characters)"}};
    }

    return {};
}

auto parse_rfc3339_utc(std::string_view text)
    -> std::optional<std::chrono::system_clock::time_point> {
    // YYYY-MM-DDTHH:MM:SS[.fraction]Z
    if (text.size() < 20 || text.back() != 'Z') {
        return std::nullopt;
    }
    if (text[4] != '-' || text[7] != '-' || text[10] != 'T' ||
        text[13] != ':' || text[16] != ':') {
        return std::nullopt;
    }

    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    if (!parse_digits(text, 0, 4, year) || !parse_digits(text, 5, 2, month) ||
        !parse_digits(text, 8, 2, day) || !parse_digits(text, 11, 2, hour) ||
        !parse_digits(text, 14, 2, minute) || !parse_digits(text, 17, 2, second)) {
        return std::nullopt;
    }

    std::chrono::microseconds fraction{0};
    std::size_t pos = 19;
    if (text[pos] == '.') {
        ++pos;
        std::size_t digits = 0;
        int64_t value = 0;
        while (pos < text.size() - 1) {
            if (!std::isdigit(static_cast<unsigned char>(text[pos]))) {
                return std::nullopt;
            }
            if (digits < 6) {
                value = value * 10 + (text[pos] - '0');
                ++digits;
            }
            ++pos;
        }
        if (digits == 0) {
            return std::nullopt;
        }
        for (; digits < 6; ++digits) {
            value *= 10;
        }
        fraction = std::chrono::microseconds{value};
    }
    if (pos != text.size() - 1) {
        return std::nullopt;
    }

    if (hour > 23 || minute > 59 || second > 59) {
        return std::nullopt;
    }

    std::chrono::year_month_day ymd{
        std::chrono::year{year},
        std::chrono::month{static_cast<unsigned>(month)},
        std::chrono::day{static_cast<unsigned>(day)}};
    if (!ymd.ok()) {
        return std::nullopt;
    }

    auto tp = std::chrono::sys_days{ymd} + std::chrono::hours{hour} +
              std::chrono::minutes{minute} + std::chrono::seconds{second} + fraction;
    return std::chrono::time_point_cast<std::chrono::system_clock::duration>(tp);
}

auto validate_schedule_format(std::string_view text) -> result<void> {
    if (!parse_rfc3339_utc(text)) {
        return unexpected{error{error_code::invalid_schedule_time,
            "Invalid schedule time '" + std::string(text) +
            "': expected RFC3339 UTC such as 2030-01-01T00:00:00Z"}};
    }
    return {};
}

auto validate_schedule_time(
    std::string_view text,
    std::chrono::system_clock::time_point now) -> result<void> {
    auto parsed = parse_rfc3339_utc(text);
    if (!parsed) {
        return validate_schedule_format(text);
    }
    if (*parsed <= now) {
        return unexpected{error{error_code::schedule_in_past,
            "Schedule time must be in the future"}};
    }
    return {};
}

auto format_rfc3339_utc(std::chrono::system_clock::time_point tp) -> std::string {
    auto time_t_val = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_buf{};
#if defined(_WIN32)
    gmtime_s(&tm_buf, &time_t_val);
#else
    gmtime_r(&time_t_val, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

}  // namespace media_upload
