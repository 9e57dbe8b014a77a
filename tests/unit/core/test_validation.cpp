/**
 * @file test_validation.cpp
 * @brief Unit tests for request and schedule-time validation
 */

#include <gtest/gtest.h>

#include <media_upload/core/validation.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>

namespace media_upload::test {

class ValidationTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("media_upload_validation_" + std::to_string(std::random_device{}()));
        std::filesystem::create_directories(test_dir_);
        video_ = create_file("clip.mp4", 2048);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    auto create_file(const std::string& name, std::size_t size) -> std::filesystem::path {
        auto path = test_dir_ / name;
        std::ofstream file(path, std::ios::binary);
        std::string content(size, 'v');
        file.write(content.data(), static_cast<std::streamsize>(content.size()));
        return path;
    }

    auto check(const std::filesystem::path& path, std::string_view title,
               std::string_view description, bool authenticated = true) -> result<void> {
        return validate_request(path, title, description, authenticated, config_);
    }

    std::filesystem::path test_dir_;
    std::filesystem::path video_;
    validation_config config_;
};

TEST_F(ValidationTest, AcceptsWellFormedRequest) {
    EXPECT_TRUE(check(video_, "Holiday", "Summer trip").has_value());
}

TEST_F(ValidationTest, RejectsWhenNotAuthenticated) {
    auto result = check(video_, "Holiday", "Summer trip", false);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::not_authenticated);
    EXPECT_EQ(result.error().message, "Not authenticated");
}

TEST_F(ValidationTest, RejectsMissingFile) {
    auto result = check(test_dir_ / "missing.mp4", "Holiday", "Summer trip");

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::file_not_found);
    EXPECT_EQ(result.error().message, "File does not exist");
}

TEST_F(ValidationTest, RejectsDirectory) {
    auto dir = test_dir_ / "folder.mp4";
    std::filesystem::create_directories(dir);

    auto result = check(dir, "Holiday", "Summer trip");

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::not_a_file);
    EXPECT_EQ(result.error().message, "Path is not a file");
}

TEST_F(ValidationTest, RejectsUnsupportedExtension) {
    auto text = create_file("notes.txt", 10);

    auto result = check(text, "Holiday", "Summer trip");

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::unsupported_format);
}

TEST_F(ValidationTest, ExtensionCheckIgnoresCase) {
    auto upper = create_file("CLIP.MOV", 10);

    EXPECT_TRUE(check(upper, "Holiday", "Summer trip").has_value());
}

TEST_F(ValidationTest, RejectsOversizedFile) {
    config_.max_file_size = 1024;

    auto result = check(video_, "Holiday", "Summer trip");

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::file_too_large);
}

TEST_F(ValidationTest, RejectsBlankTitle) {
    auto result = check(video_, "   \t", "Summer trip");

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::title_required);
    EXPECT_EQ(result.error().message, "Title is required");
}

TEST_F(ValidationTest, TitleLengthBoundary) {
    EXPECT_TRUE(check(video_, std::string(100, 't'), "Summer trip").has_value());

    auto result = check(video_, std::string(101, 't'), "Summer trip");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::title_too_long);
    EXPECT_EQ(result.error().message, "Title too long (max 100 characters)");
}

TEST_F(ValidationTest, TitleIsTrimmedBeforeLengthCheck) {
    auto padded = "  " + std::string(100, 't') + "  ";

    EXPECT_TRUE(check(video_, padded, "Summer trip").has_value());
}

TEST_F(ValidationTest, RejectsBlankDescription) {
    auto result = check(video_, "Holiday", "");

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::description_required);
    EXPECT_EQ(result.error().message, "Description is required");
}

TEST_F(ValidationTest, DescriptionLengthBoundary) {
    EXPECT_TRUE(check(video_, "Holiday", std::string(5000, 'd')).has_value());

    auto result = check(video_, "Holiday", std::string(5001, 'd'));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::description_too_long);
    EXPECT_EQ(result.error().message, "Description too long (max 5000 characters)");
}

namespace {

// U+65E5 and U+00E9: three and two bytes in UTF-8
auto repeat(std::string_view piece, std::size_t count) -> std::string {
    std::string out;
    for (std::size_t i = 0; i < count; ++i) {
        out += piece;
    }
    return out;
}

constexpr std::string_view cjk_char = "\xE6\x97\xA5";
constexpr std::string_view accented_char = "\xC3\xA9";

}  // namespace

TEST_F(ValidationTest, TitleLimitCountsCharactersNotBytes) {
    EXPECT_TRUE(check(video_, repeat(cjk_char, 60), "Summer trip").has_value());
    EXPECT_TRUE(check(video_, repeat(cjk_char, 100), "Summer trip").has_value());

    auto result = check(video_, repeat(cjk_char, 101), "Summer trip");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::title_too_long);
}

TEST_F(ValidationTest, DescriptionLimitCountsCharactersNotBytes) {
    EXPECT_TRUE(check(video_, "Holiday", repeat(accented_char, 5000)).has_value());

    auto result = check(video_, "Holiday", repeat(accented_char, 5001));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::description_too_long);
}

TEST(Utf8LengthTest, CountsCodePoints) {
    EXPECT_EQ(utf8_length(""), 0u);
    EXPECT_EQ(utf8_length("abc"), 3u);
    EXPECT_EQ(utf8_length("caf\xC3\xA9"), 4u);
    EXPECT_EQ(utf8_length("\xF0\x9F\x8E\xAC clip"), 6u);
}

TEST_F(ValidationTest, AuthenticationIsCheckedFirst) {
    auto result = check(test_dir_ / "missing.mp4", "", "", false);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::not_authenticated);
}

TEST(TrimTest, StripsSurroundingWhitespace) {
    EXPECT_EQ(trim("  hello world \n"), "hello world");
    EXPECT_EQ(trim(""), "");
    EXPECT_EQ(trim(" \t "), "");
}

// =============================================================================
// Schedule time
// =============================================================================

TEST(ScheduleTimeTest, ParsesUtcTimestamp) {
    auto parsed = parse_rfc3339_utc("2030-01-01T00:00:00Z");

    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(format_rfc3339_utc(*parsed), "2030-01-01T00:00:00Z");
}

TEST(ScheduleTimeTest, ParsesFractionalSeconds) {
    auto parsed = parse_rfc3339_utc("2030-06-15T12:30:45.250Z");

    ASSERT_TRUE(parsed.has_value());
    auto whole = parse_rfc3339_utc("2030-06-15T12:30:45Z");
    ASSERT_TRUE(whole.has_value());
    EXPECT_EQ(std::chrono::duration_cast<std::chrono::milliseconds>(*parsed - *whole).count(), 250);
}

TEST(ScheduleTimeTest, RejectsMissingSeparatorAndZone) {
    EXPECT_FALSE(parse_rfc3339_utc("2030-01-01 00:00").has_value());
    EXPECT_FALSE(parse_rfc3339_utc("2030-01-01T00:00:00").has_value());
    EXPECT_FALSE(parse_rfc3339_utc("2030-01-01T00:00:00+00:00").has_value());
    EXPECT_FALSE(parse_rfc3339_utc("2030-01-01 00:00:00Z").has_value());
}

TEST(ScheduleTimeTest, RejectsImpossibleDates) {
    EXPECT_FALSE(parse_rfc3339_utc("2030-02-30T00:00:00Z").has_value());
    EXPECT_FALSE(parse_rfc3339_utc("2030-13-01T00:00:00Z").has_value());
    EXPECT_FALSE(parse_rfc3339_utc("2030-01-01T24:00:00Z").has_value());
    EXPECT_FALSE(parse_rfc3339_utc("2030-01-01T00:00:00.Z").has_value());
}

TEST(ScheduleTimeTest, FormatErrorCode) {
    auto result = validate_schedule_format("2030-01-01 00:00");

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::invalid_schedule_time);
}

TEST(ScheduleTimeTest, PastTimeRejected) {
    auto now = *parse_rfc3339_utc("2030-01-01T00:00:00Z");

    auto past = validate_schedule_time("2029-12-31T23:59:59Z", now);
    ASSERT_FALSE(past.has_value());
    EXPECT_EQ(past.error().code, error_code::schedule_in_past);

    auto same = validate_schedule_time("2030-01-01T00:00:00Z", now);
    EXPECT_FALSE(same.has_value());

    EXPECT_TRUE(validate_schedule_time("2030-01-01T00:00:01Z", now).has_value());
}

TEST(ScheduleTimeTest, MalformedTimeReportsFormatNotPast) {
    auto result = validate_schedule_time("2030-01-01 00:00", std::chrono::system_clock::now());

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::invalid_schedule_time);
}

}  // namespace media_upload::test
