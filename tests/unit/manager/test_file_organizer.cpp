/**
 * @file test_file_organizer.cpp
 * @brief Unit tests for dated folder moves of uploaded files
 */

#include <gtest/gtest.h>

#include <media_upload/manager/file_organizer.h>

#include <algorithm>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>

namespace media_upload::test {

class FileOrganizerTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("media_upload_organizer_" + std::to_string(std::random_device{}()));
        source_dir_ = test_dir_ / "incoming";
        std::filesystem::create_directories(source_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    auto make_file(const std::string& name, std::size_t size) -> std::filesystem::path {
        auto path = source_dir_ / name;
        std::ofstream out(path, std::ios::binary);
        out << std::string(size, 'x');
        return path;
    }

    // Noon local time, far from a day boundary in any zone offset
    static auto local_date(int year, int month, int day)
        -> std::chrono::system_clock::time_point {
        std::tm tm_buf{};
        tm_buf.tm_year = year - 1900;
        tm_buf.tm_mon = month - 1;
        tm_buf.tm_mday = day;
        tm_buf.tm_hour = 12;
        tm_buf.tm_isdst = -1;
        return std::chrono::system_clock::from_time_t(std::mktime(&tm_buf));
    }

    auto uploaded_root() const -> std::filesystem::path { return test_dir_ / "uploaded"; }

    std::filesystem::path test_dir_;
    std::filesystem::path source_dir_;
};

TEST_F(FileOrganizerTest, DateFolderNameIsIsoDate) {
    EXPECT_EQ(file_organizer::date_folder_name(local_date(2024, 3, 5)), "2024-03-05");
    EXPECT_EQ(file_organizer::date_folder_name(local_date(2023, 12, 31)), "2023-12-31");
}

TEST_F(FileOrganizerTest, MovesFileIntoDatedFolder) {
    file_organizer organizer(uploaded_root());
    auto source = make_file("holiday.mp4", 2048);

    auto moved = organizer.organize(source, local_date(2024, 3, 15));

    ASSERT_TRUE(moved.has_value()) << moved.error().message;
    EXPECT_EQ(moved.value(), uploaded_root() / "2024-03-15" / "holiday.mp4");
    EXPECT_TRUE(std::filesystem::exists(moved.value()));
    EXPECT_FALSE(std::filesystem::exists(source));
    EXPECT_EQ(std::filesystem::file_size(moved.value()), 2048u);
}

TEST_F(FileOrganizerTest, NameCollisionGetsNumberedSuffix) {
    file_organizer organizer(uploaded_root());
    auto date = local_date(2024, 3, 15);

    auto first = organizer.organize(make_file("clip.mp4", 10), date);
    auto second = organizer.organize(make_file("clip.mp4", 20), date);
    auto third = organizer.organize(make_file("clip.mp4", 30), date);

    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    ASSERT_TRUE(third.has_value());
    EXPECT_EQ(first.value().filename(), "clip.mp4");
    EXPECT_EQ(second.value().filename(), "clip_1.mp4");
    EXPECT_EQ(third.value().filename(), "clip_2.mp4");
    EXPECT_EQ(std::filesystem::file_size(first.value()), 10u);
    EXPECT_EQ(std::filesystem::file_size(third.value()), 30u);
}

TEST_F(FileOrganizerTest, MissingFileIsReported) {
    file_organizer organizer(uploaded_root());

    auto moved = organizer.organize(source_dir_ / "gone.mp4", local_date(2024, 3, 15));

    ASSERT_FALSE(moved.has_value());
    EXPECT_EQ(moved.error().code, error_code::file_not_found);
    EXPECT_NE(moved.error().message.find("gone.mp4"), std::string::npos);
    EXPECT_FALSE(std::filesystem::exists(uploaded_root() / "2024-03-15"));
}

TEST_F(FileOrganizerTest, DirectoryIsNotOrganized) {
    file_organizer organizer(uploaded_root());

    auto moved = organizer.organize(source_dir_, local_date(2024, 3, 15));

    ASSERT_FALSE(moved.has_value());
    EXPECT_EQ(moved.error().code, error_code::file_not_found);
    EXPECT_TRUE(std::filesystem::is_directory(source_dir_));
}

TEST_F(FileOrganizerTest, OrganizedFilesListsOneDate) {
    file_organizer organizer(uploaded_root());
    ASSERT_TRUE(organizer.organize(make_file("a.mp4", 1), local_date(2024, 3, 15)).has_value());
    ASSERT_TRUE(organizer.organize(make_file("b.mp4", 1), local_date(2024, 3, 15)).has_value());
    ASSERT_TRUE(organizer.organize(make_file("c.mp4", 1), local_date(2024, 3, 16)).has_value());

    auto files = organizer.organized_files(local_date(2024, 3, 15));
    std::sort(files.begin(), files.end());

    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(files[0].filename(), "a.mp4");
    EXPECT_EQ(files[1].filename(), "b.mp4");
    EXPECT_TRUE(organizer.organized_files(local_date(2024, 1, 1)).empty());
}

TEST_F(FileOrganizerTest, StatsTotalFoldersFilesAndBytes) {
    file_organizer organizer(uploaded_root());

    auto empty = organizer.stats();
    EXPECT_EQ(empty.total_files, 0u);
    EXPECT_EQ(empty.date_folders, 0u);
    EXPECT_EQ(empty.total_size, 0u);

    ASSERT_TRUE(organizer.organize(make_file("a.mp4", 100), local_date(2024, 3, 15)).has_value());
    ASSERT_TRUE(organizer.organize(make_file("b.mp4", 250), local_date(2024, 3, 15)).has_value());
    ASSERT_TRUE(organizer.organize(make_file("c.mp4", 50), local_date(2024, 3, 16)).has_value());

    auto totals = organizer.stats();
    EXPECT_EQ(totals.total_files, 3u);
    EXPECT_EQ(totals.date_folders, 2u);
    EXPECT_EQ(totals.total_size, 400u);
}

}  // namespace media_upload::test
