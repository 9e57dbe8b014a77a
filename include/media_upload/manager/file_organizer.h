/**
 * @file file_organizer.h
 * @brief Moves uploaded files into dated folders
 */

#ifndef MEDIA_UPLOAD_MANAGER_FILE_ORGANIZER_H
#define MEDIA_UPLOAD_MANAGER_FILE_ORGANIZER_H

#include "media_upload/core/types.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace media_upload {

/**
 * @brief Totals over the organized folder tree
 */
struct organization_stats {
    std::size_t total_files = 0;
    std::size_t date_folders = 0;
    uint64_t total_size = 0;
};

/**
 * @brief Moves a file into <root>/<YYYY-MM-DD>/ once it has been uploaded
 *
 * A name already taken in the date folder gets a _1, _2, ... suffix before
 * the extension. The move is a rename; when that fails (another device, a
 * locked file) the file is copied and the original removed. If only the
 * removal fails the copy is kept and the move counts as done.
 *
 * Thread-safe.
 *
 * @code
 * auto organizer = std::make_shared<file_organizer>(default_uploaded_directory());
 * auto moved = organizer->organize("holiday.mp4");
 * if (moved) {
 *     std::cout << "moved to " << moved.value() << "\n";
 * }
 * @endcode
 */
class file_organizer {
public:
    explicit file_organizer(std::filesystem::path root);

    /**
     * @brief Move @p file into the folder of @p date (local time)
     * @return Final location of the file
     */
    [[nodiscard]] auto organize(
        const std::filesystem::path& file,
        std::chrono::system_clock::time_point date = std::chrono::system_clock::now())
        -> result<std::filesystem::path>;

    /**
     * @brief Files currently in the folder of @p date
     */
    [[nodiscard]] auto organized_files(
        std::chrono::system_clock::time_point date = std::chrono::system_clock::now()) const
        -> std::vector<std::filesystem::path>;

    [[nodiscard]] auto stats() const -> organization_stats;

    [[nodiscard]] auto root() const -> const std::filesystem::path& { return root_; }

    /**
     * @brief Folder name of a date, "YYYY-MM-DD" in local time
     */
    [[nodiscard]] static auto date_folder_name(std::chrono::system_clock::time_point date)
        -> std::string;

private:
    [[nodiscard]] auto unique_destination(const std::filesystem::path& folder,
                                          const std::filesystem::path& file) const
        -> std::filesystem::path;

    std::filesystem::path root_;
    mutable std::mutex mutex_;
};

}  // namespace media_upload

#endif  // MEDIA_UPLOAD_MANAGER_FILE_ORGANIZER_H
