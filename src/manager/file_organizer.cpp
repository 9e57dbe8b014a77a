/**
 * @file file_organizer.cpp
 * @brief Dated folder moves for uploaded files
 */

#include "media_upload/manager/file_organizer.h"

#include "media_upload/core/logging.h"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace media_upload {

file_organizer::file_organizer(std::filesystem::path root)
    : root_(std::move(root)) {}

auto file_organizer::date_folder_name(std::chrono::system_clock::time_point date)
    -> std::string {
    auto time_t_val = std::chrono::system_clock::to_time_t(date);

    std::tm tm_buf{};
#if defined(_WIN32)
    localtime_s(&tm_buf, &time_t_val);
#else
    localtime_r(&time_t_val, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d");
    return oss.str();
}

auto file_organizer::unique_destination(const std::filesystem::path& folder,
                                        const std::filesystem::path& file) const
    -> std::filesystem::path {
    auto candidate = folder / file.filename();
    std::error_code ec;
    if (!std::filesystem::exists(candidate, ec)) {
        return candidate;
    }

    auto stem = file.stem().string();
    auto extension = file.extension().string();
    for (int n = 1;; ++n) {
        candidate = folder / (stem + "_" + std::to_string(n) + extension);
        if (!std::filesystem::exists(candidate, ec)) {
            return candidate;
        }
    }
}

auto file_organizer::organize(const std::filesystem::path& file,
                              std::chrono::system_clock::time_point date)
    -> result<std::filesystem::path> {
    std::lock_guard lock(mutex_);

    std::error_code ec;
    if (!std::filesystem::is_regular_file(file, ec)) {
        return unexpected{error{error_code::file_not_found,
            "File not found: " + file.string()}};
    }

    auto folder = root_ / date_folder_name(date);
    std::filesystem::create_directories(folder, ec);
    if (ec) {
        return unexpected{error{error_code::file_organize_failed,
            "Failed to create folder " + folder.string() + ": " + ec.message()}};
    }

    auto destination = unique_destination(folder, file);

    std::filesystem::rename(file, destination, ec);
    if (!ec) {
        MU_LOG_DEBUG(log_category::manager, "File moved to: " + destination.string());
        return destination;
    }

    MU_LOG_DEBUG(log_category::manager,
        "Rename failed (" + ec.message() + "), copying " + file.string());

    std::filesystem::copy_file(file, destination, ec);
    if (ec) {
        auto reason = ec.message();
        std::filesystem::remove(destination, ec);
        return unexpected{error{error_code::file_organize_failed,
            "Failed to move " + file.string() + " to " + destination.string()
            + ": " + reason}};
    }

    std::filesystem::remove(file, ec);
    if (ec) {
        MU_LOG_WARN(log_category::manager,
            "Copied to " + destination.string() + " but could not remove "
            + file.string() + ": " + ec.message());
    }

    MU_LOG_DEBUG(log_category::manager, "File moved to: " + destination.string());
    return destination;
}

auto file_organizer::organized_files(std::chrono::system_clock::time_point date) const
    -> std::vector<std::filesystem::path> {
    std::lock_guard lock(mutex_);

    std::vector<std::filesystem::path> files;
    auto folder = root_ / date_folder_name(date);
    std::error_code ec;
    if (!std::filesystem::is_directory(folder, ec)) {
        return files;
    }

    for (std::filesystem::directory_iterator it(folder, ec), end; !ec && it != end;
         it.increment(ec)) {
        if (it->is_regular_file(ec)) {
            files.push_back(it->path());
        }
    }
    return files;
}

auto file_organizer::stats() const -> organization_stats {
    std::lock_guard lock(mutex_);

    organization_stats totals;
    std::error_code ec;
    if (!std::filesystem::is_directory(root_, ec)) {
        return totals;
    }

    for (std::filesystem::directory_iterator dir(root_, ec), end; !ec && dir != end;
         dir.increment(ec)) {
        if (!dir->is_directory(ec)) {
            continue;
        }
        ++totals.date_folders;

        std::error_code file_ec;
        for (std::filesystem::directory_iterator it(dir->path(), file_ec), file_end;
             !file_ec && it != file_end; it.increment(file_ec)) {
            if (!it->is_regular_file(file_ec)) {
                continue;
            }
            ++totals.total_files;
            auto size = it->file_size(file_ec);
            if (!file_ec) {
                totals.total_size += size;
            }
            file_ec.clear();
        }
    }
    return totals;
}

}  // namespace media_upload
