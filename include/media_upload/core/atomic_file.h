/**
 * @file atomic_file.h
 * @brief Whole-file read and write-temp-then-rename helpers
 */

#ifndef MEDIA_UPLOAD_CORE_ATOMIC_FILE_H
#define MEDIA_UPLOAD_CORE_ATOMIC_FILE_H

#include "types.h"

#include <filesystem>
#include <optional>
#include <string>

namespace media_upload {

/**
 * @brief Replace @p path with @p content
 *
 * The content is written to "<path>.tmp" first and renamed over @p path,
 * so readers see either the old or the new file. When @p permissions is
 * given it is applied to the temporary file before the rename.
 */
[[nodiscard]] auto write_file_atomically(
    const std::filesystem::path& path,
    const std::string& content,
    std::optional<std::filesystem::perms> permissions = std::nullopt) -> result<void>;

/**
 * @brief Read a whole file into memory
 */
[[nodiscard]] auto read_file(const std::filesystem::path& path) -> result<std::string>;

}  // namespace media_upload

#endif  // MEDIA_UPLOAD_CORE_ATOMIC_FILE_H
