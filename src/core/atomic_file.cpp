/**
 * @file atomic_file.cpp
 * @brief Implementation of the atomic file helpers
 */

#include "media_upload/core/atomic_file.h"

#include <fstream>
#include <sstream>
#include <system_error>

namespace media_upload {

auto write_file_atomically(
    const std::filesystem::path& path,
    const std::string& content,
    std::optional<std::filesystem::perms> permissions) -> result<void> {
    auto temp_path = path;
    temp_path += ".tmp";

    {
        std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
        if (!file) {
            return unexpected(error(error_code::internal_error,
                "failed to open " + temp_path.string() + " for writing"));
        }
        file << content;
        file.flush();
        if (!file) {
            std::error_code ignored;
            std::filesystem::remove(temp_path, ignored);
            return unexpected(error(error_code::internal_error,
                "failed to write " + temp_path.string()));
        }
    }

    std::error_code ec;
    if (permissions) {
        std::filesystem::permissions(temp_path, *permissions,
                                     std::filesystem::perm_options::replace, ec);
        if (ec) {
            std::error_code ignored;
            std::filesystem::remove(temp_path, ignored);
            return unexpected(error(error_code::internal_error,
                "failed to restrict permissions of " + temp_path.string() + ": " + ec.message()));
        }
    }

    std::filesystem::rename(temp_path, path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(temp_path, ignored);
        return unexpected(error(error_code::internal_error,
            "failed to replace " + path.string() + ": " + ec.message()));
    }
    return {};
}

auto read_file(const std::filesystem::path& path) -> result<std::string> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return unexpected(error(error_code::file_not_found,
            "failed to open " + path.string()));
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    if (file.bad()) {
        return unexpected(error(error_code::file_read_error,
            "failed to read " + path.string()));
    }
    return oss.str();
}

}  // namespace media_upload
