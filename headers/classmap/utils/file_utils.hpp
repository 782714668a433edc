//
// Created by gregorian-rayne on 2/9/26.
//

#ifndef CLASSMAP_FILE_UTILS_HPP
#define CLASSMAP_FILE_UTILS_HPP

/**
 * @file file_utils.hpp
 * @brief File system primitives used by the scanner and the loader.
 *
 * All operations use Result<T, Error> for error handling.
 */

#include "classmap/result.hpp"
#include "classmap/error.hpp"

#include <string>
#include <string_view>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace classmap::file_utils {

    namespace fs = std::filesystem;

    /**
     * Reads an entire file into a string (binary mode, no newline translation).
     *
     * @param path Path to the file.
     * @return The file contents or an error.
     */
    inline Result<std::string, Error> read_file(const fs::path& path) {
        if (std::error_code ec; !fs::exists(path, ec)) {
            return Result<std::string, Error>::failure(
                Error::not_found("File not found", path.string())
            );
        }

        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return Result<std::string, Error>::failure(
                Error::permission_denied("Cannot open file", path.string())
            );
        }

        std::ostringstream oss;
        oss << file.rdbuf();

        if (file.bad()) {
            return Result<std::string, Error>::failure(
                Error::io_error("Failed to read file", path.string())
            );
        }

        return Result<std::string, Error>::success(oss.str());
    }

    /**
     * Writes a string to a file, creating parent directories as needed.
     */
    inline Result<void, Error> write_file(const fs::path& path, std::string_view content) {
        auto parent = path.parent_path();
        if (std::error_code ec; !parent.empty() && !fs::exists(parent, ec)) {
            fs::create_directories(parent, ec);
            if (ec) {
                return Result<void, Error>::failure(
                    Error::io_error("Failed to create directory", parent.string())
                );
            }
        }

        std::ofstream file(path, std::ios::binary);
        if (!file) {
            return Result<void, Error>::failure(
                Error::io_error("Failed to open file for writing", path.string())
            );
        }

        file.write(content.data(), static_cast<std::streamsize>(content.size()));

        if (!file) {
            return Result<void, Error>::failure(
                Error::io_error("Failed to write file", path.string())
            );
        }

        return Result<void, Error>::success();
    }

    /**
     * Checks that a path is a regular file that can be opened for reading.
     */
    inline bool is_readable_file(const fs::path& path) {
        std::error_code ec;
        if (!fs::is_regular_file(path, ec)) {
            return false;
        }
        const std::ifstream file(path, std::ios::binary);
        return file.good();
    }

    /**
     * Checks that a path is a directory whose entries can be listed.
     */
    inline bool is_readable_directory(const fs::path& path) {
        std::error_code ec;
        if (!fs::is_directory(path, ec)) {
            return false;
        }
        fs::directory_iterator it(path, ec);
        return !ec;
    }

}  // namespace classmap::file_utils

#endif //CLASSMAP_FILE_UTILS_HPP
