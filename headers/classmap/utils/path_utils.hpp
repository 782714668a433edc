//
// Created by gregorian-rayne on 2/9/26.
//

#ifndef CLASSMAP_PATH_UTILS_HPP
#define CLASSMAP_PATH_UTILS_HPP

/**
 * @file path_utils.hpp
 * @brief Path canonicalization and pure path math.
 */

#include "classmap/result.hpp"
#include "classmap/error.hpp"

#include <algorithm>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace classmap::path_utils {

    namespace fs = std::filesystem;

    /**
     * Resolves a path to its canonical absolute form (symlinks resolved).
     *
     * @param path An existing path.
     * @return The canonical path, or NotFound if it cannot be resolved.
     */
    inline Result<fs::path, Error> canonical(const fs::path& path) {
        std::error_code ec;
        auto result = fs::canonical(path, ec);
        if (ec) {
            return Result<fs::path, Error>::failure(
                Error::not_found("Cannot resolve real path: " + ec.message(), path.string())
            );
        }
        return Result<fs::path, Error>::success(std::move(result));
    }

    /**
     * Converts a path to use forward slashes.
     */
    inline std::string to_forward_slashes(const fs::path& path) {
        std::string result = path.string();
        for (char& c : result) {
            if (c == '\\') {
                c = '/';
            }
        }
        return result;
    }

    /**
     * Splits a '/' or '\' separated path into its non-empty segments.
     */
    inline std::vector<std::string> segments(const std::string_view path) {
        std::vector<std::string> result;
        std::string current;
        for (const char c : path) {
            if (c == '/' || c == '\\') {
                if (!current.empty()) {
                    result.push_back(std::move(current));
                    current.clear();
                }
            } else {
                current += c;
            }
        }
        if (!current.empty()) {
            result.push_back(std::move(current));
        }
        return result;
    }

    /**
     * Path of @p file relative to @p root, with '/' separators.
     *
     * Both paths are expected to be canonical. Returns the file's generic
     * path unchanged when it does not live under root.
     */
    inline std::string relative_to_root(const fs::path& file, const fs::path& root) {
        const auto rel = file.lexically_relative(root);
        if (rel.empty() || *rel.begin() == "..") {
            return to_forward_slashes(file);
        }
        return to_forward_slashes(rel);
    }

    /**
     * Relative path from a base directory to a target file, with a leading '/'.
     *
     * Finds the longest common segment prefix of @p base_dir and the
     * target's directory, emits one ".." per remaining base segment, then
     * the remaining target segments and the file name. The result is meant
     * to be appended to a "current directory" marker, e.g.
     * `__DIR__ . '/../lib/Thing.php'`.
     *
     * Pure string math: nothing is touched on disk.
     *
     * @param base_dir Absolute, canonical base directory.
     * @param target_file Absolute, canonical target file.
     * @return Relative path starting with '/'.
     */
    inline std::string relative_segments(const fs::path& base_dir, const fs::path& target_file) {
        const auto base_parts = segments(base_dir.string());
        auto target_parts = segments(target_file.string());

        std::string file_name;
        if (!target_parts.empty()) {
            file_name = target_parts.back();
            target_parts.pop_back();
        }

        std::size_t common = 0;
        const std::size_t limit = std::min(base_parts.size(), target_parts.size());
        while (common < limit && base_parts[common] == target_parts[common]) {
            ++common;
        }

        std::vector<std::string> parts;
        for (std::size_t i = common; i < base_parts.size(); ++i) {
            parts.emplace_back("..");
        }
        for (std::size_t i = common; i < target_parts.size(); ++i) {
            parts.push_back(target_parts[i]);
        }
        parts.push_back(file_name);

        std::string result;
        for (const auto& part : parts) {
            result += '/';
            result += part;
        }
        return result;
    }

    /**
     * Lowercased extension without the leading dot ("PHP" -> "php").
     */
    inline std::string lowercase_extension(const fs::path& path) {
        std::string ext = path.extension().string();
        if (!ext.empty() && ext.front() == '.') {
            ext.erase(0, 1);
        }
        for (char& c : ext) {
            if (c >= 'A' && c <= 'Z') {
                c = static_cast<char>(c - 'A' + 'a');
            }
        }
        return ext;
    }

}  // namespace classmap::path_utils

#endif //CLASSMAP_PATH_UTILS_HPP
