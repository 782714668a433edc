//
// Created by gregorian-rayne on 2/9/26.
//

#ifndef CLASSMAP_STRING_UTILS_HPP
#define CLASSMAP_STRING_UTILS_HPP

/**
 * @file string_utils.hpp
 * @brief String helpers shared by the scanner, options and renderers.
 */

#include <string>
#include <string_view>
#include <vector>
#include <algorithm>
#include <cctype>
#include <sstream>

namespace classmap::string_utils {

    inline std::string_view trim_left(std::string_view s) noexcept {
        const auto it = std::ranges::find_if(s, [](const unsigned char c) {
            return !std::isspace(c);
        });
        return s.substr(static_cast<std::size_t>(it - s.begin()));
    }

    inline std::string_view trim_right(std::string_view s) noexcept {
        const auto it = std::find_if(s.rbegin(), s.rend(), [](const unsigned char c) {
            return !std::isspace(c);
        });
        return s.substr(0, static_cast<std::size_t>(s.rend() - it));
    }

    inline std::string_view trim(const std::string_view s) noexcept {
        return trim_left(trim_right(s));
    }

    /**
     * Removes every leading and trailing occurrence of @p c.
     */
    inline std::string_view trim_char(std::string_view s, const char c) noexcept {
        while (!s.empty() && s.front() == c) {
            s.remove_prefix(1);
        }
        while (!s.empty() && s.back() == c) {
            s.remove_suffix(1);
        }
        return s;
    }

    /**
     * Splits a string by a delimiter. Empty parts are kept.
     */
    inline std::vector<std::string_view> split(std::string_view s, const char delimiter) {
        std::vector<std::string_view> result;
        std::size_t start = 0;
        std::size_t end = s.find(delimiter);

        while (end != std::string_view::npos) {
            result.push_back(s.substr(start, end - start));
            start = end + 1;
            end = s.find(delimiter, start);
        }

        result.push_back(s.substr(start));
        return result;
    }

    template<typename Container>
    std::string join(const Container& parts, const std::string_view delimiter) {
        if (parts.empty()) {
            return "";
        }

        std::ostringstream oss;
        auto it = parts.begin();
        oss << *it;
        ++it;

        for (; it != parts.end(); ++it) {
            oss << delimiter << *it;
        }

        return oss.str();
    }

    inline std::string to_lower(const std::string_view s) {
        std::string result(s);
        std::ranges::transform(result, result.begin(),
                               [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return result;
    }

    /**
     * ASCII case-insensitive equality (strcasecmp semantics).
     */
    inline bool iequals(const std::string_view a, const std::string_view b) noexcept {
        if (a.size() != b.size()) {
            return false;
        }
        for (std::size_t i = 0; i < a.size(); ++i) {
            const auto ca = static_cast<unsigned char>(a[i]);
            const auto cb = static_cast<unsigned char>(b[i]);
            if (std::tolower(ca) != std::tolower(cb)) {
                return false;
            }
        }
        return true;
    }

    inline std::string replace_all(std::string_view s, const std::string_view from, const std::string_view to) {
        if (from.empty()) {
            return std::string(s);
        }

        std::string result;
        result.reserve(s.size());

        std::size_t pos = 0;
        std::size_t found;

        while ((found = s.find(from, pos)) != std::string_view::npos) {
            result.append(s, pos, found - pos);
            result.append(to);
            pos = found + from.size();
        }

        result.append(s, pos, s.size() - pos);
        return result;
    }

    /**
     * Shell-style wildcard match with fnmatch() default flags.
     *
     * Supports `*` (any run, including '/'), `?` (one character), bracket
     * expressions `[abc]`, `[a-z]`, `[!a]` / `[^a]`, and backslash escapes.
     *
     * @param pattern The glob pattern.
     * @param text The string to test.
     * @return True if the whole of @p text matches.
     */
    bool glob_match(std::string_view pattern, std::string_view text);

    /**
     * Escapes a string for a single-quoted PHP literal (backslash and quote).
     */
    inline std::string escape_single_quoted(const std::string_view s) {
        std::string result;
        result.reserve(s.size());
        for (const char c : s) {
            if (c == '\\' || c == '\'') {
                result += '\\';
            }
            result += c;
        }
        return result;
    }

}  // namespace classmap::string_utils

#endif //CLASSMAP_STRING_UTILS_HPP
