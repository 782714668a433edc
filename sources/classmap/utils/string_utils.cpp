//
// Created by gregorian-rayne on 2/9/26.
//

#include "classmap/utils/string_utils.hpp"

namespace classmap::string_utils {

    namespace {

        constexpr std::size_t npos = std::string_view::npos;

        /**
         * Matches the bracket expression starting at pattern[start] ('[')
         * against c.
         *
         * @return Length of the expression including both brackets, or npos
         *         when the expression has no closing ']'.
         */
        std::size_t match_bracket(const std::string_view pattern, const std::size_t start,
                                  const unsigned char c, bool& matched) {
            std::size_t i = start + 1;
            bool negate = false;
            if (i < pattern.size() && (pattern[i] == '!' || pattern[i] == '^')) {
                negate = true;
                ++i;
            }

            bool found = false;
            bool first = true;
            while (i < pattern.size() && (first || pattern[i] != ']')) {
                first = false;

                if (pattern[i] == '\\' && i + 1 < pattern.size()) {
                    ++i;
                }
                const auto lo = static_cast<unsigned char>(pattern[i]);
                auto hi = lo;

                if (i + 2 < pattern.size() && pattern[i + 1] == '-' && pattern[i + 2] != ']') {
                    i += 2;
                    if (pattern[i] == '\\' && i + 1 < pattern.size()) {
                        ++i;
                    }
                    hi = static_cast<unsigned char>(pattern[i]);
                }

                if (lo <= c && c <= hi) {
                    found = true;
                }
                ++i;
            }

            if (i >= pattern.size()) {
                return npos;
            }

            matched = found != negate;
            return i + 1 - start;
        }

    }  // namespace

    bool glob_match(const std::string_view pattern, const std::string_view text) {
        std::size_t p = 0;
        std::size_t t = 0;
        std::size_t star_p = npos;
        std::size_t star_t = 0;

        while (t < text.size()) {
            if (p < pattern.size()) {
                const char pc = pattern[p];

                if (pc == '*') {
                    star_p = p++;
                    star_t = t;
                    continue;
                }

                if (pc == '?') {
                    ++p;
                    ++t;
                    continue;
                }

                if (pc == '[') {
                    bool matched = false;
                    if (const auto len = match_bracket(pattern, p, static_cast<unsigned char>(text[t]), matched);
                        len != npos) {
                        if (matched) {
                            p += len;
                            ++t;
                            continue;
                        }
                    } else if (text[t] == '[') {
                        // Unterminated bracket is a literal '['
                        ++p;
                        ++t;
                        continue;
                    }
                } else {
                    char literal = pc;
                    std::size_t width = 1;
                    if (pc == '\\' && p + 1 < pattern.size()) {
                        literal = pattern[p + 1];
                        width = 2;
                    }
                    if (literal == text[t]) {
                        p += width;
                        ++t;
                        continue;
                    }
                }
            }

            if (star_p != npos) {
                p = star_p + 1;
                t = ++star_t;
                continue;
            }

            return false;
        }

        while (p < pattern.size() && pattern[p] == '*') {
            ++p;
        }

        return p == pattern.size();
    }

}  // namespace classmap::string_utils
