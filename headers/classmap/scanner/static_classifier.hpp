//
// Created by gregorian-rayne on 2/10/26.
//

#ifndef CLASSMAP_STATIC_CLASSIFIER_HPP
#define CLASSMAP_STATIC_CLASSIFIER_HPP

/**
 * @file static_classifier.hpp
 * @brief Decides which files must be included eagerly.
 *
 * A file without any named type declaration cannot be reached through the
 * class map. If it still defines functions or constants, or runs code at
 * top level, it is a "static" file and gets included up front when the
 * include_static option is set. A file with at least one type declaration
 * is never static, whatever else it contains, so it is only ever loaded
 * through its symbols and cannot be included twice.
 */

#include "classmap/scanner/token.hpp"
#include "classmap/scanner/symbol_extractor.hpp"

#include <vector>

namespace classmap::scanner {

    enum class FileKind {
        Empty,          // Nothing but tags, HTML, namespace/use/declare statements
        Declarations,   // At least one named type declaration
        Static          // Functions, constants or top-level code, no type declaration
    };

    inline const char* file_kind_name(const FileKind kind) noexcept {
        switch (kind) {
            case FileKind::Empty:        return "Empty";
            case FileKind::Declarations: return "Declarations";
            case FileKind::Static:       return "Static";
        }
        return "Unknown";
    }

    class StaticFileClassifier {
    public:
        /**
         * Classifies a file from its tokens and the extractor's result for
         * the same tokens.
         */
        [[nodiscard]] FileKind classify(const std::vector<Token>& tokens, const FileSymbols& symbols) const;

        [[nodiscard]] bool is_static(const std::vector<Token>& tokens, const FileSymbols& symbols) const {
            return classify(tokens, symbols) == FileKind::Static;
        }

        /**
         * True if the tokens contain anything besides open/close tags,
         * inline HTML, trivia and namespace, use or declare statements.
         */
        [[nodiscard]] static bool has_executable_content(const std::vector<Token>& tokens);
    };

}  // namespace classmap::scanner

#endif //CLASSMAP_STATIC_CLASSIFIER_HPP
