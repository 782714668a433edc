//
// Created by gregorian-rayne on 2/11/26.
//

#include "classmap/mapping_builder.hpp"
#include "classmap/scanner/lexer.hpp"
#include "classmap/scanner/static_classifier.hpp"
#include "classmap/scanner/symbol_extractor.hpp"
#include "classmap/utils/file_utils.hpp"
#include "classmap/utils/hash_utils.hpp"
#include "classmap/utils/path_utils.hpp"

#include <exception>

namespace classmap {

    MappingBuilder::MappingBuilder(WarningSink sink)
        : sink_(std::move(sink)) {}

    MappingBuilder& MappingBuilder::instance() {
        static MappingBuilder builder;
        return builder;
    }

    Result<std::string, Error> MappingBuilder::cache_key(const fs::path& canonical_dir, const Options& options) {
        try {
            return Result<std::string, Error>::success(
                hash_utils::md5_hex(canonical_dir.string() + "\n" + options.fingerprint())
            );
        } catch (const std::exception& e) {
            return Result<std::string, Error>::failure(
                Error::internal_error(std::string("Cannot compute cache key: ") + e.what())
            );
        }
    }

    bool MappingBuilder::is_cached(const fs::path& directory, const Options& options) const {
        const auto canonical = path_utils::canonical(directory);
        if (canonical.is_err()) {
            return false;
        }
        const auto key = cache_key(canonical.value(), options);
        return key.is_ok() && cache_.contains(key.value());
    }

    void MappingBuilder::clear_cache() noexcept {
        cache_.clear();
    }

    Result<ClassMap, Error> MappingBuilder::build(const fs::path& directory, const Options& options) {
        if (auto valid = options.validate(); valid.is_err()) {
            return Result<ClassMap, Error>::failure(valid.error());
        }

        if (auto root = scanner::TreeWalker::check_root(directory); root.is_err()) {
            report_warning(sink_, root.error());
            return Result<ClassMap, Error>::failure(root.error());
        }

        auto canonical = path_utils::canonical(directory);
        if (canonical.is_err()) {
            report_warning(sink_, canonical.error());
            return Result<ClassMap, Error>::failure(canonical.error());
        }

        auto key = cache_key(canonical.value(), options);
        if (key.is_err()) {
            return Result<ClassMap, Error>::failure(key.error());
        }

        if (const auto it = cache_.find(key.value()); it != cache_.end()) {
            return Result<ClassMap, Error>::success(it->second);
        }

        ClassMap map;
        map.root = canonical.value();

        const scanner::TreeWalker walker(map.root, options, sink_);
        auto walked = walker.walk([&](const scanner::WalkEntry& entry) {
            ++map.stats.files_visited;
            scan_file(entry, options, map);
        });
        if (walked.is_err()) {
            report_warning(sink_, walked.error());
            return Result<ClassMap, Error>::failure(walked.error());
        }

        cache_.emplace(key.value(), map);
        return Result<ClassMap, Error>::success(std::move(map));
    }

    void MappingBuilder::scan_file(const scanner::WalkEntry& entry, const Options& options, ClassMap& map) const {
        auto file = path_utils::canonical(entry.path);
        if (file.is_err()) {
            ++map.stats.files_failed;
            report_warning(sink_, file.error());
            return;
        }

        // Symlinked files may resolve outside the walked location.
        if (options.is_excluded(path_utils::relative_to_root(file.value(), map.root))) {
            return;
        }

        auto content = file_utils::read_file(file.value());
        if (content.is_err()) {
            ++map.stats.files_failed;
            report_warning(sink_, content.error());
            return;
        }

        scanner::Lexer lexer(content.value());
        auto tokens = lexer.tokenize();
        if (tokens.is_err()) {
            ++map.stats.files_failed;
            report_warning(sink_, tokens.error().with_context(file.value().string()));
            return;
        }
        ++map.stats.files_scanned;

        scanner::SymbolExtractor extractor;
        const auto symbols = extractor.extract(tokens.value());
        for (const auto& identifier : symbols.declarations) {
            if (!map.symbols.insert_or_assign(identifier, file.value())) {
                ++map.stats.duplicate_symbols;
            }
        }

        if (options.include_static) {
            const scanner::StaticFileClassifier classifier;
            if (classifier.is_static(tokens.value(), symbols)) {
                map.static_files.push_back(file.value());
                ++map.stats.static_files;
            }
        }
    }

}  // namespace classmap
